#ifndef POLICY_NORMALIZER_HPP
#define POLICY_NORMALIZER_HPP

#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/ModelConstants.hpp"
#include <Eigen/Dense>
#include <optional>

namespace riceair {

/**
 * @brief Enforces the backstop ceiling on optimizer-proposed tax vectors.
 *
 * Once a tax trajectory reaches the full-decarbonization price it stays there:
 * the first optimized period whose tax equals the ceiling (both rounded to a
 * fixed number of decimals) and every later period are overwritten with the
 * ceiling. Tax index i corresponds to model period i + 2.
 */
class PolicyNormalizer {
public:
    /**
     * @param backstop Backstop price schedule; must outlive the normalizer.
     * @param digits Number of decimals used for the equality check.
     */
    explicit PolicyNormalizer(const BackstopPriceSchedule& backstop,
                              int digits = constants::CEILING_ROUNDING_DIGITS);

    /**
     * @brief First index (ascending) at which the rounded tax equals the rounded ceiling.
     * @throws InvalidTaxVectorException If the vector is longer than numPeriods() - 1.
     */
    std::optional<Eigen::Index> findCeilingIndex(const Eigen::VectorXd& tax) const;

    /**
     * @brief Overwrites tax[i..] with the ceiling, where i is findCeilingIndex(tax).
     * @return true if the vector was modified.
     */
    bool normalizeInPlace(Eigen::VectorXd& tax) const;

    /** @brief Copying variant of normalizeInPlace. */
    Eigen::VectorXd normalize(const Eigen::VectorXd& tax) const;

private:
    const BackstopPriceSchedule& backstop_;
    double scale_;

    double roundToDigits(double value) const;
    void checkLength(const Eigen::VectorXd& tax) const;
};

} // namespace riceair

#endif // POLICY_NORMALIZER_HPP
