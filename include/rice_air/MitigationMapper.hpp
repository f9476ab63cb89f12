#ifndef MITIGATION_MAPPER_HPP
#define MITIGATION_MAPPER_HPP

#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/ModelConstants.hpp"
#include <Eigen/Dense>
#include <string>

namespace riceair {

/**
 * @brief Regional abatement levels together with the tax trajectory that produced them.
 */
struct MitigationSchedule {
    /** @brief Abatement fractions (MIU) [periods x regions], each in [0, 1]. */
    Eigen::MatrixXd abatement;
    /** @brief Full tax trajectory [periods], currency per tonne. Period 1 is always zero. */
    Eigen::VectorXd tax;
};

/**
 * @brief Converts a global carbon tax into regional CO2 abatement fractions.
 *
 * Period 1 carries no tax. Periods covered by the tax vector use the supplied
 * values and every later period is set to the full-decarbonization price
 * (the per-period maximum backstop price across regions). Regional abatement is
 * the inverse of the constant-elasticity abatement cost curve:
 *
 *     mu[t, r] = clamp((TAX[t] / backstop[t, r])^(1 / (theta2 - 1)), 0, 1)
 */
class MitigationMapper {
public:
    /**
     * @param backstop Backstop price schedule; must outlive the mapper.
     * @param theta2 Exponent of the abatement cost function.
     * @throws InvalidParameterException If theta2 is non-finite or not greater than 1.
     */
    explicit MitigationMapper(const BackstopPriceSchedule& backstop,
                              double theta2 = constants::DEFAULT_THETA2);

    /**
     * @brief Maps a tax vector for periods 2..n+1 onto abatement levels.
     *
     * @param tax Tax values (currency per tonne), length at most numPeriods() - 1.
     * @return MitigationSchedule Abatement matrix and the reconstructed full trajectory.
     * @throws InvalidTaxVectorException If the vector is too long or holds a non-finite value.
     */
    MitigationSchedule map(const Eigen::VectorXd& tax) const;

    /**
     * @brief Builds the full tax trajectory only (period 1 zero, ceiling after the window).
     */
    Eigen::VectorXd fullTaxTrajectory(const Eigen::VectorXd& tax) const;

private:
    const BackstopPriceSchedule& backstop_;
    double theta2_;

    void validateTax(const Eigen::VectorXd& tax, const std::string& caller) const;
};

} // namespace riceair

#endif // MITIGATION_MAPPER_HPP
