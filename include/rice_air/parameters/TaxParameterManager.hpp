#ifndef TAX_PARAMETER_MANAGER_HPP
#define TAX_PARAMETER_MANAGER_HPP

#include "rice_air/interfaces/IParameterManager.hpp"
#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/PolicyNormalizer.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riceair {

    /**
     * @brief Manages the carbon-tax decision vector for periods 2..n+1.
     *
     * Bounds are [0, ceiling] where the ceiling is the per-period maximum
     * backstop price, so no period is ever asked to exceed the cost of full
     * decarbonization. Every constrained point also satisfies the backstop
     * ceiling rule of PolicyNormalizer.
     */
    class TaxParameterManager : public IParameterManager {
    public:
        /**
         * @brief Constructs a manager for an optimization window of nPeriods periods.
         *
         * @param backstop Backstop price schedule; must outlive the manager.
         * @param nPeriods Number of optimized periods.
         * @param sigmaFraction Proposal sigma as a fraction of each upper bound.
         *
         * @throws InvalidTaxVectorException If nPeriods is outside [1, periods - 1].
         * @throws InvalidParameterException If sigmaFraction is not positive.
         */
        TaxParameterManager(const BackstopPriceSchedule& backstop,
                            int nPeriods,
                            double sigmaFraction = 0.05);

        /**
         * @brief Gets the current policy (zero tax until the first update).
         */
        Eigen::VectorXd getCurrentParameters() const override;

        /**
         * @brief Stores a new policy after applying constraints.
         * @throws InvalidTaxVectorException If the vector size mismatches.
         */
        void updateModelParameters(const Eigen::VectorXd& parameters) override;

        /**
         * @brief Names "tax_period_2" .. "tax_period_{n+1}".
         */
        const std::vector<std::string>& getParameterNames() const override;

        size_t getParameterCount() const override;

        /**
         * @brief Proposal standard deviation for a parameter.
         * @throws OutOfRangeException If index is invalid.
         */
        double getSigmaForParamIndex(int index) const override;

        /**
         * @brief Clamps into the box and applies the backstop ceiling rule.
         * @throws InvalidTaxVectorException If the vector size mismatches.
         */
        Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const override;

        double getLowerBoundForParamIndex(int idx) const override;
        double getUpperBoundForParamIndex(int idx) const override;

        const Eigen::VectorXd& getLowerBounds() const { return lower_bounds_; }
        const Eigen::VectorXd& getUpperBounds() const { return upper_bounds_; }

        /**
         * @brief Checks a starting point before any model run.
         * @throws InvalidTaxVectorException If the length is not nPeriods.
         * @throws InvalidBoundsException If an entry is non-finite or outside its bounds.
         */
        void validateInitialGuess(const Eigen::VectorXd& guess) const;

    private:
        const PolicyNormalizer normalizer_;
        std::vector<std::string> param_names_;
        Eigen::VectorXd lower_bounds_;
        Eigen::VectorXd upper_bounds_;
        Eigen::VectorXd sigmas_;
        Eigen::VectorXd current_;

        void checkIndex(int idx, const std::string& caller) const;
        void checkSize(const Eigen::VectorXd& parameters, const std::string& caller) const;
    };
}

#endif // TAX_PARAMETER_MANAGER_HPP
