#ifndef POLICY_OPTIMIZER_HPP
#define POLICY_OPTIMIZER_HPP

#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/ModelRunConfiguration.hpp"
#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include "rice_air/interfaces/IRiceAirModel.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>

namespace riceair {

/**
 * @brief Welfare-maximizing tax policy together with the model that produced it.
 */
struct PolicyOptimizationResult {
    /// Abatement fractions [periods x regions] implied by optimalTax.
    Eigen::MatrixXd abatement;
    /// Full tax trajectory [periods]: zero, optimalTax, then the backstop ceiling.
    Eigen::VectorXd taxTrajectory;
    /// Model instance whose last run used exactly these inputs.
    std::shared_ptr<IRiceAirModel> model;
    /// Optimized tax for periods 2..n+1 after the backstop ceiling rule.
    Eigen::VectorXd optimalTax;
    /// Total welfare at optimalTax.
    double welfare = 0.0;
    OptimizationStatus status = OptimizationStatus::FAILURE;
    int iterations = 0;
    int evaluations = 0;
};

/**
 * @class PolicyOptimizer
 * @brief Runs one carbon-tax optimization experiment end to end.
 */
class PolicyOptimizer {
public:
    /**
     * @brief Finds the tax path for periods 2..nPeriods+1 that maximizes welfare.
     *
     * All arguments are checked before the first model run. The selected
     * algorithm maximizes welfare inside [0, backstop ceiling] and stops on
     * the time limit or the relative tolerance, whichever comes first. The best
     * point is normalized, mapped to abatement levels and evaluated once more,
     * so the returned model state and welfare belong to optimalTax. A run that
     * stops on time or iterations is not an error; the status tells.
     *
     * @param config Experiment configuration for the model builder.
     * @param algorithmId Optimization algorithm id (see OptimizerFactory).
     * @param nPeriods Number of optimized periods.
     * @param stopTimeSeconds Wall-clock budget of the optimizer.
     * @param relTolerance Relative tolerance on welfare improvement.
     * @param backstop Backstop price schedule [periods x regions].
     * @param includeCobenefits Whether health co-benefits count towards welfare.
     * @param initialGuess Starting tax vector of length nPeriods.
     * @param builder Factory for model instances.
     * @param algorithmSettings Extra algorithm settings (seed, swarm_size, ...). Without an
     *        "iterations" entry the run has no iteration cap and stops on time or tolerance only.
     * @return PolicyOptimizationResult
     *
     * @throws InvalidParameterException If the configuration, the time limit or the tolerance is invalid
     *         or the algorithm id is unknown.
     * @throws InvalidTaxVectorException If nPeriods or the initial guess length is invalid.
     * @throws InvalidBackstopTableException If the table does not match the configuration or the model.
     * @throws InvalidBoundsException If the initial guess lies outside the bounds.
     * @throws EvaluationException If no finite welfare was obtained at all.
     */
    static PolicyOptimizationResult optimize(
        const ModelRunConfiguration& config,
        const std::string& algorithmId,
        int nPeriods,
        double stopTimeSeconds,
        double relTolerance,
        const BackstopPriceSchedule& backstop,
        bool includeCobenefits,
        const Eigen::VectorXd& initialGuess,
        const IRiceAirModelBuilder& builder,
        const std::map<std::string, double>& algorithmSettings = {});
};

} // namespace riceair

#endif // POLICY_OPTIMIZER_HPP
