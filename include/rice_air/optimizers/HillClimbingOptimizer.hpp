#ifndef HILL_CLIMBING_OPTIMIZER_HPP
#define HILL_CLIMBING_OPTIMIZER_HPP

#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include "rice_air/interfaces/IObjectiveFunction.hpp"
#include "rice_air/interfaces/IParameterManager.hpp"
#include "rice_air/optimizers/ConvergenceMonitor.hpp"
#include <Eigen/Dense>
#include <map>
#include <random>
#include <string>

namespace riceair {

/**
 * @brief Stochastic hill climbing optimizer with bidirectional search,
 *        step elongation, and binary refinement.
 *
 * Every trial point goes through IParameterManager::applyConstraints, so
 * the search never leaves the box and always respects the backstop ceiling
 * rule. Steps are drawn from N(0, sigma_i) per parameter and cooled after the
 * burn-in phase. The run stops on the shared ConvergenceMonitor criteria.
 */
class HillClimbingOptimizer : public IOptimizationAlgorithm {
public:
    /**
     * @brief Default constructor.
     *
     * Seeds the random number generator from std::random_device; pass "seed"
     * to configure() for reproducible runs.
     */
    HillClimbingOptimizer();

    /**
     * @brief Configure optimizer hyperparameters.
     *
     * @param settings Map of configuration parameter names to their values.
     *                 Supported parameters: the shared stopping settings plus
     *                 initial_step, cooling_rate, refinement_steps, burnin_factor,
     *                 burnin_step_increase, post_burnin_step_coef,
     *                 one_param_step_coef, min_step_coef, restart_interval,
     *                 enable_bidirectional, enable_elongation, report_interval, seed.
     *                 "iterations" 0 removes the iteration cap.
     * @throws InvalidParameterException If a value is out of range.
     */
    void configure(const std::map<std::string, double>& settings) override;

    /**
     * @brief Run optimization from a given starting point.
     *
     * @param initialParameters Starting point for the optimization.
     * @param objectiveFunction Function to maximize during optimization.
     * @param parameterManager Manager for parameter constraints and properties.
     * @return OptimizationResult containing the best parameters and objective value found.
     */
    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) override;

    std::string getName() const override { return "hill_climbing"; }

    /// Iterations the burn-in fraction refers to when no iteration cap is set.
    static constexpr int DEFAULT_SCHEDULE_ITERATIONS = 5000;

private:
    ConvergenceMonitor::Settings stopping_{60.0, 1e-8, 50, 5000};
    double initial_step_coef_ = 1.0;      ///< Initial step size coefficient
    double cooling_rate_ = 0.995;         ///< Rate at which step size decreases (0 < rate < 1)
    int    refinement_steps_ = 5;         ///< Number of binary refinement steps
    double burnin_factor_ = 0.1;          ///< Fraction of the schedule horizon spent in burn-in
    double burnin_step_increase_ = 1.5;   ///< Step size multiplier during burn-in
    double post_burnin_step_coef_ = 1.0;  ///< Step size coefficient after burn-in
    double one_param_step_coef_ = 1.0;    ///< Step size coefficient for single parameter updates
    double min_step_coef_ = 0.01;         ///< Minimum allowed step size coefficient
    int    report_interval_ = 100;        ///< Interval for progress reporting
    int    restart_interval_ = 0;         ///< Interval for restarts from the best point (0 = none)
    bool   enable_bidirectional_ = true;
    bool   enable_elongation_ = true;

    std::mt19937 gen_;
    ConvergenceMonitor monitor_;
    int evaluations_ = 0;

    struct EvaluationResult {
        Eigen::VectorXd parameters;
        double objective;
        bool valid;
    };

    /**
     * @brief One iteration: propose, try both directions, elongate and refine.
     */
    EvaluationResult performOptimizedStep(
        const Eigen::VectorXd& currentParams,
        double currentObjective,
        double stepCoef,
        int iteration,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager);

    /**
     * @brief Keep moving along a successful direction while it improves.
     */
    EvaluationResult elongateStep(
        const EvaluationResult& base,
        const Eigen::VectorXd& stepDirection,
        double stepCoef,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager);

    /**
     * @brief Halve the step numSteps times, probing both signs around the best point.
     */
    EvaluationResult binaryRefinement(
        const EvaluationResult& base,
        const Eigen::VectorXd& stepDirection,
        double initialStepCoef,
        int numSteps,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager);

    EvaluationResult evaluateParameters(
        const Eigen::VectorXd& params,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager);

    int scheduleHorizon() const {
        return stopping_.max_iterations > 0 ? stopping_.max_iterations : DEFAULT_SCHEDULE_ITERATIONS;
    }

    Eigen::VectorXd generateStepAll(IParameterManager& parameterManager);
    Eigen::VectorXd generateStepOne(IParameterManager& parameterManager);
};

} // namespace riceair

#endif // HILL_CLIMBING_OPTIMIZER_HPP
