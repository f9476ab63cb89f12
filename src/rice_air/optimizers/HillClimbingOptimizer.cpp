#include "rice_air/optimizers/HillClimbingOptimizer.hpp"
#include "rice_air/optimizers/AlgorithmSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace riceair {

HillClimbingOptimizer::HillClimbingOptimizer()
    : gen_{std::random_device{}()} {}

void HillClimbingOptimizer::configure(const std::map<std::string, double>& settings) {
    const std::string F_NAME = "HillClimbingOptimizer::configure";
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };

    stopping_ = ConvergenceMonitor::readSettings(settings, stopping_);

    initial_step_coef_     = get("initial_step", initial_step_coef_);
    cooling_rate_          = get("cooling_rate", cooling_rate_);
    refinement_steps_      = readCountSetting(settings, "refinement_steps", refinement_steps_, 0, F_NAME);
    burnin_factor_         = get("burnin_factor", burnin_factor_);
    burnin_step_increase_  = get("burnin_step_increase", burnin_step_increase_);
    post_burnin_step_coef_ = get("post_burnin_step_coef", post_burnin_step_coef_);
    one_param_step_coef_   = get("one_param_step_coef", one_param_step_coef_);
    min_step_coef_         = get("min_step_coef", min_step_coef_);
    report_interval_       = readCountSetting(settings, "report_interval", report_interval_, 1, F_NAME);
    restart_interval_      = readCountSetting(settings, "restart_interval", restart_interval_, 0, F_NAME);
    enable_bidirectional_  = get("enable_bidirectional", enable_bidirectional_ ? 1.0 : 0.0) != 0.0;
    enable_elongation_     = get("enable_elongation", enable_elongation_ ? 1.0 : 0.0) != 0.0;

    if (!(initial_step_coef_ > 0.0)) {
        THROW_INVALID_PARAM(F_NAME, "initial_step must be positive.");
    }
    if (!(cooling_rate_ > 0.0 && cooling_rate_ < 1.0)) {
        THROW_INVALID_PARAM(F_NAME, "cooling_rate must lie in (0, 1).");
    }
    if (!(burnin_factor_ >= 0.0 && burnin_factor_ <= 1.0)) {
        THROW_INVALID_PARAM(F_NAME, "burnin_factor must lie in [0, 1].");
    }
    if (!(min_step_coef_ > 0.0)) {
        THROW_INVALID_PARAM(F_NAME, "min_step_coef must be positive.");
    }

    if (auto seed = readSeedSetting(settings, F_NAME)) {
        gen_.seed(*seed);
    }

    Logger::getInstance().info("HillClimbingOptimizer",
        "Configured with bidirectional=" + std::to_string(enable_bidirectional_) +
        ", elongation=" + std::to_string(enable_elongation_) +
        ", refinement_steps=" + std::to_string(refinement_steps_) +
        ", max_time=" + std::to_string(stopping_.max_time_seconds) + "s" +
        ", ftol_rel=" + std::to_string(stopping_.ftol_rel));
}

OptimizationResult HillClimbingOptimizer::optimize(
    const Eigen::VectorXd& initialParameters,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    const std::string F_NAME = "HillClimbingOptimizer::optimize";
    Logger& logger = Logger::getInstance();
    logger.info(F_NAME, stopping_.max_iterations > 0 ?
                "Starting optimization with at most " + std::to_string(stopping_.max_iterations) + " iterations" :
                std::string("Starting optimization without an iteration cap"));

    monitor_ = ConvergenceMonitor(stopping_);
    monitor_.start();
    evaluations_ = 0;

    OptimizationResult result;
    auto initial = evaluateParameters(initialParameters, objectiveFunction, parameterManager);
    result.bestParameters = initial.parameters;
    result.bestObjectiveValue = initial.objective;
    if (!initial.valid) {
        logger.warning(F_NAME, "Invalid initial objective value");
    }

    Eigen::VectorXd current = result.bestParameters;
    double currentObjective = result.bestObjectiveValue;
    double stepCoef = initial_step_coef_;
    int burnin_iters = static_cast<int>(scheduleHorizon() * burnin_factor_);
    int accepted = 0;
    int improved = 0;

    for (int iter = 1; ; ++iter) {
        if (restart_interval_ > 0 && iter % restart_interval_ == 0) {
            logger.debug(F_NAME, "Restarting from best parameters at iteration " + std::to_string(iter));
            current = result.bestParameters;
            currentObjective = result.bestObjectiveValue;
            stepCoef = initial_step_coef_;
        }

        if (!monitor_.timeExpired()) {
            auto stepResult = performOptimizedStep(
                current, currentObjective, stepCoef, iter, objectiveFunction, parameterManager);

            if (stepResult.valid && stepResult.objective > currentObjective) {
                current = stepResult.parameters;
                currentObjective = stepResult.objective;
                accepted++;

                if (currentObjective > result.bestObjectiveValue) {
                    result.bestObjectiveValue = currentObjective;
                    result.bestParameters = current;
                    improved++;
                    if (logger.isEnabled(LogLevel::DEBUG)) {
                        logger.debug(F_NAME, "New best at iteration " + std::to_string(iter) +
                                     ": " + std::to_string(currentObjective));
                    }
                }
            }
        }

        if (iter > burnin_iters) {
            stepCoef = std::max(stepCoef * cooling_rate_, min_step_coef_);
        }

        if (iter % report_interval_ == 0) {
            double acceptRate = 100.0 * accepted / iter;
            logger.info(F_NAME,
                "Iteration " + std::to_string(iter) +
                ", Current: " + std::to_string(currentObjective) +
                ", Best: " + std::to_string(result.bestObjectiveValue) +
                ", Accept rate: " + std::to_string(acceptRate) + "%" +
                ", Step coef: " + std::to_string(stepCoef));
        }

        auto stop = monitor_.update(result.bestObjectiveValue);
        if (stop) {
            result.status = *stop;
            break;
        }
    }

    if (!std::isfinite(result.bestObjectiveValue)) {
        result.status = OptimizationStatus::FAILURE;
    }
    result.iterations = monitor_.iterations();
    result.evaluations = evaluations_;
    result.elapsedSeconds = monitor_.elapsedSeconds();

    logger.info(F_NAME,
        "Optimization complete (" + toString(result.status) + "). Accepted: " +
        std::to_string(accepted) + "/" + std::to_string(result.iterations) +
        ", Improved: " + std::to_string(improved) +
        ", Evaluations: " + std::to_string(evaluations_));

    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::performOptimizedStep(
    const Eigen::VectorXd& currentParams,
    double currentObjective,
    double stepCoef,
    int iteration,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    int burnin_iters = static_cast<int>(scheduleHorizon() * burnin_factor_);
    bool in_burnin = iteration <= burnin_iters;

    double coef;
    Eigen::VectorXd stepDirection;
    if (in_burnin || iteration % 2 == 0) {
        coef = stepCoef * (in_burnin ? burnin_step_increase_ : post_burnin_step_coef_);
        stepDirection = generateStepAll(parameterManager);
    } else {
        coef = stepCoef * one_param_step_coef_;
        stepDirection = generateStepOne(parameterManager);
    }

    EvaluationResult bestResult{currentParams, currentObjective, std::isfinite(currentObjective)};

    auto forwardResult = evaluateParameters(currentParams + coef * stepDirection,
                                            objectiveFunction, parameterManager);
    bool improved = forwardResult.valid && forwardResult.objective > currentObjective;
    if (improved) {
        bestResult = forwardResult;
    }

    if (enable_bidirectional_ && !improved && !monitor_.timeExpired()) {
        auto reverseResult = evaluateParameters(currentParams - coef * stepDirection,
                                                objectiveFunction, parameterManager);
        if (reverseResult.valid && reverseResult.objective > currentObjective) {
            bestResult = reverseResult;
            stepDirection = -stepDirection;
            improved = true;
        }
    }

    if (improved) {
        if (enable_elongation_) {
            auto elongResult = elongateStep(bestResult, stepDirection, coef,
                                            objectiveFunction, parameterManager);
            if (elongResult.objective > bestResult.objective) {
                bestResult = elongResult;
            }
        }

        if (refinement_steps_ > 0) {
            auto refineResult = binaryRefinement(bestResult, stepDirection, coef,
                                                 refinement_steps_, objectiveFunction, parameterManager);
            if (refineResult.objective > bestResult.objective) {
                bestResult = refineResult;
            }
        }
    }

    return bestResult;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::elongateStep(
    const EvaluationResult& base,
    const Eigen::VectorXd& stepDirection,
    double stepCoef,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    EvaluationResult result = base;
    while (!monitor_.timeExpired()) {
        auto extendedResult = evaluateParameters(result.parameters + stepCoef * stepDirection,
                                                 objectiveFunction, parameterManager);
        // Stalls once the box or the ceiling rule pins the point.
        if (extendedResult.valid && extendedResult.objective > result.objective &&
            extendedResult.parameters != result.parameters) {
            result = extendedResult;
        } else {
            break;
        }
    }
    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::binaryRefinement(
    const EvaluationResult& base,
    const Eigen::VectorXd& stepDirection,
    double initialStepCoef,
    int numSteps,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    EvaluationResult result = base;
    double alpha = initialStepCoef;

    for (int k = 0; k < numSteps && !monitor_.timeExpired(); ++k) {
        alpha *= 0.5;
        for (int sign : {-1, 1}) {
            auto refinedResult = evaluateParameters(result.parameters + sign * alpha * stepDirection,
                                                    objectiveFunction, parameterManager);
            if (refinedResult.valid && refinedResult.objective > result.objective) {
                result = refinedResult;
            }
        }
    }
    return result;
}

HillClimbingOptimizer::EvaluationResult HillClimbingOptimizer::evaluateParameters(
    const Eigen::VectorXd& params,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    Eigen::VectorXd constrainedParams = parameterManager.applyConstraints(params);
    double objective = objectiveFunction.calculate(constrainedParams);
    ++evaluations_;

    bool valid = std::isfinite(objective);
    if (!valid) {
        objective = -std::numeric_limits<double>::infinity();
    }
    return {constrainedParams, objective, valid};
}

Eigen::VectorXd HillClimbingOptimizer::generateStepAll(IParameterManager& parameterManager) {
    size_t paramCount = parameterManager.getParameterCount();
    Eigen::VectorXd steps(paramCount);

    for (size_t i = 0; i < paramCount; ++i) {
        double sigma = parameterManager.getSigmaForParamIndex(static_cast<int>(i));
        std::normal_distribution<> dist(0.0, sigma);
        steps[i] = dist(gen_);
    }
    return steps;
}

Eigen::VectorXd HillClimbingOptimizer::generateStepOne(IParameterManager& parameterManager) {
    size_t paramCount = parameterManager.getParameterCount();
    Eigen::VectorXd steps = Eigen::VectorXd::Zero(paramCount);

    if (paramCount > 0) {
        std::uniform_int_distribution<> idxDist(0, static_cast<int>(paramCount) - 1);
        int idx = idxDist(gen_);
        std::normal_distribution<> dist(0.0, parameterManager.getSigmaForParamIndex(idx));
        steps[idx] = dist(gen_);
    }
    return steps;
}

} // namespace riceair
