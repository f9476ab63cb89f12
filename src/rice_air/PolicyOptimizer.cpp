#include "rice_air/PolicyOptimizer.hpp"
#include "rice_air/ModelConstants.hpp"
#include "rice_air/objectives/WelfareObjectiveFunction.hpp"
#include "rice_air/optimizers/OptimizerFactory.hpp"
#include "rice_air/parameters/TaxParameterManager.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace riceair {

PolicyOptimizationResult PolicyOptimizer::optimize(
    const ModelRunConfiguration& config,
    const std::string& algorithmId,
    int nPeriods,
    double stopTimeSeconds,
    double relTolerance,
    const BackstopPriceSchedule& backstop,
    bool includeCobenefits,
    const Eigen::VectorXd& initialGuess,
    const IRiceAirModelBuilder& builder,
    const std::map<std::string, double>& algorithmSettings) {

    const std::string F_NAME = "PolicyOptimizer::optimize";
    Logger& logger = Logger::getInstance();

    config.validate();
    const int maxPeriods = std::min(constants::MAX_OPTIMIZED_PERIODS, backstop.numPeriods() - 1);
    if (nPeriods < 1 || nPeriods > maxPeriods) {
        THROW_INVALID_TAX_VECTOR(F_NAME, "Number of optimized periods must lie in [1, " +
                                 std::to_string(maxPeriods) + "], got " + std::to_string(nPeriods) + ".");
    }
    if (config.nsteps != backstop.numPeriods()) {
        THROW_INVALID_BACKSTOP(F_NAME, "Backstop table has " + std::to_string(backstop.numPeriods()) +
                               " periods but the configuration uses " + std::to_string(config.nsteps) + ".");
    }
    if (!(stopTimeSeconds > 0.0) || !std::isfinite(stopTimeSeconds)) {
        THROW_INVALID_PARAM(F_NAME, "Stop time must be a positive number of seconds.");
    }
    if (!(relTolerance > 0.0) || !std::isfinite(relTolerance)) {
        THROW_INVALID_PARAM(F_NAME, "Relative tolerance must be positive.");
    }

    TaxParameterManager parameterManager(backstop, nPeriods);
    parameterManager.validateInitialGuess(initialGuess);

    std::unique_ptr<IOptimizationAlgorithm> algorithm = OptimizerFactory::create(algorithmId);
    std::map<std::string, double> settings = algorithmSettings;
    settings["max_time_seconds"] = stopTimeSeconds;
    settings["ftol_rel"] = relTolerance;
    if (settings.find("iterations") == settings.end()) {
        settings["iterations"] = 0;
    }
    algorithm->configure(settings);

    WelfareObjectiveFunction objective(config, backstop, nPeriods, includeCobenefits, builder);

    std::ostringstream summary;
    summary << "Optimizing " << nPeriods << " periods with " << algorithm->getName()
            << " | SSP: " << toString(config.ssp_scenario)
            << " | rho: " << config.rho << " | eta: " << config.eta
            << " | co-benefits: " << (includeCobenefits ? "yes" : "no")
            << " | stop time: " << stopTimeSeconds << "s | ftol_rel: " << relTolerance;
    logger.info(F_NAME, summary.str());

    OptimizationResult optimum = algorithm->optimize(initialGuess, objective, parameterManager);
    logger.info(F_NAME, "Convergence result: " + toString(optimum.status) +
                " after " + std::to_string(optimum.iterations) + " iterations, " +
                std::to_string(optimum.evaluations) + " evaluations, " +
                std::to_string(optimum.elapsedSeconds) + "s");

    if (optimum.status == OptimizationStatus::FAILURE) {
        objective.logStatistics();
        THROW_EVALUATION_ERROR(F_NAME, "No policy produced a finite welfare value.");
    }
    if (!isSuccess(optimum.status)) {
        logger.warning(F_NAME, "Relative tolerance not reached; returning the best policy found.");
    }

    // The model state must match the returned policy, not the last trial.
    Eigen::VectorXd optimalTax = optimum.bestParameters;
    PolicyEvaluation evaluation = objective.evaluate(optimalTax);
    parameterManager.updateModelParameters(evaluation.tax);
    objective.logStatistics();

    PolicyOptimizationResult result;
    result.abatement = evaluation.schedule.abatement;
    result.taxTrajectory = evaluation.schedule.tax;
    result.model = objective.getModel();
    result.optimalTax = evaluation.tax;
    result.welfare = evaluation.welfare;
    result.status = optimum.status;
    result.iterations = optimum.iterations;
    result.evaluations = optimum.evaluations;

    logger.info(F_NAME, "Optimal welfare: " + std::to_string(result.welfare));
    return result;
}

} // namespace riceair
