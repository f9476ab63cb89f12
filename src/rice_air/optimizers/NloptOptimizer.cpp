#include "rice_air/optimizers/NloptOptimizer.hpp"
#include "rice_air/optimizers/AlgorithmSettings.hpp"
#include "rice_air/optimizers/ConvergenceMonitor.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <nlopt.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace riceair {

namespace {

bool needsGradient(const std::string& name) {
    return name.rfind("LD_", 0) == 0 || name.rfind("GD_", 0) == 0;
}

OptimizationStatus toStatus(nlopt::result code) {
    switch (code) {
        case nlopt::MAXTIME_REACHED: return OptimizationStatus::MAXTIME_REACHED;
        case nlopt::MAXEVAL_REACHED: return OptimizationStatus::MAXITER_REACHED;
        case nlopt::SUCCESS:
        case nlopt::STOPVAL_REACHED:
        case nlopt::FTOL_REACHED:
        case nlopt::XTOL_REACHED:    return OptimizationStatus::FTOL_REACHED;
        default:                     return OptimizationStatus::FAILURE;
    }
}

} // namespace

std::optional<std::string> NloptOptimizer::resolve(const std::string& algorithmId) {
    std::string id = algorithmId;
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (id.rfind("NLOPT_", 0) == 0) {
        id = id.substr(6);
    }

    nlopt_algorithm algorithm = nlopt_algorithm_from_string(id.c_str());
    if (static_cast<int>(algorithm) < 0) {
        return std::nullopt;
    }
    std::string canonical = nlopt_algorithm_to_string(algorithm);
    if (needsGradient(canonical)) {
        return std::nullopt;
    }
    return canonical;
}

std::vector<std::string> NloptOptimizer::derivativeFreeAlgorithms() {
    std::vector<std::string> names;
    for (int i = 0; i < NLOPT_NUM_ALGORITHMS; ++i) {
        std::string name = nlopt_algorithm_to_string(static_cast<nlopt_algorithm>(i));
        if (!needsGradient(name)) {
            names.push_back(name);
        }
    }
    return names;
}

NloptOptimizer::NloptOptimizer(const std::string& algorithmId) {
    auto canonical = resolve(algorithmId);
    if (!canonical) {
        THROW_INVALID_PARAM("NloptOptimizer::NloptOptimizer",
            "'" + algorithmId + "' is not a derivative-free NLopt algorithm.");
    }
    name_ = *canonical;
    algorithm_ = static_cast<int>(nlopt_algorithm_from_string(name_.c_str()));
}

void NloptOptimizer::configure(const std::map<std::string, double>& settings) {
    const std::string F_NAME = "NloptOptimizer::configure";

    ConvergenceMonitor::Settings defaults;
    defaults.max_time_seconds = max_time_seconds_;
    defaults.ftol_rel = ftol_rel_;
    defaults.max_iterations = max_evaluations_;
    ConvergenceMonitor::Settings stopping = ConvergenceMonitor::readSettings(settings, defaults);
    max_time_seconds_ = stopping.max_time_seconds;
    ftol_rel_ = stopping.ftol_rel;
    max_evaluations_ = stopping.max_iterations;

    auto step = settings.find("initial_step");
    if (step != settings.end()) {
        if (!(step->second > 0.0 && step->second <= 1.0)) {
            THROW_INVALID_PARAM(F_NAME, "initial_step must lie in (0, 1].");
        }
        initial_step_ = step->second;
    }
    if (auto seed = readSeedSetting(settings, F_NAME)) {
        seed_ = seed;
    }

    Logger::getInstance().info("NloptOptimizer",
        "Configured " + name_ + " with max_time=" + std::to_string(max_time_seconds_) + "s" +
        ", ftol_rel=" + std::to_string(ftol_rel_) +
        ", max_evaluations=" + (max_evaluations_ > 0 ? std::to_string(max_evaluations_) : std::string("none")));
}

double NloptOptimizer::evaluate(const std::vector<double>& x, std::vector<double>& /*grad*/, void* data) {
    auto* d = static_cast<CallbackData*>(data);
    try {
        Eigen::VectorXd proposal = Eigen::Map<const Eigen::VectorXd>(x.data(), static_cast<Eigen::Index>(x.size()));
        Eigen::VectorXd constrained = d->manager->applyConstraints(proposal);
        double value = d->objective->calculate(constrained);
        ++d->evaluations;
        if (!std::isfinite(value)) {
            value = -std::numeric_limits<double>::infinity();
        }
        if (value > d->bestValue) {
            d->bestValue = value;
            d->bestParameters = constrained;
        }
        return value;
    } catch (const std::exception&) {
        // NLopt cannot carry our exception types through its C core.
        d->error = std::current_exception();
        throw nlopt::forced_stop();
    }
}

OptimizationResult NloptOptimizer::optimize(
    const Eigen::VectorXd& initialParameters,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    const std::string F_NAME = "NloptOptimizer::optimize";
    Logger& logger = Logger::getInstance();

    const unsigned n = static_cast<unsigned>(parameterManager.getParameterCount());
    if (initialParameters.size() != static_cast<Eigen::Index>(n)) {
        THROW_INVALID_PARAM(F_NAME, "Initial point has " + std::to_string(initialParameters.size()) +
                            " entries, expected " + std::to_string(n) + ".");
    }

    std::vector<double> lb(n), ub(n);
    for (unsigned i = 0; i < n; ++i) {
        lb[i] = parameterManager.getLowerBoundForParamIndex(static_cast<int>(i));
        ub[i] = parameterManager.getUpperBoundForParamIndex(static_cast<int>(i));
    }

    nlopt::opt opt(static_cast<nlopt::algorithm>(algorithm_), n);
    opt.set_lower_bounds(lb);
    opt.set_upper_bounds(ub);
    opt.set_maxtime(max_time_seconds_);
    opt.set_ftol_rel(ftol_rel_);
    if (max_evaluations_ > 0) {
        opt.set_maxeval(max_evaluations_);
    }
    if (initial_step_ > 0.0) {
        std::vector<double> dx(n);
        for (unsigned i = 0; i < n; ++i) {
            dx[i] = initial_step_ * (ub[i] - lb[i]);
        }
        opt.set_initial_step(dx);
    }

    // Used by the AUGLAG and MLSL families; ignored by the others.
    nlopt::opt local(nlopt::LN_SBPLX, n);
    local.set_ftol_rel(ftol_rel_);
    opt.set_local_optimizer(local);

    if (seed_) {
        nlopt::srand(*seed_);
    }

    CallbackData data{&objectiveFunction, &parameterManager,
                      parameterManager.applyConstraints(initialParameters),
                      -std::numeric_limits<double>::infinity(), 0, nullptr};
    opt.set_max_objective(&NloptOptimizer::evaluate, &data);

    Eigen::VectorXd start = data.bestParameters;
    std::vector<double> x(start.data(), start.data() + start.size());
    double value = 0.0;

    logger.info(F_NAME, "Starting " + name_ + " on " + std::to_string(n) + " parameters");
    auto started = std::chrono::steady_clock::now();

    OptimizationResult result;
    try {
        result.status = toStatus(opt.optimize(x, value));
    } catch (const nlopt::forced_stop&) {
        if (data.error) {
            std::rethrow_exception(data.error);
        }
        result.status = OptimizationStatus::FAILURE;
    } catch (const nlopt::roundoff_limited&) {
        logger.warning(F_NAME, "Stopped by roundoff errors; returning the best point found.");
        result.status = OptimizationStatus::FTOL_REACHED;
    } catch (const std::invalid_argument& e) {
        THROW_INVALID_PARAM(F_NAME, std::string("NLopt rejected the problem: ") + e.what());
    } catch (const std::runtime_error& e) {
        logger.warning(F_NAME, std::string("NLopt failed: ") + e.what());
        result.status = OptimizationStatus::MAXITER_REACHED;
    }

    if (!std::isfinite(data.bestValue)) {
        result.status = OptimizationStatus::FAILURE;
    }
    result.bestParameters = data.bestParameters;
    result.bestObjectiveValue = data.bestValue;
    result.evaluations = data.evaluations;
    result.iterations = data.evaluations;
    result.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    logger.info(F_NAME, name_ + " finished (" + toString(result.status) + ") after " +
                std::to_string(result.evaluations) + " evaluations, best " +
                std::to_string(result.bestObjectiveValue));
    return result;
}

} // namespace riceair
