#include "rice_air/optimizers/ParticleSwarmOptimizer.hpp"
#include "rice_air/optimizers/AlgorithmSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace riceair {

ParticleSwarmOptimization::ParticleSwarmOptimization()
    : rng_{std::random_device{}()} {}

void ParticleSwarmOptimization::configure(
    const std::map<std::string, double>& settings) {

    const std::string F_NAME = "ParticleSwarmOptimization::configure";
    stopping_ = ConvergenceMonitor::readSettings(settings, stopping_);
    swarm_size_ = readCountSetting(settings, "swarm_size", swarm_size_, 2, F_NAME);
    report_interval_ = readCountSetting(settings, "report_interval", report_interval_, 1, F_NAME);
    if (auto seed = readSeedSetting(settings, F_NAME)) {
        rng_.seed(*seed);
    }

    for (const auto& [key, value] : settings) {
        if (key == "omega_start") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "omega_start must be non-negative");
            omega_start_ = value;
        } else if (key == "omega_end") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "omega_end must be non-negative");
            omega_end_ = value;
        } else if (key == "c1_initial") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "c1_initial must be non-negative");
            c1_initial_ = value;
        } else if (key == "c1_final") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "c1_final must be non-negative");
            c1_final_ = value;
        } else if (key == "c2_initial") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "c2_initial must be non-negative");
            c2_initial_ = value;
        } else if (key == "c2_final") {
            if (!(value >= 0)) THROW_INVALID_PARAM(F_NAME, "c2_final must be non-negative");
            c2_final_ = value;
        } else if (key == "velocity_clamp") {
            if (!(value > 0 && value <= 1)) THROW_INVALID_PARAM(F_NAME, "velocity_clamp must lie in (0, 1]");
            velocity_clamp_ = value;
        }
    }

    std::ostringstream config_summary;
    config_summary << "PSO configured: "
                   << "Swarm=" << swarm_size_
                   << ", Omega=" << omega_start_ << "->" << omega_end_
                   << ", C1=" << c1_initial_ << "->" << c1_final_
                   << ", C2=" << c2_initial_ << "->" << c2_final_
                   << ", MaxTime=" << stopping_.max_time_seconds << "s"
                   << ", FtolRel=" << stopping_.ftol_rel;
    Logger::getInstance().info(logger_source_id_, config_summary.str());
}

OptimizationResult ParticleSwarmOptimization::optimize(
    const Eigen::VectorXd& initialParameters,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager) {

    Logger& logger = Logger::getInstance();
    logger.info(logger_source_id_, "=== Starting PSO Optimization ===");

    monitor_ = ConvergenceMonitor(stopping_);
    monitor_.start();
    evaluations_ = 0;

    const int n = static_cast<int>(parameterManager.getParameterCount());
    std::vector<particle> swarm;
    Eigen::VectorXd gbest_position(n);
    double gbest_value = -std::numeric_limits<double>::infinity();

    const Eigen::VectorXd* init_params =
        (initialParameters.size() == n) ? &initialParameters : nullptr;
    initializeSwarm(swarm, objectiveFunction, parameterManager,
                    gbest_position, gbest_value, init_params);

    Eigen::VectorXd lb(n), ub(n);
    for (int k = 0; k < n; ++k) {
        lb[k] = parameterManager.getLowerBoundForParamIndex(k);
        ub[k] = parameterManager.getUpperBoundForParamIndex(k);
    }

    OptimizationResult result;
    for (int iter = 0; ; ++iter) {
        updateParticles(swarm, gbest_position, objectiveFunction, parameterManager, iter);

        for (const auto& p : swarm) {
            if (p.pbest_value > gbest_value) {
                gbest_value = p.pbest_value;
                gbest_position = p.pbest_position;
                if (logger.isEnabled(LogLevel::DEBUG)) {
                    logger.debug(logger_source_id_,
                        "New global best found: " + std::to_string(gbest_value));
                }
            }
        }

        if ((iter + 1) % report_interval_ == 0) {
            std::ostringstream msg;
            msg << "Iteration " << (iter + 1)
                << " | Best: " << gbest_value
                << " | Diversity: " << calculateSwarmDiversity(swarm, lb, ub)
                << " | Elapsed: " << monitor_.elapsedSeconds() << "s";
            logger.info(logger_source_id_, msg.str());
        }

        auto stop = monitor_.update(gbest_value);
        if (stop) {
            result.status = *stop;
            break;
        }
    }

    if (!std::isfinite(gbest_value)) {
        result.status = OptimizationStatus::FAILURE;
        // Nothing evaluated successfully; hand back the feasible starting point.
        gbest_position = swarm.front().position;
    }

    logger.info(logger_source_id_, "=== PSO Completed (" + toString(result.status) + ") ===");
    logger.info(logger_source_id_, "Final best value: " + std::to_string(gbest_value));

    result.bestParameters = gbest_position;
    result.bestObjectiveValue = gbest_value;
    result.iterations = monitor_.iterations();
    result.evaluations = evaluations_;
    result.elapsedSeconds = monitor_.elapsedSeconds();
    return result;
}

void ParticleSwarmOptimization::initializeSwarm(
    std::vector<particle>& swarm,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager,
    Eigen::VectorXd& gbest_position,
    double& gbest_value,
    const Eigen::VectorXd* initial_params) {

    const int n = static_cast<int>(parameterManager.getParameterCount());
    swarm.resize(swarm_size_);
    gbest_value = -std::numeric_limits<double>::infinity();

    for (int i = 0; i < swarm_size_; ++i) {
        Eigen::VectorXd position(n);
        Eigen::VectorXd velocity(n);
        for (int k = 0; k < n; ++k) {
            double lb = parameterManager.getLowerBoundForParamIndex(k);
            double ub = parameterManager.getUpperBoundForParamIndex(k);
            position[k] = lb + uniform_dist_(rng_) * (ub - lb);
            double vmax = velocity_clamp_ * (ub - lb);
            velocity[k] = -vmax + 2 * vmax * uniform_dist_(rng_);
        }
        if (i == 0 && initial_params != nullptr) {
            position = *initial_params;
        }

        swarm[i].position = parameterManager.applyConstraints(position);
        swarm[i].velocity = velocity;
        swarm[i].pbest_position = swarm[i].position;
        swarm[i].pbest_value = -std::numeric_limits<double>::infinity();
        swarm[i].current_fitness = -std::numeric_limits<double>::infinity();

        // Particles left unevaluated when time runs out keep -inf and only move.
        if (i == 0 || !monitor_.timeExpired()) {
            swarm[i].current_fitness = evaluate(swarm[i].position, objectiveFunction);
            swarm[i].pbest_value = swarm[i].current_fitness;
        }
    }

    gbest_position = swarm.front().position;
    for (const auto& p : swarm) {
        if (p.pbest_value > gbest_value) {
            gbest_value = p.pbest_value;
            gbest_position = p.pbest_position;
        }
    }

    Logger::getInstance().info(logger_source_id_,
        "Initialized swarm with " + std::to_string(swarm_size_) +
        " particles. Initial best: " + std::to_string(gbest_value));
}

void ParticleSwarmOptimization::updateParticles(
    std::vector<particle>& swarm,
    const Eigen::VectorXd& gbest_position,
    IObjectiveFunction& objectiveFunction,
    IParameterManager& parameterManager,
    int iteration) {

    const int n = static_cast<int>(parameterManager.getParameterCount());
    Eigen::VectorXd lb(n), ub(n);
    for (int k = 0; k < n; ++k) {
        lb[k] = parameterManager.getLowerBoundForParamIndex(k);
        ub[k] = parameterManager.getUpperBoundForParamIndex(k);
    }

    const int horizon = stopping_.max_iterations > 0 ? stopping_.max_iterations : DEFAULT_SCHEDULE_ITERATIONS;
    double ratio = (horizon > 1) ?
        std::min(1.0, static_cast<double>(iteration) / (horizon - 1)) : 0.0;
    double omega = omega_start_ + (omega_end_ - omega_start_) * ratio;
    double c1 = c1_initial_ + (c1_final_ - c1_initial_) * ratio;
    double c2 = c2_initial_ + (c2_final_ - c2_initial_) * ratio;

    for (auto& p : swarm) {
        if (monitor_.timeExpired()) {
            break;
        }
        standardPSOUpdate(p, gbest_position, omega, c1, c2, lb, ub);
        p.position = parameterManager.applyConstraints(p.position);

        p.current_fitness = evaluate(p.position, objectiveFunction);
        if (p.current_fitness > p.pbest_value) {
            p.pbest_value = p.current_fitness;
            p.pbest_position = p.position;
        }
    }
}

void ParticleSwarmOptimization::standardPSOUpdate(
    particle& p,
    const Eigen::VectorXd& gbest_position,
    double omega, double c1, double c2,
    const Eigen::VectorXd& lb,
    const Eigen::VectorXd& ub) {

    const int n = static_cast<int>(p.position.size());

    Eigen::VectorXd r1(n), r2(n);
    for (int i = 0; i < n; ++i) {
        r1[i] = uniform_dist_(rng_);
        r2[i] = uniform_dist_(rng_);
    }

    Eigen::VectorXd cognitive_term = c1 * r1.cwiseProduct(p.pbest_position - p.position);
    Eigen::VectorXd social_term = c2 * r2.cwiseProduct(gbest_position - p.position);
    p.velocity = omega * p.velocity + cognitive_term + social_term;

    for (int k = 0; k < n; ++k) {
        double vmax = velocity_clamp_ * (ub[k] - lb[k]);
        p.velocity[k] = std::clamp(p.velocity[k], -vmax, vmax);
    }

    p.position += p.velocity;

    // Reflect at the bounds and damp the velocity component.
    for (int k = 0; k < n; ++k) {
        if (p.position[k] < lb[k]) {
            p.position[k] = lb[k] + std::abs(p.position[k] - lb[k]);
            p.velocity[k] *= -0.5;
        } else if (p.position[k] > ub[k]) {
            p.position[k] = ub[k] - std::abs(p.position[k] - ub[k]);
            p.velocity[k] *= -0.5;
        }
        p.position[k] = std::clamp(p.position[k], lb[k], ub[k]);
    }
}

double ParticleSwarmOptimization::evaluate(const Eigen::VectorXd& position,
                                           IObjectiveFunction& objectiveFunction) {
    ++evaluations_;
    double value = objectiveFunction.calculate(position);
    return std::isfinite(value) ? value : -std::numeric_limits<double>::infinity();
}

double ParticleSwarmOptimization::calculateSwarmDiversity(
    const std::vector<particle>& swarm,
    const Eigen::VectorXd& lb,
    const Eigen::VectorXd& ub) const {

    if (swarm.empty()) {
        return 0.0;
    }
    Eigen::VectorXd centroid = Eigen::VectorXd::Zero(lb.size());
    for (const auto& p : swarm) {
        centroid += p.position;
    }
    centroid /= static_cast<double>(swarm.size());

    double diagonal = (ub - lb).norm();
    if (diagonal <= 0.0) {
        return 0.0;
    }
    double mean_distance = 0.0;
    for (const auto& p : swarm) {
        mean_distance += (p.position - centroid).norm();
    }
    return mean_distance / (swarm.size() * diagonal);
}

} // namespace riceair
