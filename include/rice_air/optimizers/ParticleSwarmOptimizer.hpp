#ifndef PARTICLE_SWARM_OPTIMIZER_HPP
#define PARTICLE_SWARM_OPTIMIZER_HPP

#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include "rice_air/interfaces/IObjectiveFunction.hpp"
#include "rice_air/interfaces/IParameterManager.hpp"
#include "rice_air/optimizers/ConvergenceMonitor.hpp"
#include <Eigen/Dense>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace riceair {

/**
 * @brief Global-best Particle Swarm Optimization.
 *
 * Classical PSO with linearly decreasing inertia and time-varying
 * acceleration coefficients (cognitive weight shrinking, social weight
 * growing over the iteration budget). Positions are reflected at the box
 * bounds and then passed through IParameterManager::applyConstraints, so every
 * evaluated point is feasible. The first particle starts at the initial
 * guess (warm start); the rest are uniform in the box.
 *
 * @implements IOptimizationAlgorithm
 */
class ParticleSwarmOptimization : public IOptimizationAlgorithm {
public:
    ParticleSwarmOptimization();

    /**
     * @brief Configure the PSO algorithm.
     *
     * @param settings Map of configuration parameters:
     *   - shared stopping settings ("max_time_seconds", "ftol_rel", "ftol_window", "iterations";
     *     "iterations" 0 removes the cap)
     *   - "swarm_size": Number of particles in the swarm (default: 20)
     *   - "omega_start" / "omega_end": Inertia weight schedule (default: 0.9 / 0.4)
     *   - "c1_initial" / "c1_final": Cognitive coefficient schedule (default: 2.5 / 0.5)
     *   - "c2_initial" / "c2_final": Social coefficient schedule (default: 0.5 / 2.5)
     *   - "velocity_clamp": Max velocity as a fraction of the box width (default: 0.2)
     *   - "report_interval": Iterations between progress reports (default: 10)
     *   - "seed": Random seed for reproducible runs
     *
     * @throws InvalidParameterException If any parameter value is invalid
     */
    void configure(const std::map<std::string, double>& settings) override;

    /**
     * @brief Execute the PSO optimization algorithm.
     *
     * @param initialParameters Starting point; used for the first particle when its
     *                          dimension matches the parameter manager.
     * @param objectiveFunction The function to maximize.
     * @param parameterManager Provides parameter bounds and constraints.
     * @return OptimizationResult Best position, its value and the stop reason.
     */
    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) override;

    std::string getName() const override { return "particle_swarm"; }

    /// Iterations the coefficient schedules span when no iteration cap is set.
    static constexpr int DEFAULT_SCHEDULE_ITERATIONS = 500;

private:
    ConvergenceMonitor::Settings stopping_{60.0, 1e-8, 20, 500};
    int swarm_size_ = 20;
    double omega_start_ = 0.9;
    double omega_end_ = 0.4;
    double c1_initial_ = 2.5;
    double c1_final_ = 0.5;
    double c2_initial_ = 0.5;
    double c2_final_ = 2.5;
    double velocity_clamp_ = 0.2;
    int report_interval_ = 10;

    const std::string logger_source_id_ = "PSO";

    struct particle {
        Eigen::VectorXd position;
        Eigen::VectorXd velocity;
        Eigen::VectorXd pbest_position;
        double pbest_value = -std::numeric_limits<double>::infinity();
        double current_fitness = -std::numeric_limits<double>::infinity();
    };

    ConvergenceMonitor monitor_;
    int evaluations_ = 0;

    std::mt19937 rng_;
    std::uniform_real_distribution<> uniform_dist_{0.0, 1.0};

    /**
     * @brief Place and evaluate the particles.
     *
     * @param[out] swarm Particles to initialize.
     * @param[in] objectiveFunction Function to evaluate particle fitness.
     * @param[in] parameterManager Bounds and constraints.
     * @param[out] gbest_position Best position found during initialization.
     * @param[out] gbest_value Best objective value found during initialization.
     * @param[in] initial_params Optional starting position for the first particle.
     */
    void initializeSwarm(
        std::vector<particle>& swarm,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager,
        Eigen::VectorXd& gbest_position,
        double& gbest_value,
        const Eigen::VectorXd* initial_params);

    /**
     * @brief Move every particle once and update personal bests.
     *
     * Stops early when the time budget runs out between evaluations.
     */
    void updateParticles(
        std::vector<particle>& swarm,
        const Eigen::VectorXd& gbest_position,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager,
        int iteration);

    /**
     * @brief Velocity and position update with clamping and reflective bounds.
     */
    void standardPSOUpdate(
        particle& p,
        const Eigen::VectorXd& gbest_position,
        double omega, double c1, double c2,
        const Eigen::VectorXd& lb,
        const Eigen::VectorXd& ub);

    double evaluate(const Eigen::VectorXd& position, IObjectiveFunction& objectiveFunction);

    double calculateSwarmDiversity(const std::vector<particle>& swarm,
                                   const Eigen::VectorXd& lb,
                                   const Eigen::VectorXd& ub) const;
};

} // namespace riceair

#endif // PARTICLE_SWARM_OPTIMIZER_HPP
