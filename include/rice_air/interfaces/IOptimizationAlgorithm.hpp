#ifndef I_OPTIMIZATION_ALGORITHM_HPP
#define I_OPTIMIZATION_ALGORITHM_HPP

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <map>
#include <limits>

namespace riceair {

// Forward declarations
class IObjectiveFunction;
class IParameterManager;

/**
 * @brief Reason an optimization run stopped.
 */
enum class OptimizationStatus {
    FTOL_REACHED,     ///< Relative improvement of the best value fell below ftol_rel.
    MAXTIME_REACHED,  ///< Wall-clock limit max_time_seconds was hit.
    MAXITER_REACHED,  ///< Iteration cap was hit.
    FAILURE           ///< No finite objective value was ever obtained.
};

std::string toString(OptimizationStatus status);

/** @brief True only when the tolerance criterion stopped the run. */
inline bool isSuccess(OptimizationStatus status) {
    return status == OptimizationStatus::FTOL_REACHED;
}

/**
 * @brief Structure to hold the results of an optimization run.
 */
struct OptimizationResult {
    Eigen::VectorXd bestParameters;
    double bestObjectiveValue = -std::numeric_limits<double>::infinity();
    OptimizationStatus status = OptimizationStatus::FAILURE;
    int iterations = 0;
    int evaluations = 0;
    double elapsedSeconds = 0.0;
};

/**
 * @brief Interface for box-constrained maximizers.
 */
class IOptimizationAlgorithm {
public:
    virtual ~IOptimizationAlgorithm() = default;

    /**
     * @brief Run the optimization algorithm.
     *
     * @param initialParameters The starting point for the optimization.
     * @param objectiveFunction The objective function to maximize.
     * @param parameterManager Manager to handle bounds and constraints.
     * @return OptimizationResult Best point found, its value and the termination status.
     */
    virtual OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) = 0;

    /**
     * @brief Configure algorithm-specific settings.
     *
     * Every algorithm understands "max_time_seconds", "ftol_rel", "ftol_window",
     * "iterations", "report_interval" and "seed".
     *
     * @param settings Map of setting names to values.
     * @throws InvalidParameterException If a setting value is out of range.
     */
    virtual void configure(const std::map<std::string, double>& settings) = 0;

    /** @brief Identifier used to select this algorithm. */
    virtual std::string getName() const = 0;
};

} // namespace riceair

#endif // I_OPTIMIZATION_ALGORITHM_HPP
