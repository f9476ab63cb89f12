#ifndef CONVERGENCE_MONITOR_HPP
#define CONVERGENCE_MONITOR_HPP

#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <string>

namespace riceair {

/**
 * @brief Stopping criteria shared by the optimization algorithms.
 *
 * Tracks wall-clock time, the iteration count and the history of the best
 * objective value. The relative-tolerance criterion fires once the best value
 * improved by less than ftol_rel * |best| over the last ftol_window iterations.
 */
class ConvergenceMonitor {
public:
    struct Settings {
        double max_time_seconds = 60.0;
        double ftol_rel = 1e-8;
        int ftol_window = 20;
        int max_iterations = 1000;  ///< 0 means no iteration cap
    };

    ConvergenceMonitor() = default;
    explicit ConvergenceMonitor(const Settings& settings);

    /**
     * @brief Reads the shared stopping settings from a configure() map.
     *
     * Missing keys keep the values in defaults.
     * @throws InvalidParameterException If max_time_seconds or ftol_rel is not positive,
     *         ftol_window is not a whole number >= 1 or iterations is not a whole number >= 0.
     */
    static Settings readSettings(const std::map<std::string, double>& settings,
                                 const Settings& defaults);

    /** @brief Starts the clock and clears the history. */
    void start();

    /**
     * @brief Records the best value after one completed iteration.
     * @return The stop reason, or std::nullopt to keep going.
     */
    std::optional<OptimizationStatus> update(double bestValue);

    /** @brief True once the time budget is spent; checked between evaluations. */
    bool timeExpired() const;

    double elapsedSeconds() const;
    int iterations() const { return iterations_; }

private:
    Settings settings_;
    std::chrono::steady_clock::time_point start_time_;
    std::deque<double> history_;
    int iterations_ = 0;
};

} // namespace riceair

#endif // CONVERGENCE_MONITOR_HPP
