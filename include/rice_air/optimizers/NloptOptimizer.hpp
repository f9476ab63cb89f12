#ifndef NLOPT_OPTIMIZER_HPP
#define NLOPT_OPTIMIZER_HPP

#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include "rice_air/interfaces/IObjectiveFunction.hpp"
#include "rice_air/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riceair {

/**
 * @brief Box-constrained maximization with a derivative-free NLopt algorithm.
 *
 * The algorithm is chosen by its NLopt identifier (e.g. "LN_SBPLX",
 * "LN_COBYLA", "GN_DIRECT"). Bounds come from the parameter manager and every
 * point NLopt proposes passes through IParameterManager::applyConstraints
 * before the objective sees it, so the best point reported always satisfies
 * the backstop ceiling rule. NLopt's own stopping criteria are used:
 * set_maxtime, set_ftol_rel and, when "iterations" is given, set_maxeval.
 */
class NloptOptimizer : public IOptimizationAlgorithm {
public:
    /**
     * @param algorithmId NLopt identifier, case-insensitive, optional "NLOPT_" prefix.
     * @throws InvalidParameterException If the id is unknown to NLopt or needs gradients.
     */
    explicit NloptOptimizer(const std::string& algorithmId);

    /**
     * @brief Configure the NLopt run.
     *
     * Understands "max_time_seconds", "ftol_rel", "iterations" (maximum number
     * of objective evaluations, 0 for no cap), "initial_step" (fraction of the
     * box width) and "seed".
     *
     * @throws InvalidParameterException If a value is out of range.
     */
    void configure(const std::map<std::string, double>& settings) override;

    /**
     * @brief Runs NLopt from the initial point.
     *
     * Model errors raised by the objective abort the run and are rethrown
     * unchanged. NLopt's positive result codes map to FTOL_REACHED (any
     * tolerance or stop-value criterion), MAXTIME_REACHED and MAXITER_REACHED
     * (evaluation cap); a run that never saw a finite value is FAILURE.
     */
    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) override;

    /** @brief The canonical NLopt identifier, e.g. "LN_SBPLX". */
    std::string getName() const override { return name_; }

    /**
     * @brief Canonical NLopt identifier for algorithmId, if it names a derivative-free algorithm.
     */
    static std::optional<std::string> resolve(const std::string& algorithmId);

    /** @brief All derivative-free NLopt identifiers of the linked library. */
    static std::vector<std::string> derivativeFreeAlgorithms();

private:
    std::string name_;
    int algorithm_;
    double max_time_seconds_ = 60.0;
    double ftol_rel_ = 1e-8;
    int max_evaluations_ = 0;
    double initial_step_ = 0.0;
    std::optional<std::uint32_t> seed_;

    struct CallbackData {
        IObjectiveFunction* objective;
        IParameterManager* manager;
        Eigen::VectorXd bestParameters;
        double bestValue;
        int evaluations;
        std::exception_ptr error;
    };

    static double evaluate(const std::vector<double>& x, std::vector<double>& grad, void* data);
};

} // namespace riceair

#endif // NLOPT_OPTIMIZER_HPP
