#ifndef I_OBJECTIVE_FUNCTION_HPP
#define I_OBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>
#include <vector>
#include <string>

namespace riceair {

/**
 * @brief Interface for the scalar objective driven by the optimization algorithms.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @brief Calculate the objective score (e.g. total welfare) for a decision vector.
     *
     * @param parameters The decision vector to evaluate.
     * @return double The calculated objective score. Higher values are better.
     *         Returns -infinity when the evaluation failed.
     */
    virtual double calculate(const Eigen::VectorXd& parameters) = 0;

    /**
     * @brief Get the names of the decision variables expected by this objective function.
     * @return const std::vector<std::string>&
     */
    virtual const std::vector<std::string>& getParameterNames() const = 0;
};

} // namespace riceair

#endif // I_OBJECTIVE_FUNCTION_HPP
