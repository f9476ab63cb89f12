#ifndef MITIGATION_ACCOUNTANT_HPP
#define MITIGATION_ACCOUNTANT_HPP

#include "rice_air/interfaces/IRiceAirModel.hpp"
#include <Eigen/Dense>

namespace riceair {

/**
 * @brief Global emission reductions of an optimized model run relative to a no-policy baseline.
 */
class MitigationAccountant {
public:
    /**
     * @brief Fraction of baseline industrial emissions avoided in each period.
     *
     * Takes a snapshot of the optimized model, sets both abatement inputs to
     * zero, runs the snapshot and compares summed regional emissions:
     * (baseline - optimized) / baseline. Periods with zero baseline emissions
     * report 0. The optimized model is left untouched.
     *
     * @param optimized Model whose last run is the optimized policy.
     * @return Eigen::VectorXd One mitigation rate per period.
     *
     * @throws SimulationException If the baseline run fails.
     * @throws EvaluationException If either run reports non-finite emissions.
     * @throws InvalidResultException If the two runs disagree on the number of periods.
     */
    static Eigen::VectorXd globalMitigation(const IRiceAirModel& optimized);

    /**
     * @brief Industrial emissions summed across regions, one value per period.
     * @throws EvaluationException If any emission value is non-finite.
     */
    static Eigen::VectorXd globalEmissions(const IRiceAirModel& model);
};

} // namespace riceair

#endif // MITIGATION_ACCOUNTANT_HPP
