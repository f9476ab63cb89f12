#ifndef MODEL_RUN_CONFIGURATION_HPP
#define MODEL_RUN_CONFIGURATION_HPP

#include "rice_air/ModelConstants.hpp"
#include <string>

namespace riceair {

/**
 * @brief Shared Socioeconomic Pathway used for the pollutant co-reduction relationship.
 */
enum class SSPScenario {
    SSP1,
    SSP2,
    SSP3,
    SSP4,
    SSP5
};

std::string toString(SSPScenario scenario);

/**
 * @brief Parses "SSP1".."SSP5" (case-insensitive).
 * @throws DataFormatException If the name is not a known scenario.
 */
SSPScenario sspScenarioFromString(const std::string& name);

/**
 * @brief User-defined settings for one RICE+AIR experiment.
 *
 * Created once per experiment and passed by const reference into every stage
 * of the optimization pipeline.
 */
struct ModelRunConfiguration {
    /** @brief Number of model time steps. */
    int nsteps = constants::DEFAULT_NUM_PERIODS;
    /** @brief Pure rate of time preference. */
    double rho = 0.015;
    /** @brief Elasticity of marginal utility of consumption. */
    double eta = 1.5;
    /** @brief Rate/shape parameter of the value-of-life transfer. */
    double tau = 0.0;
    /** @brief Environmental Kuznets-curve term. */
    double kuznets_term = 0.0;
    SSPScenario ssp_scenario = SSPScenario::SSP2;
    /** @brief Horizon (years) over which health impacts are counted. */
    double hyears = 1.0;
    /** @brief Value welfare effects with the value of a statistical life. */
    bool use_VSL = false;
    /** @brief Income elasticity of the value of a life year. */
    double VOLY_elasticity = 1.0;

    /**
     * @brief Checks that the configuration can drive a model run.
     * @throws InvalidParameterException If nsteps < 2, a numeric field is
     *         non-finite, or rho/hyears are negative.
     */
    void validate() const;
};

} // namespace riceair

#endif // MODEL_RUN_CONFIGURATION_HPP
