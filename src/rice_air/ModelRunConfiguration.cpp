#include "rice_air/ModelRunConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace riceair {

std::string toString(SSPScenario scenario) {
    switch (scenario) {
        case SSPScenario::SSP1: return "SSP1";
        case SSPScenario::SSP2: return "SSP2";
        case SSPScenario::SSP3: return "SSP3";
        case SSPScenario::SSP4: return "SSP4";
        case SSPScenario::SSP5: return "SSP5";
    }
    return "SSP?";
}

SSPScenario sspScenarioFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "SSP1") return SSPScenario::SSP1;
    if (upper == "SSP2") return SSPScenario::SSP2;
    if (upper == "SSP3") return SSPScenario::SSP3;
    if (upper == "SSP4") return SSPScenario::SSP4;
    if (upper == "SSP5") return SSPScenario::SSP5;
    throw DataFormatException("sspScenarioFromString",
        "Unknown SSP scenario '" + name + "'. Valid options are: SSP1, SSP2, SSP3, SSP4, SSP5");
}

void ModelRunConfiguration::validate() const {
    const std::string F_NAME = "ModelRunConfiguration::validate";

    if (nsteps < 2) {
        THROW_INVALID_PARAM(F_NAME, "nsteps must be at least 2, got " + std::to_string(nsteps));
    }

    auto requireFinite = [&](const char* name, double value) {
        if (!std::isfinite(value)) {
            THROW_INVALID_PARAM(F_NAME, std::string(name) + " must be finite.");
        }
    };
    requireFinite("rho", rho);
    requireFinite("eta", eta);
    requireFinite("tau", tau);
    requireFinite("kuznets_term", kuznets_term);
    requireFinite("hyears", hyears);
    requireFinite("VOLY_elasticity", VOLY_elasticity);

    if (rho < 0.0) {
        THROW_INVALID_PARAM(F_NAME, "rho (pure rate of time preference) cannot be negative.");
    }
    if (hyears < 0.0) {
        THROW_INVALID_PARAM(F_NAME, "hyears cannot be negative.");
    }
}

} // namespace riceair
