#include "rice_air/MitigationAccountant.hpp"
#include "rice_air/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <memory>

namespace riceair {

Eigen::VectorXd MitigationAccountant::globalEmissions(const IRiceAirModel& model) {
    Eigen::MatrixXd eind = model.getOutput(fields::EMISSIONS, fields::EIND);
    if (!eind.allFinite()) {
        THROW_EVALUATION_ERROR("MitigationAccountant::globalEmissions",
                               "Industrial emissions contain non-finite values.");
    }
    return eind.rowwise().sum();
}

Eigen::VectorXd MitigationAccountant::globalMitigation(const IRiceAirModel& optimized) {
    const std::string F_NAME = "MitigationAccountant::globalMitigation";

    Eigen::VectorXd optimizedEmissions = globalEmissions(optimized);

    std::unique_ptr<IRiceAirModel> baseline = optimized.clone();
    Eigen::MatrixXd noAbatement = Eigen::MatrixXd::Zero(baseline->getNumPeriods(), baseline->getNumRegions());
    baseline->setParameter(fields::EMISSIONS, fields::MIU, noAbatement);
    baseline->setParameter(fields::AIR_COREDUCTION, fields::MIU, noAbatement);
    baseline->run();

    Eigen::VectorXd baselineEmissions = globalEmissions(*baseline);
    if (baselineEmissions.size() != optimizedEmissions.size()) {
        throw InvalidResultException(F_NAME,
            "Baseline run has " + std::to_string(baselineEmissions.size()) +
            " periods, optimized run has " + std::to_string(optimizedEmissions.size()) + ".");
    }

    Eigen::VectorXd mitigation = Eigen::VectorXd::Zero(baselineEmissions.size());
    for (Eigen::Index t = 0; t < baselineEmissions.size(); ++t) {
        if (baselineEmissions(t) == 0.0) {
            Logger::getInstance().debug(F_NAME, "Zero baseline emissions in period " +
                                        std::to_string(t + 1) + "; mitigation set to 0.");
            continue;
        }
        mitigation(t) = (baselineEmissions(t) - optimizedEmissions(t)) / baselineEmissions(t);
    }
    return mitigation;
}

} // namespace riceair
