#include "rice_air/objectives/WelfareObjectiveFunction.hpp"
#include "rice_air/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

namespace riceair {

namespace acc = boost::accumulators;

WelfareObjectiveFunction::WelfareObjectiveFunction(const ModelRunConfiguration& config,
                                                   const BackstopPriceSchedule& backstop,
                                                   int nPeriods,
                                                   bool includeCobenefits,
                                                   const IRiceAirModelBuilder& builder)
    : backstop_(backstop),
      mapper_(backstop),
      normalizer_(backstop),
      n_periods_(nPeriods),
      include_cobenefits_(includeCobenefits)
{
    const std::string F_NAME = "WelfareObjectiveFunction";
    config.validate();
    // Throws for a window that does not fit into the table.
    backstop_.ceilingForOptimizedPeriods(nPeriods);

    model_ = builder.build(config);
    if (!model_) {
        throw ModelConstructionException(F_NAME, "Model builder returned a null model.");
    }
    if (model_->getNumPeriods() != backstop_.numPeriods() ||
        model_->getNumRegions() != backstop_.numRegions()) {
        THROW_INVALID_BACKSTOP(F_NAME,
            "Model shape (" + std::to_string(model_->getNumPeriods()) + " x " +
            std::to_string(model_->getNumRegions()) + ") does not match backstop table (" +
            std::to_string(backstop_.numPeriods()) + " x " +
            std::to_string(backstop_.numRegions()) + ").");
    }

    parameter_names_.reserve(nPeriods);
    for (int i = 0; i < nPeriods; ++i) {
        parameter_names_.push_back("tax_period_" + std::to_string(i + 2));
    }

    if (!include_cobenefits_) {
        disableCobenefits();
    }
}

void WelfareObjectiveFunction::disableCobenefits() {
    Eigen::MatrixXd zeros = Eigen::MatrixXd::Zero(model_->getNumPeriods(), model_->getNumRegions());
    model_->setParameter(fields::AIR_CONSUMPTION, fields::LIFEYEARS, zeros);
    model_->setParameter(fields::AIR_CONSUMPTION, fields::AVOIDED_DEATHS, zeros);
    Logger::getInstance().info("WelfareObjectiveFunction", "Health co-benefits excluded from welfare.");
}

PolicyEvaluation WelfareObjectiveFunction::evaluate(Eigen::VectorXd& tax) {
    const std::string F_NAME = "WelfareObjectiveFunction::evaluate";
    if (tax.size() != n_periods_) {
        THROW_INVALID_TAX_VECTOR(F_NAME, "Expected " + std::to_string(n_periods_) +
                                 " tax values, got " + std::to_string(tax.size()) + ".");
    }

    normalizer_.normalizeInPlace(tax);
    MitigationSchedule schedule = mapper_.map(tax);

    model_->setParameter(fields::EMISSIONS, fields::MIU, schedule.abatement);
    model_->setParameter(fields::AIR_COREDUCTION, fields::MIU, schedule.abatement);

    ++evaluations_;
    auto start = std::chrono::steady_clock::now();
    try {
        model_->run();
    } catch (const SimulationException&) {
        ++failed_evaluations_;
        throw;
    }
    run_time_acc_(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());

    Eigen::MatrixXd output = model_->getOutput(fields::WELFARE, fields::WELFARE_TOTAL);
    if (output.size() != 1) {
        ++failed_evaluations_;
        throw InvalidResultException(F_NAME, "Welfare output must be a scalar, got " +
                                     std::to_string(output.rows()) + " x " +
                                     std::to_string(output.cols()) + ".");
    }
    double welfare = output(0, 0);
    if (!std::isfinite(welfare)) {
        ++failed_evaluations_;
        THROW_EVALUATION_ERROR(F_NAME, "Model reported non-finite welfare.");
    }

    welfare_acc_(welfare);
    return PolicyEvaluation{tax, std::move(schedule), welfare};
}

double WelfareObjectiveFunction::calculate(const Eigen::VectorXd& parameters) {
    Eigen::VectorXd tax = parameters;
    try {
        return evaluate(tax).welfare;
    } catch (const EvaluationException& e) {
        Logger::getInstance().warning("WelfareObjectiveFunction::calculate", e.what());
    } catch (const SimulationException& e) {
        Logger::getInstance().warning("WelfareObjectiveFunction::calculate", e.what());
    }
    return -std::numeric_limits<double>::infinity();
}

const std::vector<std::string>& WelfareObjectiveFunction::getParameterNames() const {
    return parameter_names_;
}

EvaluationStatistics WelfareObjectiveFunction::getStatistics() const {
    EvaluationStatistics stats;
    stats.evaluations = evaluations_;
    stats.failed_evaluations = failed_evaluations_;
    if (acc::count(welfare_acc_) > 0) {
        stats.welfare_mean = acc::mean(welfare_acc_);
        stats.welfare_min = acc::min(welfare_acc_);
        stats.welfare_max = acc::max(welfare_acc_);
    }
    if (acc::count(run_time_acc_) > 0) {
        stats.mean_run_seconds = acc::mean(run_time_acc_);
    }
    return stats;
}

void WelfareObjectiveFunction::logStatistics() const {
    EvaluationStatistics stats = getStatistics();
    std::ostringstream msg;
    msg << "Evaluations: " << stats.evaluations
        << " | Failed: " << stats.failed_evaluations
        << " | Welfare mean/min/max: " << stats.welfare_mean
        << " / " << stats.welfare_min << " / " << stats.welfare_max
        << " | Mean run time: " << stats.mean_run_seconds << " s";
    Logger::getInstance().info("WelfareObjectiveFunction", msg.str());
}

} // namespace riceair
