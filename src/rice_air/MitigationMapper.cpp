#include "rice_air/MitigationMapper.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace riceair {

MitigationMapper::MitigationMapper(const BackstopPriceSchedule& backstop, double theta2)
    : backstop_(backstop), theta2_(theta2)
{
    if (!std::isfinite(theta2_) || theta2_ <= 1.0) {
        THROW_INVALID_PARAM("MitigationMapper", "theta2 must be finite and greater than 1, got " +
                            std::to_string(theta2_) + ".");
    }
}

void MitigationMapper::validateTax(const Eigen::VectorXd& tax, const std::string& caller) const {
    const int max_len = backstop_.numPeriods() - 1;
    if (tax.size() > max_len) {
        THROW_INVALID_TAX_VECTOR(caller, "Tax vector has " + std::to_string(tax.size()) +
                                 " entries but only " + std::to_string(max_len) +
                                 " periods follow the untaxed first period.");
    }
    if (!tax.allFinite()) {
        THROW_INVALID_TAX_VECTOR(caller, "Tax vector contains non-finite values.");
    }
}

Eigen::VectorXd MitigationMapper::fullTaxTrajectory(const Eigen::VectorXd& tax) const {
    validateTax(tax, "MitigationMapper::fullTaxTrajectory");

    Eigen::VectorXd trajectory = backstop_.periodMaximum();
    trajectory(0) = 0.0;
    trajectory.segment(1, tax.size()) = tax;
    return trajectory;
}

MitigationSchedule MitigationMapper::map(const Eigen::VectorXd& tax) const {
    MitigationSchedule schedule;
    schedule.tax = fullTaxTrajectory(tax);

    const Eigen::MatrixXd& prices = backstop_.scaled();
    const double exponent = 1.0 / (theta2_ - 1.0);

    schedule.abatement.resize(prices.rows(), prices.cols());
    for (Eigen::Index t = 0; t < prices.rows(); ++t) {
        // A negative ratio has no real power; it maps to zero abatement.
        const double period_tax = std::max(schedule.tax(t), 0.0);
        for (Eigen::Index r = 0; r < prices.cols(); ++r) {
            double mu = std::pow(period_tax / prices(t, r), exponent);
            schedule.abatement(t, r) = std::clamp(mu, 0.0, 1.0);
        }
    }
    return schedule;
}

} // namespace riceair
