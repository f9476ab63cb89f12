#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>

namespace riceair {

BackstopPriceSchedule::BackstopPriceSchedule(const Eigen::MatrixXd& prices)
    : raw_(prices)
{
    const std::string F_NAME = "BackstopPriceSchedule";

    if (raw_.rows() < 2) {
        THROW_INVALID_BACKSTOP(F_NAME, "Backstop table needs at least two periods, got " +
                               std::to_string(raw_.rows()) + ".");
    }
    if (raw_.cols() < 1) {
        THROW_INVALID_BACKSTOP(F_NAME, "Backstop table has no regions.");
    }

    for (Eigen::Index t = 0; t < raw_.rows(); ++t) {
        for (Eigen::Index r = 0; r < raw_.cols(); ++r) {
            double value = raw_(t, r);
            if (!std::isfinite(value) || value <= 0.0) {
                THROW_INVALID_BACKSTOP(F_NAME, "Entry [period " + std::to_string(t + 1) +
                                       ", region " + std::to_string(r + 1) + "] = " +
                                       std::to_string(value) + " must be finite and strictly positive.");
            }
        }
    }

    scaled_ = raw_ * constants::BACKSTOP_PRICE_SCALE;
    period_max_ = scaled_.rowwise().maxCoeff();
}

Eigen::VectorXd BackstopPriceSchedule::ceilingForOptimizedPeriods(int n) const {
    if (n < 1 || n > numPeriods() - 1) {
        THROW_INVALID_TAX_VECTOR("BackstopPriceSchedule::ceilingForOptimizedPeriods",
            "Number of optimized periods must be in [1, " + std::to_string(numPeriods() - 1) +
            "], got " + std::to_string(n) + ".");
    }
    return period_max_.segment(1, n);
}

} // namespace riceair
