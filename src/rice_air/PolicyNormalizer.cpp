#include "rice_air/PolicyNormalizer.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>

namespace riceair {

PolicyNormalizer::PolicyNormalizer(const BackstopPriceSchedule& backstop, int digits)
    : backstop_(backstop)
{
    if (digits < 0) {
        THROW_INVALID_PARAM("PolicyNormalizer", "Rounding digits cannot be negative.");
    }
    scale_ = std::pow(10.0, digits);
}

double PolicyNormalizer::roundToDigits(double value) const {
    return std::round(value * scale_) / scale_;
}

void PolicyNormalizer::checkLength(const Eigen::VectorXd& tax) const {
    if (tax.size() > backstop_.numPeriods() - 1) {
        THROW_INVALID_TAX_VECTOR("PolicyNormalizer", "Tax vector has " + std::to_string(tax.size()) +
                                 " entries, maximum is " + std::to_string(backstop_.numPeriods() - 1) + ".");
    }
}

std::optional<Eigen::Index> PolicyNormalizer::findCeilingIndex(const Eigen::VectorXd& tax) const {
    checkLength(tax);
    const Eigen::VectorXd& ceiling = backstop_.periodMaximum();

    for (Eigen::Index i = 0; i < tax.size(); ++i) {
        if (roundToDigits(tax(i)) == roundToDigits(ceiling(i + 1))) {
            return i;
        }
    }
    return std::nullopt;
}

bool PolicyNormalizer::normalizeInPlace(Eigen::VectorXd& tax) const {
    std::optional<Eigen::Index> hit = findCeilingIndex(tax);
    if (!hit) {
        return false;
    }

    const Eigen::Index first = *hit;
    const Eigen::Index count = tax.size() - first;
    tax.segment(first, count) = backstop_.periodMaximum().segment(first + 1, count);
    return true;
}

Eigen::VectorXd PolicyNormalizer::normalize(const Eigen::VectorXd& tax) const {
    Eigen::VectorXd result = tax;
    normalizeInPlace(result);
    return result;
}

} // namespace riceair
