#include "rice_air/parameters/TaxParameterManager.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace riceair {

TaxParameterManager::TaxParameterManager(const BackstopPriceSchedule& backstop,
                                         int nPeriods,
                                         double sigmaFraction)
    : normalizer_(backstop)
{
    if (!(sigmaFraction > 0.0)) {
        THROW_INVALID_PARAM("TaxParameterManager", "sigmaFraction must be positive.");
    }

    upper_bounds_ = backstop.ceilingForOptimizedPeriods(nPeriods);
    lower_bounds_ = Eigen::VectorXd::Zero(nPeriods);
    sigmas_ = sigmaFraction * upper_bounds_;
    current_ = Eigen::VectorXd::Zero(nPeriods);

    param_names_.reserve(nPeriods);
    for (int i = 0; i < nPeriods; ++i) {
        param_names_.push_back("tax_period_" + std::to_string(i + 2));
    }
}

void TaxParameterManager::checkIndex(int idx, const std::string& caller) const {
    if (idx < 0 || static_cast<size_t>(idx) >= param_names_.size()) {
        THROW_OUT_OF_RANGE(caller, "Parameter index " + std::to_string(idx) + " out of range.");
    }
}

void TaxParameterManager::checkSize(const Eigen::VectorXd& parameters, const std::string& caller) const {
    if (static_cast<size_t>(parameters.size()) != param_names_.size()) {
        THROW_INVALID_TAX_VECTOR(caller,
            "Parameter vector size mismatch: expected " + std::to_string(param_names_.size()) +
            ", got " + std::to_string(parameters.size()));
    }
}

Eigen::VectorXd TaxParameterManager::getCurrentParameters() const {
    return current_;
}

void TaxParameterManager::updateModelParameters(const Eigen::VectorXd& parameters) {
    checkSize(parameters, "TaxParameterManager::updateModelParameters");
    current_ = applyConstraints(parameters);
}

const std::vector<std::string>& TaxParameterManager::getParameterNames() const {
    return param_names_;
}

size_t TaxParameterManager::getParameterCount() const {
    return param_names_.size();
}

double TaxParameterManager::getSigmaForParamIndex(int index) const {
    checkIndex(index, "TaxParameterManager::getSigmaForParamIndex");
    return sigmas_(index);
}

double TaxParameterManager::getLowerBoundForParamIndex(int idx) const {
    checkIndex(idx, "TaxParameterManager::getLowerBoundForParamIndex");
    return lower_bounds_(idx);
}

double TaxParameterManager::getUpperBoundForParamIndex(int idx) const {
    checkIndex(idx, "TaxParameterManager::getUpperBoundForParamIndex");
    return upper_bounds_(idx);
}

Eigen::VectorXd TaxParameterManager::applyConstraints(const Eigen::VectorXd& parameters) const {
    checkSize(parameters, "TaxParameterManager::applyConstraints");

    Eigen::VectorXd constrained = parameters.cwiseMax(lower_bounds_).cwiseMin(upper_bounds_);
    // NaN survives cwiseMax/cwiseMin; park it at the lower bound.
    for (Eigen::Index i = 0; i < constrained.size(); ++i) {
        if (std::isnan(constrained(i))) {
            constrained(i) = lower_bounds_(i);
        }
    }
    normalizer_.normalizeInPlace(constrained);
    return constrained;
}

void TaxParameterManager::validateInitialGuess(const Eigen::VectorXd& guess) const {
    const std::string F_NAME = "TaxParameterManager::validateInitialGuess";
    checkSize(guess, F_NAME);

    for (Eigen::Index i = 0; i < guess.size(); ++i) {
        if (!std::isfinite(guess(i)) || guess(i) < lower_bounds_(i) || guess(i) > upper_bounds_(i)) {
            THROW_INVALID_BOUNDS(F_NAME, "Initial guess for " + param_names_[i] + " = " +
                                 std::to_string(guess(i)) + " lies outside [" +
                                 std::to_string(lower_bounds_(i)) + ", " +
                                 std::to_string(upper_bounds_(i)) + "].");
        }
    }
}

} // namespace riceair
