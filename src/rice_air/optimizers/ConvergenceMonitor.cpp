#include "rice_air/optimizers/ConvergenceMonitor.hpp"
#include "rice_air/optimizers/AlgorithmSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace riceair {

std::string toString(OptimizationStatus status) {
    switch (status) {
        case OptimizationStatus::FTOL_REACHED:    return "FTOL_REACHED";
        case OptimizationStatus::MAXTIME_REACHED: return "MAXTIME_REACHED";
        case OptimizationStatus::MAXITER_REACHED: return "MAXITER_REACHED";
        case OptimizationStatus::FAILURE:         return "FAILURE";
    }
    return "UNKNOWN";
}

ConvergenceMonitor::ConvergenceMonitor(const Settings& settings)
    : settings_(settings) {}

ConvergenceMonitor::Settings ConvergenceMonitor::readSettings(
    const std::map<std::string, double>& settings, const Settings& defaults) {

    const std::string F_NAME = "ConvergenceMonitor::readSettings";
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };

    Settings s;
    s.max_time_seconds = get("max_time_seconds", defaults.max_time_seconds);
    s.ftol_rel         = get("ftol_rel", defaults.ftol_rel);
    s.ftol_window      = readCountSetting(settings, "ftol_window", defaults.ftol_window, 1, F_NAME);
    s.max_iterations   = readCountSetting(settings, "iterations", defaults.max_iterations, 0, F_NAME);

    if (!(s.max_time_seconds > 0.0)) {
        THROW_INVALID_PARAM(F_NAME, "max_time_seconds must be positive.");
    }
    if (!(s.ftol_rel > 0.0)) {
        THROW_INVALID_PARAM(F_NAME, "ftol_rel must be positive.");
    }
    return s;
}

void ConvergenceMonitor::start() {
    start_time_ = std::chrono::steady_clock::now();
    history_.clear();
    iterations_ = 0;
}

double ConvergenceMonitor::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

bool ConvergenceMonitor::timeExpired() const {
    return elapsedSeconds() >= settings_.max_time_seconds;
}

std::optional<OptimizationStatus> ConvergenceMonitor::update(double bestValue) {
    ++iterations_;
    history_.push_back(bestValue);
    if (static_cast<int>(history_.size()) > settings_.ftol_window + 1) {
        history_.pop_front();
    }

    if (static_cast<int>(history_.size()) == settings_.ftol_window + 1 &&
        std::isfinite(history_.front()) && std::isfinite(bestValue)) {
        double change = std::abs(bestValue - history_.front());
        if (change <= settings_.ftol_rel * std::abs(bestValue)) {
            return OptimizationStatus::FTOL_REACHED;
        }
    }
    if (timeExpired()) {
        return OptimizationStatus::MAXTIME_REACHED;
    }
    if (settings_.max_iterations > 0 && iterations_ >= settings_.max_iterations) {
        return OptimizationStatus::MAXITER_REACHED;
    }
    return std::nullopt;
}

} // namespace riceair
