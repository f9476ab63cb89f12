#include "rice_air/optimizers/AlgorithmSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>

namespace riceair {

namespace {

bool isWholeNumberIn(double value, double low, double high) {
    return std::isfinite(value) && value >= low && value <= high && std::floor(value) == value;
}

} // namespace

int readCountSetting(const std::map<std::string, double>& settings,
                     const std::string& key,
                     int fallback,
                     int minimum,
                     const std::string& source) {
    auto it = settings.find(key);
    if (it == settings.end()) {
        return fallback;
    }
    if (!isWholeNumberIn(it->second, static_cast<double>(minimum),
                         static_cast<double>(std::numeric_limits<int>::max()))) {
        THROW_INVALID_PARAM(source, key + " must be a whole number of at least " +
                            std::to_string(minimum) + ", got " + std::to_string(it->second) + ".");
    }
    return static_cast<int>(it->second);
}

std::optional<std::uint32_t> readSeedSetting(const std::map<std::string, double>& settings,
                                             const std::string& source) {
    auto it = settings.find("seed");
    if (it == settings.end()) {
        return std::nullopt;
    }
    if (!isWholeNumberIn(it->second, 0.0, static_cast<double>(std::numeric_limits<std::uint32_t>::max()))) {
        THROW_INVALID_PARAM(source, "seed must be a whole number in [0, 4294967295], got " +
                            std::to_string(it->second) + ".");
    }
    return static_cast<std::uint32_t>(it->second);
}

} // namespace riceair
