#ifndef ALGORITHM_SETTINGS_HPP
#define ALGORITHM_SETTINGS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace riceair {

/**
 * @brief Reads an integer-valued entry of a configure() settings map.
 *
 * @param settings Settings passed to IOptimizationAlgorithm::configure.
 * @param key Setting name.
 * @param fallback Returned when the key is absent.
 * @param minimum Smallest accepted value.
 * @param source Caller name used in the exception.
 * @return int The setting value.
 *
 * @throws InvalidParameterException If the value is non-finite, not a whole
 *         number, below minimum or beyond the int range.
 */
int readCountSetting(const std::map<std::string, double>& settings,
                     const std::string& key,
                     int fallback,
                     int minimum,
                     const std::string& source);

/**
 * @brief Reads the optional "seed" entry.
 * @return The seed, or std::nullopt when the key is absent.
 * @throws InvalidParameterException If the seed is not a whole number in [0, 2^32 - 1].
 */
std::optional<std::uint32_t> readSeedSetting(const std::map<std::string, double>& settings,
                                             const std::string& source);

} // namespace riceair

#endif // ALGORITHM_SETTINGS_HPP
