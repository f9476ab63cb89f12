#ifndef MODEL_CONSTANTS_HPP
#define MODEL_CONSTANTS_HPP

#include <array>

namespace riceair {
namespace constants {

    constexpr int NUM_REGIONS = 12;
    constexpr int DEFAULT_NUM_PERIODS = 60;
    constexpr int MAX_OPTIMIZED_PERIODS = DEFAULT_NUM_PERIODS - 1;

    // Backstop prices are calibrated in thousands of currency units per tonne.
    constexpr double BACKSTOP_PRICE_SCALE = 1000.0;
    constexpr double DEFAULT_THETA2 = 2.8;
    constexpr int CEILING_ROUNDING_DIGITS = 2;

    constexpr std::array<const char*, NUM_REGIONS> REGION_NAMES = {
        "US", "EU", "Japan", "Russia", "Eurasia", "China",
        "India", "MidEast", "Africa", "LatAm", "OHI", "OthAs"
    };

} // namespace constants

/**
 * @brief Component and field names of the coupled model consumed by the optimizer.
 */
namespace fields {

    constexpr const char* EMISSIONS = "emissions";
    constexpr const char* AIR_COREDUCTION = "air_coreduction";
    constexpr const char* AIR_CONSUMPTION = "air_consumption";
    constexpr const char* WELFARE = "welfare";

    constexpr const char* MIU = "MIU";
    constexpr const char* EIND = "EIND";
    constexpr const char* LIFEYEARS = "lifeyears";
    constexpr const char* AVOIDED_DEATHS = "avoided_deaths";
    constexpr const char* WELFARE_TOTAL = "welfare";

} // namespace fields
} // namespace riceair

#endif // MODEL_CONSTANTS_HPP
