#ifndef MBFD_SOIL_THERMAL_PROPERTIES_HPP
#define MBFD_SOIL_THERMAL_PROPERTIES_HPP

namespace MBFD {

/**
 * @brief Round half away from zero to a number of decimal places
 *
 * Used for lambda (2 decimals, chart granularity) and the optional
 * worksheet rounding of L, C, mu and alpha.
 */
double roundToDecimals(double value, int decimals);

/**
 * @brief Volumetric thermal properties of a moist soil mass
 *
 * Closed-form worksheet relations of UFC 3-130-06 (and TM 5-852-6) in the
 * imperial convention:
 *
 *   L  = 144 * gamma_d * w                       [BTU/ft3]
 *   C  = gamma_d * (c_s + c_w * w)               [BTU/(ft3 degF)]
 *
 * where gamma_d is the dry unit weight [lbm/ft3], w the gravimetric water
 * content as a fraction, c_s = 0.17 BTU/(lbm degF) the specific heat of soil
 * solids and c_w the specific heat of the pore water phase: 0.5 for ice,
 * 1.0 for water and 0.75 for the frozen/unfrozen average used by the
 * modified Berggren equation.
 *
 * References:
 * - UFC 3-130-06, Calculation Methods for Determination of Depths of Freeze
 *   and Thaw in Soils (2004)
 * - Aldrich & Paynter (1953) - Analytical studies of freezing and thawing
 */
namespace SoilThermal {

constexpr double LATENT_HEAT_OF_WATER = 144.0;       // BTU/lbm
constexpr double SPECIFIC_HEAT_SOLIDS = 0.17;        // BTU/(lbm degF)
constexpr double SPECIFIC_HEAT_ICE = 0.5;            // BTU/(lbm degF)
constexpr double SPECIFIC_HEAT_WATER = 1.0;          // BTU/(lbm degF)
constexpr double SPECIFIC_HEAT_PORE_AVERAGE = 0.75;  // mean of ice and water

/**
 * @brief Pore water state used to select the specific heat of the water phase
 */
enum class PoreWaterState {
    FROZEN,
    UNFROZEN,
    AVERAGE
};

/**
 * @brief Volumetric latent heat of fusion [BTU/ft3]
 * @param dry_density Dry unit weight [lbm/ft3]
 * @param water_content Gravimetric water content [fraction]
 */
double volumetricLatentHeat(double dry_density, double water_content);

/**
 * @brief Volumetric heat capacity [BTU/(ft3 degF)] for a pore water state
 */
double volumetricHeatCapacity(double dry_density, double water_content,
                              PoreWaterState state = PoreWaterState::AVERAGE);

inline double frozenHeatCapacity(double dry_density, double water_content) {
    return volumetricHeatCapacity(dry_density, water_content, PoreWaterState::FROZEN);
}

inline double unfrozenHeatCapacity(double dry_density, double water_content) {
    return volumetricHeatCapacity(dry_density, water_content, PoreWaterState::UNFROZEN);
}

inline double averageHeatCapacity(double dry_density, double water_content) {
    return volumetricHeatCapacity(dry_density, water_content, PoreWaterState::AVERAGE);
}

} // namespace SoilThermal

/**
 * @brief Derived thermal properties of the soil layer (working units)
 */
struct SoilThermalProperties {
    double latent_heat;                // L [BTU/ft3]
    double heat_capacity;              // C, frozen/unfrozen average [BTU/(ft3 degF)]
    double frozen_heat_capacity;       // C_f [BTU/(ft3 degF)]
    double unfrozen_heat_capacity;     // C_u [BTU/(ft3 degF)]

    SoilThermalProperties() :
        latent_heat(0.0), heat_capacity(0.0),
        frozen_heat_capacity(0.0), unfrozen_heat_capacity(0.0) {}
};

/**
 * @brief Derive L and C from dry density and water content
 * @param round_to_worksheet Round L and C to 2 decimals like the manual worksheet
 */
SoilThermalProperties deriveSoilThermalProperties(double dry_density, double water_content,
                                                  bool round_to_worksheet = true);

} // namespace MBFD

#endif // MBFD_SOIL_THERMAL_PROPERTIES_HPP
