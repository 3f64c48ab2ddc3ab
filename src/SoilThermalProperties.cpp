/**
 * @file SoilThermalProperties.cpp
 * @brief Volumetric latent heat and heat capacity of moist soil
 */

#include "SoilThermalProperties.hpp"
#include <cmath>

namespace MBFD {

double roundToDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}
namespace SoilThermal {

double volumetricLatentHeat(double dry_density, double water_content) {
    return LATENT_HEAT_OF_WATER * dry_density * water_content;
}

double volumetricHeatCapacity(double dry_density, double water_content,
                              PoreWaterState state) {
    double c_water = SPECIFIC_HEAT_PORE_AVERAGE;
    switch (state) {
        case PoreWaterState::FROZEN:
            c_water = SPECIFIC_HEAT_ICE;
            break;
        case PoreWaterState::UNFROZEN:
            c_water = SPECIFIC_HEAT_WATER;
            break;
        case PoreWaterState::AVERAGE:
            break;
    }
    return dry_density * (SPECIFIC_HEAT_SOLIDS + c_water * water_content);
}

} // namespace SoilThermal

SoilThermalProperties deriveSoilThermalProperties(double dry_density, double water_content,
                                                  bool round_to_worksheet) {
    SoilThermalProperties props;
    props.latent_heat = SoilThermal::volumetricLatentHeat(dry_density, water_content);
    props.heat_capacity = SoilThermal::averageHeatCapacity(dry_density, water_content);
    props.frozen_heat_capacity = SoilThermal::frozenHeatCapacity(dry_density, water_content);
    props.unfrozen_heat_capacity = SoilThermal::unfrozenHeatCapacity(dry_density, water_content);

    if (round_to_worksheet) {
        props.latent_heat = roundToDecimals(props.latent_heat, 2);
        props.heat_capacity = roundToDecimals(props.heat_capacity, 2);
        props.frozen_heat_capacity = roundToDecimals(props.frozen_heat_capacity, 2);
        props.unfrozen_heat_capacity = roundToDecimals(props.unfrozen_heat_capacity, 2);
    }

    return props;
}

} // namespace MBFD
