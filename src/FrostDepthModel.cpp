/**
 * @file FrostDepthModel.cpp
 * @brief Modified Berggren frost depth pipeline (UFC 3-130-06 closed form)
 */

#include "FrostDepthModel.hpp"
#include "UnitSystem.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace MBFD {

namespace {

constexpr double FREEZING_POINT_DEGF = 32.0;
constexpr double FREEZING_POINT_DEGC = 0.0;

// 2 x 24 hr/day, see computeFrostDepth
constexpr double BERGGREN_CONSTANT = 48.0;

constexpr double LOW_LATITUDE_FACTOR = 0.707;

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw FrostDepthError(ErrorKind::INVALID_INPUT, field,
                              std::string(field) + " must be a finite number");
    }
}

void requirePositive(double value, const char* field) {
    requireFinite(value, field);
    if (value <= 0.0) {
        std::ostringstream msg;
        msg << field << " must be positive (got " << value << ")";
        throw FrostDepthError(ErrorKind::INVALID_INPUT, field, msg.str());
    }
}

void requireNonNegative(double value, const char* field) {
    requireFinite(value, field);
    if (value < 0.0) {
        std::ostringstream msg;
        msg << field << " must not be negative (got " << value << ")";
        throw FrostDepthError(ErrorKind::INVALID_INPUT, field, msg.str());
    }
}

} // namespace

// =============================================================================
// Enumerations
// =============================================================================

std::string toString(UnitConvention convention) {
    switch (convention) {
        case UnitConvention::IMPERIAL: return "IMPERIAL";
        case UnitConvention::METRIC:   return "METRIC";
    }
    return "UNKNOWN";
}

std::string toString(LambdaMethod method) {
    switch (method) {
        case LambdaMethod::ALDRICH:      return "ALDRICH";
        case LambdaMethod::LOW_LATITUDE: return "LOW_LATITUDE";
        case LambdaMethod::MEAN:         return "MEAN";
    }
    return "UNKNOWN";
}

std::string toString(SurfaceTemperatureMode mode) {
    switch (mode) {
        case SurfaceTemperatureMode::SEASONAL:  return "SEASONAL";
        case SurfaceTemperatureMode::MULTIYEAR: return "MULTIYEAR";
    }
    return "UNKNOWN";
}

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT:    return "InvalidInput";
        case ErrorKind::DEGENERATE_INPUT: return "DegenerateInput";
        case ErrorKind::DOMAIN_ERROR:     return "DomainError";
    }
    return "Unknown";
}

UnitConvention parseUnitConvention(const std::string& name) {
    std::string key = toUpper(name);
    if (key == "IMPERIAL" || key == "US" || key == "ENGLISH") return UnitConvention::IMPERIAL;
    if (key == "METRIC" || key == "SI") return UnitConvention::METRIC;
    throw std::invalid_argument("Unknown unit system: " + name);
}

LambdaMethod parseLambdaMethod(const std::string& name) {
    std::string key = toUpper(name);
    if (key == "ALDRICH") return LambdaMethod::ALDRICH;
    if (key == "LOW_LATITUDE") return LambdaMethod::LOW_LATITUDE;
    if (key == "MEAN") return LambdaMethod::MEAN;
    throw std::invalid_argument("Unknown lambda method: " + name);
}

SurfaceTemperatureMode parseSurfaceTemperatureMode(const std::string& name) {
    std::string key = toUpper(name);
    if (key == "SEASONAL") return SurfaceTemperatureMode::SEASONAL;
    if (key == "MULTIYEAR" || key == "MULTI_YEAR") return SurfaceTemperatureMode::MULTIYEAR;
    throw std::invalid_argument("Unknown surface temperature mode: " + name);
}

// =============================================================================
// FrostDepthError
// =============================================================================

FrostDepthError::FrostDepthError(ErrorKind kind, const std::string& quantity,
                                 const std::string& message)
    : std::runtime_error(toString(kind) + " [" + quantity + "]: " + message),
      kind_(kind), quantity_(quantity) {
}

// =============================================================================
// Units
// =============================================================================

const QuantityUnits& unitsFor(UnitConvention convention) {
    static const QuantityUnits imperial = {
        "BTU/(hr-ft-degF)", "lbm/ft3", "degF", "delta_degF", "degF-day", "day",
        "BTU/ft3", "BTU/(ft3-degF)", "ft"
    };
    static const QuantityUnits metric = {
        "W/(m-K)", "kg/m3", "degC", "delta_degC", "degC-day", "day",
        "J/m3", "J/(m3-K)", "m"
    };
    return convention == UnitConvention::METRIC ? metric : imperial;
}

double groundTemperatureDifferential(double mean_annual_ground_temperature,
                                     UnitConvention convention) {
    double freezing_point = convention == UnitConvention::METRIC
                                ? FREEZING_POINT_DEGC : FREEZING_POINT_DEGF;
    return mean_annual_ground_temperature - freezing_point;
}

FrostDepthInput toWorkingUnits(const FrostDepthInput& input) {
    if (input.unit_system == UnitConvention::IMPERIAL) {
        return input;
    }

    const QuantityUnits& from = unitsFor(input.unit_system);
    const QuantityUnits& to = unitsFor(UnitConvention::IMPERIAL);

    FrostDepthInput working = input;
    working.thermal_conductivity = convertUnits(input.thermal_conductivity,
                                                from.thermal_conductivity,
                                                to.thermal_conductivity);
    working.dry_density = convertUnits(input.dry_density, from.dry_density, to.dry_density);
    working.mean_annual_temperature = convertUnits(input.mean_annual_temperature,
                                                   from.temperature_difference,
                                                   to.temperature_difference);
    working.air_freezing_index = convertUnits(input.air_freezing_index,
                                              from.freezing_index, to.freezing_index);
    working.freezing_season_duration = convertUnits(input.freezing_season_duration,
                                                    from.duration, to.duration);
    working.mean_annual_air_temperature = convertUnits(input.mean_annual_air_temperature,
                                                       from.temperature, to.temperature);
    working.unit_system = UnitConvention::IMPERIAL;
    return working;
}

// =============================================================================
// Input Validator
// =============================================================================

void validateInput(const FrostDepthInput& input) {
    requirePositive(input.thermal_conductivity, "thermal_conductivity");
    requirePositive(input.dry_density, "dry_density");
    requireNonNegative(input.water_content, "water_content");
    requireFinite(input.mean_annual_temperature, "mean_annual_temperature");
    requireNonNegative(input.air_freezing_index, "air_freezing_index");
    requirePositive(input.n_factor, "n_factor");
    requireNonNegative(input.freezing_season_duration, "freezing_season_duration");
}

// =============================================================================
// Dimensionless Parameters
// =============================================================================

double seasonalSurfaceTemperature(double surface_freezing_index, double duration) {
    if (duration <= 0.0) {
        throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "freezing_season_duration",
                              "zero freezing season, surface temperature undefined");
    }
    if (surface_freezing_index <= 0.0) {
        throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "surface_freezing_index",
                              "no freezing degree-days, surface temperature is zero");
    }
    return surface_freezing_index / duration;
}

double multiyearSurfaceTemperature(double mean_annual_air_temperature) {
    double v_s = std::abs(mean_annual_air_temperature - FREEZING_POINT_DEGF);
    if (v_s <= 0.0) {
        throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "mean_annual_air_temperature",
                              "mean annual air temperature at the freezing point");
    }
    return v_s;
}

DimensionlessParameters computeDimensionlessParameters(const FrostDepthInput& working_input,
                                                       const SoilThermalProperties& props,
                                                       SurfaceTemperatureMode mode,
                                                       bool round_to_worksheet) {
    DimensionlessParameters params;
    params.surface_freezing_index = working_input.air_freezing_index * working_input.n_factor;

    if (mode == SurfaceTemperatureMode::SEASONAL) {
        params.surface_temperature = seasonalSurfaceTemperature(
            params.surface_freezing_index, working_input.freezing_season_duration);
    } else {
        if (params.surface_freezing_index <= 0.0) {
            throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "surface_freezing_index",
                                  "no freezing degree-days");
        }
        params.surface_temperature =
            multiyearSurfaceTemperature(working_input.mean_annual_air_temperature);
    }

    if (props.latent_heat <= 0.0) {
        throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "latent_heat",
                              working_input.water_content > 0.0
                                  ? "latent heat rounds to zero at this water content"
                                  : "no pore water, latent heat of fusion is zero");
    }

    params.fusion_parameter = props.heat_capacity * params.surface_temperature / props.latent_heat;
    params.thermal_ratio = working_input.mean_annual_temperature / params.surface_temperature;

    if (round_to_worksheet) {
        params.fusion_parameter = roundToDecimals(params.fusion_parameter, 3);
        params.thermal_ratio = roundToDecimals(params.thermal_ratio, 3);
    }

    return params;
}

// =============================================================================
// Correction Coefficient
// =============================================================================

double computeCorrectionCoefficient(double fusion_parameter, double thermal_ratio,
                                    LambdaMethod method) {
    double radicand = 1.0 + fusion_parameter * (thermal_ratio + 0.5);
    if (!(radicand > 0.0)) {
        std::ostringstream msg;
        msg << "1 + mu (alpha + 0.5) = " << radicand
            << " is not positive (mu = " << fusion_parameter
            << ", alpha = " << thermal_ratio << ")";
        throw FrostDepthError(ErrorKind::DOMAIN_ERROR, "correction_coefficient_radicand",
                              msg.str());
    }

    double aldrich = 1.0 / std::sqrt(radicand);
    double low_latitude = LOW_LATITUDE_FACTOR / std::sqrt(radicand);

    double lambda = aldrich;
    switch (method) {
        case LambdaMethod::ALDRICH:
            break;
        case LambdaMethod::LOW_LATITUDE:
            lambda = low_latitude;
            break;
        case LambdaMethod::MEAN:
            lambda = 0.5 * (aldrich + low_latitude);
            break;
    }
    lambda = roundToDecimals(lambda, 2);

    // Below the chart's 0.01 resolution lambda carries no information
    if (!(lambda > 0.0)) {
        std::ostringstream msg;
        msg << "correction coefficient rounds to zero (mu = " << fusion_parameter
            << ", alpha = " << thermal_ratio << ")";
        throw FrostDepthError(ErrorKind::DOMAIN_ERROR, "correction_coefficient", msg.str());
    }
    return lambda;
}

// =============================================================================
// Frost Depth
// =============================================================================

double computeFrostDepth(double correction_coefficient, double thermal_conductivity,
                         double surface_freezing_index, double latent_heat) {
    if (latent_heat <= 0.0) {
        throw FrostDepthError(ErrorKind::DEGENERATE_INPUT, "latent_heat",
                              "no pore water, latent heat of fusion is zero");
    }
    return correction_coefficient *
           std::sqrt(BERGGREN_CONSTANT * thermal_conductivity * surface_freezing_index /
                     latent_heat);
}

// =============================================================================
// FrostDepthCalculator
// =============================================================================

FrostDepthCalculator::FrostDepthCalculator() : options_() {
}

FrostDepthCalculator::FrostDepthCalculator(const Options& options) : options_(options) {
}

FrostDepthResult FrostDepthCalculator::compute(const FrostDepthInput& input) const {
    validateInput(input);

    FrostDepthInput working = toWorkingUnits(input);
    SoilThermalProperties props = deriveSoilThermalProperties(
        working.dry_density, working.water_content, options_.round_intermediates);

    FrostDepthResult result;
    result.unit_system = input.unit_system;
    result.lambda_method = options_.lambda_method;

    FrostDepthQuantities& q = result.working;
    q.latent_heat = props.latent_heat;
    q.heat_capacity = props.heat_capacity;
    q.surface_freezing_index = working.air_freezing_index * working.n_factor;

    try {
        DimensionlessParameters params = computeDimensionlessParameters(
            working, props, options_.surface_temperature_mode, options_.round_intermediates);

        q.surface_temperature = params.surface_temperature;
        q.fusion_parameter = params.fusion_parameter;
        q.thermal_ratio = params.thermal_ratio;
        q.correction_coefficient = computeCorrectionCoefficient(
            params.fusion_parameter, params.thermal_ratio, options_.lambda_method);
        q.frost_depth = computeFrostDepth(q.correction_coefficient,
                                          working.thermal_conductivity,
                                          q.surface_freezing_index, q.latent_heat);
    } catch (const FrostDepthError& e) {
        if (e.kind() != ErrorKind::DEGENERATE_INPUT) {
            throw;
        }
        // No frost penetrates; mu, alpha and lambda stay undefined (zero)
        result.degenerate = true;
        result.annotation = e.what();
        q.frost_depth = 0.0;
        q.fusion_parameter = 0.0;
        q.thermal_ratio = 0.0;
        q.correction_coefficient = 0.0;
    }

    result.reported = toReportedUnits(q, input.unit_system);
    return result;
}

FrostDepthQuantities FrostDepthCalculator::toReportedUnits(const FrostDepthQuantities& working,
                                                           UnitConvention convention) const {
    if (convention == UnitConvention::IMPERIAL) {
        return working;
    }

    const QuantityUnits& from = unitsFor(UnitConvention::IMPERIAL);
    const QuantityUnits& to = unitsFor(convention);

    FrostDepthQuantities reported = working;
    reported.frost_depth = convertUnits(working.frost_depth, from.depth, to.depth);
    reported.surface_freezing_index = convertUnits(working.surface_freezing_index,
                                                   from.freezing_index, to.freezing_index);
    reported.surface_temperature = convertUnits(working.surface_temperature,
                                                from.temperature_difference,
                                                to.temperature_difference);
    reported.latent_heat = convertUnits(working.latent_heat, from.latent_heat, to.latent_heat);
    reported.heat_capacity = convertUnits(working.heat_capacity,
                                          from.heat_capacity, to.heat_capacity);
    return reported;
}

} // namespace MBFD
