#ifndef MBFD_FROST_DEPTH_MODEL_HPP
#define MBFD_FROST_DEPTH_MODEL_HPP

#include "SoilThermalProperties.hpp"
#include <string>
#include <stdexcept>

namespace MBFD {

/**
 * @brief Unit convention declared for the inputs and reported outputs
 *
 * IMPERIAL is the UFC worksheet convention and the engine's working system:
 *   k [BTU/(hr ft degF)], gamma_d [lbm/ft3], v0 [degF], F [degF day],
 *   t [day], L [BTU/ft3], C [BTU/(ft3 degF)], X [ft]
 * METRIC inputs are converted at the validator boundary:
 *   k [W/(m K)], gamma_d [kg/m3], v0 [degC], F [degC day],
 *   t [day], L [J/m3], C [J/(m3 K)], X [m]
 */
enum class UnitConvention {
    IMPERIAL,
    METRIC
};

/**
 * @brief Closed-form substitute for the mu-alpha chart
 */
enum class LambdaMethod {
    ALDRICH,        ///< 1 / sqrt(1 + mu (alpha + 0.5)), high latitudes
    LOW_LATITUDE,   ///< 0.707 / sqrt(1 + mu (alpha + 0.5)), lower latitudes
    MEAN            ///< Mean of the two forms
};

/**
 * @brief Definition of the surface temperature depression v_s
 */
enum class SurfaceTemperatureMode {
    SEASONAL,       ///< v_s = n F / t, seasonal depth of freeze
    MULTIYEAR       ///< v_s = |MAAT - 32 degF|, multi-year freeze development
};

enum class ErrorKind {
    INVALID_INPUT,
    DEGENERATE_INPUT,
    DOMAIN_ERROR
};

std::string toString(UnitConvention convention);
std::string toString(LambdaMethod method);
std::string toString(SurfaceTemperatureMode mode);
std::string toString(ErrorKind kind);

// Case-insensitive; throw std::invalid_argument on unknown names
UnitConvention parseUnitConvention(const std::string& name);
LambdaMethod parseLambdaMethod(const std::string& name);
SurfaceTemperatureMode parseSurfaceTemperatureMode(const std::string& name);

/**
 * @brief Error raised by the frost depth pipeline
 *
 * Carries the kind of failure and the input field or derived quantity that
 * caused it (e.g. "dry_density", "correction_coefficient_radicand").
 */
class FrostDepthError : public std::runtime_error {
public:
    FrostDepthError(ErrorKind kind, const std::string& quantity, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::string& quantity() const { return quantity_; }

private:
    ErrorKind kind_;
    std::string quantity_;
};

/**
 * @brief Unit symbols (UnitSystem database) for every quantity of a convention
 */
struct QuantityUnits {
    std::string thermal_conductivity;
    std::string dry_density;
    std::string temperature;             // absolute
    std::string temperature_difference;
    std::string freezing_index;
    std::string duration;
    std::string latent_heat;
    std::string heat_capacity;
    std::string depth;
};

const QuantityUnits& unitsFor(UnitConvention convention);

/**
 * @brief Raw inputs of one frost depth computation
 */
struct FrostDepthInput {
    double thermal_conductivity;          // k, average frozen/unfrozen
    double dry_density;                   // gamma_d
    double water_content;                 // w [fraction]
    double mean_annual_temperature;       // v0, ground temperature minus freezing point (signed)
    double air_freezing_index;            // AFI [degree day]
    double n_factor;                      // [-]
    double freezing_season_duration;      // t [day]
    double mean_annual_air_temperature;   // MAAT, absolute; MULTIYEAR mode only
    UnitConvention unit_system;

    FrostDepthInput() :
        thermal_conductivity(0.78),       // BTU/(hr ft degF), silty sand
        dry_density(100.0),               // lbm/ft3
        water_content(0.15),
        mean_annual_temperature(5.0),     // degF above freezing
        air_freezing_index(2500.0),       // degF day
        n_factor(0.75),                   // gravel surface
        freezing_season_duration(160.0),  // day
        mean_annual_air_temperature(27.0),// degF
        unit_system(UnitConvention::IMPERIAL) {}
};

/**
 * @brief Signed ground temperature differential v0 from an absolute mean
 *        annual ground temperature expressed in the convention's unit
 */
double groundTemperatureDifferential(double mean_annual_ground_temperature,
                                     UnitConvention convention);

/**
 * @brief Express an input record in the working (imperial) convention
 * @throws std::runtime_error from the unit system on conversion failure
 */
FrostDepthInput toWorkingUnits(const FrostDepthInput& input);

/**
 * @brief Check physical plausibility of the raw inputs
 *
 * Conductivity, dry density and n-factor must be positive; water content,
 * air freezing index and duration must be non-negative; all values finite.
 * A zero duration is left to the degenerate handling downstream.
 *
 * @throws FrostDepthError with ErrorKind::INVALID_INPUT naming the field
 */
void validateInput(const FrostDepthInput& input);

/**
 * @brief Surface freezing index, surface temperature and the two chart
 *        coordinates of the modified Berggren solution (working units)
 */
struct DimensionlessParameters {
    double surface_freezing_index;   // F = n AFI [degF day]
    double surface_temperature;      // v_s [degF]
    double fusion_parameter;         // mu = C v_s / L
    double thermal_ratio;            // alpha = v0 / v_s

    DimensionlessParameters() :
        surface_freezing_index(0.0), surface_temperature(0.0),
        fusion_parameter(0.0), thermal_ratio(0.0) {}
};

/**
 * @brief Seasonal v_s = F / t
 * @throws FrostDepthError (DEGENERATE_INPUT) when t or F is zero
 */
double seasonalSurfaceTemperature(double surface_freezing_index, double duration);

/**
 * @brief Multi-year v_s = |MAAT - 32| with MAAT in degF
 * @throws FrostDepthError (DEGENERATE_INPUT) when MAAT is at the freezing point
 */
double multiyearSurfaceTemperature(double mean_annual_air_temperature);

/**
 * @brief Compute F, v_s, mu and alpha
 * @throws FrostDepthError (DEGENERATE_INPUT) when v_s collapses to zero
 */
DimensionlessParameters computeDimensionlessParameters(
    const FrostDepthInput& working_input,
    const SoilThermalProperties& props,
    SurfaceTemperatureMode mode = SurfaceTemperatureMode::SEASONAL,
    bool round_to_worksheet = true);

/**
 * @brief Correction coefficient lambda, rounded to 2 decimals
 * @throws FrostDepthError (DOMAIN_ERROR) when 1 + mu (alpha + 0.5) <= 0
 */
double computeCorrectionCoefficient(double fusion_parameter, double thermal_ratio,
                                    LambdaMethod method = LambdaMethod::ALDRICH);

/**
 * @brief Modified Berggren depth X = lambda sqrt(48 k F / L) [ft]
 *
 * 48 converts the degree-day freezing index against a per-hour
 * conductivity (2 x 24 hr/day).
 */
double computeFrostDepth(double correction_coefficient, double thermal_conductivity,
                         double surface_freezing_index, double latent_heat);

/**
 * @brief Values reported for one computation, all in one unit convention
 */
struct FrostDepthQuantities {
    double frost_depth;              // X
    double surface_freezing_index;   // F
    double surface_temperature;      // v_s
    double latent_heat;              // L
    double heat_capacity;            // C
    double fusion_parameter;         // mu
    double thermal_ratio;            // alpha
    double correction_coefficient;   // lambda

    FrostDepthQuantities() :
        frost_depth(0.0), surface_freezing_index(0.0), surface_temperature(0.0),
        latent_heat(0.0), heat_capacity(0.0), fusion_parameter(0.0),
        thermal_ratio(0.0), correction_coefficient(0.0) {}
};

struct FrostDepthResult {
    FrostDepthQuantities reported;   // declared unit convention
    FrostDepthQuantities working;    // imperial working units
    bool degenerate;
    std::string annotation;          // reason when degenerate
    UnitConvention unit_system;
    LambdaMethod lambda_method;

    FrostDepthResult() :
        degenerate(false), unit_system(UnitConvention::IMPERIAL),
        lambda_method(LambdaMethod::ALDRICH) {}
};

/**
 * @brief Modified Berggren frost depth calculator
 *
 * Runs validation, unit conversion, thermal property derivation,
 * dimensionless parameters, lambda and the depth equation in one pass.
 * The calculator only holds its options; compute() is const and
 * reentrant, so one instance can serve any number of concurrent callers.
 */
class FrostDepthCalculator {
public:
    struct Options {
        LambdaMethod lambda_method;
        SurfaceTemperatureMode surface_temperature_mode;
        bool round_intermediates;   // worksheet rounding of L, C (2 dp) and mu, alpha (3 dp)

        Options() :
            lambda_method(LambdaMethod::ALDRICH),
            surface_temperature_mode(SurfaceTemperatureMode::SEASONAL),
            round_intermediates(true) {}
    };

    FrostDepthCalculator();
    explicit FrostDepthCalculator(const Options& options);

    /**
     * @brief Compute the seasonal frost depth
     * @throws FrostDepthError for INVALID_INPUT and DOMAIN_ERROR; degenerate
     *         inputs return a zero depth flagged as degenerate
     */
    FrostDepthResult compute(const FrostDepthInput& input) const;

    const Options& getOptions() const { return options_; }

private:
    Options options_;

    FrostDepthQuantities toReportedUnits(const FrostDepthQuantities& working,
                                         UnitConvention convention) const;
};

} // namespace MBFD

#endif // MBFD_FROST_DEPTH_MODEL_HPP
