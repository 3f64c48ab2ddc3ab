/**
 * @file test_frost_depth_model.cpp
 * @brief Unit tests for the stages of the modified Berggren pipeline
 */

#include <gtest/gtest.h>
#include "FrostDepthModel.hpp"
#include <petsc.h>
#include <cmath>
#include <limits>

using namespace MBFD;

class FrostDepthModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    // Expects validateInput to reject the input and name the field
    void expectInvalid(const FrostDepthInput& input, const std::string& field) {
        try {
            validateInput(input);
            FAIL() << "Expected InvalidInput for " << field;
        } catch (const FrostDepthError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
            EXPECT_EQ(e.quantity(), field);
        }
    }

    int rank;
};

// ============================================================================
// Enumerations and Errors
// ============================================================================

TEST_F(FrostDepthModelTest, ParseEnumerations) {
    EXPECT_EQ(parseUnitConvention("imperial"), UnitConvention::IMPERIAL);
    EXPECT_EQ(parseUnitConvention("SI"), UnitConvention::METRIC);
    EXPECT_EQ(parseLambdaMethod("low_latitude"), LambdaMethod::LOW_LATITUDE);
    EXPECT_EQ(parseSurfaceTemperatureMode("Multi_Year"), SurfaceTemperatureMode::MULTIYEAR);

    EXPECT_THROW(parseUnitConvention("cgs"), std::invalid_argument);
    EXPECT_THROW(parseLambdaMethod("chart"), std::invalid_argument);
    EXPECT_THROW(parseSurfaceTemperatureMode("daily"), std::invalid_argument);

    EXPECT_EQ(toString(LambdaMethod::MEAN), "MEAN");
    EXPECT_EQ(toString(ErrorKind::DOMAIN_ERROR), "DomainError");
}

TEST_F(FrostDepthModelTest, ErrorCarriesKindAndQuantity) {
    FrostDepthError error(ErrorKind::INVALID_INPUT, "dry_density", "must be positive");
    EXPECT_EQ(error.kind(), ErrorKind::INVALID_INPUT);
    EXPECT_EQ(error.quantity(), "dry_density");
    EXPECT_NE(std::string(error.what()).find("dry_density"), std::string::npos);
}

TEST_F(FrostDepthModelTest, RoundHalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(roundToDecimals(0.935, 2), 0.94);
    EXPECT_DOUBLE_EQ(roundToDecimals(-0.4266, 3), -0.427);
    EXPECT_DOUBLE_EQ(roundToDecimals(2.5, 0), 3.0);
    EXPECT_DOUBLE_EQ(roundToDecimals(-2.5, 0), -3.0);
}

// ============================================================================
// Input Validator
// ============================================================================

TEST_F(FrostDepthModelTest, DefaultInputIsValid) {
    EXPECT_NO_THROW(validateInput(FrostDepthInput()));
}

TEST_F(FrostDepthModelTest, RejectsNonPositiveFields) {
    FrostDepthInput input;
    input.thermal_conductivity = 0.0;
    expectInvalid(input, "thermal_conductivity");

    input = FrostDepthInput();
    input.dry_density = -100.0;
    expectInvalid(input, "dry_density");

    input = FrostDepthInput();
    input.n_factor = 0.0;
    expectInvalid(input, "n_factor");
}

TEST_F(FrostDepthModelTest, RejectsNegativeFields) {
    FrostDepthInput input;
    input.water_content = -0.01;
    expectInvalid(input, "water_content");

    input = FrostDepthInput();
    input.air_freezing_index = -1.0;
    expectInvalid(input, "air_freezing_index");

    input = FrostDepthInput();
    input.freezing_season_duration = -10.0;
    expectInvalid(input, "freezing_season_duration");
}

TEST_F(FrostDepthModelTest, RejectsNonFiniteFields) {
    FrostDepthInput input;
    input.mean_annual_temperature = std::numeric_limits<double>::quiet_NaN();
    expectInvalid(input, "mean_annual_temperature");

    input = FrostDepthInput();
    input.air_freezing_index = std::numeric_limits<double>::infinity();
    expectInvalid(input, "air_freezing_index");
}

TEST_F(FrostDepthModelTest, AcceptsZeroDurationAndNegativeV0) {
    FrostDepthInput input;
    input.freezing_season_duration = 0.0;
    input.mean_annual_temperature = -4.0;
    input.water_content = 0.0;
    EXPECT_NO_THROW(validateInput(input));
}

// ============================================================================
// Unit Boundary
// ============================================================================

TEST_F(FrostDepthModelTest, ImperialInputPassesThrough) {
    FrostDepthInput input;
    FrostDepthInput working = toWorkingUnits(input);
    EXPECT_DOUBLE_EQ(working.dry_density, input.dry_density);
    EXPECT_DOUBLE_EQ(working.air_freezing_index, input.air_freezing_index);
}

TEST_F(FrostDepthModelTest, MetricInputConverted) {
    FrostDepthInput input;
    input.unit_system = UnitConvention::METRIC;
    input.thermal_conductivity = 1.730734666371391;
    input.dry_density = 1601.8463373960138;
    input.mean_annual_temperature = -5.0;
    input.air_freezing_index = 1000.0;
    input.mean_annual_air_temperature = 0.0;

    FrostDepthInput working = toWorkingUnits(input);
    EXPECT_EQ(working.unit_system, UnitConvention::IMPERIAL);
    EXPECT_NEAR(working.thermal_conductivity, 1.0, 1e-10);
    EXPECT_NEAR(working.dry_density, 100.0, 1e-9);
    EXPECT_NEAR(working.mean_annual_temperature, -9.0, 1e-10);
    EXPECT_NEAR(working.air_freezing_index, 1800.0, 1e-8);
    EXPECT_NEAR(working.mean_annual_air_temperature, 32.0, 1e-10);
    EXPECT_DOUBLE_EQ(working.water_content, input.water_content);
    EXPECT_DOUBLE_EQ(working.freezing_season_duration, input.freezing_season_duration);
}

TEST_F(FrostDepthModelTest, GroundTemperatureDifferential) {
    EXPECT_DOUBLE_EQ(groundTemperatureDifferential(37.0, UnitConvention::IMPERIAL), 5.0);
    EXPECT_DOUBLE_EQ(groundTemperatureDifferential(-3.0, UnitConvention::METRIC), -3.0);
}

// ============================================================================
// Dimensionless Parameters
// ============================================================================

TEST_F(FrostDepthModelTest, SeasonalSurfaceTemperature) {
    EXPECT_DOUBLE_EQ(seasonalSurfaceTemperature(1875.0, 160.0), 11.71875);

    try {
        seasonalSurfaceTemperature(1875.0, 0.0);
        FAIL() << "Expected DegenerateInput";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DEGENERATE_INPUT);
        EXPECT_EQ(e.quantity(), "freezing_season_duration");
    }

    try {
        seasonalSurfaceTemperature(0.0, 160.0);
        FAIL() << "Expected DegenerateInput";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DEGENERATE_INPUT);
        EXPECT_EQ(e.quantity(), "surface_freezing_index");
    }
}

TEST_F(FrostDepthModelTest, MultiyearSurfaceTemperature) {
    EXPECT_DOUBLE_EQ(multiyearSurfaceTemperature(27.0), 5.0);
    EXPECT_DOUBLE_EQ(multiyearSurfaceTemperature(40.0), 8.0);
    EXPECT_THROW(multiyearSurfaceTemperature(32.0), FrostDepthError);
}

TEST_F(FrostDepthModelTest, ParametersRoundedLikeWorksheet) {
    FrostDepthInput input;
    SoilThermalProperties props = deriveSoilThermalProperties(100.0, 0.15);

    DimensionlessParameters rounded = computeDimensionlessParameters(input, props);
    EXPECT_DOUBLE_EQ(rounded.surface_freezing_index, 1875.0);
    EXPECT_DOUBLE_EQ(rounded.surface_temperature, 11.71875);
    EXPECT_DOUBLE_EQ(rounded.fusion_parameter, 0.153);
    EXPECT_DOUBLE_EQ(rounded.thermal_ratio, 0.427);

    DimensionlessParameters exact = computeDimensionlessParameters(
        input, props, SurfaceTemperatureMode::SEASONAL, false);
    EXPECT_NEAR(exact.fusion_parameter, 28.25 * 11.71875 / 2160.0, 1e-12);
    EXPECT_NEAR(exact.thermal_ratio, 5.0 / 11.71875, 1e-12);
}

TEST_F(FrostDepthModelTest, ZeroLatentHeatIsDegenerate) {
    FrostDepthInput input;
    input.water_content = 0.0;
    SoilThermalProperties props = deriveSoilThermalProperties(100.0, 0.0);

    try {
        computeDimensionlessParameters(input, props);
        FAIL() << "Expected DegenerateInput";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DEGENERATE_INPUT);
        EXPECT_EQ(e.quantity(), "latent_heat");
    }
}

// ============================================================================
// Correction Coefficient
// ============================================================================

TEST_F(FrostDepthModelTest, CorrectionCoefficientForms) {
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(0.153, 0.427), 0.94);
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(0.153, 0.427, LambdaMethod::LOW_LATITUDE), 0.66);
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(0.153, 0.427, LambdaMethod::MEAN), 0.80);

    // No fusion parameter, no correction
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(0.0, 0.427), 1.0);
}

TEST_F(FrostDepthModelTest, CorrectionCoefficientHasTwoDecimals) {
    const double mus[] = {0.01, 0.2, 0.75, 1.9};
    const double alphas[] = {-0.3, 0.0, 0.6, 2.4};
    for (double mu : mus) {
        for (double alpha : alphas) {
            double lambda = computeCorrectionCoefficient(mu, alpha);
            EXPECT_NEAR(lambda * 100.0, std::round(lambda * 100.0), 1e-9);
            EXPECT_GT(lambda, 0.0);
        }
    }
}

TEST_F(FrostDepthModelTest, CorrectionCoefficientAboveOneForNegativeAlpha) {
    // 1 + 0.5 (-1 + 0.5) = 0.75, lambda = 1.1547 -> 1.15
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(0.5, -1.0), 1.15);
}

TEST_F(FrostDepthModelTest, RadicandAtZeroIsDomainError) {
    // 1 + 2 (-1 + 0.5) = 0
    try {
        computeCorrectionCoefficient(2.0, -1.0);
        FAIL() << "Expected DomainError";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DOMAIN_ERROR);
        EXPECT_EQ(e.quantity(), "correction_coefficient_radicand");
    }

    EXPECT_THROW(computeCorrectionCoefficient(2.0, -1.5), FrostDepthError);
    EXPECT_THROW(computeCorrectionCoefficient(std::numeric_limits<double>::quiet_NaN(), 0.4),
                 FrostDepthError);
}

TEST_F(FrostDepthModelTest, CorrectionCoefficientRoundingToZeroIsDomainError) {
    // 1 + 3320.313 (170.667 + 0.5) = 568334, lambda = 0.0013 -> 0.00
    try {
        computeCorrectionCoefficient(3320.313, 170.667);
        FAIL() << "Expected DomainError";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DOMAIN_ERROR);
        EXPECT_EQ(e.quantity(), "correction_coefficient");
    }

    // The low-latitude form reaches zero first
    EXPECT_DOUBLE_EQ(computeCorrectionCoefficient(100.0, 1.0), 0.08);
    EXPECT_THROW(computeCorrectionCoefficient(5000.0, 10.0, LambdaMethod::LOW_LATITUDE),
                 FrostDepthError);
}

// ============================================================================
// Depth Equation
// ============================================================================

TEST_F(FrostDepthModelTest, FrostDepthEquation) {
    double expected = 0.94 * std::sqrt(48.0 * 0.78 * 1875.0 / 2160.0);
    EXPECT_NEAR(computeFrostDepth(0.94, 0.78, 1875.0, 2160.0), expected, 1e-12);
    EXPECT_NEAR(computeFrostDepth(0.94, 0.78, 1875.0, 2160.0), 5.358824497965948, 1e-9);
    EXPECT_DOUBLE_EQ(computeFrostDepth(1.0, 0.78, 0.0, 2160.0), 0.0);
    EXPECT_THROW(computeFrostDepth(0.94, 0.78, 1875.0, 0.0), FrostDepthError);
}

// ============================================================================
// Calculator
// ============================================================================

TEST_F(FrostDepthModelTest, CalculatorReportsWorkingAndReported) {
    FrostDepthCalculator calculator;
    FrostDepthResult result = calculator.compute(FrostDepthInput());

    EXPECT_FALSE(result.degenerate);
    EXPECT_EQ(result.unit_system, UnitConvention::IMPERIAL);
    EXPECT_EQ(result.lambda_method, LambdaMethod::ALDRICH);
    EXPECT_DOUBLE_EQ(result.reported.frost_depth, result.working.frost_depth);
    EXPECT_DOUBLE_EQ(result.reported.latent_heat, 2160.0);
    EXPECT_DOUBLE_EQ(result.reported.heat_capacity, 28.25);
}

TEST_F(FrostDepthModelTest, CalculatorIsIdempotent) {
    FrostDepthCalculator calculator;
    FrostDepthInput input;
    input.air_freezing_index = 3170.0;

    FrostDepthResult first = calculator.compute(input);
    FrostDepthResult second = calculator.compute(input);
    EXPECT_EQ(first.reported.frost_depth, second.reported.frost_depth);
    EXPECT_EQ(first.reported.correction_coefficient, second.reported.correction_coefficient);
}

TEST_F(FrostDepthModelTest, CalculatorDegenerateCases) {
    FrostDepthCalculator calculator;

    FrostDepthInput no_freeze;
    no_freeze.air_freezing_index = 0.0;
    FrostDepthResult result = calculator.compute(no_freeze);
    EXPECT_TRUE(result.degenerate);
    EXPECT_DOUBLE_EQ(result.reported.frost_depth, 0.0);
    EXPECT_NE(result.annotation.find("surface_freezing_index"), std::string::npos);

    FrostDepthInput no_season;
    no_season.freezing_season_duration = 0.0;
    result = calculator.compute(no_season);
    EXPECT_TRUE(result.degenerate);
    EXPECT_DOUBLE_EQ(result.reported.frost_depth, 0.0);

    FrostDepthInput dry;
    dry.water_content = 0.0;
    result = calculator.compute(dry);
    EXPECT_TRUE(result.degenerate);
    EXPECT_DOUBLE_EQ(result.reported.latent_heat, 0.0);
    EXPECT_NE(result.annotation.find("latent_heat"), std::string::npos);
}

TEST_F(FrostDepthModelTest, CalculatorRejectsVanishingCorrectionCoefficient) {
    FrostDepthCalculator calculator;

    // L = 0.06, mu = 3320.313, alpha = 170.667
    FrostDepthInput input;
    input.water_content = 4e-6;
    input.mean_annual_temperature = 2000.0;

    try {
        calculator.compute(input);
        FAIL() << "Expected DomainError";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DOMAIN_ERROR);
        EXPECT_EQ(e.quantity(), "correction_coefficient");
    }
}

TEST_F(FrostDepthModelTest, LatentHeatRoundedAwayIsAnnotated) {
    FrostDepthCalculator calculator;

    // L = 144 * 100 * 3e-7 = 0.00432 -> 0.00
    FrostDepthInput trace;
    trace.water_content = 3e-7;
    FrostDepthResult result = calculator.compute(trace);
    EXPECT_TRUE(result.degenerate);
    EXPECT_DOUBLE_EQ(result.reported.frost_depth, 0.0);
    EXPECT_NE(result.annotation.find("rounds to zero"), std::string::npos);
    EXPECT_EQ(result.annotation.find("no pore water"), std::string::npos);

    FrostDepthInput dry;
    dry.water_content = 0.0;
    result = calculator.compute(dry);
    EXPECT_NE(result.annotation.find("no pore water"), std::string::npos);
}

TEST_F(FrostDepthModelTest, CalculatorPropagatesErrors) {
    FrostDepthCalculator calculator;

    FrostDepthInput invalid;
    invalid.thermal_conductivity = -0.5;
    EXPECT_THROW(calculator.compute(invalid), FrostDepthError);

    // v_s = 11.72, alpha = -50 / 11.72 drives the radicand negative
    FrostDepthInput warm_ground;
    warm_ground.water_content = 0.02;
    warm_ground.mean_annual_temperature = -50.0;
    try {
        calculator.compute(warm_ground);
        FAIL() << "Expected DomainError";
    } catch (const FrostDepthError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DOMAIN_ERROR);
    }
}
