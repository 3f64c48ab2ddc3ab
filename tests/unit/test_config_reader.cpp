/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "MBFD.hpp"
#include <fstream>
#include <cstdio>

using namespace MBFD;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "[OPTIONS]\n";
            config << "unit_system = IMPERIAL\n";
            config << "lambda_method = MEAN\n";
            config << "surface_temperature_mode = SEASONAL\n";
            config << "round_intermediates = false\n";
            config << "output_file = sites.csv\n";
            config << "\n[SCENARIO_fairbanks]\n";
            config << "thermal_conductivity = 0.78\n";
            config << "dry_density = 100.0          # lbm/ft3\n";
            config << "water_content = 15 %\n";
            config << "mean_annual_temperature_difference = 5\n";
            config << "air_freezing_index = 2500\n";
            config << "n_factor = 0.75\n";
            config << "freezing_season_duration = 160\n";
            config << "\n[SCENARIO_metric_values]\n";
            config << "name = converted\n";
            config << "thermal_conductivity = 1.35 W/(m-K)\n";
            config << "dry_density = 1601.846337 kg/m3\n";
            config << "water_content = 0.15\n";
            config << "mean_annual_ground_temperature = 2.7777777778 degC\n";
            config << "air_freezing_index = 1388.8888889 degC-day\n";
            config << "n_factor = 0.75\n";
            config << "freezing_season_duration = 160 day\n";
            config << "\n[SWEEP]\n";
            config << "base = SCENARIO_fairbanks\n";
            config << "parameter = air_freezing_index\n";
            config << "start = 500\n";
            config << "stop = 4000\n";
            config << "count = 8\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_FALSE(reader.loadFile("nonexistent_file.config"));
}

TEST_F(ConfigReaderTest, ReadPlainValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getString("OPTIONS", "lambda_method"), "MEAN");
    EXPECT_DOUBLE_EQ(reader.getDouble("SCENARIO_fairbanks", "dry_density"), 100.0);
    EXPECT_EQ(reader.getInt("SWEEP", "count"), 8);
    EXPECT_FALSE(reader.getBool("OPTIONS", "round_intermediates", true));
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("SWEEP", "missing", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("NOPE", "x", 3.14), 3.14);
    EXPECT_EQ(reader.getString("OPTIONS", "missing", "fallback"), "fallback");
    // Unparseable numbers fall back with a warning
    EXPECT_DOUBLE_EQ(reader.getDouble("OPTIONS", "lambda_method", 1.5), 1.5);
}

TEST_F(ConfigReaderTest, SectionQueries) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("OPTIONS"));
    EXPECT_TRUE(reader.hasKey("SCENARIO_fairbanks", "n_factor"));
    EXPECT_FALSE(reader.hasKey("SCENARIO_fairbanks", "porosity"));
    EXPECT_EQ(reader.getSectionsMatching("SCENARIO").size(), 2u);
    EXPECT_EQ(reader.getSections().size(), 4u);
    EXPECT_EQ(reader.getKeys("SWEEP").size(), 5u);
}

TEST_F(ConfigReaderTest, UnitAwareValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    // Suffix converted, plain value taken as the target unit
    EXPECT_NEAR(reader.getDoubleInUnit("SCENARIO_metric_values", "thermal_conductivity",
                                       0.0, "BTU/(hr-ft-degF)"), 1.35 / 1.730734666371391, 1e-9);
    EXPECT_DOUBLE_EQ(reader.getDoubleInUnit("SCENARIO_fairbanks", "thermal_conductivity",
                                            0.0, "BTU/(hr-ft-degF)"), 0.78);
    EXPECT_NEAR(reader.getDoubleInUnit("SCENARIO_fairbanks", "water_content", 0.0, "fraction"),
                0.15, 1e-12);

    // Incompatible unit keeps the default
    EXPECT_DOUBLE_EQ(reader.getDoubleInUnit("SCENARIO_metric_values", "dry_density",
                                            -1.0, "W/(m-K)"), -1.0);
}

TEST_F(ConfigReaderTest, AbsoluteUnitOnDifferentialMeansDifference) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[S]\nv0 = 9 degF\n"));
    EXPECT_NEAR(reader.getDoubleInUnit("S", "v0", 0.0, "delta_degC"), 5.0, 1e-12);
}

TEST_F(ConfigReaderTest, ParseRunOptions) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    ConfigReader::RunOptions options;
    EXPECT_TRUE(reader.parseRunOptions(options));
    EXPECT_EQ(options.unit_system, UnitConvention::IMPERIAL);
    EXPECT_EQ(options.calculator.lambda_method, LambdaMethod::MEAN);
    EXPECT_EQ(options.calculator.surface_temperature_mode, SurfaceTemperatureMode::SEASONAL);
    EXPECT_FALSE(options.calculator.round_intermediates);
    EXPECT_EQ(options.output_file, "sites.csv");
}

TEST_F(ConfigReaderTest, ParseScenarios) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto scenarios = reader.parseScenarios(UnitConvention::IMPERIAL);
    ASSERT_EQ(scenarios.size(), 2u);

    const ConfigReader::ScenarioConfig& fairbanks = scenarios[0];
    EXPECT_EQ(fairbanks.name, "fairbanks");
    EXPECT_DOUBLE_EQ(fairbanks.input.thermal_conductivity, 0.78);
    EXPECT_NEAR(fairbanks.input.water_content, 0.15, 1e-12);
    EXPECT_DOUBLE_EQ(fairbanks.input.mean_annual_temperature, 5.0);
    EXPECT_DOUBLE_EQ(fairbanks.input.air_freezing_index, 2500.0);
    EXPECT_EQ(fairbanks.input.unit_system, UnitConvention::IMPERIAL);

    // Metric suffixes converted into the imperial declaration
    const ConfigReader::ScenarioConfig& converted = scenarios[1];
    EXPECT_EQ(converted.name, "converted");
    EXPECT_NEAR(converted.input.dry_density, 100.0, 1e-6);
    EXPECT_NEAR(converted.input.mean_annual_temperature, 5.0, 1e-8);
    EXPECT_NEAR(converted.input.air_freezing_index, 2500.0, 1e-6);
}

TEST_F(ConfigReaderTest, ParseScenarioInMetric) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[SCENARIO]\n"
        "thermal_conductivity = 1.35\n"
        "dry_density = 100 lbm/ft3\n"
        "water_content = 15 %\n"
        "mean_annual_ground_temperature = 3\n"
        "air_freezing_index = 2500 degF-day\n"
        "n_factor = 0.75\n"
        "freezing_season_duration = 160\n"));

    ConfigReader::ScenarioConfig scenario = reader.parseScenario("SCENARIO", UnitConvention::METRIC);
    EXPECT_EQ(scenario.name, "SCENARIO");
    EXPECT_EQ(scenario.input.unit_system, UnitConvention::METRIC);
    EXPECT_DOUBLE_EQ(scenario.input.thermal_conductivity, 1.35);
    EXPECT_NEAR(scenario.input.dry_density, 1601.8463373960138, 1e-9);
    EXPECT_DOUBLE_EQ(scenario.input.mean_annual_temperature, 3.0);
    EXPECT_NEAR(scenario.input.air_freezing_index, 1388.888888889, 1e-6);
}

TEST_F(ConfigReaderTest, ParseSweepConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    ConfigReader::SweepConfig sweep;
    EXPECT_TRUE(reader.parseSweepConfig(sweep));
    EXPECT_TRUE(sweep.enabled);
    EXPECT_EQ(sweep.base_scenario, "SCENARIO_fairbanks");
    EXPECT_EQ(sweep.parameter, "air_freezing_index");
    EXPECT_DOUBLE_EQ(sweep.start, 500.0);
    EXPECT_DOUBLE_EQ(sweep.stop, 4000.0);
    EXPECT_EQ(sweep.count, 8);
}

TEST_F(ConfigReaderTest, ApplyScenarioValue) {
    FrostDepthInput input;
    ConfigReader::applyScenarioValue(input, "n_factor", 0.9);
    EXPECT_DOUBLE_EQ(input.n_factor, 0.9);

    ConfigReader::applyScenarioValue(input, "mean_annual_ground_temperature", 30.0);
    EXPECT_DOUBLE_EQ(input.mean_annual_temperature, -2.0);

    EXPECT_THROW(ConfigReader::applyScenarioValue(input, "porosity", 0.3),
                 std::invalid_argument);
    EXPECT_EQ(ConfigReader::scenarioKeys().count("air_freezing_index"), 1u);
}

TEST_F(ConfigReaderTest, ValidateAcceptsGoodFile) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidateReportsProblems) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[OPTIONS]\n"
        "lambda_method = CHART\n"
        "surface_temperature_mode = MULTIYEAR\n"
        "[SCENARIO_bad]\n"
        "thermal_conductivity = 1.0 kg/m3\n"
        "dry_density = lots\n"
        "porosity = 0.3\n"
        "[SWEEP]\n"
        "base = SCENARIO_missing\n"
        "parameter = porosity\n"
        "count = 1\n"));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_FALSE(result.valid);
    // Lambda method, missing keys, ground temperature, MAAT, unit, number, sweep
    EXPECT_GE(result.errors.size(), 8u);
    EXPECT_FALSE(result.warnings.empty()) << "Unknown key should warn";
}

TEST_F(ConfigReaderTest, ValidateNeedsScenario) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[OPTIONS]\nunit_system = METRIC\n"));
    EXPECT_FALSE(reader.validate().valid);
}

TEST_F(ConfigReaderTest, MergeFileOverrides) {
    std::string override_file = "test_config_override.config";
    if (rank == 0) {
        std::ofstream config(override_file);
        config << "[SCENARIO_fairbanks]\n";
        config << "n_factor = 0.9\n";
        config.close();
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ConfigReader reader;
    reader.loadFile(test_config_file);
    EXPECT_TRUE(reader.mergeFile(override_file));
    EXPECT_DOUBLE_EQ(reader.getDouble("SCENARIO_fairbanks", "n_factor"), 0.9);
    EXPECT_DOUBLE_EQ(reader.getDouble("SCENARIO_fairbanks", "dry_density"), 100.0);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        std::remove(override_file.c_str());
    }
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    std::string template_file = "test_template.config";
    if (rank == 0) {
        ConfigReader::generateTemplate(template_file);
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));
    EXPECT_TRUE(reader.validate().valid);

    auto scenarios = reader.parseScenarios(UnitConvention::IMPERIAL);
    ASSERT_EQ(scenarios.size(), 1u);
    EXPECT_NEAR(scenarios[0].input.water_content, 0.15, 1e-12);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        std::remove(template_file.c_str());
    }
}
