#include "MBFD.hpp"
#include <petsc.h>
#include <sstream>
#include <string>
#include <vector>

static char help[] = "mbfd - Modified Berggren frost depth (UFC 3-130-06)\n"
                    "Usage: mbfd [options]\n\n"
                    "Options:\n"
                    "  -c <file>               Configuration file (.config)\n"
                    "  -o <file>               CSV summary file (overrides the config)\n"
                    "  -generate_config <file> Write a template configuration\n"
                    "  -verbose                Report how scenarios were spread over ranks\n\n"
                    "Direct values (without -c), optionally with a unit suffix:\n"
                    "  -k <value>              Thermal conductivity\n"
                    "  -dry_density <value>    Dry unit weight\n"
                    "  -water_content <value>  Water content (fraction, or '15 %')\n"
                    "  -v0 <value>             Mean annual ground temperature above freezing\n"
                    "  -magt <value>           Mean annual ground temperature (absolute)\n"
                    "  -afi <value>            Air freezing index\n"
                    "  -n_factor <value>       Air to surface n-factor\n"
                    "  -duration <value>       Length of the freezing season\n"
                    "  -maat <value>           Mean annual air temperature (MULTIYEAR)\n"
                    "  -units <name>           IMPERIAL (default) or METRIC\n"
                    "  -lambda_method <name>   ALDRICH, LOW_LATITUDE, MEAN\n"
                    "  -mode <name>            SEASONAL or MULTIYEAR\n"
                    "  -round_intermediates <bool>  Worksheet rounding (default true)\n\n"
                    "Examples:\n"
                    "  mpirun -np 4 mbfd -c config/fairbanks_pavement.config\n"
                    "  mbfd -k 0.78 -dry_density 100 -water_content 0.15 -v0 5 \\\n"
                    "       -afi 2500 -n_factor 0.75 -duration 160\n"
                    "  mbfd -generate_config my_site.config\n\n";

namespace {

struct DirectOption {
    const char* flag;
    const char* section;
    const char* key;
};

// Command-line flags and the configuration keys they stand for
const DirectOption DIRECT_OPTIONS[] = {
    {"-units",               "OPTIONS",               "unit_system"},
    {"-lambda_method",       "OPTIONS",               "lambda_method"},
    {"-mode",                "OPTIONS",               "surface_temperature_mode"},
    {"-round_intermediates", "OPTIONS",               "round_intermediates"},
    {"-k",                   "SCENARIO_command_line", "thermal_conductivity"},
    {"-dry_density",         "SCENARIO_command_line", "dry_density"},
    {"-water_content",       "SCENARIO_command_line", "water_content"},
    {"-v0",                  "SCENARIO_command_line", "mean_annual_temperature_difference"},
    {"-magt",                "SCENARIO_command_line", "mean_annual_ground_temperature"},
    {"-afi",                 "SCENARIO_command_line", "air_freezing_index"},
    {"-n_factor",            "SCENARIO_command_line", "n_factor"},
    {"-duration",            "SCENARIO_command_line", "freezing_season_duration"},
    {"-maat",                "SCENARIO_command_line", "mean_annual_air_temperature"}
};

// Assemble a configuration from the direct-value flags so that they go
// through the same unit-aware reader as a file
PetscErrorCode buildCommandLineConfig(std::string& contents) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    std::ostringstream options_section;
    std::ostringstream scenario_section;
    options_section << "[OPTIONS]\noutput_file =\n";
    scenario_section << "[SCENARIO_command_line]\n";

    for (const auto& opt : DIRECT_OPTIONS) {
        char value[256] = "";
        PetscBool set = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, opt.flag, value,
                                     sizeof(value), &set); CHKERRQ(ierr);
        if (!set) continue;

        std::ostringstream& target =
            (std::string(opt.section) == "OPTIONS") ? options_section : scenario_section;
        target << opt.key << " = " << value << "\n";
    }

    contents = options_section.str() + "\n" + scenario_section.str();
    PetscFunctionReturn(0);
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int status = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                MBFD::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
            }
            ierr = PetscFinalize();
            return 0;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool verbose = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-verbose", &verbose, nullptr); CHKERRQ(ierr);

        PetscPrintf(comm, "\n");
        PetscPrintf(comm, "============================================================\n");
        PetscPrintf(comm, "  MBFD - Modified Berggren Frost Depth\n");
        PetscPrintf(comm, "  Version %s, %s\n", MBFD::VERSION, MBFD::UFC_REFERENCE);
        PetscPrintf(comm, "============================================================\n");

        MBFD::ConfigReader reader;
        bool loaded = false;
        if (config_provided) {
            PetscPrintf(comm, "Config file: %s\n", config_file);
            loaded = reader.loadFile(config_file);
        } else {
            std::string contents;
            ierr = buildCommandLineConfig(contents); CHKERRQ(ierr);
            loaded = reader.loadString(contents);
        }

        if (!loaded) {
            PetscPrintf(comm, "Error: could not read the configuration\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            ierr = PetscFinalize();
            return 1;
        }

        MBFD::ConfigReader::ValidationResult validation = reader.validate();
        for (const auto& warning : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", warning.c_str());
        }
        if (!validation.valid) {
            for (const auto& error : validation.errors) {
                PetscPrintf(comm, "Error: %s\n", error.c_str());
            }
            ierr = PetscFinalize();
            return 1;
        }

        try {
            MBFD::ConfigReader::RunOptions options;
            reader.parseRunOptions(options);
            if (output_provided) {
                options.output_file = output_file;
            }

            std::vector<MBFD::ConfigReader::ScenarioConfig> scenarios =
                reader.parseScenarios(options.unit_system);

            MBFD::ConfigReader::SweepConfig sweep;
            if (reader.parseSweepConfig(sweep) && sweep.enabled) {
                MBFD::ConfigReader::ScenarioConfig base =
                    reader.parseScenario(sweep.base_scenario, options.unit_system);
                std::vector<MBFD::ConfigReader::ScenarioConfig> swept =
                    MBFD::BatchRunner::expandSweep(sweep, base);
                scenarios.insert(scenarios.end(), swept.begin(), swept.end());
            }

            PetscPrintf(comm, "Unit system:   %s\n", MBFD::toString(options.unit_system).c_str());
            PetscPrintf(comm, "Lambda method: %s\n",
                        MBFD::toString(options.calculator.lambda_method).c_str());
            PetscPrintf(comm, "Surface mode:  %s\n",
                        MBFD::toString(options.calculator.surface_temperature_mode).c_str());
            PetscPrintf(comm, "Scenarios:     %d\n", static_cast<int>(scenarios.size()));

            MBFD::BatchRunner runner(comm, options.calculator);
            runner.setVerbose(verbose == PETSC_TRUE);

            std::vector<MBFD::ScenarioOutcome> outcomes;
            ierr = runner.run(scenarios, outcomes); CHKERRQ(ierr);

            MBFD::SummaryOutput summary(comm);
            ierr = summary.printTable(outcomes, options.print_intermediates); CHKERRQ(ierr);

            if (!options.output_file.empty()) {
                ierr = summary.writeCSV(options.output_file, outcomes);
                if (ierr) {
                    status = 1;
                } else {
                    PetscPrintf(comm, "Summary written to: %s\n", options.output_file.c_str());
                }
            }

            for (const auto& outcome : outcomes) {
                if (!outcome.succeeded()) {
                    PetscPrintf(comm, "Error: %s\n", outcome.message.c_str());
                    if (status == 0) status = 2;
                }
            }

        } catch (const MBFD::FrostDepthError& e) {
            PetscPrintf(comm, "\nError (%s): %s\n", MBFD::toString(e.kind()).c_str(), e.what());
            status = 1;
        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            status = 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return status;
}
