/*
 * Example: UFC 3-130-06 worksheet, step by step
 *
 * Walks one site through the modified Berggren worksheet using the
 * individual pipeline stages, then repeats it with the full calculator
 * for the three lambda forms and for multi-year freezing.
 *
 * Site: silty sand under a gravel surface
 *   gamma_d = 100 lbm/ft3, w = 15 %, k = 0.78 BTU/(hr ft degF)
 *   AFI = 2500 degF day, n = 0.75, t = 160 day, v0 = 5 degF
 */

#include "MBFD.hpp"
#include <iostream>
#include <iomanip>

static char help[] = "Example: UFC 3-130-06 modified Berggren worksheet\n"
                     "  -afi <value>   Air freezing index [degF day] (default 2500)\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    MBFD::FrostDepthInput input;
    PetscReal afi = input.air_freezing_index;
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-afi", &afi, nullptr); CHKERRQ(ierr);
    input.air_freezing_index = afi;

    if (rank == 0) {
        std::cout << "================================================\n";
        std::cout << "  Modified Berggren Worksheet (UFC 3-130-06)\n";
        std::cout << "================================================\n\n";

        try {
            MBFD::validateInput(input);

            // Step 1: soil thermal properties
            MBFD::SoilThermalProperties props =
                MBFD::deriveSoilThermalProperties(input.dry_density, input.water_content);
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "1. L = 144 gamma_d w            = " << props.latent_heat << " BTU/ft3\n";
            std::cout << "   C = gamma_d (0.17 + 0.75 w)  = " << props.heat_capacity
                      << " BTU/(ft3 degF)\n";
            std::cout << "   (frozen " << props.frozen_heat_capacity
                      << ", unfrozen " << props.unfrozen_heat_capacity << ")\n";

            // Step 2: surface index and the chart coordinates
            MBFD::DimensionlessParameters params =
                MBFD::computeDimensionlessParameters(input, props);
            std::cout << "2. F = n AFI                    = " << params.surface_freezing_index
                      << " degF day\n";
            std::cout << std::setprecision(3);
            std::cout << "   v_s = F / t                  = " << params.surface_temperature
                      << " degF\n";
            std::cout << "   alpha = v0 / v_s             = " << params.thermal_ratio << "\n";
            std::cout << "   mu = C v_s / L               = " << params.fusion_parameter << "\n";

            // Step 3: correction coefficient and depth
            double lambda = MBFD::computeCorrectionCoefficient(params.fusion_parameter,
                                                               params.thermal_ratio);
            double depth = MBFD::computeFrostDepth(lambda, input.thermal_conductivity,
                                                   params.surface_freezing_index,
                                                   props.latent_heat);
            std::cout << std::setprecision(2);
            std::cout << "3. lambda                       = " << lambda << "\n";
            std::cout << "   X = lambda sqrt(48 k F / L)  = " << depth << " ft\n\n";

            // Same site through the calculator with each lambda form
            std::cout << "Lambda form        lambda    X [ft]\n";
            std::cout << "------------------------------------\n";
            const MBFD::LambdaMethod methods[] = {
                MBFD::LambdaMethod::ALDRICH,
                MBFD::LambdaMethod::LOW_LATITUDE,
                MBFD::LambdaMethod::MEAN
            };
            for (MBFD::LambdaMethod method : methods) {
                MBFD::FrostDepthCalculator::Options options;
                options.lambda_method = method;
                MBFD::FrostDepthResult result = MBFD::FrostDepthCalculator(options).compute(input);
                std::cout << std::left << std::setw(18) << MBFD::toString(method) << std::right
                          << std::setw(8) << result.reported.correction_coefficient
                          << std::setw(10) << result.reported.frost_depth << "\n";
            }

            // Multi-year freezing with MAAT below freezing
            MBFD::FrostDepthCalculator::Options multiyear;
            multiyear.surface_temperature_mode = MBFD::SurfaceTemperatureMode::MULTIYEAR;
            MBFD::FrostDepthResult result = MBFD::FrostDepthCalculator(multiyear).compute(input);
            std::cout << "\nMulti-year (MAAT = " << input.mean_annual_air_temperature
                      << " degF): v_s = " << result.reported.surface_temperature
                      << " degF, X = " << result.reported.frost_depth << " ft\n";

            // Same site in metric units
            MBFD::FrostDepthInput metric = input;
            metric.unit_system = MBFD::UnitConvention::METRIC;
            metric.thermal_conductivity = MBFD::convertUnits(input.thermal_conductivity,
                                                             "BTU/(hr-ft-degF)", "W/(m-K)");
            metric.dry_density = MBFD::convertUnits(input.dry_density, "lbm/ft3", "kg/m3");
            metric.mean_annual_temperature = MBFD::convertUnits(input.mean_annual_temperature,
                                                                "delta_degF", "delta_degC");
            metric.air_freezing_index = MBFD::convertUnits(input.air_freezing_index,
                                                           "degF-day", "degC-day");
            result = MBFD::FrostDepthCalculator().compute(metric);
            std::cout << "Metric input: X = " << result.reported.frost_depth << " m ("
                      << result.working.frost_depth << " ft)\n\n";

        } catch (const MBFD::FrostDepthError& e) {
            std::cerr << "Error (" << MBFD::toString(e.kind()) << "): " << e.what() << "\n";
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return 0;
}
