#include "SummaryOutput.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>

namespace MBFD {

namespace {

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

SummaryOutput::SummaryOutput(MPI_Comm comm) : comm_(comm), rank_(0) {
    MPI_Comm_rank(comm_, &rank_);
}

// =============================================================================
// Stream Output
// =============================================================================

void SummaryOutput::writeCSVHeader(std::ostream& os) {
    os << "scenario,status,unit_system,lambda_method,"
       << "thermal_conductivity,dry_density,water_content,mean_annual_temperature,"
       << "air_freezing_index,n_factor,freezing_season_duration,"
       << "latent_heat,heat_capacity,surface_freezing_index,surface_temperature,"
       << "mu,alpha,lambda,frost_depth,error_quantity,message\n";
}

void SummaryOutput::writeCSVRow(std::ostream& os, const ScenarioOutcome& outcome) {
    const FrostDepthInput& in = outcome.input;
    const FrostDepthQuantities& q = outcome.result.reported;

    std::ostringstream row;
    row << std::setprecision(10);
    row << csvEscape(outcome.name) << ","
        << toString(outcome.status) << ","
        << toString(in.unit_system) << ","
        << toString(outcome.result.lambda_method) << ","
        << in.thermal_conductivity << ","
        << in.dry_density << ","
        << in.water_content << ","
        << in.mean_annual_temperature << ","
        << in.air_freezing_index << ","
        << in.n_factor << ","
        << in.freezing_season_duration << ",";

    if (outcome.succeeded()) {
        row << q.latent_heat << ","
            << q.heat_capacity << ","
            << q.surface_freezing_index << ","
            << q.surface_temperature << ","
            << q.fusion_parameter << ","
            << q.thermal_ratio << ","
            << q.correction_coefficient << ","
            << q.frost_depth << ",";
    } else {
        row << ",,,,,,,,";
    }

    row << csvEscape(outcome.error_quantity) << ","
        << csvEscape(outcome.message) << "\n";
    os << row.str();
}

void SummaryOutput::writeWorksheet(std::ostream& os, const ScenarioOutcome& outcome) {
    const QuantityUnits& u = unitsFor(outcome.input.unit_system);
    const FrostDepthQuantities& q = outcome.result.reported;

    os << "  Scenario " << outcome.name << " [" << toString(outcome.status) << "]\n";
    if (!outcome.succeeded()) {
        os << "    " << outcome.message << "\n";
        return;
    }

    os << std::fixed;
    os << "    L      = " << std::setprecision(2) << q.latent_heat << " " << u.latent_heat << "\n";
    os << "    C      = " << std::setprecision(2) << q.heat_capacity << " " << u.heat_capacity << "\n";
    os << "    F      = " << std::setprecision(1) << q.surface_freezing_index << " "
       << u.freezing_index << "\n";
    os << "    v_s    = " << std::setprecision(3) << q.surface_temperature << " "
       << u.temperature_difference << "\n";
    os << "    mu     = " << std::setprecision(3) << q.fusion_parameter << "\n";
    os << "    alpha  = " << std::setprecision(3) << q.thermal_ratio << "\n";
    os << "    lambda = " << std::setprecision(2) << q.correction_coefficient << "\n";
    os << "    X      = " << std::setprecision(3) << q.frost_depth << " " << u.depth << "\n";
    if (outcome.result.degenerate) {
        os << "    note: " << outcome.message << "\n";
    }
    os.unsetf(std::ios_base::floatfield);
}

// =============================================================================
// Rank-0 Output
// =============================================================================

PetscErrorCode SummaryOutput::printTable(const std::vector<ScenarioOutcome>& outcomes,
                                         bool print_intermediates) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    std::ostringstream table;
    table << "\n" << std::left << std::setw(28) << "Scenario"
          << std::setw(16) << "Status"
          << std::right << std::setw(8) << "lambda"
          << std::setw(14) << "Frost depth" << "\n";
    table << std::string(66, '-') << "\n";

    for (const auto& outcome : outcomes) {
        table << std::left << std::setw(28) << outcome.name
              << std::setw(16) << toString(outcome.status) << std::right;
        if (outcome.succeeded()) {
            table << std::fixed << std::setprecision(2)
                  << std::setw(8) << outcome.result.reported.correction_coefficient
                  << std::setprecision(3)
                  << std::setw(11) << outcome.result.reported.frost_depth << " "
                  << unitsFor(outcome.input.unit_system).depth;
            table.unsetf(std::ios_base::floatfield);
        } else {
            table << "  " << outcome.error_quantity;
        }
        table << "\n";
    }

    if (print_intermediates) {
        table << "\nWorksheet:\n";
        for (const auto& outcome : outcomes) {
            writeWorksheet(table, outcome);
        }
    }

    ierr = PetscPrintf(comm_, "%s\n", table.str().c_str()); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode SummaryOutput::writeCSV(const std::string& filename,
                                       const std::vector<ScenarioOutcome>& outcomes) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    // Only rank 0 touches the file; every rank learns whether it opened
    int opened = 1;
    std::ofstream csv;
    if (rank_ == 0) {
        csv.open(filename);
        opened = csv.is_open() ? 1 : 0;
    }
    ierr = MPI_Bcast(&opened, 1, MPI_INT, 0, comm_); CHKERRMPI(ierr);
    if (!opened) {
        SETERRQ(comm_, PETSC_ERR_FILE_OPEN, "Cannot open summary file %s", filename.c_str());
    }

    if (rank_ == 0) {
        writeCSVHeader(csv);
        for (const auto& outcome : outcomes) {
            writeCSVRow(csv, outcome);
        }
    }

    PetscFunctionReturn(0);
}

} // namespace MBFD
