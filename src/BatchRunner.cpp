/**
 * @file BatchRunner.cpp
 * @brief Round-robin evaluation of frost depth scenarios over MPI ranks
 */

#include "BatchRunner.hpp"
#include <sstream>
#include <stdexcept>

namespace MBFD {

namespace {

// status + reported quantities + working quantities
constexpr int RECORD_SIZE = 17;

void packQuantities(const FrostDepthQuantities& q, double* out) {
    out[0] = q.frost_depth;
    out[1] = q.surface_freezing_index;
    out[2] = q.surface_temperature;
    out[3] = q.latent_heat;
    out[4] = q.heat_capacity;
    out[5] = q.fusion_parameter;
    out[6] = q.thermal_ratio;
    out[7] = q.correction_coefficient;
}

void unpackQuantities(const double* in, FrostDepthQuantities& q) {
    q.frost_depth = in[0];
    q.surface_freezing_index = in[1];
    q.surface_temperature = in[2];
    q.latent_heat = in[3];
    q.heat_capacity = in[4];
    q.fusion_parameter = in[5];
    q.thermal_ratio = in[6];
    q.correction_coefficient = in[7];
}

OutcomeStatus statusFromError(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT:    return OutcomeStatus::INVALID_INPUT;
        case ErrorKind::DEGENERATE_INPUT: return OutcomeStatus::DEGENERATE;
        case ErrorKind::DOMAIN_ERROR:     return OutcomeStatus::DOMAIN_ERROR;
    }
    return OutcomeStatus::INVALID_INPUT;
}

// Reads one NUL-terminated string starting at pos and advances pos past it
std::string readString(const std::vector<char>& buffer, size_t& pos) {
    std::string value;
    while (pos < buffer.size() && buffer[pos] != '\0') {
        value += buffer[pos++];
    }
    ++pos;
    return value;
}

} // namespace

std::string toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::OK:               return "OK";
        case OutcomeStatus::DEGENERATE:       return "Degenerate";
        case OutcomeStatus::INVALID_INPUT:    return "InvalidInput";
        case OutcomeStatus::DOMAIN_ERROR:     return "DomainError";
        case OutcomeStatus::CONVERSION_ERROR: return "ConversionError";
    }
    return "Unknown";
}

BatchRunner::BatchRunner(MPI_Comm comm, const FrostDepthCalculator::Options& options)
    : comm_(comm), rank_(0), size_(1), verbose_(false), calculator_(options) {
    MPI_Comm_rank(comm_, &rank_);
    MPI_Comm_size(comm_, &size_);
}

// =============================================================================
// Single Scenario
// =============================================================================

ScenarioOutcome BatchRunner::evaluate(const ConfigReader::ScenarioConfig& scenario) const {
    ScenarioOutcome outcome;
    outcome.name = scenario.name;
    outcome.input = scenario.input;

    try {
        outcome.result = calculator_.compute(scenario.input);
        if (outcome.result.degenerate) {
            outcome.status = OutcomeStatus::DEGENERATE;
            outcome.message = outcome.result.annotation;
        }
    } catch (const FrostDepthError& e) {
        outcome.status = statusFromError(e.kind());
        outcome.error_quantity = e.quantity();
        outcome.message = e.what();
    } catch (const std::runtime_error& e) {
        // Unit database failures surface as plain runtime errors
        outcome.status = OutcomeStatus::CONVERSION_ERROR;
        outcome.error_quantity = "unit_conversion";
        outcome.message = e.what();
    }

    return outcome;
}

// =============================================================================
// Batch Evaluation
// =============================================================================

PetscErrorCode BatchRunner::run(const std::vector<ConfigReader::ScenarioConfig>& scenarios,
                                std::vector<ScenarioOutcome>& outcomes) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    const int n = static_cast<int>(scenarios.size());
    outcomes.assign(n, ScenarioOutcome());

    std::vector<double> records(static_cast<size_t>(n) * RECORD_SIZE, 0.0);
    std::vector<char> local_text;
    int local_count = 0;

    for (int i = rank_; i < n; i += size_) {
        ++local_count;
        ScenarioOutcome outcome = evaluate(scenarios[i]);

        double* rec = &records[static_cast<size_t>(i) * RECORD_SIZE];
        rec[0] = static_cast<double>(static_cast<int>(outcome.status));
        packQuantities(outcome.result.reported, rec + 1);
        packQuantities(outcome.result.working, rec + 9);

        local_text.insert(local_text.end(), outcome.error_quantity.begin(),
                          outcome.error_quantity.end());
        local_text.push_back('\0');
        local_text.insert(local_text.end(), outcome.message.begin(), outcome.message.end());
        local_text.push_back('\0');
    }

    if (verbose_) {
        ierr = PetscSynchronizedPrintf(comm_, "[%d] evaluated %d of %d scenarios\n",
                                       rank_, local_count, n); CHKERRQ(ierr);
        ierr = PetscSynchronizedFlush(comm_, PETSC_STDOUT); CHKERRQ(ierr);
    }

    // Every slot is written by exactly one rank, the sum reproduces it exactly
    if (n > 0) {
        ierr = MPI_Allreduce(MPI_IN_PLACE, records.data(), n * RECORD_SIZE,
                             MPI_DOUBLE, MPI_SUM, comm_); CHKERRMPI(ierr);
    }

    // Gather the text fields; each rank's block lists its scenarios in order
    int local_len = static_cast<int>(local_text.size());
    std::vector<int> lengths(size_, 0);
    ierr = MPI_Allgather(&local_len, 1, MPI_INT, lengths.data(), 1, MPI_INT, comm_);
    CHKERRMPI(ierr);

    std::vector<int> displs(size_, 0);
    int total = 0;
    for (int r = 0; r < size_; ++r) {
        displs[r] = total;
        total += lengths[r];
    }

    std::vector<char> all_text(static_cast<size_t>(total) + 1, '\0');
    local_text.push_back('\0');  // keep the send buffer non-empty
    ierr = MPI_Allgatherv(local_text.data(), local_len, MPI_CHAR,
                          all_text.data(), lengths.data(), displs.data(),
                          MPI_CHAR, comm_); CHKERRMPI(ierr);

    for (int r = 0; r < size_; ++r) {
        size_t pos = static_cast<size_t>(displs[r]);
        for (int i = r; i < n; i += size_) {
            ScenarioOutcome& outcome = outcomes[i];
            outcome.name = scenarios[i].name;
            outcome.input = scenarios[i].input;

            const double* rec = &records[static_cast<size_t>(i) * RECORD_SIZE];
            outcome.status = static_cast<OutcomeStatus>(static_cast<int>(rec[0]));
            outcome.error_quantity = readString(all_text, pos);
            outcome.message = readString(all_text, pos);

            FrostDepthResult& result = outcome.result;
            result.unit_system = scenarios[i].input.unit_system;
            result.lambda_method = calculator_.getOptions().lambda_method;
            result.degenerate = (outcome.status == OutcomeStatus::DEGENERATE);
            result.annotation = result.degenerate ? outcome.message : std::string();
            if (outcome.succeeded()) {
                unpackQuantities(rec + 1, result.reported);
                unpackQuantities(rec + 9, result.working);
            }
        }
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Parameter Sweep
// =============================================================================

std::vector<ConfigReader::ScenarioConfig> BatchRunner::expandSweep(
    const ConfigReader::SweepConfig& sweep,
    const ConfigReader::ScenarioConfig& base) {
    std::vector<double> values = sweep.values;
    if (values.empty()) {
        if (sweep.count < 2) {
            throw std::invalid_argument("Sweep count must be at least 2");
        }
        const double step = (sweep.stop - sweep.start) / (sweep.count - 1);
        for (int i = 0; i < sweep.count; ++i) {
            // Hit the end point exactly
            values.push_back(i == sweep.count - 1 ? sweep.stop : sweep.start + i * step);
        }
    }

    std::vector<ConfigReader::ScenarioConfig> scenarios;
    scenarios.reserve(values.size());

    for (size_t i = 0; i < values.size(); ++i) {
        ConfigReader::ScenarioConfig scenario = base;
        ConfigReader::applyScenarioValue(scenario.input, sweep.parameter, values[i]);

        std::ostringstream name;
        name << base.name << "_" << sweep.parameter << "_" << i;
        scenario.name = name.str();
        scenarios.push_back(scenario);
    }

    return scenarios;
}

} // namespace MBFD
