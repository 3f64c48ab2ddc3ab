#ifndef MBFD_BATCH_RUNNER_HPP
#define MBFD_BATCH_RUNNER_HPP

#include "ConfigReader.hpp"
#include "FrostDepthModel.hpp"
#include <petscsys.h>
#include <string>
#include <vector>

namespace MBFD {

/**
 * @brief Final state of one scenario in a batch
 */
enum class OutcomeStatus {
    OK,
    DEGENERATE,         ///< zero depth, annotation says why
    INVALID_INPUT,
    DOMAIN_ERROR,
    CONVERSION_ERROR    ///< unit database could not convert a value
};

std::string toString(OutcomeStatus status);

struct ScenarioOutcome {
    std::string name;
    OutcomeStatus status;
    FrostDepthInput input;
    FrostDepthResult result;          // meaningful for OK and DEGENERATE
    std::string error_quantity;       // field or derived quantity at fault
    std::string message;              // error text or degenerate annotation

    ScenarioOutcome() : status(OutcomeStatus::OK) {}

    bool succeeded() const {
        return status == OutcomeStatus::OK || status == OutcomeStatus::DEGENERATE;
    }
};

/**
 * @brief Evaluates a list of scenarios across the ranks of a communicator
 *
 * Scenario i is computed by rank i % size. Results are combined so that
 * every rank holds the full, ordered outcome list after run(); the values
 * do not depend on the number of ranks. A failing scenario never aborts
 * the batch, its error is recorded in the outcome instead.
 */
class BatchRunner {
public:
    BatchRunner(MPI_Comm comm, const FrostDepthCalculator::Options& options);
    ~BatchRunner() = default;

    PetscErrorCode run(const std::vector<ConfigReader::ScenarioConfig>& scenarios,
                       std::vector<ScenarioOutcome>& outcomes) const;

    /**
     * @brief Evaluate one scenario on the calling rank
     */
    ScenarioOutcome evaluate(const ConfigReader::ScenarioConfig& scenario) const;

    /**
     * @brief Linearly spaced copies of a base scenario with one key varied
     *
     * Names are "<base>_<parameter>_<index>". Values are read in the base
     * scenario's unit system.
     *
     * @throws std::invalid_argument for unknown keys or count < 2
     */
    static std::vector<ConfigReader::ScenarioConfig> expandSweep(
        const ConfigReader::SweepConfig& sweep,
        const ConfigReader::ScenarioConfig& base);

    const FrostDepthCalculator& getCalculator() const { return calculator_; }

    // Report per-rank scenario counts through PetscSynchronizedPrintf
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    MPI_Comm comm_;
    int rank_;
    int size_;
    bool verbose_;
    FrostDepthCalculator calculator_;
};

} // namespace MBFD

#endif // MBFD_BATCH_RUNNER_HPP
