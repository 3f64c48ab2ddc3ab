#ifndef MBFD_SUMMARY_OUTPUT_HPP
#define MBFD_SUMMARY_OUTPUT_HPP

/**
 * @file SummaryOutput.hpp
 * @brief Console and CSV summaries of a frost depth batch
 *
 * The CSV carries one row per scenario with the status, the inputs and
 * every intermediate of the worksheet (L, C, F, v_s, mu, alpha, lambda, X)
 * in the scenario's unit system. Failed rows keep their inputs and name the
 * error kind and quantity; their computed columns are left empty.
 */

#include "BatchRunner.hpp"
#include <petscsys.h>
#include <ostream>
#include <string>
#include <vector>

namespace MBFD {

class SummaryOutput {
public:
    explicit SummaryOutput(MPI_Comm comm);

    /**
     * @brief Print the batch as a table on rank 0
     * @param print_intermediates Also print the worksheet block of each scenario
     */
    PetscErrorCode printTable(const std::vector<ScenarioOutcome>& outcomes,
                              bool print_intermediates) const;

    /**
     * @brief Write the CSV summary from rank 0
     */
    PetscErrorCode writeCSV(const std::string& filename,
                            const std::vector<ScenarioOutcome>& outcomes) const;

    // Stream forms, usable without a communicator
    static void writeCSVHeader(std::ostream& os);
    static void writeCSVRow(std::ostream& os, const ScenarioOutcome& outcome);
    static void writeWorksheet(std::ostream& os, const ScenarioOutcome& outcome);

private:
    MPI_Comm comm_;
    int rank_;
};

} // namespace MBFD

#endif // MBFD_SUMMARY_OUTPUT_HPP
