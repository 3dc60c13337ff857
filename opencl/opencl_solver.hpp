#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include "opencl_evaluator.hpp"
#include <string>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Candidate-pool solver that offloads scoring to OpenCL.
 *
 * Enumerates valid timetables with the AssignmentEngine on the CPU,
 * collects them in batches, and scores every batch on the device at once.
 */
class OpenCLPoolSolver : public ISolver {
public:
    /**
     * @brief Construct an OpenCL-based pool solver.
     *
     * @param poolSize  Maximum number of timetables to score (0 = all).
     * @param batchSize Number of timetables to accumulate before sending
     *                  them to the device.
     */
    OpenCLPoolSolver(long long poolSize, int batchSize);

    std::string name() const override { return "opencl-pool"; }

    SearchResult search(const SearchContext& ctx) override;

private:
    /**
     * @brief Collects complete timetables and flushes full batches.
     */
    class BatchListener : public SearchListener {
    public:
        BatchListener(OpenCLPoolSolver& solver, const SearchContext& ctx) : solver_(solver), ctx_(ctx) {}

        bool onSolution(const TimetableState& state, const std::vector<int>& path) override;

    private:
        OpenCLPoolSolver& solver_;
        const SearchContext& ctx_;
    };

    /// Maximum number of timetables to score before terminating the search.
    long long poolSize_;

    /// Target number of timetables per device batch.
    int batchSize_;

    /// OpenCL context and kernel used for batched scoring.
    TimetableOpenCLContext clctx_;

    /// Accumulated timetables awaiting scoring.
    std::vector<BatchCandidate> batch_;

    /// Best timetables scored so far.
    RankedIncumbents ranked_;

    /// Timetables collected so far.
    long long collected_ = 0;

    /**
     * @brief Score the current batch on the device and update ranked_.
     */
    void flushBatch(const SearchContext& ctx);
};
