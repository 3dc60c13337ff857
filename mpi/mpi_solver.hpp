#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include "../threads/threaded_solver.hpp"
#include <string>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI wrapper around the threaded branch-and-bound solver.
 *
 * Root branches are split across ranks by stride (rank r explores branches
 * r, r + size, ...), with a ThreadedBacktrackingSolver inside each rank.
 * Rank 0 gathers every rank's ranking, merges them and broadcasts the
 * merged ranking, so search() returns the same result on every rank.
 */
class MPIHybridMultiStartSolver : public ISolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param numThreads Number of worker threads used inside each rank
     *                   (0 = use OptimizerConfig::threads).
     */
    explicit MPIHybridMultiStartSolver(int numThreads);

    std::string name() const override { return "mpi-hybrid"; }

    /**
     * @brief Solve cooperatively across all MPI ranks.
     *
     * Must be called on every rank, between MPI_Init and MPI_Finalize.
     */
    SearchResult search(const SearchContext& ctx) override;

private:
    /// Number of worker threads used within each MPI process.
    int numThreads_;

    /**
     * @brief Serialize a ranking into a flat buffer.
     *
     * Layout: entry count, then per entry (layer count, costs),
     * (path length, path), (group count, group slots).
     */
    static void serializeRanking(const std::vector<Incumbent>& ranked, std::vector<long long>& buffer);

    /**
     * @brief Inverse of serializeRanking().
     */
    static std::vector<Incumbent> deserializeRanking(const std::vector<long long>& buffer);
};
