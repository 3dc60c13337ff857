#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include <string>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded branch-and-bound solver.
 *
 * Worker threads claim root branches from a shared atomic counter and run
 * them with their own TimetableState. The only shared mutable state is the
 * incumbent, so a stronger bound found by one worker immediately prunes the
 * others. Once the tree is exhausted the answer does not depend on timing:
 * the winner is the cheapest timetable, ties going to the earliest one in
 * depth-first order, exactly as in the sequential solver.
 */
class ThreadedBacktrackingSolver : public ISolver {
public:
    /**
     * @brief Create a threaded branch-and-bound solver.
     *
     * @param numThreads Number of worker threads (0 = use OptimizerConfig::threads).
     */
    explicit ThreadedBacktrackingSolver(int numThreads = 0);

    std::string name() const override { return "threaded"; }

    SearchResult search(const SearchContext& ctx) override;

    /**
     * @brief Explore only the root branches offset, offset + stride, ...
     *
     * Lets several processes split one tree; search() is the case
     * offset = 0, stride = 1.
     */
    SearchResult searchBranches(const SearchContext& ctx, int offset, int stride);

private:
    int numThreads_; ///< Number of worker threads.
};
