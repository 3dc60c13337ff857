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
 * @brief Single-threaded branch-and-bound solver.
 *
 * Runs one AssignmentEngine over the whole tree with a BoundListener, so
 * every subtree whose lower bound cannot beat the incumbent is skipped.
 * With an unlimited budget the result is the optimum.
 */
class SequentialBacktrackingSolver : public ISolver {
public:
    std::string name() const override { return "sequential"; }

    /**
     * @brief Explore the search tree depth-first and return the best timetable.
     */
    SearchResult search(const SearchContext& ctx) override;
};
