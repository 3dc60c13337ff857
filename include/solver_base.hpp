#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "branch_and_bound.hpp"
#include "configuration.hpp"
#include "soft_constraints.hpp"
#include <optional>
#include <string>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Terminal status of a solve.
 */
enum class SolveStatus {
    OPTIMAL, ///< Search space exhausted; the timetable is the best one.
    FEASIBLE_UNPROVEN, ///< Budget ran out after a timetable was found.
    INFEASIBLE, ///< Search space exhausted without any valid timetable.
    UNKNOWN ///< Budget ran out before any timetable was found.
};

const char* statusName(SolveStatus status);

/**
 * @brief Counters reported by a search.
 */
struct SearchStats {
    long long nodes = 0;
    long long candidates = 0; ///< Complete timetables reached.
    long long pruned = 0; ///< Subtrees cut by the bound.
    double seconds = 0.0;
    int workers = 1;
};

/**
 * @brief Raw result of a solver front end.
 */
struct SearchResult {
    bool exhausted = false; ///< Whole tree explored (no limit interrupted the search).
    std::vector<Incumbent> ranked; ///< Best first, at most numSchedules entries.
    SearchStats stats;
};

/**
 * @brief Everything a solver front end needs, built once per solve.
 *
 * All members but the limits are read-only during the search and shared by
 * every worker. The limits were started before the candidates were built,
 * so the search spends what is left of the budget.
 */
struct SearchContext {
    const FactStore& facts;
    const ConflictResolver& resolver;
    const SearchSpace& space;
    const CostModel& costs;
    const OptimizerConfig& config;
    SearchLimits& limits;
};

/**
 * @brief Full timetable solution with its cost breakdown.
 *
 * Unit indices in the violations and conflicts refer to units.
 */
struct TimetableSolution {
    std::vector<UnitKey> units; ///< Offering groups in input order.
    Timetable timetable;
    std::vector<ClassMeeting> meetings; ///< Sorted by slot, then course and group.

    std::vector<int> layerPriorities; ///< Priority of each cost layer, descending.
    CostVector layerCosts; ///< Weighted violation sum per layer.

    std::vector<Violation> violations;
    std::vector<Conflict> conflicts;
    std::vector<std::vector<int>> jointGroups; ///< Unit indices of every group with more than one unit.
};

/**
 * @brief Outcome of scheduleTimetable().
 */
struct SolveResult {
    SolveStatus status = SolveStatus::UNKNOWN;
    std::optional<TimetableSolution> solution; ///< Never a partial timetable.
    std::vector<TimetableSolution> alternatives; ///< Next best distinct timetables, in cost order.
    std::vector<std::string> diagnostics; ///< Why no timetable exists, when known.
    SearchStats stats;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for timetable solvers.
 *
 * Implementations may be sequential, multithreaded, GPU-accelerated,
 * or distributed via MPI, but all expose the same search() contract:
 * among the timetables they examine, return the numSchedules ones with the
 * smallest layered cost, ties going to the earliest in depth-first order.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Search the prepared space within the configured budget.
     */
    virtual SearchResult search(const SearchContext& ctx) = 0;
};
