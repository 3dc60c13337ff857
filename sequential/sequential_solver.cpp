///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "logging.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Solve with depth-first branch-and-bound.
 *
 * Sets up the shared incumbent, runs the engine once and reports whether
 * the tree was exhausted.
 */
SearchResult SequentialBacktrackingSolver::search(const SearchContext& ctx) {
    SearchLimits& limits = ctx.limits;
    SharedIncumbent incumbent(ctx.config.numSchedules);
    BoundListener listener(ctx.costs, ctx.space, incumbent);

    AssignmentEngine engine(ctx.space, limits);
    SearchOutcome outcome = engine.run(listener);

    SearchResult result;
    result.exhausted = outcome.exhausted && !limits.budgetExpired();
    result.ranked = incumbent.ranked();
    result.stats.nodes = limits.nodes();
    result.stats.candidates = limits.candidates();
    result.stats.pruned = listener.pruned();
    result.stats.seconds = limits.elapsedSeconds();
    result.stats.workers = 1;

    logDebug("sequential search: " + std::to_string(outcome.solutions) + " timetables reached");
    return result;
}
