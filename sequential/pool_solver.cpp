///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "pool_solver.hpp"
#include "logging.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Score one pool member and rank it.
 *
 * Pool members arrive in depth-first order, so the ranking keeps the
 * earliest of equally cheap timetables.
 */
bool PoolListener::onSolution(const TimetableState& state, const std::vector<int>& path) {
    if (poolSize_ > 0 && scored_ >= poolSize_) return false;

    std::vector<SlotSet> slots = state.groupSlots();
    CostVector cost = costs_.evaluate(slots);
    ++scored_;

    if (ranked_.full() && !improves(cost, path, ranked_.worst())) return true;
    ranked_.offer(Incumbent{std::move(cost), path, std::move(slots)});
    return true;
}

CandidatePoolSolver::CandidatePoolSolver(long long poolSize) : poolSize_(poolSize) {}

SearchResult CandidatePoolSolver::search(const SearchContext& ctx) {
    SearchLimits& limits = ctx.limits;
    PoolListener listener(ctx.costs, poolSize_, ctx.config.numSchedules);

    AssignmentEngine engine(ctx.space, limits);
    SearchOutcome outcome = engine.run(listener);

    SearchResult result;
    result.ranked = listener.ranked().items();
    result.exhausted = outcome.exhausted && !limits.budgetExpired();
    result.stats.nodes = limits.nodes();
    result.stats.candidates = listener.scored();
    result.stats.seconds = limits.elapsedSeconds();
    result.stats.workers = 1;

    logInfo("Candidate pool: " + std::to_string(listener.scored()) + " timetables scored");
    return result;
}
