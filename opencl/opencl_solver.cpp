///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include "logging.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
OpenCLPoolSolver::OpenCLPoolSolver(long long poolSize, int batchSize)
        : poolSize_(poolSize),
          batchSize_(batchSize > 0 ? batchSize : 1) {}

bool OpenCLPoolSolver::BatchListener::onSolution(const TimetableState& state, const std::vector<int>& path) {
    if (solver_.poolSize_ > 0 && solver_.collected_ >= solver_.poolSize_) return false;

    BatchCandidate c;
    c.ranks.resize(ctx_.space.numGroups());
    for (int g = 0; g < ctx_.space.numGroups(); ++g) c.ranks[g] = state.rankOf(g);
    c.groupSlots = state.groupSlots();
    c.path = path;
    solver_.batch_.push_back(std::move(c));
    ++solver_.collected_;

    if ((int)solver_.batch_.size() >= solver_.batchSize_) solver_.flushBatch(ctx_);
    return true;
}

/**
 * @brief Score the accumulated batch and rank its timetables.
 *
 * Batches follow depth-first order, so the ranking keeps the earliest of
 * equally cheap timetables.
 */
void OpenCLPoolSolver::flushBatch(const SearchContext& ctx) {
    if (batch_.empty()) return;

    std::vector<CostVector> scores;
    clctx_.evaluateBatch(ctx.costs, ctx.space, batch_, scores);

    for (int i = 0; i < (int)batch_.size(); ++i) {
        if (ranked_.full() && !improves(scores[i], batch_[i].path, ranked_.worst())) continue;
        ranked_.offer(Incumbent{scores[i], batch_[i].path, batch_[i].groupSlots});
    }
    batch_.clear();
}

SearchResult OpenCLPoolSolver::search(const SearchContext& ctx) {
    batch_.clear();
    ranked_ = RankedIncumbents(ctx.config.numSchedules);
    collected_ = 0;

    logInfo("OpenCLPoolSolver: batchSize=" + std::to_string(batchSize_) +
            ", poolSize=" + std::to_string(poolSize_));

    SearchLimits& limits = ctx.limits;
    BatchListener listener(*this, ctx);
    AssignmentEngine engine(ctx.space, limits);
    SearchOutcome outcome = engine.run(listener);

    flushBatch(ctx);

    SearchResult result;
    result.exhausted = outcome.exhausted && !limits.budgetExpired();
    result.ranked = ranked_.items();
    result.stats.nodes = limits.nodes();
    result.stats.candidates = collected_;
    result.stats.seconds = limits.elapsedSeconds();
    result.stats.workers = 1;
    return result;
}
