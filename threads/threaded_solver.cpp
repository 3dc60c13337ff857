///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "logging.hpp"
#include <atomic>
#include <future>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
ThreadedBacktrackingSolver::ThreadedBacktrackingSolver(int numThreads)
        : numThreads_(numThreads) {}

SearchResult ThreadedBacktrackingSolver::search(const SearchContext& ctx) {
    return searchBranches(ctx, 0, 1);
}

/**
 * @brief Launch the workers and merge their outcomes.
 *
 * The engine is shared read-only; each run() works on its own copy of the
 * initial state. Exceptions thrown by a worker are rethrown by get().
 */
SearchResult ThreadedBacktrackingSolver::searchBranches(const SearchContext& ctx, int offset, int stride) {
    int threads = numThreads_ > 0 ? numThreads_ : ctx.config.threads;

    SearchLimits& limits = ctx.limits;
    SharedIncumbent incumbent(ctx.config.numSchedules);
    AssignmentEngine engine(ctx.space, limits);

    // Root branches handed out in order: offset, offset + stride, ...
    const int branches = engine.rootBranchCount();
    std::atomic<int> next{0};
    AssignmentEngine::RootSelector selector = [&next, branches, offset, stride]() -> int {
        long long b = offset + (long long)next.fetch_add(1) * stride;
        return b < branches ? (int)b : -1;
    };

    struct WorkerReport {
        bool exhausted;
        long long pruned;
    };

    std::vector<std::future<WorkerReport>> tasks;
    for (int i = 0; i < threads; ++i) {
        tasks.push_back(std::async(std::launch::async, [&ctx, &engine, &incumbent, &selector]() {
            BoundListener listener(ctx.costs, ctx.space, incumbent);
            SearchOutcome outcome = engine.run(listener, selector);
            return WorkerReport{outcome.exhausted, listener.pruned()};
        }));
    }

    SearchResult result;
    result.exhausted = true;
    for (auto& t : tasks) {
        WorkerReport report = t.get();
        result.exhausted = result.exhausted && report.exhausted;
        result.stats.pruned += report.pruned;
    }
    result.exhausted = result.exhausted && !limits.budgetExpired();
    result.ranked = incumbent.ranked();
    result.stats.nodes = limits.nodes();
    result.stats.candidates = limits.candidates();
    result.stats.seconds = limits.elapsedSeconds();
    result.stats.workers = threads;

    logDebug("threaded search: " + std::to_string(branches) + " root branches, " +
             std::to_string(threads) + " workers");
    return result;
}
