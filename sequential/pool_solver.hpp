#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include <string>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Scores the first valid timetables of the search, up to a pool size.
 *
 * No pruning is applied. Each timetable is scored with the cost model as it
 * arrives and only the best ones are kept, so memory stays bounded however
 * large the pool is.
 */
class PoolListener : public SearchListener {
public:
    /**
     * @param poolSize Maximum number of timetables scored (0 = unlimited).
     * @param keep     Number of best timetables retained.
     */
    PoolListener(const CostModel& costs, long long poolSize, int keep)
            : costs_(costs), poolSize_(poolSize), ranked_(keep) {}

    bool onSolution(const TimetableState& state, const std::vector<int>& path) override;

    /// Timetables scored so far.
    long long scored() const { return scored_; }

    const RankedIncumbents& ranked() const { return ranked_; }

private:
    const CostModel& costs_;
    long long poolSize_;
    long long scored_ = 0;
    RankedIncumbents ranked_;
};

/**
 * @brief Generate a pool of valid timetables and keep the cheapest ones.
 *
 * Candidates are enumerated without bounding and scored on the CPU. If the
 * pool covers every valid timetable the answer is optimal and equals the
 * branch-and-bound one.
 */
class CandidatePoolSolver : public ISolver {
public:
    /**
     * @param poolSize Number of timetables to generate (0 = all of them).
     */
    explicit CandidatePoolSolver(long long poolSize);

    std::string name() const override { return "candidate-pool"; }

    SearchResult search(const SearchContext& ctx) override;

private:
    long long poolSize_;
};
