#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment_engine.hpp"
#include "cost_model.hpp"
#include <atomic>
#include <climits>
#include <mutex>
#include <optional>
#include <vector>


///////////////////////////
///      INCUMBENT      ///
///////////////////////////
/**
 * @brief A complete timetable found by the search.
 */
struct Incumbent {
    CostVector cost;
    std::vector<int> path; ///< Ranks chosen from the root; orders ties.
    std::vector<SlotSet> groupSlots; ///< Fixed plus chosen slots per group.
};

/// True if (cost, path) beats the incumbent: smaller cost, then earlier path.
bool improves(const CostVector& cost, const std::vector<int>& path, const Incumbent& best);

/**
 * @brief The best timetables seen so far, at most a fixed number of them.
 *
 * Kept sorted by cost, then path key. Distinct leaves of the search tree
 * have distinct path keys and distinct group slots, so the entries are
 * distinct timetables.
 */
class RankedIncumbents {
public:
    explicit RankedIncumbents(int capacity = 1) : capacity_(capacity > 0 ? capacity : 1) {}

    /// Insert the candidate if it ranks among the best; true if it was kept.
    bool offer(const Incumbent& candidate);

    bool empty() const { return items_.empty(); }
    bool full() const { return (int)items_.size() >= capacity_; }
    int capacity() const { return capacity_; }

    /// Last kept entry; a candidate must beat it to enter a full ranking.
    const Incumbent& worst() const { return items_.back(); }

    /// Best first.
    const std::vector<Incumbent>& items() const { return items_; }

private:
    int capacity_;
    std::vector<Incumbent> items_;
};

/**
 * @brief Best timetables shared by all workers of a solve.
 *
 * Guarded by a mutex. The version counter lets workers notice updates
 * without locking, and the top-layer bound allows a lock-free first
 * pruning test. Once the ranking is full, the bound is that of its worst
 * entry: only timetables beating it can still be kept.
 */
class SharedIncumbent {
public:
    /// @param capacity Number of best timetables to keep.
    explicit SharedIncumbent(int capacity = 1) : ranked_(capacity) {}

    /// Add the candidate to the ranking if it ranks among the best; true if it did.
    bool offer(const Incumbent& candidate);

    /// Copy of the best timetable, if any.
    std::optional<Incumbent> best() const;

    /// Copy of every kept timetable, best first.
    std::vector<Incumbent> ranked() const;

    /**
     * @brief Copy the pruning bound into out if it changed since seenVersion.
     *
     * @return true if out now holds the worst entry of a full ranking.
     */
    bool refresh(long long& seenVersion, Incumbent& out) const;

    long long version() const { return version_.load(std::memory_order_acquire); }

    /// First-layer cost of the pruning bound (LLONG_MAX while the ranking is not full).
    long long topBound() const { return topBound_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mutex_;
    RankedIncumbents ranked_;
    std::atomic<long long> version_{0};
    std::atomic<long long> topBound_{LLONG_MAX};

    void lowerTopBound(long long value);
};


///////////////////////////
///   BRANCH & BOUND    ///
///////////////////////////
/**
 * @brief Search listener that keeps an exact running cost and prunes.
 *
 * The running value is the cost of the assigned groups (local and pair
 * terms) plus the minimum local cost of every unassigned group, an
 * admissible lower bound in every layer. A node is pruned when that bound
 * is lexicographically greater than the incumbent's cost, or equal to it
 * while the node comes later in depth-first order. Hence the first
 * timetable in search order among those of minimal cost is always kept.
 * When several timetables are requested, the bound is the worst of them.
 */
class BoundListener : public SearchListener {
public:
    BoundListener(const CostModel& costs, const SearchSpace& space, SharedIncumbent& incumbent);

    bool enter(const TimetableState& state, int group, const std::vector<int>& path) override;
    void leave(const TimetableState& state, int group) override;
    bool onSolution(const TimetableState& state, const std::vector<int>& path) override;

    long long pruned() const { return pruned_; }

private:
    const CostModel& costs_;
    const SearchSpace& space_;
    SharedIncumbent& incumbent_;

    CostVector value_;
    std::vector<CostVector> deltas_;

    long long seenVersion_ = 0;
    Incumbent cached_;
    bool hasBound_ = false;

    long long pruned_ = 0;

    bool shouldPrune(const std::vector<int>& path);
};
