///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "branch_and_bound.hpp"
#include <algorithm>


///////////////////////////
///      INCUMBENT      ///
///////////////////////////
bool improves(const CostVector& cost, const std::vector<int>& path, const Incumbent& best) {
    int c = lexCompare(cost, best.cost);
    if (c != 0) return c < 0;
    return pathCompare(path, best.path) < 0;
}

bool RankedIncumbents::offer(const Incumbent& candidate) {
    size_t pos = items_.size();
    while (pos > 0 && improves(candidate.cost, candidate.path, items_[pos - 1])) --pos;
    if (pos > 0 && items_[pos - 1].path == candidate.path) return false;
    if (pos >= (size_t)capacity_) return false;

    items_.insert(items_.begin() + pos, candidate);
    if ((int)items_.size() > capacity_) items_.pop_back();
    return true;
}

bool SharedIncumbent::offer(const Incumbent& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ranked_.offer(candidate)) return false;
    if (ranked_.full() && !ranked_.worst().cost.empty()) lowerTopBound(ranked_.worst().cost.front());
    version_.fetch_add(1, std::memory_order_release);
    return true;
}

std::optional<Incumbent> SharedIncumbent::best() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ranked_.empty()) return std::nullopt;
    return ranked_.items().front();
}

std::vector<Incumbent> SharedIncumbent::ranked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranked_.items();
}

bool SharedIncumbent::refresh(long long& seenVersion, Incumbent& out) const {
    if (version() == seenVersion) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    seenVersion = version_.load(std::memory_order_relaxed);
    if (!ranked_.full()) return false;
    out = ranked_.worst();
    return true;
}

/// Atomic min.
void SharedIncumbent::lowerTopBound(long long value) {
    long long current = topBound_.load(std::memory_order_relaxed);
    while (value < current && !topBound_.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
    }
}


///////////////////////////
///   BRANCH & BOUND    ///
///////////////////////////
BoundListener::BoundListener(const CostModel& costs, const SearchSpace& space, SharedIncumbent& incumbent)
        : costs_(costs),
          space_(space),
          incumbent_(incumbent),
          value_(costs.zero()) {
    for (int g = 0; g < space.numGroups(); ++g) {
        const CostVector& m = costs.minLocal(g);
        for (size_t l = 0; l < value_.size(); ++l) value_[l] += m[l];
    }
}

/**
 * @brief Replace the group's minimum local cost by its actual one and add
 * the pair terms against every group assigned before it.
 */
bool BoundListener::enter(const TimetableState& state, int group, const std::vector<int>& path) {
    int rank = state.rankOf(group);
    const CostVector& local = costs_.localCost(group, rank);
    const CostVector& minLocal = costs_.minLocal(group);

    CostVector delta = costs_.zero();
    for (size_t l = 0; l < delta.size(); ++l) delta[l] = local[l] - minLocal[l];

    SlotSet mine = space_.fullSlots(group, rank);
    for (const CostModel::PairWeight& p : costs_.pairWeights(group)) {
        if (!state.isAssigned(p.other)) continue;
        SlotSet theirs = space_.fullSlots(p.other, state.rankOf(p.other));
        CostModel::addScaled(delta, p.weight, slotCount(mine & theirs));
    }

    for (size_t l = 0; l < delta.size(); ++l) value_[l] += delta[l];
    deltas_.push_back(std::move(delta));

    if (shouldPrune(path)) {
        ++pruned_;
        return false;
    }
    return true;
}

void BoundListener::leave(const TimetableState& state, int group) {
    (void)state;
    (void)group;
    const CostVector& delta = deltas_.back();
    for (size_t l = 0; l < delta.size(); ++l) value_[l] -= delta[l];
    deltas_.pop_back();
}

bool BoundListener::shouldPrune(const std::vector<int>& path) {
    if (!value_.empty() && value_.front() > incumbent_.topBound()) return true;

    if (incumbent_.refresh(seenVersion_, cached_)) hasBound_ = true;
    if (!hasBound_) return false;

    int c = lexCompare(value_, cached_.cost);
    if (c != 0) return c > 0;

    // Equal bound: only subtrees before the incumbent in search order may still win.
    size_t n = std::min(path.size(), cached_.path.size());
    std::vector<int> prefix(cached_.path.begin(), cached_.path.begin() + n);
    return pathCompare(path, prefix) > 0;
}

bool BoundListener::onSolution(const TimetableState& state, const std::vector<int>& path) {
    if (incumbent_.refresh(seenVersion_, cached_)) hasBound_ = true;
    if (hasBound_ && !improves(value_, path, cached_)) return true;

    Incumbent found{value_, path, state.groupSlots()};
    incumbent_.offer(found);
    return true;
}
