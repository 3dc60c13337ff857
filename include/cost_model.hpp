#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "soft_constraints.hpp"
#include <vector>


///////////////////////////
///        COSTS        ///
///////////////////////////
/// Weighted violation sum per layer, highest priority first.
using CostVector = std::vector<long long>;

/// -1, 0 or 1 as a is lexicographically smaller, equal or greater than b.
int lexCompare(const CostVector& a, const CostVector& b);

inline bool lexLess(const CostVector& a, const CostVector& b) { return lexCompare(a, b) < 0; }

/// -1, 0 or 1 comparing two path keys in depth-first order.
int pathCompare(const std::vector<int>& a, const std::vector<int>& b);


///////////////////////////
///     COST MODEL      ///
///////////////////////////
/**
 * @brief Layered cost of timetables, decomposed for incremental search.
 *
 * Enabled rules are grouped into layers by priority, highest first. The cost
 * of a timetable splits exactly into
 *  - a local cost per group, depending only on the group's own slots
 *    (unit rules over every member), precomputed for each candidate, and
 *  - a pair cost per two groups: a per-layer weight times the number of
 *    slots both groups meet in (pair rules over every member pair).
 *
 * Construction ranks every domain of the search space by ascending local
 * cost (stable, so ties keep enumeration order). With limits given, ranking
 * stops once the time limit passes; the model then holds no usable costs
 * and the search must not run.
 */
class CostModel {
public:
    /// Weights of one group pair, per layer.
    struct PairWeight {
        int other;
        CostVector weight;
    };

    CostModel(SearchSpace& space, const SoftConstraintEvaluator& evaluator, const std::vector<ActiveRule>& rules,
              SearchLimits* limits = nullptr);

    int numLayers() const { return (int)priorities_.size(); }

    /// Priority of every layer, descending.
    const std::vector<int>& layerPriorities() const { return priorities_; }

    /// Zero vector of the right length.
    CostVector zero() const { return CostVector(priorities_.size(), 0); }

    /// Local cost of a group at a candidate rank.
    const CostVector& localCost(int group, int rank) const { return local_[group][rank]; }

    /// Componentwise minimum local cost over the group's candidates.
    const CostVector& minLocal(int group) const { return minLocal_[group]; }

    /// Groups whose meetings may be charged together with this group's.
    const std::vector<PairWeight>& pairWeights(int group) const { return pairs_[group]; }

    /// acc += weight * |common slots|.
    static void addScaled(CostVector& acc, const CostVector& weight, long long times);

    /**
     * @brief Full cost of a timetable given per-group slots (fixed included).
     *
     * Recomputes local costs from scratch, so it also serves as a reference
     * for the precomputed tables.
     */
    CostVector evaluate(const std::vector<SlotSet>& groupSlots) const;

    /// Layer of a rule priority, or -1.
    int layerOf(int priority) const;

private:
    const SearchSpace& space_;
    const SoftConstraintEvaluator& evaluator_;
    std::vector<ActiveRule> rules_;
    std::vector<int> priorities_;

    std::vector<std::vector<CostVector>> local_;
    std::vector<CostVector> minLocal_;
    std::vector<std::vector<PairWeight>> pairs_;

    CostVector computeLocal(int group, SlotSet slots) const;
    void buildPairs();
    void rankDomains(SearchSpace& space, SearchLimits* limits);
};
