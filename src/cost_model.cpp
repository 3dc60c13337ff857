///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cost_model.hpp"
#include <algorithm>
#include <functional>
#include <numeric>


///////////////////////////
///        COSTS        ///
///////////////////////////
int lexCompare(const CostVector& a, const CostVector& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) return a[i] < b[i] ? -1 : 1;
    }
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    return 0;
}

int pathCompare(const std::vector<int>& a, const std::vector<int>& b) {
    if (std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end())) return -1;
    if (std::lexicographical_compare(b.begin(), b.end(), a.begin(), a.end())) return 1;
    return 0;
}


///////////////////////////
///     COST MODEL      ///
///////////////////////////
CostModel::CostModel(SearchSpace& space, const SoftConstraintEvaluator& evaluator,
                     const std::vector<ActiveRule>& rules, SearchLimits* limits)
        : space_(space),
          evaluator_(evaluator),
          rules_(rules) {
    for (const ActiveRule& r : rules_) priorities_.push_back(r.priority);
    std::sort(priorities_.begin(), priorities_.end(), std::greater<int>());
    priorities_.erase(std::unique(priorities_.begin(), priorities_.end()), priorities_.end());

    rankDomains(space, limits);
    buildPairs();
}

int CostModel::layerOf(int priority) const {
    for (int i = 0; i < (int)priorities_.size(); ++i) {
        if (priorities_[i] == priority) return i;
    }
    return -1;
}

void CostModel::addScaled(CostVector& acc, const CostVector& weight, long long times) {
    if (times == 0) return;
    for (size_t i = 0; i < acc.size(); ++i) acc[i] += weight[i] * times;
}

/**
 * @brief Unit-rule cost of a group meeting at the given slots.
 *
 * Every member unit is charged separately with its own fixed meetings.
 */
CostVector CostModel::computeLocal(int group, SlotSet slots) const {
    const SchedulingGroup& g = space_.resolver().groups()[group];
    const FactStore& facts = space_.resolver().facts();
    CostVector cost = zero();
    for (const ActiveRule& r : rules_) {
        if (SoftConstraintEvaluator::isPairRule(r.kind)) continue;
        int layer = layerOf(r.priority);
        for (int u : g.units) {
            long long n = evaluator_.unitWitnesses(r.kind, u, slots, facts.units()[u].fixed, r.weight, nullptr);
            cost[layer] += n * r.weight;
        }
    }
    return cost;
}

void CostModel::rankDomains(SearchSpace& space, SearchLimits* limits) {
    int numGroups = space.numGroups();
    local_.assign(numGroups, {});
    minLocal_.assign(numGroups, zero());

    for (int g = 0; g < numGroups; ++g) {
        if (limits && !limits->checkTime()) return;
        const std::vector<SlotSet>& dom = space.domain(g);
        std::vector<CostVector> costs;
        costs.reserve(dom.size());
        for (size_t i = 0; i < dom.size(); ++i) {
            if (limits && (i & 4095) == 4095 && !limits->checkTime()) return;
            costs.push_back(computeLocal(g, space.fullSlots(g, (int)i)));
        }

        std::vector<int> order(dom.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&costs](int a, int b) {
            return lexLess(costs[a], costs[b]);
        });
        space.applyOrder(g, order);

        for (int old : order) local_[g].push_back(costs[old]);

        if (!local_[g].empty()) {
            minLocal_[g] = local_[g].front();
            for (const CostVector& c : local_[g]) {
                for (size_t l = 0; l < c.size(); ++l) minLocal_[g][l] = std::min(minLocal_[g][l], c[l]);
            }
        }
    }
}

/**
 * @brief Collect per-layer pair weights between groups.
 *
 * weight(g, h) sums the rule weight over every member pair (u in g, v in h)
 * the pair rule charges.
 */
void CostModel::buildPairs() {
    const auto& groups = space_.resolver().groups();
    int numGroups = (int)groups.size();
    pairs_.assign(numGroups, {});

    std::vector<ActiveRule> pairRules;
    for (const ActiveRule& r : rules_) {
        if (SoftConstraintEvaluator::isPairRule(r.kind)) pairRules.push_back(r);
    }
    if (pairRules.empty()) return;

    for (int g = 0; g < numGroups; ++g) {
        for (int h = g + 1; h < numGroups; ++h) {
            CostVector w = zero();
            bool any = false;
            for (const ActiveRule& r : pairRules) {
                int layer = layerOf(r.priority);
                for (int u : groups[g].units) {
                    for (int v : groups[h].units) {
                        if (evaluator_.pairQualifies(r.kind, u, v)) {
                            w[layer] += r.weight;
                            any = true;
                        }
                    }
                }
            }
            if (!any) continue;
            pairs_[g].push_back(PairWeight{h, w});
            pairs_[h].push_back(PairWeight{g, w});
        }
    }
}

CostVector CostModel::evaluate(const std::vector<SlotSet>& groupSlots) const {
    CostVector cost = zero();
    int numGroups = (int)groupSlots.size();
    for (int g = 0; g < numGroups; ++g) {
        CostVector local = computeLocal(g, groupSlots[g]);
        for (size_t l = 0; l < cost.size(); ++l) cost[l] += local[l];
        for (const PairWeight& p : pairs_[g]) {
            if (p.other < g) continue;
            addScaled(cost, p.weight, slotCount(groupSlots[g] & groupSlots[p.other]));
        }
    }
    return cost;
}
