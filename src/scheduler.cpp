///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "scheduler.hpp"
#include "logging.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
const char* statusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::OPTIMAL:           return "optimal";
        case SolveStatus::FEASIBLE_UNPROVEN: return "feasible-unproven-optimal";
        case SolveStatus::INFEASIBLE:        return "infeasible";
        case SolveStatus::UNKNOWN:           return "unknown";
    }
    return "unknown";
}

SolveStatus classifyOutcome(bool exhausted, bool found) {
    if (exhausted) return found ? SolveStatus::OPTIMAL : SolveStatus::INFEASIBLE;
    return found ? SolveStatus::FEASIBLE_UNPROVEN : SolveStatus::UNKNOWN;
}

/**
 * @brief Expand the winning group slots into meetings and cost reports.
 */
static TimetableSolution buildSolution(const SearchContext& ctx, const SoftConstraintEvaluator& evaluator,
                                       const std::vector<ActiveRule>& rules, const Incumbent& best) {
    const FactStore& facts = ctx.facts;
    const SlotDomain& dom = facts.slots();
    TimetableSolution sol;

    for (const UnitFacts& u : facts.units()) {
        sol.units.push_back(UnitKey{facts.courses()[u.course].id, u.groupId});
    }
    sol.timetable = ctx.resolver.expand(best.groupSlots);

    for (int u = 0; u < (int)sol.units.size(); ++u) {
        for (const Slot& s : dom.slotsOf(sol.timetable.slots[u])) {
            bool fixed = (sol.timetable.fixed[u] & dom.bit(s)) != 0;
            sol.meetings.push_back(ClassMeeting{sol.units[u].courseId, sol.units[u].groupId, s, fixed});
        }
    }
    std::sort(sol.meetings.begin(), sol.meetings.end(), [](const ClassMeeting& a, const ClassMeeting& b) {
        if (a.slot != b.slot) return a.slot < b.slot;
        if (a.courseId != b.courseId) return a.courseId < b.courseId;
        return a.groupId < b.groupId;
    });

    sol.layerPriorities = ctx.costs.layerPriorities();
    sol.layerCosts = ctx.costs.zero();
    sol.violations = evaluator.evaluateAll(rules, sol.timetable);
    for (const Violation& v : sol.violations) {
        for (const ActiveRule& rule : rules) {
            if (rule.kind == v.rule) sol.layerCosts[ctx.costs.layerOf(rule.priority)] += v.cost;
        }
    }

    sol.conflicts = ctx.resolver.conflicts(sol.timetable);

    for (const SchedulingGroup& g : ctx.resolver.groups()) {
        if (g.units.size() > 1) sol.jointGroups.push_back(g.units);
    }
    return sol;
}


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
SolveResult scheduleTimetable(const ProblemInstance& inst, const OptimizerConfig& config, ISolver& solver) {
    setLogLevel(config.logLevel);
    std::vector<ActiveRule> rules = validateConfig(config);

    // The budget covers candidate enumeration and ranking as well.
    SearchLimits limits(config.budget);

    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver, &limits);
    SoftConstraintEvaluator evaluator(resolver, config);
    CostModel costs(space, evaluator, rules, &limits);
    bool expiredBeforeSearch = limits.budgetExpired();

    logInfo("Scheduling " + std::to_string(facts.units().size()) + " offerings in " +
            std::to_string(resolver.groups().size()) + " groups, " + std::to_string(costs.numLayers()) +
            " cost layers, solver: " + solver.name());

    // A stopped budget makes the solver return at once; it is still called so
    // that distributed front ends take part in their collective operations.
    SearchContext ctx{facts, resolver, space, costs, config, limits};
    SearchResult found = solver.search(ctx);

    SolveResult result;
    result.stats = found.stats;
    result.status = classifyOutcome(found.exhausted, !found.ranked.empty());

    if (!found.ranked.empty()) {
        result.solution = buildSolution(ctx, evaluator, rules, found.ranked.front());
        for (size_t i = 1; i < found.ranked.size(); ++i) {
            result.alternatives.push_back(buildSolution(ctx, evaluator, rules, found.ranked[i]));
        }
    } else if (result.status == SolveStatus::INFEASIBLE) {
        SearchLimits unlimited(SearchBudget{0, 0, 0});
        AssignmentEngine engine(space, unlimited);
        result.diagnostics = engine.diagnose();
        if (result.diagnostics.empty())
            result.diagnostics.push_back("no combination of candidates satisfies every teacher conflict");
        for (const std::string& d : result.diagnostics) logWarn(d);
    } else if (expiredBeforeSearch) {
        result.diagnostics.push_back("time limit reached while enumerating candidates");
        logWarn(result.diagnostics.back());
    }

    logInfo(std::string("Search finished: ") + statusName(result.status) + ", nodes=" +
            std::to_string(result.stats.nodes) + ", candidates=" + std::to_string(result.stats.candidates) +
            ", pruned=" + std::to_string(result.stats.pruned));
    return result;
}
