#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "configuration.hpp"
#include "resolver.hpp"
#include <string>
#include <vector>


///////////////////////////
///     VIOLATIONS      ///
///////////////////////////
/**
 * @brief One witness of a soft-constraint violation.
 *
 * Pair rules list their two units in canonical order (see
 * ConflictResolver::orderedPair).
 */
struct Violation {
    SoftRuleKind rule;
    std::vector<int> units; ///< Unit indices involved.
    std::vector<Slot> slots; ///< Slots that witness the violation.
    std::string detail; ///< Extra context, e.g. the teacher id for preferences.
    long long cost; ///< Weight charged for this witness.
};


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Pure cost functions for the bundled soft rules.
 *
 * Every rule maps a complete timetable to a list of witnesses, each charged
 * the rule weight. Rules are dispatched on SoftRuleKind and never modify
 * their inputs, so they can be evaluated independently and concurrently.
 *
 * Two families exist:
 *  - unit rules depend on the slots of a single unit only,
 *  - pair rules charge conflicts between two non-joint units at a slot.
 */
class SoftConstraintEvaluator {
public:
    SoftConstraintEvaluator(const ConflictResolver& resolver, const OptimizerConfig& config);

    /// True for rules charging conflicts between two units.
    static bool isPairRule(SoftRuleKind kind);

    /**
     * @brief Witnesses of a unit rule for one unit.
     *
     * @param slots All meeting slots of the unit.
     * @param fixed Subset of slots pinned by the user.
     * @param out   Receives the witnesses; may be null to only count them.
     * @return Number of witnesses.
     */
    long long unitWitnesses(SoftRuleKind kind, int unit, SlotSet slots, SlotSet fixed,
                            long long weight, std::vector<Violation>* out) const;

    /// True if a conflict between the two units is charged by the pair rule (symmetric).
    bool pairQualifies(SoftRuleKind kind, int unitA, int unitB) const;

    /// All witnesses of one rule on a complete timetable.
    std::vector<Violation> evaluate(const ActiveRule& rule, const Timetable& tt) const;

    /// Sum of the witness costs of one rule.
    long long cost(const ActiveRule& rule, const Timetable& tt) const;

    /// Witnesses of every rule, in the order given.
    std::vector<Violation> evaluateAll(const std::vector<ActiveRule>& rules, const Timetable& tt) const;

private:
    const ConflictResolver& resolver_;
    const FactStore& facts_;
    const OptimizerConfig& config_;

    /// Course belongs to one of the configured science curricula.
    bool inScienceCurriculum(int course) const;

    /// Course is required and at or beyond the protected ideal semester.
    bool isProtectedRequired(int course) const;
};
