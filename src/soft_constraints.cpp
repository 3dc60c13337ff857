///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "soft_constraints.hpp"
#include <cstdlib>


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
SoftConstraintEvaluator::SoftConstraintEvaluator(const ConflictResolver& resolver, const OptimizerConfig& config)
        : resolver_(resolver),
          facts_(resolver.facts()),
          config_(config) {}

bool SoftConstraintEvaluator::isPairRule(SoftRuleKind kind) {
    return kind == SoftRuleKind::CURRICULUM_CONFLICT ||
           kind == SoftRuleKind::SCIENCE_STATISTICS_CONFLICT;
}

long long SoftConstraintEvaluator::unitWitnesses(SoftRuleKind kind, int unit, SlotSet slots, SlotSet fixed,
                                                 long long weight, std::vector<Violation>* out) const {
    const SlotDomain& dom = facts_.slots();
    const SlotSet morning = dom.partOfDayMask(partOfDayBit(PartOfDay::MORNING));
    long long count = 0;

    auto emit = [&](std::vector<Slot> where, const std::string& detail) {
        ++count;
        if (out) out->push_back(Violation{kind, {unit}, std::move(where), detail, weight});
    };

    switch (kind) {
        case SoftRuleKind::NON_MORNING_CLASS: {
            for (const Slot& s : dom.slotsOf(slots & ~morning)) emit({s}, "");
            break;
        }
        case SoftRuleKind::DIFFERENT_PARTS_OF_DAY: {
            int parts = 0;
            for (PartOfDay p : {PartOfDay::MORNING, PartOfDay::AFTERNOON, PartOfDay::NIGHT}) {
                if (slots & dom.partOfDayMask(partOfDayBit(p))) ++parts;
            }
            if (parts > 1) emit(dom.slotsOf(slots), "");
            break;
        }
        case SoftRuleKind::FRIDAY_AFTERNOON: {
            if (!facts_.courseOf(unit).isUndergrad) break;
            SlotSet late = slots & ~fixed & dom.dayMask(DAYS - 1) & ~morning;
            for (const Slot& s : dom.slotsOf(late)) emit({s}, "");
            break;
        }
        case SoftRuleKind::TEACHER_PREFERENCE: {
            // Teachers that stated no preference are indifferent.
            for (int t : facts_.units()[unit].lecturers) {
                const TeacherFacts& teacher = facts_.teachers()[t];
                if (teacher.preferred == 0) continue;
                for (const Slot& s : dom.slotsOf(slots & ~fixed & ~teacher.preferred)) emit({s}, teacher.id);
            }
            break;
        }
        case SoftRuleKind::MAX_SPACING: {
            std::vector<Slot> list = dom.slotsOf(slots);
            for (size_t i = 0; i < list.size(); ++i) {
                for (size_t j = i + 1; j < list.size(); ++j) {
                    if (std::abs(list[i].day - list[j].day) > config_.maxSpacingDays) emit({list[i], list[j]}, "");
                }
            }
            break;
        }
        case SoftRuleKind::CURRICULUM_CONFLICT:
        case SoftRuleKind::SCIENCE_STATISTICS_CONFLICT:
            break;
    }
    return count;
}

bool SoftConstraintEvaluator::pairQualifies(SoftRuleKind kind, int unitA, int unitB) const {
    if (resolver_.areJoint(unitA, unitB)) return false;
    int ca = facts_.units()[unitA].course;
    int cb = facts_.units()[unitB].course;

    switch (kind) {
        case SoftRuleKind::CURRICULUM_CONFLICT:
            return facts_.shareCurriculum(ca, cb);
        case SoftRuleKind::SCIENCE_STATISTICS_CONFLICT:
            if (ca == cb) return false;
            return (inScienceCurriculum(ca) && isProtectedRequired(cb)) ||
                   (inScienceCurriculum(cb) && isProtectedRequired(ca));
        default:
            return false;
    }
}

bool SoftConstraintEvaluator::inScienceCurriculum(int course) const {
    for (const std::string& name : config_.scienceCurricula) {
        if (facts_.inCurriculum(course, name)) return true;
    }
    return false;
}

bool SoftConstraintEvaluator::isProtectedRequired(int course) const {
    return facts_.isRequired(course) &&
           facts_.courses()[course].idealSemester >= config_.scienceMinSemester;
}

/**
 * @brief Evaluate one rule over a complete timetable.
 *
 * Pair rules visit each unordered unit pair once and report it in
 * canonical orientation, so a conflict is never charged twice.
 */
std::vector<Violation> SoftConstraintEvaluator::evaluate(const ActiveRule& rule, const Timetable& tt) const {
    std::vector<Violation> out;
    int n = (int)tt.slots.size();

    if (!isPairRule(rule.kind)) {
        for (int u = 0; u < n; ++u) {
            unitWitnesses(rule.kind, u, tt.slots[u], tt.fixed[u], rule.weight, &out);
        }
        return out;
    }

    const SlotDomain& dom = facts_.slots();
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            SlotSet common = tt.slots[a] & tt.slots[b];
            if (!common || !pairQualifies(rule.kind, a, b)) continue;
            std::pair<int, int> p = resolver_.orderedPair(a, b);
            for (const Slot& s : dom.slotsOf(common)) {
                out.push_back(Violation{rule.kind, {p.first, p.second}, {s}, "", rule.weight});
            }
        }
    }
    return out;
}

long long SoftConstraintEvaluator::cost(const ActiveRule& rule, const Timetable& tt) const {
    long long total = 0;
    for (const Violation& v : evaluate(rule, tt)) total += v.cost;
    return total;
}

std::vector<Violation> SoftConstraintEvaluator::evaluateAll(const std::vector<ActiveRule>& rules,
                                                            const Timetable& tt) const {
    std::vector<Violation> out;
    for (const ActiveRule& rule : rules) {
        std::vector<Violation> part = evaluate(rule, tt);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}
