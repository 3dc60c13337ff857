///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "test_helpers.hpp"
#include "assignment_engine.hpp"
#include "scheduler.hpp"
#include "demo_instances.hpp"
#include "sequential_solver.hpp"
#include "pool_solver.hpp"
#include "threaded_solver.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Records every complete timetable in search order.
 */
class RecordingListener : public SearchListener {
public:
    bool onSolution(const TimetableState& state, const std::vector<int>& path) override {
        solutions.push_back(state.groupSlots());
        paths.push_back(path);
        return true;
    }

    std::vector<std::vector<SlotSet>> solutions;
    std::vector<std::vector<int>> paths;
};

/// One teacher, two single-class courses, the teacher free only at the given slots.
ProblemInstance sharedTeacherInstance(const std::vector<Slot>& available) {
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0110", 1), makeCourse("mac0121", 1)};
    inst.teachers = {makeTeacher("alice", available)};
    inst.offerings = {makeOffering("mac0110", "bcc", {"alice"}), makeOffering("mac0121", "bcc", {"alice"})};
    return inst;
}

/**
 * @brief Check the hard constraints on a solved timetable.
 */
void expectHardConstraints(const ProblemInstance& inst, const TimetableSolution& sol) {
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    const SlotDomain& dom = facts.slots();

    ASSERT_EQ(sol.units.size(), facts.units().size());
    for (int u = 0; u < (int)facts.units().size(); ++u) {
        const UnitFacts& unit = facts.units()[u];
        const Course& course = facts.courseOf(u);

        std::vector<Slot> meetings = meetingsOf(sol, course.id, unit.groupId);
        EXPECT_EQ((int)meetings.size(), course.numClasses) << facts.unitLabel(u);
        EXPECT_EQ(slotCount(sol.timetable.slots[u]), course.numClasses) << facts.unitLabel(u);
        EXPECT_EQ(sol.timetable.slots[u] & unit.fixed, unit.fixed) << facts.unitLabel(u);

        SlotSet placed = sol.timetable.slots[u] & ~unit.fixed;
        const SlotSet legal = facts.teachers()[unit.primaryLecturer].available & dom.partOfDayMask(unit.scheduleOn);
        for (int v : resolver.groups()[resolver.groupOf(u)].units) {
            // Placed meetings are legal for every joint member.
            const UnitFacts& member = facts.units()[v];
            SlotSet memberLegal = facts.teachers()[member.primaryLecturer].available &
                                  dom.partOfDayMask(member.scheduleOn);
            EXPECT_EQ(placed & ~member.fixed & ~memberLegal, 0u) << facts.unitLabel(u);
        }
        EXPECT_EQ(placed & ~legal, 0u) << facts.unitLabel(u);

        if (course.isDouble) {
            std::vector<Slot> free = dom.slotsOf(placed);
            if (free.size() == 2) {
                EXPECT_EQ(free[0].day, free[1].day) << facts.unitLabel(u);
                EXPECT_EQ(free[1].period - free[0].period, 1) << facts.unitLabel(u);
            }
        }
    }

    // Meetings sharing a teacher never share a slot unless their units are joint.
    for (int a = 0; a < (int)facts.units().size(); ++a) {
        for (int b = a + 1; b < (int)facts.units().size(); ++b) {
            if (resolver.areJoint(a, b)) {
                EXPECT_EQ(sol.timetable.slots[a], sol.timetable.slots[b]);
                continue;
            }
            const auto& la = facts.units()[a].lecturers;
            const auto& lb = facts.units()[b].lecturers;
            bool shared = false;
            for (int t : la)
                for (int s : lb)
                    shared = shared || t == s;
            if (shared) {
                EXPECT_EQ(sol.timetable.slots[a] & sol.timetable.slots[b], 0u)
                        << facts.unitLabel(a) << " vs " << facts.unitLabel(b);
            }
        }
    }
}

} // namespace


///////////////////////////
///    SEARCH SPACE     ///
///////////////////////////
TEST(SearchSpaceTest, EnumeratesCombinationsOfAllowedSlots) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0110", 2)};
    inst.teachers = {makeTeacher("alice", {at(0, 0), at(0, 1), at(1, 0), at(1, 4)})};
    inst.offerings = {makeOffering("mac0110", "bcc", {"alice"})};

    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);

    // Night period 4 is outside the default parts of day.
    ASSERT_EQ(space.domain(0).size(), 3u);
    for (SlotSet cand : space.domain(0)) EXPECT_EQ(slotCount(cand), 2);
    EXPECT_FALSE(space.hasEmptyDomain());
}

TEST(SearchSpaceTest, DoubleCoursesUseAdjacentPeriods) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0329", 2, true)};
    inst.teachers = {makeTeacher("dave", {})};
    inst.offerings = {makeOffering("mac0329", "bcc", {"dave"})};

    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);

    // Periods 0-3 on each of five days: pairs (0,1), (1,2), (2,3).
    ASSERT_EQ(space.domain(0).size(), 15u);
    for (SlotSet cand : space.domain(0)) {
        std::vector<Slot> slots = facts.slots().slotsOf(cand);
        ASSERT_EQ(slots.size(), 2u);
        EXPECT_EQ(slots[0].day, slots[1].day);
        EXPECT_EQ(slots[1].period, slots[0].period + 1);
    }
}

TEST(SearchSpaceTest, FullyFixedGroupHasSingleEmptyCandidate) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst;
    inst.courses = {makeCourse("mac5701", 1)};
    inst.teachers = {makeTeacher("bob", {at(0, 0)})};
    inst.offerings = {makeOffering("mac5701", "pos", {"bob"})};
    inst.fixedMeetings = {FixedMeeting{UnitKey{"mac5701", "pos"}, at(3, 5)}};

    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);

    ASSERT_EQ(space.domain(0).size(), 1u);
    EXPECT_EQ(space.domain(0)[0], 0u);
    EXPECT_EQ(space.fullSlots(0, 0), facts.slots().bit(at(3, 5)));
}

TEST(SearchSpaceTest, ReportsEmptyDomains) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0329", 2, true), makeCourse("mac0110", 3)};
    inst.teachers = {makeTeacher("dave", {at(0, 0), at(0, 2), at(1, 1)})};
    inst.offerings = {makeOffering("mac0329", "bcc", {"dave"}), makeOffering("mac0110", "bcc", {"dave"}, anyTime())};

    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);

    EXPECT_TRUE(space.domain(0).empty());
    EXPECT_EQ(space.domain(1).size(), 1u);
    EXPECT_TRUE(space.hasEmptyDomain());
    ASSERT_EQ(space.emptyDomainReasons().size(), 1u);
    EXPECT_NE(space.emptyDomainReasons()[0].find("mac0329/bcc"), std::string::npos);
}


///////////////////////////
///       ENGINE        ///
///////////////////////////
TEST(AssignmentEngineTest, EnumeratesEveryValidTimetable) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst = sharedTeacherInstance({at(0, 0), at(1, 0)});
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);
    SearchLimits limits(SearchBudget{0, 0, 0});
    AssignmentEngine engine(space, limits);

    RecordingListener listener;
    SearchOutcome outcome = engine.run(listener);

    EXPECT_TRUE(outcome.exhausted);
    ASSERT_EQ(outcome.solutions, 2);
    for (const auto& slots : listener.solutions) {
        EXPECT_EQ(slots[0] & slots[1], 0u);
        EXPECT_EQ(slots[0] | slots[1], facts.slots().toSet({at(0, 0), at(1, 0)}));
    }
    // Depth-first order is the order of the path keys.
    EXPECT_LT(pathCompare(listener.paths[0], listener.paths[1]), 0);
    EXPECT_EQ(limits.candidates(), 2);
}

TEST(AssignmentEngineTest, RootSelectorPartitionsTheTree) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst = sharedTeacherInstance({at(0, 0), at(1, 0), at(2, 0)});
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);
    SearchLimits limits(SearchBudget{0, 0, 0});
    AssignmentEngine engine(space, limits);
    ASSERT_EQ(engine.rootBranchCount(), 3);

    RecordingListener all;
    engine.run(all);

    // Two engines sharing the tree by even and odd root branches.
    long long total = 0;
    for (int offset = 0; offset < 2; ++offset) {
        int next = offset;
        AssignmentEngine::RootSelector selector = [&next]() {
            int b = next;
            next += 2;
            return b < 3 ? b : -1;
        };
        RecordingListener part;
        SearchOutcome outcome = engine.run(part, selector);
        EXPECT_TRUE(outcome.exhausted);
        total += outcome.solutions;
    }
    EXPECT_EQ(total, (long long)all.solutions.size());
    EXPECT_EQ(total, 6);
}

TEST(AssignmentEngineTest, NodeBudgetStopsTheSearch) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst = sharedTeacherInstance({at(0, 0), at(1, 0), at(2, 0)});
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);
    SearchLimits limits(SearchBudget{0, 0, 1});
    AssignmentEngine engine(space, limits);

    RecordingListener listener;
    SearchOutcome outcome = engine.run(listener);
    EXPECT_FALSE(outcome.exhausted);
    EXPECT_TRUE(limits.budgetExpired());
    EXPECT_TRUE(listener.solutions.empty());
}

TEST(AssignmentEngineTest, DiagnosesOverloadedTeacher) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst = sharedTeacherInstance({at(0, 0)});
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);
    SearchLimits limits(SearchBudget{0, 0, 0});
    AssignmentEngine engine(space, limits);

    std::vector<std::string> reasons = engine.diagnose();
    bool mentionsTeacher = false;
    for (const std::string& r : reasons) mentionsTeacher = mentionsTeacher || r.find("'alice'") != std::string::npos;
    EXPECT_TRUE(mentionsTeacher);
}

TEST(AssignmentEngineTest, ClashingFixedMeetingsAreDeadAtRoot) {
    setLogLevel(LogLevel::OFF);
    ProblemInstance inst = sharedTeacherInstance({at(0, 0), at(1, 0)});
    inst.fixedMeetings = {FixedMeeting{UnitKey{"mac0110", "bcc"}, at(2, 2)},
                          FixedMeeting{UnitKey{"mac0121", "bcc"}, at(2, 2)}};
    FactStore facts(inst);
    ConflictResolver resolver(facts);
    SearchSpace space(resolver);
    SearchLimits limits(SearchBudget{0, 0, 0});
    AssignmentEngine engine(space, limits);

    EXPECT_TRUE(engine.deadAtRoot());
    RecordingListener listener;
    EXPECT_TRUE(engine.run(listener).exhausted);
    EXPECT_TRUE(listener.solutions.empty());
    EXPECT_FALSE(engine.diagnose().empty());
}


///////////////////////////
///     SCENARIOS       ///
///////////////////////////
TEST(HardConstraintScenarioTest, SharedTeacherUsesDifferentDays) {
    ProblemInstance inst = sharedTeacherInstance({at(0, 0), at(1, 0)});
    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, emptyConfig(), solver);

    ASSERT_EQ(result.status, SolveStatus::OPTIMAL);
    ASSERT_TRUE(result.solution.has_value());
    std::vector<Slot> a = meetingsOf(*result.solution, "mac0110", "bcc");
    std::vector<Slot> b = meetingsOf(*result.solution, "mac0121", "bcc");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_NE(a[0].day, b[0].day);
    EXPECT_TRUE(result.solution->conflicts.empty());
}

TEST(HardConstraintScenarioTest, SharedTeacherWithOneSlotIsInfeasible) {
    ProblemInstance inst = sharedTeacherInstance({at(0, 0)});
    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, emptyConfig(), solver);

    EXPECT_EQ(result.status, SolveStatus::INFEASIBLE);
    EXPECT_FALSE(result.solution.has_value());
    EXPECT_FALSE(result.diagnostics.empty());
}

TEST(HardConstraintScenarioTest, DoubleCourseTakesBothAdjacentPeriods) {
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0329", 2, true)};
    inst.teachers = {makeTeacher("dave", {at(0, 0), at(0, 1)})};
    inst.offerings = {makeOffering("mac0329", "bcc", {"dave"})};

    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, defaultConfig(), solver);

    ASSERT_EQ(result.status, SolveStatus::OPTIMAL);
    std::vector<Slot> slots = meetingsOf(*result.solution, "mac0329", "bcc");
    EXPECT_EQ(slots, (std::vector<Slot>{at(0, 0), at(0, 1)}));
}

TEST(HardConstraintScenarioTest, DoubleCourseWithoutAdjacentPeriodsIsInfeasible) {
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0329", 2, true)};
    inst.teachers = {makeTeacher("dave", {at(0, 0), at(0, 2), at(1, 1)})};
    inst.offerings = {makeOffering("mac0329", "bcc", {"dave"})};

    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, emptyConfig(), solver);
    EXPECT_EQ(result.status, SolveStatus::INFEASIBLE);
    ASSERT_FALSE(result.diagnostics.empty());
    EXPECT_NE(result.diagnostics[0].find("double"), std::string::npos);
}

TEST(HardConstraintScenarioTest, DemoTimetablesSatisfyHardConstraints) {
    for (DemoSize size : {DemoSize::S, DemoSize::M, DemoSize::L}) {
        ProblemInstance inst = makeDemoInstance(size);
        SequentialBacktrackingSolver solver;
        SolveResult result = scheduleTimetable(inst, emptyConfig(), solver);

        ASSERT_EQ(result.status, SolveStatus::OPTIMAL);
        ASSERT_TRUE(result.solution.has_value());
        expectHardConstraints(inst, *result.solution);

        int fixed = 0;
        for (const ClassMeeting& m : result.solution->meetings) fixed += m.fixed ? 1 : 0;
        EXPECT_EQ(fixed, (int)inst.fixedMeetings.size());
    }
}

TEST(HardConstraintScenarioTest, BudgetedDemoTimetableSatisfiesHardConstraints) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    OptimizerConfig config = defaultConfig();
    config.logLevel = LogLevel::ERROR;
    config.budget.maxTimeSeconds = 0;
    config.budget.maxNodes = 5000;

    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, config, solver);

    ASSERT_TRUE(result.status == SolveStatus::OPTIMAL || result.status == SolveStatus::FEASIBLE_UNPROVEN);
    ASSERT_TRUE(result.solution.has_value());
    expectHardConstraints(inst, *result.solution);
    EXPECT_LE(result.stats.nodes, 5001);
}


///////////////////////////
///       BUDGETS       ///
///////////////////////////
TEST(BudgetTest, ExpiryBeforeAnyTimetableIsUnknown) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    OptimizerConfig config = defaultConfig();
    config.logLevel = LogLevel::ERROR;
    config.budget.maxNodes = 1;

    SequentialBacktrackingSolver solver;
    SolveResult result = scheduleTimetable(inst, config, solver);
    EXPECT_EQ(result.status, SolveStatus::UNKNOWN);
    EXPECT_FALSE(result.solution.has_value());
}

TEST(BudgetTest, ExpiryAfterATimetableIsFeasibleUnproven) {
    ProblemInstance inst = makeDemoInstance(DemoSize::M);
    OptimizerConfig config = defaultConfig();
    config.logLevel = LogLevel::ERROR;
    config.budget.maxCandidates = 1;

    CandidatePoolSolver solver(/*poolSize=*/0);
    SolveResult result = scheduleTimetable(inst, config, solver);
    EXPECT_EQ(result.status, SolveStatus::FEASIBLE_UNPROVEN);
    ASSERT_TRUE(result.solution.has_value());
    expectHardConstraints(inst, *result.solution);
}

TEST(BudgetTest, UnlimitedPoolStopsAtTheTimeLimit) {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    OptimizerConfig config = defaultConfig();
    config.logLevel = LogLevel::ERROR;
    config.budget.maxTimeSeconds = 1.0;

    CandidatePoolSolver solver(/*poolSize=*/0);
    auto start = std::chrono::steady_clock::now();
    SolveResult result = scheduleTimetable(inst, config, solver);
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(result.status == SolveStatus::OPTIMAL || result.status == SolveStatus::FEASIBLE_UNPROVEN);
    ASSERT_TRUE(result.solution.has_value());
    expectHardConstraints(inst, *result.solution);
    EXPECT_GT(result.stats.candidates, 0);
    EXPECT_LT(seconds, 6.0);
}

TEST(BudgetTest, TimeLimitCoversCandidateEnumeration) {
    // C(30, 10) candidate slot sets: far more than can be listed in the budget.
    ProblemInstance inst;
    inst.courses = {makeCourse("mac0110", 10)};
    inst.teachers = {makeTeacher("alice", {})};
    inst.offerings = {makeOffering("mac0110", "bcc", {"alice"}, anyTime())};
    OptimizerConfig config = emptyConfig();
    config.budget.maxTimeSeconds = 0.2;

    SequentialBacktrackingSolver solver;
    auto start = std::chrono::steady_clock::now();
    SolveResult result = scheduleTimetable(inst, config, solver);
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.status, SolveStatus::UNKNOWN);
    EXPECT_FALSE(result.solution.has_value());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].find("enumerating"), std::string::npos);
    EXPECT_EQ(result.stats.nodes, 0);
    EXPECT_LT(seconds, 5.0);
}

TEST(BudgetTest, ThreadedWorkersStopAtTheTimeLimit) {
    // Twelve two-meeting courses of one curriculum squeezed into the ten
    // morning slots: collisions are unavoidable and the optimum cannot be
    // proven within the budget, while a first timetable is immediate.
    ProblemInstance inst;
    for (int c = 0; c < 12; ++c) {
        std::string course = "mac01" + std::to_string(10 + c);
        std::string teacher = "lecturer" + std::to_string(c);
        inst.courses.push_back(makeCourse(course, 2));
        inst.teachers.push_back(makeTeacher(teacher, {}));
        inst.offerings.push_back(makeOffering(course, "bcc", {teacher}, partOfDayBit(PartOfDay::MORNING)));
        inst.curricula.push_back(CurriculumMembership{"bcc", course, true});
    }
    OptimizerConfig config = singleRuleConfig("curriculum_conflict", 1);
    config.budget.maxTimeSeconds = 0.5;
    config.threads = 4;

    ThreadedBacktrackingSolver solver;
    auto start = std::chrono::steady_clock::now();
    SolveResult result = scheduleTimetable(inst, config, solver);
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.status, SolveStatus::FEASIBLE_UNPROVEN);
    ASSERT_TRUE(result.solution.has_value());
    expectHardConstraints(inst, *result.solution);
    EXPECT_EQ(result.stats.workers, 4);
    EXPECT_GE(result.solution->layerCosts[0], 18);
    EXPECT_LT(seconds, 5.0);
}

TEST(BudgetTest, StatusNames) {
    EXPECT_STREQ(statusName(SolveStatus::OPTIMAL), "optimal");
    EXPECT_STREQ(statusName(SolveStatus::FEASIBLE_UNPROVEN), "feasible-unproven-optimal");
    EXPECT_STREQ(statusName(SolveStatus::INFEASIBLE), "infeasible");
    EXPECT_STREQ(statusName(SolveStatus::UNKNOWN), "unknown");
}

TEST(BudgetTest, ClassifyOutcome) {
    EXPECT_EQ(classifyOutcome(true, true), SolveStatus::OPTIMAL);
    EXPECT_EQ(classifyOutcome(true, false), SolveStatus::INFEASIBLE);
    EXPECT_EQ(classifyOutcome(false, true), SolveStatus::FEASIBLE_UNPROVEN);
    EXPECT_EQ(classifyOutcome(false, false), SolveStatus::UNKNOWN);
}
