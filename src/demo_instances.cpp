///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Every (day, period) combination of the given days and periods.
static std::vector<Slot> slotsIn(const std::vector<int>& days, const std::vector<int>& periods) {
    std::vector<Slot> out;
    for (int d : days)
        for (int p : periods)
            out.push_back(Slot{d, p});
    return out;
}

static const std::vector<int> kAllDays = {0, 1, 2, 3, 4};
static const std::vector<int> kDaytime = {0, 1, 2, 3};
static const std::vector<int> kMorning = {0, 1};
static const PartOfDayMask kNightOnly = 1u << 2;

static void addCourse(ProblemInstance& inst, const std::string& id, int numClasses, bool isDouble,
                      bool isUndergrad, int idealSemester) {
    Course c;
    c.id = id;
    c.numClasses = numClasses;
    c.isDouble = isDouble;
    c.isUndergrad = isUndergrad;
    c.idealSemester = idealSemester;
    inst.courses.push_back(c);
}

static void addOffering(ProblemInstance& inst, const std::string& course, const std::string& group,
                        std::vector<std::string> teachers, PartOfDayMask scheduleOn = 0) {
    OfferingGroup og;
    og.courseId = course;
    og.groupId = group;
    og.teacherIds = std::move(teachers);
    og.scheduleOn = scheduleOn;
    inst.offerings.push_back(og);
}

static void addMembership(ProblemInstance& inst, const std::string& curriculum, const std::string& course,
                          bool required) {
    inst.curricula.push_back(CurriculumMembership{curriculum, course, required});
}


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static ProblemInstance makeDemoSmall() {
    ProblemInstance inst;

    addCourse(inst, "mac0110", 2, false, true, 1);
    addCourse(inst, "mac0121", 2, false, true, 2);
    addCourse(inst, "mae0121", 2, false, true, 1);
    addCourse(inst, "mac0329", 2, true, true, 3);
    addCourse(inst, "mac5701", 1, false, false, 0);

    inst.teachers.push_back(Teacher{"alice", slotsIn(kAllDays, kDaytime), slotsIn({0, 2, 4}, kMorning)});
    inst.teachers.push_back(Teacher{"bob", slotsIn({0, 1, 2}, {0, 1, 2, 3, 4, 5}), {}});
    inst.teachers.push_back(Teacher{"carol", slotsIn(kAllDays, {0, 1, 2, 3, 4, 5}), slotsIn({1, 3}, kMorning)});
    // No availability data: treated as fully available.
    inst.teachers.push_back(Teacher{"dave", {}, {}});

    addOffering(inst, "mac0110", "bcc", {"alice"});
    addOffering(inst, "mac0110", "bmac", {"alice"});
    addOffering(inst, "mac0121", "bcc", {"bob"});
    addOffering(inst, "mae0121", "bcc", {"carol"});
    addOffering(inst, "mac0329", "bcc", {"dave"});
    addOffering(inst, "mac5701", "pos", {"carol", "bob"}, kNightOnly);

    inst.joints.push_back(JointPair{{"mac0110", "bcc"}, {"mac0110", "bmac"}});
    inst.fixedMeetings.push_back(FixedMeeting{{"mac5701", "pos"}, Slot{1, 4}});

    addMembership(inst, "bcc", "mac0110", true);
    addMembership(inst, "bcc", "mac0121", true);
    addMembership(inst, "bcc", "mae0121", true);
    addMembership(inst, "bcc", "mac0329", true);
    addMembership(inst, "bmac", "mac0110", true);
    addMembership(inst, "statistics", "mae0121", true);

    return inst;
}

///////////////////////////
///    DEMO: MEDIUM     ///
///////////////////////////
static ProblemInstance makeDemoMedium() {
    ProblemInstance inst = makeDemoSmall();

    addCourse(inst, "mat0111", 3, false, true, 1);
    addCourse(inst, "mat0122", 2, false, true, 2);
    addCourse(inst, "mae0228", 2, false, true, 3);
    addCourse(inst, "mac0323", 2, true, true, 3);
    addCourse(inst, "map2110", 2, false, true, 2);
    addCourse(inst, "mac6916", 2, false, false, 0);

    inst.teachers.push_back(Teacher{"erin", slotsIn({1, 2, 3, 4}, kDaytime), {}});
    inst.teachers.push_back(Teacher{"frank", slotsIn(kAllDays, kMorning), {}});
    inst.teachers.push_back(Teacher{"grace", slotsIn(kAllDays, {2, 3, 4, 5}), slotsIn({0, 1}, {2, 3})});

    addOffering(inst, "mat0111", "bcc", {"frank"});
    addOffering(inst, "mat0111", "bmac", {"frank"});
    addOffering(inst, "mat0111", "estat", {"erin"});
    addOffering(inst, "mat0122", "bcc", {"erin"});
    addOffering(inst, "mae0228", "estat", {"grace"});
    addOffering(inst, "mac0323", "bcc", {"alice", "dave"});
    addOffering(inst, "map2110", "bmac", {"grace"});
    addOffering(inst, "mac6916", "pos", {"bob"}, kNightOnly);

    inst.joints.push_back(JointPair{{"mat0111", "bcc"}, {"mat0111", "bmac"}});
    inst.fixedMeetings.push_back(FixedMeeting{{"mat0111", "estat"}, Slot{0, 0}});

    addMembership(inst, "bcc", "mat0111", true);
    addMembership(inst, "bcc", "mat0122", true);
    addMembership(inst, "bcc", "mac0323", true);
    addMembership(inst, "bmac", "mat0111", true);
    addMembership(inst, "bmac", "map2110", true);
    addMembership(inst, "statistics", "mat0111", true);
    addMembership(inst, "statistics", "mae0228", true);
    addMembership(inst, "sciences", "map2110", false);
    // Lists a course that is not offered this term.
    addMembership(inst, "bcc", "mac0499", false);

    return inst;
}

///////////////////////////
///     DEMO: LARGE     ///
///////////////////////////
/**
 * @brief Medium instance plus generated elective offerings.
 *
 * Electives rotate over the teachers and curricula so every teacher keeps
 * enough free slots.
 */
static ProblemInstance makeDemoLarge() {
    ProblemInstance inst = makeDemoMedium();

    const std::vector<std::string> curricula = {"bcc", "bmac", "statistics", "sciences"};

    for (int t = 0; t < 4; ++t) {
        std::vector<int> days = {t % 5, (t + 2) % 5, (t + 4) % 5};
        inst.teachers.push_back(Teacher{"lecturer" + std::to_string(t), slotsIn(days, kDaytime), {}});
    }

    for (int i = 0; i < 12; ++i) {
        std::string id = "mac04" + std::to_string(10 + i);
        addCourse(inst, id, 2, i % 4 == 3, true, 3 + i % 4);
        addOffering(inst, id, "bcc", {"lecturer" + std::to_string(i % 4)});
        addMembership(inst, curricula[i % curricula.size()], id, i % 3 == 0);
    }

    return inst;
}

///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
ProblemInstance makeDemoInstance(DemoSize size) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoMedium();
        case DemoSize::L: return makeDemoLarge();
    }
    return makeDemoSmall();
}
