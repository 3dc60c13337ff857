///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "test_helpers.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
class FactStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        setLogLevel(LogLevel::OFF);
        inst.courses = {makeCourse("mac0110", 2, false, true, 1), makeCourse("mac0121", 2, false, true, 2)};
        inst.teachers = {makeTeacher("bob", {at(0, 0), at(0, 1), at(1, 0)}),
                         makeTeacher("alice", {at(0, 0), at(0, 1), at(1, 0)}),
                         makeTeacher("carol", {at(0, 0)})};
        inst.offerings = {makeOffering("mac0110", "bcc", {"bob", "alice"}),
                          makeOffering("mac0121", "bcc", {"carol"})};
    }

    ProblemInstance inst;
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(FactStoreTest, IndexesValidInput) {
    FactStore facts(inst);
    EXPECT_EQ(facts.courses().size(), 2u);
    EXPECT_EQ(facts.teachers().size(), 3u);
    ASSERT_EQ(facts.units().size(), 2u);
    EXPECT_EQ(facts.findUnit("mac0121", "bcc"), 1);
    EXPECT_EQ(facts.findUnit("mac0121", "bmac"), -1);
    EXPECT_EQ(facts.findTeacher("carol"), 2);
    EXPECT_EQ(facts.findCourse("mac9999"), -1);
    EXPECT_EQ(facts.unitLabel(0), "mac0110/bcc");
}

TEST_F(FactStoreTest, PrimaryLecturerTiesGoToSmallestId) {
    FactStore facts(inst);
    const UnitFacts& unit = facts.units()[0];
    ASSERT_EQ(unit.lecturers.size(), 2u);
    EXPECT_EQ(facts.teachers()[unit.lecturers[0]].id, "alice");
    EXPECT_EQ(facts.teachers()[unit.primaryLecturer].id, "alice");
}

TEST_F(FactStoreTest, PrimaryLecturerHasFewestSlots) {
    inst.offerings[0].teacherIds = {"alice", "carol"};
    FactStore facts(inst);
    EXPECT_EQ(facts.teachers()[facts.units()[0].primaryLecturer].id, "carol");
}

TEST_F(FactStoreTest, MissingAvailabilityMeansFullWeek) {
    inst.teachers.push_back(makeTeacher("dave", {}));
    FactStore facts(inst);
    EXPECT_EQ(facts.teachers()[facts.findTeacher("dave")].available, facts.slots().allSlots());
}

TEST_F(FactStoreTest, PreferredSlotsAreLimitedToAvailability) {
    inst.teachers.push_back(makeTeacher("erin", {at(0, 0), at(0, 1)}, {at(0, 1), at(4, 5)}));
    FactStore facts(inst);
    EXPECT_EQ(facts.teachers()[facts.findTeacher("erin")].preferred, facts.slots().bit(at(0, 1)));
}

TEST_F(FactStoreTest, DefaultScheduleOnIsMorningAndAfternoon) {
    inst.offerings[1].scheduleOn = partOfDayBit(PartOfDay::NIGHT);
    FactStore facts(inst);
    EXPECT_EQ(facts.units()[0].scheduleOn, FactStore::kDefaultScheduleOn);
    EXPECT_EQ(facts.units()[1].scheduleOn, partOfDayBit(PartOfDay::NIGHT));
}

TEST_F(FactStoreTest, RejectsDanglingReferences) {
    ProblemInstance unknownTeacher = inst;
    unknownTeacher.offerings[1].teacherIds = {"zed"};
    EXPECT_THROW(FactStore{unknownTeacher}, DataIntegrityError);

    ProblemInstance unknownCourse = inst;
    unknownCourse.offerings.push_back(makeOffering("mac9999", "bcc", {"bob"}));
    EXPECT_THROW(FactStore{unknownCourse}, DataIntegrityError);

    ProblemInstance unknownFixed = inst;
    unknownFixed.fixedMeetings.push_back(FixedMeeting{UnitKey{"mac0110", "bmac"}, at(0, 0)});
    EXPECT_THROW(FactStore{unknownFixed}, DataIntegrityError);
}

TEST_F(FactStoreTest, RejectsInvalidValues) {
    ProblemInstance noClasses = inst;
    noClasses.courses[0].numClasses = 0;
    EXPECT_THROW(FactStore{noClasses}, DataIntegrityError);

    ProblemInstance duplicateCourse = inst;
    duplicateCourse.courses.push_back(makeCourse("mac0110", 1));
    EXPECT_THROW(FactStore{duplicateCourse}, DataIntegrityError);

    ProblemInstance duplicateOffering = inst;
    duplicateOffering.offerings.push_back(makeOffering("mac0110", "bcc", {"bob"}));
    EXPECT_THROW(FactStore{duplicateOffering}, DataIntegrityError);

    ProblemInstance noLecturer = inst;
    noLecturer.offerings[0].teacherIds.clear();
    EXPECT_THROW(FactStore{noLecturer}, DataIntegrityError);

    ProblemInstance outsideGrid = inst;
    outsideGrid.teachers[0].available.push_back(at(5, 0));
    EXPECT_THROW(FactStore{outsideGrid}, DataIntegrityError);
}

TEST_F(FactStoreTest, RejectsTooManyFixedMeetings) {
    inst.fixedMeetings = {FixedMeeting{UnitKey{"mac0121", "bcc"}, at(0, 0)},
                          FixedMeeting{UnitKey{"mac0121", "bcc"}, at(1, 0)},
                          FixedMeeting{UnitKey{"mac0121", "bcc"}, at(2, 0)}};
    EXPECT_THROW(FactStore{inst}, DataIntegrityError);
}

TEST_F(FactStoreTest, FixedMeetingsAreRecorded) {
    inst.fixedMeetings = {FixedMeeting{UnitKey{"mac0121", "bcc"}, at(3, 4)}};
    FactStore facts(inst);
    EXPECT_EQ(facts.units()[1].fixed, facts.slots().bit(at(3, 4)));
    EXPECT_EQ(facts.units()[0].fixed, 0u);
}

TEST_F(FactStoreTest, CurriculaIgnoreCoursesNotOffered) {
    inst.curricula = {CurriculumMembership{"bcc", "mac0110", true},
                      CurriculumMembership{"bcc", "mac0121", false},
                      CurriculumMembership{"bcc", "mac0499", true},
                      CurriculumMembership{"statistics", "mac0121", false}};
    FactStore facts(inst);

    EXPECT_TRUE(facts.shareCurriculum(0, 1));
    EXPECT_TRUE(facts.inCurriculum(1, "statistics"));
    EXPECT_FALSE(facts.inCurriculum(0, "statistics"));
    EXPECT_TRUE(facts.isRequired(0));
    EXPECT_FALSE(facts.isRequired(1));
    EXPECT_EQ(facts.curriculaOf(1), (std::vector<std::string>{"bcc", "statistics"}));
}

TEST_F(FactStoreTest, RejectsDuplicateMembership) {
    inst.curricula = {CurriculumMembership{"bcc", "mac0110", true},
                      CurriculumMembership{"bcc", "mac0110", false}};
    EXPECT_THROW(FactStore{inst}, DataIntegrityError);
}
