#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <string>
#include <vector>


///////////////////////////
///      TIME GRID      ///
///////////////////////////
// Time grid: 5 weekdays × 6 periods (two per part of day)
static constexpr int DAYS = 5;
static constexpr int PERIODS_PER_DAY = 6;
static constexpr int NUM_SLOTS = DAYS * PERIODS_PER_DAY;

/// Bit i set <=> slot with index i (day * PERIODS_PER_DAY + period) is in the set.
using SlotSet = std::uint32_t;

/**
 * @brief A single (weekday, period) cell of the weekly timetable.
 */
struct Slot {
    int day; ///< Weekday index (0 = Monday .. 4 = Friday).
    int period; ///< Period index within the day (0..PERIODS_PER_DAY-1).

    bool operator==(const Slot& other) const { return day == other.day && period == other.period; }
    bool operator!=(const Slot& other) const { return !(*this == other); }
    bool operator<(const Slot& other) const {
        return day != other.day ? day < other.day : period < other.period;
    }
};

/**
 * @brief Coarse classification of a period.
 */
enum class PartOfDay { MORNING = 0, AFTERNOON = 1, NIGHT = 2 };

/// Bit (1 << PartOfDay) set <=> that part of day is allowed.
using PartOfDayMask = unsigned;

inline PartOfDayMask partOfDayBit(PartOfDay p) { return 1u << static_cast<unsigned>(p); }


///////////////////////////
///     INPUT FACTS     ///
///////////////////////////
/**
 * @brief A course of the department catalogue.
 */
struct Course {
    std::string id; ///< Unique course identifier (e.g., "mac0110").
    int numClasses = 1; ///< Weekly meetings every offering group needs.
    bool isDouble = false; ///< Meetings must be scheduled in consecutive periods.
    bool isUndergrad = false; ///< Undergraduate course.
    int idealSemester = 0; ///< Ideal semester for a student (0 = none).
};

/**
 * @brief Availability and time preferences of a teacher.
 *
 * An empty available list means no availability data was supplied; the
 * teacher is then treated as fully available.
 */
struct Teacher {
    std::string id; ///< Unique teacher identifier.
    std::vector<Slot> available; ///< Slots the teacher can teach in.
    std::vector<Slot> preferred; ///< Preferred teaching slots (may be empty).
};

/**
 * @brief One offering of a course, the unit that actually gets scheduled.
 */
struct OfferingGroup {
    std::string courseId; ///< Course being offered.
    std::string groupId; ///< Offering group identifier (e.g., "bcc").
    std::vector<std::string> teacherIds; ///< Lecturers of this offering (at least one).
    /// Parts of day classes may be placed in; 0 selects morning + afternoon.
    PartOfDayMask scheduleOn = 0;
};

/**
 * @brief Identifies an offering group by its (course, group) pair.
 */
struct UnitKey {
    std::string courseId;
    std::string groupId;
};

/**
 * @brief Two offering groups that must be taught together in the same slots.
 */
struct JointPair {
    UnitKey a;
    UnitKey b;
};

/**
 * @brief A class meeting pinned by the user.
 */
struct FixedMeeting {
    UnitKey unit;
    Slot slot;
};

/**
 * @brief Membership of a course in a curriculum.
 */
struct CurriculumMembership {
    std::string curriculumId;
    std::string courseId;
    bool required = false; ///< Course is obligatory in this curriculum.
};

/**
 * @brief Complete set of raw scheduling facts for one term.
 *
 * Produced by the ingestion collaborator; validated and indexed by FactStore.
 */
struct ProblemInstance {
    std::vector<Course> courses;
    std::vector<Teacher> teachers;
    std::vector<OfferingGroup> offerings;
    std::vector<JointPair> joints;
    std::vector<FixedMeeting> fixedMeetings;
    std::vector<CurriculumMembership> curricula;
};


///////////////////////////
///       OUTPUT        ///
///////////////////////////
/**
 * @brief One scheduled weekly meeting of an offering group.
 */
struct ClassMeeting {
    std::string courseId;
    std::string groupId;
    Slot slot;
    bool fixed; ///< Pinned by the user rather than placed by the engine.
};
