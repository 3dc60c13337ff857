#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "slot_domain.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///     FACT STORE      ///
///////////////////////////
/**
 * @brief Validated teacher data with availability resolved to slot sets.
 */
struct TeacherFacts {
    std::string id;
    SlotSet available; ///< Never empty: missing data means full availability.
    SlotSet preferred; ///< Subset of the grid; empty means no preference given.
};

/**
 * @brief Validated offering group (course, group) with resolved references.
 */
struct UnitFacts {
    int index; ///< Position in FactStore::units().
    int course; ///< Index into FactStore::courses().
    std::string groupId;
    std::vector<int> lecturers; ///< Teacher indices, sorted by teacher id.
    int primaryLecturer; ///< Lecturer with the fewest available slots (ties: smallest id).
    PartOfDayMask scheduleOn; ///< Allowed parts of day (default already applied).
    SlotSet fixed; ///< Slots pinned by the user.
};

/**
 * @brief Read-only, normalized view of all scheduling inputs.
 *
 * Construction validates the ProblemInstance and throws DataIntegrityError
 * on dangling references, duplicates or out-of-range values. Once built the
 * store is never mutated and may be shared by all search workers.
 */
class FactStore {
public:
    /// Parts of day used when an offering does not restrict them.
    static constexpr PartOfDayMask kDefaultScheduleOn = (1u << 0) | (1u << 1);

    explicit FactStore(const ProblemInstance& inst);

    const SlotDomain& slots() const { return slots_; }

    const std::vector<Course>& courses() const { return courses_; }
    const std::vector<TeacherFacts>& teachers() const { return teachers_; }
    const std::vector<UnitFacts>& units() const { return units_; }

    /// Joint pairs as supplied; resolved (and checked) by ConflictResolver.
    const std::vector<JointPair>& jointPairs() const { return joints_; }

    /// @return Index of the course, or -1 if unknown.
    int findCourse(const std::string& courseId) const;

    /// @return Index of the teacher, or -1 if unknown.
    int findTeacher(const std::string& teacherId) const;

    /// @return Index of the unit, or -1 if unknown.
    int findUnit(const std::string& courseId, const std::string& groupId) const;

    const Course& courseOf(int unit) const { return courses_[units_[unit].course]; }

    /// "course/group" label used in reports and messages.
    std::string unitLabel(int unit) const;

    /// True if both courses belong to at least one common curriculum.
    bool shareCurriculum(int courseA, int courseB) const;

    /// True if the course belongs to the named curriculum.
    bool inCurriculum(int course, const std::string& curriculumId) const;

    /// True if the course is required in at least one curriculum.
    bool isRequired(int course) const;

    /// Curricula the course belongs to, sorted.
    const std::vector<std::string>& curriculaOf(int course) const { return curricula_[course]; }

private:
    SlotDomain slots_;
    std::vector<Course> courses_;
    std::vector<TeacherFacts> teachers_;
    std::vector<UnitFacts> units_;
    std::vector<JointPair> joints_;

    std::map<std::string, int> courseIndex_;
    std::map<std::string, int> teacherIndex_;
    std::map<std::pair<std::string, std::string>, int> unitIndex_;

    /// curricula_[course] = sorted curriculum ids the course belongs to.
    std::vector<std::vector<std::string>> curricula_;

    /// required_[course] = required in some curriculum.
    std::vector<bool> required_;

    void loadCourses(const ProblemInstance& inst);
    void loadTeachers(const ProblemInstance& inst);
    void loadUnits(const ProblemInstance& inst);
    void loadFixedMeetings(const ProblemInstance& inst);
    void loadCurricula(const ProblemInstance& inst);
};
