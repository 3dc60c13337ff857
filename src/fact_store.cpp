///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fact_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>


///////////////////////////
///     FACT STORE      ///
///////////////////////////
/**
 * @brief Validate and index a raw problem instance.
 *
 * Order matters: units reference courses and teachers, fixed meetings
 * reference units, curricula reference courses.
 */
FactStore::FactStore(const ProblemInstance& inst) {
    loadCourses(inst);
    loadTeachers(inst);
    loadUnits(inst);
    loadFixedMeetings(inst);
    loadCurricula(inst);
    joints_ = inst.joints;
}

void FactStore::loadCourses(const ProblemInstance& inst) {
    for (const Course& c : inst.courses) {
        if (c.id.empty())
            throw DataIntegrityError("course with empty id");
        if (c.numClasses <= 0)
            throw DataIntegrityError("course '" + c.id + "' must have num_classes > 0");
        if (c.idealSemester < 0)
            throw DataIntegrityError("course '" + c.id + "' has a negative ideal semester");
        if (!courseIndex_.emplace(c.id, (int)courses_.size()).second)
            throw DataIntegrityError("duplicate course '" + c.id + "'");
        courses_.push_back(c);
    }
    curricula_.assign(courses_.size(), {});
    required_.assign(courses_.size(), false);
}

/**
 * @brief Resolve availability lists into slot sets.
 *
 * A teacher without availability data is treated as fully available, as the
 * ingestion side does for teachers missing from the schedules sheet.
 * Preferred slots the teacher is not available in are dropped.
 */
void FactStore::loadTeachers(const ProblemInstance& inst) {
    for (const Teacher& t : inst.teachers) {
        if (t.id.empty())
            throw DataIntegrityError("teacher with empty id");
        for (const Slot& s : t.available) {
            if (!slots_.contains(s))
                throw DataIntegrityError("teacher '" + t.id + "' has an available slot outside the weekly grid");
        }
        for (const Slot& s : t.preferred) {
            if (!slots_.contains(s))
                throw DataIntegrityError("teacher '" + t.id + "' has a preferred slot outside the weekly grid");
        }
        if (!teacherIndex_.emplace(t.id, (int)teachers_.size()).second)
            throw DataIntegrityError("duplicate teacher '" + t.id + "'");

        TeacherFacts facts;
        facts.id = t.id;
        facts.available = slots_.toSet(t.available);
        if (facts.available == 0) {
            logWarn("No availability for teacher '" + t.id + "', using full availability.");
            facts.available = slots_.allSlots();
        }
        facts.preferred = slots_.toSet(t.preferred);
        if (facts.preferred & ~facts.available) {
            logWarn("Teacher '" + t.id + "' prefers slots outside their availability, ignoring them.");
            facts.preferred &= facts.available;
        }
        teachers_.push_back(facts);
    }
}

/**
 * @brief Resolve offering groups and elect their primary lecturer.
 *
 * The primary lecturer is the one with the fewest available slots; equal
 * counts are broken by the lexicographically smallest teacher id.
 */
void FactStore::loadUnits(const ProblemInstance& inst) {
    for (const OfferingGroup& og : inst.offerings) {
        int course = findCourse(og.courseId);
        if (course < 0)
            throw DataIntegrityError("offering '" + og.courseId + "/" + og.groupId + "' references unknown course");
        if (og.groupId.empty())
            throw DataIntegrityError("offering of course '" + og.courseId + "' has an empty group id");
        if (og.teacherIds.empty())
            throw DataIntegrityError("offering '" + og.courseId + "/" + og.groupId + "' has no lecturer");

        UnitFacts unit;
        unit.index = (int)units_.size();
        unit.course = course;
        unit.groupId = og.groupId;
        unit.scheduleOn = og.scheduleOn == 0 ? kDefaultScheduleOn : og.scheduleOn;
        unit.fixed = 0;

        std::set<int> lecturers;
        for (const std::string& tid : og.teacherIds) {
            int t = findTeacher(tid);
            if (t < 0)
                throw DataIntegrityError("offering '" + og.courseId + "/" + og.groupId +
                                         "' names unknown teacher '" + tid + "'");
            lecturers.insert(t);
        }
        unit.lecturers.assign(lecturers.begin(), lecturers.end());
        std::sort(unit.lecturers.begin(), unit.lecturers.end(), [this](int a, int b) {
            return teachers_[a].id < teachers_[b].id;
        });

        unit.primaryLecturer = unit.lecturers.front();
        for (int t : unit.lecturers) {
            // Lecturers are in id order, so strict < keeps the smallest id on ties.
            if (slotCount(teachers_[t].available) < slotCount(teachers_[unit.primaryLecturer].available))
                unit.primaryLecturer = t;
        }

        if (!unitIndex_.emplace(std::make_pair(og.courseId, og.groupId), unit.index).second)
            throw DataIntegrityError("duplicate offering '" + og.courseId + "/" + og.groupId + "'");
        units_.push_back(unit);
    }
}

void FactStore::loadFixedMeetings(const ProblemInstance& inst) {
    for (const FixedMeeting& fm : inst.fixedMeetings) {
        int u = findUnit(fm.unit.courseId, fm.unit.groupId);
        std::string label = fm.unit.courseId + "/" + fm.unit.groupId;
        if (u < 0)
            throw DataIntegrityError("fixed meeting references unknown offering '" + label + "'");
        if (!slots_.contains(fm.slot))
            throw DataIntegrityError("fixed meeting of '" + label + "' lies outside the weekly grid");
        SlotSet b = slots_.bit(fm.slot);
        if (units_[u].fixed & b)
            throw DataIntegrityError("duplicate fixed meeting for '" + label + "'");
        units_[u].fixed |= b;
        if (slotCount(units_[u].fixed) > courseOf(u).numClasses)
            throw DataIntegrityError("'" + label + "' has more fixed meetings than num_classes");
    }
}

void FactStore::loadCurricula(const ProblemInstance& inst) {
    std::set<std::pair<std::string, std::string>> seen;
    for (const CurriculumMembership& m : inst.curricula) {
        if (m.curriculumId.empty())
            throw DataIntegrityError("curriculum membership with empty curriculum id");
        if (!seen.emplace(m.curriculumId, m.courseId).second)
            throw DataIntegrityError("duplicate membership of '" + m.courseId +
                                     "' in curriculum '" + m.curriculumId + "'");
        int course = findCourse(m.courseId);
        if (course < 0) {
            logWarn("Curriculum '" + m.curriculumId + "' lists course '" + m.courseId +
                    "' which is not offered, ignoring.");
            continue;
        }
        curricula_[course].push_back(m.curriculumId);
        if (m.required) required_[course] = true;
    }
    for (auto& list : curricula_) std::sort(list.begin(), list.end());
}

int FactStore::findCourse(const std::string& courseId) const {
    auto it = courseIndex_.find(courseId);
    return it == courseIndex_.end() ? -1 : it->second;
}

int FactStore::findTeacher(const std::string& teacherId) const {
    auto it = teacherIndex_.find(teacherId);
    return it == teacherIndex_.end() ? -1 : it->second;
}

int FactStore::findUnit(const std::string& courseId, const std::string& groupId) const {
    auto it = unitIndex_.find(std::make_pair(courseId, groupId));
    return it == unitIndex_.end() ? -1 : it->second;
}

std::string FactStore::unitLabel(int unit) const {
    return courseOf(unit).id + "/" + units_[unit].groupId;
}

bool FactStore::shareCurriculum(int courseA, int courseB) const {
    const auto& a = curricula_[courseA];
    const auto& b = curricula_[courseB];
    // Both lists are sorted: linear merge.
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) return true;
        if (a[i] < b[j]) ++i; else ++j;
    }
    return false;
}

bool FactStore::inCurriculum(int course, const std::string& curriculumId) const {
    const auto& list = curricula_[course];
    return std::binary_search(list.begin(), list.end(), curriculumId);
}

bool FactStore::isRequired(int course) const {
    return required_[course];
}
