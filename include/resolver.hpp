#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fact_store.hpp"
#include <utility>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Slot assignment of every unit, indexed like FactStore::units().
 */
struct Timetable {
    std::vector<SlotSet> slots; ///< All meeting slots of each unit.
    std::vector<SlotSet> fixed; ///< Subset of slots[u] pinned by the user.
};

/**
 * @brief Jointly taught units merged into one schedulable entity.
 *
 * Carries the union of its members' hard constraints.
 */
struct SchedulingGroup {
    int id; ///< Position in ConflictResolver::groups().
    std::vector<int> units; ///< Member unit indices, ascending.
    int numClasses; ///< Common meeting count of every member.
    bool isDouble; ///< Any member is a double course.
    SlotSet fixed; ///< Union of the members' fixed slots.
    /// Slots where a non-fixed meeting is legal for every member
    /// (primary lecturer availability and allowed parts of day).
    SlotSet allowed;
    std::vector<int> teachers; ///< Union of the members' lecturers, ascending.
};

/**
 * @brief One conflict between two units, in canonical orientation.
 */
struct Conflict {
    int unitA; ///< Unit whose course id (then group id) is smaller.
    int unitB;
    Slot slot;
};


///////////////////////////
///      RESOLVER       ///
///////////////////////////
/**
 * @brief Derives joint groups, teacher adjacency and the conflict relation.
 *
 * Built once from a FactStore. Joint pairs are closed transitively with a
 * union-find; pairs naming unknown units, a unit joined with itself, or
 * joined units with different num_classes raise DataIntegrityError.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(const FactStore& facts);

    const FactStore& facts() const { return facts_; }

    const std::vector<SchedulingGroup>& groups() const { return groups_; }

    /// Group containing the given unit.
    int groupOf(int unit) const { return groupOf_[unit]; }

    /// True if both units are (transitively) joint, or the same unit.
    bool areJoint(int unitA, int unitB) const { return groupOf_[unitA] == groupOf_[unitB]; }

    /// Groups sharing at least one teacher with the given group, ascending.
    const std::vector<int>& teacherNeighbours(int group) const { return neighbours_[group]; }

    /**
     * @brief Canonical orientation of an unordered unit pair.
     *
     * Smaller course id first; for the same course, smaller group id first.
     */
    std::pair<int, int> orderedPair(int unitA, int unitB) const;

    /// True if the units meet at the same slot and are not joint (symmetric).
    bool conflictsAt(const Timetable& tt, int unitA, int unitB, const Slot& slot) const;

    /// Every conflict of the timetable, each unordered pair and slot once.
    std::vector<Conflict> conflicts(const Timetable& tt) const;

    /// Expand per-group slot choices into a per-unit timetable.
    Timetable expand(const std::vector<SlotSet>& groupSlots) const;

private:
    const FactStore& facts_;
    std::vector<SchedulingGroup> groups_;
    std::vector<int> groupOf_;
    std::vector<std::vector<int>> neighbours_;

    void buildGroups();
    void buildNeighbours();
};
