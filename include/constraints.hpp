#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "resolver.hpp"
#include "search_limits.hpp"
#include <string>
#include <vector>


///////////////////////////
///    SEARCH SPACE     ///
///////////////////////////
/**
 * @brief Candidate slot sets of every scheduling group.
 *
 * For a group with k = numClasses - |fixed| meetings left to place, each
 * candidate is a set of k slots drawn from the group's allowed slots minus
 * its fixed ones. Double groups only accept one slot or two adjacent periods
 * on the same weekday. The position of a candidate in its domain is its
 * rank; the search tries candidates in rank order.
 *
 * With limits given, the clock is polled while enumerating; if the time
 * limit passes, enumeration stops and the space is marked truncated.
 */
class SearchSpace {
public:
    explicit SearchSpace(const ConflictResolver& resolver, SearchLimits* limits = nullptr);

    const ConflictResolver& resolver() const { return resolver_; }

    int numGroups() const { return (int)domains_.size(); }

    /// Candidates of a group in rank order.
    const std::vector<SlotSet>& domain(int group) const { return domains_[group]; }

    /// Fixed plus candidate slots of a group.
    SlotSet fullSlots(int group, int rank) const { return resolver_.groups()[group].fixed | domains_[group][rank]; }

    /**
     * @brief Reorder a domain; order[i] is the old rank of the new rank i.
     */
    void applyOrder(int group, const std::vector<int>& order);

    /// True if enumeration was cut short by the time limit.
    bool truncated() const { return truncated_; }

    /// True if some group has no candidate at all.
    bool hasEmptyDomain() const;

    /// One human-readable line per group whose domain is empty.
    const std::vector<std::string>& emptyDomainReasons() const { return reasons_; }

private:
    const ConflictResolver& resolver_;
    std::vector<std::vector<SlotSet>> domains_;
    std::vector<std::string> reasons_;
    bool truncated_ = false;

    void enumerate(const SchedulingGroup& g, SearchLimits* limits);
};


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Incremental state of a partial timetable during search.
 *
 * Tracks, per teacher, the slots already occupied by placed or fixed
 * meetings. Fixed meetings are pre-placed on construction, so they take
 * part in conflict propagation like any other meeting. A group may be
 * placed at a candidate only if none of its teachers is busy at any of the
 * candidate's slots.
 *
 * The state is cheap to copy; every search worker owns one.
 */
class TimetableState {
public:
    explicit TimetableState(const SearchSpace& space);

    /// True if no teacher of the group is busy at any slot of the candidate.
    bool canPlace(int group, SlotSet slots) const;

    /**
     * @brief Assign a candidate to an unassigned group.
     *
     * The caller must have checked canPlace(); teacher occupancy is updated.
     */
    void place(int group, int rank);

    /**
     * @brief Undo the assignment of a group.
     *
     * Reverts teacher occupancy so the previous state is restored exactly.
     */
    void undo(int group);

    bool isAssigned(int group) const { return rank_[group] >= 0; }

    /// Rank of the candidate assigned to the group, or -1.
    int rankOf(int group) const { return rank_[group]; }

    int assignedCount() const { return assigned_; }

    /**
     * @brief Count candidates of a group that can still be placed.
     *
     * Stops counting at limit (pass 0 for no limit).
     */
    int countViable(int group, int limit = 0) const;

    /// True if the group has at least one placeable candidate.
    bool hasViable(int group) const { return countViable(group, 1) > 0; }

    /// Fixed plus chosen slots of every group (unassigned groups: fixed only).
    std::vector<SlotSet> groupSlots() const;

    /// Per teacher: fixed meetings of different groups sharing a slot.
    const std::vector<std::string>& fixedClashes() const { return fixedClashes_; }

    const SearchSpace& space() const { return space_; }

private:
    /// Search space this state belongs to.
    const SearchSpace& space_;

    /// teacherBusy_[teacher] = slots already taken by that teacher.
    std::vector<SlotSet> teacherBusy_;

    /// rank_[group] = assigned candidate rank, or -1.
    std::vector<int> rank_;

    int assigned_ = 0;

    std::vector<std::string> fixedClashes_;

    /// Union of the busy slots of a group's teachers.
    SlotSet busyFor(int group) const;
};
