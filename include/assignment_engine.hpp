#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "configuration.hpp"
#include "constraints.hpp"
#include "search_limits.hpp"
#include <functional>
#include <string>
#include <vector>


///////////////////////////
///      LISTENER       ///
///////////////////////////
/**
 * @brief Observer of the depth-first search.
 *
 * Path keys are the ranks chosen from the root down to the current node;
 * comparing two path keys lexicographically gives their depth-first order.
 */
class SearchListener {
public:
    virtual ~SearchListener() = default;

    /**
     * @brief Called right after a candidate was placed.
     *
     * @return false to prune the subtree below this node.
     */
    virtual bool enter(const TimetableState& state, int group, const std::vector<int>& path) {
        (void)state;
        (void)group;
        (void)path;
        return true;
    }

    /// Called for every enter(), before the candidate is undone.
    virtual void leave(const TimetableState& state, int group) {
        (void)state;
        (void)group;
    }

    /**
     * @brief Called on every complete timetable.
     *
     * @return false to stop the whole search.
     */
    virtual bool onSolution(const TimetableState& state, const std::vector<int>& path) = 0;
};

/**
 * @brief How a run of the engine ended.
 */
struct SearchOutcome {
    bool exhausted = false; ///< Every claimed branch was fully explored.
    long long solutions = 0; ///< Complete timetables reported to the listener.
};


///////////////////////////
///       ENGINE        ///
///////////////////////////
/**
 * @brief Deterministic backtracking search over group candidates.
 *
 * Picks the unassigned group with the fewest viable candidates (ties by
 * group id), tries its candidates in rank order and forward-checks every
 * group sharing a teacher with it. The engine holds no state between runs.
 */
class AssignmentEngine {
public:
    /// Returns the next root branch (a rank of rootGroup()) to explore, or -1.
    using RootSelector = std::function<int()>;

    AssignmentEngine(const SearchSpace& space, SearchLimits& limits);

    /// Group branched on at the root, or -1 if there is nothing to assign.
    int rootGroup() const { return rootGroup_; }

    /// Number of root branches (size of the root group's domain).
    int rootBranchCount() const;

    /// True if some group has no placeable candidate before any choice is made.
    bool deadAtRoot() const { return deadAtRoot_; }

    /**
     * @brief Explore the tree and report timetables to the listener.
     *
     * With a selector, only the root branches it hands out are explored;
     * several engines sharing one selector partition the tree between them.
     */
    SearchOutcome run(SearchListener& listener, const RootSelector& selector = nullptr) const;

    /**
     * @brief Best-effort explanation of why no timetable exists.
     *
     * Lists empty domains, clashing fixed meetings and teachers whose
     * meetings outnumber the slots they may use.
     */
    std::vector<std::string> diagnose() const;

private:
    const SearchSpace& space_;
    SearchLimits& limits_;
    TimetableState initial_;
    int rootGroup_ = -1;
    bool deadAtRoot_ = false;

    struct Run {
        SearchListener& listener;
        TimetableState state;
        std::vector<int> path;
        long long solutions = 0;
        bool aborted = false;
    };

    /// Most constrained unassigned group, or -1 when all are assigned.
    int selectGroup(const TimetableState& state) const;

    /// Every unassigned teacher-neighbour of the group keeps a viable candidate.
    bool forwardCheck(const TimetableState& state, int group) const;

    /// Place, check, recurse, undo.
    void branch(Run& run, int group, int rank) const;

    void dfs(Run& run) const;
};
