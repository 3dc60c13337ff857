///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment_engine.hpp"
#include <climits>


///////////////////////////
///       ENGINE        ///
///////////////////////////
AssignmentEngine::AssignmentEngine(const SearchSpace& space, SearchLimits& limits)
        : space_(space),
          limits_(limits),
          initial_(space) {
    if (space.hasEmptyDomain() || !initial_.fixedClashes().empty()) {
        deadAtRoot_ = true;
        return;
    }
    for (int g = 0; g < space.numGroups(); ++g) {
        if (!initial_.hasViable(g)) {
            deadAtRoot_ = true;
            return;
        }
    }
    rootGroup_ = selectGroup(initial_);
}

int AssignmentEngine::rootBranchCount() const {
    if (deadAtRoot_) return 0;
    if (rootGroup_ < 0) return 1;
    return (int)space_.domain(rootGroup_).size();
}

int AssignmentEngine::selectGroup(const TimetableState& state) const {
    int best = -1;
    int bestCount = INT_MAX;
    for (int g = 0; g < space_.numGroups(); ++g) {
        if (state.isAssigned(g)) continue;
        // Reaching bestCount already loses the tie to the smaller id.
        int count = state.countViable(g, best < 0 ? 0 : bestCount);
        if (count < bestCount) {
            best = g;
            bestCount = count;
        }
    }
    return best;
}

bool AssignmentEngine::forwardCheck(const TimetableState& state, int group) const {
    for (int h : space_.resolver().teacherNeighbours(group)) {
        if (!state.isAssigned(h) && !state.hasViable(h)) return false;
    }
    return true;
}

void AssignmentEngine::branch(Run& run, int group, int rank) const {
    if (!run.state.canPlace(group, space_.domain(group)[rank])) return;

    run.state.place(group, rank);
    if (forwardCheck(run.state, group)) {
        run.path.push_back(rank);
        if (run.listener.enter(run.state, group, run.path)) {
            dfs(run);
        }
        run.listener.leave(run.state, group);
        run.path.pop_back();
    }
    run.state.undo(group);
}

void AssignmentEngine::dfs(Run& run) const {
    if (!limits_.countNode()) {
        run.aborted = true;
        return;
    }

    int g = selectGroup(run.state);
    if (g < 0) {
        limits_.countCandidate();
        ++run.solutions;
        if (!run.listener.onSolution(run.state, run.path)) run.aborted = true;
        return;
    }

    int size = (int)space_.domain(g).size();
    for (int rank = 0; rank < size && !run.aborted; ++rank) {
        branch(run, g, rank);
    }
}

/**
 * @brief Run the search from the initial state.
 *
 * Root branches handed out by the selector are explored in the order they
 * are claimed; within a branch the order is the usual depth-first one.
 */
SearchOutcome AssignmentEngine::run(SearchListener& listener, const RootSelector& selector) const {
    Run r{listener, initial_, {}};
    SearchOutcome outcome;

    if (deadAtRoot_) {
        outcome.exhausted = true;
        return outcome;
    }

    if (!selector) {
        dfs(r);
    } else if (rootGroup_ < 0) {
        // Nothing to assign: a single empty branch.
        if (selector() == 0) dfs(r);
    } else {
        int size = rootBranchCount();
        while (!r.aborted) {
            int rank = selector();
            if (rank < 0) break;
            if (rank >= size) continue;
            if (!limits_.countNode()) {
                r.aborted = true;
                break;
            }
            branch(r, rootGroup_, rank);
        }
    }

    outcome.exhausted = !r.aborted;
    outcome.solutions = r.solutions;
    return outcome;
}

std::vector<std::string> AssignmentEngine::diagnose() const {
    const ConflictResolver& resolver = space_.resolver();
    const FactStore& facts = resolver.facts();
    std::vector<std::string> out = space_.emptyDomainReasons();

    for (const std::string& clash : initial_.fixedClashes()) out.push_back(clash);

    for (int g = 0; g < space_.numGroups(); ++g) {
        if (!space_.domain(g).empty() && !initial_.hasViable(g)) {
            out.push_back("'" + facts.unitLabel(resolver.groups()[g].units.front()) +
                          "' has no candidate avoiding its teachers' fixed meetings");
        }
    }

    // A teacher can hold at most one meeting per slot it may use.
    std::vector<int> demand(facts.teachers().size(), 0);
    std::vector<SlotSet> supply(facts.teachers().size(), 0);
    for (const SchedulingGroup& g : resolver.groups()) {
        for (int t : g.teachers) {
            demand[t] += g.numClasses;
            supply[t] |= g.allowed | g.fixed;
        }
    }
    for (int t = 0; t < (int)demand.size(); ++t) {
        if (demand[t] > slotCount(supply[t])) {
            out.push_back("teacher '" + facts.teachers()[t].id + "' must teach " + std::to_string(demand[t]) +
                          " meetings but can use only " + std::to_string(slotCount(supply[t])) + " slots");
        }
    }
    return out;
}
