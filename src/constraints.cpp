///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>


///////////////////////////
///    SEARCH SPACE     ///
///////////////////////////
SearchSpace::SearchSpace(const ConflictResolver& resolver, SearchLimits* limits) : resolver_(resolver) {
    domains_.resize(resolver.groups().size());
    for (const SchedulingGroup& g : resolver.groups()) {
        if (limits && !limits->checkTime()) {
            truncated_ = true;
            break;
        }
        enumerate(g, limits);
    }
}

/**
 * @brief Build the candidate list of one group.
 *
 * Slots fixed for one joint member but not for another become ordinary
 * meetings of the latter, so they must be legal for it as well.
 */
void SearchSpace::enumerate(const SchedulingGroup& g, SearchLimits* limits) {
    const FactStore& facts = resolver_.facts();
    const SlotDomain& dom = facts.slots();
    std::vector<SlotSet>& out = domains_[g.id];
    const std::string label = facts.unitLabel(g.units.front());

    for (int u : g.units) {
        const UnitFacts& uf = facts.units()[u];
        SlotSet legal = facts.teachers()[uf.primaryLecturer].available & dom.partOfDayMask(uf.scheduleOn);
        if ((g.fixed & ~uf.fixed) & ~legal) {
            reasons_.push_back("'" + facts.unitLabel(u) + "' inherits a fixed meeting of a joint offering "
                               "outside its lecturer's availability or allowed parts of day");
            return;
        }
    }

    int k = g.numClasses - slotCount(g.fixed);
    SlotSet free = g.allowed & ~g.fixed;

    if (k == 0) {
        out.push_back(0);
        return;
    }

    if (g.isDouble) {
        if (k > 2) {
            reasons_.push_back("'" + label + "' is a double course but needs " + std::to_string(k) +
                               " non-fixed meetings");
            return;
        }
        if (k == 1) {
            for (int i = 0; i < NUM_SLOTS; ++i) {
                if (free & (SlotSet(1) << i)) out.push_back(SlotSet(1) << i);
            }
        } else {
            for (int d = 0; d < DAYS; ++d) {
                for (int p = 0; p + 1 < PERIODS_PER_DAY; ++p) {
                    SlotSet pair = dom.bit(Slot{d, p}) | dom.bit(Slot{d, p + 1});
                    if ((free & pair) == pair) out.push_back(pair);
                }
            }
        }
        if (out.empty())
            reasons_.push_back("'" + label + "' is a double course without two adjacent legal periods on any day");
        return;
    }

    std::vector<int> freeIdx;
    for (int i = 0; i < NUM_SLOTS; ++i) {
        if (free & (SlotSet(1) << i)) freeIdx.push_back(i);
    }
    int n = (int)freeIdx.size();
    if (n < k) {
        reasons_.push_back("'" + label + "' needs " + std::to_string(k) + " meetings but only " +
                           std::to_string(n) + " legal slots remain");
        return;
    }

    // k-combinations of the free slots in lexicographic order.
    std::vector<int> pick(k);
    for (int i = 0; i < k; ++i) pick[i] = i;
    while (true) {
        SlotSet mask = 0;
        for (int i : pick) mask |= SlotSet(1) << freeIdx[i];
        out.push_back(mask);
        if (limits && (out.size() & 4095) == 0 && !limits->checkTime()) {
            truncated_ = true;
            return;
        }

        int i = k - 1;
        while (i >= 0 && pick[i] == n - k + i) --i;
        if (i < 0) break;
        ++pick[i];
        for (int j = i + 1; j < k; ++j) pick[j] = pick[j - 1] + 1;
    }
}

void SearchSpace::applyOrder(int group, const std::vector<int>& order) {
    std::vector<SlotSet> reordered;
    reordered.reserve(order.size());
    for (int old : order) reordered.push_back(domains_[group][old]);
    domains_[group] = std::move(reordered);
}

bool SearchSpace::hasEmptyDomain() const {
    for (const auto& d : domains_) {
        if (d.empty()) return true;
    }
    return false;
}


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Start from an empty timetable with every fixed meeting in place.
 */
TimetableState::TimetableState(const SearchSpace& space) : space_(space) {
    const ConflictResolver& resolver = space.resolver();
    const FactStore& facts = resolver.facts();
    const SlotDomain& dom = facts.slots();

    teacherBusy_.assign(facts.teachers().size(), 0);
    rank_.assign(space.numGroups(), -1);

    for (const SchedulingGroup& g : resolver.groups()) {
        for (int t : g.teachers) {
            SlotSet clash = teacherBusy_[t] & g.fixed;
            for (const Slot& s : dom.slotsOf(clash)) {
                fixedClashes_.push_back("teacher '" + facts.teachers()[t].id + "' has two fixed meetings on " +
                                        dom.weekdayName(s.day) + " " + dom.periodLabel(s.period));
            }
            teacherBusy_[t] |= g.fixed;
        }
    }
}

SlotSet TimetableState::busyFor(int group) const {
    SlotSet busy = 0;
    for (int t : space_.resolver().groups()[group].teachers) busy |= teacherBusy_[t];
    return busy;
}

bool TimetableState::canPlace(int group, SlotSet slots) const {
    return (busyFor(group) & slots) == 0;
}

void TimetableState::place(int group, int rank) {
    SlotSet slots = space_.domain(group)[rank];
    for (int t : space_.resolver().groups()[group].teachers) teacherBusy_[t] |= slots;
    rank_[group] = rank;
    ++assigned_;
}

void TimetableState::undo(int group) {
    SlotSet slots = space_.domain(group)[rank_[group]];
    for (int t : space_.resolver().groups()[group].teachers) teacherBusy_[t] &= ~slots;
    rank_[group] = -1;
    --assigned_;
}

int TimetableState::countViable(int group, int limit) const {
    SlotSet busy = busyFor(group);
    int count = 0;
    for (SlotSet cand : space_.domain(group)) {
        if ((cand & busy) == 0) {
            ++count;
            if (limit > 0 && count >= limit) break;
        }
    }
    return count;
}

std::vector<SlotSet> TimetableState::groupSlots() const {
    std::vector<SlotSet> out(space_.numGroups());
    for (int g = 0; g < space_.numGroups(); ++g) {
        out[g] = space_.resolver().groups()[g].fixed;
        if (rank_[g] >= 0) out[g] |= space_.domain(g)[rank_[g]];
    }
    return out;
}
