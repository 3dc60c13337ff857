///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <numeric>
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Minimal union-find over unit indices.
 */
class DisjointSets {
public:
    explicit DisjointSets(int n) : parent_(n) { std::iota(parent_.begin(), parent_.end(), 0); }

    int find(int x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(int a, int b) {
        a = find(a);
        b = find(b);
        // Smaller index becomes the root so roots are stable.
        if (a < b) parent_[b] = a;
        else if (b < a) parent_[a] = b;
    }

private:
    std::vector<int> parent_;
};

} // namespace


///////////////////////////
///      RESOLVER       ///
///////////////////////////
ConflictResolver::ConflictResolver(const FactStore& facts) : facts_(facts) {
    buildGroups();
    buildNeighbours();
}

/**
 * @brief Close the joint relation and merge each class into a SchedulingGroup.
 *
 * Groups are numbered by their smallest member unit, so numbering follows
 * the input order of offerings.
 */
void ConflictResolver::buildGroups() {
    const auto& units = facts_.units();
    const SlotDomain& dom = facts_.slots();
    int n = (int)units.size();

    DisjointSets sets(n);
    for (const JointPair& jp : facts_.jointPairs()) {
        int a = facts_.findUnit(jp.a.courseId, jp.a.groupId);
        int b = facts_.findUnit(jp.b.courseId, jp.b.groupId);
        if (a < 0)
            throw DataIntegrityError("joint pair references unknown offering '" +
                                     jp.a.courseId + "/" + jp.a.groupId + "'");
        if (b < 0)
            throw DataIntegrityError("joint pair references unknown offering '" +
                                     jp.b.courseId + "/" + jp.b.groupId + "'");
        if (a == b)
            throw DataIntegrityError("offering '" + facts_.unitLabel(a) + "' is joint with itself");
        sets.unite(a, b);
    }

    groupOf_.assign(n, -1);
    for (int u = 0; u < n; ++u) {
        int root = sets.find(u);
        if (groupOf_[root] < 0) {
            SchedulingGroup g;
            g.id = (int)groups_.size();
            g.numClasses = facts_.courseOf(root).numClasses;
            g.isDouble = false;
            g.fixed = 0;
            g.allowed = dom.allSlots();
            groups_.push_back(g);
            groupOf_[root] = g.id;
        }
        groupOf_[u] = groupOf_[root];

        SchedulingGroup& g = groups_[groupOf_[u]];
        const UnitFacts& uf = units[u];
        const Course& course = facts_.courseOf(u);
        if (course.numClasses != g.numClasses)
            throw DataIntegrityError("joint offerings '" + facts_.unitLabel(g.units.empty() ? root : g.units.front()) +
                                     "' and '" + facts_.unitLabel(u) + "' need different num_classes");
        g.units.push_back(u);
        g.isDouble = g.isDouble || course.isDouble;
        g.fixed |= uf.fixed;
        g.allowed &= facts_.teachers()[uf.primaryLecturer].available & dom.partOfDayMask(uf.scheduleOn);
        for (int t : uf.lecturers) g.teachers.push_back(t);
    }

    for (SchedulingGroup& g : groups_) {
        std::sort(g.teachers.begin(), g.teachers.end());
        g.teachers.erase(std::unique(g.teachers.begin(), g.teachers.end()), g.teachers.end());
        if (slotCount(g.fixed) > g.numClasses)
            throw DataIntegrityError("joint offerings of '" + facts_.unitLabel(g.units.front()) +
                                     "' have more fixed meetings than num_classes");
    }
}

/**
 * @brief Link groups that share a teacher; they may never share a slot.
 */
void ConflictResolver::buildNeighbours() {
    int numTeachers = (int)facts_.teachers().size();
    std::vector<std::vector<int>> byTeacher(numTeachers);
    for (const SchedulingGroup& g : groups_) {
        for (int t : g.teachers) byTeacher[t].push_back(g.id);
    }

    std::vector<std::set<int>> adj(groups_.size());
    for (const auto& list : byTeacher) {
        for (int a : list) {
            for (int b : list) {
                if (a != b) adj[a].insert(b);
            }
        }
    }

    neighbours_.resize(groups_.size());
    for (size_t g = 0; g < groups_.size(); ++g) {
        neighbours_[g].assign(adj[g].begin(), adj[g].end());
    }
}

std::pair<int, int> ConflictResolver::orderedPair(int unitA, int unitB) const {
    const std::string& ca = facts_.courseOf(unitA).id;
    const std::string& cb = facts_.courseOf(unitB).id;
    if (ca != cb) {
        return ca < cb ? std::make_pair(unitA, unitB) : std::make_pair(unitB, unitA);
    }
    const std::string& ga = facts_.units()[unitA].groupId;
    const std::string& gb = facts_.units()[unitB].groupId;
    return ga <= gb ? std::make_pair(unitA, unitB) : std::make_pair(unitB, unitA);
}

bool ConflictResolver::conflictsAt(const Timetable& tt, int unitA, int unitB, const Slot& slot) const {
    if (areJoint(unitA, unitB)) return false;
    SlotSet b = facts_.slots().bit(slot);
    return (tt.slots[unitA] & b) && (tt.slots[unitB] & b);
}

/**
 * @brief List conflicts once per unordered unit pair and slot.
 *
 * Results are sorted by slot, then by the canonical pair.
 */
std::vector<Conflict> ConflictResolver::conflicts(const Timetable& tt) const {
    const SlotDomain& dom = facts_.slots();
    std::vector<Conflict> out;
    int n = (int)tt.slots.size();
    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (areJoint(a, b)) continue;
            SlotSet common = tt.slots[a] & tt.slots[b];
            if (!common) continue;
            std::pair<int, int> p = orderedPair(a, b);
            for (const Slot& s : dom.slotsOf(common)) {
                out.push_back(Conflict{p.first, p.second, s});
            }
        }
    }
    std::sort(out.begin(), out.end(), [this](const Conflict& x, const Conflict& y) {
        if (x.slot != y.slot) return x.slot < y.slot;
        const std::string xa = facts_.unitLabel(x.unitA), ya = facts_.unitLabel(y.unitA);
        if (xa != ya) return xa < ya;
        return facts_.unitLabel(x.unitB) < facts_.unitLabel(y.unitB);
    });
    return out;
}

Timetable ConflictResolver::expand(const std::vector<SlotSet>& groupSlots) const {
    Timetable tt;
    int n = (int)facts_.units().size();
    tt.slots.assign(n, 0);
    tt.fixed.assign(n, 0);
    for (int u = 0; u < n; ++u) {
        tt.slots[u] = groupSlots[groupOf_[u]];
        tt.fixed[u] = facts_.units()[u].fixed;
    }
    return tt;
}
