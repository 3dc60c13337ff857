///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <iostream>
#include <algorithm>
#include <iomanip>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Names and period labels of the weekly grid.
 */
static const SlotDomain& grid() {
    static const SlotDomain kGrid;
    return kGrid;
}

static std::string unitLabel(const TimetableSolution& sol, int unit) {
    return sol.units[unit].courseId + "/" + sol.units[unit].groupId;
}

static std::string slotLabel(const Slot& s) {
    return grid().weekdayName(s.day) + " " + grid().periodLabel(s.period);
}

/**
 * @brief Print the header row for a per-day schedule table.
 */
static void printDayTableHeader() {
    std::cout << "    "
              << std::left << std::setw(15) << "Time"
              << " | " << std::left << std::setw(10) << "Course"
              << " | " << std::left << std::setw(8) << "Group"
              << " | " << std::left << std::setw(6) << "Fixed"
              << "\n";

    std::cout << "    "
              << std::string(15, '-')
              << "-+-" << std::string(10, '-')
              << "-+-" << std::string(8, '-')
              << "-+-" << std::string(6, '-')
              << "\n";
}

/**
 * @brief Print pretty, per-offering schedules of a timetable.
 *
 * Meetings are grouped by weekday and ordered by period; each weekday gets
 * a small table.
 */
void printUnitSchedules(const TimetableSolution& sol) {
    for (const UnitKey& unit : sol.units) {
        std::cout << "----------------------------------------\n";
        std::cout << "Schedule for " << unit.courseId << "/" << unit.groupId << ":\n";

        std::vector<const ClassMeeting*> meetings;
        for (const ClassMeeting& m : sol.meetings) {
            if (m.courseId == unit.courseId && m.groupId == unit.groupId) meetings.push_back(&m);
        }

        if (meetings.empty()) {
            std::cout << "  (no meetings)\n";
            continue;
        }

        int currentDay = -1;
        for (const ClassMeeting* m : meetings) {
            if (m->slot.day != currentDay) {
                currentDay = m->slot.day;
                std::cout << "\n  " << grid().weekdayName(currentDay) << ":\n";
                printDayTableHeader();
            }
            std::cout << "    "
                      << std::left << std::setw(15) << grid().periodLabel(m->slot.period)
                      << " | " << std::left << std::setw(10) << m->courseId
                      << " | " << std::left << std::setw(8) << m->groupId
                      << " | " << std::left << std::setw(6) << (m->fixed ? "yes" : "")
                      << "\n";
        }
        std::cout << "\n";
    }
}

void printWeekGrid(const TimetableSolution& sol) {
    const int width = 24;
    std::cout << std::left << std::setw(15) << "";
    for (int d = 0; d < DAYS; ++d) std::cout << " | " << std::setw(width) << grid().weekdayName(d);
    std::cout << "\n";

    for (int p = 0; p < PERIODS_PER_DAY; ++p) {
        // Rows grow downwards when several offerings share a slot.
        std::vector<std::vector<std::string>> cells(DAYS);
        size_t height = 1;
        for (const ClassMeeting& m : sol.meetings) {
            if (m.slot.period != p) continue;
            cells[m.slot.day].push_back(m.courseId + "/" + m.groupId + (m.fixed ? "*" : ""));
            height = std::max(height, cells[m.slot.day].size());
        }
        std::cout << std::string(15 + DAYS * (width + 3), '-') << "\n";
        for (size_t line = 0; line < height; ++line) {
            std::cout << std::left << std::setw(15) << (line == 0 ? grid().periodLabel(p) : "");
            for (int d = 0; d < DAYS; ++d) {
                std::cout << " | " << std::setw(width) << (line < cells[d].size() ? cells[d][line] : "");
            }
            std::cout << "\n";
        }
    }
    std::cout << "(* = fixed meeting)\n";
}

void printViolations(const TimetableSolution& sol) {
    std::cout << "Violations (" << sol.violations.size() << "):\n";
    for (const Violation& v : sol.violations) {
        std::cout << "  " << std::left << std::setw(28) << ruleName(v.rule) << " cost " << std::setw(4) << v.cost;
        for (size_t i = 0; i < v.units.size(); ++i) {
            std::cout << (i == 0 ? " " : " x ") << unitLabel(sol, v.units[i]);
        }
        for (const Slot& s : v.slots) std::cout << " @ " << slotLabel(s);
        if (!v.detail.empty()) std::cout << " (" << v.detail << ")";
        std::cout << "\n";
    }

    std::cout << "Conflicts (" << sol.conflicts.size() << "):\n";
    for (const Conflict& c : sol.conflicts) {
        std::cout << "  " << unitLabel(sol, c.unitA) << " x " << unitLabel(sol, c.unitB)
                  << " @ " << slotLabel(c.slot) << "\n";
    }

    std::cout << "Joint groups (" << sol.jointGroups.size() << "):\n";
    for (const auto& group : sol.jointGroups) {
        std::cout << " ";
        for (int u : group) std::cout << " " << unitLabel(sol, u);
        std::cout << "\n";
    }
}

static void printLayerCosts(const TimetableSolution& sol) {
    for (size_t l = 0; l < sol.layerCosts.size(); ++l) {
        std::cout << " [priority " << sol.layerPriorities[l] << "] " << sol.layerCosts[l];
    }
    std::cout << "\n";
}

void printSolveReport(const SolveResult& result) {
    std::cout << "Status: " << statusName(result.status) << "\n";
    std::cout << "Nodes: " << result.stats.nodes
              << ", timetables reached: " << result.stats.candidates
              << ", pruned: " << result.stats.pruned
              << ", workers: " << result.stats.workers << "\n";
    std::cout << "Time used: " << result.stats.seconds << " s\n";

    for (const std::string& d : result.diagnostics) {
        std::cout << "  ! " << d << "\n";
    }

    if (!result.solution) {
        std::cout << "No valid timetable found.\n";
        return;
    }

    const TimetableSolution& sol = *result.solution;
    std::cout << "Layer costs:";
    printLayerCosts(sol);
    std::cout << "\n";

    printWeekGrid(sol);
    std::cout << "\n";
    printViolations(sol);

    for (size_t i = 0; i < result.alternatives.size(); ++i) {
        std::cout << "\nAlternative " << i + 2 << ", layer costs:";
        printLayerCosts(result.alternatives[i]);
        printWeekGrid(result.alternatives[i]);
    }
}
