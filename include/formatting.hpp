#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Per-offering tables, one small table per weekday.
void printUnitSchedules(const TimetableSolution& sol);

/// Period x weekday grid listing the offerings meeting in each slot.
void printWeekGrid(const TimetableSolution& sol);

/// Soft-constraint witnesses, conflicts and joint groups.
void printViolations(const TimetableSolution& sol);

/// Status, costs, counters and diagnostics, followed by the timetable and its alternatives if any.
void printSolveReport(const SolveResult& result);
