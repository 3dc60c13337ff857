#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "configuration.hpp"
#include "solver_base.hpp"


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
/**
 * @brief Build the best timetable for an instance with the given solver.
 *
 * Validates the configuration and the facts (throwing ConfigurationError or
 * DataIntegrityError), derives joint groups and candidates, runs the solver
 * and reports the winner with its per-layer costs, violations and conflicts.
 * Infeasibility and budget expiry are reported through the status.
 */
SolveResult scheduleTimetable(const ProblemInstance& inst, const OptimizerConfig& config, ISolver& solver);

/// Status from whether the search finished and whether it found a timetable.
SolveStatus classifyOutcome(bool exhausted, bool found);
