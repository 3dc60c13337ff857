///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
#include "../sequential/pool_solver.hpp"
#include "scheduler.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Run one solver on the instance, time it and print its report.
 */
static void runAndReport(const ProblemInstance& inst, const OptimizerConfig& config, ISolver& solver) {
    auto start = std::chrono::high_resolution_clock::now();
    SolveResult result = scheduleTimetable(inst, config, solver);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "SOLVER: " << solver.name() << "\n";
    std::cout << "Offerings: " << inst.offerings.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";
    printSolveReport(result);
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential timetabling solvers.
 *
 * Builds the small demo department, solves it with branch-and-bound and
 * with a bounded candidate pool, and prints both reports together with the
 * runner-up timetable. The pool only sees the first timetables in search
 * order, so its winner may cost more than the branch-and-bound one.
 */
int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    OptimizerConfig config = defaultConfig();
    config.budget.maxTimeSeconds = 20;
    config.numSchedules = 2;

    try {
        SequentialBacktrackingSolver seqSolver;
        runAndReport(inst, config, seqSolver);

        CandidatePoolSolver poolSolver(/*poolSize=*/50000);
        runAndReport(inst, config, poolSolver);

        std::cout << "\nPer-offering schedules (sequential):\n";
        SolveResult result = scheduleTimetable(inst, config, seqSolver);
        if (result.solution) printUnitSchedules(*result.solution);
    } catch (const SchedulerError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
