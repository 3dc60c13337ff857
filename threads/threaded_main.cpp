///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_solver.hpp"
#include "scheduler.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded timetabling solver.
 *
 * Solves the medium demo department with several worker threads, measures
 * the runtime and prints the timetable with its costs and violations.
 */
int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::M);

    //  - threads = 4        -> four workers claiming root branches,
    //  - maxTimeSeconds = 30 -> report the best timetable so far after 30 s.
    OptimizerConfig config = defaultConfig();
    config.threads = 4;
    config.budget.maxTimeSeconds = 30;

    ThreadedBacktrackingSolver thrSolver;

    SolveResult result;
    auto startThr = std::chrono::high_resolution_clock::now();
    try {
        result = scheduleTimetable(inst, config, thrSolver);
    } catch (const SchedulerError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    auto endThr = std::chrono::high_resolution_clock::now();
    double msThr = std::chrono::duration<double, std::milli>(endThr - startThr).count();

    std::cout << "========================================\n";
    std::cout << "THREADED TIMETABLING SOLVER\n";
    std::cout << "Offerings: " << inst.offerings.size() << "\n";
    std::cout << "Threads: " << config.threads << "\n";
    std::cout << "Time: " << msThr << " ms\n";
    printSolveReport(result);

    if (result.solution) {
        std::cout << "\nPer-offering schedules (threaded):\n";
        printUnitSchedules(*result.solution);
    }

    std::cout << "========================================\n";
    return 0;
}
