///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "scheduler.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include "opencl_solver.hpp"
#include <iostream>
#include <chrono>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL candidate-pool solver.
 *
 * Builds the small demo department, enumerates its timetables on the CPU
 * while the device scores them in batches, and prints the cheapest one.
 */
int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    OptimizerConfig config = defaultConfig();

    //  - poolSize:  upper bound on how many complete timetables to score (0 = all).
    //  - batchSize: how many timetables to score per device batch.
    long long poolSize = 50000;
    int batchSize = 512;

    std::cout << "========================================\n";
    std::cout << "OPENCL CANDIDATE-POOL TIMETABLING SOLVER\n";
    std::cout << "Offerings: " << inst.offerings.size() << "\n";
    std::cout << "Device batch size: " << batchSize << "\n";
    std::cout << "========================================\n";

    try {
        OpenCLPoolSolver solver(poolSize, batchSize);

        auto start = std::chrono::high_resolution_clock::now();
        SolveResult result = scheduleTimetable(inst, config, solver);
        auto end = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "OpenCL solver time: " << elapsedMs << " ms\n";
        printSolveReport(result);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
