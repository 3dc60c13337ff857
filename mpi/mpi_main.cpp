///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "scheduler.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "errors.hpp"
#include <mpi.h>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads timetabling demo.
 *
 * Initializes MPI, builds the large demo department on each rank, runs the
 * MPIHybridMultiStartSolver, and finalizes MPI. Rank 0 prints the run
 * information and the best timetable found across all ranks.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (rank == 0) {
        std::cout << "========================================\n";
        std::cout << "MPI+THREADS TIMETABLING SOLVER\n";
        std::cout << "Processes: " << size << "\n";
        std::cout << "========================================\n";
    }

    ProblemInstance inst = makeDemoInstance(DemoSize::L);

    // Every rank must use the same budget, or the exhaustion flags disagree.
    OptimizerConfig config = defaultConfig();
    config.budget.maxTimeSeconds = 60;
    if (rank != 0) config.logLevel = LogLevel::WARN;

    int numThreads = 4;
    MPIHybridMultiStartSolver solver(/*numThreads=*/numThreads);

    int exitCode = 0;
    try {
        SolveResult result = scheduleTimetable(inst, config, solver);
        if (rank == 0) {
            printSolveReport(result);
            std::cout << "========================================\n";
        }
    } catch (const SchedulerError& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << "\n";
        exitCode = 1;
    }

    MPI_Finalize();
    return exitCode;
}
