///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "logging.hpp"
#include <mpi.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static inline void checkMPI(int err, const char* operation) {
    if (err != MPI_SUCCESS) {
        std::stringstream ss;
        ss << "MPI error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
MPIHybridMultiStartSolver::MPIHybridMultiStartSolver(int numThreads)
        : numThreads_(numThreads) {}

void MPIHybridMultiStartSolver::serializeRanking(const std::vector<Incumbent>& ranked,
                                                 std::vector<long long>& buffer) {
    buffer.clear();
    buffer.push_back((long long)ranked.size());
    for (const Incumbent& inc : ranked) {
        buffer.push_back((long long)inc.cost.size());
        buffer.insert(buffer.end(), inc.cost.begin(), inc.cost.end());
        buffer.push_back((long long)inc.path.size());
        for (int r : inc.path) buffer.push_back(r);
        buffer.push_back((long long)inc.groupSlots.size());
        for (SlotSet s : inc.groupSlots) buffer.push_back((long long)s);
    }
}

std::vector<Incumbent> MPIHybridMultiStartSolver::deserializeRanking(const std::vector<long long>& buffer) {
    std::vector<Incumbent> ranked;
    if (buffer.empty()) return ranked;
    size_t pos = 0;
    long long entries = buffer[pos++];
    for (long long e = 0; e < entries; ++e) {
        Incumbent inc;
        long long n = buffer[pos++];
        for (long long i = 0; i < n; ++i) inc.cost.push_back(buffer[pos++]);
        n = buffer[pos++];
        for (long long i = 0; i < n; ++i) inc.path.push_back((int)buffer[pos++]);
        n = buffer[pos++];
        for (long long i = 0; i < n; ++i) inc.groupSlots.push_back((SlotSet)buffer[pos++]);
        ranked.push_back(std::move(inc));
    }
    return ranked;
}

/**
 * @brief Solve the rank's share of the tree, then agree on one winner.
 *
 * Exhaustion is combined with a logical AND, counters are summed, and the
 * rankings travel to rank 0 as flat buffers (length, then data). The ranks
 * explore disjoint branches, so merging their rankings yields the global
 * one.
 */
SearchResult MPIHybridMultiStartSolver::search(const SearchContext& ctx) {
    int rank, size;
    checkMPI(MPI_Comm_rank(MPI_COMM_WORLD, &rank), "MPI_Comm_rank");
    checkMPI(MPI_Comm_size(MPI_COMM_WORLD, &size), "MPI_Comm_size");

    ThreadedBacktrackingSolver threadedSolver(numThreads_);
    SearchResult local = threadedSolver.searchBranches(ctx, rank, size);

    logDebug("rank " + std::to_string(rank) + ": " + std::to_string(local.stats.nodes) + " nodes, " +
             std::to_string(local.ranked.size()) + " timetables ranked");

    SearchResult result;

    int localExhausted = local.exhausted ? 1 : 0;
    int globalExhausted = 0;
    checkMPI(MPI_Allreduce(&localExhausted, &globalExhausted, 1, MPI_INT, MPI_LAND, MPI_COMM_WORLD),
             "reducing exhaustion");
    result.exhausted = globalExhausted != 0;

    long long localCounts[3] = {local.stats.nodes, local.stats.candidates, local.stats.pruned};
    long long globalCounts[3] = {0, 0, 0};
    checkMPI(MPI_Allreduce(localCounts, globalCounts, 3, MPI_LONG_LONG, MPI_SUM, MPI_COMM_WORLD),
             "reducing counters");
    result.stats.nodes = globalCounts[0];
    result.stats.candidates = globalCounts[1];
    result.stats.pruned = globalCounts[2];

    double seconds = 0.0;
    checkMPI(MPI_Allreduce(&local.stats.seconds, &seconds, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD),
             "reducing time");
    result.stats.seconds = seconds;
    result.stats.workers = local.stats.workers * size;

    const int TAG_META = 300;
    const int TAG_DATA = 301;

    std::vector<long long> buf;
    if (rank != 0) {
        serializeRanking(local.ranked, buf);
        int len = (int)buf.size();
        checkMPI(MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD), "sending length");
        checkMPI(MPI_Send(buf.data(), len, MPI_LONG_LONG, 0, TAG_DATA, MPI_COMM_WORLD), "sending ranking");
    } else {
        RankedIncumbents merged(ctx.config.numSchedules);
        for (const Incumbent& inc : local.ranked) merged.offer(inc);
        for (int source = 1; source < size; ++source) {
            int len = 0;
            checkMPI(MPI_Recv(&len, 1, MPI_INT, source, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE),
                     "receiving length");
            std::vector<long long> incoming(len);
            checkMPI(MPI_Recv(incoming.data(), len, MPI_LONG_LONG, source, TAG_DATA, MPI_COMM_WORLD,
                              MPI_STATUS_IGNORE), "receiving ranking");
            for (const Incumbent& inc : deserializeRanking(incoming)) merged.offer(inc);
        }
        serializeRanking(merged.items(), buf);
    }

    // Everyone leaves with rank 0's choice.
    int len = (int)buf.size();
    checkMPI(MPI_Bcast(&len, 1, MPI_INT, 0, MPI_COMM_WORLD), "broadcasting length");
    buf.resize(len);
    checkMPI(MPI_Bcast(buf.data(), len, MPI_LONG_LONG, 0, MPI_COMM_WORLD), "broadcasting ranking");
    result.ranked = deserializeRanking(buf);

    return result;
}
