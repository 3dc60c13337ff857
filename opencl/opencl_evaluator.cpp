///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

/// Buffer released when it goes out of scope, also when a later call throws.
class ScopedMem {
public:
    explicit ScopedMem(cl_mem mem) : handle(mem) {}
    ~ScopedMem() { if (handle) clReleaseMemObject(handle); }
    ScopedMem(const ScopedMem&) = delete;
    ScopedMem& operator=(const ScopedMem&) = delete;

    cl_mem handle;
};

/// Kernel counterpart of ScopedMem.
class ScopedKernel {
public:
    explicit ScopedKernel(cl_kernel kernel) : handle(kernel) {}
    ~ScopedKernel() { if (handle) clReleaseKernel(handle); }
    ScopedKernel(const ScopedKernel&) = delete;
    ScopedKernel& operator=(const ScopedKernel&) = delete;

    cl_kernel handle;
};

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* TIMETABLE_KERNEL_SRC = R"(
__kernel void eval_costs(
    __global const int* ranks,          // numCandidates * numGroups
    __global const uint* slots,         // numCandidates * numGroups, fixed | chosen
    const int numCandidates,
    const int numGroups,
    const int numLayers,
    __global const int* localOffsets,   // numGroups: first row of each group's table
    __global const long* localCosts,    // rows of numLayers values
    const int numPairs,
    __global const int* pairA,
    __global const int* pairB,
    __global const long* pairWeights,   // numPairs * numLayers
    __global long* costOut              // numCandidates * numLayers
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int base = cid * numGroups;
    int out = cid * numLayers;

    for (int l = 0; l < numLayers; ++l) costOut[out + l] = 0;

    // Local costs, looked up by rank.
    for (int g = 0; g < numGroups; ++g) {
        int row = (localOffsets[g] + ranks[base + g]) * numLayers;
        for (int l = 0; l < numLayers; ++l) costOut[out + l] += localCosts[row + l];
    }

    // Pair costs: weight per common slot.
    for (int p = 0; p < numPairs; ++p) {
        uint common = slots[base + pairA[p]] & slots[base + pairB[p]];
        long n = (long)popcount(common);
        if (n == 0) continue;
        for (int l = 0; l < numLayers; ++l) costOut[out + l] += pairWeights[p * numLayers + l] * n;
    }
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
TimetableOpenCLContext::TimetableOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        logInfo("No GPU found, trying CPU...");
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    logInfo(std::string("Using OpenCL device: ") + name);

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    checkError(err, "creating command queue");

    program = buildProgram(TIMETABLE_KERNEL_SRC);
}

TimetableOpenCLContext::~TimetableOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program TimetableOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        logError(std::string("OpenCL build log:\n") + log.data());
        clReleaseProgram(prog);
        checkError(err, "building program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
/**
 * @brief Flatten the cost tables and the batch, run the kernel, read back.
 *
 * Buffers are never empty: OpenCL rejects zero-sized allocations, so every
 * array gets at least one element.
 */
void TimetableOpenCLContext::evaluateBatch(
        const CostModel& costs,
        const SearchSpace& space,
        const std::vector<BatchCandidate>& batch,
        std::vector<CostVector>& out
) {
    cl_int err = CL_SUCCESS;

    int numCandidates = (int)batch.size();
    int numGroups = space.numGroups();
    int numLayers = costs.numLayers();

    out.assign(numCandidates, costs.zero());
    if (numCandidates == 0 || numLayers == 0) return;

    // Flatten candidates.
    std::vector<cl_int> ranks(std::max(1, numCandidates * numGroups), 0);
    std::vector<cl_uint> slots(std::max(1, numCandidates * numGroups), 0);
    for (int c = 0; c < numCandidates; ++c) {
        for (int g = 0; g < numGroups; ++g) {
            ranks[c * numGroups + g] = batch[c].ranks[g];
            slots[c * numGroups + g] = batch[c].groupSlots[g];
        }
    }

    // Flatten local cost tables.
    std::vector<cl_int> localOffsets(std::max(1, numGroups), 0);
    std::vector<cl_long> localCosts;
    for (int g = 0; g < numGroups; ++g) {
        localOffsets[g] = (cl_int)(localCosts.size() / numLayers);
        for (int r = 0; r < (int)space.domain(g).size(); ++r) {
            const CostVector& c = costs.localCost(g, r);
            localCosts.insert(localCosts.end(), c.begin(), c.end());
        }
    }
    if (localCosts.empty()) localCosts.push_back(0);

    // Flatten pair weights, each unordered pair once.
    std::vector<cl_int> pairA, pairB;
    std::vector<cl_long> pairWeights;
    for (int g = 0; g < numGroups; ++g) {
        for (const CostModel::PairWeight& p : costs.pairWeights(g)) {
            if (p.other < g) continue;
            pairA.push_back(g);
            pairB.push_back(p.other);
            pairWeights.insert(pairWeights.end(), p.weight.begin(), p.weight.end());
        }
    }
    int numPairs = (int)pairA.size();
    if (pairA.empty()) {
        pairA.push_back(0);
        pairB.push_back(0);
        pairWeights.push_back(0);
    }

    size_t bufCandidates = ranks.size() * sizeof(cl_int);
    size_t bufSlots = slots.size() * sizeof(cl_uint);
    size_t bufOffsets = localOffsets.size() * sizeof(cl_int);
    size_t bufLocal = localCosts.size() * sizeof(cl_long);
    size_t bufPairs = pairA.size() * sizeof(cl_int);
    size_t bufPairWeights = pairWeights.size() * sizeof(cl_long);
    size_t bufOut = (size_t)numCandidates * numLayers * sizeof(cl_long);

    ScopedMem d_ranks(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufCandidates, ranks.data(), &err));
    checkError(err, "creating d_ranks");
    ScopedMem d_slots(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufSlots, slots.data(), &err));
    checkError(err, "creating d_slots");
    ScopedMem d_localOffsets(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufOffsets, localOffsets.data(), &err));
    checkError(err, "creating d_localOffsets");
    ScopedMem d_localCosts(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufLocal, localCosts.data(), &err));
    checkError(err, "creating d_localCosts");
    ScopedMem d_pairA(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufPairs, pairA.data(), &err));
    checkError(err, "creating d_pairA");
    ScopedMem d_pairB(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufPairs, pairB.data(), &err));
    checkError(err, "creating d_pairB");
    ScopedMem d_pairWeights(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bufPairWeights, pairWeights.data(), &err));
    checkError(err, "creating d_pairWeights");
    ScopedMem d_out(clCreateBuffer(context, CL_MEM_WRITE_ONLY, bufOut, nullptr, &err));
    checkError(err, "creating d_out");

    ScopedKernel kernel(clCreateKernel(program, "eval_costs", &err));
    checkError(err, "creating kernel");

    int arg = 0;
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_ranks.handle); checkError(err, "arg ranks");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_slots.handle); checkError(err, "arg slots");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(int), &numGroups); checkError(err, "arg numGroups");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(int), &numLayers); checkError(err, "arg numLayers");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_localOffsets.handle); checkError(err, "arg localOffsets");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_localCosts.handle); checkError(err, "arg localCosts");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(int), &numPairs); checkError(err, "arg numPairs");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_pairA.handle); checkError(err, "arg pairA");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_pairB.handle); checkError(err, "arg pairB");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_pairWeights.handle); checkError(err, "arg pairWeights");
    err = clSetKernelArg(kernel.handle, arg++, sizeof(cl_mem), &d_out.handle); checkError(err, "arg costOut");

    size_t global = (size_t)numCandidates;
    err = clEnqueueNDRangeKernel(queue, kernel.handle, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueuing eval_costs");
    err = clFinish(queue);
    checkError(err, "finishing queue");

    std::vector<cl_long> flat((size_t)numCandidates * numLayers);
    err = clEnqueueReadBuffer(queue, d_out.handle, CL_TRUE, 0, bufOut, flat.data(), 0, nullptr, nullptr);
    checkError(err, "reading costs");

    for (int c = 0; c < numCandidates; ++c) {
        for (int l = 0; l < numLayers; ++l) out[c][l] = flat[(size_t)c * numLayers + l];
    }
}
