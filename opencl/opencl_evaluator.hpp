#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "cost_model.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief One complete timetable waiting to be scored on the device.
 */
struct BatchCandidate {
    std::vector<int> ranks; ///< Candidate rank chosen for each group.
    std::vector<SlotSet> groupSlots; ///< Fixed plus chosen slots per group.
    std::vector<int> path; ///< Search-order key.
};

/**
 * @brief OpenCL helper context for batched timetable scoring.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to score many complete timetables in parallel on the GPU.
 */
class TimetableOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the OpenCL program containing the scoring kernel.
     * Throws std::runtime_error if OpenCL setup fails.
     */
    TimetableOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~TimetableOpenCLContext();

    TimetableOpenCLContext(const TimetableOpenCLContext&) = delete;
    TimetableOpenCLContext& operator=(const TimetableOpenCLContext&) = delete;

    /**
     * @brief Evaluate a batch of complete timetables on the device.
     *
     * Each work item sums the precomputed local cost of every group at its
     * chosen rank, plus, for every group pair with a pair weight, the weight
     * times the number of common slots. On return costs[i] holds the layered
     * cost of batch[i], equal to CostModel::evaluate().
     */
    void evaluateBatch(
            const CostModel& costs,
            const SearchSpace& space,
            const std::vector<BatchCandidate>& batch,
            std::vector<CostVector>& out
    );

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
