#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "configuration.hpp"
#include <atomic>
#include <chrono>


///////////////////////////
///       LIMITS        ///
///////////////////////////
/**
 * @brief Shared, thread-safe search budget with cooperative cancellation.
 *
 * The clock starts on construction, so candidate enumeration and ranking
 * are charged to the same budget as the search itself. Every worker polls
 * stopped() and reports nodes and complete candidates; once a limit is hit
 * the stop flag is raised for everyone.
 */
class SearchLimits {
public:
    explicit SearchLimits(const SearchBudget& budget);

    /**
     * @brief Account for one expanded node.
     *
     * @return false if the search must stop (any limit reached or stop() called).
     */
    bool countNode();

    /// Account for one complete timetable reached by the search.
    void countCandidate();

    /**
     * @brief Read the clock outside the search tree.
     *
     * @return false if the time limit has passed or the search was stopped.
     */
    bool checkTime();

    /// Raise the stop flag without marking the budget as exhausted.
    void stop() { stop_.store(true, std::memory_order_relaxed); }

    bool stopped() const { return stop_.load(std::memory_order_relaxed); }

    /// True if a time, node or candidate limit caused the stop.
    bool budgetExpired() const { return expired_.load(std::memory_order_relaxed); }

    long long nodes() const { return nodes_.load(std::memory_order_relaxed); }
    long long candidates() const { return candidates_.load(std::memory_order_relaxed); }

    double elapsedSeconds() const;

private:
    SearchBudget budget_;
    std::chrono::steady_clock::time_point start_;

    std::atomic<long long> nodes_{0};
    std::atomic<long long> candidates_{0};
    std::atomic<bool> stop_{false};
    std::atomic<bool> expired_{false};

    void expire();
};
