///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "search_limits.hpp"


///////////////////////////
///       LIMITS        ///
///////////////////////////
SearchLimits::SearchLimits(const SearchBudget& budget)
        : budget_(budget),
          start_(std::chrono::steady_clock::now()) {}

double SearchLimits::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void SearchLimits::expire() {
    expired_.store(true, std::memory_order_relaxed);
    stop_.store(true, std::memory_order_relaxed);
}

bool SearchLimits::checkTime() {
    if (stopped()) return false;
    if (budget_.maxTimeSeconds > 0 && elapsedSeconds() > budget_.maxTimeSeconds) {
        expire();
        return false;
    }
    return true;
}

/**
 * @brief Count a node and check every limit.
 *
 * The clock is only read every 256 nodes.
 */
bool SearchLimits::countNode() {
    if (stopped()) return false;
    long long n = nodes_.fetch_add(1, std::memory_order_relaxed) + 1;

    if (budget_.maxNodes > 0 && n > budget_.maxNodes) {
        expire();
        return false;
    }
    if (budget_.maxCandidates > 0 && candidates() >= budget_.maxCandidates) {
        expire();
        return false;
    }
    if ((n & 255) == 0) return checkTime();
    return true;
}

void SearchLimits::countCandidate() {
    candidates_.fetch_add(1, std::memory_order_relaxed);
}
