///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::atomic<int> gLevel{static_cast<int>(LogLevel::INFO)};

/// Serializes lines written by concurrent search workers.
static std::mutex gLogMutex;

static void emit(LogLevel level, const char* tag, const std::string& msg) {
    if (static_cast<int>(level) < gLevel.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cerr << tag << " " << msg << "\n";
}


///////////////////////////
///       LOGGING       ///
///////////////////////////
void setLogLevel(LogLevel level) {
    gLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(gLevel.load(std::memory_order_relaxed));
}

void logDebug(const std::string& msg) { emit(LogLevel::DEBUG, "DEBUG", msg); }
void logInfo(const std::string& msg)  { emit(LogLevel::INFO,  "INFO ", msg); }
void logWarn(const std::string& msg)  { emit(LogLevel::WARN,  "WARN ", msg); }
void logError(const std::string& msg) { emit(LogLevel::ERROR, "ERROR", msg); }
