#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>


///////////////////////////
///       LOGGING       ///
///////////////////////////
/**
 * @brief Severity threshold for diagnostic messages written to stderr.
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

/// Set the minimum level that gets printed (process-wide, INFO by default).
void setLogLevel(LogLevel level);

/// Current minimum printed level.
LogLevel logLevel();

void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);
