#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Base class of every error raised by the scheduler before search.
 */
class SchedulerError : public std::runtime_error {
public:
    explicit SchedulerError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Input facts are inconsistent (dangling references, duplicates, bad values).
 */
class DataIntegrityError : public SchedulerError {
public:
    explicit DataIntegrityError(const std::string& what)
            : SchedulerError("data integrity error: " + what) {}
};

/**
 * @brief Optimizer configuration is invalid (unknown rule, negative weight, bad budget).
 */
class ConfigurationError : public SchedulerError {
public:
    explicit ConfigurationError(const std::string& what)
            : SchedulerError("configuration error: " + what) {}
};
