/**
 * @file Errors.hpp
 * @brief Exception types raised by the backend, grouped by failure origin.
 *
 * The message is the whole contract: callers surface what() verbatim.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace localscribe::domain {

/** @brief Directory resolution or settings failures. */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Spawn failure, non-zero exit or malformed output of an external process. */
class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Transport failure, non-success status or unexpected body from an HTTP API. */
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief File creation or write failures. */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace localscribe::domain
