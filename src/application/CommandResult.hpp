/**
 * @file CommandResult.hpp
 * @brief Success value or error message returned across the command boundary.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace localscribe::application {

template <typename T>
struct CommandResult {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }

    static CommandResult Success(T v) { return CommandResult{std::move(v), {}}; }
    static CommandResult Failure(std::string message) { return CommandResult{std::nullopt, std::move(message)}; }
};

} // namespace localscribe::application
