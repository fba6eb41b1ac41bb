/**
 * @file LocalScribeApp.hpp
 * @brief Command-line host for the LocalScribe backend.
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace localscribe::app {

/**
 * @class LocalScribeApp
 * @brief Wires configuration and services together and runs one CLI invocation.
 *
 * Usage:
 *   localscribe [--config <settings.json>] transcribe <audio file>
 *   localscribe [--config <settings.json>] summarize [text]      (stdin when text is omitted)
 *   localscribe [--config <settings.json>] save <filename> <source file>
 *   localscribe [--config <settings.json>] serve                 (JSON lines on stdin/stdout)
 */
class LocalScribeApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitCommandFailed = 1;
    static constexpr int kExitUsage = 2;

    /**
     * @brief Parses arguments and runs the requested command.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

    /** @brief Builds the production services for a configuration. */
    static application::AppServices BuildServices(const infrastructure::AppConfig& config);

    /**
     * @brief Reads JSON request lines from @p in and writes one response line per request to @p out.
     *
     * Requests run concurrently; responses are written as they complete.
     * Returns once input is exhausted and every response has been written.
     */
    static void Serve(const application::AppServices& services, std::istream& in, std::ostream& out);

private:
    static void PrintUsage(std::ostream& out);
};

} // namespace localscribe::app
