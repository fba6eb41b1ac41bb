/**
 * @file ProcessRunner.hpp
 * @brief Spawns a child process and captures its complete output.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace localscribe::infrastructure {

/**
 * @struct ProcessOutput
 * @brief Result of a finished child process.
 */
struct ProcessOutput {
    int exitCode = -1;        ///< Exit status, or -1 when terminated by a signal.
    int termSignal = 0;       ///< Signal number when the child did not exit normally.
    std::string stdoutText;
    std::string stderrText;

    bool success() const { return exitCode == 0; }
};

/**
 * @class ProcessRunner
 * @brief Runs an executable directly (no shell) and blocks until it exits.
 *
 * The child inherits the current environment plus @p extraEnv. Both output streams
 * are drained concurrently, so a chatty child cannot deadlock on a full pipe.
 * There is no timeout.
 */
class ProcessRunner {
public:
    /**
     * @throws domain::ProcessError if the process cannot be started.
     */
    static ProcessOutput Run(const std::string& executable,
                             const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& extraEnv = {});
};

} // namespace localscribe::infrastructure
