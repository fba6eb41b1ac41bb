#include "infrastructure/SidecarTranscriber.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/TextEncoding.hpp"
#include "domain/Errors.hpp"

#include <iostream>
#include <map>

namespace localscribe::infrastructure {

SidecarTranscriber::SidecarTranscriber(std::string sidecarPath, std::shared_ptr<const CredentialResolver> credentials)
    : m_sidecarPath(std::move(sidecarPath))
    , m_credentials(std::move(credentials))
{}

nlohmann::json SidecarTranscriber::transcribe(const std::string& audioPath) {
    std::cout << "[SidecarTranscriber] Invoking transcription for: " << audioPath << std::endl;

    std::map<std::string, std::string> env;
    if (m_credentials) {
        if (auto token = m_credentials->resolve()) {
            env[CredentialResolver::kTokenKey] = *token;
        }
    }

    ProcessOutput output = ProcessRunner::Run(m_sidecarPath, {audioPath}, env);
    // Diagnostics may carry arbitrary bytes (e.g. latin-1 paths in a traceback).
    const std::string stdoutText = TextEncoding::ToValidUtf8(output.stdoutText);
    const std::string stderrText = TextEncoding::ToValidUtf8(output.stderrText);

    if (!output.success()) {
        std::cerr << "[SidecarTranscriber] Sidecar exited with "
                  << (output.termSignal ? "signal " + std::to_string(output.termSignal)
                                        : "code " + std::to_string(output.exitCode))
                  << std::endl;
        throw domain::ProcessError("Sidecar failed: " + stderrText);
    }

    try {
        return nlohmann::json::parse(stdoutText);
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::ProcessError("Failed to parse sidecar output: " + std::string(e.what()) +
                                   ". Output was: " + stdoutText);
    }
}

} // namespace localscribe::infrastructure
