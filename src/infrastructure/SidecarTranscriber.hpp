#pragma once

#include "domain/TranscriptionService.hpp"
#include "infrastructure/CredentialResolver.hpp"
#include <memory>
#include <string>

namespace localscribe::infrastructure {

/**
 * @class SidecarTranscriber
 * @brief Runs the bundled transcription sidecar and passes its JSON output through.
 *
 * Invocation is `<sidecar> <audio path>`; the bearer token, when one resolves, is
 * exported to the child as HF_TOKEN. Both output streams are decoded lossily as UTF-8.
 */
class SidecarTranscriber : public domain::TranscriptionService {
public:
    SidecarTranscriber(std::string sidecarPath, std::shared_ptr<const CredentialResolver> credentials);
    ~SidecarTranscriber() override = default;

    nlohmann::json transcribe(const std::string& audioPath) override;

private:
    std::string m_sidecarPath;
    std::shared_ptr<const CredentialResolver> m_credentials;
};

} // namespace localscribe::infrastructure
