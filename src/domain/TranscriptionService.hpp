/**
 * @file TranscriptionService.hpp
 * @brief Interface for audio-to-text transcription.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace localscribe::domain {

/**
 * @class TranscriptionService
 * @brief Abstract interface for services that convert audio files to a structured transcript.
 *
 * Callers needing concurrency run it through application::AsyncTaskManager.
 * The transcript is opaque at this layer: it is passed through to the caller as parsed JSON.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes an audio file, blocking until the work is done.
     * @param audioPath Path to the input audio file. Not validated here.
     * @return The transcript as produced by the transcription engine.
     * @throws ProcessError on any failure.
     */
    virtual nlohmann::json transcribe(const std::string& audioPath) = 0;
};

} // namespace localscribe::domain
