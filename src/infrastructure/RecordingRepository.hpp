/**
 * @file RecordingRepository.hpp
 * @brief Stores recorded audio under the per-user application-data directory.
 */

#pragma once

#include "domain/RecordingStore.hpp"
#include <filesystem>
#include <functional>

namespace localscribe::infrastructure {

/**
 * @class RecordingRepository
 * @brief Writes payloads to `<app data>/recordings/<filename>`.
 *
 * The base directory is resolved on every save so environment changes are honored.
 * Writes are in place (create or truncate, then write); a failed write leaves
 * whatever reached the disk.
 */
class RecordingRepository : public domain::RecordingStore {
public:
    static constexpr const char* kRecordingsDir = "recordings";

    /** @brief Resolves the base directory or throws domain::ConfigurationError. */
    using BaseDirResolver = std::function<std::filesystem::path()>;

    RecordingRepository();
    explicit RecordingRepository(BaseDirResolver resolver);

    std::string saveRecording(const std::string& filename, const std::vector<std::uint8_t>& payload) override;

private:
    BaseDirResolver m_resolveBaseDir;
};

} // namespace localscribe::infrastructure
