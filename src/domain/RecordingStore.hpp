/**
 * @file RecordingStore.hpp
 * @brief Interface for persisting recorded audio payloads.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace localscribe::domain {

/**
 * @class RecordingStore
 * @brief Stores raw audio bytes under a caller-chosen filename.
 */
class RecordingStore {
public:
    virtual ~RecordingStore() = default;

    /**
     * @brief Writes the payload, replacing any file with the same name.
     * @param filename Target file name, trusted as given.
     * @param payload Raw bytes to store.
     * @return Absolute path of the stored file.
     */
    virtual std::string saveRecording(const std::string& filename, const std::vector<std::uint8_t>& payload) = 0;
};

} // namespace localscribe::domain
