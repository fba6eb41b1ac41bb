/**
 * @file RecordingRepository.cpp
 * @brief Implementation of the RecordingRepository class.
 */
#include "infrastructure/RecordingRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace localscribe::infrastructure {

RecordingRepository::RecordingRepository()
    : m_resolveBaseDir(&PathUtils::GetAppDataDir) {}

RecordingRepository::RecordingRepository(BaseDirResolver resolver)
    : m_resolveBaseDir(std::move(resolver)) {}

std::string RecordingRepository::saveRecording(const std::string& filename, const std::vector<std::uint8_t>& payload) {
    // 1. Base directory
    fs::path baseDir;
    try {
        baseDir = m_resolveBaseDir();
    } catch (const domain::ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::ConfigurationError("Failed to resolve app data dir: " + std::string(e.what()));
    }

    // 2. Recordings directory
    fs::path recordingsDir = baseDir / kRecordingsDir;
    std::error_code ec;
    fs::create_directories(recordingsDir, ec);
    if (ec) {
        std::cerr << "[RecordingRepository] Error creating directories: " << ec.message() << std::endl;
        throw domain::StorageError("Failed to create recordings directory " + recordingsDir.string() + ": " + ec.message());
    }

    // 3. Create or truncate
    fs::path filePath = recordingsDir / filename;
    std::ofstream ofs(filePath, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        std::string reason = std::strerror(errno);
        std::cerr << "[RecordingRepository] Failed to open file: " << filePath << std::endl;
        throw domain::StorageError("Failed to create file " + filePath.string() + ": " + reason);
    }

    // 4. Write
    std::string bytes(payload.begin(), payload.end());
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (ofs.fail()) {
        std::string reason = std::strerror(errno);
        std::cerr << "[RecordingRepository] Write failed during output: " << filePath << std::endl;
        throw domain::StorageError("Failed to write file " + filePath.string() + ": " + reason);
    }

    fs::path absolutePath = fs::absolute(filePath, ec);
    if (ec) {
        absolutePath = filePath;
    }
    std::cout << "[RecordingRepository] Saved " << payload.size() << " bytes to " << absolutePath.string() << std::endl;
    return absolutePath.string();
}

} // namespace localscribe::infrastructure
