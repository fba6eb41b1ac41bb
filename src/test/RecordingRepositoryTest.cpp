#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RecordingRepository.hpp"

using namespace localscribe;
using namespace localscribe::infrastructure;
namespace fs = std::filesystem;

namespace {

std::vector<std::uint8_t> ReadBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value) return std::string(value);
    return std::nullopt;
}

void RestoreEnv(const char* name, const std::optional<std::string>& value) {
    if (value) {
        ::setenv(name, value->c_str(), 1);
    } else {
        ::unsetenv(name);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting RecordingRepository Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / ("localscribe_recordings_" + std::to_string(::getpid()));
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    auto savedXdg = GetEnv("XDG_DATA_HOME");
    auto savedHome = GetEnv("HOME");
    ::setenv("XDG_DATA_HOME", testRoot.string().c_str(), 1);

    RecordingRepository repository;
    fs::path expectedDir = testRoot / PathUtils::kAppId / RecordingRepository::kRecordingsDir;
    assert(!fs::exists(expectedDir));

    // First save creates the directory tree and writes exactly the payload.
    {
        std::string stored = repository.saveRecording("r.webm", {1, 2, 3});
        fs::path storedPath(stored);
        assert(storedPath.is_absolute());
        assert(fs::is_directory(expectedDir));
        assert(fs::equivalent(storedPath, expectedDir / "r.webm"));
        assert(ReadBytes(storedPath) == (std::vector<std::uint8_t>{1, 2, 3}));
        std::cout << "[PASS] Directory created and bytes written." << std::endl;
    }

    // Saving again under the same name replaces the content.
    {
        std::string stored = repository.saveRecording("r.webm", {9});
        assert(ReadBytes(stored) == (std::vector<std::uint8_t>{9}));
        assert(fs::file_size(stored) == 1);
        std::cout << "[PASS] Re-save truncates." << std::endl;
    }

    // Empty payloads and binary content round through unchanged.
    {
        std::string empty = repository.saveRecording("empty.m4a", {});
        assert(fs::exists(empty) && fs::file_size(empty) == 0);

        std::vector<std::uint8_t> binary;
        for (int i = 0; i < 256; ++i) binary.push_back(static_cast<std::uint8_t>(i));
        std::string stored = repository.saveRecording("all_bytes.webm", binary);
        assert(ReadBytes(stored) == binary);
        std::cout << "[PASS] Empty and binary payloads stored." << std::endl;
    }

    // A base directory that cannot hold subdirectories fails at directory creation.
    {
        fs::path blocker = testRoot / "blocker";
        std::ofstream(blocker.string()).put('x');
        RecordingRepository blocked([blocker]() { return blocker; });
        try {
            blocked.saveRecording("r.webm", {1});
            assert(false && "expected StorageError");
        } catch (const domain::StorageError& e) {
            assert(std::string(e.what()).rfind("Failed to create recordings directory", 0) == 0);
        }
        std::cout << "[PASS] Directory failure names the step." << std::endl;
    }

    // Without any per-user data root the save fails before touching the disk.
    {
        ::unsetenv("XDG_DATA_HOME");
        ::unsetenv("HOME");
        try {
            repository.saveRecording("r.webm", {1});
            assert(false && "expected ConfigurationError");
        } catch (const domain::ConfigurationError& e) {
            assert(std::string(e.what()).rfind("Failed to resolve app data dir", 0) == 0);
        }
        std::cout << "[PASS] Unresolvable data dir reported." << std::endl;
    }

    RestoreEnv("XDG_DATA_HOME", savedXdg);
    RestoreEnv("HOME", savedHome);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
