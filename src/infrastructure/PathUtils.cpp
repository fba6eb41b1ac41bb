#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace localscribe::infrastructure {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> FromEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return fs::path(value);
    }
    return std::nullopt;
}

} // namespace

std::optional<fs::path> PathUtils::GetDataHome() {
#if defined(_WIN32)
    return FromEnv("APPDATA");
#else
    if (auto xdgDataHome = FromEnv("XDG_DATA_HOME")) {
        return xdgDataHome;
    }
    if (auto home = FromEnv("HOME")) {
        return *home / ".local" / "share";
    }
    return std::nullopt;
#endif
}

std::optional<fs::path> PathUtils::GetConfigHome() {
#if defined(_WIN32)
    return FromEnv("APPDATA");
#else
    if (auto xdgConfigHome = FromEnv("XDG_CONFIG_HOME")) {
        return xdgConfigHome;
    }
    if (auto home = FromEnv("HOME")) {
        return *home / ".config";
    }
    return std::nullopt;
#endif
}

fs::path PathUtils::GetAppDataDir() {
    auto dataHome = GetDataHome();
    if (!dataHome) {
        throw domain::ConfigurationError("Failed to resolve app data dir: no per-user data directory is configured");
    }
    return *dataHome / kAppId;
}

std::optional<fs::path> PathUtils::GetSettingsFile() {
    auto configHome = GetConfigHome();
    if (!configHome) {
        return std::nullopt;
    }
    return *configHome / kAppId / "settings.json";
}

fs::path PathUtils::GetExecutableDir() {
#if defined(__linux__)
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path();
    }
#endif
    return {};
}

} // namespace localscribe::infrastructure
