// PathUtils Header
#pragma once
#include <string>
#include <filesystem>
#include <optional>

namespace localscribe::infrastructure {

class PathUtils {
public:
    /** @brief Directory name used under the per-user data and config roots. */
    static constexpr const char* kAppId = "LocalScribe";

    static std::optional<std::filesystem::path> GetDataHome();
    static std::optional<std::filesystem::path> GetConfigHome();

    /** @brief Per-user application-data directory. Throws ConfigurationError when unresolvable. */
    static std::filesystem::path GetAppDataDir();

    /** @brief Default location of settings.json, if a config root can be resolved. */
    static std::optional<std::filesystem::path> GetSettingsFile();

    /** @brief Directory holding the running executable; empty if it cannot be determined. */
    static std::filesystem::path GetExecutableDir();
};

} // namespace localscribe::infrastructure
