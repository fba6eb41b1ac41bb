/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access the sidecar location, the Ollama endpoint and
 * the credential file list without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace localscribe::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective runtime settings. Defaults describe a stock desktop install.
 */
struct AppConfig {
    std::string sidecarPath;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5-coder:7b";
    int ollamaReadTimeoutSeconds = 600;
    std::vector<std::string> credentialFiles = {"../.credentials", ".credentials"};

    /** @brief Defaults, with the sidecar resolved beside the running executable. */
    static AppConfig Defaults();
};

class ConfigLoader {
public:
    /**
     * @brief Builds the effective configuration.
     * @param settingsPath Explicit settings.json path; when absent the per-user config file is used.
     * @return Defaults overridden by whatever valid keys the file provides.
     *
     * A missing file is not an error. A malformed file is reported and ignored.
     */
    static AppConfig Load(const std::optional<std::string>& settingsPath = std::nullopt);

    /** @brief Applies the keys of an already-read settings document on top of @p config. */
    static void ApplySettings(AppConfig& config, const std::string& settingsText);
};

} // namespace localscribe::infrastructure
