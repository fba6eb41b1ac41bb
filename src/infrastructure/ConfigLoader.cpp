/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace localscribe::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ReadIntInRange(const nlohmann::json& j, const char* key, int minValue, int maxValue, int& target) {
    int value = target;
    ReadKey(j, key, value);
    if (value < minValue || value > maxValue) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << value
                  << " is outside " << minValue << "-" << maxValue << std::endl;
        return;
    }
    target = value;
}

} // namespace

AppConfig AppConfig::Defaults() {
    AppConfig config;
    std::filesystem::path exeDir = PathUtils::GetExecutableDir();
    config.sidecarPath = exeDir.empty() ? "api-sidecar" : (exeDir / "api-sidecar").string();
    return config;
}

AppConfig ConfigLoader::Load(const std::optional<std::string>& settingsPath) {
    AppConfig config = AppConfig::Defaults();

    std::optional<std::filesystem::path> configPath;
    if (settingsPath) {
        configPath = std::filesystem::path(*settingsPath);
    } else {
        configPath = PathUtils::GetSettingsFile();
    }

    if (!configPath || !std::filesystem::exists(*configPath)) {
        return config;
    }

    std::ifstream f(*configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath->string() << ", using defaults" << std::endl;
        return config;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    ApplySettings(config, buffer.str());
    return config;
}

void ConfigLoader::ApplySettings(AppConfig& config, const std::string& settingsText) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(settingsText);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json must hold a JSON object, using defaults" << std::endl;
        return;
    }

    ReadKey(j, "sidecar_path", config.sidecarPath);
    ReadKey(j, "ollama_host", config.ollamaHost);
    ReadIntInRange(j, "ollama_port", 1, 65535, config.ollamaPort);
    ReadKey(j, "ollama_model", config.ollamaModel);
    ReadIntInRange(j, "ollama_read_timeout", 1, 86400, config.ollamaReadTimeoutSeconds);
    ReadKey(j, "credential_files", config.credentialFiles);
}

} // namespace localscribe::infrastructure
