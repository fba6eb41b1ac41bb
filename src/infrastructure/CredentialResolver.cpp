#include "infrastructure/CredentialResolver.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace localscribe::infrastructure {

namespace {

std::string TrimQuotes(const std::string& value) {
    auto begin = value.find_first_not_of('"');
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of('"');
    return value.substr(begin, end - begin + 1);
}

} // namespace

EnvironmentCredentialSource::EnvironmentCredentialSource(std::string variable)
    : m_variable(std::move(variable)) {}

std::optional<std::string> EnvironmentCredentialSource::lookup() const {
    const char* value = std::getenv(m_variable.c_str());
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

std::string EnvironmentCredentialSource::describe() const {
    return "environment variable " + m_variable;
}

FileCredentialSource::FileCredentialSource(std::string path, std::string key)
    : m_path(std::move(path)), m_key(std::move(key)) {}

std::optional<std::string> FileCredentialSource::lookup() const {
    std::ifstream file(m_path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return CredentialResolver::ParseCredentialText(buffer.str(), m_key);
}

std::string FileCredentialSource::describe() const {
    return m_path;
}

CredentialResolver::CredentialResolver(std::vector<std::unique_ptr<CredentialSource>> sources)
    : m_sources(std::move(sources)) {}

CredentialResolver CredentialResolver::CreateDefault(const std::vector<std::string>& candidateFiles) {
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::make_unique<EnvironmentCredentialSource>(kTokenKey));
    for (const auto& path : candidateFiles) {
        sources.push_back(std::make_unique<FileCredentialSource>(path, kTokenKey));
    }
    return CredentialResolver(std::move(sources));
}

std::optional<std::string> CredentialResolver::resolve() const {
    for (const auto& source : m_sources) {
        if (auto token = source->lookup()) {
            std::cout << "[CredentialResolver] Loaded " << kTokenKey << " from " << source->describe() << std::endl;
            return token;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CredentialResolver::ParseCredentialText(const std::string& content, const std::string& key) {
    const std::string prefix = key + "=";
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string token = TrimQuotes(line.substr(prefix.size()));
        if (!token.empty()) {
            return token;
        }
    }
    return std::nullopt;
}

} // namespace localscribe::infrastructure
