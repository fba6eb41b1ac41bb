/**
 * @file CredentialResolver.hpp
 * @brief Layered lookup of the transcription bearer token.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace localscribe::infrastructure {

/**
 * @class CredentialSource
 * @brief One place a credential may live. Absence is a normal outcome, never an error.
 */
class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    /** @brief Returns a non-empty secret, or nullopt if this source has none. */
    virtual std::optional<std::string> lookup() const = 0;

    /** @brief Human-readable origin used in diagnostics. Never the secret itself. */
    virtual std::string describe() const = 0;
};

/** @brief Reads a process environment variable. */
class EnvironmentCredentialSource : public CredentialSource {
public:
    explicit EnvironmentCredentialSource(std::string variable);

    std::optional<std::string> lookup() const override;
    std::string describe() const override;

private:
    std::string m_variable;
};

/**
 * @brief Scans a line-oriented text file for `KEY=value`.
 *
 * Surrounding double quotes are stripped. Lines with an empty value are skipped.
 */
class FileCredentialSource : public CredentialSource {
public:
    FileCredentialSource(std::string path, std::string key);

    std::optional<std::string> lookup() const override;
    std::string describe() const override;

private:
    std::string m_path;
    std::string m_key;
};

/**
 * @class CredentialResolver
 * @brief Tries an ordered list of sources; the first non-empty result wins.
 */
class CredentialResolver {
public:
    static constexpr const char* kTokenKey = "HF_TOKEN";

    explicit CredentialResolver(std::vector<std::unique_ptr<CredentialSource>> sources);

    /** @brief Environment variable first, then each candidate file in order. */
    static CredentialResolver CreateDefault(const std::vector<std::string>& candidateFiles);

    std::optional<std::string> resolve() const;

    /** @brief Extracts the value of `key` from credential file content. Exposed for reuse. */
    static std::optional<std::string> ParseCredentialText(const std::string& content, const std::string& key);

private:
    std::vector<std::unique_ptr<CredentialSource>> m_sources;
};

} // namespace localscribe::infrastructure
