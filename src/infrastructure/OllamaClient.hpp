/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace localscribe::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 600);

    /**
     * @brief Sends a non-streaming POST request to /api/generate.
     * @return The `response` field of the reply.
     * @throws domain::ApiError on transport failure, non-2xx status, unparseable body
     *         or a missing/non-string `response` field.
     */
    std::string generate(const std::string& model, const std::string& prompt);

    /** @brief Builds the JSON body sent by generate(). */
    static nlohmann::json BuildGenerateRequest(const std::string& model, const std::string& prompt);

    /** @brief Extracts the generated text from a /api/generate reply body. */
    static std::string ParseGenerateResponse(const std::string& body);

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace localscribe::infrastructure
