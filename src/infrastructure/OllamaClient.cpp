#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

namespace localscribe::infrastructure {

using json = nlohmann::json;

namespace {
constexpr const char* kMissingResponseField = "Ollama response missing 'response' field";
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

json OllamaClient::BuildGenerateRequest(const std::string& model, const std::string& prompt) {
    return {
        {"model", model},
        {"prompt", prompt},
        {"stream", false}
    };
}

std::string OllamaClient::ParseGenerateResponse(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        throw domain::ApiError("Failed to parse Ollama response: " + std::string(e.what()));
    }

    if (!parsed.is_object() || !parsed.contains("response") || !parsed["response"].is_string()) {
        std::cerr << "[OllamaClient] " << kMissingResponseField << std::endl;
        throw domain::ApiError(kMissingResponseField);
    }
    return parsed["response"].get<std::string>();
}

std::string OllamaClient::generate(const std::string& model, const std::string& prompt) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds, 0);

    json requestData = BuildGenerateRequest(model, prompt);

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (!res) {
        std::string reason = httplib::to_string(res.error());
        std::cerr << "[OllamaClient] Connection failed: " << reason << std::endl;
        throw domain::ApiError("Ollama request failed: " + reason);
    }

    if (res->status < 200 || res->status >= 300) {
        std::string status = std::to_string(res->status);
        if (!res->reason.empty()) {
            status += " " + res->reason;
        }
        std::cerr << "[OllamaClient] HTTP Error " << status << std::endl;
        throw domain::ApiError("Ollama API error: " + status);
    }

    return ParseGenerateResponse(res->body);
}

} // namespace localscribe::infrastructure
