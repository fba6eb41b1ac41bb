/**
 * @file OllamaSummarizer.hpp
 * @brief Summarization backed by a local Ollama server.
 */

#pragma once
#include "domain/SummarizationService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace localscribe::infrastructure {

/**
 * @class OllamaSummarizer
 * @brief Implements SummarizationService with a single /api/generate call.
 */
class OllamaSummarizer : public domain::SummarizationService {
public:
    static constexpr const char* kInstruction = "Summarize the following text concisely:\n\n";

    /**
     * @param client Configured HTTP client.
     * @param model Model identifier sent with every request.
     */
    OllamaSummarizer(OllamaClient client, std::string model = "qwen2.5-coder:7b");

    /** @brief Summarizes text. @see domain::SummarizationService::summarize */
    std::string summarize(const std::string& text) override;

    static std::string BuildPrompt(const std::string& text);

private:
    OllamaClient m_client; ///< HTTP transport.
    std::string m_model; ///< Target model name.
};

} // namespace localscribe::infrastructure
