#include "infrastructure/OllamaSummarizer.hpp"
#include <iostream>

namespace localscribe::infrastructure {

OllamaSummarizer::OllamaSummarizer(OllamaClient client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::string OllamaSummarizer::BuildPrompt(const std::string& text) {
    return std::string(kInstruction) + text;
}

std::string OllamaSummarizer::summarize(const std::string& text) {
    std::cout << "[OllamaSummarizer] Summarizing text (length: " << text.size() << ")" << std::endl;
    std::string summary = m_client.generate(m_model, BuildPrompt(text));
    std::cout << "[OllamaSummarizer] Summarization successful" << std::endl;
    return summary;
}

} // namespace localscribe::infrastructure
