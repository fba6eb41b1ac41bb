/**
 * @file LocalScribeApp.cpp
 * @brief Implementation of the LocalScribeApp class.
 */
#include "app/LocalScribeApp.hpp"

#include "application/CommandRegistry.hpp"
#include "infrastructure/CredentialResolver.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaSummarizer.hpp"
#include "infrastructure/RecordingRepository.hpp"
#include "infrastructure/SidecarTranscriber.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>

namespace localscribe::app {

using json = nlohmann::json;

namespace {

/** @brief Sends std::cout to stderr for its lifetime so stdout carries results only. */
class StdoutToStderr {
public:
    StdoutToStderr() : m_previous(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutToStderr() { std::cout.rdbuf(m_previous); }
    StdoutToStderr(const StdoutToStderr&) = delete;
    StdoutToStderr& operator=(const StdoutToStderr&) = delete;

    std::streambuf* original() const { return m_previous; }

private:
    std::streambuf* m_previous;
};

} // namespace

application::AppServices LocalScribeApp::BuildServices(const infrastructure::AppConfig& config) {
    auto credentials = std::make_shared<const infrastructure::CredentialResolver>(
        infrastructure::CredentialResolver::CreateDefault(config.credentialFiles));

    application::AppServices services;
    services.transcriptionService = std::make_shared<infrastructure::SidecarTranscriber>(config.sidecarPath, credentials);
    services.summarizationService = std::make_shared<infrastructure::OllamaSummarizer>(
        infrastructure::OllamaClient(config.ollamaHost, config.ollamaPort, config.ollamaReadTimeoutSeconds),
        config.ollamaModel);
    services.recordingStore = std::make_shared<infrastructure::RecordingRepository>();
    services.taskManager = std::make_shared<application::AsyncTaskManager>();
    return services;
}

void LocalScribeApp::Serve(const application::AppServices& services, std::istream& in, std::ostream& out) {
    application::CommandRegistry registry(services);
    std::mutex outMutex;
    std::vector<std::future<void>> pending;

    // Error strings can carry bytes from external tools; never let encoding abort the session.
    auto writeLine = [&out, &outMutex](const json& response) {
        std::string encoded = response.dump(-1, ' ', false, json::error_handler_t::replace);
        std::lock_guard<std::mutex> lock(outMutex);
        out << encoded << "\n";
        out.flush();
    };

    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json request;
        try {
            request = json::parse(line);
        } catch (const json::parse_error& e) {
            writeLine({{"id", nullptr}, {"ok", false}, {"error", std::string("Malformed request: ") + e.what()}});
            continue;
        }

        json id = request.is_object() && request.contains("id") ? request["id"] : json(nullptr);
        if (!request.is_object() || !request.contains("command") || !request["command"].is_string()) {
            writeLine({{"id", id}, {"ok", false}, {"error", "Malformed request: missing 'command'"}});
            continue;
        }
        std::string command = request["command"].get<std::string>();
        json args = request.contains("args") ? request["args"] : json::object();

        // One waiter per request so a slow command never delays another's response.
        auto future = std::make_shared<std::future<json>>(registry.invokeAsync(command, std::move(args)));
        pending.push_back(std::async(std::launch::async, [future, id, writeLine]() {
            json response;
            try {
                response = future->get();
            } catch (const std::exception& e) {
                std::cerr << "[LocalScribe] Command task failed: " << e.what() << std::endl;
                response = {{"ok", false}, {"error", e.what()}};
            }
            response["id"] = id;
            try {
                writeLine(response);
            } catch (const std::exception& e) {
                std::cerr << "[LocalScribe] Failed to write response: " << e.what() << std::endl;
                writeLine({{"id", id}, {"ok", false}, {"error", "Failed to encode response"}});
            }
        }));

        pending.erase(std::remove_if(pending.begin(), pending.end(), [](const std::future<void>& waiter) {
            return waiter.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), pending.end());
    }

    for (auto& waiter : pending) {
        waiter.get();
    }
}

int LocalScribeApp::Run(const std::vector<std::string>& args) {
    std::optional<std::string> settingsPath;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "--config requires a path" << std::endl;
                return kExitUsage;
            }
            settingsPath = args[++i];
        } else if (args[i] == "--help" || args[i] == "-h") {
            PrintUsage(std::cout);
            return kExitOk;
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.empty()) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const std::string& command = positional[0];

    StdoutToStderr redirect;
    std::ostream resultOut(redirect.original());

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(settingsPath);

    if (command == "serve" && positional.size() == 1) {
        std::cerr << "[LocalScribe] Serving commands on stdin (sidecar: " << config.sidecarPath << ")" << std::endl;
        Serve(BuildServices(config), std::cin, resultOut);
        return kExitOk;
    }

    application::CommandRegistry registry(BuildServices(config));

    if (command == "transcribe" && positional.size() == 2) {
        auto result = registry.transcribe(positional[1]);
        if (!result.ok()) {
            std::cerr << "Transcription Failed: " << result.error << std::endl;
            return kExitCommandFailed;
        }
        resultOut << result.value->dump(2) << std::endl;
        return kExitOk;
    }

    if (command == "summarize" && positional.size() <= 2) {
        std::string text;
        if (positional.size() == 2) {
            text = positional[1];
        } else {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        auto result = registry.summarize(text);
        if (!result.ok()) {
            std::cerr << "Summary failed: " << result.error << std::endl;
            return kExitCommandFailed;
        }
        resultOut << *result.value << std::endl;
        return kExitOk;
    }

    if (command == "save" && positional.size() == 3) {
        std::ifstream source(positional[2], std::ios::binary);
        if (!source.is_open()) {
            std::cerr << "Cannot open source file: " << positional[2] << std::endl;
            return kExitCommandFailed;
        }
        std::vector<std::uint8_t> payload((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());
        auto result = registry.saveAudio(payload, positional[1]);
        if (!result.ok()) {
            std::cerr << "Save failure: " << result.error << std::endl;
            return kExitCommandFailed;
        }
        resultOut << *result.value << std::endl;
        return kExitOk;
    }

    PrintUsage(std::cerr);
    return kExitUsage;
}

void LocalScribeApp::PrintUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  localscribe [--config <settings.json>] transcribe <audio file>\n"
        << "  localscribe [--config <settings.json>] summarize [text]\n"
        << "  localscribe [--config <settings.json>] save <filename> <source file>\n"
        << "  localscribe [--config <settings.json>] serve\n";
}

} // namespace localscribe::app
