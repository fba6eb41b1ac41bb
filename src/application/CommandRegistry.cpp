#include "application/CommandRegistry.hpp"

#include <iostream>
#include <stdexcept>

namespace localscribe::application {

using json = nlohmann::json;

namespace {

json ToEnvelope(const CommandResult<json>& result) {
    if (result.ok()) {
        return {{"ok", true}, {"value", *result.value}};
    }
    return {{"ok", false}, {"error", result.error}};
}

json ToEnvelope(const CommandResult<std::string>& result) {
    if (result.ok()) {
        return {{"ok", true}, {"value", *result.value}};
    }
    return {{"ok", false}, {"error", result.error}};
}

json ErrorEnvelope(const std::string& message) {
    return {{"ok", false}, {"error", message}};
}

std::string RequireString(const json& args, const char* name) {
    if (!args.is_object() || !args.contains(name) || !args[name].is_string()) {
        throw std::invalid_argument(std::string("missing string argument '") + name + "'");
    }
    return args[name].get<std::string>();
}

std::vector<std::uint8_t> RequireBytes(const json& args, const char* name) {
    if (!args.is_object() || !args.contains(name) || !args[name].is_array()) {
        throw std::invalid_argument(std::string("missing byte array argument '") + name + "'");
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(args[name].size());
    for (const auto& item : args[name]) {
        if (!item.is_number_integer() || item.get<long long>() < 0 || item.get<long long>() > 255) {
            throw std::invalid_argument(std::string("argument '") + name + "' must hold byte values 0-255");
        }
        bytes.push_back(static_cast<std::uint8_t>(item.get<int>()));
    }
    return bytes;
}

} // namespace

CommandRegistry::CommandRegistry(AppServices services)
    : m_services(std::move(services)) {
    if (!m_services.taskManager) {
        m_services.taskManager = std::make_shared<AsyncTaskManager>();
    }
    registerHandlers();
}

void CommandRegistry::registerHandlers() {
    m_handlers[kTranscribeAudio] = [this](const json& args) {
        return ToEnvelope(transcribe(RequireString(args, "filePath")));
    };
    m_handlers[kSummarizeText] = [this](const json& args) {
        return ToEnvelope(summarize(RequireString(args, "text")));
    };
    m_handlers[kSaveAudio] = [this](const json& args) {
        auto payload = RequireBytes(args, "payload");
        return ToEnvelope(saveAudio(payload, RequireString(args, "filename")));
    };
    m_handlers[kListTasks] = [this](const json&) {
        return json{{"ok", true}, {"value", activeTasks()}};
    };
}

json CommandRegistry::activeTasks() {
    json tasks = json::array();
    for (const auto& status : m_services.taskManager->GetActiveTasks()) {
        tasks.push_back({
            {"id", status->id},
            {"type", TaskTypeName(status->type)},
            {"description", status->description}
        });
    }
    return tasks;
}

CommandResult<json> CommandRegistry::transcribe(const std::string& filePath) {
    if (!m_services.transcriptionService) {
        return CommandResult<json>::Failure("Transcription service is not configured");
    }
    try {
        return CommandResult<json>::Success(m_services.transcriptionService->transcribe(filePath));
    } catch (const std::exception& e) {
        std::cerr << "[CommandRegistry] " << kTranscribeAudio << " failed: " << e.what() << std::endl;
        return CommandResult<json>::Failure(e.what());
    }
}

CommandResult<std::string> CommandRegistry::summarize(const std::string& text) {
    if (!m_services.summarizationService) {
        return CommandResult<std::string>::Failure("Summarization service is not configured");
    }
    try {
        return CommandResult<std::string>::Success(m_services.summarizationService->summarize(text));
    } catch (const std::exception& e) {
        std::cerr << "[CommandRegistry] " << kSummarizeText << " failed: " << e.what() << std::endl;
        return CommandResult<std::string>::Failure(e.what());
    }
}

CommandResult<std::string> CommandRegistry::saveAudio(const std::vector<std::uint8_t>& payload, const std::string& filename) {
    if (!m_services.recordingStore) {
        return CommandResult<std::string>::Failure("Recording store is not configured");
    }
    try {
        return CommandResult<std::string>::Success(m_services.recordingStore->saveRecording(filename, payload));
    } catch (const std::exception& e) {
        std::cerr << "[CommandRegistry] " << kSaveAudio << " failed: " << e.what() << std::endl;
        return CommandResult<std::string>::Failure(e.what());
    }
}

json CommandRegistry::invoke(const std::string& command, const json& args) {
    auto it = m_handlers.find(command);
    if (it == m_handlers.end()) {
        std::cerr << "[CommandRegistry] Unknown command: " << command << std::endl;
        return ErrorEnvelope("Unknown command: " + command);
    }
    try {
        return it->second(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CommandRegistry] Invalid arguments for " << command << ": " << e.what() << std::endl;
        return ErrorEnvelope("Invalid arguments for " + command + ": " + e.what());
    }
}

std::future<json> CommandRegistry::invokeAsync(const std::string& command, json args) {
    return m_services.taskManager->SubmitTask(TaskTypeFor(command), command,
        [this, command, args = std::move(args)]() {
            return invoke(command, args);
        });
}

std::vector<std::string> CommandRegistry::commandNames() const {
    std::vector<std::string> names;
    for (const auto& [name, handler] : m_handlers) {
        names.push_back(name);
    }
    return names;
}

TaskType CommandRegistry::TaskTypeFor(const std::string& command) {
    if (command == kTranscribeAudio) return TaskType::Transcription;
    if (command == kSummarizeText) return TaskType::Summarization;
    if (command == kSaveAudio) return TaskType::SaveRecording;
    return TaskType::Other;
}

const char* CommandRegistry::TaskTypeName(TaskType type) {
    switch (type) {
        case TaskType::Transcription: return "transcription";
        case TaskType::Summarization: return "summarization";
        case TaskType::SaveRecording: return "save_recording";
        case TaskType::Other: return "other";
    }
    return "other";
}

} // namespace localscribe::application
