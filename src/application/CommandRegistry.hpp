/**
 * @file CommandRegistry.hpp
 * @brief Front-end facing command surface: transcribe, summarize and save audio.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/AppServices.hpp"
#include "application/CommandResult.hpp"

namespace localscribe::application {

/**
 * @class CommandRegistry
 * @brief Exposes the backend operations as independent request/response commands.
 *
 * Every failure raised below this layer is caught here, logged, and returned
 * as the command's error string. Nothing is retried.
 */
class CommandRegistry {
public:
    static constexpr const char* kTranscribeAudio = "transcribe_audio";
    static constexpr const char* kSummarizeText = "summarize_text";
    static constexpr const char* kSaveAudio = "save_audio";
    static constexpr const char* kListTasks = "list_tasks";

    explicit CommandRegistry(AppServices services);
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    CommandResult<nlohmann::json> transcribe(const std::string& filePath);
    CommandResult<std::string> summarize(const std::string& text);
    CommandResult<std::string> saveAudio(const std::vector<std::uint8_t>& payload, const std::string& filename);

    /** @brief Commands still in flight: `[{"id", "type", "description"}]`, oldest first. */
    nlohmann::json activeTasks();

    /**
     * @brief Dispatches a command by name.
     * @param command One of the kXxx command names.
     * @param args Argument object, e.g. `{"filePath": "..."}` for transcribe_audio.
     * @return `{"ok": true, "value": ...}` or `{"ok": false, "error": "..."}`.
     */
    nlohmann::json invoke(const std::string& command, const nlohmann::json& args);

    /** @brief Runs invoke() as an independent background task. */
    std::future<nlohmann::json> invokeAsync(const std::string& command, nlohmann::json args);

    /** @brief Registered command names, sorted. */
    std::vector<std::string> commandNames() const;

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json& args)>;

    void registerHandlers();
    static TaskType TaskTypeFor(const std::string& command);
    static const char* TaskTypeName(TaskType type);

    AppServices m_services;
    std::map<std::string, Handler> m_handlers;
};

} // namespace localscribe::application
