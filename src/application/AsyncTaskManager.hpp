/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background command execution.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <algorithm>
#include <exception>
#include <optional>
#include <type_traits>

namespace localscribe::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Transcription,
    Summarization,
    SaveRecording,
    Other
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
};

namespace detail {

template <typename R>
struct StoredResult {
    R value;
};

template <>
struct StoredResult<void> {};

} // namespace detail

/**
 * @class AsyncTaskManager
 * @brief Runs each submitted task on its own thread and tracks the ones still in flight.
 *
 * Tasks never wait on each other. There is no cancellation: a task blocked on an
 * external dependency keeps its thread until that dependency answers.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a callable to run in the background.
     * @return Future holding the callable's result or the exception it threw.
     *
     * The manager must outlive every task it starts.
     */
    template<typename F>
    auto SubmitTask(TaskType type, const std::string& description, F&& f)
        -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();

        std::thread([this, status, promise, func = std::forward<F>(f)]() mutable {
            std::exception_ptr error;
            std::optional<detail::StoredResult<Result>> result;
            try {
                if constexpr (std::is_void_v<Result>) {
                    func();
                    result.emplace();
                } else {
                    result.emplace(detail::StoredResult<Result>{func()});
                }
            } catch (...) {
                // Handed to the caller through the future.
                error = std::current_exception();
            }
            status->isCompleted = true;
            CleanupCompletedTasks();

            // Nothing below may touch the manager: a caller can destroy it once the future is ready.
            if (error) {
                promise->set_exception(error);
            } else if constexpr (std::is_void_v<Result>) {
                promise->set_value();
            } else {
                promise->set_value(std::move(result->value));
            }
        }).detach();

        return future;
    }

    /** @brief Returns the tasks still running, oldest first. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
};

} // namespace localscribe::application
