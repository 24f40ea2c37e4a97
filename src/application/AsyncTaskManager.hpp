/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace lyricflow::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Pipeline,
    Maintenance
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
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Valid once isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs each task on its own detached thread and tracks the ones still running.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        // Detached threads reference this object; let them drain first.
        WaitIdle();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        std::thread([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
                std::cerr << "[AsyncTaskManager] Task " << status->id << " (" << status->description
                          << ") failed: " << status->errorMessage << std::endl;
            } catch (...) {
                status->errorMessage = "Unknown error during task execution.";
                status->failed = true;
                std::cerr << "[AsyncTaskManager] Task " << status->id << " (" << status->description
                          << ") failed: " << status->errorMessage << std::endl;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until no task is running. */
    void WaitIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_activeTasks.empty(); });
    }

    /** @brief Like WaitIdle, but gives up after @p timeout. Returns true when idle. */
    bool WaitIdleFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        return m_idle.wait_for(lock, timeout, [this] { return m_activeTasks.empty(); });
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        if (m_activeTasks.empty()) {
            m_idle.notify_all();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace lyricflow::application
