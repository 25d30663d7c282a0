/**
 * @file AsyncTaskManager.hpp
 * @brief Background threads for whole pipeline jobs.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace timenotes::application {

/**
 * @enum TaskType
 * @brief Kind of pipeline a background task runs.
 */
enum class TaskType {
    MediaPipeline,
    DocumentPipeline
};

/**
 * @struct TaskStatus
 * @brief Live view of one background task. Progress runs from 0 to 1.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::MediaPipeline;
    std::string description;
    std::chrono::steady_clock::time_point startedAt;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Written once before isCompleted is set.
};

/**
 * @class AsyncTaskManager
 * @brief Runs every task on a detached thread of its own.
 *
 * Job tasks mostly wait on WorkerPool futures, so they are kept off the pool
 * to avoid starving it. The destructor waits for all tasks to finish.
 */
class AsyncTaskManager {
public:
    using TaskBody = std::function<void(std::shared_ptr<TaskStatus>)>;

    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Starts @p body in the background and returns its status handle. */
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, TaskBody body) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;
        status->startedAt = std::chrono::steady_clock::now();

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
            ++m_running;
        }

        std::thread(&AsyncTaskManager::Execute, this, status, std::move(body)).detach();
        return status;
    }

    /** @brief Snapshot of the tasks that have not finished yet. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() const {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    size_t RunningCount() const {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_running;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_allDone.wait(lock, [this] { return m_running == 0; });
    }

private:
    void Execute(std::shared_ptr<TaskStatus> status, TaskBody body) {
        try {
            body(status);
            status->progress = 1.0f;
        } catch (const std::exception& e) {
            status->errorMessage = e.what();
            status->failed = true;
        } catch (...) {
            status->errorMessage = "Unknown error during task execution.";
            status->failed = true;
        }
        status->isCompleted = true;
        Retire(status);
    }

    void Retire(const std::shared_ptr<TaskStatus>& status) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(std::remove(m_activeTasks.begin(), m_activeTasks.end(), status),
                            m_activeTasks.end());
        if (--m_running == 0) {
            m_allDone.notify_all();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    mutable std::mutex m_tasksMutex;
    std::condition_variable m_allDone;
    size_t m_running = 0;
};

} // namespace timenotes::application
