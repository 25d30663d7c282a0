/**
 * @file WorkerPool.hpp
 * @brief Fixed-size thread pool for CPU-bound pipeline stages.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace timenotes::application {

/**
 * @class WorkerPool
 * @brief Runs submitted callables on a bounded set of worker threads.
 *
 * Tasks still queued at shutdown are executed before the workers exit.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues @p f and returns a future for its result.
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (m_shutdown) {
                throw std::runtime_error("WorkerPool is shutting down");
            }
            m_queue.emplace([task]() { (*task)(); });
        }
        m_taskAvailable.notify_one();
        return result;
    }

    /** @brief Stops accepting work, drains the queue and joins all workers. */
    void Shutdown();

    size_t WorkerCount() const { return m_workers.size(); }
    size_t QueueSize() const;

private:
    void WorkerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_queue;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_taskAvailable;
    bool m_shutdown = false;
};

} // namespace timenotes::application
