#include "application/WorkerPool.hpp"

#include <iostream>

namespace timenotes::application {

WorkerPool::WorkerPool(size_t workers) {
    if (workers == 0) {
        workers = 1;
    }
    m_workers.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(&WorkerPool::WorkerLoop, this);
    }
    std::cout << "[WorkerPool] Started with " << workers << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_taskAvailable.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    std::cout << "[WorkerPool] Stopped." << std::endl;
}

size_t WorkerPool::QueueSize() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

void WorkerPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_taskAvailable.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            if (m_queue.empty()) {
                break;
            }
            task = std::move(m_queue.front());
            m_queue.pop();
        }
        // packaged_task stores exceptions in its future; nothing escapes here.
        task();
    }
}

} // namespace timenotes::application
