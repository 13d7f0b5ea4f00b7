/**
 * @file BlockingExecutor.cpp
 * @brief Implementation of BlockingExecutor.
 */

#include "application/BlockingExecutor.hpp"

namespace docforge::application {

BlockingExecutor::BlockingExecutor(std::size_t workers) {
    if (workers == 0) workers = 1;
    for (std::size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(&BlockingExecutor::workerLoop, this);
    }
}

BlockingExecutor::~BlockingExecutor() {
    stop();
}

void BlockingExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void BlockingExecutor::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock; exceptions land in the task's future
        task();
    }
}

} // namespace docforge::application
