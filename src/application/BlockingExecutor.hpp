/**
 * @file BlockingExecutor.hpp
 * @brief Small worker pool for calls that block on external processes.
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
#include <vector>

namespace docforge::application {

/**
 * @class BlockingExecutor
 * @brief Runs submitted tasks on a fixed set of background threads.
 *
 * Diagram rendering spawns a child process and waits for it; routing those calls
 * through this pool keeps them off the threads that drive exports.
 */
class BlockingExecutor {
public:
    explicit BlockingExecutor(std::size_t workers = 2);
    ~BlockingExecutor();

    BlockingExecutor(const BlockingExecutor&) = delete;
    BlockingExecutor& operator=(const BlockingExecutor&) = delete;

    /**
     * @brief Queues a callable and returns a future for its result.
     * @throws std::runtime_error if the executor has been stopped.
     */
    template<typename F>
    auto submit(F&& f) -> std::future<decltype(f())> {
        using R = decltype(f());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("BlockingExecutor is stopped");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return result;
    }

    /**
     * @brief Stops the workers after all queued tasks have run.
     */
    void stop();

private:
    void workerLoop();

    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::vector<std::thread> m_workers;
    bool m_running = true;
};

} // namespace docforge::application
