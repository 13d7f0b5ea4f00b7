/**
 * @file OperationRegistry.hpp
 * @brief Id-keyed registry of live progress trackers with delayed eviction.
 */

#pragma once

#include "application/ProgressTracker.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace docforge::application {

/**
 * @class OperationRegistry
 * @brief Owns the trackers of running and recently finished operations.
 *
 * Insert and remove are the only shared mutations and are mutex-guarded. Finished
 * operations are evicted by a background reaper thread once their delay elapses.
 */
class OperationRegistry {
public:
    explicit OperationRegistry(std::chrono::milliseconds cleanupDelay = std::chrono::seconds(300),
                               std::size_t maxMessages = 100);
    ~OperationRegistry();

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /** @brief Creates and registers a tracker under a fresh random id. */
    std::shared_ptr<ProgressTracker> create();

    std::shared_ptr<ProgressTracker> find(const std::string& operationId) const;

    bool remove(const std::string& operationId);

    /** @brief Evicts the tracker once the cleanup delay has passed. */
    void scheduleRemoval(const std::string& operationId);

    std::vector<std::string> activeIds() const;
    std::size_t size() const;

    /** @brief Stops the reaper thread. Pending evictions are discarded. */
    void stop();

private:
    using Clock = std::chrono::steady_clock;

    void reaperLoop();

    const std::chrono::milliseconds m_cleanupDelay;
    const std::size_t m_maxMessages;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::shared_ptr<ProgressTracker>> m_trackers;
    std::multimap<Clock::time_point, std::string> m_evictions;

    std::thread m_reaper;
    bool m_running = true;
};

} // namespace docforge::application
