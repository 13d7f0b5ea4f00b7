/**
 * @file OperationRegistry.cpp
 * @brief Implementation of OperationRegistry.
 */

#include "application/OperationRegistry.hpp"
#include "infrastructure/FileUtils.hpp"

#include <iostream>

namespace docforge::application {

OperationRegistry::OperationRegistry(std::chrono::milliseconds cleanupDelay, std::size_t maxMessages)
    : m_cleanupDelay(cleanupDelay)
    , m_maxMessages(maxMessages) {
    m_reaper = std::thread(&OperationRegistry::reaperLoop, this);
}

OperationRegistry::~OperationRegistry() {
    stop();
}

void OperationRegistry::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_reaper.joinable()) {
        m_reaper.join();
    }
}

std::shared_ptr<ProgressTracker> OperationRegistry::create() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string id;
    do {
        id = infrastructure::FileUtils::RandomToken(16);
    } while (m_trackers.count(id) > 0);

    auto tracker = std::make_shared<ProgressTracker>(id, m_maxMessages);
    m_trackers.emplace(id, tracker);
    return tracker;
}

std::shared_ptr<ProgressTracker> OperationRegistry::find(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_trackers.find(operationId);
    return it == m_trackers.end() ? nullptr : it->second;
}

bool OperationRegistry::remove(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_trackers.erase(operationId) > 0;
}

void OperationRegistry::scheduleRemoval(const std::string& operationId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running || m_trackers.count(operationId) == 0) return;
        m_evictions.emplace(Clock::now() + m_cleanupDelay, operationId);
    }
    m_cv.notify_one();
}

std::vector<std::string> OperationRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_trackers.size());
    for (const auto& [id, tracker] : m_trackers) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t OperationRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_trackers.size();
}

void OperationRegistry::reaperLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (m_evictions.empty()) {
            m_cv.wait(lock, [this] { return !m_running || !m_evictions.empty(); });
            continue;
        }

        auto deadline = m_evictions.begin()->first;
        if (Clock::now() < deadline) {
            m_cv.wait_until(lock, deadline);
            continue; // Re-evaluate: new earlier deadline, stop, or spurious wake up
        }

        while (!m_evictions.empty() && m_evictions.begin()->first <= Clock::now()) {
            const std::string id = m_evictions.begin()->second;
            m_evictions.erase(m_evictions.begin());
            if (m_trackers.erase(id) > 0) {
                std::cout << "[OperationRegistry] Evicted operation " << id << std::endl;
            }
        }
    }
}

} // namespace docforge::application
