/**
 * @file ProgressTracker.hpp
 * @brief Per-operation observable progress state with weighted stages.
 */

#pragma once

#include "domain/ExportStage.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace docforge::application {

/**
 * @struct OperationStatus
 * @brief Snapshot of a tracker, safe to hand to other threads.
 */
struct OperationStatus {
    std::string operationId;
    domain::ExportStage currentStage = domain::ExportStage::Initializing;
    double progressPercentage = 0.0;
    double stageProgress = 0.0;
    std::chrono::system_clock::time_point startTime;
    double elapsedSeconds = 0.0;
    std::vector<std::string> lastMessages;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool cancelled = false;
};

nlohmann::json ToJson(const OperationStatus& status);

/**
 * @class ProgressTracker
 * @brief Owned by one export call chain; read concurrently by pollers and callbacks.
 *
 * Overall progress is the full weight of all earlier stages plus the current stage's
 * weight scaled by its percentage, and never decreases. A skipped stage hands its weight
 * to the next stage that runs. Once cancelled or terminal, updateProgress() is a no-op.
 */
class ProgressTracker {
public:
    using Callback = std::function<void(const OperationStatus&)>;

    static constexpr std::size_t kStatusMessageTail = 10;

    ProgressTracker(std::string operationId, std::size_t maxMessages = 100);

    void updateProgress(domain::ExportStage stage, double stagePercent, const std::string& message = "");
    void complete(bool success, const std::string& message = "");
    void cancel();

    /** @brief Marks a stage that will not run; its weight moves to the following stage. */
    void skipStage(domain::ExportStage stage);

    void addMessage(const std::string& message);
    void addWarning(const std::string& warning);
    void addError(const std::string& error);

    void addCallback(Callback callback);

    OperationStatus status() const;

    const std::string& operationId() const { return m_operationId; }
    bool isCancelled() const;
    bool isFinished() const;
    double progress() const;
    domain::ExportStage stage() const;

private:
    void appendMessageLocked(const std::string& message);
    OperationStatus snapshotLocked() const;
    void notify(const OperationStatus& snapshot);

    const std::string m_operationId;
    const std::size_t m_maxMessages;
    const std::chrono::system_clock::time_point m_startTime;
    const std::chrono::steady_clock::time_point m_startClock;

    mutable std::mutex m_mutex;
    domain::ExportStage m_stage = domain::ExportStage::Initializing;
    double m_stageProgress = 0.0;
    double m_overallProgress = 0.0;
    bool m_cancelled = false;
    std::set<domain::ExportStage> m_skipped;
    std::deque<std::string> m_messages;
    std::vector<std::string> m_errors;
    std::vector<std::string> m_warnings;
    std::vector<Callback> m_callbacks;
};

} // namespace docforge::application
