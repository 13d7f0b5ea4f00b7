#include "application/ProgressTracker.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docforge::application {

using domain::ExportStage;

namespace {
    std::string ToIso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
}

nlohmann::json ToJson(const OperationStatus& status) {
    return {
        {"operation_id", status.operationId},
        {"current_stage", domain::StageToString(status.currentStage)},
        {"progress_percentage", status.progressPercentage},
        {"stage_progress", status.stageProgress},
        {"start_time", ToIso8601(status.startTime)},
        {"elapsed_seconds", status.elapsedSeconds},
        {"last_messages", status.lastMessages},
        {"errors", status.errors},
        {"warnings", status.warnings},
        {"cancelled", status.cancelled}
    };
}

ProgressTracker::ProgressTracker(std::string operationId, std::size_t maxMessages)
    : m_operationId(std::move(operationId))
    , m_maxMessages(std::max<std::size_t>(maxMessages, 1))
    , m_startTime(std::chrono::system_clock::now())
    , m_startClock(std::chrono::steady_clock::now()) {}

void ProgressTracker::updateProgress(ExportStage stage, double stagePercent, const std::string& message) {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled || domain::IsTerminal(m_stage)) {
            return;
        }

        double pct = std::clamp(stagePercent, 0.0, 100.0);
        double carried = 0.0;
        for (int s = static_cast<int>(stage) - 1; s >= 0 && m_skipped.count(static_cast<ExportStage>(s)); --s) {
            carried += domain::StageWeight(static_cast<ExportStage>(s));
        }
        double overall = domain::WeightBefore(stage) - carried
                       + (domain::StageWeight(stage) + carried) * pct / 100.0;

        m_stage = stage;
        m_stageProgress = pct;
        m_overallProgress = std::min(100.0, std::max(m_overallProgress, overall));
        if (!message.empty()) {
            appendMessageLocked(message);
        }
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::complete(bool success, const std::string& message) {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stage = success ? ExportStage::Completed : ExportStage::Failed;
        m_stageProgress = 100.0;
        m_overallProgress = 100.0;
        if (!message.empty()) {
            appendMessageLocked(message);
        }
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::cancel() {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) return;
        m_cancelled = true;
        appendMessageLocked("Operation cancelled");
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::skipStage(ExportStage stage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_skipped.insert(stage);
}

void ProgressTracker::addMessage(const std::string& message) {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        appendMessageLocked(message);
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::addWarning(const std::string& warning) {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_warnings.push_back(warning);
        appendMessageLocked("Warning: " + warning);
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::addError(const std::string& error) {
    OperationStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errors.push_back(error);
        appendMessageLocked("Error: " + error);
        snapshot = snapshotLocked();
    }
    notify(snapshot);
}

void ProgressTracker::addCallback(Callback callback) {
    if (!callback) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.push_back(std::move(callback));
}

OperationStatus ProgressTracker::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return snapshotLocked();
}

bool ProgressTracker::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool ProgressTracker::isFinished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return domain::IsTerminal(m_stage);
}

double ProgressTracker::progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_overallProgress;
}

ExportStage ProgressTracker::stage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stage;
}

void ProgressTracker::appendMessageLocked(const std::string& message) {
    m_messages.push_back(message);
    while (m_messages.size() > m_maxMessages) {
        m_messages.pop_front();
    }
}

OperationStatus ProgressTracker::snapshotLocked() const {
    OperationStatus s;
    s.operationId = m_operationId;
    s.currentStage = m_stage;
    s.progressPercentage = m_overallProgress;
    s.stageProgress = m_stageProgress;
    s.startTime = m_startTime;
    s.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_startClock).count();
    std::size_t tail = std::min(m_messages.size(), kStatusMessageTail);
    s.lastMessages.assign(m_messages.end() - static_cast<long>(tail), m_messages.end());
    s.errors = m_errors;
    s.warnings = m_warnings;
    s.cancelled = m_cancelled;
    return s;
}

void ProgressTracker::notify(const OperationStatus& snapshot) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callbacks = m_callbacks;
    }
    for (const auto& cb : callbacks) {
        try {
            cb(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[ProgressTracker] Callback failed for " << m_operationId << ": " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[ProgressTracker] Callback failed for " << m_operationId << ": unknown exception" << std::endl;
        }
    }
}

} // namespace docforge::application
