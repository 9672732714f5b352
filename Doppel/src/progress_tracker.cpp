#include "progress_tracker.hpp"

#include <utility>

namespace doppel {

ProgressTracker::ProgressTracker(ProgressStage stage, size_t total, ProgressCallback callback,
                                 std::chrono::milliseconds minInterval)
    : m_stage(stage),
      m_total(total),
      m_completed(0),
      m_failed(0),
      m_callback(std::move(callback)),
      m_lastCallbackTime(std::chrono::steady_clock::now()),
      m_minCallbackInterval(minInterval)
{
}

void ProgressTracker::update(size_t count) {
    m_completed.fetch_add(count, std::memory_order_relaxed);
    tryInvokeCallback();
}

void ProgressTracker::updateFailed(size_t count) {
    m_failed.fetch_add(count, std::memory_order_relaxed);
    tryInvokeCallback();
}

void ProgressTracker::forceUpdate() {
    if (!m_callback) return;

    std::lock_guard<std::mutex> lock(m_callbackMutex);

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = std::chrono::steady_clock::now();
}

ProgressInfo ProgressTracker::getProgress() const {
    ProgressInfo info;

    info.stage = m_stage;
    info.total = m_total.load(std::memory_order_relaxed);
    info.completed = m_completed.load(std::memory_order_relaxed);
    info.failed = m_failed.load(std::memory_order_relaxed);

    return info;
}

void ProgressTracker::tryInvokeCallback() {
    if (!m_callback) return;

    // Another thread is already reporting; skip rather than queue up
    std::unique_lock<std::mutex> lock(m_callbackMutex, std::try_to_lock);
    if (!lock.owns_lock()) return;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastCallbackTime);
    if (elapsed < m_minCallbackInterval) return;

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = now;
}

} // namespace doppel
