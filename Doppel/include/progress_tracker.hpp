//
// progress_tracker.hpp
// Thread-safe progress counters with a rate-limited reporting callback
//

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace doppel {

enum class ProgressStage {
    Hash,
    Search
};

struct ProgressInfo {
    ProgressStage stage = ProgressStage::Hash;
    size_t total = 0;
    size_t completed = 0;
    size_t failed = 0;

    // Failed items count as processed
    size_t processed() const { return completed + failed; }

    size_t percentComplete() const {
        if (total == 0) return 100;
        return static_cast<size_t>((static_cast<float>(processed()) / total) * 100);
    }

    bool finished() const { return processed() >= total; }
};

// Thread-safe progress tracker with rate-limited callbacks
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    ProgressTracker(ProgressStage stage, size_t total, ProgressCallback callback = nullptr,
                    std::chrono::milliseconds minInterval = std::chrono::milliseconds(500));

    void update(size_t count = 1);
    void updateFailed(size_t count = 1);
    void forceUpdate();

    ProgressInfo getProgress() const;

private:
    const ProgressStage m_stage;
    std::atomic<size_t> m_total;
    std::atomic<size_t> m_completed;
    std::atomic<size_t> m_failed;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
    std::chrono::steady_clock::time_point m_lastCallbackTime;
    const std::chrono::milliseconds m_minCallbackInterval;

    void tryInvokeCallback();
};

} // namespace doppel
