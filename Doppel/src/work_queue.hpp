//
// work_queue.hpp
// Bounded blocking queue feeding the hashing workers
//

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace doppel {

// Bounded blocking LIFO queue. Once the sentinel is set, pop() drains what is left
// and then returns std::nullopt; push() refuses new items instead of blocking.
template<typename T>
class WorkQueue {
private:
    std::vector<T> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_sentinel = false;
    size_t m_maxCapacity;
    std::string m_name;

public:
    WorkQueue(size_t maxCapacity, std::string name)
        : m_maxCapacity(maxCapacity == 0 ? 1 : maxCapacity), m_name(std::move(name)) {
    }

    // Blocks while full. Returns false if the queue was closed before the item fit.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return m_items.size() < m_maxCapacity || m_sentinel; });
        if (m_sentinel) return false;
        m_items.emplace_back(std::move(item));
        m_cond.notify_all();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_items.empty() || m_sentinel; });
        if (m_items.empty()) { return std::nullopt; }
        T result = std::move(m_items.back());
        m_items.pop_back();
        m_cond.notify_all();
        return result;
    }

    // Drop everything still queued and close. Used on cancellation.
    size_t clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        const size_t dropped = m_items.size();
        m_items.clear();
        m_sentinel = true;
        m_cond.notify_all();
        return dropped;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.empty();
    }

    bool isSentinel() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sentinel;
    }

    void setSentinel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sentinel = true;
        }
        m_cond.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_maxCapacity; }
    const std::string& name() const { return m_name; }
};

} // namespace doppel
