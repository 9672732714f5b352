//
// cancellation.hpp
// Cooperative cancellation shared by the pipeline, the search and the interrupt handler
//

#pragma once

#include "errors.hpp"

#include <atomic>

namespace doppel {

// Cooperative cancellation flag. requestCancel() only touches a lock-free atomic,
// so it may be called from a signal handler.
class CancellationToken {
public:
    void requestCancel() noexcept { m_cancelled.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    void throwIfCancelled() const
    {
        if (isCancelled()) throw OperationCancelled();
    }

private:
    std::atomic<bool> m_cancelled{ false };
    static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace doppel
