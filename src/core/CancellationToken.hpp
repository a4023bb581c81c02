#pragma once

/**
 * CancellationToken.hpp
 *
 * Cooperative cancellation shared between a caller and one running download.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace docfetch::core {

/**
 * CancellationToken - one-shot cancel flag with an interruptible wait
 *
 * cancel() may be called from any thread (including a signal-watching
 * thread); waitFor() returns early as soon as it is.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_condition.notify_all();
    }

    bool isCancelled() const {
        return m_cancelled.load();
    }

    /**
     * Sleep for the given duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_condition.wait_for(lock, duration, [this] {
            return m_cancelled.load();
        });
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    std::atomic<bool> m_cancelled{false};
};

} // namespace docfetch::core
