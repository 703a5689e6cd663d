/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation shared by every suspension point of a run.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bacnetinventory::domain {

/**
 * @class CancellationToken
 * @brief One flag observed by sends, receives, settle delays and resolve polls.
 *
 * Shared by reference (usually via std::shared_ptr) from the top-level call
 * down to every worker.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Sleeps for up to @p duration, waking early on cancel().
     * @return False if the token was cancelled before or during the wait.
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !m_cv.wait_for(lock, duration, [this] { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace bacnetinventory::domain
