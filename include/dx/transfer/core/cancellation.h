/**
 * @file cancellation.h
 * @brief Cooperative cancellation signal
 */

#ifndef DX_TRANSFER_CORE_CANCELLATION_H
#define DX_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dx::transfer {

/**
 * @brief Cancellation signal shared by the orchestrator, pool and retries
 *
 * Observed between chunk attempts and between state transitions. Backoff
 * sleeps wait on it so a cancel does not sit out a long delay.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool { return cancelled_.load(); }

    /**
     * @brief Sleep for duration unless cancelled first
     * @return true if cancelled (before or during the wait)
     */
    template <typename Rep, typename Period>
    auto wait_for_cancel(std::chrono::duration<Rep, Period> duration) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_CANCELLATION_H
