/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation for a run
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_ENGINE_CANCELLATION_TOKEN_H
#define KCENON_SFTP_STRESS_ENGINE_CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kcenon::sftp_stress {

/**
 * @brief Shared flag that stops workers from taking new artifacts
 *
 * Transfers already in flight run to completion. Interruptible waits let
 * the post-transfer sleep end early once cancellation is requested.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for @p timeout unless cancelled first
     * @return true if cancellation was requested
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> timeout) const -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return is_cancelled(); });
    }

    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_ENGINE_CANCELLATION_TOKEN_H
