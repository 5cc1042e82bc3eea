/**
 * @file result_channel.h
 * @brief Many-producer / single-consumer queue for worker results
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_ENGINE_RESULT_CHANNEL_H
#define KCENON_SFTP_STRESS_ENGINE_RESULT_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::sftp_stress {

/**
 * @brief Unbounded mutex/condition-variable queue
 *
 * push() never blocks, so a slow consumer never stalls a worker.
 */
template <typename T>
class result_channel {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    /**
     * @brief Block until an item is available
     */
    [[nodiscard]] auto pop() -> T {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        return take_front();
    }

    /**
     * @brief Wait up to @p timeout for an item
     */
    template <typename Rep, typename Period>
    [[nodiscard]] auto pop_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        return take_front();
    }

    [[nodiscard]] auto try_pop() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    // Caller holds mutex_
    auto take_front() -> T {
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_ENGINE_RESULT_CHANNEL_H
