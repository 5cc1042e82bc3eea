// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.h
 * @brief Worker pool adapter for sftp_stress
 *
 * This adapter provides the pool the scheduler runs its worker loops on,
 * supporting both thread_system integration and a standalone fallback.
 *
 * Features:
 * - Stage-based task tracking ("warm_up", "transfer")
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::sftp_stress::adapters {

/**
 * @brief Interface for the pool that executes transfer workers
 *
 * Tasks submitted here are long-lived worker loops, so implementations must
 * run at least as many tasks concurrently as the run has workers.
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task to a named stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "warm_up")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool is running
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get pending task count for a specific stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    // Non-copyable
    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    // Movable
    thread_system_worker_pool(thread_system_worker_pool&&) noexcept;
    thread_system_worker_pool& operator=(thread_system_worker_pool&&) noexcept;

    /**
     * @brief Create and start a pool with @p worker_count threads
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "sftp_stress_pool");

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every task gets its own thread, so worker loops never starve each other.
 */
class async_worker_pool : public worker_pool_interface {
public:
    async_worker_pool();
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the best available worker pool
 *
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @brief Create the best available pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "sftp_stress_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::sftp_stress::adapters
