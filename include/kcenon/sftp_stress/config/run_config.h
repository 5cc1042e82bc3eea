/**
 * @file run_config.h
 * @brief Run configuration for the SFTP stress harness
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_CONFIG_RUN_CONFIG_H
#define KCENON_SFTP_STRESS_CONFIG_RUN_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/sftp_stress/core/types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Everything one run needs; immutable once the run starts
 *
 * Timeouts and the sleep interval use -1 for "disabled". Concurrency
 * values <= 0 resolve to the host's logical core count.
 */
struct run_config {
    // Endpoint
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string private_key_path;
    std::optional<std::string> private_key_passphrase;
    std::string remote_root = "/";

    // Workload
    uint64_t min_file_size = 6000;
    uint64_t max_file_size = 64000000;
    std::size_t num_files = 1;

    // Timing
    int connect_timeout_seconds = 20;
    int transfer_timeout_seconds = 20;
    double sleep_interval_seconds = -1.0;

    // Concurrency
    int concurrency = 1;
    bool keep_alive = false;
    int retry_attempts = 0;

    /**
     * @brief Check the invariants
     * @return config_invalid describing the first violated rule
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Concurrency with <= 0 resolved to hardware threads (always >= 1)
     */
    [[nodiscard]] auto effective_concurrency() const -> std::size_t;

    /**
     * @brief Workers actually started: min(effective_concurrency, num_files)
     */
    [[nodiscard]] auto worker_count() const -> std::size_t;

    [[nodiscard]] auto connect_timeout() const -> std::optional<std::chrono::milliseconds>;
    [[nodiscard]] auto transfer_timeout() const -> std::optional<std::chrono::milliseconds>;

    /**
     * @brief Pause after each transfer attempt, if enabled
     */
    [[nodiscard]] auto post_transfer_sleep() const
        -> std::optional<std::chrono::duration<double>>;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CONFIG_RUN_CONFIG_H
