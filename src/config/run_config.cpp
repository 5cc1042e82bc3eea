/**
 * @file run_config.cpp
 * @brief run_config validation and derived values
 */

#include "kcenon/sftp_stress/config/run_config.h"

#include <algorithm>
#include <thread>

namespace kcenon::sftp_stress {

namespace {

auto invalid(const std::string& what) -> unexpected {
    return unexpected(error(error_code::config_invalid, what));
}

// Any negative value disables the timeout
auto timeout_ok(int seconds) -> bool { return seconds != 0; }

auto to_timeout(int seconds) -> std::optional<std::chrono::milliseconds> {
    if (seconds < 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
}

}  // namespace

auto run_config::validate() const -> result<void> {
    if (host.empty()) {
        return invalid("host must not be empty");
    }
    if (port == 0) {
        return invalid("port must be in 1..65535");
    }
    if (username.empty()) {
        return invalid("username must not be empty");
    }
    if (private_key_path.empty()) {
        return invalid("ssh_private_key_path must not be empty");
    }
    if (remote_root.empty()) {
        return invalid("root_dir must not be empty");
    }
    if (min_file_size > max_file_size) {
        return invalid("min_test_file_size_bytes (" + std::to_string(min_file_size) +
                       ") exceeds max_test_file_size_bytes (" +
                       std::to_string(max_file_size) + ")");
    }
    if (!timeout_ok(connect_timeout_seconds)) {
        return invalid("connect_timeout_seconds must be negative (no timeout) or >= 1");
    }
    if (!timeout_ok(transfer_timeout_seconds)) {
        return invalid("transfer_timeout_seconds must be negative (no timeout) or >= 1");
    }
    if (retry_attempts < 0) {
        return invalid("retry_attempts must be >= 0");
    }
    return {};
}

auto run_config::effective_concurrency() const -> std::size_t {
    if (concurrency > 0) {
        return static_cast<std::size_t>(concurrency);
    }
    auto cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 1;
}

auto run_config::worker_count() const -> std::size_t {
    return std::max<std::size_t>(1, std::min(effective_concurrency(), num_files));
}

auto run_config::connect_timeout() const -> std::optional<std::chrono::milliseconds> {
    return to_timeout(connect_timeout_seconds);
}

auto run_config::transfer_timeout() const -> std::optional<std::chrono::milliseconds> {
    return to_timeout(transfer_timeout_seconds);
}

auto run_config::post_transfer_sleep() const
    -> std::optional<std::chrono::duration<double>> {
    if (sleep_interval_seconds > 0.0) {
        return std::chrono::duration<double>(sleep_interval_seconds);
    }
    return std::nullopt;
}

}  // namespace kcenon::sftp_stress
