/**
 * @file session_interface.h
 * @brief Abstract SFTP session and session factory
 * @version 0.1.0
 *
 * The engine only talks to session_interface; sftp_session implements it on
 * top of libssh2 and tests substitute their own factory.
 */

#ifndef KCENON_SFTP_STRESS_SESSION_SESSION_INTERFACE_H
#define KCENON_SFTP_STRESS_SESSION_SESSION_INTERFACE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/sftp_stress/config/run_config.h"
#include "kcenon/sftp_stress/core/types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Connection parameters for one session
 */
struct session_options {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string private_key_path;
    std::optional<std::string> passphrase;
    std::optional<std::chrono::milliseconds> connect_timeout;   ///< nullopt = block indefinitely
    std::optional<std::chrono::milliseconds> transfer_timeout;  ///< nullopt = block indefinitely

    [[nodiscard]] static auto from_config(const run_config& cfg) -> session_options {
        session_options opts;
        opts.host = cfg.host;
        opts.port = cfg.port;
        opts.username = cfg.username;
        opts.private_key_path = cfg.private_key_path;
        opts.passphrase = cfg.private_key_passphrase;
        opts.connect_timeout = cfg.connect_timeout();
        opts.transfer_timeout = cfg.transfer_timeout();
        return opts;
    }
};

/**
 * @brief Upload progress (bytes_sent is monotonically increasing)
 */
using progress_callback = std::function<void(uint64_t bytes_sent, uint64_t total)>;

/**
 * @brief One authenticated SFTP channel
 *
 * A session is never used by two threads at the same time.
 */
class session_interface {
public:
    virtual ~session_interface() = default;

    /**
     * @brief TCP connect, SSH handshake, key authentication, SFTP init
     */
    [[nodiscard]] virtual auto open() -> result<void> = 0;

    /**
     * @brief Write a local file to @p remote_path (created or truncated)
     * @return Bytes written
     */
    [[nodiscard]] virtual auto upload(const std::filesystem::path& local_path,
                                      const std::string& remote_path,
                                      const progress_callback& progress) -> result<uint64_t> = 0;

    /**
     * @brief Delete @p remote_path
     */
    [[nodiscard]] virtual auto remove(const std::string& remote_path) -> result<void> = 0;

    /**
     * @brief Release transport resources; safe to call repeatedly
     */
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
};

/**
 * @brief Creates unopened sessions
 */
class session_factory {
public:
    virtual ~session_factory() = default;

    [[nodiscard]] virtual auto create(const session_options& options)
        -> std::unique_ptr<session_interface> = 0;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_SESSION_SESSION_INTERFACE_H
