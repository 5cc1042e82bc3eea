/**
 * @file sftp_session.h
 * @brief libssh2-backed SFTP session
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_SESSION_SFTP_SESSION_H
#define KCENON_SFTP_STRESS_SESSION_SFTP_SESSION_H

#include <memory>

#include "kcenon/sftp_stress/core/event_sink.h"
#include "session_interface.h"

namespace kcenon::sftp_stress {

/**
 * @brief SFTP session over libssh2 with public-key authentication
 *
 * Any host key is accepted; its SHA-256 fingerprint is reported at debug
 * level. The connect timeout bounds TCP connect, handshake, authentication
 * and SFTP init; the transfer timeout bounds each SFTP request afterwards.
 *
 * @code
 * sftp_session session(session_options::from_config(cfg), sink);
 * if (auto r = session.open(); !r) {
 *     // r.error().code is a connection error
 * }
 * auto sent = session.upload(art.local_path(), "/upload/test_0.lz4", nullptr);
 * session.close();
 * @endcode
 */
class sftp_session : public session_interface {
public:
    explicit sftp_session(session_options options,
                          std::shared_ptr<event_sink> sink = nullptr);
    ~sftp_session() override;

    sftp_session(const sftp_session&) = delete;
    auto operator=(const sftp_session&) -> sftp_session& = delete;

    [[nodiscard]] auto open() -> result<void> override;
    [[nodiscard]] auto upload(const std::filesystem::path& local_path,
                              const std::string& remote_path,
                              const progress_callback& progress) -> result<uint64_t> override;
    [[nodiscard]] auto remove(const std::string& remote_path) -> result<void> override;
    void close() noexcept override;
    [[nodiscard]] auto is_open() const noexcept -> bool override;

    [[nodiscard]] auto options() const -> const session_options&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory producing sftp_session instances
 */
class sftp_session_factory : public session_factory {
public:
    explicit sftp_session_factory(std::shared_ptr<event_sink> sink = nullptr);

    [[nodiscard]] auto create(const session_options& options)
        -> std::unique_ptr<session_interface> override;

private:
    std::shared_ptr<event_sink> sink_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_SESSION_SFTP_SESSION_H
