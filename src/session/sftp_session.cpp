/**
 * @file sftp_session.cpp
 * @brief libssh2 SFTP session implementation
 */

#include "kcenon/sftp_stress/session/sftp_session.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <libssh2.h>
#include <libssh2_sftp.h>

namespace kcenon::sftp_stress {

namespace {

// libssh2 waits for acks per request; larger writes keep the pipe full
constexpr std::size_t upload_block_size = 256 * 1024;

/**
 * @brief Process-wide libssh2_init()/libssh2_exit() pairing
 */
class libssh2_library {
public:
    static auto ensure() -> bool {
        static libssh2_library instance;
        return instance.initialized_;
    }

    libssh2_library(const libssh2_library&) = delete;
    auto operator=(const libssh2_library&) -> libssh2_library& = delete;

private:
    libssh2_library() : initialized_(libssh2_init(0) == 0) {}
    ~libssh2_library() {
        if (initialized_) {
            libssh2_exit();
        }
    }

    bool initialized_;
};

auto hex_fingerprint(const char* hash, std::size_t length) -> std::string {
    std::string out;
    out.reserve(length * 3);
    for (std::size_t i = 0; i < length; ++i) {
        char buf[4];
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : ":%02x",
                      static_cast<unsigned char>(hash[i]));
        out += buf;
    }
    return out;
}

}  // namespace

/**
 * @brief Implementation details for sftp_session
 */
struct sftp_session::impl {
    session_options options;
    std::shared_ptr<event_sink> sink;

    int socket_fd = -1;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;

    impl(session_options opts, std::shared_ptr<event_sink> s)
        : options(std::move(opts)), sink(std::move(s)) {}

    ~impl() { teardown(); }

    void log(log_level level, const std::string& message) const {
        if (sink) {
            sink->log(level, log_category::session, message);
        }
    }

    [[nodiscard]] auto endpoint() const -> std::string {
        return options.host + ":" + std::to_string(options.port);
    }

    /**
     * @brief Build an error from libssh2's last error state
     * @param code Error code for ordinary failures
     * @param timeout_code Error code used when libssh2 reports a timeout
     */
    [[nodiscard]] auto last_error(error_code code,
                                  error_code timeout_code,
                                  const std::string& step) const -> error {
        std::string text = step;
        int rc = 0;
        if (session) {
            char* msg = nullptr;
            int len = 0;
            rc = libssh2_session_last_error(session, &msg, &len, 0);
            if (msg && len > 0) {
                text += ": " + std::string(msg, static_cast<std::size_t>(len));
            }
        }
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp) {
            text += " (SFTP status " + std::to_string(libssh2_sftp_last_error(sftp)) + ")";
        }
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            code = timeout_code;
        }
        return error(code, text);
    }

    void apply_timeout(const std::optional<std::chrono::milliseconds>& timeout) {
        // 0 disables the libssh2 timeout
        libssh2_session_set_timeout(session, timeout ? static_cast<long>(timeout->count()) : 0L);
    }

    [[nodiscard]] auto connect_socket() -> result<void> {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* found = nullptr;
        auto port = std::to_string(options.port);
        int gai = ::getaddrinfo(options.host.c_str(), port.c_str(), &hints, &found);
        if (gai != 0) {
            return unexpected(error(error_code::host_resolution_failed,
                                    options.host + ": " + ::gai_strerror(gai)));
        }
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(found, &::freeaddrinfo);

        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (options.connect_timeout) {
            deadline = std::chrono::steady_clock::now() + *options.connect_timeout;
        }

        std::string last_failure = "no usable address";
        for (auto* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                last_failure = std::strerror(errno);
                continue;
            }

            int flags = ::fcntl(fd, F_GETFL, 0);
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc != 0 && errno == EINPROGRESS) {
                pollfd pfd{fd, POLLOUT, 0};
                int ready = 0;
                do {
                    int wait_ms = -1;
                    if (deadline) {
                        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                            *deadline - std::chrono::steady_clock::now());
                        wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
                    }
                    ready = ::poll(&pfd, 1, wait_ms);
                } while (ready < 0 && errno == EINTR);

                if (ready == 0) {
                    ::close(fd);
                    return unexpected(error(error_code::connection_timeout,
                                            "connect to " + endpoint() + " timed out"));
                }
                if (ready < 0) {
                    last_failure = std::strerror(errno);
                    ::close(fd);
                    continue;
                }

                int so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                rc = so_error == 0 ? 0 : -1;
                errno = so_error;
            }

            if (rc != 0) {
                last_failure = std::strerror(errno);
                ::close(fd);
                continue;
            }

            ::fcntl(fd, F_SETFL, flags);
            socket_fd = fd;
            return {};
        }

        return unexpected(error(error_code::connection_failed,
                                "connect to " + endpoint() + ": " + last_failure));
    }

    void report_host_key() const {
        const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (hash) {
            log(log_level::debug,
                "host key for " + endpoint() + " accepted, SHA256 " + hex_fingerprint(hash, 32));
        }
    }

    void teardown() noexcept {
        if (sftp) {
            libssh2_sftp_shutdown(sftp);
            sftp = nullptr;
        }
        if (session) {
            libssh2_session_disconnect(session, "sftp_stress session closed");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (socket_fd >= 0) {
            ::close(socket_fd);
            socket_fd = -1;
        }
    }
};

sftp_session::sftp_session(session_options options, std::shared_ptr<event_sink> sink)
    : impl_(std::make_unique<impl>(std::move(options), std::move(sink))) {}

sftp_session::~sftp_session() = default;

auto sftp_session::open() -> result<void> {
    if (is_open()) {
        return {};
    }
    impl_->teardown();

    if (!libssh2_library::ensure()) {
        return unexpected(error(error_code::internal_error, "libssh2_init failed"));
    }

    if (auto connected = impl_->connect_socket(); !connected) {
        return connected;
    }

    impl_->session = libssh2_session_init();
    if (!impl_->session) {
        impl_->teardown();
        return unexpected(error(error_code::connection_failed, "libssh2_session_init failed"));
    }
    libssh2_session_set_blocking(impl_->session, 1);
    impl_->apply_timeout(impl_->options.connect_timeout);

    if (libssh2_session_handshake(impl_->session, impl_->socket_fd) != 0) {
        auto err = impl_->last_error(error_code::handshake_failed,
                                     error_code::connection_timeout, "SSH handshake");
        impl_->teardown();
        return unexpected(err);
    }
    impl_->report_host_key();

    const auto& opts = impl_->options;
    const char* passphrase = opts.passphrase ? opts.passphrase->c_str() : nullptr;
    if (libssh2_userauth_publickey_fromfile(impl_->session, opts.username.c_str(), nullptr,
                                            opts.private_key_path.c_str(), passphrase) != 0) {
        auto err = impl_->last_error(error_code::authentication_failed,
                                     error_code::connection_timeout,
                                     "public key authentication for " + opts.username);
        impl_->teardown();
        return unexpected(err);
    }

    impl_->sftp = libssh2_sftp_init(impl_->session);
    if (!impl_->sftp) {
        auto err = impl_->last_error(error_code::sftp_init_failed,
                                     error_code::connection_timeout, "SFTP init");
        impl_->teardown();
        return unexpected(err);
    }

    impl_->apply_timeout(opts.transfer_timeout);
    impl_->log(log_level::debug, "session open to " + impl_->endpoint());
    return {};
}

auto sftp_session::upload(const std::filesystem::path& local_path,
                          const std::string& remote_path,
                          const progress_callback& progress) -> result<uint64_t> {
    if (!is_open()) {
        return unexpected(error(error_code::session_not_open));
    }

    std::error_code ec;
    auto total = static_cast<uint64_t>(std::filesystem::file_size(local_path, ec));
    if (ec) {
        return unexpected(error(error_code::local_read_failed,
                                local_path.string() + ": " + ec.message()));
    }
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::local_read_failed,
                                "cannot open " + local_path.string()));
    }

    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open(
        impl_->sftp, remote_path.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP |
            LIBSSH2_SFTP_S_IROTH);
    if (!handle) {
        return unexpected(impl_->last_error(error_code::remote_open_failed,
                                            error_code::transfer_timeout,
                                            "open " + remote_path));
    }

    std::vector<char> buffer(upload_block_size);
    uint64_t sent = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            break;
        }

        const char* cursor = buffer.data();
        while (got > 0) {
            auto written = libssh2_sftp_write(handle, cursor, got);
            if (written < 0) {
                auto err = impl_->last_error(error_code::remote_write_failed,
                                             error_code::transfer_timeout,
                                             "write " + remote_path);
                libssh2_sftp_close_handle(handle);
                return unexpected(err);
            }
            cursor += written;
            got -= static_cast<std::size_t>(written);
            sent += static_cast<uint64_t>(written);
            if (progress) {
                progress(sent, total);
            }
        }
    }

    if (in.bad()) {
        libssh2_sftp_close_handle(handle);
        return unexpected(error(error_code::local_read_failed,
                                "read error on " + local_path.string()));
    }

    if (libssh2_sftp_close_handle(handle) != 0) {
        return unexpected(impl_->last_error(error_code::remote_write_failed,
                                            error_code::transfer_timeout,
                                            "close " + remote_path));
    }
    return sent;
}

auto sftp_session::remove(const std::string& remote_path) -> result<void> {
    if (!is_open()) {
        return unexpected(error(error_code::session_not_open));
    }
    if (libssh2_sftp_unlink(impl_->sftp, remote_path.c_str()) != 0) {
        return unexpected(impl_->last_error(error_code::remote_delete_failed,
                                            error_code::transfer_timeout,
                                            "unlink " + remote_path));
    }
    return {};
}

void sftp_session::close() noexcept { impl_->teardown(); }

auto sftp_session::is_open() const noexcept -> bool { return impl_->sftp != nullptr; }

auto sftp_session::options() const -> const session_options& { return impl_->options; }

// ============================================================================
// sftp_session_factory
// ============================================================================

sftp_session_factory::sftp_session_factory(std::shared_ptr<event_sink> sink)
    : sink_(std::move(sink)) {}

auto sftp_session_factory::create(const session_options& options)
    -> std::unique_ptr<session_interface> {
    return std::make_unique<sftp_session>(options, sink_);
}

}  // namespace kcenon::sftp_stress
