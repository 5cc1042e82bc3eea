/**
 * @file cli_options.cpp
 * @brief Command-line parsing for the stress runner
 */

#include "kcenon/sftp_stress/config/cli_options.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace kcenon::sftp_stress {

namespace {

auto bad_flag(const std::string& message) -> unexpected {
    return unexpected(error(error_code::config_invalid, message));
}

template <typename Int>
auto parse_int(std::string_view text) -> std::optional<Int> {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_double(std::string_view text) -> std::optional<double> {
    std::string copy(text);
    char* end = nullptr;
    double value = std::strtod(copy.c_str(), &end);
    if (copy.empty() || end != copy.c_str() + copy.size()) {
        return std::nullopt;
    }
    return value;
}

constexpr std::array<std::string_view, 16> valued_flags = {
    "--config", "--host", "--port", "--user",
    "--key", "--passphrase", "--root", "--files",
    "--min-size", "--max-size", "--threads", "--sleep",
    "--connect-timeout", "--transfer-timeout", "--report", "--log-level",
};

auto takes_value(std::string_view flag) -> bool {
    return std::find(valued_flags.begin(), valued_flags.end(), flag) != valued_flags.end();
}

}  // namespace

auto parse_size(std::string_view text) -> std::optional<uint64_t> {
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t multiplier = 1;
    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    switch (suffix) {
        case 'K': multiplier = 1024ULL; break;
        case 'M': multiplier = 1024ULL * 1024; break;
        case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }

    auto value = parse_int<uint64_t>(text);
    if (!value || *value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return *value * multiplier;
}

auto parse_cli(int argc, const char* const argv[]) -> result<cli_options> {
    cli_options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) -> result<void> {
            if (++i >= argc) {
                return bad_flag(arg + " requires an argument");
            }
            out = argv[i];
            return {};
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--json-log") {
            options.json_log = true;
        } else if (arg == "--ignore-unknown-keys") {
            options.ignore_unknown_keys = true;
        } else if (arg == "--keep-alive") {
            options.keep_alive = true;
        } else if (arg == "--no-keep-alive") {
            options.keep_alive = false;
        } else if (arg.rfind("--", 0) != 0) {
            return bad_flag("unexpected argument: " + arg);
        } else if (!takes_value(arg)) {
            return bad_flag("unknown option: " + arg);
        } else {
            if (auto r = next_value(value); !r) {
                return unexpected(r.error());
            }

            if (arg == "--config") {
                options.config_path = value;
            } else if (arg == "--host") {
                options.host = value;
            } else if (arg == "--port") {
                auto port = parse_int<uint32_t>(value);
                if (!port || *port == 0 || *port > 65535) {
                    return bad_flag("--port expects 1..65535, got " + value);
                }
                options.port = static_cast<uint16_t>(*port);
            } else if (arg == "--user") {
                options.username = value;
            } else if (arg == "--key") {
                options.private_key_path = value;
            } else if (arg == "--passphrase") {
                options.passphrase = value;
            } else if (arg == "--root") {
                options.remote_root = value;
            } else if (arg == "--files") {
                auto n = parse_int<std::size_t>(value);
                if (!n) {
                    return bad_flag("--files expects a count, got " + value);
                }
                options.num_files = *n;
            } else if (arg == "--min-size" || arg == "--max-size") {
                auto size = parse_size(value);
                if (!size) {
                    return bad_flag(arg + " expects a byte count (K/M/G allowed), got " + value);
                }
                (arg == "--min-size" ? options.min_size : options.max_size) = *size;
            } else if (arg == "--threads") {
                auto n = parse_int<int>(value);
                if (!n) {
                    return bad_flag("--threads expects an integer, got " + value);
                }
                options.threads = *n;
            } else if (arg == "--sleep") {
                auto seconds = parse_double(value);
                if (!seconds) {
                    return bad_flag("--sleep expects seconds, got " + value);
                }
                options.sleep_seconds = *seconds;
            } else if (arg == "--connect-timeout" || arg == "--transfer-timeout") {
                auto seconds = parse_int<int>(value);
                if (!seconds) {
                    return bad_flag(arg + " expects an integer, got " + value);
                }
                (arg == "--connect-timeout" ? options.connect_timeout
                                            : options.transfer_timeout) = *seconds;
            } else if (arg == "--report") {
                options.report_path = value;
            } else if (arg == "--log-level") {
                auto level = log_level_from_string(value);
                if (!level) {
                    return bad_flag("--log-level expects trace|debug|info|warn|error|fatal, got " +
                                    value);
                }
                options.level = *level;
            }
        }
    }

    return options;
}

void apply_overrides(const cli_options& options, run_config& config) {
    if (options.host) config.host = *options.host;
    if (options.port) config.port = *options.port;
    if (options.username) config.username = *options.username;
    if (options.private_key_path) config.private_key_path = *options.private_key_path;
    if (options.passphrase) config.private_key_passphrase = *options.passphrase;
    if (options.remote_root) config.remote_root = *options.remote_root;
    if (options.num_files) config.num_files = *options.num_files;
    if (options.min_size) config.min_file_size = *options.min_size;
    if (options.max_size) config.max_file_size = *options.max_size;
    if (options.threads) config.concurrency = *options.threads;
    if (options.sleep_seconds) config.sleep_interval_seconds = *options.sleep_seconds;
    if (options.keep_alive) config.keep_alive = *options.keep_alive;
    if (options.connect_timeout) config.connect_timeout_seconds = *options.connect_timeout;
    if (options.transfer_timeout) config.transfer_timeout_seconds = *options.transfer_timeout;
}

auto usage_text(std::string_view program) -> std::string {
    std::ostringstream oss;
    oss << "SFTP Stress - concurrent SFTP upload load tester\n"
        << "\n"
        << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>           YAML configuration file (default: "
        << default_config_path << ")\n"
        << "  --host <host>             SFTP server host\n"
        << "  --port <port>             SFTP server port (default: 22)\n"
        << "  --user <name>             Login user\n"
        << "  --key <path>              Private key file\n"
        << "  --passphrase <text>       Private key passphrase\n"
        << "  --root <dir>              Remote directory for uploads (default: /)\n"
        << "  --files <n>               Number of test files (default: 1)\n"
        << "  --min-size <bytes>        Smallest payload, K/M/G allowed (default: 6000)\n"
        << "  --max-size <bytes>        Largest payload, K/M/G allowed (default: 64000000)\n"
        << "  --threads <n>             Concurrent workers, <= 0 = CPU count (default: 1)\n"
        << "  --sleep <seconds>         Pause after each transfer, -1 = off (default: -1)\n"
        << "  --keep-alive              Reuse one session per worker\n"
        << "  --no-keep-alive           Open a session per file (default)\n"
        << "  --connect-timeout <s>     Connect timeout, -1 = none (default: 20)\n"
        << "  --transfer-timeout <s>    Per-request transfer timeout, -1 = none (default: 20)\n"
        << "  --report <file>           Report path (default: sftp_report_<unix-time>.txt)\n"
        << "  --json-log                Log as JSON lines\n"
        << "  --log-level <level>       trace|debug|info|warn|error|fatal (default: info)\n"
        << "  --ignore-unknown-keys     Skip unknown configuration keys instead of failing\n"
        << "  --help                    Show this help message\n"
        << "\n"
        << "Command-line values override the configuration file.\n";
    return oss.str();
}

}  // namespace kcenon::sftp_stress
