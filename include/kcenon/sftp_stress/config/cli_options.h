/**
 * @file cli_options.h
 * @brief Command-line options for the stress runner
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_CONFIG_CLI_OPTIONS_H
#define KCENON_SFTP_STRESS_CONFIG_CLI_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/sftp_stress/core/logging.h"
#include "run_config.h"

namespace kcenon::sftp_stress {

/**
 * @brief Configuration file read when --config is not given
 */
inline constexpr std::string_view default_config_path = "config.yml";

/**
 * @brief Parsed command line
 *
 * Every run_config field is optional here; only flags that were given
 * override values from the configuration file.
 */
struct cli_options {
    std::optional<std::string> config_path;

    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> username;
    std::optional<std::string> private_key_path;
    std::optional<std::string> passphrase;
    std::optional<std::string> remote_root;
    std::optional<std::size_t> num_files;
    std::optional<uint64_t> min_size;
    std::optional<uint64_t> max_size;
    std::optional<int> threads;
    std::optional<double> sleep_seconds;
    std::optional<bool> keep_alive;
    std::optional<int> connect_timeout;
    std::optional<int> transfer_timeout;

    std::optional<std::string> report_path;
    bool json_log = false;
    std::optional<log_level> level;
    bool ignore_unknown_keys = false;
    bool show_help = false;
};

/**
 * @brief Parse argv
 * @return config_invalid for unknown flags, missing or malformed values
 */
[[nodiscard]] auto parse_cli(int argc, const char* const argv[]) -> result<cli_options>;

/**
 * @brief Parse a byte count with optional K/M/G suffix (binary multiples)
 */
[[nodiscard]] auto parse_size(std::string_view text) -> std::optional<uint64_t>;

/**
 * @brief Overwrite @p config with every flag present in @p options
 */
void apply_overrides(const cli_options& options, run_config& config);

[[nodiscard]] auto usage_text(std::string_view program) -> std::string;

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CONFIG_CLI_OPTIONS_H
