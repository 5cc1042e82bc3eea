/**
 * @file config_loader.h
 * @brief YAML configuration file loading
 * @version 0.1.0
 *
 * Maps the configuration keys onto run_config. Documents are YAML, read with
 * yaml-cpp; a JSON document is accepted as well. Plain scalars resolve the
 * way YAML 1.1 loaders resolve them, so `keep_alive_enabled: yes` is a
 * boolean and `port: "22"` is a string.
 *
 * Recognized keys: host, port, username, root_dir, ssh_private_key_path,
 * ssh_private_key_passphrase, min_test_file_size_bytes,
 * max_test_file_size_bytes, num_test_files, connect_timeout_seconds,
 * transfer_timeout_seconds, sftp_threads, sftp_sleep_interval,
 * keep_alive_enabled, retry_attempts.
 */

#ifndef KCENON_SFTP_STRESS_CONFIG_CONFIG_LOADER_H
#define KCENON_SFTP_STRESS_CONFIG_CONFIG_LOADER_H

#include <filesystem>
#include <string_view>
#include <vector>

#include "run_config.h"

namespace kcenon::sftp_stress {

/**
 * @brief Handling of keys the loader does not know
 */
enum class unknown_key_policy {
    reject,  ///< Fail with config_unknown_key
    ignore   ///< Skip silently
};

/**
 * @brief Loads run_config values from YAML or JSON
 *
 * Values are applied on top of a base configuration; keys that are absent
 * keep the base value. The result is not validated, so command-line
 * overrides can still be applied before run_config::validate().
 *
 * @code
 * config_loader loader;
 * auto cfg = loader.load_file("config.yml");
 * if (!cfg) {
 *     std::cerr << cfg.error().message << "\n";
 * }
 * @endcode
 */
class config_loader {
public:
    explicit config_loader(unknown_key_policy policy = unknown_key_policy::reject);

    /**
     * @brief Read and parse a configuration file
     * @return config_file_error if unreadable, otherwise as parse_string()
     */
    [[nodiscard]] auto load_file(const std::filesystem::path& path,
                                 const run_config& base = {}) const -> result<run_config>;

    /**
     * @brief Parse a YAML or JSON document
     * @return config_parse_error, config_unknown_key, config_type_mismatch
     *         or config_invalid on failure
     */
    [[nodiscard]] auto parse_string(std::string_view text,
                                    const run_config& base = {}) const -> result<run_config>;

    [[nodiscard]] auto policy() const noexcept -> unknown_key_policy { return policy_; }

    /**
     * @brief All keys the loader recognizes
     */
    [[nodiscard]] static auto known_keys() -> std::vector<std::string_view>;

private:
    unknown_key_policy policy_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CONFIG_CONFIG_LOADER_H
