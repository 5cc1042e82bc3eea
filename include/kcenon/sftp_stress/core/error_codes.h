/**
 * @file error_codes.h
 * @brief Error codes for sftp_stress (-700 to -799 range)
 * @version 0.1.0
 *
 * Error codes follow the range -700 to -799 as per ecosystem convention.
 */

#ifndef KCENON_SFTP_STRESS_CORE_ERROR_CODES_H
#define KCENON_SFTP_STRESS_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::sftp_stress {

/**
 * @brief Error codes for stress run operations (-700 to -799)
 *
 * Error code ranges:
 * - -700 to -709: Connection Errors (session open)
 * - -710 to -729: Transfer Errors (upload, remote cleanup)
 * - -750 to -759: Setup Errors (scratch storage, payload generation)
 * - -760 to -769: Key Validation Errors
 * - -770 to -779: Run Lifecycle Errors
 * - -780 to -789: Report Errors
 * - -790 to -799: Configuration Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Connection Errors (-700 to -709)
    connection_failed = -700,
    connection_timeout = -701,
    host_resolution_failed = -702,
    handshake_failed = -703,
    authentication_failed = -704,
    sftp_init_failed = -705,
    session_not_open = -706,

    // Transfer Errors (-710 to -729)
    remote_open_failed = -710,
    remote_write_failed = -711,
    remote_delete_failed = -712,
    local_read_failed = -713,
    transfer_timeout = -714,
    transfer_cancelled = -715,

    // Setup Errors (-750 to -759)
    scratch_directory_failed = -750,
    payload_write_failed = -751,
    compression_failed = -752,

    // Key Validation Errors (-760 to -769)
    key_not_found = -760,
    key_passphrase_required = -761,
    key_unreadable = -762,

    // Run Lifecycle Errors (-770 to -779)
    run_in_progress = -770,
    internal_error = -771,

    // Report Errors (-780 to -789)
    report_write_failed = -780,

    // Configuration Errors (-790 to -799)
    config_invalid = -790,
    config_file_error = -791,
    config_parse_error = -792,
    config_unknown_key = -793,
    config_type_mismatch = -794,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        // Connection Errors
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::host_resolution_failed:
            return "host name resolution failed";
        case error_code::handshake_failed:
            return "SSH handshake failed";
        case error_code::authentication_failed:
            return "public key authentication failed";
        case error_code::sftp_init_failed:
            return "SFTP subsystem initialization failed";
        case error_code::session_not_open:
            return "session is not open";

        // Transfer Errors
        case error_code::remote_open_failed:
            return "remote file open failed";
        case error_code::remote_write_failed:
            return "remote write failed";
        case error_code::remote_delete_failed:
            return "remote delete failed";
        case error_code::local_read_failed:
            return "local artifact read failed";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::transfer_cancelled:
            return "transfer cancelled before dispatch";

        // Setup Errors
        case error_code::scratch_directory_failed:
            return "scratch directory creation failed";
        case error_code::payload_write_failed:
            return "payload write failed";
        case error_code::compression_failed:
            return "payload compression failed";

        // Key Validation Errors
        case error_code::key_not_found:
            return "private key file not found";
        case error_code::key_passphrase_required:
            return "private key is encrypted; passphrase missing or invalid";
        case error_code::key_unreadable:
            return "unsupported key format or bad passphrase";

        // Run Lifecycle Errors
        case error_code::run_in_progress:
            return "a run is already in progress";
        case error_code::internal_error:
            return "internal error";

        // Report Errors
        case error_code::report_write_failed:
            return "report write failed";

        // Configuration Errors
        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::config_file_error:
            return "configuration file unreadable";
        case error_code::config_parse_error:
            return "configuration file parse error";
        case error_code::config_unknown_key:
            return "unknown configuration key";
        case error_code::config_type_mismatch:
            return "configuration value has wrong type";

        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in connection error range
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -700 && value >= -709;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -710 && value >= -729;
}

/**
 * @brief Check if error code aborts a whole run
 */
[[nodiscard]] constexpr auto is_setup_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -750 && value >= -759;
}

/**
 * @brief Check if error code is in key validation error range
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -760 && value >= -769;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept
    -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -790 && value >= -799;
}

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_ERROR_CODES_H
