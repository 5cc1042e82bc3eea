/**
 * @file key_validator.h
 * @brief Pre-run private key validation
 * @version 0.1.0
 *
 * Checks that the configured private key can be read and, when encrypted,
 * that a passphrase is available. Callers log the outcome; a failed check
 * never blocks a run because the server is the final authority.
 */

#ifndef KCENON_SFTP_STRESS_SECURITY_KEY_VALIDATOR_H
#define KCENON_SFTP_STRESS_SECURITY_KEY_VALIDATOR_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/sftp_stress/core/types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Private key algorithm
 */
enum class key_type {
    unknown,
    rsa,
    ecdsa,
    ed25519,
    dsa
};

[[nodiscard]] constexpr auto to_string(key_type type) noexcept -> std::string_view {
    switch (type) {
        case key_type::rsa: return "RSA";
        case key_type::ecdsa: return "ECDSA";
        case key_type::ed25519: return "Ed25519";
        case key_type::dsa: return "DSA";
        default: return "unknown";
    }
}

/**
 * @brief Container format of a key file
 */
enum class key_format {
    pem,     ///< PKCS#1, SEC1 or PKCS#8 PEM
    openssh  ///< openssh-key-v1
};

[[nodiscard]] constexpr auto to_string(key_format format) noexcept -> std::string_view {
    return format == key_format::openssh ? "OpenSSH" : "PEM";
}

/**
 * @brief What was learned about a readable key
 */
struct key_info {
    key_type type = key_type::unknown;
    key_format format = key_format::pem;
    bool encrypted = false;

    /// False when the key is encrypted in a format whose passphrase
    /// cannot be checked locally (bcrypt-protected OpenSSH keys).
    bool passphrase_verified = true;
};

/**
 * @brief Validates SSH private key files
 *
 * PEM keys are loaded through OpenSSL, which covers RSA, EC, Ed25519, DSA
 * and PKCS#8. OpenSSH-format keys are parsed up to the public key block to
 * learn the algorithm and cipher.
 *
 * @code
 * auto info = key_validator::validate("/home/me/.ssh/id_ed25519", std::nullopt);
 * if (!info) {
 *     SS_LOG_WARN(logger, log_category::key, info.error().message);
 * }
 * @endcode
 */
class key_validator {
public:
    /**
     * @brief Validate a key file
     * @param path Key file; an empty path is reported as key_not_found
     * @param passphrase Passphrase for encrypted keys
     * @return key_info, or key_not_found, key_passphrase_required, key_unreadable
     */
    [[nodiscard]] static auto validate(const std::filesystem::path& path,
                                       const std::optional<std::string>& passphrase)
        -> result<key_info>;

    /**
     * @brief Validate an in-memory key
     * @param origin Name used in error messages
     */
    [[nodiscard]] static auto validate_text(std::string_view text,
                                            const std::optional<std::string>& passphrase,
                                            std::string_view origin = "<memory>")
        -> result<key_info>;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_SECURITY_KEY_VALIDATOR_H
