/**
 * @file scratch_directory.h
 * @brief Uniquely named temporary directory for one run
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_CORE_SCRATCH_DIRECTORY_H
#define KCENON_SFTP_STRESS_CORE_SCRATCH_DIRECTORY_H

#include <filesystem>
#include <string>

#include "types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Temporary directory removed (recursively) on destruction
 */
class scratch_directory {
public:
    /**
     * @brief Create a new uniquely named directory
     * @param base Parent directory (empty = system temp directory)
     * @param prefix Directory name prefix
     * @return The directory or scratch_directory_failed
     */
    [[nodiscard]] static auto create(const std::filesystem::path& base = {},
                                     const std::string& prefix = "sftp_stress_")
        -> result<scratch_directory>;

    ~scratch_directory();

    scratch_directory(const scratch_directory&) = delete;
    auto operator=(const scratch_directory&) -> scratch_directory& = delete;

    scratch_directory(scratch_directory&& other) noexcept;
    auto operator=(scratch_directory&& other) noexcept -> scratch_directory&;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Number of regular files currently inside the directory
     */
    [[nodiscard]] auto file_count() const -> std::size_t;

    /**
     * @brief Remove the directory and everything in it now
     */
    void remove() noexcept;

private:
    explicit scratch_directory(std::filesystem::path path);

    std::filesystem::path path_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_SCRATCH_DIRECTORY_H
