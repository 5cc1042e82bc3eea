/**
 * @file artifact.h
 * @brief Owning handle for one generated test artifact
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_CORE_ARTIFACT_H
#define KCENON_SFTP_STRESS_CORE_ARTIFACT_H

#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::sftp_stress {

/**
 * @brief A compressed payload file in scratch storage
 *
 * Move-only. The local file is removed when the owning object is destroyed
 * or release() is called, whichever comes first.
 *
 * @code
 * auto art = generator.generate(1000, 0);
 * if (art) {
 *     session.upload(art.value(), "/upload");
 * }   // local file removed here
 * @endcode
 */
class artifact {
public:
    artifact(std::filesystem::path local_path,
             std::string remote_name,
             uint64_t payload_size,
             uint64_t archive_size,
             std::size_t index);

    ~artifact();

    artifact(const artifact&) = delete;
    auto operator=(const artifact&) -> artifact& = delete;

    artifact(artifact&& other) noexcept;
    auto operator=(artifact&& other) noexcept -> artifact&;

    [[nodiscard]] auto local_path() const -> const std::filesystem::path& { return local_path_; }
    [[nodiscard]] auto remote_name() const -> const std::string& { return remote_name_; }
    [[nodiscard]] auto payload_size() const noexcept -> uint64_t { return payload_size_; }
    [[nodiscard]] auto archive_size() const noexcept -> uint64_t { return archive_size_; }
    [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }

    /**
     * @brief Check whether the local file is still owned
     */
    [[nodiscard]] auto owns_file() const noexcept -> bool { return !local_path_.empty(); }

    /**
     * @brief Remove the local file now
     * @return true if a file was removed
     */
    auto release() noexcept -> bool;

private:
    std::filesystem::path local_path_;
    std::string remote_name_;
    uint64_t payload_size_ = 0;
    uint64_t archive_size_ = 0;
    std::size_t index_ = 0;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_ARTIFACT_H
