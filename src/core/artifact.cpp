/**
 * @file artifact.cpp
 * @brief Implementation of the artifact file handle
 */

#include "kcenon/sftp_stress/core/artifact.h"

#include <system_error>
#include <utility>

namespace kcenon::sftp_stress {

artifact::artifact(std::filesystem::path local_path,
                   std::string remote_name,
                   uint64_t payload_size,
                   uint64_t archive_size,
                   std::size_t index)
    : local_path_(std::move(local_path)),
      remote_name_(std::move(remote_name)),
      payload_size_(payload_size),
      archive_size_(archive_size),
      index_(index) {}

artifact::~artifact() { release(); }

artifact::artifact(artifact&& other) noexcept
    : local_path_(std::exchange(other.local_path_, {})),
      remote_name_(std::move(other.remote_name_)),
      payload_size_(other.payload_size_),
      archive_size_(other.archive_size_),
      index_(other.index_) {}

auto artifact::operator=(artifact&& other) noexcept -> artifact& {
    if (this != &other) {
        release();
        local_path_ = std::exchange(other.local_path_, {});
        remote_name_ = std::move(other.remote_name_);
        payload_size_ = other.payload_size_;
        archive_size_ = other.archive_size_;
        index_ = other.index_;
    }
    return *this;
}

auto artifact::release() noexcept -> bool {
    if (local_path_.empty()) {
        return false;
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(local_path_, ec);
    local_path_.clear();
    return removed && !ec;
}

}  // namespace kcenon::sftp_stress
