/**
 * @file scratch_directory.cpp
 * @brief Implementation of scratch_directory
 */

#include "kcenon/sftp_stress/core/scratch_directory.h"

#include <atomic>
#include <chrono>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

namespace kcenon::sftp_stress {

namespace {

auto unique_suffix() -> std::string {
    static std::atomic<uint64_t> counter{0};
    std::random_device rd;
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();

    std::ostringstream oss;
    oss << std::hex << rd() << "_" << static_cast<uint64_t>(ticks) << "_"
        << counter.fetch_add(1, std::memory_order_relaxed);
    return oss.str();
}

}  // namespace

scratch_directory::scratch_directory(std::filesystem::path path)
    : path_(std::move(path)) {}

auto scratch_directory::create(const std::filesystem::path& base,
                               const std::string& prefix) -> result<scratch_directory> {
    std::error_code ec;
    std::filesystem::path parent = base;
    if (parent.empty()) {
        parent = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return unexpected(error(error_code::scratch_directory_failed,
                                    "temp directory unavailable: " + ec.message()));
        }
    }

    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return unexpected(error(error_code::scratch_directory_failed,
                                "cannot create " + parent.string() + ": " + ec.message()));
    }

    constexpr int max_attempts = 8;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        auto candidate = parent / (prefix + unique_suffix());
        if (std::filesystem::create_directory(candidate, ec)) {
            return scratch_directory(std::move(candidate));
        }
        if (ec) {
            return unexpected(error(error_code::scratch_directory_failed,
                                    "cannot create " + candidate.string() + ": " +
                                        ec.message()));
        }
    }

    return unexpected(error(error_code::scratch_directory_failed,
                            "no unique directory name under " + parent.string()));
}

scratch_directory::~scratch_directory() { remove(); }

scratch_directory::scratch_directory(scratch_directory&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

auto scratch_directory::operator=(scratch_directory&& other) noexcept -> scratch_directory& {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

auto scratch_directory::file_count() const -> std::size_t {
    if (path_.empty()) {
        return 0;
    }

    std::error_code ec;
    std::size_t count = 0;
    for (std::filesystem::directory_iterator it(path_, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            ++count;
        }
    }
    return count;
}

void scratch_directory::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

}  // namespace kcenon::sftp_stress
