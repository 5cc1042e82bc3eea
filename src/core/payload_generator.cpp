/**
 * @file payload_generator.cpp
 * @brief Payload generation implementation (OpenSSL RAND_bytes + LZ4 frame)
 */

#include "kcenon/sftp_stress/core/payload_generator.h"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <random>
#include <system_error>
#include <vector>

#include <lz4frame.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace kcenon::sftp_stress {

namespace {

using lz4f_context = std::unique_ptr<LZ4F_cctx, decltype(&LZ4F_freeCompressionContext)>;

auto make_context() -> result<lz4f_context> {
    LZ4F_cctx* raw = nullptr;
    auto rc = LZ4F_createCompressionContext(&raw, LZ4F_VERSION);
    if (LZ4F_isError(rc)) {
        return unexpected(error(error_code::compression_failed,
                                std::string("LZ4F context: ") + LZ4F_getErrorName(rc)));
    }
    return lz4f_context(raw, &LZ4F_freeCompressionContext);
}

void discard(std::ofstream& out, const std::filesystem::path& path) {
    out.close();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

/**
 * @brief Implementation details for payload_generator
 */
struct payload_generator::impl {
    std::filesystem::path dir;
    payload_options options;

    std::mutex rng_mutex;
    std::mt19937_64 rng;

    impl(std::filesystem::path d, payload_options opts)
        : dir(std::move(d)), options(std::move(opts)) {
        if (options.seed) {
            rng.seed(*options.seed);
        } else {
            std::random_device rd;
            rng.seed((static_cast<uint64_t>(rd()) << 32) | rd());
        }
        if (options.block_size == 0) {
            options.block_size = 64 * 1024;
        }
    }

    auto write_frame(std::ofstream& out, uint64_t size_bytes) -> result<uint64_t> {
        auto ctx = make_context();
        if (!ctx) {
            return unexpected(ctx.error());
        }

        LZ4F_preferences_t prefs{};
        prefs.frameInfo.contentSize = size_bytes;
        prefs.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
        prefs.compressionLevel = options.compression_level;

        const std::size_t block = options.block_size;
        std::vector<unsigned char> src(block);
        std::vector<char> dst(std::max<std::size_t>(LZ4F_compressBound(block, &prefs),
                                                    LZ4F_HEADER_SIZE_MAX));

        uint64_t archive_bytes = 0;
        auto emit = [&](std::size_t rc) -> result<void> {
            if (LZ4F_isError(rc)) {
                return unexpected(error(error_code::compression_failed,
                                        std::string("LZ4F: ") + LZ4F_getErrorName(rc)));
            }
            if (rc > 0) {
                out.write(dst.data(), static_cast<std::streamsize>(rc));
                if (!out) {
                    return unexpected(error(error_code::payload_write_failed,
                                            "short write to scratch file"));
                }
                archive_bytes += rc;
            }
            return {};
        };

        if (auto r = emit(LZ4F_compressBegin(ctx.value().get(), dst.data(), dst.size(), &prefs));
            !r) {
            return unexpected(r.error());
        }

        uint64_t remaining = size_bytes;
        while (remaining > 0) {
            auto chunk = static_cast<std::size_t>(std::min<uint64_t>(remaining, block));
            if (RAND_bytes(src.data(), static_cast<int>(chunk)) != 1) {
                ERR_clear_error();
                return unexpected(error(error_code::payload_write_failed,
                                        "random source failure"));
            }
            if (auto r = emit(LZ4F_compressUpdate(ctx.value().get(), dst.data(), dst.size(),
                                                  src.data(), chunk, nullptr));
                !r) {
                return unexpected(r.error());
            }
            remaining -= chunk;
        }

        if (auto r = emit(LZ4F_compressEnd(ctx.value().get(), dst.data(), dst.size(), nullptr));
            !r) {
            return unexpected(r.error());
        }

        out.flush();
        if (!out) {
            return unexpected(error(error_code::payload_write_failed, "flush failed"));
        }
        return archive_bytes;
    }
};

payload_generator::payload_generator(std::filesystem::path scratch_dir,
                                     payload_options options)
    : impl_(std::make_unique<impl>(std::move(scratch_dir), std::move(options))) {}

payload_generator::payload_generator(payload_generator&&) noexcept = default;
auto payload_generator::operator=(payload_generator&&) noexcept -> payload_generator& = default;
payload_generator::~payload_generator() = default;

auto payload_generator::draw_size() -> uint64_t {
    auto lo = std::min(impl_->options.min_size, impl_->options.max_size);
    auto hi = std::max(impl_->options.min_size, impl_->options.max_size);

    std::uniform_int_distribution<uint64_t> dist(lo, hi);
    std::lock_guard<std::mutex> lock(impl_->rng_mutex);
    return dist(impl_->rng);
}

auto payload_generator::generate(uint64_t size_bytes, std::size_t index) -> result<artifact> {
    auto name = artifact_name(index);
    auto path = impl_->dir / name;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(error(error_code::payload_write_failed,
                                "cannot open " + path.string() + " for writing"));
    }

    auto written = impl_->write_frame(out, size_bytes);
    if (!written) {
        discard(out, path);
        return unexpected(error(written.error().code,
                                written.error().message + " (" + name + ")"));
    }

    out.close();
    if (out.fail()) {
        discard(out, path);
        return unexpected(error(error_code::payload_write_failed,
                                "cannot close " + path.string()));
    }

    return artifact(std::move(path), std::move(name), size_bytes, written.value(), index);
}

auto payload_generator::generate_next(std::size_t index) -> result<artifact> {
    return generate(draw_size(), index);
}

auto payload_generator::artifact_name(std::size_t index) -> std::string {
    return "test_" + std::to_string(index) + ".lz4";
}

auto payload_generator::options() const -> const payload_options& {
    return impl_->options;
}

auto payload_generator::scratch_dir() const -> const std::filesystem::path& {
    return impl_->dir;
}

}  // namespace kcenon::sftp_stress
