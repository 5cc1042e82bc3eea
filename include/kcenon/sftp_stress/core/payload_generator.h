/**
 * @file payload_generator.h
 * @brief Random payload generation into LZ4 frame containers
 * @version 0.1.0
 *
 * This file defines the payload_generator class, which draws artifact sizes
 * and writes that many random bytes (OpenSSL RAND_bytes) through the LZ4
 * frame compressor into a scratch file.
 */

#ifndef KCENON_SFTP_STRESS_CORE_PAYLOAD_GENERATOR_H
#define KCENON_SFTP_STRESS_CORE_PAYLOAD_GENERATOR_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "artifact.h"
#include "types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Payload generation settings
 */
struct payload_options {
    uint64_t min_size = 6000;                 ///< Smallest payload in bytes
    uint64_t max_size = 64000000;             ///< Largest payload in bytes
    std::optional<uint64_t> seed;             ///< Seeds size draws only; content is always random
    std::size_t block_size = 1024 * 1024;     ///< Bytes fed to the compressor per step
    int compression_level = 0;                ///< LZ4F level (0 = fast default)
};

/**
 * @brief Produces test artifacts in a scratch directory
 *
 * draw_size() and generate() may be called from several threads; artifact
 * file names are derived from the index so no locking on the directory is
 * required.
 *
 * @code
 * payload_generator gen(scratch.path(), {.min_size = 1000, .max_size = 1000});
 * auto art = gen.generate_next(0);
 * if (!art) {
 *     // art.error().code == error_code::payload_write_failed
 * }
 * @endcode
 */
class payload_generator {
public:
    /**
     * @brief Construct a generator
     * @param scratch_dir Directory that receives the artifact files
     * @param options Size bounds and compressor settings
     */
    payload_generator(std::filesystem::path scratch_dir, payload_options options);

    payload_generator(const payload_generator&) = delete;
    auto operator=(const payload_generator&) -> payload_generator& = delete;
    payload_generator(payload_generator&&) noexcept;
    auto operator=(payload_generator&&) noexcept -> payload_generator&;

    ~payload_generator();

    /**
     * @brief Draw a payload size uniformly from [min_size, max_size]
     */
    [[nodiscard]] auto draw_size() -> uint64_t;

    /**
     * @brief Write an artifact with exactly @p size_bytes of random payload
     * @param size_bytes Uncompressed payload size
     * @param index Submission index (determines the artifact name)
     * @return The artifact, or payload_write_failed / compression_failed
     *
     * A partially written file is removed before an error is returned.
     */
    [[nodiscard]] auto generate(uint64_t size_bytes, std::size_t index) -> result<artifact>;

    /**
     * @brief draw_size() followed by generate()
     */
    [[nodiscard]] auto generate_next(std::size_t index) -> result<artifact>;

    /**
     * @brief Remote/local name for the artifact at @p index ("test_<index>.lz4")
     */
    [[nodiscard]] static auto artifact_name(std::size_t index) -> std::string;

    [[nodiscard]] auto options() const -> const payload_options&;
    [[nodiscard]] auto scratch_dir() const -> const std::filesystem::path&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_PAYLOAD_GENERATOR_H
