/**
 * @file report_writer.h
 * @brief Plain-text run report
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_REPORT_REPORT_WRITER_H
#define KCENON_SFTP_STRESS_REPORT_REPORT_WRITER_H

#include <chrono>
#include <filesystem>
#include <string>

#include "kcenon/sftp_stress/core/result_aggregator.h"
#include "kcenon/sftp_stress/core/types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Renders and saves run reports
 *
 * Layout:
 * @code
 * SFTP Test Report
 * =================
 * File: test_0.lz4 Size: 1000 bytes Success: True ConnectTime: 0.12s TransferTime: 0.03s
 * File: test_1.lz4 Size: 1000 bytes Success: False ConnectTime: 0.00s TransferTime: 0.00s Error: ...
 *
 * Summary
 * -------
 * ...
 * @endcode
 *
 * Outcome lines are sorted by artifact name in natural order.
 */
class report_writer {
public:
    /**
     * @brief Per-outcome lines, without the summary block
     */
    [[nodiscard]] static auto render_outcomes(const run_report& report) -> std::string;

    [[nodiscard]] static auto render_summary(const run_summary& summary) -> std::string;

    /**
     * @brief Complete report text
     */
    [[nodiscard]] static auto render_text(const run_report& report) -> std::string;

    /**
     * @brief sftp_report_<unix-seconds>.txt
     */
    [[nodiscard]] static auto default_filename(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
        -> std::string;

    /**
     * @brief Write render_text() to @p path, replacing any existing file
     * @return report_write_failed on I/O errors
     */
    [[nodiscard]] static auto save(const run_report& report,
                                   const std::filesystem::path& path) -> result<void>;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_REPORT_REPORT_WRITER_H
