/**
 * @file report_writer.cpp
 * @brief Report rendering implementation
 */

#include "kcenon/sftp_stress/report/report_writer.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::sftp_stress {

namespace {

constexpr double bytes_per_mib = 1024.0 * 1024.0;

auto format_seconds(seconds_f value) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value.count() << "s";
    return oss.str();
}

}  // namespace

auto report_writer::render_outcomes(const run_report& report) -> std::string {
    std::ostringstream oss;
    oss << "SFTP Test Report\n"
        << "=================";

    for (const auto& outcome : report.sorted_by_name()) {
        oss << "\nFile: " << outcome.name
            << " Size: " << outcome.payload_size << " bytes"
            << " Success: " << (outcome.success ? "True" : "False")
            << " ConnectTime: " << format_seconds(outcome.connect_time)
            << " TransferTime: " << format_seconds(outcome.transfer_time);
        if (outcome.error_message && !outcome.error_message->empty()) {
            oss << " Error: " << *outcome.error_message;
        }
    }
    return oss.str();
}

auto report_writer::render_summary(const run_summary& summary) -> std::string {
    std::ostringstream oss;
    oss << "Summary\n"
        << "-------\n"
        << "Files: " << summary.total
        << " Succeeded: " << summary.succeeded
        << " Failed: " << summary.failed << "\n"
        << "PayloadBytes: " << summary.total_payload_bytes
        << " UploadedBytes: " << summary.total_archive_bytes << "\n";

    if (summary.succeeded > 0) {
        oss << "ConnectTime: mean " << format_seconds(summary.mean_connect_time)
            << " min " << format_seconds(summary.min_connect_time)
            << " max " << format_seconds(summary.max_connect_time) << "\n"
            << "TransferTime: mean " << format_seconds(summary.mean_transfer_time)
            << " min " << format_seconds(summary.min_transfer_time)
            << " max " << format_seconds(summary.max_transfer_time) << "\n";
    }

    oss << "WallTime: " << format_seconds(summary.wall_time)
        << " Throughput: " << std::fixed << std::setprecision(2)
        << summary.throughput_bytes_per_second / bytes_per_mib << " MiB/s";
    return oss.str();
}

auto report_writer::render_text(const run_report& report) -> std::string {
    return render_outcomes(report) + "\n\n" + render_summary(report.summary()) + "\n";
}

auto report_writer::default_filename(std::chrono::system_clock::time_point now) -> std::string {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    return "sftp_report_" + std::to_string(seconds.count()) + ".txt";
}

auto report_writer::save(const run_report& report, const std::filesystem::path& path)
    -> result<void> {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return unexpected(error(error_code::report_write_failed,
                                "cannot open " + path.string() + " for writing"));
    }

    out << render_text(report);
    out.flush();
    if (!out) {
        return unexpected(error(error_code::report_write_failed,
                                "write to " + path.string() + " failed"));
    }
    return {};
}

}  // namespace kcenon::sftp_stress
