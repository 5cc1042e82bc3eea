/**
 * @file event_sink.cpp
 * @brief logging_event_sink implementation
 */

#include "kcenon/sftp_stress/core/event_sink.h"

#include <iomanip>
#include <sstream>

namespace kcenon::sftp_stress {

logging_event_sink::logging_event_sink(std::shared_ptr<stress_logger> logger,
                                       std::string host)
    : logger_(std::move(logger)), host_(std::move(host)) {}

void logging_event_sink::log(log_level level,
                             std::string_view category,
                             std::string_view message,
                             const run_log_context* context) {
    if (!logger_) {
        return;
    }
    logger_->log(level, category, message, context);
}

void logging_event_sink::on_state_changed(run_state from, run_state to) {
    log(log_level::debug, log_category::orchestrator,
        "state " + std::string(to_string(from)) + " -> " + std::string(to_string(to)));
}

void logging_event_sink::on_run_started(std::size_t artifact_count,
                                        std::size_t workers,
                                        bool keep_alive) {
    run_log_context ctx;
    if (!host_.empty()) {
        ctx.host = host_;
    }
    log(log_level::info, log_category::orchestrator,
        "dispatching " + std::to_string(artifact_count) + " artifacts on " +
            std::to_string(workers) + (keep_alive ? " pooled" : " ephemeral") +
            " worker(s)",
        &ctx);
}

void logging_event_sink::on_artifact_generated(std::string_view name,
                                               uint64_t payload_size,
                                               uint64_t archive_size) {
    run_log_context ctx;
    ctx.artifact = std::string(name);
    ctx.payload_bytes = payload_size;
    ctx.archive_bytes = archive_size;
    log(log_level::debug, log_category::payload, "artifact generated", &ctx);
}

void logging_event_sink::on_transfer_progress(std::string_view name,
                                              uint64_t bytes_sent,
                                              uint64_t total) {
    if (!logger_ || !logger_->is_enabled(log_level::debug) || total == 0) {
        return;
    }

    int milestone = static_cast<int>((bytes_sent * 4) / total) * 25;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        auto& last = progress_milestones_[std::string(name)];
        if (milestone <= last) {
            return;
        }
        last = milestone;
        if (milestone >= 100) {
            progress_milestones_.erase(std::string(name));
        }
    }

    run_log_context ctx;
    ctx.artifact = std::string(name);
    ctx.archive_bytes = total;
    log(log_level::debug, log_category::session,
        "upload " + std::to_string(milestone) + "% (" + std::to_string(bytes_sent) +
            " bytes)",
        &ctx);
}

void logging_event_sink::on_transfer_completed(const transfer_outcome& outcome,
                                               std::size_t completed,
                                               std::size_t total) {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress_milestones_.erase(outcome.name);
    }

    run_log_context ctx;
    ctx.artifact = outcome.name;
    ctx.payload_bytes = outcome.payload_size;
    ctx.archive_bytes = outcome.archive_size;
    ctx.worker_slot = outcome.worker_slot;
    ctx.connect_seconds = outcome.connect_time.count();
    ctx.transfer_seconds = outcome.transfer_time.count();
    if (!host_.empty()) {
        ctx.host = host_;
    }

    std::string progress =
        "[" + std::to_string(completed) + "/" + std::to_string(total) + "] ";
    if (outcome.success) {
        log(log_level::info, log_category::scheduler, progress + "transfer succeeded", &ctx);
    } else {
        ctx.error_message = outcome.error_message.value_or(std::string(to_string(outcome.code)));
        log(log_level::error, log_category::scheduler, progress + "transfer failed", &ctx);
    }
}

auto logging_event_sink::tracked_uploads() const -> std::size_t {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_milestones_.size();
}

void logging_event_sink::on_run_finished(const run_summary& summary) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "run finished: " << summary.succeeded << "/" << summary.total
        << " succeeded, " << summary.failed << " failed, wall "
        << summary.wall_time.count() << "s, throughput "
        << summary.throughput_bytes_per_second << " B/s";
    log(summary.failed > 0 ? log_level::warn : log_level::info,
        log_category::orchestrator, oss.str());
}

}  // namespace kcenon::sftp_stress
