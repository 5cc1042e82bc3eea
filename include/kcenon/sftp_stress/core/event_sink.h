/**
 * @file event_sink.h
 * @brief Injected observer for run-level and per-transfer events
 * @version 0.1.0
 *
 * The engine never writes to a global logger. Every component receives an
 * event_sink and reports through it; the caller decides where events go.
 */

#ifndef KCENON_SFTP_STRESS_CORE_EVENT_SINK_H
#define KCENON_SFTP_STRESS_CORE_EVENT_SINK_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "logging.h"
#include "run_types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Receiver for engine events
 *
 * Implementations must be thread-safe: transfer events arrive concurrently
 * from every worker.
 */
class event_sink {
public:
    virtual ~event_sink() = default;

    /**
     * @brief Free-form diagnostic message
     */
    virtual void log(log_level level,
                     std::string_view category,
                     std::string_view message,
                     const run_log_context* context = nullptr) = 0;

    virtual void on_state_changed(run_state from, run_state to) {
        (void)from;
        (void)to;
    }

    virtual void on_run_started(std::size_t artifact_count,
                                std::size_t workers,
                                bool keep_alive) {
        (void)artifact_count;
        (void)workers;
        (void)keep_alive;
    }

    virtual void on_artifact_generated(std::string_view name,
                                       uint64_t payload_size,
                                       uint64_t archive_size) {
        (void)name;
        (void)payload_size;
        (void)archive_size;
    }

    /**
     * @brief Upload progress for one artifact
     * @param name Artifact name
     * @param bytes_sent Bytes written so far (monotonically increasing)
     * @param total Archive size
     */
    virtual void on_transfer_progress(std::string_view name,
                                      uint64_t bytes_sent,
                                      uint64_t total) {
        (void)name;
        (void)bytes_sent;
        (void)total;
    }

    /**
     * @brief One artifact finished (successfully or not)
     * @param outcome The recorded outcome
     * @param completed Outcomes recorded so far, this one included
     * @param total Artifacts dispatched in this run
     */
    virtual void on_transfer_completed(const transfer_outcome& outcome,
                                       std::size_t completed,
                                       std::size_t total) {
        (void)outcome;
        (void)completed;
        (void)total;
    }

    virtual void on_run_finished(const run_summary& summary) { (void)summary; }
};

/**
 * @brief Discards every event
 */
class null_event_sink : public event_sink {
public:
    void log(log_level, std::string_view, std::string_view,
             const run_log_context*) override {}
};

/**
 * @brief Forwards events to a caller-owned stress_logger
 *
 * Progress is logged at debug level on 25% milestones; failed transfers are
 * logged at error level as they complete.
 */
class logging_event_sink : public event_sink {
public:
    explicit logging_event_sink(std::shared_ptr<stress_logger> logger,
                                std::string host = {});

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const run_log_context* context = nullptr) override;

    void on_state_changed(run_state from, run_state to) override;
    void on_run_started(std::size_t artifact_count,
                        std::size_t workers,
                        bool keep_alive) override;
    void on_artifact_generated(std::string_view name,
                               uint64_t payload_size,
                               uint64_t archive_size) override;
    void on_transfer_progress(std::string_view name,
                              uint64_t bytes_sent,
                              uint64_t total) override;
    void on_transfer_completed(const transfer_outcome& outcome,
                               std::size_t completed,
                               std::size_t total) override;
    void on_run_finished(const run_summary& summary) override;

    [[nodiscard]] auto logger() const -> const std::shared_ptr<stress_logger>& {
        return logger_;
    }

    /**
     * @brief Uploads with progress seen but no completion yet
     */
    [[nodiscard]] auto tracked_uploads() const -> std::size_t;

private:
    std::shared_ptr<stress_logger> logger_;
    std::string host_;
    mutable std::mutex progress_mutex_;
    std::unordered_map<std::string, int> progress_milestones_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_EVENT_SINK_H
