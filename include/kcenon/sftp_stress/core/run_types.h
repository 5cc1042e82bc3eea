/**
 * @file run_types.h
 * @brief Value types produced by a stress run
 * @version 0.1.0
 *
 * This file defines the run state machine, the per-artifact transfer outcome
 * and the aggregated run summary.
 */

#ifndef KCENON_SFTP_STRESS_CORE_RUN_TYPES_H
#define KCENON_SFTP_STRESS_CORE_RUN_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "error_codes.h"

namespace kcenon::sftp_stress {

/**
 * @brief Seconds with sub-second resolution, as reported per transfer
 */
using seconds_f = std::chrono::duration<double>;

/**
 * @brief Orchestrator lifecycle states (strictly sequential)
 */
enum class run_state {
    idle,                 ///< No run active
    generating_payloads,  ///< Producing artifacts in scratch storage
    transferring,         ///< Scheduler is dispatching artifacts
    aggregated,           ///< All outcomes collected
    done                  ///< Scratch storage reclaimed
};

[[nodiscard]] constexpr auto to_string(run_state state) noexcept -> std::string_view {
    switch (state) {
        case run_state::idle: return "idle";
        case run_state::generating_payloads: return "generating_payloads";
        case run_state::transferring: return "transferring";
        case run_state::aggregated: return "aggregated";
        case run_state::done: return "done";
        default: return "unknown";
    }
}

/**
 * @brief Result of one artifact's transfer attempt
 *
 * Produced exactly once per artifact by the worker that processed it.
 */
struct transfer_outcome {
    std::string name;                    ///< Remote artifact name
    uint64_t payload_size = 0;           ///< Uncompressed payload bytes
    uint64_t archive_size = 0;           ///< Bytes actually uploaded
    seconds_f connect_time{0.0};         ///< Session open time (zero when pooled)
    seconds_f transfer_time{0.0};        ///< Upload time, remote delete excluded
    bool success = false;
    std::optional<std::string> error_message;
    error_code code = error_code::success;
    std::size_t worker_slot = 0;
    std::size_t index = 0;               ///< Submission index
};

/**
 * @brief Aggregate statistics over all outcomes of a run
 */
struct run_summary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    uint64_t total_payload_bytes = 0;
    uint64_t total_archive_bytes = 0;   ///< Archive bytes of successful uploads only
    seconds_f mean_connect_time{0.0};
    seconds_f min_connect_time{0.0};
    seconds_f max_connect_time{0.0};
    seconds_f mean_transfer_time{0.0};
    seconds_f min_transfer_time{0.0};
    seconds_f max_transfer_time{0.0};
    seconds_f wall_time{0.0};
    double throughput_bytes_per_second = 0.0;  ///< Successful archive bytes over wall time
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_RUN_TYPES_H
