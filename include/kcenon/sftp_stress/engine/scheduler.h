/**
 * @file scheduler.h
 * @brief Dispatches artifacts to a bounded set of concurrent workers
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_ENGINE_SCHEDULER_H
#define KCENON_SFTP_STRESS_ENGINE_SCHEDULER_H

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/sftp_stress/adapters/worker_pool_adapter.h"
#include "kcenon/sftp_stress/core/artifact.h"
#include "kcenon/sftp_stress/core/event_sink.h"
#include "kcenon/sftp_stress/core/result_aggregator.h"
#include "kcenon/sftp_stress/session/session_slot.h"
#include "cancellation_token.h"

namespace kcenon::sftp_stress {

/**
 * @brief Scheduler configuration
 */
struct scheduler_options {
    std::size_t concurrency = 1;   ///< Effective concurrency C (>= 1)
    slot_options slot;             ///< Session settings, keep-alive included
    std::optional<std::chrono::duration<double>> post_transfer_sleep;
};

/**
 * @brief What one execute() call did
 */
struct dispatch_summary {
    std::size_t dispatched = 0;   ///< Artifacts handed to workers
    std::size_t workers = 0;      ///< min(C, N)
    std::size_t cancelled = 0;    ///< Outcomes with transfer_cancelled
    std::size_t warm_up_failures = 0;
    seconds_f elapsed{0.0};
};

/**
 * @brief Worker pool plus assignment policy
 *
 * Keep-alive on: artifact i goes to slot i mod workers, and each slot's
 * pooled session is opened before dispatch and closed after the drain.
 * Keep-alive off: idle workers take the next artifact from one shared queue.
 *
 * Every artifact yields exactly one outcome in the aggregator, whatever
 * happens to the transfer.
 */
class scheduler {
public:
    scheduler(scheduler_options options,
              std::shared_ptr<session_factory> factory,
              std::shared_ptr<event_sink> sink,
              std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    ~scheduler();

    scheduler(const scheduler&) = delete;
    auto operator=(const scheduler&) -> scheduler& = delete;

    /**
     * @brief Run every artifact and block until all outcomes are recorded
     * @param artifacts Artifacts to dispatch (ownership moves to the workers)
     * @param aggregator Receives one outcome per artifact, in completion order
     * @param token Optional cancellation; unstarted artifacts then yield
     *        transfer_cancelled outcomes
     */
    auto execute(std::vector<artifact> artifacts,
                 result_aggregator& aggregator,
                 cancellation_token* token = nullptr) -> dispatch_summary;

    [[nodiscard]] auto options() const -> const scheduler_options&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_ENGINE_SCHEDULER_H
