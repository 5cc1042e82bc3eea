/**
 * @file orchestrator.h
 * @brief One complete stress run: generate, transfer, aggregate, clean up
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_ENGINE_ORCHESTRATOR_H
#define KCENON_SFTP_STRESS_ENGINE_ORCHESTRATOR_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "kcenon/sftp_stress/adapters/worker_pool_adapter.h"
#include "kcenon/sftp_stress/config/run_config.h"
#include "kcenon/sftp_stress/core/event_sink.h"
#include "kcenon/sftp_stress/core/result_aggregator.h"
#include "kcenon/sftp_stress/session/session_interface.h"
#include "cancellation_token.h"

namespace kcenon::sftp_stress {

/**
 * @brief What to do when an artifact cannot be written to scratch storage
 */
enum class payload_failure_policy {
    abort_run,       ///< Reclaim everything and return the setup error
    record_failure   ///< Record a failed outcome for that artifact and continue
};

/**
 * @brief Orchestrator settings that are not part of run_config
 */
struct orchestrator_options {
    std::filesystem::path scratch_base;   ///< Empty = system temp directory
    payload_failure_policy on_payload_failure = payload_failure_policy::abort_run;
    std::optional<uint64_t> size_seed;    ///< Reproducible size draws
    std::shared_ptr<adapters::worker_pool_interface> pool;  ///< Null = create per run
};

/**
 * @brief Drives one run through idle -> generating_payloads -> transferring
 *        -> aggregated -> done
 *
 * Not reentrant: run() while another run() is active returns
 * run_in_progress. Scratch storage is reclaimed on every exit path.
 *
 * @code
 * auto sink = std::make_shared<logging_event_sink>(logger);
 * orchestrator orch(cfg, std::make_shared<sftp_session_factory>(sink), sink);
 * auto report = orch.run();
 * if (report) {
 *     report_writer::save(report.value(), report_writer::default_filename());
 * }
 * @endcode
 */
class orchestrator {
public:
    orchestrator(run_config config,
                 std::shared_ptr<session_factory> factory,
                 std::shared_ptr<event_sink> sink,
                 orchestrator_options options = {});

    ~orchestrator();

    orchestrator(const orchestrator&) = delete;
    auto operator=(const orchestrator&) -> orchestrator& = delete;

    /**
     * @brief Execute the run
     * @param token Optional cancellation token
     * @return The report (even at 100% failure), or a setup, config or
     *         run_in_progress error
     */
    [[nodiscard]] auto run(cancellation_token* token = nullptr) -> result<run_report>;

    [[nodiscard]] auto state() const noexcept -> run_state;
    [[nodiscard]] auto config() const -> const run_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_ENGINE_ORCHESTRATOR_H
