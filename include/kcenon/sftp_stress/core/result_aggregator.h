/**
 * @file result_aggregator.h
 * @brief Thread-safe accumulation of transfer outcomes into a run report
 * @version 0.1.0
 */

#ifndef KCENON_SFTP_STRESS_CORE_RESULT_AGGREGATOR_H
#define KCENON_SFTP_STRESS_CORE_RESULT_AGGREGATOR_H

#include <memory>
#include <string_view>
#include <vector>

#include "run_types.h"

namespace kcenon::sftp_stress {

/**
 * @brief Compare artifact names treating digit runs as numbers
 *
 * "test_2.lz4" orders before "test_10.lz4".
 */
[[nodiscard]] auto natural_name_less(std::string_view lhs, std::string_view rhs) -> bool;

/**
 * @brief Compute summary statistics for a set of outcomes
 * @param outcomes Outcomes in any order
 * @param wall_time Elapsed wall-clock time of the run
 *
 * Timing statistics cover successful transfers only; counts and payload
 * bytes cover every outcome.
 */
[[nodiscard]] auto summarize(const std::vector<transfer_outcome>& outcomes,
                             seconds_f wall_time = seconds_f{0.0}) -> run_summary;

/**
 * @brief Immutable result of one completed run
 */
class run_report {
public:
    run_report(std::vector<transfer_outcome> outcomes, run_summary summary);

    /**
     * @brief Outcomes in completion order
     */
    [[nodiscard]] auto outcomes() const -> const std::vector<transfer_outcome>& {
        return outcomes_;
    }

    /**
     * @brief Copy of the outcomes sorted by artifact name
     */
    [[nodiscard]] auto sorted_by_name() const -> std::vector<transfer_outcome>;

    [[nodiscard]] auto summary() const -> const run_summary& { return summary_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return outcomes_.size(); }
    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return summary_.failed == 0;
    }

private:
    std::vector<transfer_outcome> outcomes_;
    run_summary summary_;
};

/**
 * @brief Collects outcomes from concurrent workers
 *
 * Pure accumulation: no deduplication and no cross-outcome validation.
 *
 * @code
 * result_aggregator agg;
 * agg.record(outcome);          // from any thread
 * auto report = agg.finalize(wall_time);
 * @endcode
 */
class result_aggregator {
public:
    result_aggregator();

    result_aggregator(const result_aggregator&) = delete;
    auto operator=(const result_aggregator&) -> result_aggregator& = delete;
    result_aggregator(result_aggregator&&) noexcept;
    auto operator=(result_aggregator&&) noexcept -> result_aggregator&;

    ~result_aggregator();

    /**
     * @brief Append one outcome
     * @return Number of outcomes recorded so far, this one included
     */
    auto record(transfer_outcome outcome) -> std::size_t;

    [[nodiscard]] auto count() const -> std::size_t;

    /**
     * @brief Copy of the outcomes recorded so far, in arrival order
     */
    [[nodiscard]] auto snapshot() const -> std::vector<transfer_outcome>;

    [[nodiscard]] auto summary(seconds_f wall_time = seconds_f{0.0}) const -> run_summary;

    /**
     * @brief Move the outcomes into an immutable report
     *
     * The aggregator is empty afterwards.
     */
    [[nodiscard]] auto finalize(seconds_f wall_time) -> run_report;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_CORE_RESULT_AGGREGATOR_H
