/**
 * @file result_aggregator.cpp
 * @brief Implementation of outcome aggregation and run summaries
 */

#include "kcenon/sftp_stress/core/result_aggregator.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace kcenon::sftp_stress {

namespace {

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

auto natural_name_less(std::string_view lhs, std::string_view rhs) -> bool {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        if (is_digit(lhs[i]) && is_digit(rhs[j])) {
            auto start_i = i;
            auto start_j = j;
            while (i < lhs.size() && is_digit(lhs[i])) ++i;
            while (j < rhs.size() && is_digit(rhs[j])) ++j;

            auto num_l = lhs.substr(start_i, i - start_i);
            auto num_r = rhs.substr(start_j, j - start_j);
            auto strip = [](std::string_view s) {
                auto pos = s.find_first_not_of('0');
                return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
            };
            auto sl = strip(num_l);
            auto sr = strip(num_r);
            if (sl.size() != sr.size()) {
                return sl.size() < sr.size();
            }
            if (sl != sr) {
                return sl < sr;
            }
            if (num_l.size() != num_r.size()) {
                return num_l.size() < num_r.size();
            }
            continue;
        }

        if (lhs[i] != rhs[j]) {
            return lhs[i] < rhs[j];
        }
        ++i;
        ++j;
    }

    return (lhs.size() - i) < (rhs.size() - j);
}

auto summarize(const std::vector<transfer_outcome>& outcomes, seconds_f wall_time)
    -> run_summary {
    run_summary s;
    s.total = outcomes.size();
    s.wall_time = wall_time;

    bool first = true;
    double connect_sum = 0.0;
    double transfer_sum = 0.0;

    for (const auto& o : outcomes) {
        s.total_payload_bytes += o.payload_size;
        if (!o.success) {
            ++s.failed;
            continue;
        }

        ++s.succeeded;
        s.total_archive_bytes += o.archive_size;
        connect_sum += o.connect_time.count();
        transfer_sum += o.transfer_time.count();

        if (first) {
            s.min_connect_time = s.max_connect_time = o.connect_time;
            s.min_transfer_time = s.max_transfer_time = o.transfer_time;
            first = false;
        } else {
            s.min_connect_time = std::min(s.min_connect_time, o.connect_time);
            s.max_connect_time = std::max(s.max_connect_time, o.connect_time);
            s.min_transfer_time = std::min(s.min_transfer_time, o.transfer_time);
            s.max_transfer_time = std::max(s.max_transfer_time, o.transfer_time);
        }
    }

    if (s.succeeded > 0) {
        auto n = static_cast<double>(s.succeeded);
        s.mean_connect_time = seconds_f{connect_sum / n};
        s.mean_transfer_time = seconds_f{transfer_sum / n};
    }
    if (wall_time.count() > 0.0) {
        s.throughput_bytes_per_second =
            static_cast<double>(s.total_archive_bytes) / wall_time.count();
    }
    return s;
}

// ============================================================================
// run_report
// ============================================================================

run_report::run_report(std::vector<transfer_outcome> outcomes, run_summary summary)
    : outcomes_(std::move(outcomes)), summary_(summary) {}

auto run_report::sorted_by_name() const -> std::vector<transfer_outcome> {
    auto sorted = outcomes_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const transfer_outcome& a, const transfer_outcome& b) {
                         return natural_name_less(a.name, b.name);
                     });
    return sorted;
}

// ============================================================================
// result_aggregator
// ============================================================================

struct result_aggregator::impl {
    mutable std::mutex mutex;
    std::vector<transfer_outcome> outcomes;
};

result_aggregator::result_aggregator() : impl_(std::make_unique<impl>()) {}

result_aggregator::result_aggregator(result_aggregator&&) noexcept = default;
auto result_aggregator::operator=(result_aggregator&&) noexcept -> result_aggregator& = default;
result_aggregator::~result_aggregator() = default;

auto result_aggregator::record(transfer_outcome outcome) -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->outcomes.push_back(std::move(outcome));
    return impl_->outcomes.size();
}

auto result_aggregator::count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->outcomes.size();
}

auto result_aggregator::snapshot() const -> std::vector<transfer_outcome> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->outcomes;
}

auto result_aggregator::summary(seconds_f wall_time) const -> run_summary {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return summarize(impl_->outcomes, wall_time);
}

auto result_aggregator::finalize(seconds_f wall_time) -> run_report {
    std::vector<transfer_outcome> outcomes;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        outcomes.swap(impl_->outcomes);
    }
    auto s = summarize(outcomes, wall_time);
    return run_report(std::move(outcomes), s);
}

void result_aggregator::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->outcomes.clear();
}

}  // namespace kcenon::sftp_stress
