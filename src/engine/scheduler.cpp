/**
 * @file scheduler.cpp
 * @brief Worker scheduling and outcome collection
 */

#include "kcenon/sftp_stress/engine/scheduler.h"

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>

#include "kcenon/sftp_stress/engine/result_channel.h"

namespace kcenon::sftp_stress {

namespace {

using clock_type = std::chrono::steady_clock;

/**
 * @brief Artifacts waiting for a worker
 */
class work_queue {
public:
    void push(artifact item) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
    }

    auto try_take() -> std::optional<artifact> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        artifact item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::mutex mutex_;
    std::deque<artifact> items_;
};

auto base_outcome(const artifact& item, std::size_t slot) -> transfer_outcome {
    transfer_outcome outcome;
    outcome.name = item.remote_name();
    outcome.payload_size = item.payload_size();
    outcome.archive_size = item.archive_size();
    outcome.worker_slot = slot;
    outcome.index = item.index();
    return outcome;
}

auto failed_outcome(const artifact& item, std::size_t slot, error_code code,
                    std::string message) -> transfer_outcome {
    auto outcome = base_outcome(item, slot);
    outcome.success = false;
    outcome.code = code;
    outcome.error_message = std::move(message);
    return outcome;
}

}  // namespace

/**
 * @brief Implementation details for scheduler
 */
struct scheduler::impl {
    scheduler_options options;
    std::shared_ptr<session_factory> factory;
    std::shared_ptr<event_sink> sink;
    std::shared_ptr<adapters::worker_pool_interface> pool;

    /**
     * @brief Worker body: drain @p queue through @p slot
     */
    void worker_loop(session_slot& slot,
                     work_queue& queue,
                     result_channel<transfer_outcome>& channel,
                     cancellation_token& token) const {
        while (auto item = queue.try_take()) {
            transfer_outcome outcome;
            if (token.is_cancelled()) {
                outcome = failed_outcome(*item, slot.index(), error_code::transfer_cancelled,
                                         "run cancelled before transfer started");
            } else {
                try {
                    outcome = slot.transfer(*item);
                } catch (const std::exception& e) {
                    outcome = failed_outcome(*item, slot.index(), error_code::internal_error,
                                             std::string("transfer raised: ") + e.what());
                } catch (...) {
                    outcome = failed_outcome(*item, slot.index(), error_code::internal_error,
                                             "transfer raised a non-standard exception");
                }
            }

            // Local file goes away right after the attempt
            item.reset();
            channel.push(std::move(outcome));

            if (options.post_transfer_sleep && !token.is_cancelled()) {
                token.wait_for(*options.post_transfer_sleep);
            }
        }
    }

    void warm_up_slots(std::vector<std::unique_ptr<session_slot>>& slots,
                       dispatch_summary& summary) const {
        std::vector<std::future<void>> pending;
        pending.reserve(slots.size());
        for (auto& slot : slots) {
            auto* s = slot.get();
            pending.push_back(pool->submit_to_stage([s] { (void)s->warm_up(); }, "warm_up"));
        }
        for (auto& f : pending) {
            wait_quietly(f, "warm-up");
        }
        for (const auto& slot : slots) {
            if (slot->warm_up_error()) {
                ++summary.warm_up_failures;
            }
        }
    }

    void wait_quietly(std::future<void>& f, const char* what) const {
        try {
            f.get();
        } catch (const std::exception& e) {
            sink->log(log_level::error, log_category::scheduler,
                      std::string(what) + " task failed: " + e.what());
        }
    }
};

scheduler::scheduler(scheduler_options options,
                     std::shared_ptr<session_factory> factory,
                     std::shared_ptr<event_sink> sink,
                     std::shared_ptr<adapters::worker_pool_interface> pool)
    : impl_(std::make_unique<impl>()) {
    impl_->options = std::move(options);
    impl_->factory = std::move(factory);
    impl_->sink = sink ? std::move(sink) : std::make_shared<null_event_sink>();
    impl_->pool = std::move(pool);
}

scheduler::~scheduler() = default;

auto scheduler::execute(std::vector<artifact> artifacts,
                        result_aggregator& aggregator,
                        cancellation_token* token) -> dispatch_summary {
    dispatch_summary summary;
    const auto total = artifacts.size();
    if (total == 0) {
        return summary;
    }

    auto start = clock_type::now();
    const bool pooled = impl_->options.slot.keep_alive;
    const auto workers =
        std::max<std::size_t>(1, std::min(impl_->options.concurrency, total));
    summary.dispatched = total;
    summary.workers = workers;

    if (!impl_->pool) {
        impl_->pool = adapters::worker_pool_factory::create(workers, "sftp_stress_workers");
    }

    cancellation_token local_token;
    cancellation_token& cancel = token ? *token : local_token;

    std::vector<std::unique_ptr<session_slot>> slots;
    slots.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        slots.push_back(std::make_unique<session_slot>(i, impl_->options.slot, impl_->factory,
                                                       impl_->sink));
    }

    // Pooled: one queue per slot, artifact i -> slot i mod workers.
    // Ephemeral: a single shared queue.
    std::vector<work_queue> queues(pooled ? workers : 1);
    for (auto& item : artifacts) {
        auto target = pooled ? item.index() % workers : 0;
        queues[target].push(std::move(item));
    }
    artifacts.clear();

    impl_->sink->on_run_started(total, workers, pooled);

    if (pooled) {
        impl_->warm_up_slots(slots, summary);
    }

    result_channel<transfer_outcome> channel;
    std::vector<std::future<void>> running;
    running.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        auto* slot = slots[i].get();
        auto* queue = &queues[pooled ? i : 0];
        auto* ch = &channel;
        auto* tok = &cancel;
        auto* self = impl_.get();
        running.push_back(impl_->pool->submit_to_stage(
            [self, slot, queue, ch, tok] { self->worker_loop(*slot, *queue, *ch, *tok); },
            "transfer"));
    }

    for (std::size_t received = 0; received < total; ++received) {
        auto outcome = channel.pop();
        if (outcome.code == error_code::transfer_cancelled) {
            ++summary.cancelled;
        }
        aggregator.record(outcome);
        impl_->sink->on_transfer_completed(outcome, received + 1, total);
    }

    // Workers may still be in their post-transfer sleep
    for (auto& f : running) {
        impl_->wait_quietly(f, "worker");
    }

    for (auto& slot : slots) {
        slot->close();
    }

    summary.elapsed = std::chrono::duration_cast<seconds_f>(clock_type::now() - start);
    return summary;
}

auto scheduler::options() const -> const scheduler_options& { return impl_->options; }

}  // namespace kcenon::sftp_stress
