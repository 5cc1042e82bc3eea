/**
 * @file orchestrator.cpp
 * @brief Run lifecycle implementation
 */

#include "kcenon/sftp_stress/engine/orchestrator.h"

#include <atomic>
#include <chrono>
#include <vector>

#include "kcenon/sftp_stress/core/payload_generator.h"
#include "kcenon/sftp_stress/core/scratch_directory.h"
#include "kcenon/sftp_stress/engine/scheduler.h"

namespace kcenon::sftp_stress {

namespace {

using clock_type = std::chrono::steady_clock;

auto unsent_outcome(std::size_t index, uint64_t payload_size, const error& err)
    -> transfer_outcome {
    transfer_outcome outcome;
    outcome.name = payload_generator::artifact_name(index);
    outcome.payload_size = payload_size;
    outcome.index = index;
    outcome.success = false;
    outcome.code = err.code;
    outcome.error_message = err.message;
    return outcome;
}

}  // namespace

/**
 * @brief Implementation details for orchestrator
 */
struct orchestrator::impl {
    run_config config;
    std::shared_ptr<session_factory> factory;
    std::shared_ptr<event_sink> sink;
    orchestrator_options options;

    std::atomic<run_state> state{run_state::idle};
    std::atomic<bool> running{false};

    void transition(run_state to) {
        auto from = state.exchange(to);
        sink->on_state_changed(from, to);
    }

    /**
     * @brief Ends the run on every exit path
     */
    class run_guard {
    public:
        explicit run_guard(impl& owner) : owner_(owner) {}
        ~run_guard() {
            owner_.transition(run_state::done);
            owner_.running.store(false);
        }

        run_guard(const run_guard&) = delete;
        auto operator=(const run_guard&) -> run_guard& = delete;

    private:
        impl& owner_;
    };

    /**
     * @brief Produce all artifacts, or the setup error that aborts the run
     */
    auto generate_all(payload_generator& generator,
                      result_aggregator& aggregator,
                      cancellation_token* token) -> result<std::vector<artifact>> {
        std::vector<artifact> artifacts;
        artifacts.reserve(config.num_files);

        for (std::size_t i = 0; i < config.num_files; ++i) {
            if (token && token->is_cancelled()) {
                aggregator.record(unsent_outcome(
                    i, 0, error(error_code::transfer_cancelled,
                                "run cancelled before transfer started")));
                continue;
            }

            auto size = generator.draw_size();
            auto generated = generator.generate(size, i);
            if (!generated) {
                const auto& err = generated.error();
                run_log_context ctx;
                ctx.artifact = payload_generator::artifact_name(i);
                ctx.payload_bytes = size;
                ctx.error_message = err.message;

                if (options.on_payload_failure == payload_failure_policy::abort_run) {
                    sink->log(log_level::error, log_category::payload,
                              "payload generation failed, aborting run", &ctx);
                    return unexpected(err);
                }
                sink->log(log_level::error, log_category::payload,
                          "payload generation failed, recording failure", &ctx);
                aggregator.record(unsent_outcome(i, size, err));
                continue;
            }

            const auto& item = generated.value();
            sink->on_artifact_generated(item.remote_name(), item.payload_size(),
                                        item.archive_size());
            artifacts.push_back(std::move(generated).value());
        }
        return std::move(artifacts);
    }
};

orchestrator::orchestrator(run_config config,
                           std::shared_ptr<session_factory> factory,
                           std::shared_ptr<event_sink> sink,
                           orchestrator_options options)
    : impl_(std::make_unique<impl>()) {
    impl_->config = std::move(config);
    impl_->factory = std::move(factory);
    impl_->sink = sink ? std::move(sink) : std::make_shared<null_event_sink>();
    impl_->options = std::move(options);
}

orchestrator::~orchestrator() = default;

auto orchestrator::run(cancellation_token* token) -> result<run_report> {
    bool expected = false;
    if (!impl_->running.compare_exchange_strong(expected, true)) {
        return unexpected(error(error_code::run_in_progress));
    }

    if (auto valid = impl_->config.validate(); !valid) {
        impl_->running.store(false);
        return unexpected(valid.error());
    }

    const auto& cfg = impl_->config;
    auto& sink = *impl_->sink;
    auto start = clock_type::now();

    impl::run_guard guard(*impl_);
    impl_->transition(run_state::generating_payloads);

    if (cfg.retry_attempts > 0) {
        sink.log(log_level::warn, log_category::orchestrator,
                 "retry_attempts=" + std::to_string(cfg.retry_attempts) +
                     " is accepted but retries are not performed");
    }

    auto scratch = scratch_directory::create(impl_->options.scratch_base);
    if (!scratch) {
        sink.log(log_level::error, log_category::orchestrator, scratch.error().message);
        return unexpected(scratch.error());
    }

    result_aggregator aggregator;
    {
        payload_options popts;
        popts.min_size = cfg.min_file_size;
        popts.max_size = cfg.max_file_size;
        popts.seed = impl_->options.size_seed;
        payload_generator generator(scratch.value().path(), popts);

        auto artifacts = impl_->generate_all(generator, aggregator, token);
        if (!artifacts) {
            // Already generated artifacts are destroyed with the result
            scratch.value().remove();
            return unexpected(artifacts.error());
        }

        impl_->transition(run_state::transferring);

        scheduler_options sopts;
        sopts.concurrency = cfg.effective_concurrency();
        sopts.slot.session = session_options::from_config(cfg);
        sopts.slot.remote_root = cfg.remote_root;
        sopts.slot.keep_alive = cfg.keep_alive;
        sopts.post_transfer_sleep = cfg.post_transfer_sleep();

        scheduler sched(std::move(sopts), impl_->factory, impl_->sink, impl_->options.pool);
        auto dispatched = sched.execute(std::move(artifacts).value(), aggregator, token);

        if (dispatched.cancelled > 0) {
            sink.log(log_level::warn, log_category::orchestrator,
                     std::to_string(dispatched.cancelled) +
                         " artifact(s) not transferred due to cancellation");
        }
    }

    impl_->transition(run_state::aggregated);
    auto wall = std::chrono::duration_cast<seconds_f>(clock_type::now() - start);
    auto report = aggregator.finalize(wall);
    sink.on_run_finished(report.summary());

    scratch.value().remove();
    return report;
}

auto orchestrator::state() const noexcept -> run_state { return impl_->state.load(); }

auto orchestrator::config() const -> const run_config& { return impl_->config; }

}  // namespace kcenon::sftp_stress
