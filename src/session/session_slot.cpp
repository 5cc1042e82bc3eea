/**
 * @file session_slot.cpp
 * @brief Ephemeral and pooled transfer policy
 */

#include "kcenon/sftp_stress/session/session_slot.h"

#include <chrono>
#include <exception>

namespace kcenon::sftp_stress {

namespace {

using clock_type = std::chrono::steady_clock;

auto elapsed_since(clock_type::time_point start) -> seconds_f {
    return std::chrono::duration_cast<seconds_f>(clock_type::now() - start);
}

}  // namespace

auto session_slot::create_session() const -> result<std::unique_ptr<session_interface>> {
    std::unique_ptr<session_interface> session;
    try {
        session = factory_->create(options_.session);
    } catch (const std::exception& e) {
        return unexpected(error(error_code::internal_error,
                                std::string("session factory raised: ") + e.what()));
    } catch (...) {
        return unexpected(error(error_code::internal_error,
                                "session factory raised a non-standard exception"));
    }
    if (!session) {
        return unexpected(error(error_code::internal_error, "session factory returned no session"));
    }
    return std::move(session);
}

auto session_slot::open_session(session_interface& session) -> result<void> {
    try {
        return session.open();
    } catch (const std::exception& e) {
        return unexpected(error(error_code::internal_error,
                                std::string("session open raised: ") + e.what()));
    } catch (...) {
        return unexpected(error(error_code::internal_error,
                                "session open raised a non-standard exception"));
    }
}

session_slot::session_slot(std::size_t slot_index,
                           slot_options options,
                           std::shared_ptr<session_factory> factory,
                           std::shared_ptr<event_sink> sink)
    : index_(slot_index),
      options_(std::move(options)),
      factory_(std::move(factory)),
      sink_(sink ? std::move(sink) : std::make_shared<null_event_sink>()) {}

session_slot::~session_slot() { close(); }

auto session_slot::remote_path_for(const std::string& root, const std::string& name)
    -> std::string {
    if (root.empty()) {
        return name;
    }
    if (root.back() == '/') {
        return root + name;
    }
    return root + "/" + name;
}

auto session_slot::warm_up() -> result<void> {
    if (warmed_up_) {
        if (warm_up_error_) {
            return unexpected(*warm_up_error_);
        }
        return {};
    }
    warmed_up_ = true;

    run_log_context ctx;
    ctx.worker_slot = index_;
    ctx.host = options_.session.host;

    auto start = clock_type::now();
    result<void> opened;
    if (auto created = create_session(); !created) {
        opened = unexpected(created.error());
    } else {
        pooled_ = std::move(created).value();
        opened = open_session(*pooled_);
    }
    warm_up_time_ = elapsed_since(start);
    ctx.connect_seconds = warm_up_time_.count();

    if (!opened) {
        warm_up_error_ = opened.error();
        ctx.error_message = opened.error().message;
        sink_->log(log_level::error, log_category::session, "pooled session warm-up failed",
                   &ctx);
        return opened;
    }

    sink_->log(log_level::debug, log_category::session, "pooled session ready", &ctx);
    return {};
}

auto session_slot::transfer(const artifact& item) -> transfer_outcome {
    transfer_outcome outcome;
    outcome.name = item.remote_name();
    outcome.payload_size = item.payload_size();
    outcome.archive_size = item.archive_size();
    outcome.worker_slot = index_;
    outcome.index = item.index();

    if (options_.keep_alive) {
        if (!warmed_up_) {
            (void)warm_up();
        }
        if (warm_up_error_ || !pooled_) {
            auto cause = warm_up_error_.value_or(error(error_code::session_not_open));
            fail(outcome, error(cause.code, "pooled session unavailable: " + cause.message));
            return outcome;
        }
        // Connect time was attributed once at warm-up
        upload_and_clean(*pooled_, item, outcome);
        return outcome;
    }

    auto created = create_session();
    if (!created) {
        fail(outcome, created.error());
        return outcome;
    }
    auto session = std::move(created).value();

    auto start = clock_type::now();
    auto opened = open_session(*session);
    outcome.connect_time = elapsed_since(start);

    if (!opened) {
        fail(outcome, opened.error());
        session->close();
        return outcome;
    }

    upload_and_clean(*session, item, outcome);
    session->close();
    return outcome;
}

void session_slot::upload_and_clean(session_interface& session,
                                    const artifact& item,
                                    transfer_outcome& outcome) {
    auto remote = remote_path_for(options_.remote_root, item.remote_name());
    auto* sink = sink_.get();
    const auto& name = item.remote_name();
    progress_callback progress = [sink, &name](uint64_t sent, uint64_t total) {
        sink->on_transfer_progress(name, sent, total);
    };

    auto start = clock_type::now();
    auto uploaded = session.upload(item.local_path(), remote, progress);
    outcome.transfer_time = elapsed_since(start);

    if (!uploaded) {
        fail(outcome, uploaded.error());
        // A partial remote file may exist
        if (session.is_open()) {
            if (auto removed = session.remove(remote); !removed) {
                sink_->log(log_level::warn, log_category::session,
                           "cleanup of " + remote + " after failed upload: " +
                               removed.error().message);
            }
        }
        return;
    }

    if (auto removed = session.remove(remote); !removed) {
        fail(outcome, removed.error());
        return;
    }

    outcome.success = true;
    outcome.code = error_code::success;
}

void session_slot::fail(transfer_outcome& outcome, const error& err) const {
    outcome.success = false;
    outcome.code = err.code;
    outcome.error_message = err.message.empty() ? std::string(to_string(err.code)) : err.message;
}

void session_slot::close() noexcept {
    if (pooled_) {
        pooled_->close();
    }
}

}  // namespace kcenon::sftp_stress
