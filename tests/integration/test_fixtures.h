/**
 * @file test_fixtures.h
 * @brief In-process session fakes and fixtures for stress run tests
 */

#ifndef KCENON_SFTP_STRESS_TEST_FIXTURES_H
#define KCENON_SFTP_STRESS_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/sftp_stress/sftp_stress.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace kcenon::sftp_stress::test {

/**
 * @brief Shared state of all fake sessions made by one factory
 */
struct fake_server_state {
    // Counters
    std::atomic<std::size_t> created{0};
    std::atomic<std::size_t> open_attempts{0};
    std::atomic<std::size_t> opens{0};
    std::atomic<std::size_t> closes{0};
    std::atomic<std::size_t> uploads{0};
    std::atomic<std::size_t> removes{0};
    std::atomic<std::size_t> active_uploads{0};
    std::atomic<std::size_t> max_active_uploads{0};

    // Injected behavior, set before the run starts
    std::optional<error> open_failure;
    std::optional<std::size_t> open_failure_limit;  ///< nullopt = every open fails
    std::size_t open_failures_given = 0;
    std::set<std::string> failing_uploads;    ///< Artifact names whose upload fails
    bool fail_remove = false;
    std::chrono::milliseconds open_delay{0};
    std::chrono::milliseconds upload_delay{0};

    std::mutex mutex;
    std::vector<std::string> uploaded_paths;
    std::vector<uint64_t> uploaded_sizes;
    std::vector<std::vector<uint64_t>> progress_reports;

    auto should_fail_open() -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        if (!open_failure) {
            return false;
        }
        if (open_failure_limit && open_failures_given >= *open_failure_limit) {
            return false;
        }
        ++open_failures_given;
        return true;
    }
};

/**
 * @brief session_interface that never touches the network
 */
class fake_session : public session_interface {
public:
    explicit fake_session(std::shared_ptr<fake_server_state> state)
        : state_(std::move(state)) {
        ++state_->created;
    }

    ~fake_session() override { close(); }

    auto open() -> result<void> override {
        ++state_->open_attempts;
        if (state_->open_delay.count() > 0) {
            std::this_thread::sleep_for(state_->open_delay);
        }
        if (state_->should_fail_open()) {
            return unexpected(*state_->open_failure);
        }
        open_ = true;
        ++state_->opens;
        return {};
    }

    auto upload(const std::filesystem::path& local_path,
                const std::string& remote_path,
                const progress_callback& progress) -> result<uint64_t> override {
        if (!open_) {
            return unexpected(error(error_code::session_not_open));
        }

        auto active = ++state_->active_uploads;
        auto seen = state_->max_active_uploads.load();
        while (active > seen && !state_->max_active_uploads.compare_exchange_weak(seen, active)) {
        }

        if (state_->upload_delay.count() > 0) {
            std::this_thread::sleep_for(state_->upload_delay);
        }
        --state_->active_uploads;
        ++state_->uploads;

        auto name = std::filesystem::path(remote_path).filename().string();
        if (state_->failing_uploads.count(name) > 0) {
            return unexpected(error(error_code::remote_write_failed, "injected write failure"));
        }

        std::error_code ec;
        auto size = std::filesystem::file_size(local_path, ec);
        if (ec) {
            return unexpected(error(error_code::local_read_failed, ec.message()));
        }

        std::vector<uint64_t> reported;
        if (progress) {
            for (uint64_t sent : {size / 2, size}) {
                progress(sent, size);
                reported.push_back(sent);
            }
        }

        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->uploaded_paths.push_back(remote_path);
        state_->uploaded_sizes.push_back(size);
        state_->progress_reports.push_back(std::move(reported));
        return size;
    }

    auto remove(const std::string& /*remote_path*/) -> result<void> override {
        ++state_->removes;
        if (state_->fail_remove) {
            return unexpected(error(error_code::remote_delete_failed, "injected delete failure"));
        }
        return {};
    }

    void close() noexcept override {
        if (open_) {
            open_ = false;
            ++state_->closes;
        }
    }

    auto is_open() const noexcept -> bool override { return open_; }

private:
    std::shared_ptr<fake_server_state> state_;
    bool open_ = false;
};

class fake_session_factory : public session_factory {
public:
    fake_session_factory() : state_(std::make_shared<fake_server_state>()) {}

    auto create(const session_options& /*options*/) -> std::unique_ptr<session_interface> override {
        return std::make_unique<fake_session>(state_);
    }

    [[nodiscard]] auto state() -> fake_server_state& { return *state_; }

private:
    std::shared_ptr<fake_server_state> state_;
};

/**
 * @brief event_sink that records what it sees
 */
class recording_event_sink : public event_sink {
public:
    void log(log_level level, std::string_view, std::string_view message,
             const run_log_context*) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages.emplace_back(level, std::string(message));
    }

    void on_state_changed(run_state, run_state to) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states.push_back(to);
    }

    void on_run_started(std::size_t, std::size_t workers, bool) override {
        started_workers = workers;
    }

    void on_artifact_generated(std::string_view name, uint64_t, uint64_t) override {
        ++generated;
        if (after_generated) {
            after_generated(name);
        }
    }

    void on_transfer_progress(std::string_view, uint64_t, uint64_t) override {
        ++progress_events;
    }

    void on_transfer_completed(const transfer_outcome&, std::size_t completed,
                               std::size_t total) override {
        std::lock_guard<std::mutex> lock(mutex_);
        completions.emplace_back(completed, total);
    }

    void on_run_finished(const run_summary& summary) override {
        finished_total = summary.total;
    }

    auto count_level(log_level level) -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& m : messages) {
            if (m.first == level) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::pair<log_level, std::string>> messages;
    std::vector<run_state> states;
    std::vector<std::pair<std::size_t, std::size_t>> completions;
    std::function<void(std::string_view)> after_generated;  ///< Runs on the generating thread
    std::atomic<std::size_t> generated{0};
    std::atomic<std::size_t> progress_events{0};
    std::atomic<std::size_t> started_workers{0};
    std::atomic<std::size_t> finished_total{0};

private:
    std::mutex mutex_;
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("sftp_stress_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto files_under(const std::filesystem::path& dir) const -> std::size_t {
        std::size_t count = 0;
        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                ++count;
            }
        }
        return count;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Fixture running the orchestrator against fake sessions
 */
class StressRunFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        config_.host = "sftp.test";
        config_.username = "stress";
        config_.private_key_path = "/nonexistent/id_ed25519";
        config_.remote_root = "/upload";
        config_.min_file_size = 1000;
        config_.max_file_size = 1000;
        config_.num_files = 3;
        config_.concurrency = 1;

        factory_ = std::make_shared<fake_session_factory>();
        sink_ = std::make_shared<recording_event_sink>();

        options_.scratch_base = test_dir_;
        options_.size_seed = 1234;
    }

    auto run(cancellation_token* token = nullptr) -> result<run_report> {
        orchestrator runner(config_, factory_, sink_, options_);
        return runner.run(token);
    }

    /**
     * @brief Make the artifact file @p name unwritable once generation starts
     *
     * The scratch directory only exists during run(), so a directory with the
     * artifact's name is planted there after the first artifact is written.
     */
    void block_artifact(const std::string& name) {
        auto base = options_.scratch_base;
        sink_->after_generated = [base, name, planted = false](std::string_view) mutable {
            if (planted) {
                return;
            }
            for (const auto& entry : std::filesystem::directory_iterator(base)) {
                if (entry.is_directory()) {
                    std::filesystem::create_directory(entry.path() / name);
                    std::ofstream(entry.path() / name / "occupied") << "x";
                    planted = true;
                }
            }
        };
    }

    auto entries_under(const std::filesystem::path& dir) const -> std::size_t {
        std::size_t count = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir)) {
            ++count;
        }
        return count;
    }

    auto fake() -> fake_server_state& { return factory_->state(); }

    run_config config_;
    orchestrator_options options_;
    std::shared_ptr<fake_session_factory> factory_;
    std::shared_ptr<recording_event_sink> sink_;
};

}  // namespace kcenon::sftp_stress::test

#endif  // KCENON_SFTP_STRESS_TEST_FIXTURES_H
