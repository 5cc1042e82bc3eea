/**
 * @file sftp_stress_cli.cpp
 * @brief Command-line stress runner
 *
 * Loads the configuration file, applies command-line overrides, checks the
 * private key, runs the stress test and writes the text report.
 *
 * Ctrl+C cancels artifacts that have not been dispatched yet; transfers in
 * flight are allowed to finish so the report stays complete.
 */

#include <kcenon/sftp_stress/config/cli_options.h>
#include <kcenon/sftp_stress/sftp_stress.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace kcenon::sftp_stress;

namespace {

volatile std::sig_atomic_t interrupt_requested = 0;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        interrupt_requested = 1;
    }
}

/**
 * @brief Forwards Ctrl+C to the run's cancellation token
 */
class interrupt_watcher {
public:
    interrupt_watcher(cancellation_token& token, stress_logger& logger)
        : thread_([this, &token, &logger] {
              while (!stop_.load()) {
                  if (interrupt_requested != 0 && !token.is_cancelled()) {
                      SS_LOG_WARN(logger, log_category::orchestrator,
                                  "interrupt received, cancelling pending transfers");
                      token.cancel();
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~interrupt_watcher() {
        stop_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    interrupt_watcher(const interrupt_watcher&) = delete;
    auto operator=(const interrupt_watcher&) -> interrupt_watcher& = delete;

private:
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

auto load_configuration(const cli_options& options, stress_logger& logger)
    -> result<run_config> {
    config_loader loader(options.ignore_unknown_keys ? unknown_key_policy::ignore
                                                     : unknown_key_policy::reject);

    if (options.config_path) {
        return loader.load_file(*options.config_path);
    }

    std::error_code ec;
    std::filesystem::path fallback{std::string(default_config_path)};
    if (!std::filesystem::exists(fallback, ec)) {
        SS_LOG_INFO(logger, log_category::config,
                    std::string(default_config_path) +
                        " not found, using built-in defaults and command-line values");
        return run_config{};
    }
    return loader.load_file(fallback);
}

void check_private_key(const run_config& config, stress_logger& logger) {
    auto info = key_validator::validate(config.private_key_path, config.private_key_passphrase);
    if (!info) {
        SS_LOG_WARN(logger, log_category::key,
                    "private key check failed: " + info.error().message);
        return;
    }

    const auto& key = info.value();
    std::string message = "private key OK: " + std::string(to_string(key.type)) + " (" +
                          std::string(to_string(key.format)) +
                          (key.encrypted ? ", encrypted" : "") + ")";
    if (!key.passphrase_verified) {
        message += ", passphrase not verified locally";
    }
    SS_LOG_INFO(logger, log_category::key, message);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_cli(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << std::endl;
        std::cerr << "Run with --help for usage." << std::endl;
        return 1;
    }
    const auto& options = parsed.value();

    if (options.show_help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }

    auto logger = std::make_shared<stress_logger>();
    logger->set_level(options.level.value_or(log_level::info));
    if (options.json_log) {
        logger->set_output_format(log_output_format::json);
    }
    logger->initialize();

    auto loaded = load_configuration(options, *logger);
    if (!loaded) {
        SS_LOG_ERROR(*logger, log_category::config, loaded.error().message);
        return 1;
    }
    run_config config = std::move(loaded).value();
    apply_overrides(options, config);

    if (auto valid = config.validate(); !valid) {
        SS_LOG_ERROR(*logger, log_category::config, valid.error().message);
        return 1;
    }

    check_private_key(config, *logger);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto sink = std::make_shared<logging_event_sink>(logger, config.host);
    auto factory = std::make_shared<sftp_session_factory>(sink);
    orchestrator runner(config, factory, sink);

    cancellation_token token;
    result<run_report> report;
    {
        interrupt_watcher watcher(token, *logger);
        report = runner.run(&token);
    }

    if (!report) {
        SS_LOG_ERROR(*logger, log_category::orchestrator,
                     "run aborted: " + report.error().message);
        logger->flush();
        return 1;
    }

    std::string filename = options.report_path.value_or(report_writer::default_filename());
    if (auto saved = report_writer::save(report.value(), filename); !saved) {
        SS_LOG_ERROR(*logger, log_category::report, saved.error().message);
        logger->flush();
        return 1;
    }

    logger->flush();
    std::cout << "Report saved to " << filename << std::endl;
    return 0;
}
