/**
 * @file sftp_stress.h
 * @brief Main header for the sftp_stress library
 * @version 0.1.0
 *
 * Include this header to access the stress harness.
 *
 * @code
 * #include <kcenon/sftp_stress/sftp_stress.h>
 *
 * using namespace kcenon::sftp_stress;
 *
 * auto logger = std::make_shared<stress_logger>();
 * auto sink = std::make_shared<logging_event_sink>(logger, config.host);
 * orchestrator run(config, std::make_shared<sftp_session_factory>(sink), sink);
 * auto report = run.run();
 * if (report) {
 *     (void)report_writer::save(report.value(), report_writer::default_filename());
 * }
 * @endcode
 */

#ifndef KCENON_SFTP_STRESS_SFTP_STRESS_H
#define KCENON_SFTP_STRESS_SFTP_STRESS_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/sftp_stress/core/types.h"
#include "kcenon/sftp_stress/core/run_types.h"
#include "kcenon/sftp_stress/core/event_sink.h"
#include "kcenon/sftp_stress/core/result_aggregator.h"

// Configuration
#include "kcenon/sftp_stress/config/run_config.h"
#include "kcenon/sftp_stress/config/config_loader.h"

// Sessions
#include "kcenon/sftp_stress/session/session_interface.h"
#include "kcenon/sftp_stress/session/sftp_session.h"

// Engine
#include "kcenon/sftp_stress/engine/cancellation_token.h"
#include "kcenon/sftp_stress/engine/orchestrator.h"

// Key validation and reporting
#include "kcenon/sftp_stress/security/key_validator.h"
#include "kcenon/sftp_stress/report/report_writer.h"

namespace kcenon::sftp_stress {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_SFTP_STRESS_H
