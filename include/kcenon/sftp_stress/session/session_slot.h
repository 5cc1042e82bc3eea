/**
 * @file session_slot.h
 * @brief Per-worker session policy (ephemeral or pooled)
 * @version 0.1.0
 *
 * A session_slot turns one artifact into exactly one transfer_outcome. With
 * keep-alive off it opens and closes a fresh session around every artifact;
 * with keep-alive on it reuses the session opened by warm_up().
 */

#ifndef KCENON_SFTP_STRESS_SESSION_SESSION_SLOT_H
#define KCENON_SFTP_STRESS_SESSION_SESSION_SLOT_H

#include <memory>
#include <optional>
#include <string>

#include "kcenon/sftp_stress/core/artifact.h"
#include "kcenon/sftp_stress/core/event_sink.h"
#include "kcenon/sftp_stress/core/run_types.h"
#include "session_interface.h"

namespace kcenon::sftp_stress {

/**
 * @brief Settings shared by every slot of a run
 */
struct slot_options {
    session_options session;
    std::string remote_root = "/";
    bool keep_alive = false;
};

/**
 * @brief Session ownership and transfer policy for one worker slot
 *
 * Not thread-safe; a slot is driven by exactly one worker.
 *
 * @code
 * session_slot slot(0, opts, factory, sink);
 * if (opts.keep_alive) {
 *     (void)slot.warm_up();   // failure is remembered, not fatal
 * }
 * auto outcome = slot.transfer(art);
 * slot.close();
 * @endcode
 */
class session_slot {
public:
    session_slot(std::size_t slot_index,
                 slot_options options,
                 std::shared_ptr<session_factory> factory,
                 std::shared_ptr<event_sink> sink);

    ~session_slot();

    session_slot(const session_slot&) = delete;
    auto operator=(const session_slot&) -> session_slot& = delete;

    /**
     * @brief Open the pooled session (keep-alive only)
     *
     * On failure the slot keeps its failed session; every artifact routed
     * here afterwards yields a failed outcome carrying this error.
     */
    auto warm_up() -> result<void>;

    /**
     * @brief Upload one artifact and delete the remote copy
     *
     * Only the upload is timed; the remote delete is cleanup. Never fails:
     * every problem is captured in the returned outcome.
     */
    [[nodiscard]] auto transfer(const artifact& item) -> transfer_outcome;

    /**
     * @brief Close the pooled session; safe to call repeatedly
     */
    void close() noexcept;

    [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }
    [[nodiscard]] auto keep_alive() const noexcept -> bool { return options_.keep_alive; }
    [[nodiscard]] auto warm_up_time() const noexcept -> seconds_f { return warm_up_time_; }
    [[nodiscard]] auto warm_up_error() const -> const std::optional<error>& {
        return warm_up_error_;
    }

    /**
     * @brief Join the remote root and an artifact name with one '/'
     */
    [[nodiscard]] static auto remote_path_for(const std::string& root, const std::string& name)
        -> std::string;

private:
    /**
     * @brief Factory call that turns a throw or a null session into internal_error
     */
    auto create_session() const -> result<std::unique_ptr<session_interface>>;
    static auto open_session(session_interface& session) -> result<void>;

    void upload_and_clean(session_interface& session,
                          const artifact& item,
                          transfer_outcome& outcome);
    void fail(transfer_outcome& outcome, const error& err) const;

    std::size_t index_;
    slot_options options_;
    std::shared_ptr<session_factory> factory_;
    std::shared_ptr<event_sink> sink_;

    std::unique_ptr<session_interface> pooled_;
    bool warmed_up_ = false;
    seconds_f warm_up_time_{0.0};
    std::optional<error> warm_up_error_;
};

}  // namespace kcenon::sftp_stress

#endif  // KCENON_SFTP_STRESS_SESSION_SESSION_SLOT_H
