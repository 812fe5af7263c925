#pragma once

#include "clu/core/result.hpp"
#include "clu/events/event_bus.hpp"
#include "clu/library/content_library_api.hpp"
#include "clu/library/types.hpp"
#include "clu/session/lease_clock.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clu::session {

/**
 * @brief Client-side mirror of one remote update session
 *
 * The server owns the truth; this object is a cache reconciled by refresh().
 * Every mutating operation (keep_alive, complete, cancel, fail, remove,
 * add_file, remove_file) refreshes afterwards, on success and on failure.
 *
 * Rules:
 * - Mutations on a DEFUNCT session fail with InvalidState and make no remote call.
 * - keep_alive/complete/cancel/fail/add_file/remove_file need ACTIVE;
 *   remove() (Delete) is allowed in every state except DEFUNCT.
 * - Once complete/cancel/fail/remove has been requested, no keepalive or
 *   file registration is issued any more.
 * - A session found missing server-side becomes DEFUNCT exactly once, and
 *   a refresh that cannot reach the server forces DEFUNCT as well.
 *
 * Not thread-safe: owned by the single flow that opened it.
 */
class UpdateSession {
public:
    using SessionState = library::SessionState;

    /**
     * @brief Open a new session on an item at its current content version
     *
     * Errors: Conflict when the item already has an ACTIVE session,
     * NotFound when the item does not exist.
     */
    static Result<std::unique_ptr<UpdateSession>> open(library::ContentLibraryApi& api,
                                                        events::EventBus& bus,
                                                        const library::ItemHandle& item,
                                                        SessionLeaseClock lease);

    /// Read an existing session by id, whatever its state.
    static Result<std::unique_ptr<UpdateSession>> load(library::ContentLibraryApi& api,
                                                        events::EventBus& bus,
                                                        const std::string& session_id,
                                                        SessionLeaseClock lease);

    /// Reuse an existing session by id; fails unless it is ACTIVE.
    static Result<std::unique_ptr<UpdateSession>> attach(library::ContentLibraryApi& api,
                                                          events::EventBus& bus,
                                                          const std::string& session_id,
                                                          SessionLeaseClock lease);

    UpdateSession(const UpdateSession&) = delete;
    UpdateSession& operator=(const UpdateSession&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& item_id() const noexcept { return item_id_; }
    [[nodiscard]] const std::string& content_version() const noexcept { return content_version_; }
    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] std::optional<int> progress() const noexcept { return progress_; }
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> expires_at() const noexcept {
        return lease_.expires_at();
    }
    [[nodiscard]] const std::vector<library::SessionFile>& files() const noexcept { return files_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::string& server_error() const noexcept { return server_error_; }
    [[nodiscard]] bool terminal_requested() const noexcept { return terminal_requested_; }

    [[nodiscard]] const SessionLeaseClock& lease() const noexcept { return lease_; }
    [[nodiscard]] bool keepalive_due() const;

    [[nodiscard]] std::optional<library::SessionFile> find_file(const std::string& name) const;

    /// Pure read; allowed in every state except DEFUNCT.
    Result<void> refresh();

    Result<void> keep_alive(std::optional<int> progress);
    Result<void> complete();
    Result<void> cancel();
    Result<void> fail(const std::string& message);

    /// Delete the session server-side; afterwards the session is DEFUNCT.
    Result<void> remove();

    /// Register a file; for PUSH the returned entry carries the upload endpoint.
    Result<library::SessionFile> add_file(const library::FileSpec& spec);
    Result<void> remove_file(const std::string& name);

    /**
     * @brief Poll refresh until every file reports READY or ERROR
     *
     * Errors: TransferFailure naming the files that ended in ERROR,
     * RemoteFailure on timeout, Cancelled when cancel becomes true.
     */
    Result<void> wait_for_files(std::chrono::milliseconds poll_interval,
                                std::chrono::milliseconds timeout,
                                const std::atomic<bool>* cancel = nullptr);

private:
    enum class Requirement {
        Active,   // ACTIVE and no terminal transition requested
        Settling, // ACTIVE (terminal transitions)
        Live      // anything but DEFUNCT
    };

    UpdateSession(library::ContentLibraryApi& api,
                  events::EventBus& bus,
                  std::string session_id,
                  SessionLeaseClock lease);

    Result<void> check_allowed(const char* operation, Requirement requirement) const;

    /// Map a remote outcome, then reconcile local state with the server.
    Result<void> finish_mutation(const char* operation, Result<void> outcome);

    void apply_snapshot(const library::SessionSnapshot& snapshot);
    void mark_defunct(const std::string& reason);

    library::ContentLibraryApi& api_;
    events::EventBus& bus_;
    SessionLeaseClock lease_;

    std::string id_;
    std::string item_id_;
    std::string content_version_;
    SessionState state_ = SessionState::Active;
    std::optional<int> progress_;
    std::vector<library::SessionFile> files_;
    std::string last_error_;
    std::string server_error_;
    bool terminal_requested_ = false;
};

} // namespace clu::session
