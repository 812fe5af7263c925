#pragma once

#include "clu/core/config.hpp"
#include "clu/core/result.hpp"
#include "clu/events/event_bus.hpp"
#include "clu/library/content_library_api.hpp"
#include "clu/library/types.hpp"
#include "clu/session/transfer_driver.hpp"
#include "clu/session/transfer_spec.hpp"
#include "clu/session/update_session.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clu::session {

struct OrchestratorOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds keepalive_interval{60000};
    std::chrono::milliseconds server_idle_timeout{SessionLeaseClock::kDefaultIdleTimeout};
    bool wait_for_pull = true;
    std::chrono::milliseconds pull_timeout{std::chrono::hours(1)};

    static OrchestratorOptions from_config(const TransferConfig& config);
};

/**
 * @brief One file to add: a name inside the item plus where its bytes come from
 */
struct AddFileRequest {
    std::string name;
    std::string source;                            ///< Locator, see classify_source()
    std::optional<library::SourceType> type;       ///< Explicit PUSH/PULL override
    std::optional<std::uint64_t> size;             ///< Declared size for PULL sources
};

/**
 * @brief What a finished sequence left behind on the server
 */
struct TransferOutcome {
    std::string session_id;
    library::SessionState final_state = library::SessionState::Active;
    std::vector<library::SessionFile> files;
};

/**
 * @brief Top-level update sequences over an item
 *
 * ADD: classify every source (no remote call on bad input), open or reuse
 * an ACTIVE session, register each file, upload PUSH files one at a time
 * while renewing the lease, then Complete(). PULL files are fetched by the
 * server; optionally wait until they settle.
 *
 * REMOVE: open a session, remove the named files, Complete().
 *
 * FAILURE: any error after the session is open triggers one best-effort
 * Fail() while the session is still ACTIVE. If that Fail() itself fails,
 * its error is attached as context to the original error.
 *
 * THREAD SAFETY:
 * - One sequence at a time per orchestrator
 * - request_cancel() may be called from any thread (signal handlers
 *   included); the running sequence tears down its upload and fails the
 *   session
 */
class UpdateSessionOrchestrator {
public:
    UpdateSessionOrchestrator(library::ContentLibraryApi& api,
                              const FileTransferDriver& driver,
                              events::EventBus& bus,
                              OrchestratorOptions options = {});

    Result<TransferOutcome> add_file(const library::ItemHandle& item,
                                     const AddFileRequest& request,
                                     const std::optional<std::string>& reuse_session = std::nullopt);

    Result<TransferOutcome> add_files(const library::ItemHandle& item,
                                      const std::vector<AddFileRequest>& requests,
                                      const std::optional<std::string>& reuse_session = std::nullopt);

    Result<TransferOutcome> remove_file(const library::ItemHandle& item, const std::string& name);
    Result<TransferOutcome> remove_files(const library::ItemHandle& item, const std::vector<std::string>& names);

    void request_cancel() noexcept { cancel_requested_.store(true); }
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_.load(); }

private:
    struct PreparedFile {
        AddFileRequest request;
        TransferSpec spec;
    };

    Result<std::vector<PreparedFile>> prepare(const std::vector<AddFileRequest>& requests) const;

    Result<std::unique_ptr<UpdateSession>> open_or_attach(const library::ItemHandle& item,
                                                          const std::optional<std::string>& reuse_session);

    Result<void> add_prepared(UpdateSession& session, const std::vector<PreparedFile>& files);
    Result<void> add_one(UpdateSession& session, const PreparedFile& file);

    /// Observe the upload, keepalive when due, until it resolves or is cancelled.
    Result<void> drive_push(UpdateSession& session, const std::string& file_name, TransferTask& task);

    Result<void> complete(UpdateSession& session, bool has_pull_files);

    /// Best-effort Fail() while ACTIVE; a failing cleanup is added as context.
    Error abort_session(UpdateSession& session, Error error);

    SessionLeaseClock make_lease() const;
    static TransferOutcome outcome_of(const UpdateSession& session);

    library::ContentLibraryApi& api_;
    const FileTransferDriver& driver_;
    events::EventBus& bus_;
    OrchestratorOptions options_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace clu::session
