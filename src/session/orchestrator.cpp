#include "clu/session/orchestrator.hpp"

#include "clu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <set>

namespace clu::session {

using library::SessionState;
using library::SourceType;

OrchestratorOptions OrchestratorOptions::from_config(const TransferConfig& config) {
    OrchestratorOptions options;
    options.poll_interval = config.poll_interval;
    options.keepalive_interval = config.keepalive_interval;
    options.server_idle_timeout = config.server_idle_timeout;
    options.wait_for_pull = config.wait_for_pull;
    options.pull_timeout = config.pull_timeout;
    return options;
}

UpdateSessionOrchestrator::UpdateSessionOrchestrator(library::ContentLibraryApi& api,
                                                     const FileTransferDriver& driver,
                                                     events::EventBus& bus,
                                                     OrchestratorOptions options)
    : api_(api)
    , driver_(driver)
    , bus_(bus)
    , options_(options) {
}

SessionLeaseClock UpdateSessionOrchestrator::make_lease() const {
    return SessionLeaseClock(options_.keepalive_interval, options_.server_idle_timeout);
}

TransferOutcome UpdateSessionOrchestrator::outcome_of(const UpdateSession& session) {
    TransferOutcome outcome;
    outcome.session_id = session.id();
    outcome.final_state = session.state();
    outcome.files = session.files();
    return outcome;
}

// ════════════════════════════════════════════════════════
// Add
// ════════════════════════════════════════════════════════

Result<TransferOutcome> UpdateSessionOrchestrator::add_file(const library::ItemHandle& item,
                                                            const AddFileRequest& request,
                                                            const std::optional<std::string>& reuse_session) {
    return add_files(item, std::vector<AddFileRequest>{request}, reuse_session);
}

Result<TransferOutcome> UpdateSessionOrchestrator::add_files(const library::ItemHandle& item,
                                                             const std::vector<AddFileRequest>& requests,
                                                             const std::optional<std::string>& reuse_session) {
    auto prepared = prepare(requests);
    if (prepared.is_error()) {
        return Err<TransferOutcome>(prepared.error());
    }
    if (cancel_requested()) {
        return Err<TransferOutcome>(ErrorCode::Cancelled, "Cancelled before the session was opened");
    }

    auto opened = open_or_attach(item, reuse_session);
    if (opened.is_error()) {
        return Err<TransferOutcome>(opened.error());
    }
    auto& session = *opened.value();

    const bool has_pull = std::any_of(prepared.value().begin(), prepared.value().end(),
                                      [](const PreparedFile& f) { return f.spec.source_type == SourceType::Pull; });

    Result<void> sequence = Ok();
    try {
        sequence = add_prepared(session, prepared.value());
        if (sequence.is_ok()) {
            sequence = complete(session, has_pull);
        }
    } catch (const std::exception& e) {
        sequence = Err<void>(abort_session(session, Error(ErrorCode::RemoteFailure,
                                                          std::string("Unexpected error: ") + e.what())));
    }

    if (sequence.is_error()) {
        spdlog::error("Adding files to item {} failed: {}", item.id, sequence.error().to_string());
        return Err<TransferOutcome>(sequence.error());
    }

    spdlog::info("Session {} finished in state {}", session.id(), library::to_string(session.state()));
    return Ok(outcome_of(session));
}

Result<std::vector<UpdateSessionOrchestrator::PreparedFile>>
UpdateSessionOrchestrator::prepare(const std::vector<AddFileRequest>& requests) const {
    if (requests.empty()) {
        return Err<std::vector<PreparedFile>>(ErrorCode::InvalidArgument, "No files to add");
    }

    std::set<std::string> names;
    std::vector<PreparedFile> prepared;
    prepared.reserve(requests.size());

    for (const auto& request : requests) {
        if (request.name.empty()) {
            return Err<std::vector<PreparedFile>>(ErrorCode::InvalidArgument,
                                                  "File name missing for source " + request.source);
        }
        if (!names.insert(request.name).second) {
            return Err<std::vector<PreparedFile>>(ErrorCode::InvalidArgument,
                                                  "File " + request.name + " given more than once");
        }

        auto spec = classify_source(request.source, request.type);
        if (spec.is_error()) {
            spec.error().with_context("file " + request.name);
            return Err<std::vector<PreparedFile>>(spec.error());
        }
        if (spec.value().source_type == SourceType::Push) {
            if (auto path = spec.value().local_path(); path.is_error()) {
                path.error().with_context("file " + request.name);
                return Err<std::vector<PreparedFile>>(path.error());
            }
        }
        prepared.push_back({request, std::move(spec.value())});
    }
    return Ok(std::move(prepared));
}

Result<std::unique_ptr<UpdateSession>>
UpdateSessionOrchestrator::open_or_attach(const library::ItemHandle& item,
                                          const std::optional<std::string>& reuse_session) {
    if (reuse_session) {
        auto attached = UpdateSession::attach(api_, bus_, *reuse_session, make_lease());
        if (attached.is_ok() && !attached.value()->item_id().empty() && attached.value()->item_id() != item.id) {
            return Err<std::unique_ptr<UpdateSession>>(
                ErrorCode::InvalidArgument,
                "Session " + *reuse_session + " belongs to item " + attached.value()->item_id() +
                ", not " + item.id);
        }
        return attached;
    }
    return UpdateSession::open(api_, bus_, item, make_lease());
}

Result<void> UpdateSessionOrchestrator::add_prepared(UpdateSession& session, const std::vector<PreparedFile>& files) {
    for (const auto& file : files) {
        if (cancel_requested()) {
            return Err<void>(abort_session(session, Error(ErrorCode::Cancelled, "Cancelled by caller")));
        }
        if (auto added = add_one(session, file); added.is_error()) {
            return added;
        }
    }
    return Ok();
}

Result<void> UpdateSessionOrchestrator::add_one(UpdateSession& session, const PreparedFile& file) {
    library::FileSpec spec;
    spec.name = file.request.name;
    spec.source_type = file.spec.source_type;

    std::filesystem::path local;
    if (file.spec.source_type == SourceType::Pull) {
        spec.source_endpoint = file.spec.source_endpoint();
        spec.size = file.request.size;
    } else {
        local = file.spec.local_path().value();
        std::error_code ec;
        const auto size = std::filesystem::file_size(local, ec);
        if (!ec) {
            spec.size = static_cast<std::uint64_t>(size);
        }
    }

    spdlog::info("Registering {} in session {} as {} from {}", spec.name, session.id(),
                 library::to_string(spec.source_type), file.request.source);

    auto registered = session.add_file(spec);
    if (registered.is_error()) {
        registered.error().with_context("registering file " + spec.name);
        return Err<void>(abort_session(session, registered.error()));
    }
    if (spec.source_type == SourceType::Pull) {
        return Ok();
    }

    if (!registered.value().upload_endpoint) {
        return Err<void>(abort_session(session, Error(ErrorCode::RemoteFailure,
                                                      "Server issued no upload endpoint for " + spec.name)));
    }

    auto task = driver_.start(*registered.value().upload_endpoint, local);
    if (task.is_error()) {
        bus_.emit(events::TransferFailedEvent{session.id(), spec.name, task.error().message});
        return Err<void>(abort_session(session, task.error()));
    }

    auto uploaded = drive_push(session, spec.name, *task.value());
    if (uploaded.is_error()) {
        // Join the worker first; Fail() must not race a chunk still in flight
        task.value().reset();
        return Err<void>(abort_session(session, uploaded.error()));
    }
    return Ok();
}

Result<void> UpdateSessionOrchestrator::drive_push(UpdateSession& session,
                                                   const std::string& file_name,
                                                   TransferTask& task) {
    const auto started = std::chrono::steady_clock::now();
    int last_percent = 0;

    while (true) {
        if (auto update = task.next_update(options_.poll_interval)) {
            switch (update->kind) {
            case TransferUpdate::Kind::Progress:
                last_percent = std::max(last_percent, update->percent);
                bus_.emit(events::TransferProgressEvent{session.id(), file_name, last_percent, update->bytes_sent});
                break;
            case TransferUpdate::Kind::Completed: {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                bus_.emit(events::TransferCompletedEvent{session.id(), file_name, task.total_bytes(), elapsed});
                return Ok();
            }
            case TransferUpdate::Kind::Failed:
                bus_.emit(events::TransferFailedEvent{session.id(), file_name, update->reason});
                return Err<void>(ErrorCode::TransferFailure,
                                 "Upload of " + file_name + " failed at " + std::to_string(update->percent) +
                                 "%: " + update->reason);
            }
        }

        if (cancel_requested()) {
            task.cancel();
            bus_.emit(events::TransferFailedEvent{session.id(), file_name, "cancelled"});
            return Err<void>(ErrorCode::Cancelled, "Upload of " + file_name + " cancelled by caller");
        }

        // Renew even when progress is unchanged; the lease must not lapse mid-upload
        if (session.keepalive_due()) {
            if (auto renewed = session.keep_alive(last_percent); renewed.is_error()) {
                task.cancel();
                bus_.emit(events::TransferFailedEvent{session.id(), file_name, renewed.error().message});
                renewed.error().with_context("keepalive during upload of " + file_name);
                return renewed;
            }
        }
    }
}

Result<void> UpdateSessionOrchestrator::complete(UpdateSession& session, bool has_pull_files) {
    if (cancel_requested()) {
        return Err<void>(abort_session(session, Error(ErrorCode::Cancelled, "Cancelled by caller")));
    }

    if (auto completed = session.complete(); completed.is_error()) {
        completed.error().with_context("completing session " + session.id());
        return Err<void>(abort_session(session, completed.error()));
    }

    if (session.state() == SessionState::Error) {
        const auto& reason = session.server_error().empty() ? std::string("no reason given") : session.server_error();
        return Err<void>(ErrorCode::RemoteFailure, "Server rejected session " + session.id() + ": " + reason);
    }

    if (has_pull_files && options_.wait_for_pull) {
        spdlog::info("Waiting for the server to fetch pull sources of session {}", session.id());
        return session.wait_for_files(options_.poll_interval, options_.pull_timeout, &cancel_requested_);
    }
    return Ok();
}

Error UpdateSessionOrchestrator::abort_session(UpdateSession& session, Error error) {
    if (session.state() != SessionState::Active) {
        return error;
    }

    const auto reason = error.message;
    spdlog::warn("Failing session {}: {}", session.id(), reason);
    if (auto failed = session.fail(reason); failed.is_error()) {
        error.with_context("cleanup Fail() on session " + session.id() + " failed: " + failed.error().to_string());
    }
    return error;
}

// ════════════════════════════════════════════════════════
// Remove
// ════════════════════════════════════════════════════════

Result<TransferOutcome> UpdateSessionOrchestrator::remove_file(const library::ItemHandle& item,
                                                               const std::string& name) {
    return remove_files(item, std::vector<std::string>{name});
}

Result<TransferOutcome> UpdateSessionOrchestrator::remove_files(const library::ItemHandle& item,
                                                                const std::vector<std::string>& names) {
    if (names.empty()) {
        return Err<TransferOutcome>(ErrorCode::InvalidArgument, "No files to remove");
    }
    for (const auto& name : names) {
        if (name.empty()) {
            return Err<TransferOutcome>(ErrorCode::InvalidArgument, "Empty file name in removal list");
        }
    }
    if (cancel_requested()) {
        return Err<TransferOutcome>(ErrorCode::Cancelled, "Cancelled before the session was opened");
    }

    auto opened = UpdateSession::open(api_, bus_, item, make_lease());
    if (opened.is_error()) {
        return Err<TransferOutcome>(opened.error());
    }
    auto& session = *opened.value();

    Result<void> sequence = Ok();
    try {
        for (const auto& name : names) {
            spdlog::info("Removing {} from item {} in session {}", name, item.id, session.id());
            if (auto removed = session.remove_file(name); removed.is_error()) {
                removed.error().with_context("removing file " + name);
                sequence = Err<void>(abort_session(session, removed.error()));
                break;
            }
        }
        if (sequence.is_ok()) {
            sequence = complete(session, false);
        }
    } catch (const std::exception& e) {
        sequence = Err<void>(abort_session(session, Error(ErrorCode::RemoteFailure,
                                                          std::string("Unexpected error: ") + e.what())));
    }

    if (sequence.is_error()) {
        spdlog::error("Removing files from item {} failed: {}", item.id, sequence.error().to_string());
        return Err<TransferOutcome>(sequence.error());
    }
    return Ok(outcome_of(session));
}

} // namespace clu::session
