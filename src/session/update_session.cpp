#include "clu/session/update_session.hpp"

#include "clu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace clu::session {

using library::SessionState;

UpdateSession::UpdateSession(library::ContentLibraryApi& api,
                             events::EventBus& bus,
                             std::string session_id,
                             SessionLeaseClock lease)
    : api_(api)
    , bus_(bus)
    , lease_(std::move(lease))
    , id_(std::move(session_id)) {
}

Result<std::unique_ptr<UpdateSession>> UpdateSession::open(library::ContentLibraryApi& api,
                                                           events::EventBus& bus,
                                                           const library::ItemHandle& item,
                                                           SessionLeaseClock lease) {
    auto opened = api.open_session(item.id, item.content_version);
    if (opened.is_error()) {
        opened.error().with_context("opening update session on item " + item.id);
        return Err<std::unique_ptr<UpdateSession>>(opened.error());
    }

    std::unique_ptr<UpdateSession> session(new UpdateSession(api, bus, opened.value(), std::move(lease)));
    session->item_id_ = item.id;
    session->content_version_ = item.content_version;
    session->lease_.record_renewal(std::chrono::steady_clock::now());
    bus.emit(events::SessionOpenedEvent{session->id_, item.id, item.content_version});

    if (auto refreshed = session->refresh(); refreshed.is_error()) {
        refreshed.error().with_context("session " + session->id_ + " opened but could not be read back");
        return Err<std::unique_ptr<UpdateSession>>(refreshed.error());
    }
    return Ok(std::move(session));
}

Result<std::unique_ptr<UpdateSession>> UpdateSession::load(library::ContentLibraryApi& api,
                                                           events::EventBus& bus,
                                                           const std::string& session_id,
                                                           SessionLeaseClock lease) {
    std::unique_ptr<UpdateSession> session(new UpdateSession(api, bus, session_id, std::move(lease)));
    if (auto refreshed = session->refresh(); refreshed.is_error()) {
        return Err<std::unique_ptr<UpdateSession>>(refreshed.error());
    }
    return Ok(std::move(session));
}

Result<std::unique_ptr<UpdateSession>> UpdateSession::attach(library::ContentLibraryApi& api,
                                                             events::EventBus& bus,
                                                             const std::string& session_id,
                                                             SessionLeaseClock lease) {
    auto loaded = load(api, bus, session_id, std::move(lease));
    if (loaded.is_error()) {
        return loaded;
    }
    auto session = std::move(loaded.value());
    if (session->state_ != SessionState::Active) {
        return Err<std::unique_ptr<UpdateSession>>(
            ErrorCode::InvalidState,
            "Session " + session_id + " is " + library::to_string(session->state_) + ", cannot reuse it");
    }

    session->lease_.record_renewal(std::chrono::steady_clock::now());
    bus.emit(events::SessionOpenedEvent{session->id_, session->item_id_, session->content_version_, true});
    return Ok(std::move(session));
}

bool UpdateSession::keepalive_due() const {
    return lease_.keepalive_due(std::chrono::steady_clock::now());
}

std::optional<library::SessionFile> UpdateSession::find_file(const std::string& name) const {
    auto it = std::find_if(files_.begin(), files_.end(),
                           [&name](const library::SessionFile& file) { return file.name == name; });
    if (it == files_.end()) {
        return std::nullopt;
    }
    return *it;
}

// ════════════════════════════════════════════════════════
// Reconciliation
// ════════════════════════════════════════════════════════

Result<void> UpdateSession::refresh() {
    if (state_ == SessionState::Defunct) {
        return Err<void>(ErrorCode::Defunct, "Session " + id_ + " is defunct");
    }

    auto snapshot = api_.get_session(id_);
    if (snapshot.is_error()) {
        if (snapshot.error().is(ErrorCode::NotFound)) {
            mark_defunct("not found on server");
            return Err<void>(ErrorCode::Defunct, "Session " + id_ + " no longer exists on the server");
        }
        mark_defunct("refresh failed: " + snapshot.error().message);
        snapshot.error().with_context("session " + id_ + " marked defunct");
        return Err<void>(snapshot.error());
    }
    apply_snapshot(snapshot.value());

    auto files = api_.list_files(id_);
    if (files.is_error()) {
        if (files.error().is(ErrorCode::NotFound)) {
            mark_defunct("not found on server");
            return Err<void>(ErrorCode::Defunct, "Session " + id_ + " no longer exists on the server");
        }
        mark_defunct("file refresh failed: " + files.error().message);
        files.error().with_context("session " + id_ + " marked defunct");
        return Err<void>(files.error());
    }
    files_ = std::move(files.value());
    return Ok();
}

void UpdateSession::apply_snapshot(const library::SessionSnapshot& snapshot) {
    if (!snapshot.item_id.empty()) {
        item_id_ = snapshot.item_id;
    }
    if (!snapshot.content_version.empty()) {
        content_version_ = snapshot.content_version;
    }
    if (snapshot.progress) {
        progress_ = snapshot.progress;
    }
    server_error_ = snapshot.error_message;
    lease_.update_expiry(snapshot.expires_at);

    if (snapshot.state != state_) {
        const auto previous = state_;
        state_ = snapshot.state;
        bus_.emit(events::SessionStateChangedEvent{id_, previous, state_, server_error_});
    }
}

void UpdateSession::mark_defunct(const std::string& reason) {
    if (state_ == SessionState::Defunct) {
        return;
    }
    state_ = SessionState::Defunct;
    if (last_error_.empty()) {
        last_error_ = reason;
    }
    bus_.emit(events::SessionDefunctEvent{id_, reason});
}

Result<void> UpdateSession::check_allowed(const char* operation, Requirement requirement) const {
    if (state_ == SessionState::Defunct) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string(operation) + " on defunct session " + id_);
    }
    if (requirement == Requirement::Live) {
        return Ok();
    }
    if (state_ != SessionState::Active) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string(operation) + " on session " + id_ + " in state " + library::to_string(state_));
    }
    if (requirement == Requirement::Active && terminal_requested_) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string(operation) + " after a terminal transition was requested on session " + id_);
    }
    return Ok();
}

Result<void> UpdateSession::finish_mutation(const char* operation, Result<void> outcome) {
    auto refreshed = refresh();

    if (outcome.is_ok()) {
        return refreshed;
    }

    auto& error = outcome.error();
    if (error.is(ErrorCode::NotFound) && state_ == SessionState::Defunct) {
        // The missing object was the session itself
        return Err<void>(ErrorCode::Defunct,
                         std::string(operation) + ": session " + id_ + " no longer exists on the server");
    }
    if (refreshed.is_error()) {
        error.with_context("refresh after " + std::string(operation) + " failed: " + refreshed.error().message);
    }
    last_error_ = error.message;
    return outcome;
}

// ════════════════════════════════════════════════════════
// Transitions
// ════════════════════════════════════════════════════════

Result<void> UpdateSession::keep_alive(std::optional<int> progress) {
    if (auto allowed = check_allowed("KeepAlive", Requirement::Active); allowed.is_error()) {
        return allowed;
    }

    auto outcome = api_.keep_alive_session(id_, progress);
    if (outcome.is_error() && !outcome.error().is(ErrorCode::NotFound)) {
        spdlog::warn("Keepalive for session {} failed ({}), retrying once", id_, outcome.error().message);
        outcome = api_.keep_alive_session(id_, progress);
        if (outcome.is_error() && !outcome.error().is(ErrorCode::NotFound)) {
            mark_defunct("keepalive failed twice: " + outcome.error().message);
            return Err<void>(ErrorCode::Defunct,
                             "Keepalive for session " + id_ + " failed twice: " + outcome.error().message);
        }
    }

    if (outcome.is_ok()) {
        lease_.record_renewal(std::chrono::steady_clock::now());
        bus_.emit(events::SessionKeepAliveEvent{id_, progress});
    }
    return finish_mutation("KeepAlive", std::move(outcome));
}

Result<void> UpdateSession::complete() {
    if (auto allowed = check_allowed("Complete", Requirement::Settling); allowed.is_error()) {
        return allowed;
    }
    terminal_requested_ = true;
    return finish_mutation("Complete", api_.complete_session(id_));
}

Result<void> UpdateSession::cancel() {
    if (auto allowed = check_allowed("Cancel", Requirement::Settling); allowed.is_error()) {
        return allowed;
    }
    terminal_requested_ = true;
    return finish_mutation("Cancel", api_.cancel_session(id_));
}

Result<void> UpdateSession::fail(const std::string& message) {
    if (auto allowed = check_allowed("Fail", Requirement::Settling); allowed.is_error()) {
        return allowed;
    }
    terminal_requested_ = true;
    last_error_ = message;
    return finish_mutation("Fail", api_.fail_session(id_, message));
}

Result<void> UpdateSession::remove() {
    if (auto allowed = check_allowed("Delete", Requirement::Live); allowed.is_error()) {
        return allowed;
    }
    terminal_requested_ = true;

    auto outcome = api_.delete_session(id_);
    if (outcome.is_ok()) {
        mark_defunct("deleted");
        return Ok();
    }
    if (outcome.error().is(ErrorCode::NotFound)) {
        mark_defunct("not found on server");
        return Err<void>(ErrorCode::Defunct, "Delete: session " + id_ + " no longer exists on the server");
    }
    return finish_mutation("Delete", std::move(outcome));
}

Result<library::SessionFile> UpdateSession::add_file(const library::FileSpec& spec) {
    if (auto allowed = check_allowed("AddFile", Requirement::Active); allowed.is_error()) {
        return Err<library::SessionFile>(allowed.error());
    }

    auto added = api_.add_file(id_, spec);
    if (added.is_error()) {
        auto reconciled = finish_mutation("AddFile", Err<void>(added.error()));
        return Err<library::SessionFile>(reconciled.error());
    }

    bus_.emit(events::FileRegisteredEvent{id_, spec.name, spec.source_type});
    library::SessionFile registered = added.value();
    if (auto refreshed = finish_mutation("AddFile", Ok()); refreshed.is_error()) {
        return Err<library::SessionFile>(refreshed.error());
    }

    // The upload endpoint is only guaranteed on the add response
    if (auto listed = find_file(spec.name)) {
        if (!registered.upload_endpoint) {
            registered.upload_endpoint = listed->upload_endpoint;
        }
        registered.status = listed->status;
    }
    return Ok(std::move(registered));
}

Result<void> UpdateSession::remove_file(const std::string& name) {
    if (auto allowed = check_allowed("RemoveFile", Requirement::Active); allowed.is_error()) {
        return allowed;
    }

    auto outcome = api_.remove_file(id_, name);
    if (outcome.is_ok()) {
        bus_.emit(events::FileRemovedEvent{id_, name});
    }
    return finish_mutation("RemoveFile", std::move(outcome));
}

Result<void> UpdateSession::wait_for_files(std::chrono::milliseconds poll_interval,
                                           std::chrono::milliseconds timeout,
                                           const std::atomic<bool>* cancel) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto refreshed = refresh(); refreshed.is_error()) {
            return refreshed;
        }

        const bool settled = std::all_of(files_.begin(), files_.end(), [](const library::SessionFile& file) {
            return library::is_terminal(file.status);
        });
        if (settled) {
            break;
        }

        if (cancel != nullptr && cancel->load()) {
            return Err<void>(ErrorCode::Cancelled, "Stopped waiting for files of session " + id_);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Err<void>(ErrorCode::RemoteFailure,
                             "Timed out waiting for files of session " + id_ + " to finish transferring");
        }
        std::this_thread::sleep_for(poll_interval);
    }

    std::string failed;
    for (const auto& file : files_) {
        if (file.status == library::TransferStatus::Error) {
            failed += (failed.empty() ? "" : ", ") + file.name +
                      (file.error_message.empty() ? "" : " (" + file.error_message + ")");
        }
    }
    if (!failed.empty()) {
        return Err<void>(ErrorCode::TransferFailure, "Session " + id_ + " files failed: " + failed);
    }
    return Ok();
}

} // namespace clu::session
