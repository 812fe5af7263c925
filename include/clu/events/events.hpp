/**
 * @file events.hpp
 * @brief Event types emitted by update sessions and file transfers
 *
 * NAMING CONVENTION:
 * - Events are past-tense: SessionOpenedEvent, TransferFailedEvent
 */

#pragma once

#include "clu/library/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace clu::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a new update session is opened (or an existing one attached)
 *
 * WHO EMITS: UpdateSession::open / UpdateSession::attach
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct SessionOpenedEvent {
    std::string session_id;
    std::string item_id;
    std::string content_version;
    bool attached = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted whenever a refresh observes a different state than before
 *
 * Defunct transitions are reported by SessionDefunctEvent instead.
 */
struct SessionStateChangedEvent {
    std::string session_id;
    library::SessionState from;
    library::SessionState to;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionKeepAliveEvent {
    std::string session_id;
    std::optional<int> progress;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted exactly once per session when it is found missing server-side
 */
struct SessionDefunctEvent {
    std::string session_id;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

struct FileRegisteredEvent {
    std::string session_id;
    std::string file_name;
    library::SourceType source_type;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileRemovedEvent {
    std::string session_id;
    std::string file_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct TransferProgressEvent {
    std::string session_id;
    std::string file_name;
    int percent = 0;
    std::uint64_t bytes_sent = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string session_id;
    std::string file_name;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace clu::events
