#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clu::library {

/**
 * @brief Client-observed mirror of the remote update session state
 *
 * Defunct never comes from the server: it is set locally when the session
 * is found missing (deleted or expired).
 */
enum class SessionState {
    Active,
    Error,
    Canceled,
    Done,
    Defunct
};

enum class SourceType {
    Push, ///< Client uploads to a server-issued endpoint
    Pull  ///< Server fetches from a client-supplied URI
};

enum class TransferStatus {
    Waiting,
    Transferring,
    Validating,
    Ready,
    Error
};

struct LibraryInfo {
    std::string id;
    std::string name;
    std::string type;
};

struct ItemInfo {
    std::string id;
    std::string library_id;
    std::string name;
    std::string type;
    std::string content_version;
    std::uint64_t size = 0;
};

/**
 * @brief Typed handle for a library item, resolved once at the boundary
 */
struct ItemHandle {
    std::string id;
    std::string library_id;
    std::string name;
    std::string content_version;
};

/**
 * @brief One file entry of an update session
 */
struct SessionFile {
    std::string name;
    SourceType source_type = SourceType::Push;
    std::optional<std::string> source_endpoint;  ///< PULL only
    std::optional<std::string> upload_endpoint;  ///< PUSH only, server-issued
    std::optional<std::uint64_t> size;
    std::optional<std::string> checksum;         ///< Known once the transfer completes
    std::uint64_t bytes_transferred = 0;
    TransferStatus status = TransferStatus::Waiting;
    std::string error_message;
};

/**
 * @brief Registration request for a file in a session
 */
struct FileSpec {
    std::string name;
    SourceType source_type = SourceType::Push;
    std::optional<std::string> source_endpoint;
    std::optional<std::uint64_t> size;
};

/**
 * @brief Result of the refresh primitive
 */
struct SessionSnapshot {
    std::string id;
    std::string item_id;
    std::string content_version;
    SessionState state = SessionState::Active;
    std::optional<int> progress;
    std::optional<std::chrono::system_clock::time_point> expires_at;
    std::string error_message;
};

[[nodiscard]] bool is_terminal(SessionState state) noexcept;
[[nodiscard]] bool is_terminal(TransferStatus status) noexcept;

const char* to_string(SessionState state) noexcept;
const char* to_string(SourceType type) noexcept;
const char* to_string(TransferStatus status) noexcept;

/// Parse server enum spellings (ACTIVE, PUSH, WAITING_FOR_TRANSFER, ...).
std::optional<SessionState> parse_session_state(const std::string& text);
std::optional<SourceType> parse_source_type(const std::string& text);
std::optional<TransferStatus> parse_transfer_status(const std::string& text);

} // namespace clu::library
