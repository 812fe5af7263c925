#include "clu/library/types.hpp"

#include <algorithm>
#include <cctype>

namespace clu::library {
namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Done || state == SessionState::Canceled || state == SessionState::Defunct;
}

bool is_terminal(TransferStatus status) noexcept {
    return status == TransferStatus::Ready || status == TransferStatus::Error;
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Active: return "ACTIVE";
        case SessionState::Error: return "ERROR";
        case SessionState::Canceled: return "CANCELED";
        case SessionState::Done: return "DONE";
        case SessionState::Defunct: return "DEFUNCT";
    }
    return "UNKNOWN";
}

const char* to_string(SourceType type) noexcept {
    return type == SourceType::Push ? "PUSH" : "PULL";
}

const char* to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Waiting: return "WAITING_FOR_TRANSFER";
        case TransferStatus::Transferring: return "TRANSFERRING";
        case TransferStatus::Validating: return "VALIDATING";
        case TransferStatus::Ready: return "READY";
        case TransferStatus::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<SessionState> parse_session_state(const std::string& text) {
    const auto upper = to_upper(text);
    if (upper == "ACTIVE") return SessionState::Active;
    if (upper == "ERROR") return SessionState::Error;
    if (upper == "CANCELED" || upper == "CANCELLED") return SessionState::Canceled;
    if (upper == "DONE") return SessionState::Done;
    return std::nullopt;
}

std::optional<SourceType> parse_source_type(const std::string& text) {
    const auto upper = to_upper(text);
    if (upper == "PUSH") return SourceType::Push;
    if (upper == "PULL") return SourceType::Pull;
    return std::nullopt;
}

std::optional<TransferStatus> parse_transfer_status(const std::string& text) {
    const auto upper = to_upper(text);
    if (upper == "WAITING_FOR_TRANSFER" || upper == "WAITING") return TransferStatus::Waiting;
    if (upper == "TRANSFERRING") return TransferStatus::Transferring;
    if (upper == "VALIDATING") return TransferStatus::Validating;
    if (upper == "READY") return TransferStatus::Ready;
    if (upper == "ERROR") return TransferStatus::Error;
    return std::nullopt;
}

} // namespace clu::library
