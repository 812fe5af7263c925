#pragma once

#include <string>
#include <vector>

namespace clu {

enum class ErrorCode {
    InvalidState,        // Operation on a DONE/CANCELED/DEFUNCT session
    Conflict,            // Another ACTIVE session exists on the item
    UnsupportedProtocol, // Locator scheme not recognized
    TransferFailure,     // Upload failed or a file ended in error
    RemoteFailure,       // Any other remote error
    Defunct,             // Session found missing server-side
    NotFound,
    InvalidArgument,
    Cancelled
};

const char* error_code_name(ErrorCode code) noexcept;

/**
 * @brief Error value carried by clu::Result
 *
 * context holds secondary failures (e.g. a cleanup call that failed while
 * handling the primary error) in the order they happened.
 */
struct Error {
    ErrorCode code = ErrorCode::RemoteFailure;
    std::string message;
    std::vector<std::string> context;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    Error& with_context(std::string text) {
        context.push_back(std::move(text));
        return *this;
    }

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    [[nodiscard]] std::string to_string() const;
};

} // namespace clu
