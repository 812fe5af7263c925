#include "clu/core/error.hpp"

#include <sstream>

namespace clu {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::UnsupportedProtocol: return "UnsupportedProtocol";
        case ErrorCode::TransferFailure: return "TransferFailure";
        case ErrorCode::RemoteFailure: return "RemoteFailure";
        case ErrorCode::Defunct: return "Defunct";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << error_code_name(code) << ": " << message;
    if (!context.empty()) {
        oss << " (";
        for (std::size_t i = 0; i < context.size(); ++i) {
            if (i > 0) {
                oss << "; ";
            }
            oss << context[i];
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace clu
