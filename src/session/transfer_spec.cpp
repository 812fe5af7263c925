#include "clu/session/transfer_spec.hpp"

#include <algorithm>
#include <cctype>

namespace clu::session {
namespace {

using library::SourceType;

// Scheme of "scheme://..." or "scheme:...", lower-cased. Single letters are
// drive letters ("C:\\images"), not schemes.
std::optional<std::string> scheme_of(const std::string& locator) {
    const auto colon = locator.find(':');
    if (colon == std::string::npos || colon < 2) {
        return std::nullopt;
    }
    std::string scheme = locator.substr(0, colon);
    const bool valid = std::isalpha(static_cast<unsigned char>(scheme.front())) &&
        std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        });
    if (!valid) {
        return std::nullopt;
    }
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

SourceType default_type(SourceProtocol protocol) {
    switch (protocol) {
        case SourceProtocol::Http:
        case SourceProtocol::Https:
            return SourceType::Pull;
        default:
            return SourceType::Push;
    }
}

} // namespace

const char* to_string(SourceProtocol protocol) noexcept {
    switch (protocol) {
        case SourceProtocol::Datastore: return "ds";
        case SourceProtocol::File: return "file";
        case SourceProtocol::Http: return "http";
        case SourceProtocol::Https: return "https";
        case SourceProtocol::Other: return "other";
    }
    return "unknown";
}

Result<TransferSpec> classify_source(const std::string& locator, std::optional<SourceType> override_type) {
    if (locator.empty()) {
        return Err<TransferSpec>(ErrorCode::InvalidArgument, "Source locator is empty");
    }

    TransferSpec spec;
    spec.locator = locator;

    // "[datastore1] folder/file.iso" is the datastore path notation
    if (locator.front() == '[') {
        spec.protocol = SourceProtocol::Datastore;
    } else if (const auto scheme = scheme_of(locator)) {
        if (*scheme == "ds") {
            spec.protocol = SourceProtocol::Datastore;
        } else if (*scheme == "file") {
            spec.protocol = SourceProtocol::File;
        } else if (*scheme == "http") {
            spec.protocol = SourceProtocol::Http;
        } else if (*scheme == "https") {
            spec.protocol = SourceProtocol::Https;
        } else if (override_type) {
            spec.protocol = SourceProtocol::Other;
        } else {
            return Err<TransferSpec>(ErrorCode::UnsupportedProtocol,
                                     "Unsupported source protocol '" + *scheme + "' in " + locator);
        }
    } else {
        spec.protocol = SourceProtocol::File;
    }

    spec.source_type = override_type.value_or(default_type(spec.protocol));
    spec.explicit_override = override_type.has_value();
    return Ok(std::move(spec));
}

Result<std::filesystem::path> TransferSpec::local_path() const {
    if (protocol != SourceProtocol::File) {
        return Err<std::filesystem::path>(ErrorCode::InvalidArgument,
                                          std::string("A ") + to_string(protocol) +
                                          " source cannot be pushed from this client: " + locator);
    }

    const auto scheme = scheme_of(locator);
    if (!scheme) {
        return Ok(std::filesystem::path(locator));
    }

    // file:///abs/path -> /abs/path, file://server/share/x -> //server/share/x
    std::string rest = locator.substr(scheme->size() + 1);
    if (rest.rfind("//", 0) == 0) {
        rest = rest.substr(2);
        if (rest.empty() || rest.front() != '/') {
            rest = "//" + rest;
        }
    }
    if (rest.empty()) {
        return Err<std::filesystem::path>(ErrorCode::InvalidArgument, "file locator has no path: " + locator);
    }
    return Ok(std::filesystem::path(rest));
}

std::string TransferSpec::source_endpoint() const {
    return locator;
}

} // namespace clu::session
