#include "clu/network/uri.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace clu::network {

std::string Uri::authority() const {
    const bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

Result<Uri> Uri::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Err<Uri>(ErrorCode::InvalidArgument, "URI has no scheme: " + text);
    }

    Uri uri;
    uri.scheme = text.substr(0, scheme_end);
    std::transform(uri.scheme.begin(), uri.scheme.end(), uri.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (uri.scheme != "http" && uri.scheme != "https") {
        return Err<Uri>(ErrorCode::UnsupportedProtocol, "Unsupported URI scheme: " + uri.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find_first_of("/?", authority_begin);
    std::string authority = text.substr(authority_begin, path_begin == std::string::npos
                                                             ? std::string::npos
                                                             : path_begin - authority_begin);
    uri.target = path_begin == std::string::npos ? "/" : text.substr(path_begin);
    if (uri.target.front() == '?') {
        uri.target.insert(uri.target.begin(), '/');
    }

    // Drop userinfo; credentials never travel in the URI
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    uri.port = uri.is_secure() ? 443 : 80;
    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Uri>(ErrorCode::InvalidArgument, "Malformed IPv6 host in URI: " + text);
        }
        uri.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_text = authority.substr(close + 2);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        uri.host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
    } else {
        uri.host = authority;
    }

    if (uri.host.empty()) {
        return Err<Uri>(ErrorCode::InvalidArgument, "URI has no host: " + text);
    }

    if (!port_text.empty()) {
        if (!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })
            || port_text.size() > 5) {
            return Err<Uri>(ErrorCode::InvalidArgument, "Invalid port in URI: " + text);
        }
        const auto port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Uri>(ErrorCode::InvalidArgument, "Port out of range in URI: " + text);
        }
        uri.port = static_cast<uint16_t>(port);
    }

    return Ok(std::move(uri));
}

std::string url_encode(const std::string& text) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace clu::network
