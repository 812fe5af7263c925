#pragma once

#include "clu/core/result.hpp"

#include <cstdint>
#include <string>

namespace clu::network {

/**
 * @brief Split form of an absolute http(s) URI
 *
 * "https://vc.example.com/api/session" -> {https, vc.example.com, 443, /api/session}
 */
struct Uri {
    std::string scheme;   ///< Lower-cased
    std::string host;
    uint16_t port = 0;    ///< Explicit port or the scheme default
    std::string target;   ///< Path plus query, at least "/"

    bool is_secure() const { return scheme == "https"; }

    /// host, or host:port when the port is not the scheme default.
    std::string authority() const;

    static Result<Uri> parse(const std::string& text);
};

/// Percent-encode one path segment or query value.
std::string url_encode(const std::string& text);

} // namespace clu::network
