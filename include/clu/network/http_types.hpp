#pragma once

#include <string>
#include <unordered_map>

namespace clu::network {

/**
 * @brief Methods used against the management API and upload endpoints
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    UNKNOWN
};

/**
 * @brief Statuses the REST client branches on; everything else is just 2xx or not
 */
enum class HttpStatus {
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    CONFLICT = 409
};

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Outgoing request; url is absolute (scheme://host[:port]/target)
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_json_body(std::string json_text) {
        body = std::move(json_text);
        headers["Content-Type"] = "application/json";
    }
};

struct HttpResponse {
    int status_code = 0;
    HeaderMap headers;
    std::string body;

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    bool has_status(HttpStatus status) const {
        return status_code == static_cast<int>(status);
    }
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        default: return "UNKNOWN";
    }
}

/// Upper-case method name to enum; UNKNOWN for anything else.
inline HttpMethod parse_method(const std::string& name) {
    if (name == "GET") return HttpMethod::GET;
    if (name == "POST") return HttpMethod::POST;
    if (name == "PUT") return HttpMethod::PUT;
    if (name == "DELETE") return HttpMethod::DELETE_METHOD;
    return HttpMethod::UNKNOWN;
}

} // namespace clu::network
