#include "clu/library/rest_api.hpp"
#include "clu/library/json_codec.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <spdlog/spdlog.h>

namespace clu::library {
namespace {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;
using network::url_encode;

constexpr const char* kSessionHeader = "vmware-api-session-id";
constexpr const char* kLibraryPath = "/api/content/library";
constexpr const char* kItemPath = "/api/content/library/item";
constexpr const char* kUpdateSessionPath = "/api/content/library/item/update-session";
constexpr const char* kSessionFilePath = "/api/content/library/item/updatesession";

std::string base64(const std::string& text) {
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(text.size()), '\0');
    out.resize(b64::encode(out.data(), text.data(), text.size()));
    return out;
}

bool is_conflict_type(const std::string& error_type) {
    return error_type == "ALREADY_EXISTS" || error_type == "RESOURCE_BUSY" ||
           error_type == "RESOURCE_IN_USE" || error_type == "CONCURRENT_CHANGE";
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

RestContentLibraryApi::RestContentLibraryApi(std::string base_url,
                                             RestCredentials credentials,
                                             network::HttpTransport& transport)
    : base_url_(trim_trailing_slash(std::move(base_url)))
    , credentials_(std::move(credentials))
    , transport_(transport) {
}

Result<void> RestContentLibraryApi::login() {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = base_url_ + "/api/session";
    request.set_header("Authorization", "Basic " + base64(credentials_.username + ":" + credentials_.password));

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(map_error(response.value(), "login as " + credentials_.username));
    }

    const auto body = json::parse(response.value().body, nullptr, false);
    if (body.is_discarded() || !body.is_string()) {
        return Err<void>(ErrorCode::RemoteFailure, "Login response did not contain a session token");
    }

    {
        std::lock_guard lock(token_mutex_);
        token_ = body.get<std::string>();
    }
    spdlog::info("Authenticated to {} as {}", base_url_, credentials_.username);
    return Ok();
}

Result<void> RestContentLibraryApi::logout() {
    {
        std::lock_guard lock(token_mutex_);
        if (token_.empty()) {
            return Ok();
        }
    }
    auto result = call_void(HttpMethod::DELETE_METHOD, "/api/session");
    std::lock_guard lock(token_mutex_);
    token_.clear();
    return result;
}

std::unordered_map<std::string, std::string> RestContentLibraryApi::auth_headers() const {
    std::lock_guard lock(token_mutex_);
    if (token_.empty()) {
        return {};
    }
    return {{kSessionHeader, token_}};
}

Result<HttpResponse> RestContentLibraryApi::send_authenticated(HttpRequest request) {
    bool token_missing = false;
    {
        std::lock_guard lock(token_mutex_);
        token_missing = token_.empty();
    }
    if (token_missing) {
        if (auto logged_in = login(); logged_in.is_error()) {
            return Err<HttpResponse>(logged_in.error());
        }
    }

    for (int attempt = 0; attempt < 2; ++attempt) {
        {
            std::lock_guard lock(token_mutex_);
            request.set_header(kSessionHeader, token_);
        }
        auto response = transport_.send(request);
        if (response.is_error() || !response.value().has_status(HttpStatus::UNAUTHORIZED) || attempt == 1) {
            return response;
        }
        spdlog::warn("API session expired, re-authenticating");
        if (auto logged_in = login(); logged_in.is_error()) {
            return Err<HttpResponse>(logged_in.error());
        }
    }
    return Err<HttpResponse>(ErrorCode::RemoteFailure, "Authentication retry exhausted");
}

Result<json> RestContentLibraryApi::call(HttpMethod method,
                                         const std::string& path,
                                         const std::optional<json>& body) {
    HttpRequest request;
    request.method = method;
    request.url = base_url_ + path;
    request.set_header("Accept", "application/json");
    if (body) {
        request.set_json_body(body->dump());
    }

    const std::string what = network::to_string(method) + " " + path;
    auto response = send_authenticated(std::move(request));
    if (response.is_error()) {
        response.error().with_context(what);
        return Err<json>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<json>(map_error(response.value(), what));
    }

    if (response.value().body.empty()) {
        return Ok(json());
    }
    auto parsed = json::parse(response.value().body, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<json>(ErrorCode::RemoteFailure, "Invalid JSON in response to " + what);
    }
    return Ok(std::move(parsed));
}

Result<void> RestContentLibraryApi::call_void(HttpMethod method,
                                              const std::string& path,
                                              const std::optional<json>& body) {
    auto result = call(method, path, body);
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    return Ok();
}

Error RestContentLibraryApi::map_error(const HttpResponse& response, const std::string& what) {
    const auto remote = json_codec::remote_error_from_body(response.body);
    std::string message = what + " failed with HTTP " + std::to_string(response.status_code);
    if (!remote.error_type.empty()) {
        message += " " + remote.error_type;
    }
    if (!remote.message.empty()) {
        message += ": " + remote.message;
    }

    if (response.has_status(HttpStatus::NOT_FOUND) || remote.error_type == "NOT_FOUND") {
        return Error(ErrorCode::NotFound, message);
    }
    if (response.has_status(HttpStatus::CONFLICT) || is_conflict_type(remote.error_type)) {
        return Error(ErrorCode::Conflict, message);
    }
    return Error(ErrorCode::RemoteFailure, message);
}

std::string RestContentLibraryApi::session_path(const std::string& session_id) {
    return std::string(kUpdateSessionPath) + "/" + url_encode(session_id);
}

std::string RestContentLibraryApi::file_path(const std::string& session_id) {
    return std::string(kSessionFilePath) + "/" + url_encode(session_id) + "/file";
}

// ════════════════════════════════════════════════════════
// Lookups
// ════════════════════════════════════════════════════════

Result<LibraryInfo> RestContentLibraryApi::get_library(const std::string& library_id) {
    auto body = call(HttpMethod::GET, std::string(kLibraryPath) + "/" + url_encode(library_id));
    if (body.is_error()) {
        return Err<LibraryInfo>(body.error());
    }
    return json_codec::library_from_json(body.value());
}

Result<std::vector<std::string>> RestContentLibraryApi::find_libraries(const std::string& name) {
    auto body = call(HttpMethod::POST, std::string(kLibraryPath) + "?action=find", json{{"name", name}});
    if (body.is_error()) {
        return Err<std::vector<std::string>>(body.error());
    }
    return json_codec::ids_from_json(body.value());
}

Result<ItemInfo> RestContentLibraryApi::get_item(const std::string& item_id) {
    auto body = call(HttpMethod::GET, std::string(kItemPath) + "/" + url_encode(item_id));
    if (body.is_error()) {
        return Err<ItemInfo>(body.error());
    }
    return json_codec::item_from_json(body.value());
}

Result<std::vector<std::string>> RestContentLibraryApi::list_items(const std::string& library_id) {
    auto body = call(HttpMethod::GET, std::string(kItemPath) + "?library_id=" + url_encode(library_id));
    if (body.is_error()) {
        return Err<std::vector<std::string>>(body.error());
    }
    return json_codec::ids_from_json(body.value());
}

Result<std::vector<std::string>> RestContentLibraryApi::find_items(const std::string& library_id,
                                                                   const std::string& name) {
    auto body = call(HttpMethod::POST, std::string(kItemPath) + "?action=find",
                     json{{"library_id", library_id}, {"name", name}});
    if (body.is_error()) {
        return Err<std::vector<std::string>>(body.error());
    }
    return json_codec::ids_from_json(body.value());
}

// ════════════════════════════════════════════════════════
// Update sessions
// ════════════════════════════════════════════════════════

Result<std::string> RestContentLibraryApi::open_session(const std::string& item_id,
                                                        const std::string& content_version) {
    json body{{"library_item_id", item_id}};
    if (!content_version.empty()) {
        body["library_item_content_version"] = content_version;
    }
    auto response = call(HttpMethod::POST, kUpdateSessionPath, body);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    if (!response.value().is_string()) {
        return Err<std::string>(ErrorCode::RemoteFailure, "Session create response is not an identifier");
    }
    return Ok(response.value().get<std::string>());
}

Result<SessionSnapshot> RestContentLibraryApi::get_session(const std::string& session_id) {
    auto body = call(HttpMethod::GET, session_path(session_id));
    if (body.is_error()) {
        return Err<SessionSnapshot>(body.error());
    }
    auto snapshot = json_codec::session_from_json(body.value());
    if (snapshot.is_ok() && snapshot.value().id.empty()) {
        snapshot.value().id = session_id;
    }
    return snapshot;
}

Result<void> RestContentLibraryApi::cancel_session(const std::string& session_id) {
    return call_void(HttpMethod::POST, session_path(session_id) + "?action=cancel");
}

Result<void> RestContentLibraryApi::complete_session(const std::string& session_id) {
    return call_void(HttpMethod::POST, session_path(session_id) + "?action=complete");
}

Result<void> RestContentLibraryApi::fail_session(const std::string& session_id, const std::string& message) {
    return call_void(HttpMethod::POST, session_path(session_id) + "?action=fail",
                     json{{"client_error_message", message}});
}

Result<void> RestContentLibraryApi::keep_alive_session(const std::string& session_id, std::optional<int> progress) {
    std::optional<json> body;
    if (progress) {
        body = json{{"client_progress", *progress}};
    }
    return call_void(HttpMethod::POST, session_path(session_id) + "?action=keep-alive", body);
}

Result<void> RestContentLibraryApi::delete_session(const std::string& session_id) {
    return call_void(HttpMethod::DELETE_METHOD, session_path(session_id));
}

// ════════════════════════════════════════════════════════
// Session files
// ════════════════════════════════════════════════════════

Result<SessionFile> RestContentLibraryApi::add_file(const std::string& session_id, const FileSpec& spec) {
    auto body = call(HttpMethod::POST, file_path(session_id) + "?action=add", json_codec::file_spec_to_json(spec));
    if (body.is_error()) {
        return Err<SessionFile>(body.error());
    }
    return json_codec::file_from_json(body.value());
}

Result<std::vector<SessionFile>> RestContentLibraryApi::list_files(const std::string& session_id) {
    auto body = call(HttpMethod::GET, file_path(session_id));
    if (body.is_error()) {
        return Err<std::vector<SessionFile>>(body.error());
    }
    return json_codec::files_from_json(body.value());
}

Result<void> RestContentLibraryApi::remove_file(const std::string& session_id, const std::string& name) {
    return call_void(HttpMethod::POST, file_path(session_id) + "/" + url_encode(name) + "?action=remove");
}

} // namespace clu::library
