#pragma once

#include "clu/library/content_library_api.hpp"
#include "clu/network/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace clu::library {

struct RestCredentials {
    std::string username;
    std::string password;
};

/**
 * @brief ContentLibraryApi over the vSphere Automation REST API
 *
 * Authenticates lazily with POST /api/session (Basic auth) and sends the
 * returned token as vmware-api-session-id. A 401 triggers one re-login and
 * one replay of the request.
 *
 * Status mapping:
 *   404 / NOT_FOUND                                            -> NotFound
 *   409 / ALREADY_EXISTS, RESOURCE_BUSY, RESOURCE_IN_USE,
 *         CONCURRENT_CHANGE                                    -> Conflict
 *   any other non-2xx                                          -> RemoteFailure
 */
class RestContentLibraryApi : public ContentLibraryApi {
public:
    RestContentLibraryApi(std::string base_url, RestCredentials credentials, network::HttpTransport& transport);

    Result<void> login();
    Result<void> logout();

    /// Headers an upload to a server-issued endpoint must carry.
    std::unordered_map<std::string, std::string> auth_headers() const;

    Result<LibraryInfo> get_library(const std::string& library_id) override;
    Result<std::vector<std::string>> find_libraries(const std::string& name) override;
    Result<ItemInfo> get_item(const std::string& item_id) override;
    Result<std::vector<std::string>> list_items(const std::string& library_id) override;
    Result<std::vector<std::string>> find_items(const std::string& library_id, const std::string& name) override;

    Result<std::string> open_session(const std::string& item_id, const std::string& content_version) override;
    Result<SessionSnapshot> get_session(const std::string& session_id) override;
    Result<void> cancel_session(const std::string& session_id) override;
    Result<void> complete_session(const std::string& session_id) override;
    Result<void> fail_session(const std::string& session_id, const std::string& message) override;
    Result<void> keep_alive_session(const std::string& session_id, std::optional<int> progress) override;
    Result<void> delete_session(const std::string& session_id) override;

    Result<SessionFile> add_file(const std::string& session_id, const FileSpec& spec) override;
    Result<std::vector<SessionFile>> list_files(const std::string& session_id) override;
    Result<void> remove_file(const std::string& session_id, const std::string& name) override;

private:
    /// Send with auth; returns the parsed JSON body ("null" for empty bodies).
    Result<nlohmann::json> call(network::HttpMethod method,
                                const std::string& path,
                                const std::optional<nlohmann::json>& body = std::nullopt);

    Result<void> call_void(network::HttpMethod method,
                           const std::string& path,
                           const std::optional<nlohmann::json>& body = std::nullopt);

    Result<network::HttpResponse> send_authenticated(network::HttpRequest request);

    static Error map_error(const network::HttpResponse& response, const std::string& what);

    static std::string session_path(const std::string& session_id);
    static std::string file_path(const std::string& session_id);

    std::string base_url_;
    RestCredentials credentials_;
    network::HttpTransport& transport_;

    mutable std::mutex token_mutex_;
    std::string token_;
};

} // namespace clu::library
