#pragma once

#include "clu/core/result.hpp"
#include "clu/library/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clu::library {

/**
 * @brief Remote management API the update-session core depends on
 *
 * Error contract for implementations:
 * - object missing (library, item, session, file)  -> ErrorCode::NotFound
 * - another ACTIVE session already on the item      -> ErrorCode::Conflict
 * - anything else                                   -> ErrorCode::RemoteFailure
 */
class ContentLibraryApi {
public:
    virtual ~ContentLibraryApi() = default;

    // Read-only lookups
    virtual Result<LibraryInfo> get_library(const std::string& library_id) = 0;
    virtual Result<std::vector<std::string>> find_libraries(const std::string& name) = 0;
    virtual Result<ItemInfo> get_item(const std::string& item_id) = 0;
    virtual Result<std::vector<std::string>> list_items(const std::string& library_id) = 0;
    virtual Result<std::vector<std::string>> find_items(const std::string& library_id,
                                                        const std::string& name) = 0;

    // Update sessions
    virtual Result<std::string> open_session(const std::string& item_id,
                                             const std::string& content_version) = 0;
    virtual Result<SessionSnapshot> get_session(const std::string& session_id) = 0;
    virtual Result<void> cancel_session(const std::string& session_id) = 0;
    virtual Result<void> complete_session(const std::string& session_id) = 0;
    virtual Result<void> fail_session(const std::string& session_id, const std::string& message) = 0;
    virtual Result<void> keep_alive_session(const std::string& session_id, std::optional<int> progress) = 0;
    virtual Result<void> delete_session(const std::string& session_id) = 0;

    // Session files
    virtual Result<SessionFile> add_file(const std::string& session_id, const FileSpec& spec) = 0;
    virtual Result<std::vector<SessionFile>> list_files(const std::string& session_id) = 0;
    virtual Result<void> remove_file(const std::string& session_id, const std::string& name) = 0;
};

} // namespace clu::library
