#pragma once

#include "clu/core/result.hpp"
#include "clu/library/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace clu::library::json_codec {

using json = nlohmann::json;

/// Parse "2026-10-18T12:00:00.000Z" (UTC, optional fraction).
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);
std::string format_timestamp(std::chrono::system_clock::time_point time);

Result<LibraryInfo> library_from_json(const json& j);
Result<ItemInfo> item_from_json(const json& j);
Result<SessionSnapshot> session_from_json(const json& j);
Result<SessionFile> file_from_json(const json& j);
Result<std::vector<SessionFile>> files_from_json(const json& j);
Result<std::vector<std::string>> ids_from_json(const json& j);

json file_spec_to_json(const FileSpec& spec);

/**
 * @brief Server error body: {"error_type": "...", "messages": [{"default_message": "..."}]}
 */
struct RemoteError {
    std::string error_type;
    std::string message;
};

RemoteError remote_error_from_body(const std::string& body);

} // namespace clu::library::json_codec
