#include "clu/library/json_codec.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clu::library::json_codec {
namespace {

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return {};
}

std::uint64_t uint_field(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_number_unsigned()) {
        return j.at(key).get<std::uint64_t>();
    }
    return 0;
}

std::optional<std::string> endpoint_uri(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_object()) {
        return std::nullopt;
    }
    const auto uri = string_field(j.at(key), "uri");
    if (uri.empty()) {
        return std::nullopt;
    }
    return uri;
}

// Localizable message objects carry the text in default_message
std::string message_field(const json& j, const char* key) {
    if (!j.contains(key)) {
        return {};
    }
    const auto& value = j.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        return string_field(value, "default_message");
    }
    return {};
}

std::time_t to_time_t_utc(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    std::chrono::milliseconds fraction{0};
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        digits = (digits + "000").substr(0, 3);
        fraction = std::chrono::milliseconds(std::stoi(digits));
    }

    const auto seconds = to_time_t_utc(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) + fraction;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time - std::chrono::system_clock::from_time_t(seconds)).count();
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Result<LibraryInfo> library_from_json(const json& j) {
    if (!j.is_object() || string_field(j, "id").empty()) {
        return Err<LibraryInfo>(ErrorCode::RemoteFailure, "Malformed library info");
    }
    LibraryInfo info;
    info.id = string_field(j, "id");
    info.name = string_field(j, "name");
    info.type = string_field(j, "type");
    return Ok(std::move(info));
}

Result<ItemInfo> item_from_json(const json& j) {
    if (!j.is_object() || string_field(j, "id").empty()) {
        return Err<ItemInfo>(ErrorCode::RemoteFailure, "Malformed library item info");
    }
    ItemInfo info;
    info.id = string_field(j, "id");
    info.library_id = string_field(j, "library_id");
    info.name = string_field(j, "name");
    info.type = string_field(j, "type");
    info.content_version = string_field(j, "content_version");
    info.size = uint_field(j, "size");
    return Ok(std::move(info));
}

Result<SessionSnapshot> session_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<SessionSnapshot>(ErrorCode::RemoteFailure, "Malformed update session info");
    }
    const auto state_text = string_field(j, "state");
    const auto state = parse_session_state(state_text);
    if (!state) {
        return Err<SessionSnapshot>(ErrorCode::RemoteFailure, "Unknown update session state: " + state_text);
    }

    SessionSnapshot snapshot;
    snapshot.id = string_field(j, "id");
    snapshot.item_id = string_field(j, "library_item_id");
    snapshot.content_version = string_field(j, "library_item_content_version");
    snapshot.state = *state;
    for (const char* key : {"client_progress", "progress"}) {
        if (j.contains(key) && j.at(key).is_number_integer()) {
            snapshot.progress = j.at(key).get<int>();
            break;
        }
    }
    if (const auto expiry = string_field(j, "expiration_time"); !expiry.empty()) {
        snapshot.expires_at = parse_timestamp(expiry);
    }
    snapshot.error_message = message_field(j, "error_message");
    return Ok(std::move(snapshot));
}

Result<SessionFile> file_from_json(const json& j) {
    if (!j.is_object() || string_field(j, "name").empty()) {
        return Err<SessionFile>(ErrorCode::RemoteFailure, "Malformed update session file info");
    }

    SessionFile file;
    file.name = string_field(j, "name");
    if (const auto type = parse_source_type(string_field(j, "source_type"))) {
        file.source_type = *type;
    }
    file.source_endpoint = endpoint_uri(j, "source_endpoint");
    file.upload_endpoint = endpoint_uri(j, "upload_endpoint");
    if (j.contains("size") && j.at("size").is_number_unsigned()) {
        file.size = j.at("size").get<std::uint64_t>();
    }
    if (j.contains("checksum_info") && j.at("checksum_info").is_object()) {
        const auto checksum = string_field(j.at("checksum_info"), "checksum");
        if (!checksum.empty()) {
            file.checksum = checksum;
        }
    }
    file.bytes_transferred = uint_field(j, "bytes_transferred");
    if (const auto status = parse_transfer_status(string_field(j, "status"))) {
        file.status = *status;
    }
    file.error_message = message_field(j, "error_message");
    return Ok(std::move(file));
}

Result<std::vector<SessionFile>> files_from_json(const json& j) {
    if (!j.is_array()) {
        return Err<std::vector<SessionFile>>(ErrorCode::RemoteFailure, "Expected a list of session files");
    }
    std::vector<SessionFile> files;
    files.reserve(j.size());
    for (const auto& entry : j) {
        auto file = file_from_json(entry);
        if (file.is_error()) {
            return Err<std::vector<SessionFile>>(file.error());
        }
        files.push_back(std::move(file.value()));
    }
    return Ok(std::move(files));
}

Result<std::vector<std::string>> ids_from_json(const json& j) {
    if (!j.is_array()) {
        return Err<std::vector<std::string>>(ErrorCode::RemoteFailure, "Expected a list of identifiers");
    }
    std::vector<std::string> ids;
    for (const auto& entry : j) {
        if (!entry.is_string()) {
            return Err<std::vector<std::string>>(ErrorCode::RemoteFailure, "Identifier is not a string");
        }
        ids.push_back(entry.get<std::string>());
    }
    return Ok(std::move(ids));
}

json file_spec_to_json(const FileSpec& spec) {
    json j;
    j["name"] = spec.name;
    j["source_type"] = to_string(spec.source_type);
    if (spec.source_endpoint) {
        j["source_endpoint"] = json{{"uri", *spec.source_endpoint}};
    }
    if (spec.size) {
        j["size"] = *spec.size;
    }
    return j;
}

RemoteError remote_error_from_body(const std::string& body) {
    RemoteError error;
    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error.message = body;
        return error;
    }
    error.error_type = string_field(j, "error_type");
    if (j.contains("messages") && j.at("messages").is_array() && !j.at("messages").empty()) {
        error.message = string_field(j.at("messages").front(), "default_message");
    }
    if (error.message.empty()) {
        error.message = message_field(j, "error_message");
    }
    return error;
}

} // namespace clu::library::json_codec
