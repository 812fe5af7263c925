#include "clu/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace clu {
namespace {

using json = nlohmann::json;

template<typename T>
void read_value(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section.at(key).is_null()) {
        target = section.at(key).get<T>();
    }
}

template<typename Duration>
void read_duration(const json& section, const char* key, Duration& target) {
    if (section.contains(key) && !section.at(key).is_null()) {
        target = Duration(section.at(key).get<typename Duration::rep>());
    }
}

void override_from_env(const char* name, std::string& target) {
    if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
        target = value;
    }
}

} // namespace

Result<Config> parse_config(const std::string& json_text) {
    auto document = json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<Config>(ErrorCode::InvalidArgument, "Configuration is not a JSON object");
    }

    Config config;
    try {
        if (document.contains("server")) {
            const auto& server = document.at("server");
            read_value(server, "url", config.server.url);
            read_value(server, "username", config.server.username);
            read_value(server, "password", config.server.password);
            read_value(server, "verify_tls", config.server.verify_tls);
            read_duration(server, "request_timeout_seconds", config.server.request_timeout);
        }
        if (document.contains("transfer")) {
            const auto& transfer = document.at("transfer");
            read_duration(transfer, "poll_interval_ms", config.transfer.poll_interval);
            read_duration(transfer, "keepalive_interval_ms", config.transfer.keepalive_interval);
            read_duration(transfer, "server_idle_timeout_seconds", config.transfer.server_idle_timeout);
            read_value(transfer, "chunk_size", config.transfer.chunk_size);
            read_value(transfer, "upload_method", config.transfer.upload_method);
            read_value(transfer, "wait_for_pull", config.transfer.wait_for_pull);
            read_duration(transfer, "pull_timeout_seconds", config.transfer.pull_timeout);
        }
        if (document.contains("logging")) {
            const auto& logging = document.at("logging");
            read_value(logging, "level", config.logging.level);
            read_value(logging, "pattern", config.logging.pattern);
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorCode::InvalidArgument, std::string("Invalid configuration value: ") + e.what());
    }

    return Ok(std::move(config));
}

Result<Config> load_config(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Err<Config>(ErrorCode::InvalidArgument, "Config file not found: " + path.string());
        }
        spdlog::debug("No config file at {}, using defaults", path.string());
        return Ok(Config{});
    }

    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorCode::InvalidArgument, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (parsed.is_error()) {
        parsed.error().with_context("while reading " + path.string());
    }
    return parsed;
}

void apply_environment(Config& config) {
    override_from_env("CLU_SERVER", config.server.url);
    override_from_env("CLU_USERNAME", config.server.username);
    override_from_env("CLU_PASSWORD", config.server.password);
}

Result<void> validate_config(const Config& config) {
    const auto& transfer = config.transfer;
    if (transfer.poll_interval.count() <= 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.poll_interval_ms must be > 0");
    }
    if (transfer.chunk_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "transfer.chunk_size must be > 0");
    }
    if (transfer.keepalive_interval >= transfer.server_idle_timeout) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "transfer.keepalive_interval_ms must be shorter than the server idle timeout");
    }
    if (transfer.upload_method != "PUT" && transfer.upload_method != "POST") {
        return Err<void>(ErrorCode::InvalidArgument,
                         "transfer.upload_method must be PUT or POST, got " + transfer.upload_method);
    }
    return Ok();
}

void configure_logging(const LoggingConfig& logging) {
    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        spdlog::warn("Unknown log level '{}', falling back to info", logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern(logging.pattern);
}

} // namespace clu
