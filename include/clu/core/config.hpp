#pragma once

#include "clu/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace clu {

struct ServerConfig {
    std::string url;                 ///< e.g. https://vcenter.example.com
    std::string username;
    std::string password;
    bool verify_tls = true;
    std::chrono::seconds request_timeout{60};
};

struct TransferConfig {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds keepalive_interval{60000};
    std::chrono::seconds server_idle_timeout{300};
    std::size_t chunk_size = 256 * 1024;
    std::string upload_method = "PUT";
    bool wait_for_pull = true;
    std::chrono::seconds pull_timeout{3600};
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct Config {
    ServerConfig server;
    TransferConfig transfer;
    LoggingConfig logging;
};

/**
 * @brief Parse a JSON configuration document
 *
 * Every key is optional; absent keys keep their defaults. Unknown keys are
 * ignored. Type mismatches are reported as InvalidArgument.
 */
Result<Config> parse_config(const std::string& json_text);

/**
 * @brief Load configuration from disk
 *
 * @param path   File to read
 * @param required When false a missing file yields the default Config
 */
Result<Config> load_config(const std::filesystem::path& path, bool required);

/// Apply CLU_SERVER / CLU_USERNAME / CLU_PASSWORD overrides.
void apply_environment(Config& config);

Result<void> validate_config(const Config& config);

/// Configure the default spdlog logger from the logging section.
void configure_logging(const LoggingConfig& logging);

} // namespace clu
