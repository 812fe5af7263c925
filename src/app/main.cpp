#include "clu/core/config.hpp"
#include "clu/events/components.hpp"
#include "clu/events/event_bus.hpp"
#include "clu/library/item_resolver.hpp"
#include "clu/library/json_codec.hpp"
#include "clu/library/rest_api.hpp"
#include "clu/network/http_transport.hpp"
#include "clu/network/upload_stream.hpp"
#include "clu/session/orchestrator.hpp"
#include "clu/session/transfer_driver.hpp"
#include "clu/session/update_session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using clu::library::ItemRef;
using clu::library::SourceType;
using clu::session::AddFileRequest;
using clu::session::UpdateSessionOrchestrator;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Orchestrator running the current command, for signal handling
std::atomic<UpdateSessionOrchestrator*> g_orchestrator{nullptr};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        if (auto* orchestrator = g_orchestrator.load()) {
            orchestrator->request_cancel();
        }
    }
}

struct CliOptions {
    std::string config_path;
    bool verbose = false;
    std::string command;

    std::string item_id;
    std::string library;
    std::string item_name;
    std::string session_id;
    std::vector<std::string> names;
    std::vector<std::string> sources;
    std::optional<SourceType> type;
    bool no_wait = false;
};

void print_usage() {
    std::cerr <<
        "Usage: clu [--config FILE] [-v] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  add-file       (--item ID | --library NAME --item-name NAME) --name FILE --source LOCATOR\n"
        "                 [--type push|pull] [--session ID] [--no-wait]   (repeat --name/--source pairs)\n"
        "  remove-file    (--item ID | --library NAME --item-name NAME) --name FILE [--name FILE...]\n"
        "  list-files     --session ID\n"
        "  show-session   --session ID\n"
        "  cancel-session --session ID\n"
        "  delete-session --session ID\n"
        "\n"
        "Environment: CLU_SERVER, CLU_USERNAME, CLU_PASSWORD override the config file.\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--item" && has_value) {
            options.item_id = argv[++i];
        } else if (arg == "--library" && has_value) {
            options.library = argv[++i];
        } else if (arg == "--item-name" && has_value) {
            options.item_name = argv[++i];
        } else if (arg == "--session" && has_value) {
            options.session_id = argv[++i];
        } else if (arg == "--name" && has_value) {
            options.names.emplace_back(argv[++i]);
        } else if (arg == "--source" && has_value) {
            options.sources.emplace_back(argv[++i]);
        } else if (arg == "--type" && has_value) {
            const std::string type = argv[++i];
            if (type == "push") {
                options.type = SourceType::Push;
            } else if (type == "pull") {
                options.type = SourceType::Pull;
            } else {
                std::cerr << "Unknown transfer type: " << type << "\n";
                return std::nullopt;
            }
        } else if (arg == "--no-wait") {
            options.no_wait = true;
        } else if (!arg.empty() && arg[0] != '-' && options.command.empty()) {
            options.command = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.command.empty()) {
        return std::nullopt;
    }
    return options;
}

bool needs_item(const std::string& command) {
    return command == "add-file" || command == "remove-file";
}

std::optional<ItemRef> item_ref_from(const CliOptions& options) {
    if (!options.item_id.empty() && options.library.empty() && options.item_name.empty()) {
        return ItemRef::by_id(options.item_id);
    }
    if (options.item_id.empty() && !options.library.empty() && !options.item_name.empty()) {
        return ItemRef::by_name(options.library, options.item_name);
    }
    return std::nullopt;
}

json file_to_json(const clu::library::SessionFile& file) {
    json j;
    j["name"] = file.name;
    j["source_type"] = clu::library::to_string(file.source_type);
    j["status"] = clu::library::to_string(file.status);
    j["bytes_transferred"] = file.bytes_transferred;
    if (file.size) {
        j["size"] = *file.size;
    }
    if (file.checksum) {
        j["checksum"] = *file.checksum;
    }
    if (!file.error_message.empty()) {
        j["error_message"] = file.error_message;
    }
    return j;
}

json session_to_json(const clu::session::UpdateSession& session) {
    json j;
    j["id"] = session.id();
    j["library_item_id"] = session.item_id();
    j["content_version"] = session.content_version();
    j["state"] = clu::library::to_string(session.state());
    if (session.progress()) {
        j["progress"] = *session.progress();
    }
    if (session.expires_at()) {
        j["expires_at"] = clu::library::json_codec::format_timestamp(*session.expires_at());
    }
    if (!session.server_error().empty()) {
        j["error_message"] = session.server_error();
    }
    j["files"] = json::array();
    for (const auto& file : session.files()) {
        j["files"].push_back(file_to_json(file));
    }
    return j;
}

int report(const clu::Error& error) {
    spdlog::error("{}", error.to_string());
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitUsage;
    }
    const CliOptions& options = *parsed;

    std::optional<ItemRef> item_ref;
    if (needs_item(options.command)) {
        item_ref = item_ref_from(options);
        if (!item_ref || options.names.empty()) {
            print_usage();
            return kExitUsage;
        }
        if (options.command == "add-file" && options.names.size() != options.sources.size()) {
            std::cerr << "Every --name needs a matching --source\n";
            return kExitUsage;
        }
    } else if (options.session_id.empty()) {
        print_usage();
        return kExitUsage;
    }

    auto loaded = clu::load_config(options.config_path.empty() ? "clu.json" : options.config_path,
                                   !options.config_path.empty());
    if (loaded.is_error()) {
        std::cerr << loaded.error().to_string() << "\n";
        return kExitUsage;
    }
    clu::Config config = loaded.value();
    clu::apply_environment(config);
    if (options.verbose) {
        config.logging.level = "debug";
    }
    if (options.no_wait) {
        config.transfer.wait_for_pull = false;
    }
    if (auto valid = clu::validate_config(config); valid.is_error()) {
        std::cerr << valid.error().to_string() << "\n";
        return kExitUsage;
    }
    clu::configure_logging(config.logging);

    clu::events::EventBus event_bus;
    clu::events::LoggerComponent logger(event_bus);
    clu::events::MetricsComponent metrics(event_bus);

    clu::network::TransportOptions transport_options;
    transport_options.verify_tls = config.server.verify_tls;
    transport_options.timeout = config.server.request_timeout;

    clu::network::BeastHttpTransport transport(transport_options);
    clu::library::RestContentLibraryApi api(config.server.url,
                                            {config.server.username, config.server.password},
                                            transport);

    const auto upload_method = clu::network::parse_method(config.transfer.upload_method);
    clu::session::FileTransferDriver driver(
        [&api, transport_options, upload_method]() -> std::unique_ptr<clu::network::UploadStream> {
            return std::make_unique<clu::network::HttpUploadStream>(transport_options, upload_method,
                                                                     api.auth_headers());
        },
        config.transfer.chunk_size);

    UpdateSessionOrchestrator orchestrator(api, driver, event_bus,
                                           clu::session::OrchestratorOptions::from_config(config.transfer));
    g_orchestrator.store(&orchestrator);
    std::signal(SIGINT, signal_handler);

    const clu::session::SessionLeaseClock lease(config.transfer.keepalive_interval,
                                                config.transfer.server_idle_timeout);
    int exit_code = kExitOk;

    if (options.command == "add-file" || options.command == "remove-file") {
        auto item = clu::library::resolve_item(api, *item_ref);
        if (item.is_error()) {
            exit_code = report(item.error());
        } else {
            spdlog::info("Target item {} ({}) at content version {}",
                         item.value().name, item.value().id, item.value().content_version);

            clu::Result<clu::session::TransferOutcome> outcome =
                clu::Err<clu::session::TransferOutcome>(clu::ErrorCode::InvalidArgument, "No command ran");
            if (options.command == "add-file") {
                std::vector<AddFileRequest> requests;
                for (size_t i = 0; i < options.names.size(); ++i) {
                    requests.push_back({options.names[i], options.sources[i], options.type, std::nullopt});
                }
                std::optional<std::string> reuse;
                if (!options.session_id.empty()) {
                    reuse = options.session_id;
                }
                outcome = orchestrator.add_files(item.value(), requests, reuse);
            } else {
                outcome = orchestrator.remove_files(item.value(), options.names);
            }

            if (outcome.is_error()) {
                exit_code = report(outcome.error());
            } else {
                json summary;
                summary["session_id"] = outcome.value().session_id;
                summary["state"] = clu::library::to_string(outcome.value().final_state);
                summary["files"] = json::array();
                for (const auto& file : outcome.value().files) {
                    summary["files"].push_back(file_to_json(file));
                }
                std::cout << summary.dump(2) << std::endl;
            }
        }
        metrics.print_stats();
    } else if (options.command == "list-files" || options.command == "show-session") {
        auto session = clu::session::UpdateSession::load(api, event_bus, options.session_id, lease);
        if (session.is_error()) {
            exit_code = report(session.error());
        } else if (options.command == "show-session") {
            std::cout << session_to_json(*session.value()).dump(2) << std::endl;
        } else {
            for (const auto& file : session.value()->files()) {
                std::cout << file.name << "\t" << clu::library::to_string(file.source_type) << "\t"
                          << clu::library::to_string(file.status) << "\t" << file.bytes_transferred << "\n";
            }
        }
    } else if (options.command == "cancel-session" || options.command == "delete-session") {
        auto session = clu::session::UpdateSession::load(api, event_bus, options.session_id, lease);
        if (session.is_error()) {
            exit_code = report(session.error());
        } else {
            auto done = options.command == "cancel-session" ? session.value()->cancel()
                                                            : session.value()->remove();
            if (done.is_error()) {
                exit_code = report(done.error());
            } else {
                spdlog::info("Session {} is now {}", options.session_id,
                             clu::library::to_string(session.value()->state()));
            }
        }
    } else {
        std::cerr << "Unknown command: " << options.command << "\n";
        print_usage();
        exit_code = kExitUsage;
    }

    g_orchestrator.store(nullptr);
    if (auto logged_out = api.logout(); logged_out.is_error()) {
        spdlog::warn("Logout failed: {}", logged_out.error().to_string());
    }
    return exit_code;
}
