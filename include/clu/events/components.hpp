/**
 * @file components.hpp
 * @brief Components that react to session and transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Run an orchestrated upload, then:
 * metrics.print_stats();
 */

#pragma once

#include "clu/events/event_bus.hpp"
#include "clu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace clu::events {

/**
 * @brief Logs every session and transfer event using spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionOpenedEvent>([](const SessionOpenedEvent& e) {
            spdlog::info("[SessionOpened] session={} item={} content_version={}{}",
                         e.session_id, e.item_id, e.content_version, e.attached ? " (attached)" : "");
        });

        bus_.subscribe<SessionStateChangedEvent>([](const SessionStateChangedEvent& e) {
            if (e.to == library::SessionState::Error) {
                spdlog::warn("[SessionState] session={} {} -> {} error={}",
                             e.session_id, library::to_string(e.from), library::to_string(e.to),
                             e.error_message);
                return;
            }
            spdlog::info("[SessionState] session={} {} -> {}",
                         e.session_id, library::to_string(e.from), library::to_string(e.to));
        });

        bus_.subscribe<SessionKeepAliveEvent>([](const SessionKeepAliveEvent& e) {
            spdlog::debug("[KeepAlive] session={} progress={}",
                          e.session_id, e.progress ? std::to_string(*e.progress) : std::string("-"));
        });

        bus_.subscribe<SessionDefunctEvent>([](const SessionDefunctEvent& e) {
            spdlog::warn("[SessionDefunct] session={} reason={}", e.session_id, e.reason);
        });

        bus_.subscribe<FileRegisteredEvent>([](const FileRegisteredEvent& e) {
            spdlog::info("[FileRegistered] session={} file={} source={}",
                         e.session_id, e.file_name, library::to_string(e.source_type));
        });

        bus_.subscribe<FileRemovedEvent>([](const FileRemovedEvent& e) {
            spdlog::info("[FileRemoved] session={} file={}", e.session_id, e.file_name);
        });

        bus_.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) {
            spdlog::debug("[TransferProgress] session={} file={} {}% bytes={}",
                          e.session_id, e.file_name, e.percent, e.bytes_sent);
        });

        bus_.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] session={} file={} bytes={} duration={}ms",
                         e.session_id, e.file_name, e.total_bytes, e.duration.count());
        });

        bus_.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::error("[TransferFailed] session={} file={} reason={}",
                          e.session_id, e.file_name, e.reason);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts session and transfer outcomes
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_opened{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_canceled{0};
        std::atomic<uint64_t> sessions_defunct{0};
        std::atomic<uint64_t> keepalives_sent{0};
        std::atomic<uint64_t> files_registered{0};
        std::atomic<uint64_t> files_removed{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionOpenedEvent>([this](const SessionOpenedEvent&) {
            stats_.sessions_opened++;
        });

        bus_.subscribe<SessionStateChangedEvent>([this](const SessionStateChangedEvent& e) {
            on_state_changed(e);
        });

        bus_.subscribe<SessionDefunctEvent>([this](const SessionDefunctEvent&) {
            stats_.sessions_defunct++;
        });

        bus_.subscribe<SessionKeepAliveEvent>([this](const SessionKeepAliveEvent&) {
            stats_.keepalives_sent++;
        });

        bus_.subscribe<FileRegisteredEvent>([this](const FileRegisteredEvent&) {
            stats_.files_registered++;
        });

        bus_.subscribe<FileRemovedEvent>([this](const FileRemovedEvent&) {
            stats_.files_removed++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.total_bytes;
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.uploads_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Update Session Statistics:");
        spdlog::info("  Sessions opened:    {}", stats_.sessions_opened.load());
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions canceled:  {}", stats_.sessions_canceled.load());
        spdlog::info("  Sessions defunct:   {}", stats_.sessions_defunct.load());
        spdlog::info("  Keepalives sent:    {}", stats_.keepalives_sent.load());
        spdlog::info("  Files registered:   {}", stats_.files_registered.load());
        spdlog::info("  Files removed:      {}", stats_.files_removed.load());
        spdlog::info("  Uploads completed:  {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:     {}", stats_.uploads_failed.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_state_changed(const SessionStateChangedEvent& e) {
        switch (e.to) {
            case library::SessionState::Done: stats_.sessions_completed++; break;
            case library::SessionState::Error: stats_.sessions_failed++; break;
            case library::SessionState::Canceled: stats_.sessions_canceled++; break;
            default: break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace clu::events
