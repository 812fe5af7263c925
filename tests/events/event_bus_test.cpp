#include "clu/events/event_bus.hpp"
#include "clu/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace clu::events;
using clu::library::SessionState;

TEST(EventBus, DeliversToSubscribersOfTheEventType) {
    EventBus bus;

    std::string opened;
    int defunct = 0;
    bus.subscribe<SessionOpenedEvent>([&](const SessionOpenedEvent& e) { opened = e.session_id; });
    bus.subscribe<SessionDefunctEvent>([&](const SessionDefunctEvent&) { defunct++; });

    bus.emit(SessionOpenedEvent{"session-1", "item-1", "3"});

    EXPECT_EQ(opened, "session-1");
    EXPECT_EQ(defunct, 0);
}

TEST(EventBus, EveryHandlerRuns) {
    EventBus bus;
    int count = 0;

    for (int i = 0; i < 3; ++i) {
        bus.subscribe<SessionKeepAliveEvent>([&](const SessionKeepAliveEvent&) { count++; });
    }
    bus.emit(SessionKeepAliveEvent{"session-1", 40});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe<FileRemovedEvent>([&](const FileRemovedEvent&) { count++; });

    bus.emit(FileRemovedEvent{"session-1", "a.iso"});
    bus.unsubscribe<FileRemovedEvent>(id);
    bus.emit(FileRemovedEvent{"session-1", "b.iso"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<FileRemovedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int later = 0;

    bus.subscribe<SessionStateChangedEvent>([](const SessionStateChangedEvent&) {
        throw std::runtime_error("subscriber bug");
    });
    bus.subscribe<SessionStateChangedEvent>([&](const SessionStateChangedEvent&) { later++; });

    EXPECT_NO_THROW(bus.emit(SessionStateChangedEvent{"session-1", SessionState::Active, SessionState::Done, ""}));
    EXPECT_EQ(later, 1);
}

TEST(EventBus, EmitWithoutSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(TransferFailedEvent{"session-1", "a.iso", "reset"}));
}

TEST(EventBus, ConcurrentEmitFromUploadAndOrchestratorThreads) {
    EventBus bus;
    std::atomic<int> percent_sum{0};
    bus.subscribe<TransferProgressEvent>([&](const TransferProgressEvent& e) { percent_sum += e.percent; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(TransferProgressEvent{"session-1", "a.iso", 5, 512});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(percent_sum.load(), 100);
}

TEST(EventBus, ClearRemovesAllHandlers) {
    EventBus bus;
    bus.subscribe<FileRegisteredEvent>([](const FileRegisteredEvent&) {});
    bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<FileRegisteredEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 0u);
}
