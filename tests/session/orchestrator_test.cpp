#include "clu/events/events.hpp"
#include "clu/session/orchestrator.hpp"
#include "support/fake_content_library.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <vector>

using clu::Error;
using clu::ErrorCode;
using clu::events::EventBus;
using clu::events::SessionDefunctEvent;
using clu::events::SessionOpenedEvent;
using clu::events::SessionStateChangedEvent;
using clu::events::TransferCompletedEvent;
using clu::events::TransferFailedEvent;
using clu::events::TransferProgressEvent;
using clu::library::ItemHandle;
using clu::library::SessionState;
using clu::library::SourceType;
using clu::library::TransferStatus;
using clu::session::AddFileRequest;
using clu::session::FileTransferDriver;
using clu::session::OrchestratorOptions;
using clu::session::UpdateSessionOrchestrator;
using clu::testing::FakeContentLibrary;
using clu::testing::FakeUploadStream;
using clu::testing::UploadRecord;
using clu::testing::make_upload_factory;
using clu::testing::write_temp_file;
using Op = FakeContentLibrary::Operation;

using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        library_ = server_.add_library("isos");
        item_id_ = server_.add_item(library_, "ubuntu", "1", {"old1.iso", "old2.iso", "keep.iso"});

        options_.poll_interval = 5ms;
        options_.keepalive_interval = 60s;
        options_.pull_timeout = 5s;

        bus_.subscribe<SessionOpenedEvent>([this](const SessionOpenedEvent& e) {
            std::lock_guard lock(mutex_);
            session_id_ = e.session_id;
        });
        bus_.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            std::lock_guard lock(mutex_);
            progress_.push_back(e.percent);
        });
        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) { completed_events_++; });
        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) { failed_events_++; });
        bus_.subscribe<SessionDefunctEvent>([this](const SessionDefunctEvent&) { defunct_events_++; });
    }

    ItemHandle item() const { return ItemHandle{item_id_, library_, "ubuntu", "1"}; }

    std::string session_id() {
        std::lock_guard lock(mutex_);
        return session_id_;
    }

    AddFileRequest push_request(const std::string& name, std::size_t size) {
        return AddFileRequest{name, write_temp_file(name, size).string(), std::nullopt, std::nullopt};
    }

    FakeContentLibrary server_;
    EventBus bus_;
    OrchestratorOptions options_;
    std::string library_;
    std::string item_id_;

    std::mutex mutex_;
    std::string session_id_;
    std::vector<int> progress_;
    std::atomic<int> completed_events_{0};
    std::atomic<int> failed_events_{0};
    std::atomic<int> defunct_events_{0};
};

// ════════════════════════════════════════════════════════
// Adding files
// ════════════════════════════════════════════════════════

TEST_F(OrchestratorTest, PushUploadCompletesTheSession) {
    FileTransferDriver driver(make_upload_factory(server_), 45);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 100));

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);
    ASSERT_EQ(outcome.value().files.size(), 1u);
    EXPECT_EQ(outcome.value().files[0].status, TransferStatus::Ready);
    EXPECT_EQ(progress_, (std::vector<int>{0, 45, 90, 100}));
    EXPECT_EQ(completed_events_.load(), 1);
    EXPECT_EQ(failed_events_.load(), 0);

    const auto calls = server_.calls();
    EXPECT_EQ(calls.open_session, 1);
    EXPECT_EQ(calls.add_file, 1);
    EXPECT_EQ(calls.complete_session, 1);
    EXPECT_EQ(calls.fail_session, 0);
    EXPECT_EQ(server_.item_content_version(item_id_), "2");
    EXPECT_EQ(server_.item_files(item_id_).size(), 4u);
}

TEST_F(OrchestratorTest, PullSourceIsFetchedByTheServer) {
    server_.set_pull_polls(4);
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(
        item(), AddFileRequest{"b.iso", "https://example/b.iso", std::nullopt, 4096u});

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);
    ASSERT_EQ(outcome.value().files.size(), 1u);
    EXPECT_EQ(outcome.value().files[0].source_type, SourceType::Pull);
    EXPECT_EQ(outcome.value().files[0].status, TransferStatus::Ready);
    EXPECT_TRUE(progress_.empty());

    const auto calls = server_.calls();
    EXPECT_EQ(calls.complete_session, 1);
    EXPECT_GE(calls.list_files, 4);
}

TEST_F(OrchestratorTest, PullWithoutWaitingReturnsAfterComplete) {
    server_.set_pull_polls(1000);
    options_.wait_for_pull = false;
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(
        item(), AddFileRequest{"b.iso", "https://example/b.iso", std::nullopt, std::nullopt});

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);
    EXPECT_EQ(outcome.value().files[0].status, TransferStatus::Transferring);
}

TEST_F(OrchestratorTest, BrokenPullSourceIsReported) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(
        item(), AddFileRequest{"b.iso", "https://example/broken.iso", std::nullopt, std::nullopt});

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::TransferFailure));
}

TEST_F(OrchestratorTest, FailedUploadFailsTheSession) {
    FakeUploadStream::Script script;
    script.fail_at_percent = 60;
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 100));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::TransferFailure));
    EXPECT_NE(outcome.error().message.find("60%"), std::string::npos);
    EXPECT_EQ(failed_events_.load(), 1);
    EXPECT_EQ(progress_.back(), 60);

    const auto calls = server_.calls();
    EXPECT_EQ(calls.fail_session, 1);
    EXPECT_EQ(calls.complete_session, 0);
    auto remote = server_.session(session_id());
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->state, SessionState::Error);
    EXPECT_NE(remote->error_message.find("connection reset"), std::string::npos);
    EXPECT_EQ(server_.item_content_version(item_id_), "1");
}

TEST_F(OrchestratorTest, SessionReclaimedMidUploadIsDefunct) {
    options_.keepalive_interval = 20ms;
    FakeUploadStream::Script script;
    script.write_delay = 10ms;
    script.on_write = [this](int index) {
        if (index == 2) {
            server_.expire(session_id());
        }
    };
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 1000));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Defunct)) << outcome.error().to_string();
    EXPECT_EQ(defunct_events_.load(), 1);

    const auto calls = server_.calls();
    EXPECT_EQ(calls.fail_session, 0);
    EXPECT_EQ(calls.complete_session, 0);
    EXPECT_FALSE(server_.session(session_id()).has_value());
}

TEST_F(OrchestratorTest, SessionDeletedMidUploadIsDefunct) {
    options_.keepalive_interval = 20ms;
    FakeUploadStream::Script script;
    script.write_delay = 10ms;
    script.on_write = [this](int index) {
        if (index == 2) {
            EXPECT_TRUE(server_.delete_session(session_id()).is_ok());
        }
    };
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 1000));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Defunct)) << outcome.error().to_string();
    EXPECT_NE(outcome.error().to_string().find("keepalive during upload of a.iso"), std::string::npos);
    EXPECT_EQ(defunct_events_.load(), 1);
    EXPECT_EQ(failed_events_.load(), 1);
    EXPECT_EQ(completed_events_.load(), 0);

    const auto calls = server_.calls();
    EXPECT_GE(calls.keep_alive_session, 1);
    EXPECT_EQ(calls.fail_session, 0);
    EXPECT_EQ(calls.complete_session, 0);
}

TEST_F(OrchestratorTest, SlowUploadKeepsTheSessionAlive) {
    options_.keepalive_interval = 30ms;
    FakeUploadStream::Script script;
    script.write_delay = 10ms;
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 300));

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);

    const auto reported = server_.keepalive_progress();
    ASSERT_GE(reported.size(), 2u);
    int previous = 0;
    for (const auto& progress : reported) {
        ASSERT_TRUE(progress.has_value());
        EXPECT_GE(*progress, previous);
        previous = *progress;
    }
}

TEST_F(OrchestratorTest, UnsupportedSourceIsRejectedBeforeAnyRemoteCall) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_files(
        item(), {push_request("a.iso", 10), AddFileRequest{"b.iso", "ftp://host/b.iso", std::nullopt, std::nullopt}});

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::UnsupportedProtocol));
    EXPECT_EQ(server_.calls().open_session, 0);
}

TEST_F(OrchestratorTest, MalformedRequestsAreRejectedBeforeAnyRemoteCall) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto empty = orchestrator.add_files(item(), {});
    auto duplicate = orchestrator.add_files(item(), {push_request("a.iso", 1), push_request("a.iso", 1)});
    auto unnamed = orchestrator.add_file(item(), AddFileRequest{"", "https://example/b.iso", std::nullopt, std::nullopt});
    auto no_removals = orchestrator.remove_files(item(), {});

    EXPECT_TRUE(empty.error().is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(duplicate.error().is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(unnamed.error().is(ErrorCode::InvalidArgument));
    EXPECT_TRUE(no_removals.error().is(ErrorCode::InvalidArgument));
    EXPECT_EQ(server_.calls().open_session, 0);
}

TEST_F(OrchestratorTest, BusyItemConflictIsSurfaced) {
    ASSERT_TRUE(server_.open_session(item_id_, "1").is_ok());
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 10));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Conflict));
    EXPECT_EQ(server_.calls().add_file, 0);
    EXPECT_EQ(server_.calls().fail_session, 0);
}

TEST_F(OrchestratorTest, ServerRejectionAtCompleteIsReported) {
    server_.reject_next_complete("checksum mismatch");
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 10));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::RemoteFailure));
    EXPECT_NE(outcome.error().message.find("checksum mismatch"), std::string::npos);
    EXPECT_EQ(server_.calls().fail_session, 0);
}

TEST_F(OrchestratorTest, FailingCleanupIsAttachedAsContext) {
    FakeUploadStream::Script script;
    script.fail_at_percent = 50;
    server_.fail_next(Op::FailSession, Error(ErrorCode::RemoteFailure, "server down"));
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 100));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::TransferFailure));
    const auto rendered = outcome.error().to_string();
    EXPECT_NE(rendered.find("cleanup Fail()"), std::string::npos) << rendered;
    EXPECT_NE(rendered.find("server down"), std::string::npos) << rendered;
}

TEST_F(OrchestratorTest, ReusesAnExistingSession) {
    const auto existing = server_.open_session(item_id_, "1").value();
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 10), existing);

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().session_id, existing);
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);
    EXPECT_EQ(server_.calls().open_session, 1);
}

TEST_F(OrchestratorTest, ReusedSessionMustBelongToTheItem) {
    const auto other_item = server_.add_item(library_, "debian");
    const auto foreign = server_.open_session(other_item, "1").value();
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 10), foreign);

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::InvalidArgument));
    EXPECT_EQ(server_.calls().add_file, 0);
}

// ════════════════════════════════════════════════════════
// Cancellation
// ════════════════════════════════════════════════════════

TEST_F(OrchestratorTest, CancelBeforeStartMakesNoRemoteCall) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);
    orchestrator.request_cancel();

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 10));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Cancelled));
    EXPECT_EQ(server_.calls().open_session, 0);
}

TEST_F(OrchestratorTest, CancelDuringUploadFailsTheSession) {
    UpdateSessionOrchestrator* running = nullptr;
    FakeUploadStream::Script script;
    script.write_delay = 10ms;
    script.on_write = [&running](int index) {
        if (index == 1) {
            running->request_cancel();
        }
    };
    FileTransferDriver driver(make_upload_factory(server_, script), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);
    running = &orchestrator;

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 1000));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Cancelled));
    EXPECT_EQ(server_.calls().fail_session, 1);
    EXPECT_EQ(server_.calls().complete_session, 0);
    EXPECT_EQ(server_.session(session_id())->state, SessionState::Error);
}

TEST_F(OrchestratorTest, UploadIsTornDownBeforeTheSessionIsFailed) {
    auto record = std::make_shared<UploadRecord>();
    UpdateSessionOrchestrator* running = nullptr;
    FakeUploadStream::Script script;
    script.write_delay = 20ms;
    script.on_write = [&running](int index) {
        if (index == 1) {
            running->request_cancel();
        }
    };
    FileTransferDriver driver(make_upload_factory(server_, script, record), 10);
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);
    running = &orchestrator;

    int writes_at_fail = -1;
    bool aborted_at_fail = false;
    bus_.subscribe<SessionStateChangedEvent>([&](const SessionStateChangedEvent& e) {
        if (e.to == SessionState::Error) {
            writes_at_fail = record->writes.load();
            aborted_at_fail = record->aborted.load();
        }
    });

    auto outcome = orchestrator.add_file(item(), push_request("a.iso", 1000));

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::Cancelled));
    EXPECT_TRUE(aborted_at_fail);
    EXPECT_EQ(writes_at_fail, record->writes.load());
    EXPECT_EQ(server_.calls().fail_session, 1);
}

// ════════════════════════════════════════════════════════
// Removing files
// ════════════════════════════════════════════════════════

TEST_F(OrchestratorTest, RemovesFilesInOneSession) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.remove_files(item(), {"old1.iso", "old2.iso"});

    ASSERT_TRUE(outcome.is_ok()) << outcome.error().to_string();
    EXPECT_EQ(outcome.value().final_state, SessionState::Done);
    EXPECT_EQ(server_.item_files(item_id_), std::vector<std::string>{"keep.iso"});
    EXPECT_EQ(server_.calls().open_session, 1);
    EXPECT_EQ(server_.calls().remove_file, 2);
}

TEST_F(OrchestratorTest, RemovingUnknownFileFailsTheSession) {
    FileTransferDriver driver(make_upload_factory(server_));
    UpdateSessionOrchestrator orchestrator(server_, driver, bus_, options_);

    auto outcome = orchestrator.remove_file(item(), "nope.iso");

    ASSERT_TRUE(outcome.is_error());
    EXPECT_TRUE(outcome.error().is(ErrorCode::NotFound));
    EXPECT_EQ(server_.calls().fail_session, 1);
    EXPECT_EQ(server_.calls().complete_session, 0);
    EXPECT_EQ(server_.item_files(item_id_).size(), 3u);
}
