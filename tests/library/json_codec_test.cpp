#include "clu/library/json_codec.hpp"

#include <gtest/gtest.h>

using namespace clu::library;
using clu::ErrorCode;
using json = nlohmann::json;

TEST(JsonCodecTest, ParsesSessionSnapshot) {
    const auto j = json::parse(R"({
        "id": "session-7",
        "library_item_id": "item-1",
        "library_item_content_version": "3",
        "state": "ACTIVE",
        "client_progress": 45,
        "expiration_time": "2024-05-01T12:30:15.250Z",
        "error_message": {"id": "x", "default_message": "", "args": []}
    })");

    auto snapshot = json_codec::session_from_json(j);

    ASSERT_TRUE(snapshot.is_ok());
    const auto& s = snapshot.value();
    EXPECT_EQ(s.id, "session-7");
    EXPECT_EQ(s.item_id, "item-1");
    EXPECT_EQ(s.content_version, "3");
    EXPECT_EQ(s.state, SessionState::Active);
    ASSERT_TRUE(s.progress.has_value());
    EXPECT_EQ(*s.progress, 45);
    ASSERT_TRUE(s.expires_at.has_value());
    EXPECT_EQ(json_codec::format_timestamp(*s.expires_at), "2024-05-01T12:30:15.250Z");
    EXPECT_TRUE(s.error_message.empty());
}

TEST(JsonCodecTest, ErrorSessionCarriesServerMessage) {
    const auto j = json::parse(R"({"state": "ERROR",
        "error_message": {"id": "com.vmware.vdcs.cls-main.file_validation_failed",
                          "default_message": "File a.iso failed validation"}})");

    auto snapshot = json_codec::session_from_json(j);

    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_EQ(snapshot.value().state, SessionState::Error);
    EXPECT_EQ(snapshot.value().error_message, "File a.iso failed validation");
}

TEST(JsonCodecTest, UnknownSessionStateIsRemoteFailure) {
    auto snapshot = json_codec::session_from_json(json::parse(R"({"state": "PAUSED"})"));

    ASSERT_TRUE(snapshot.is_error());
    EXPECT_TRUE(snapshot.error().is(ErrorCode::RemoteFailure));
}

TEST(JsonCodecTest, ParsesPushAndPullFiles) {
    const auto j = json::parse(R"([
        {"name": "a.iso", "source_type": "PUSH", "status": "WAITING_FOR_TRANSFER",
         "upload_endpoint": {"uri": "https://esx01/nfc/abc/a.iso"}, "bytes_transferred": 0},
        {"name": "b.iso", "source_type": "PULL", "status": "READY", "size": 2048,
         "source_endpoint": {"uri": "https://example/b.iso"}, "bytes_transferred": 2048,
         "checksum_info": {"algorithm": "SHA256", "checksum": "abcd"}}
    ])");

    auto files = json_codec::files_from_json(j);

    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 2u);

    const auto& push = files.value()[0];
    EXPECT_EQ(push.source_type, SourceType::Push);
    EXPECT_EQ(push.status, TransferStatus::Waiting);
    EXPECT_EQ(push.upload_endpoint.value(), "https://esx01/nfc/abc/a.iso");
    EXPECT_FALSE(push.source_endpoint.has_value());

    const auto& pull = files.value()[1];
    EXPECT_EQ(pull.source_type, SourceType::Pull);
    EXPECT_EQ(pull.status, TransferStatus::Ready);
    EXPECT_EQ(pull.size.value(), 2048u);
    EXPECT_EQ(pull.bytes_transferred, 2048u);
    EXPECT_EQ(pull.checksum.value(), "abcd");
}

TEST(JsonCodecTest, FileWithoutNameIsRejected) {
    EXPECT_TRUE(json_codec::files_from_json(json::parse(R"([{"status": "READY"}])")).is_error());
    EXPECT_TRUE(json_codec::files_from_json(json::parse(R"({"name": "a"})")).is_error());
}

TEST(JsonCodecTest, FileSpecSerialization) {
    FileSpec pull{"b.iso", SourceType::Pull, std::string("https://example/b.iso"), 4096u};
    const auto j = json_codec::file_spec_to_json(pull);

    EXPECT_EQ(j.at("name"), "b.iso");
    EXPECT_EQ(j.at("source_type"), "PULL");
    EXPECT_EQ(j.at("source_endpoint").at("uri"), "https://example/b.iso");
    EXPECT_EQ(j.at("size"), 4096);

    FileSpec push{"a.iso", SourceType::Push, std::nullopt, std::nullopt};
    const auto p = json_codec::file_spec_to_json(push);
    EXPECT_EQ(p.at("source_type"), "PUSH");
    EXPECT_FALSE(p.contains("source_endpoint"));
    EXPECT_FALSE(p.contains("size"));
}

TEST(JsonCodecTest, ItemAndLibraryInfo) {
    auto item = json_codec::item_from_json(json::parse(
        R"({"id": "item-1", "library_id": "lib-1", "name": "ubuntu", "type": "iso", "content_version": "3", "size": 10})"));
    ASSERT_TRUE(item.is_ok());
    EXPECT_EQ(item.value().content_version, "3");
    EXPECT_EQ(item.value().size, 10u);

    auto library = json_codec::library_from_json(json::parse(R"({"id": "lib-1", "name": "isos", "type": "LOCAL"})"));
    ASSERT_TRUE(library.is_ok());
    EXPECT_EQ(library.value().name, "isos");

    EXPECT_TRUE(json_codec::item_from_json(json::parse(R"({"name": "no id"})")).is_error());
}

TEST(JsonCodecTest, IdentifierLists) {
    auto ids = json_codec::ids_from_json(json::parse(R"(["a", "b"])"));
    ASSERT_TRUE(ids.is_ok());
    EXPECT_EQ(ids.value(), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(json_codec::ids_from_json(json::parse(R"([1, 2])")).is_error());
}

TEST(JsonCodecTest, RemoteErrorBody) {
    auto busy = json_codec::remote_error_from_body(
        R"({"error_type": "RESOURCE_BUSY", "messages": [{"id": "x", "default_message": "Item is busy"}]})");
    EXPECT_EQ(busy.error_type, "RESOURCE_BUSY");
    EXPECT_EQ(busy.message, "Item is busy");

    auto plain = json_codec::remote_error_from_body("Service Unavailable");
    EXPECT_TRUE(plain.error_type.empty());
    EXPECT_EQ(plain.message, "Service Unavailable");
}

TEST(JsonCodecTest, TimestampWithoutFraction) {
    auto parsed = json_codec::parse_timestamp("2024-01-02T03:04:05Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(json_codec::format_timestamp(*parsed), "2024-01-02T03:04:05.000Z");
    EXPECT_FALSE(json_codec::parse_timestamp("yesterday").has_value());
}
