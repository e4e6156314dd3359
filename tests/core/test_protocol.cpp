// test_protocol.cpp — Тесты кадров и JSON-контрактов сообщений

#include <gtest/gtest.h>
#include "peersync/Network/NetworkProtocol.h"
#include "peersync/Errors.h"
#include <nlohmann/json.hpp>

using namespace PeerSync;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// FrameCodec Tests
// ═══════════════════════════════════════════════════════════

TEST(FrameCodecTest, HeaderLayout) {
    auto frame = FrameCodec::serialize(R"({"type":"ping"})");
    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + 15);

    // Magic в big-endian
    EXPECT_EQ(frame[0], 0x50);
    EXPECT_EQ(frame[1], 0x53);
    EXPECT_EQ(frame[2], 0x59);
    EXPECT_EQ(frame[3], 0x4E);

    // Длина всего кадра
    EXPECT_EQ(frame[4], 0);
    EXPECT_EQ(frame[5], 0);
    EXPECT_EQ(frame[6], 0);
    EXPECT_EQ(frame[7], 23);
}

TEST(FrameCodecTest, IncompleteThenReady) {
    auto frame = FrameCodec::serialize(R"({"type":"hello"})");
    size_t frameSize = 0;

    EXPECT_EQ(FrameCodec::check(frame.data(), 3, frameSize), FrameStatus::Incomplete);
    EXPECT_EQ(FrameCodec::check(frame.data(), 6, frameSize), FrameStatus::Incomplete);
    EXPECT_EQ(FrameCodec::check(frame.data(), frame.size() - 1, frameSize), FrameStatus::Incomplete);
    EXPECT_EQ(FrameCodec::check(frame.data(), frame.size(), frameSize), FrameStatus::Ready);
    EXPECT_EQ(frameSize, frame.size());

    auto text = FrameCodec::deserialize(frame.data(), frame.size());
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, R"({"type":"hello"})");
}

TEST(FrameCodecTest, TwoFramesInOneBuffer) {
    auto first = FrameCodec::serialize("{}");
    auto second = FrameCodec::serialize(R"({"a":1})");
    std::vector<uint8_t> buffer = first;
    buffer.insert(buffer.end(), second.begin(), second.end());

    size_t frameSize = 0;
    ASSERT_EQ(FrameCodec::check(buffer.data(), buffer.size(), frameSize), FrameStatus::Ready);
    EXPECT_EQ(frameSize, first.size());
    EXPECT_EQ(*FrameCodec::deserialize(buffer.data() + frameSize, buffer.size() - frameSize),
              R"({"a":1})");
}

TEST(FrameCodecTest, InvalidMagicOrLength) {
    size_t frameSize = 0;
    std::vector<uint8_t> badMagic = {'G', 'E', 'T', ' ', 0, 0, 0, 8};
    EXPECT_EQ(FrameCodec::check(badMagic.data(), badMagic.size(), frameSize), FrameStatus::Invalid);

    auto tooShort = FrameCodec::serialize("");
    tooShort[7] = 4;
    EXPECT_EQ(FrameCodec::check(tooShort.data(), tooShort.size(), frameSize), FrameStatus::Invalid);

    auto tooLong = FrameCodec::serialize("");
    tooLong[4] = 0x7F;
    EXPECT_EQ(FrameCodec::check(tooLong.data(), tooLong.size(), frameSize), FrameStatus::Invalid);
    EXPECT_FALSE(FrameCodec::deserialize(tooLong.data(), tooLong.size()).has_value());
}

// ═══════════════════════════════════════════════════════════
// parseMessage Tests
// ═══════════════════════════════════════════════════════════

TEST(ParseMessageTest, NotJsonOrNoType) {
    EXPECT_FALSE(parseMessage("not json").has_value());
    EXPECT_FALSE(parseMessage("[1,2,3]").has_value());
    EXPECT_FALSE(parseMessage(R"({"device_id":"x"})").has_value());
    EXPECT_FALSE(parseMessage(R"({"type":42})").has_value());
}

TEST(ParseMessageTest, PairingRequest) {
    auto message = parseMessage(
        R"({"type":"pairing_request","code":"AB12CD","device_id":"p1","device_name":"Pixel","device_type":"android"})");
    ASSERT_TRUE(message.has_value());
    ASSERT_TRUE(std::holds_alternative<PairingRequestMessage>(*message));

    const auto& m = std::get<PairingRequestMessage>(*message);
    EXPECT_EQ(m.request.code, "AB12CD");
    EXPECT_EQ(m.request.deviceId, "p1");
    EXPECT_EQ(m.request.deviceName, "Pixel");
    EXPECT_EQ(m.request.deviceType, "android");
    EXPECT_STREQ(messageTypeName(*message), "pairing_request");
}

TEST(ParseMessageTest, MissingRequiredFieldThrowsValidation) {
    try {
        parseMessage(R"({"type":"pairing_request","code":"AB12CD"})");
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }

    EXPECT_THROW(parseMessage(R"({"type":"clipboard_sync","device_id":"p1"})"), PeerSyncError);
    EXPECT_THROW(parseMessage(R"({"type":"file_transfer_chunk","file_id":"f","chunk_index":"0"})"),
                 PeerSyncError);
    EXPECT_THROW(parseMessage(R"({"type":"admin_request"})"), PeerSyncError);
}

TEST(ParseMessageTest, TransferInitDownload) {
    auto message = parseMessage(R"({
        "type":"file_transfer_init","direction":"download",
        "file_id":"f1","file_name":"a.txt","file_size":10,
        "key":"k","iv":"i","hash":"abc"
    })");
    ASSERT_TRUE(message.has_value());
    const auto& m = std::get<FileTransferInitMessage>(*message);
    EXPECT_EQ(m.direction, TransferDirection::Download);
    EXPECT_EQ(m.descriptor.fileId, "f1");
    EXPECT_EQ(m.descriptor.fileSize, 10);
    EXPECT_EQ(m.descriptor.contentHash, "abc");
    EXPECT_EQ(m.descriptor.chunkSize, DEFAULT_CHUNK_SIZE);
}

TEST(ParseMessageTest, TransferInitUploadAndBadDirection) {
    auto message = parseMessage(
        R"({"type":"file_transfer_init","direction":"upload","file_path":"/tmp/x"})");
    ASSERT_TRUE(message.has_value());
    const auto& m = std::get<FileTransferInitMessage>(*message);
    EXPECT_EQ(m.direction, TransferDirection::Upload);
    EXPECT_EQ(m.filePath, "/tmp/x");

    EXPECT_THROW(parseMessage(R"({"type":"file_transfer_init","direction":"sideways"})"),
                 PeerSyncError);
}

TEST(ParseMessageTest, ChunkWithAndWithoutData) {
    auto request = parseMessage(R"({"type":"file_transfer_chunk","file_id":"f","chunk_index":3})");
    ASSERT_TRUE(request.has_value());
    const auto& r = std::get<FileTransferChunkMessage>(*request);
    EXPECT_FALSE(r.chunkData.has_value());
    EXPECT_EQ(r.chunkIndex, 3);

    auto data = parseMessage(
        R"({"type":"file_transfer_chunk","file_id":"f","chunk_index":0,"chunk_data":"AAAA","final_chunk":true})");
    ASSERT_TRUE(data.has_value());
    const auto& d = std::get<FileTransferChunkMessage>(*data);
    ASSERT_TRUE(d.chunkData.has_value());
    EXPECT_EQ(*d.chunkData, "AAAA");
    EXPECT_TRUE(d.finalChunk);

    // chunk_data без final_chunk
    EXPECT_THROW(parseMessage(
        R"({"type":"file_transfer_chunk","file_id":"f","chunk_index":0,"chunk_data":"AAAA"})"),
        PeerSyncError);
}

TEST(ParseMessageTest, AdminRequestAcceptsTransferId) {
    auto message = parseMessage(
        R"({"type":"admin_request","action":"cancel_transfer","transfer_id":"t1"})");
    ASSERT_TRUE(message.has_value());
    const auto& m = std::get<AdminRequestMessage>(*message);
    EXPECT_EQ(m.action, "cancel_transfer");
    EXPECT_EQ(m.fileId, "t1");
    EXPECT_FALSE(m.value.has_value());
}

TEST(ParseMessageTest, UnknownTypeAndPing) {
    auto unknown = parseMessage(R"({"type":"teleport"})");
    ASSERT_TRUE(unknown.has_value());
    ASSERT_TRUE(std::holds_alternative<UnknownMessage>(*unknown));
    EXPECT_EQ(std::get<UnknownMessage>(*unknown).type, "teleport");

    auto ping = parseMessage(R"({"type":"ping","timestamp":1700000000000})");
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(std::get<PingMessage>(*ping).timestamp, 1700000000000LL);
}

// ═══════════════════════════════════════════════════════════
// Исходящие сообщения
// ═══════════════════════════════════════════════════════════

TEST(MessagesTest, PairingResponseFailureHidesDevice) {
    PairingResult failed;
    failed.errorCode = "INVALID_CODE";
    failed.errorMessage = "Invalid pairing code";

    json j = json::parse(Messages::pairingResponse(failed, "srv", "Desk"));
    EXPECT_EQ(j["type"], "pairing_response");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_code"], "INVALID_CODE");
    EXPECT_FALSE(j.contains("device_id"));
    EXPECT_FALSE(j.contains("server_id"));
}

TEST(MessagesTest, PairingResponseSuccess) {
    PairingResult ok;
    ok.success = true;
    ok.device = PairedDevice{"p1", "Pixel", "android", 100};

    json j = json::parse(Messages::pairingResponse(ok, "srv", "Desk"));
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["device_id"], "p1");
    EXPECT_EQ(j["server_id"], "srv");
    EXPECT_EQ(j["server_name"], "Desk");
}

TEST(MessagesTest, TransferChunkAndAck) {
    ChunkResult chunk;
    chunk.fileId = "f1";
    chunk.chunkIndex = 2;
    chunk.chunkData = "QUJD";
    chunk.finalChunk = true;
    chunk.progress = 100.0;

    json c = json::parse(Messages::transferChunk(chunk));
    EXPECT_EQ(c["type"], "file_transfer_chunk");
    EXPECT_EQ(c["chunk_index"], 2);
    EXPECT_EQ(c["final_chunk"], true);
    EXPECT_FALSE(c.contains("status"));

    ChunkAck ack{"f1", 2, "completed", 150000, 100.0};
    json a = json::parse(Messages::transferAck(ack));
    EXPECT_EQ(a["type"], "file_transfer_ack");
    EXPECT_EQ(a["status"], "completed");
    EXPECT_EQ(a["bytes_received"], 150000);
}

TEST(MessagesTest, StatusUpdateMarksConnectedDevices) {
    Messages::StatusInfo status;
    status.serverId = "srv";
    status.port = 8765;
    status.pairedDevices = {PairedDevice{"p1", "Pixel", "android", 1},
                            PairedDevice{"t1", "Tab", "android", 2}};
    status.connectedDevices = {"t1"};
    status.notificationMirroring = false;

    json j = json::parse(Messages::statusUpdate(status));
    EXPECT_EQ(j["type"], "status_update");
    EXPECT_EQ(j["port"], 8765);
    ASSERT_EQ(j["devices"].size(), 2u);
    EXPECT_EQ(j["devices"][0]["connected"], false);
    EXPECT_EQ(j["devices"][1]["connected"], true);
    EXPECT_EQ(j["settings"]["notification_mirroring"], false);
    EXPECT_TRUE(j["transfers"].is_object());
}

TEST(MessagesTest, AdminResponseMergesExtraFields) {
    json j = json::parse(Messages::adminResponse("get_transfer", true, "", R"({"transfer":{"file_id":"f"}})"));
    EXPECT_EQ(j["type"], "admin_response");
    EXPECT_EQ(j["action"], "get_transfer");
    EXPECT_EQ(j["success"], true);
    EXPECT_FALSE(j.contains("message"));
    EXPECT_EQ(j["transfer"]["file_id"], "f");
}
