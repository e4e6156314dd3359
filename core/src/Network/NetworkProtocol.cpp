// NetworkProtocol.cpp — Кадры, разбор входящих и сборка исходящих сообщений

#include "peersync/Network/NetworkProtocol.h"
#include "peersync/Errors.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <algorithm>

namespace PeerSync {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// FrameCodec
// ═══════════════════════════════════════════════════════════

static uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

static void writeU32(uint8_t* p, uint32_t v) {
    p[0] = (v >> 24) & 0xFF;
    p[1] = (v >> 16) & 0xFF;
    p[2] = (v >> 8) & 0xFF;
    p[3] = v & 0xFF;
}

std::vector<uint8_t> FrameCodec::serialize(const std::string& text) {
    // Header: Magic(4) + Length(4), Length — размер всего кадра
    size_t totalSize = FRAME_HEADER_SIZE + text.size();

    std::vector<uint8_t> result(totalSize);
    writeU32(result.data(), PROTOCOL_MAGIC);
    writeU32(result.data() + 4, static_cast<uint32_t>(totalSize));
    if (!text.empty()) {
        memcpy(result.data() + FRAME_HEADER_SIZE, text.data(), text.size());
    }
    return result;
}

FrameStatus FrameCodec::check(const uint8_t* data, size_t available, size_t& frameSize) {
    frameSize = 0;
    if (available < 4) {
        return FrameStatus::Incomplete;
    }

    uint32_t magic = readU32(data);
    if (magic != PROTOCOL_MAGIC) {
        spdlog::debug("Protocol: Invalid magic 0x{:08X}", magic);
        return FrameStatus::Invalid;
    }

    if (available < FRAME_HEADER_SIZE) {
        return FrameStatus::Incomplete;
    }

    uint32_t len = readU32(data + 4);
    if (len < FRAME_HEADER_SIZE || len > MAX_FRAME_SIZE) {
        spdlog::debug("Protocol: Invalid length {}", len);
        return FrameStatus::Invalid;
    }

    if (available < len) {
        return FrameStatus::Incomplete;
    }

    frameSize = len;
    return FrameStatus::Ready;
}

std::optional<std::string> FrameCodec::deserialize(const uint8_t* data, size_t size) {
    size_t frameSize = 0;
    if (check(data, size, frameSize) != FrameStatus::Ready) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(data + FRAME_HEADER_SIZE),
                       frameSize - FRAME_HEADER_SIZE);
}

// ═══════════════════════════════════════════════════════════
// Разбор входящих сообщений
// ═══════════════════════════════════════════════════════════

namespace {

std::string requireString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        throw PeerSyncError(ErrorKind::Validation, std::string("Missing field: ") + field);
    }
    return it->get<std::string>();
}

int64_t requireInt(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number_integer()) {
        throw PeerSyncError(ErrorKind::Validation, std::string("Missing field: ") + field);
    }
    return it->get<int64_t>();
}

std::string optionalString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

TransferDescriptor parseDescriptor(const json& j) {
    TransferDescriptor d;
    d.fileId = requireString(j, "file_id");
    d.fileName = requireString(j, "file_name");
    d.fileSize = requireInt(j, "file_size");
    d.key = requireString(j, "key");
    d.iv = requireString(j, "iv");
    d.contentHash = optionalString(j, "content_hash");
    if (d.contentHash.empty()) {
        d.contentHash = optionalString(j, "hash");
    }
    auto it = j.find("chunk_size");
    if (it != j.end() && it->is_number_integer()) {
        d.chunkSize = it->get<int64_t>();
    }
    return d;
}

} // namespace

std::optional<InboundMessage> parseMessage(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::warn("Protocol: Unparseable frame: {}", e.what());
        return std::nullopt;
    }

    if (!j.is_object()) {
        spdlog::warn("Protocol: Frame is not an object");
        return std::nullopt;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        spdlog::warn("Protocol: Frame without type");
        return std::nullopt;
    }
    const std::string type = typeIt->get<std::string>();

    if (type == "hello") {
        HelloMessage m;
        m.deviceId = optionalString(j, "device_id");
        return m;
    }

    if (type == "pairing_request") {
        PairingRequestMessage m;
        m.request.code = requireString(j, "code");
        m.request.deviceId = requireString(j, "device_id");
        m.request.deviceName = requireString(j, "device_name");
        m.request.deviceType = requireString(j, "device_type");
        return m;
    }

    if (type == "clipboard_sync") {
        ClipboardSyncMessage m;
        m.deviceId = requireString(j, "device_id");
        m.text = requireString(j, "text");
        return m;
    }

    if (type == "notification") {
        NotificationMessage m;
        m.notificationType = requireString(j, "notification_type");
        m.message = requireString(j, "message");
        return m;
    }

    if (type == "file_transfer_init") {
        FileTransferInitMessage m;
        std::string direction = requireString(j, "direction");
        if (!transferDirectionFromString(direction, m.direction)) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid direction: " + direction);
        }
        if (m.direction == TransferDirection::Download) {
            m.descriptor = parseDescriptor(j);
        } else {
            m.filePath = requireString(j, "file_path");
        }
        return m;
    }

    if (type == "file_transfer_chunk") {
        FileTransferChunkMessage m;
        m.fileId = requireString(j, "file_id");
        m.chunkIndex = requireInt(j, "chunk_index");
        auto dataIt = j.find("chunk_data");
        if (dataIt != j.end() && dataIt->is_string()) {
            m.chunkData = dataIt->get<std::string>();
            auto finalIt = j.find("final_chunk");
            if (finalIt == j.end() || !finalIt->is_boolean()) {
                throw PeerSyncError(ErrorKind::Validation, "Missing field: final_chunk");
            }
            m.finalChunk = finalIt->get<bool>();
        }
        auto sizeIt = j.find("chunk_size");
        if (sizeIt != j.end() && sizeIt->is_number_integer()) {
            m.chunkSize = sizeIt->get<int64_t>();
        }
        return m;
    }

    if (type == "ping") {
        PingMessage m;
        auto it = j.find("timestamp");
        if (it != j.end() && it->is_number()) {
            m.timestamp = it->get<int64_t>();
        }
        return m;
    }

    if (type == "admin_request") {
        AdminRequestMessage m;
        m.action = requireString(j, "action");
        m.deviceId = optionalString(j, "device_id");
        m.filePath = optionalString(j, "file_path");
        m.fileId = optionalString(j, "file_id");
        if (m.fileId.empty()) {
            m.fileId = optionalString(j, "transfer_id");
        }
        m.setting = optionalString(j, "setting");
        auto it = j.find("value");
        if (it != j.end() && it->is_boolean()) {
            m.value = it->get<bool>();
        }
        return m;
    }

    return UnknownMessage{type};
}

const char* messageTypeName(const InboundMessage& message) {
    struct Visitor {
        const char* operator()(const HelloMessage&) const { return "hello"; }
        const char* operator()(const PairingRequestMessage&) const { return "pairing_request"; }
        const char* operator()(const ClipboardSyncMessage&) const { return "clipboard_sync"; }
        const char* operator()(const NotificationMessage&) const { return "notification"; }
        const char* operator()(const FileTransferInitMessage&) const { return "file_transfer_init"; }
        const char* operator()(const FileTransferChunkMessage&) const { return "file_transfer_chunk"; }
        const char* operator()(const PingMessage&) const { return "ping"; }
        const char* operator()(const AdminRequestMessage&) const { return "admin_request"; }
        const char* operator()(const UnknownMessage&) const { return "unknown"; }
    };
    return std::visit(Visitor{}, message);
}

// ═══════════════════════════════════════════════════════════
// Исходящие сообщения
// ═══════════════════════════════════════════════════════════

namespace Messages {

namespace {

json deviceJson(const PairedDevice& device) {
    return {
        {"device_id", device.deviceId},
        {"name", device.name},
        {"type", device.type},
        {"paired_at", device.pairedAt}
    };
}

json snapshotJson(const TransferProgress& p) {
    return {
        {"file_id", p.fileId},
        {"file_name", p.fileName},
        {"direction", transferDirectionToString(p.direction)},
        {"status", transferStatusToString(p.status)},
        {"progress", p.progress},
        {"bytes_transferred", p.bytesTransferred},
        {"total_bytes", p.totalBytes},
        {"speed_bps", p.speedBps},
        {"eta_seconds", p.etaSeconds}
    };
}

json descriptorJson(const TransferDescriptor& d) {
    return {
        {"file_id", d.fileId},
        {"file_name", d.fileName},
        {"file_size", d.fileSize},
        {"key", d.key},
        {"iv", d.iv},
        {"content_hash", d.contentHash},
        {"chunk_size", d.chunkSize}
    };
}

} // namespace

std::string welcome(const std::string& connectionId, bool paired,
                    const std::string& serverId, const std::string& serverName) {
    json j = {
        {"type", "welcome"},
        {"connection_id", connectionId},
        {"paired", paired},
        {"server_id", serverId},
        {"server_name", serverName}
    };
    return j.dump();
}

std::string pairingResponse(const PairingResult& result,
                            const std::string& serverId, const std::string& serverName) {
    json j = {
        {"type", "pairing_response"},
        {"success", result.success}
    };
    if (result.success && result.device) {
        j["device_id"] = result.device->deviceId;
        j["device_name"] = result.device->name;
        j["server_id"] = serverId;
        j["server_name"] = serverName;
    } else {
        j["error"] = result.errorMessage;
        j["error_code"] = result.errorCode;
    }
    return j.dump();
}

std::string pong(int64_t timestamp) {
    json j = {{"type", "pong"}, {"timestamp", timestamp}};
    return j.dump();
}

std::string error(const std::string& code, const std::string& message) {
    json j = {{"type", "error"}, {"code", code}, {"message", message}};
    return j.dump();
}

std::string clipboardSync(const std::string& deviceId, const std::string& text) {
    json j = {{"type", "clipboard_sync"}, {"device_id", deviceId}, {"text", text}};
    return j.dump();
}

std::string notification(const std::string& notificationType, const std::string& message,
                         const std::string& appName, const std::string& summary,
                         const std::string& body, int64_t timestamp) {
    json j = {
        {"type", "notification"},
        {"notification_type", notificationType},
        {"message", message},
        {"app_name", appName},
        {"summary", summary},
        {"body", body},
        {"timestamp", timestamp}
    };
    return j.dump();
}

std::string deviceConnected(const PairedDevice& device) {
    json j = {{"type", "device_connected"}, {"device", deviceJson(device)}};
    return j.dump();
}

std::string deviceDisconnected(const std::string& deviceId) {
    json j = {{"type", "device_disconnected"}, {"device_id", deviceId}};
    return j.dump();
}

std::string transferInit(const TransferDescriptor& descriptor, TransferDirection direction) {
    json j = descriptorJson(descriptor);
    j["type"] = "file_transfer_init";
    j["direction"] = transferDirectionToString(direction);
    return j.dump();
}

std::string transferReadyUpload(const TransferDescriptor& descriptor) {
    json j = descriptorJson(descriptor);
    j["type"] = "file_transfer_ready";
    j["direction"] = "upload";
    j["status"] = "ready";
    return j.dump();
}

std::string transferReadyDownload(const DownloadTicket& ticket) {
    json j = {
        {"type", "file_transfer_ready"},
        {"direction", "download"},
        {"file_id", ticket.fileId},
        {"save_path", ticket.savePath},
        {"status", ticket.status}
    };
    return j.dump();
}

std::string transferChunk(const ChunkResult& chunk) {
    json j = {
        {"type", "file_transfer_chunk"},
        {"file_id", chunk.fileId},
        {"chunk_index", chunk.chunkIndex},
        {"chunk_data", chunk.chunkData},
        {"final_chunk", chunk.finalChunk},
        {"progress", chunk.progress}
    };
    if (chunk.chunkData.empty() && chunk.finalChunk) {
        j["status"] = transferStatusToString(chunk.status);
    }
    return j.dump();
}

std::string transferAck(const ChunkAck& ack) {
    json j = {
        {"type", "file_transfer_ack"},
        {"file_id", ack.fileId},
        {"chunk_index", ack.chunkIndex},
        {"status", ack.status},
        {"bytes_received", ack.bytesReceived},
        {"progress", ack.progress}
    };
    return j.dump();
}

std::string transferError(const std::string& fileId, const std::string& code,
                          const std::string& message) {
    json j = {
        {"type", "file_transfer_error"},
        {"file_id", fileId},
        {"code", code},
        {"message", message}
    };
    return j.dump();
}

std::string transferUpdate(const TransferProgress& progress) {
    json j = {{"type", "transfer_update"}, {"transfer", snapshotJson(progress)}};
    return j.dump();
}

std::string transferSnapshot(const TransferProgress& progress) {
    return snapshotJson(progress).dump();
}

std::string statusUpdate(const StatusInfo& status) {
    json devices = json::array();
    for (const auto& device : status.pairedDevices) {
        json d = deviceJson(device);
        d["connected"] = std::find(status.connectedDevices.begin(), status.connectedDevices.end(),
                                   device.deviceId) != status.connectedDevices.end();
        devices.push_back(d);
    }

    json transfers = json::object();
    for (const auto& t : status.transfers) {
        transfers[t.fileId] = snapshotJson(t);
    }

    json j = {
        {"type", "status_update"},
        {"server_id", status.serverId},
        {"server_name", status.serverName},
        {"port", status.port},
        {"devices", devices},
        {"transfers", transfers},
        {"settings", {
            {"clipboard_sync", status.clipboardSync},
            {"notification_mirroring", status.notificationMirroring},
            {"auto_reconnect", status.autoReconnect}
        }}
    };
    return j.dump();
}

std::string deviceList(const std::vector<PairedDevice>& devices,
                       const std::vector<std::string>& connected) {
    json list = json::array();
    for (const auto& device : devices) {
        json d = deviceJson(device);
        d["connected"] = std::find(connected.begin(), connected.end(), device.deviceId) != connected.end();
        list.push_back(d);
    }
    json j = {{"type", "device_list"}, {"devices", list}};
    return j.dump();
}

std::string adminResponse(const std::string& action, bool success,
                          const std::string& message, const std::string& extraJson) {
    json j = {
        {"type", "admin_response"},
        {"action", action},
        {"success", success}
    };
    if (!message.empty()) {
        j["message"] = message;
    }
    if (!extraJson.empty()) {
        json extra = json::parse(extraJson);
        for (auto& [key, value] : extra.items()) {
            j[key] = value;
        }
    }
    return j.dump();
}

} // namespace Messages

} // namespace PeerSync
