// NetworkProtocol.h — Формат кадров и сообщений PeerSync
// Кадр: [Magic:4][Length:4][UTF-8 JSON], тип сообщения задаёт поле "type"

#pragma once

#include "../export.h"
#include "../DevicePairing.h"
#include "../Transfer/TransferManager.h"
#include <string>
#include <cstddef>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// Константы протокола
// ═══════════════════════════════════════════════════════════

constexpr uint32_t PROTOCOL_MAGIC = 0x5053594E;         // "PSYN" in big-endian
constexpr size_t FRAME_HEADER_SIZE = 8;
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;     // 16 MB max
constexpr uint16_t DEFAULT_PORT = 8765;

// ═══════════════════════════════════════════════════════════
// FrameCodec — кадрирование потока
// ═══════════════════════════════════════════════════════════

enum class FrameStatus {
    Incomplete,     // Нужно больше данных
    Ready,          // Полный кадр в буфере
    Invalid         // Неверный magic или длина, поток не восстановить
};

class PS_API FrameCodec {
public:
    /// Упаковать JSON-текст в кадр
    static std::vector<uint8_t> serialize(const std::string& text);

    /// Проверить начало буфера
    /// @param frameSize Полный размер кадра (при Ready)
    static FrameStatus check(const uint8_t* data, size_t available, size_t& frameSize);

    /// Извлечь текст из полного кадра
    /// @return текст или nullopt при ошибке заголовка
    static std::optional<std::string> deserialize(const uint8_t* data, size_t size);
};

// ═══════════════════════════════════════════════════════════
// Входящие сообщения
// ═══════════════════════════════════════════════════════════

/// Первое сообщение соединения (необязательное)
struct HelloMessage {
    std::string deviceId;
};

struct PairingRequestMessage {
    PairingRequest request;
};

struct ClipboardSyncMessage {
    std::string deviceId;
    std::string text;
};

/// Уведомление пересылается остальным соединениям как есть
struct NotificationMessage {
    std::string notificationType;
    std::string message;
};

/// direction — действие получателя кадра:
/// "download" — принять файл по описанию, "upload" — отдать файл filePath
struct FileTransferInitMessage {
    TransferDirection direction = TransferDirection::Download;
    TransferDescriptor descriptor;
    std::string filePath;
};

/// Для отдачи файла chunkData отсутствует (запрос фрагмента)
struct FileTransferChunkMessage {
    std::string fileId;
    int64_t chunkIndex = 0;
    std::optional<std::string> chunkData;
    bool finalChunk = false;
    int64_t chunkSize = DEFAULT_CHUNK_SIZE;
};

struct PingMessage {
    int64_t timestamp = 0;
};

struct AdminRequestMessage {
    std::string action;
    std::string deviceId;
    std::string filePath;
    std::string fileId;         // file_id или transfer_id
    std::string setting;
    std::optional<bool> value;
};

/// Неизвестный type; логируется и отбрасывается
struct UnknownMessage {
    std::string type;
};

using InboundMessage = std::variant<
    HelloMessage,
    PairingRequestMessage,
    ClipboardSyncMessage,
    NotificationMessage,
    FileTransferInitMessage,
    FileTransferChunkMessage,
    PingMessage,
    AdminRequestMessage,
    UnknownMessage>;

/// Разобрать текст сообщения
/// @return nullopt если это не JSON-объект (ProtocolError)
/// @throws PeerSyncError(Validation) если нет обязательных полей
PS_API std::optional<InboundMessage> parseMessage(const std::string& text);

/// Имя типа сообщения (для логов)
PS_API const char* messageTypeName(const InboundMessage& message);

// ═══════════════════════════════════════════════════════════
// Исходящие сообщения (JSON-текст)
// ═══════════════════════════════════════════════════════════

namespace Messages {

PS_API std::string welcome(const std::string& connectionId, bool paired,
                           const std::string& serverId, const std::string& serverName);

PS_API std::string pairingResponse(const PairingResult& result,
                                   const std::string& serverId, const std::string& serverName);

PS_API std::string pong(int64_t timestamp);

PS_API std::string error(const std::string& code, const std::string& message);

PS_API std::string clipboardSync(const std::string& deviceId, const std::string& text);

PS_API std::string notification(const std::string& notificationType, const std::string& message,
                                const std::string& appName, const std::string& summary,
                                const std::string& body, int64_t timestamp);

PS_API std::string deviceConnected(const PairedDevice& device);
PS_API std::string deviceDisconnected(const std::string& deviceId);

PS_API std::string transferInit(const TransferDescriptor& descriptor, TransferDirection direction);
PS_API std::string transferReadyUpload(const TransferDescriptor& descriptor);
PS_API std::string transferReadyDownload(const DownloadTicket& ticket);
PS_API std::string transferChunk(const ChunkResult& chunk);
PS_API std::string transferAck(const ChunkAck& ack);
PS_API std::string transferError(const std::string& fileId, const std::string& code,
                                 const std::string& message);
PS_API std::string transferUpdate(const TransferProgress& progress);

/// Снимок прогресса как JSON-объект
PS_API std::string transferSnapshot(const TransferProgress& progress);

struct PS_API StatusInfo {
    std::string serverId;
    std::string serverName;
    uint16_t port = 0;
    std::vector<PairedDevice> pairedDevices;
    std::vector<std::string> connectedDevices;
    std::vector<TransferProgress> transfers;
    bool clipboardSync = true;
    bool notificationMirroring = true;
    bool autoReconnect = true;
};

PS_API std::string statusUpdate(const StatusInfo& status);
PS_API std::string deviceList(const std::vector<PairedDevice>& devices,
                              const std::vector<std::string>& connected);

/// admin_response с произвольными дополнительными полями (JSON-объект или пусто)
PS_API std::string adminResponse(const std::string& action, bool success,
                                 const std::string& message,
                                 const std::string& extraJson = "");

} // namespace Messages

} // namespace PeerSync
