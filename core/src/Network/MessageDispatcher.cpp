// MessageDispatcher.cpp — Обработчики входящих сообщений

#include "peersync/Network/MessageDispatcher.h"
#include "peersync/DevicePairing.h"
#include "peersync/Transfer/TransferManager.h"
#include "peersync/Clipboard/ClipboardMonitor.h"
#include "peersync/Config.h"
#include "peersync/Errors.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>

namespace PeerSync {

using json = nlohmann::json;

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

json transferJson(const TransferProgress& progress) {
    return json::parse(Messages::transferSnapshot(progress));
}

} // namespace

// ═══════════════════════════════════════════════════════════
// MessageDispatcher::Impl
// ═══════════════════════════════════════════════════════════

class MessageDispatcher::Impl {
public:
    explicit Impl(Services services) : m_services(std::move(services)) {
        if (!m_services.sessions || !m_services.pairing || !m_services.transfers || !m_services.config) {
            throw std::invalid_argument("MessageDispatcher: sessions, pairing, transfers and config are required");
        }
    }

    std::string open(const ConnectionContext& ctx, const std::string& firstFrame) {
        std::optional<InboundMessage> message;
        try {
            message = parseMessage(firstFrame);
        } catch (const PeerSyncError& e) {
            std::string id = m_services.sessions->connect(ctx.sink);
            replyError(ctx, e);
            return id;
        }

        if (message) {
            if (auto* hello = std::get_if<HelloMessage>(&*message)) {
                std::optional<std::string> deviceId;
                if (!hello->deviceId.empty()) {
                    deviceId = hello->deviceId;
                }
                std::string id = m_services.sessions->connect(ctx.sink, deviceId);
                reply(ctx, Messages::welcome(id, m_services.sessions->isBound(id),
                                             m_services.pairing->getDeviceId(),
                                             m_services.pairing->getDeviceName()));
                return id;
            }
        }

        std::string id = m_services.sessions->connect(ctx.sink);
        if (message) {
            dispatch(ctx, firstFrame, *message);
        }
        return id;
    }

    void handle(const ConnectionContext& ctx, const std::string& text) {
        std::optional<InboundMessage> message;
        try {
            message = parseMessage(text);
        } catch (const PeerSyncError& e) {
            replyError(ctx, e);
            return;
        }

        // ProtocolError: уже залогировано, ответа нет
        if (!message) {
            return;
        }
        dispatch(ctx, text, *message);
    }

    void close(const ConnectionContext& ctx) {
        auto record = m_services.sessions->disconnect(ctx.sink);
        if (record && record->deviceId) {
            spdlog::info("MessageDispatcher: Device {} disconnected", *record->deviceId);
            publish(OutboundEvent{Messages::deviceDisconnected(*record->deviceId), std::nullopt, std::nullopt});
        }
    }

    TransferDescriptor sendFile(const std::string& filePath, const std::string& deviceId) {
        if (deviceId.empty()) {
            throw PeerSyncError(ErrorKind::Validation, "Missing field: device_id");
        }
        if (!m_services.sessions->isBound(deviceId)) {
            throw PeerSyncError(ErrorKind::Validation, "Device not connected: " + deviceId);
        }

        TransferDescriptor descriptor = m_services.transfers->prepareUpload(filePath, deviceId);
        watchTransfer(descriptor.fileId);

        // Получатель принимает файл: для него это download
        if (!m_services.sessions->sendToDevice(
                deviceId, Messages::transferInit(descriptor, TransferDirection::Download))) {
            m_services.transfers->cancel(descriptor.fileId);
            throw PeerSyncError(ErrorKind::IO, "Failed to send transfer offer to " + deviceId);
        }

        spdlog::info("MessageDispatcher: Offered {} ({} bytes) to {}",
                     descriptor.fileName, descriptor.fileSize, deviceId);
        return descriptor;
    }

    void publish(OutboundEvent event) {
        if (m_services.events && m_services.events->publish(event)) {
            return;
        }
        deliver(event);
    }

    Messages::StatusInfo statusInfo() const {
        Settings settings = m_services.config->get();

        Messages::StatusInfo status;
        status.serverId = m_services.pairing->getDeviceId();
        status.serverName = m_services.pairing->getDeviceName();
        status.port = m_services.port;
        status.pairedDevices = m_services.pairing->getPairedDevices();
        status.connectedDevices = m_services.sessions->connectedDevices();
        status.transfers = m_services.transfers->getAllTransfers();
        status.clipboardSync = settings.clipboardSync;
        status.notificationMirroring = settings.notificationMirroring;
        status.autoReconnect = settings.autoReconnect;
        return status;
    }

    /// Доставка события (из потока EventBridge или напрямую)
    void deliver(const OutboundEvent& event) {
        if (event.targetDevice) {
            m_services.sessions->sendToDevice(*event.targetDevice, event.text);
        } else {
            m_services.sessions->broadcast(event.text, event.exclude);
        }
    }

private:
    // ═══════════════════════════════════════════════════════════
    // Dispatch
    // ═══════════════════════════════════════════════════════════

    void dispatch(const ConnectionContext& ctx, const std::string& text, const InboundMessage& message) {
        const std::string connectionId = currentId(ctx);
        spdlog::debug("MessageDispatcher: {} from {}", messageTypeName(message), connectionId);

        try {
            std::visit([&](const auto& m) { on(ctx, connectionId, text, m); }, message);
        } catch (const PeerSyncError& e) {
            replyError(ctx, e);
        } catch (const std::exception& e) {
            spdlog::error("MessageDispatcher: Error handling {} from {}: {}",
                          messageTypeName(message), connectionId, e.what());
            reply(ctx, Messages::error("INTERNAL_ERROR", "Internal error"));
        }
    }

    void on(const ConnectionContext& ctx, const std::string& connectionId,
            const std::string&, const HelloMessage& m) {
        // Повторный hello: привязать, если устройство уже сопряжено
        std::string id = connectionId;
        if (!m.deviceId.empty() && !m_services.sessions->isBound(connectionId) &&
            m_services.pairing->isPaired(m.deviceId)) {
            if (auto bound = m_services.sessions->bind(connectionId, m.deviceId)) {
                id = *bound;
            }
        }
        reply(ctx, Messages::welcome(id, m_services.sessions->isBound(id),
                                     m_services.pairing->getDeviceId(),
                                     m_services.pairing->getDeviceName()));
    }

    void on(const ConnectionContext& ctx, const std::string& connectionId,
            const std::string&, const PairingRequestMessage& m) {
        PairingResult result = m_services.pairing->validate(m.request);

        std::string id = connectionId;
        if (result.success && result.device) {
            if (auto bound = m_services.sessions->bind(connectionId, result.device->deviceId)) {
                id = *bound;
            }
        }

        reply(ctx, Messages::pairingResponse(result, m_services.pairing->getDeviceId(),
                                             m_services.pairing->getDeviceName()));

        if (result.success && result.device) {
            publish(OutboundEvent{Messages::deviceConnected(*result.device), id, std::nullopt});
        }
    }

    void on(const ConnectionContext& ctx, const std::string& connectionId,
            const std::string&, const ClipboardSyncMessage& m) {
        if (!m_services.config->get().clipboardSync) {
            spdlog::debug("MessageDispatcher: Clipboard sync disabled, ignoring update");
            return;
        }

        if (!m_services.pairing->isPaired(m.deviceId)) {
            spdlog::warn("MessageDispatcher: Clipboard update from unpaired device {}", m.deviceId);
            throw PeerSyncError(ErrorKind::Auth, "Device is not paired");
        }
        if (!m_services.sessions->isBound(connectionId)) {
            spdlog::warn("MessageDispatcher: Clipboard update for {} from unbound connection {}",
                         m.deviceId, connectionId);
            throw PeerSyncError(ErrorKind::Auth, "Pairing required for clipboard sync");
        }

        if (m_services.clipboard) {
            if (!m_services.clipboard->applyRemote(m.text)) {
                spdlog::error("MessageDispatcher: Failed to set local clipboard");
            }
        }

        publish(OutboundEvent{Messages::clipboardSync(m.deviceId, m.text), connectionId, std::nullopt});
    }

    void on(const ConnectionContext&, const std::string& connectionId,
            const std::string& text, const NotificationMessage& m) {
        if (!m_services.config->get().notificationMirroring) {
            spdlog::debug("MessageDispatcher: Notification mirroring disabled, dropping {}",
                          m.notificationType);
            return;
        }
        // Пересылается исходный кадр
        publish(OutboundEvent{text, connectionId, std::nullopt});
    }

    void on(const ConnectionContext& ctx, const std::string& connectionId,
            const std::string&, const FileTransferInitMessage& m) {
        if (!m_services.sessions->isBound(connectionId) && !ctx.isLoopback) {
            throw PeerSyncError(ErrorKind::Auth, "Pairing required for file transfer");
        }

        const std::string deviceId = deviceIdOf(connectionId);

        if (m.direction == TransferDirection::Download) {
            DownloadTicket ticket = m_services.transfers->prepareDownload(m.descriptor, deviceId);
            watchTransfer(ticket.fileId);
            reply(ctx, Messages::transferReadyDownload(ticket));
        } else {
            // Отправка по пути на диске: только для локального интерфейса
            if (!ctx.isLoopback) {
                spdlog::warn("MessageDispatcher: Rejected upload of local path from {}", connectionId);
                throw PeerSyncError(ErrorKind::Auth, "Upload by path is accepted only from this host");
            }
            TransferDescriptor descriptor = m_services.transfers->prepareUpload(m.filePath, deviceId);
            watchTransfer(descriptor.fileId);
            reply(ctx, Messages::transferReadyUpload(descriptor));
        }
    }

    void on(const ConnectionContext& ctx, const std::string&,
            const std::string&, const FileTransferChunkMessage& m) {
        auto progress = m_services.transfers->getProgress(m.fileId);
        if (!progress) {
            reply(ctx, Messages::transferError(m.fileId, errorKindCode(ErrorKind::Validation),
                                               "Unknown transfer: " + m.fileId));
            return;
        }

        try {
            if (progress->direction == TransferDirection::Download) {
                if (!m.chunkData) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: chunk_data");
                }
                ChunkAck ack = m_services.transfers->writeChunk(
                    m.fileId, *m.chunkData, m.chunkIndex, m.finalChunk);
                reply(ctx, Messages::transferAck(ack));
            } else {
                ChunkResult chunk = m_services.transfers->readChunk(m.fileId, m.chunkIndex, m.chunkSize);
                reply(ctx, Messages::transferChunk(chunk));
            }
        } catch (const PeerSyncError& e) {
            spdlog::error("MessageDispatcher: Chunk {} of {} failed: {}", m.chunkIndex, m.fileId, e.what());
            reply(ctx, Messages::transferError(m.fileId, errorKindCode(e.kind()), e.what()));

            // Сбой мог перевести передачу в failed: сообщить наблюдателям
            if (auto after = m_services.transfers->getProgress(m.fileId)) {
                if (after->status == TransferStatus::Failed) {
                    publish(OutboundEvent{Messages::transferUpdate(*after), std::nullopt, std::nullopt});
                }
            }
        }
    }

    void on(const ConnectionContext& ctx, const std::string&,
            const std::string&, const PingMessage& m) {
        reply(ctx, Messages::pong(m.timestamp != 0 ? m.timestamp : nowMillis()));
    }

    void on(const ConnectionContext& ctx, const std::string& connectionId,
            const std::string&, const AdminRequestMessage& m) {
        if (m_services.config->get().adminLoopbackOnly && !ctx.isLoopback) {
            spdlog::warn("MessageDispatcher: Rejected admin request '{}' from {}", m.action, connectionId);
            throw PeerSyncError(ErrorKind::Auth, "Admin requests are accepted only from this host");
        }
        reply(ctx, handleAdmin(m));
    }

    void on(const ConnectionContext&, const std::string& connectionId,
            const std::string&, const UnknownMessage& m) {
        spdlog::warn("MessageDispatcher: Dropping unknown message type '{}' from {}", m.type, connectionId);
    }

    // ═══════════════════════════════════════════════════════════
    // Admin
    // ═══════════════════════════════════════════════════════════

    std::string handleAdmin(const AdminRequestMessage& m) {
        try {
            if (m.action == "get_status") {
                return Messages::statusUpdate(statusInfo());
            }

            if (m.action == "get_devices") {
                return Messages::deviceList(m_services.pairing->getPairedDevices(),
                                            m_services.sessions->connectedDevices());
            }

            if (m.action == "send_file") {
                if (m.filePath.empty()) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: file_path");
                }
                TransferDescriptor descriptor = sendFile(m.filePath, m.deviceId);
                json extra = {{"file_id", descriptor.fileId}};
                if (auto progress = m_services.transfers->getProgress(descriptor.fileId)) {
                    extra["transfer"] = transferJson(*progress);
                }
                return Messages::adminResponse(m.action, true, "File transfer started", extra.dump());
            }

            if (m.action == "unpair_device") {
                if (m.deviceId.empty()) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: device_id");
                }
                if (!m_services.pairing->unpair(m.deviceId)) {
                    return Messages::adminResponse(m.action, false, "Device not paired",
                                                   json{{"device_id", m.deviceId}}.dump());
                }
                m_services.sessions->unbindDevice(m.deviceId);
                return Messages::adminResponse(m.action, true, "Device unpaired",
                                               json{{"device_id", m.deviceId}}.dump());
            }

            if (m.action == "cancel_transfer") {
                if (m.fileId.empty()) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: file_id");
                }
                bool canceled = m_services.transfers->cancel(m.fileId);
                return Messages::adminResponse(m.action, canceled,
                                               canceled ? "Transfer canceled" : "Transfer already finished",
                                               json{{"file_id", m.fileId}}.dump());
            }

            if (m.action == "set_setting") {
                if (m.setting.empty() || !m.value) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: setting or value");
                }
                m_services.config->setSetting(m.setting, *m.value);
                return Messages::adminResponse(m.action, true, "",
                                               json{{"setting", m.setting}, {"value", *m.value}}.dump());
            }

            if (m.action == "get_transfer") {
                if (m.fileId.empty()) {
                    throw PeerSyncError(ErrorKind::Validation, "Missing field: file_id");
                }
                auto progress = m_services.transfers->getProgress(m.fileId);
                if (!progress) {
                    throw PeerSyncError(ErrorKind::NotFound, "Unknown transfer: " + m.fileId);
                }
                return Messages::adminResponse(m.action, true, "",
                                               json{{"transfer", transferJson(*progress)}}.dump());
            }

            if (m.action == "get_all_transfers") {
                json list = json::array();
                for (const auto& progress : m_services.transfers->getAllTransfers()) {
                    list.push_back(transferJson(progress));
                }
                return Messages::adminResponse(m.action, true, "", json{{"transfers", list}}.dump());
            }
        } catch (const PeerSyncError& e) {
            spdlog::warn("MessageDispatcher: Admin action '{}' failed: {}", m.action, e.what());
            return Messages::adminResponse(m.action, false, e.what(),
                                           json{{"error_code", errorKindCode(e.kind())}}.dump());
        }

        spdlog::warn("MessageDispatcher: Unknown admin action '{}'", m.action);
        return Messages::adminResponse(m.action, false, "Unknown action");
    }

    // ═══════════════════════════════════════════════════════════
    // Helpers
    // ═══════════════════════════════════════════════════════════

    /// Прогресс передачи рассылается как transfer_update
    void watchTransfer(const std::string& fileId) {
        std::weak_ptr<SessionRegistry> sessions = m_services.sessions;
        std::weak_ptr<EventBridge> events = m_services.events;

        m_services.transfers->registerCallback(fileId,
            [sessions, events](const TransferProgress& progress) {
                OutboundEvent event{Messages::transferUpdate(progress), std::nullopt, std::nullopt};
                if (auto bridge = events.lock()) {
                    if (bridge->publish(event)) {
                        return;
                    }
                }
                if (auto registry = sessions.lock()) {
                    registry->broadcast(event.text);
                }
            });
    }

    std::string currentId(const ConnectionContext& ctx) const {
        return m_services.sessions->connectionIdFor(ctx.sink).value_or("");
    }

    /// Привязанное соединение хранится под device_id
    std::string deviceIdOf(const std::string& connectionId) const {
        return m_services.sessions->isBound(connectionId) ? connectionId : std::string();
    }

    void reply(const ConnectionContext& ctx, const std::string& text) {
        if (!ctx.sink->send(text)) {
            spdlog::error("MessageDispatcher: Failed to send reply");
        }
    }

    void replyError(const ConnectionContext& ctx, const PeerSyncError& e) {
        if (e.kind() == ErrorKind::Protocol) {
            spdlog::warn("MessageDispatcher: Protocol error: {}", e.what());
            return;
        }
        spdlog::warn("MessageDispatcher: {}: {}", errorKindCode(e.kind()), e.what());
        reply(ctx, Messages::error(errorKindCode(e.kind()), e.what()));
    }

    Services m_services;
};

// ═══════════════════════════════════════════════════════════
// MessageDispatcher Public Interface
// ═══════════════════════════════════════════════════════════

MessageDispatcher::MessageDispatcher(Services services)
    : m_impl(std::make_unique<Impl>(std::move(services))) {}

MessageDispatcher::~MessageDispatcher() = default;

std::string MessageDispatcher::open(const ConnectionContext& context, const std::string& firstFrame) {
    return m_impl->open(context, firstFrame);
}

void MessageDispatcher::handle(const ConnectionContext& context, const std::string& text) {
    m_impl->handle(context, text);
}

void MessageDispatcher::close(const ConnectionContext& context) {
    m_impl->close(context);
}

TransferDescriptor MessageDispatcher::sendFile(const std::string& filePath, const std::string& deviceId) {
    return m_impl->sendFile(filePath, deviceId);
}

void MessageDispatcher::publish(OutboundEvent event) {
    m_impl->publish(std::move(event));
}

Messages::StatusInfo MessageDispatcher::statusInfo() const {
    return m_impl->statusInfo();
}

} // namespace PeerSync
