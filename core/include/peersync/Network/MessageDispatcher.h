// MessageDispatcher.h — Разбор входящих сообщений и маршрутизация по типу

#pragma once

#include "../export.h"
#include "NetworkProtocol.h"
#include "SessionRegistry.h"
#include "EventBridge.h"
#include <string>
#include <memory>

namespace PeerSync {

class DevicePairing;
class TransferManager;
class Config;
class ClipboardMonitor;

/// Соединение, от которого пришёл кадр.
/// connection_id не хранится: он меняется при сопряжении и берётся из реестра по sink.
struct PS_API ConnectionContext {
    std::shared_ptr<MessageSink> sink;
    bool isLoopback = false;
};

// ═══════════════════════════════════════════════════════════
// MessageDispatcher
// ═══════════════════════════════════════════════════════════

/// Кадры одного соединения обрабатываются последовательно в потоке соединения.
/// Разные соединения вызывают диспетчер параллельно; общее состояние
/// защищено замками самих реестров.
class PS_API MessageDispatcher {
public:
    struct Services {
        std::shared_ptr<SessionRegistry> sessions;
        std::shared_ptr<DevicePairing> pairing;
        std::shared_ptr<TransferManager> transfers;
        std::shared_ptr<Config> config;
        std::shared_ptr<ClipboardMonitor> clipboard;    // nullptr — буфер обмена отключён
        std::shared_ptr<EventBridge> events;            // nullptr — рассылка напрямую
        uint16_t port = DEFAULT_PORT;
    };

    explicit MessageDispatcher(Services services);
    ~MessageDispatcher();

    // Запрет копирования
    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    /// Первый кадр соединения: регистрирует соединение в реестре.
    /// hello с device_id сопряжённого устройства привязывает соединение сразу,
    /// любой другой кадр регистрирует временное соединение и обрабатывается обычно.
    /// @return connection_id
    std::string open(const ConnectionContext& context, const std::string& firstFrame);

    /// Обработать кадр зарегистрированного соединения
    void handle(const ConnectionContext& context, const std::string& text);

    /// Соединение закрыто. Для привязанного рассылается device_disconnected.
    void close(const ConnectionContext& context);

    /// Начать отправку файла устройству (file_transfer_init с direction "download")
    /// @throws PeerSyncError (NotFound/Validation/IO)
    TransferDescriptor sendFile(const std::string& filePath, const std::string& deviceId);

    /// Разослать событие через EventBridge (или напрямую, если его нет)
    void publish(OutboundEvent event);

    /// Текущее состояние для status_update
    Messages::StatusInfo statusInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
