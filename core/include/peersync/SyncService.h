// SyncService.h — Координатор PeerSync
// Собирает хранилище, сопряжение, передачи, реестр соединений, мониторы и сервер

#pragma once

#include "export.h"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>

namespace PeerSync {

class ClipboardBackend;
class NotificationSource;
class MessageDispatcher;
class DevicePairing;
class TransferManager;
class SessionRegistry;
class Config;

struct PS_API SyncOptions {
    std::string appDir;                         // Пусто — AppStorage::defaultDirectory()
    std::string configPath;                     // Пусто — <appDir>/config.json
    std::optional<uint16_t> port;               // Переопределяет config.json
    bool enableClipboard = true;
    bool enableNotifications = true;

    // Подменяемые источники (по умолчанию xclip и dbus-monitor)
    std::shared_ptr<ClipboardBackend> clipboardBackend;
    std::shared_ptr<NotificationSource> notificationSource;
};

// ═══════════════════════════════════════════════════════════
// SyncService
// ═══════════════════════════════════════════════════════════

class PS_API SyncService {
public:
    /// Состояние сервиса
    enum class State {
        Stopped,
        Running,
        Error
    };

    explicit SyncService(SyncOptions options);
    ~SyncService();

    // Запрет копирования
    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Загрузить конфигурацию и запустить сервер и мониторы
    /// @return true если успешно
    bool start();

    /// Остановить мониторы, сервер и доставку событий
    void stop();

    State getState() const;
    bool isRunning() const;
    std::string getLastError() const;

    // ═══════════════════════════════════════════════════════════
    // Info
    // ═══════════════════════════════════════════════════════════

    uint16_t getPort() const;
    std::string getDeviceId() const;
    std::string getPairingCode() const;

    // ═══════════════════════════════════════════════════════════
    // Компоненты (доступны после start)
    // ═══════════════════════════════════════════════════════════

    std::shared_ptr<MessageDispatcher> dispatcher() const;
    std::shared_ptr<DevicePairing> pairing() const;
    std::shared_ptr<TransferManager> transfers() const;
    std::shared_ptr<SessionRegistry> sessions() const;
    std::shared_ptr<Config> config() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
