// SessionRegistry.h — Реестр соединений и их привязки к устройствам

#pragma once

#include "../export.h"
#include <string>
#include <cstddef>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// MessageSink — куда отправлять сообщения соединения
// ═══════════════════════════════════════════════════════════

class PS_API MessageSink {
public:
    virtual ~MessageSink() = default;

    /// Отправить одно сообщение (JSON-текст)
    /// @return false при ошибке отправки
    virtual bool send(const std::string& text) = 0;
};

/// Запись о соединении, удалённом из реестра
struct PS_API SessionRecord {
    std::string connectionId;
    std::optional<std::string> deviceId;    // Если было привязано
};

// ═══════════════════════════════════════════════════════════
// SessionRegistry — соединение ↔ устройство
// ═══════════════════════════════════════════════════════════

/// Привязанное соединение хранится под device_id, временное — под "temp-<uuid>".
/// Одно соединение никогда не хранится дважды.
class PS_API SessionRegistry {
public:
    using PairedPredicate = std::function<bool(const std::string& deviceId)>;

    explicit SessionRegistry(PairedPredicate isPaired);
    ~SessionRegistry();

    // Запрет копирования
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Зарегистрировать соединение.
    /// Известное сопряжённое устройство привязывается сразу, иначе выдаётся временный id.
    std::string connect(std::shared_ptr<MessageSink> sink,
                        const std::optional<std::string>& deviceId = std::nullopt);

    /// Перепривязать соединение к устройству (после успешного сопряжения)
    /// @return новый connection_id или nullopt если соединения нет
    std::optional<std::string> bind(const std::string& connectionId, const std::string& deviceId);

    /// Снять привязку устройства, соединение остаётся временным
    /// @return новый временный id или nullopt если устройство не подключено
    std::optional<std::string> unbindDevice(const std::string& deviceId);

    /// Удалить соединение (идемпотентно)
    std::optional<SessionRecord> disconnect(const std::string& connectionId);

    /// Удалить соединение по его sink (id мог смениться из другого потока)
    std::optional<SessionRecord> disconnect(const std::shared_ptr<MessageSink>& sink);

    /// Отправить всем, кроме exclude. Ошибки логируются, соединения не удаляются.
    /// @return число успешных отправок
    size_t broadcast(const std::string& text,
                     const std::optional<std::string>& exclude = std::nullopt);

    /// Отправить устройству
    /// @return false если не подключено или отправка не удалась
    bool sendToDevice(const std::string& deviceId, const std::string& text);

    /// Отправить по connection_id
    bool sendTo(const std::string& connectionId, const std::string& text);

    /// Текущий id соединения по его sink
    std::optional<std::string> connectionIdFor(const std::shared_ptr<MessageSink>& sink) const;

    bool isBound(const std::string& connectionId) const;
    std::vector<std::string> connectedDevices() const;
    size_t connectionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
