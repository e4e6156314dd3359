// PeerConnection.h — TCP соединение с кадрированием PSYN

#pragma once

#include "../export.h"
#include "SessionRegistry.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// PeerConnection — одно TCP соединение
// ═══════════════════════════════════════════════════════════

/// Отправка потокобезопасна (из потока соединения, EventBridge и обработчиков
/// других соединений). Приём выполняет только владелец соединения.
class PS_API PeerConnection : public MessageSink {
public:
    /// Обернуть принятый сокет
    PeerConnection(intptr_t socket, std::string remoteAddress);
    ~PeerConnection() override;

    // Запрет копирования
    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    /// Подключиться к серверу
    /// @return nullptr при ошибке
    static std::shared_ptr<PeerConnection> connectTo(const std::string& host, uint16_t port);

    /// Отправить JSON-текст одним кадром
    bool send(const std::string& text) override;

    /// Принять следующий кадр
    /// @return текст или nullopt при закрытии, таймауте или неверном кадре
    std::optional<std::string> receive(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /// Закрыть сокет (разблокирует receive в другом потоке)
    void close();

    bool isOpen() const;

    /// Адрес удалённой стороны
    std::string getRemoteAddress() const;

    /// Соединение с 127.0.0.1 / ::1
    bool isLoopback() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
