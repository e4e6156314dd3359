// PeerServer.h — TCP сервер: приём соединений и цикл чтения кадров

#pragma once

#include "../export.h"
#include "NetworkProtocol.h"
#include <string>
#include <cstddef>
#include <memory>
#include <cstdint>

namespace PeerSync {

class MessageDispatcher;

// ═══════════════════════════════════════════════════════════
// PeerServer
// ═══════════════════════════════════════════════════════════

/// Каждое соединение обслуживается своим потоком; кадры одного соединения
/// передаются диспетчеру строго по порядку.
class PS_API PeerServer {
public:
    explicit PeerServer(std::shared_ptr<MessageDispatcher> dispatcher);
    ~PeerServer();

    // Запрет копирования
    PeerServer(const PeerServer&) = delete;
    PeerServer& operator=(const PeerServer&) = delete;

    /// Запустить сервер
    /// @param port TCP порт (0 = выбрать свободный)
    /// @param bindAddress IPv4 адрес для bind
    /// @return true если успешно
    bool start(uint16_t port = DEFAULT_PORT, const std::string& bindAddress = "0.0.0.0");

    /// Остановить приём и закрыть все соединения
    void stop();

    bool isRunning() const;

    /// Фактический порт
    uint16_t getPort() const;

    /// Число обслуживаемых соединений
    size_t activeConnections() const;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
