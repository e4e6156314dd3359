// PeerServer.cpp — Приём TCP соединений, поток на соединение

#include "peersync/Network/PeerServer.h"
#include "peersync/Network/PeerConnection.h"
#include "peersync/Network/MessageDispatcher.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <atomic>
#include <mutex>
#include <list>
#include <cstring>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET ::close
    #define SOCKET_ERROR_CODE errno
#endif

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// PeerServer::Impl
// ═══════════════════════════════════════════════════════════

class PeerServer::Impl {
public:
    explicit Impl(std::shared_ptr<MessageDispatcher> dispatcher)
        : m_dispatcher(std::move(dispatcher)) {
#ifdef _WIN32
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            spdlog::error("PeerServer: WSAStartup failed");
        }
#endif
    }

    ~Impl() {
        stop();
#ifdef _WIN32
        WSACleanup();
#endif
    }

    bool start(uint16_t port, const std::string& bindAddress) {
        if (m_running) {
            m_lastError = "Server already running";
            return false;
        }

        m_serverSocket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_serverSocket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket";
            spdlog::error("PeerServer: {}", m_lastError);
            return false;
        }

        int opt = 1;
        setsockopt(m_serverSocket, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
            m_lastError = "Invalid bind address: " + bindAddress;
            spdlog::error("PeerServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        if (bind(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            m_lastError = "Failed to bind: " + std::to_string(SOCKET_ERROR_CODE);
            spdlog::error("PeerServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        // Фактический порт (если port == 0)
        socklen_t addrLen = sizeof(addr);
        getsockname(m_serverSocket, reinterpret_cast<sockaddr*>(&addr), &addrLen);
        m_port = ntohs(addr.sin_port);

        if (listen(m_serverSocket, SOMAXCONN) < 0) {
            m_lastError = "Failed to listen: " + std::to_string(SOCKET_ERROR_CODE);
            spdlog::error("PeerServer: {}", m_lastError);
            closeServerSocket();
            return false;
        }

        m_running = true;
        m_acceptThread = std::thread([this]() { acceptLoop(); });

        spdlog::info("PeerServer: Listening on {}:{}", bindAddress, m_port);
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) return;

        // shutdown разблокирует accept()
#ifdef _WIN32
        ::shutdown(m_serverSocket, SD_BOTH);
#else
        ::shutdown(m_serverSocket, SHUT_RDWR);
#endif
        closeServerSocket();

        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }

        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            workers.swap(m_workers);
        }
        for (auto& worker : workers) {
            worker.connection->close();
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }

        spdlog::info("PeerServer: Stopped");
    }

    bool isRunning() const { return m_running; }
    uint16_t getPort() const { return m_port; }
    std::string getLastError() const { return m_lastError; }

    size_t activeConnections() const {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        size_t count = 0;
        for (const auto& worker : m_workers) {
            if (!*worker.finished) ++count;
        }
        return count;
    }

private:
    struct Worker {
        std::shared_ptr<PeerConnection> connection;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    void closeServerSocket() {
        if (m_serverSocket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_serverSocket);
            m_serverSocket = SOCKET_INVALID;
        }
    }

    void acceptLoop() {
        while (m_running) {
            sockaddr_in clientAddr{};
            socklen_t clientAddrLen = sizeof(clientAddr);
            socket_t clientSocket = accept(m_serverSocket,
                reinterpret_cast<sockaddr*>(&clientAddr), &clientAddrLen);

            if (clientSocket == SOCKET_INVALID) {
                if (m_running) {
                    spdlog::debug("PeerServer: accept() failed: {}", SOCKET_ERROR_CODE);
                }
                continue;
            }

            char clientIp[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &clientAddr.sin_addr, clientIp, sizeof(clientIp));
            spdlog::info("PeerServer: Connection from {}", clientIp);

            auto connection = std::make_shared<PeerConnection>(static_cast<intptr_t>(clientSocket), clientIp);
            auto finished = std::make_shared<std::atomic<bool>>(false);

            std::lock_guard<std::mutex> lock(m_workersMutex);
            reapLocked();
            Worker worker;
            worker.connection = connection;
            worker.finished = finished;
            worker.thread = std::thread([this, connection, finished]() {
                serve(connection);
                *finished = true;
            });
            m_workers.push_back(std::move(worker));
        }
    }

    /// Цикл одного соединения: кадры передаются диспетчеру по порядку
    void serve(const std::shared_ptr<PeerConnection>& connection) {
        ConnectionContext ctx;
        ctx.sink = connection;
        ctx.isLoopback = connection->isLoopback();

        bool opened = false;
        while (m_running) {
            auto text = connection->receive();
            if (!text) {
                break;
            }

            try {
                if (!opened) {
                    std::string id = m_dispatcher->open(ctx, *text);
                    spdlog::info("PeerServer: {} registered as {}", connection->getRemoteAddress(), id);
                    opened = true;
                } else {
                    m_dispatcher->handle(ctx, *text);
                }
            } catch (const std::exception& e) {
                spdlog::error("PeerServer: Error on connection {}: {}", connection->getRemoteAddress(), e.what());
            }
        }

        if (opened) {
            m_dispatcher->close(ctx);
        }
        connection->close();
        spdlog::info("PeerServer: Connection from {} closed", connection->getRemoteAddress());
    }

    // Завершённые потоки присоединяются при следующем accept
    void reapLocked() {
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            if (*it->finished) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::shared_ptr<MessageDispatcher> m_dispatcher;
    socket_t m_serverSocket = SOCKET_INVALID;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{false};
    std::thread m_acceptThread;
    std::string m_lastError;

    mutable std::mutex m_workersMutex;
    std::list<Worker> m_workers;
};

// ═══════════════════════════════════════════════════════════
// PeerServer Public Interface
// ═══════════════════════════════════════════════════════════

PeerServer::PeerServer(std::shared_ptr<MessageDispatcher> dispatcher)
    : m_impl(std::make_unique<Impl>(std::move(dispatcher))) {}

PeerServer::~PeerServer() = default;

bool PeerServer::start(uint16_t port, const std::string& bindAddress) {
    return m_impl->start(port, bindAddress);
}

void PeerServer::stop() {
    m_impl->stop();
}

bool PeerServer::isRunning() const {
    return m_impl->isRunning();
}

uint16_t PeerServer::getPort() const {
    return m_impl->getPort();
}

size_t PeerServer::activeConnections() const {
    return m_impl->activeConnections();
}

std::string PeerServer::getLastError() const {
    return m_impl->getLastError();
}

} // namespace PeerSync
