// PeerConnection.cpp — TCP соединение: отправка и приём кадров

#include "peersync/Network/PeerConnection.h"
#include "peersync/Network/NetworkProtocol.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>
#include <cstring>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define SHUTDOWN_BOTH SD_BOTH
    #define SEND_FLAGS 0
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <sys/select.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET ::close
    #define SOCKET_ERROR_CODE errno
    #define SHUTDOWN_BOTH SHUT_RDWR
    #define SEND_FLAGS MSG_NOSIGNAL
#endif

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// PeerConnection::Impl
// ═══════════════════════════════════════════════════════════

class PeerConnection::Impl {
public:
    Impl(socket_t socket, std::string remoteAddress)
        : m_socket(socket)
        , m_remoteAddress(std::move(remoteAddress))
        , m_open(socket != SOCKET_INVALID) {
        if (m_open) {
            int flag = 1;
            setsockopt(m_socket, IPPROTO_TCP, TCP_NODELAY,
                       reinterpret_cast<const char*>(&flag), sizeof(flag));
        }
    }

    ~Impl() {
        close();
        if (m_socket != SOCKET_INVALID) {
            CLOSE_SOCKET(m_socket);
            m_socket = SOCKET_INVALID;
        }
    }

    bool send(const std::string& text) {
        if (!m_open) {
            return false;
        }
        if (text.size() + FRAME_HEADER_SIZE > MAX_FRAME_SIZE) {
            spdlog::error("PeerConnection: Message too large ({} bytes)", text.size());
            return false;
        }

        auto data = FrameCodec::serialize(text);

        std::lock_guard<std::mutex> lock(m_sendMutex);
        size_t totalSent = 0;
        while (totalSent < data.size()) {
            auto sent = ::send(m_socket, reinterpret_cast<const char*>(data.data() + totalSent),
                               static_cast<int>(data.size() - totalSent), SEND_FLAGS);
            if (sent <= 0) {
                spdlog::error("PeerConnection: Send to {} failed: {}", m_remoteAddress, SOCKET_ERROR_CODE);
                return false;
            }
            totalSent += static_cast<size_t>(sent);
        }
        return true;
    }

    std::optional<std::string> receive(std::chrono::milliseconds timeout) {
        std::vector<uint8_t> chunk(64 * 1024);

        while (true) {
            // Полный кадр мог прийти вместе с предыдущим
            size_t frameSize = 0;
            FrameStatus status = FrameCodec::check(m_buffer.data(), m_buffer.size(), frameSize);
            if (status == FrameStatus::Ready) {
                auto text = FrameCodec::deserialize(m_buffer.data(), frameSize);
                m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(frameSize));
                return text;
            }
            if (status == FrameStatus::Invalid) {
                spdlog::warn("PeerConnection: Invalid frame from {}, closing", m_remoteAddress);
                close();
                return std::nullopt;
            }

            if (!m_open) {
                return std::nullopt;
            }

            if (timeout.count() > 0 && !waitReadable(timeout)) {
                return std::nullopt;
            }

            auto received = ::recv(m_socket, reinterpret_cast<char*>(chunk.data()),
                                   static_cast<int>(chunk.size()), 0);
            if (received <= 0) {
                if (received < 0 && m_open) {
                    spdlog::debug("PeerConnection: recv from {} failed: {}", m_remoteAddress, SOCKET_ERROR_CODE);
                }
                m_open = false;
                return std::nullopt;
            }
            m_buffer.insert(m_buffer.end(), chunk.begin(), chunk.begin() + received);
        }
    }

    void close() {
        if (m_open.exchange(false) && m_socket != SOCKET_INVALID) {
            // Сокет закрывается в деструкторе: recv в другом потоке не должен увидеть чужой fd
            ::shutdown(m_socket, SHUTDOWN_BOTH);
        }
    }

    bool isOpen() const { return m_open; }

    std::string getRemoteAddress() const { return m_remoteAddress; }

private:
    bool waitReadable(std::chrono::milliseconds timeout) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(m_socket, &readSet);

        timeval tv{};
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        int rc = ::select(static_cast<int>(m_socket) + 1, &readSet, nullptr, nullptr, &tv);
        return rc > 0;
    }

    socket_t m_socket;
    std::string m_remoteAddress;
    std::atomic<bool> m_open;
    std::mutex m_sendMutex;
    std::vector<uint8_t> m_buffer;
};

// ═══════════════════════════════════════════════════════════
// PeerConnection Public Interface
// ═══════════════════════════════════════════════════════════

PeerConnection::PeerConnection(intptr_t socket, std::string remoteAddress)
    : m_impl(std::make_unique<Impl>(static_cast<socket_t>(socket), std::move(remoteAddress))) {}

PeerConnection::~PeerConnection() = default;

std::shared_ptr<PeerConnection> PeerConnection::connectTo(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string portStr = std::to_string(port);
    if (getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result) != 0 || !result) {
        spdlog::error("PeerConnection: Cannot resolve {}", host);
        return nullptr;
    }

    socket_t sock = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (sock == SOCKET_INVALID) {
        freeaddrinfo(result);
        spdlog::error("PeerConnection: Failed to create socket");
        return nullptr;
    }

    if (::connect(sock, result->ai_addr, static_cast<socklen_t>(result->ai_addrlen)) < 0) {
        spdlog::error("PeerConnection: Connect to {}:{} failed: {}", host, port, SOCKET_ERROR_CODE);
        freeaddrinfo(result);
        CLOSE_SOCKET(sock);
        return nullptr;
    }
    freeaddrinfo(result);

    spdlog::debug("PeerConnection: Connected to {}:{}", host, port);
    return std::make_shared<PeerConnection>(static_cast<intptr_t>(sock), host + ":" + portStr);
}

bool PeerConnection::send(const std::string& text) {
    return m_impl->send(text);
}

std::optional<std::string> PeerConnection::receive(std::chrono::milliseconds timeout) {
    return m_impl->receive(timeout);
}

void PeerConnection::close() {
    m_impl->close();
}

bool PeerConnection::isOpen() const {
    return m_impl->isOpen();
}

std::string PeerConnection::getRemoteAddress() const {
    return m_impl->getRemoteAddress();
}

bool PeerConnection::isLoopback() const {
    std::string address = m_impl->getRemoteAddress();
    return address.rfind("127.", 0) == 0 || address == "::1" || address.rfind("localhost", 0) == 0;
}

} // namespace PeerSync
