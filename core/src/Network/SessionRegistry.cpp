// SessionRegistry.cpp — Таблица соединений под одним замком

#include "peersync/Network/SessionRegistry.h"
#include "peersync/Crypto.h"
#include <spdlog/spdlog.h>
#include <map>
#include <mutex>

namespace PeerSync {

namespace {

struct Session {
    std::shared_ptr<MessageSink> sink;
    std::optional<std::string> deviceId;
};

std::string makeTempId() {
    return "temp-" + Crypto::generateUUID();
}

} // namespace

// ═══════════════════════════════════════════════════════════
// SessionRegistry::Impl
// ═══════════════════════════════════════════════════════════

class SessionRegistry::Impl {
public:
    explicit Impl(PairedPredicate isPaired) : m_isPaired(std::move(isPaired)) {}

    std::string connect(std::shared_ptr<MessageSink> sink, const std::optional<std::string>& deviceId) {
        // Проверка сопряжения вне замка реестра
        bool paired = deviceId && !deviceId->empty() && m_isPaired && m_isPaired(*deviceId);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (paired) {
            displaceLocked(*deviceId);
            m_sessions[*deviceId] = Session{std::move(sink), *deviceId};
            spdlog::info("SessionRegistry: Connection bound to device {} (total {})",
                         *deviceId, m_sessions.size());
            return *deviceId;
        }

        std::string id = makeTempId();
        m_sessions[id] = Session{std::move(sink), std::nullopt};
        spdlog::info("SessionRegistry: Temporary connection {} (total {})", id, m_sessions.size());
        return id;
    }

    std::optional<std::string> bind(const std::string& connectionId, const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(connectionId);
        if (it == m_sessions.end()) {
            spdlog::warn("SessionRegistry: Cannot bind unknown connection {}", connectionId);
            return std::nullopt;
        }
        if (connectionId == deviceId) {
            return deviceId;
        }

        Session session = std::move(it->second);
        m_sessions.erase(it);

        displaceLocked(deviceId);
        session.deviceId = deviceId;
        m_sessions[deviceId] = std::move(session);

        spdlog::info("SessionRegistry: Connection {} bound to device {}", connectionId, deviceId);
        return deviceId;
    }

    std::optional<std::string> unbindDevice(const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(deviceId);
        if (it == m_sessions.end()) {
            return std::nullopt;
        }

        Session session = std::move(it->second);
        m_sessions.erase(it);
        session.deviceId.reset();

        std::string id = makeTempId();
        m_sessions[id] = std::move(session);
        spdlog::info("SessionRegistry: Device {} unbound, connection is now {}", deviceId, id);
        return id;
    }

    std::optional<SessionRecord> disconnect(const std::string& connectionId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(connectionId);
        if (it == m_sessions.end()) {
            return std::nullopt;
        }
        return eraseLocked(it);
    }

    std::optional<SessionRecord> disconnect(const std::shared_ptr<MessageSink>& sink) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end(); ++it) {
            if (it->second.sink == sink) {
                return eraseLocked(it);
            }
        }
        return std::nullopt;
    }

    size_t broadcast(const std::string& text, const std::optional<std::string>& exclude) {
        // Отправка вне замка: медленный получатель не блокирует реестр
        std::vector<std::pair<std::string, std::shared_ptr<MessageSink>>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            targets.reserve(m_sessions.size());
            for (const auto& [id, session] : m_sessions) {
                if (exclude && id == *exclude) continue;
                targets.emplace_back(id, session.sink);
            }
        }

        size_t delivered = 0;
        for (const auto& [id, sink] : targets) {
            if (sink->send(text)) {
                ++delivered;
            } else {
                spdlog::error("SessionRegistry: Error sending message to {}", id);
            }
        }
        return delivered;
    }

    bool sendTo(const std::string& connectionId, const std::string& text) {
        std::shared_ptr<MessageSink> sink;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(connectionId);
            if (it == m_sessions.end()) {
                return false;
            }
            sink = it->second.sink;
        }

        if (!sink->send(text)) {
            spdlog::error("SessionRegistry: Error sending message to {}", connectionId);
            return false;
        }
        return true;
    }

    bool sendToDevice(const std::string& deviceId, const std::string& text) {
        std::shared_ptr<MessageSink> sink;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(deviceId);
            if (it == m_sessions.end() || !it->second.deviceId) {
                spdlog::debug("SessionRegistry: Device {} not connected", deviceId);
                return false;
            }
            sink = it->second.sink;
        }

        if (!sink->send(text)) {
            spdlog::error("SessionRegistry: Error sending message to device {}", deviceId);
            return false;
        }
        return true;
    }

    std::optional<std::string> connectionIdFor(const std::shared_ptr<MessageSink>& sink) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, session] : m_sessions) {
            if (session.sink == sink) {
                return id;
            }
        }
        return std::nullopt;
    }

    bool isBound(const std::string& connectionId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(connectionId);
        return it != m_sessions.end() && it->second.deviceId.has_value();
    }

    std::vector<std::string> connectedDevices() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> result;
        for (const auto& [id, session] : m_sessions) {
            if (session.deviceId) {
                result.push_back(*session.deviceId);
            }
        }
        return result;
    }

    size_t connectionCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sessions.size();
    }

private:
    using SessionMap = std::map<std::string, Session>;

    // Прежнее соединение того же устройства становится временным
    void displaceLocked(const std::string& deviceId) {
        auto it = m_sessions.find(deviceId);
        if (it == m_sessions.end()) {
            return;
        }
        Session previous = std::move(it->second);
        m_sessions.erase(it);
        previous.deviceId.reset();

        std::string id = makeTempId();
        m_sessions[id] = std::move(previous);
        spdlog::warn("SessionRegistry: Device {} reconnected, previous connection moved to {}",
                     deviceId, id);
    }

    SessionRecord eraseLocked(SessionMap::iterator it) {
        SessionRecord record{it->first, it->second.deviceId};
        m_sessions.erase(it);
        spdlog::info("SessionRegistry: Connection {} closed. Total connections: {}",
                     record.connectionId, m_sessions.size());
        return record;
    }

    PairedPredicate m_isPaired;
    mutable std::mutex m_mutex;
    SessionMap m_sessions;
};

// ═══════════════════════════════════════════════════════════
// SessionRegistry Public Interface
// ═══════════════════════════════════════════════════════════

SessionRegistry::SessionRegistry(PairedPredicate isPaired)
    : m_impl(std::make_unique<Impl>(std::move(isPaired))) {}

SessionRegistry::~SessionRegistry() = default;

std::string SessionRegistry::connect(std::shared_ptr<MessageSink> sink,
                                     const std::optional<std::string>& deviceId) {
    return m_impl->connect(std::move(sink), deviceId);
}

std::optional<std::string> SessionRegistry::bind(const std::string& connectionId, const std::string& deviceId) {
    return m_impl->bind(connectionId, deviceId);
}

std::optional<std::string> SessionRegistry::unbindDevice(const std::string& deviceId) {
    return m_impl->unbindDevice(deviceId);
}

std::optional<SessionRecord> SessionRegistry::disconnect(const std::string& connectionId) {
    return m_impl->disconnect(connectionId);
}

std::optional<SessionRecord> SessionRegistry::disconnect(const std::shared_ptr<MessageSink>& sink) {
    return m_impl->disconnect(sink);
}

size_t SessionRegistry::broadcast(const std::string& text, const std::optional<std::string>& exclude) {
    return m_impl->broadcast(text, exclude);
}

bool SessionRegistry::sendToDevice(const std::string& deviceId, const std::string& text) {
    return m_impl->sendToDevice(deviceId, text);
}

bool SessionRegistry::sendTo(const std::string& connectionId, const std::string& text) {
    return m_impl->sendTo(connectionId, text);
}

std::optional<std::string> SessionRegistry::connectionIdFor(const std::shared_ptr<MessageSink>& sink) const {
    return m_impl->connectionIdFor(sink);
}

bool SessionRegistry::isBound(const std::string& connectionId) const {
    return m_impl->isBound(connectionId);
}

std::vector<std::string> SessionRegistry::connectedDevices() const {
    return m_impl->connectedDevices();
}

size_t SessionRegistry::connectionCount() const {
    return m_impl->connectionCount();
}

} // namespace PeerSync
