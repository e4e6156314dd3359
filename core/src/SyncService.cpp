// SyncService.cpp — Сборка и жизненный цикл компонентов PeerSync

#include "peersync/SyncService.h"
#include "peersync/AppStorage.h"
#include "peersync/Config.h"
#include "peersync/DevicePairing.h"
#include "peersync/Transfer/TransferManager.h"
#include "peersync/Network/SessionRegistry.h"
#include "peersync/Network/EventBridge.h"
#include "peersync/Network/MessageDispatcher.h"
#include "peersync/Network/PeerServer.h"
#include "peersync/Clipboard/ClipboardMonitor.h"
#include "peersync/Notifications/NotificationMonitor.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <mutex>

namespace PeerSync {

namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════
// SyncService::Impl
// ═══════════════════════════════════════════════════════════

class SyncService::Impl {
public:
    explicit Impl(SyncOptions options) : m_options(std::move(options)) {
        if (m_options.appDir.empty()) {
            m_options.appDir = AppStorage::defaultDirectory();
        }
        if (m_options.configPath.empty()) {
            m_options.configPath = (fs::path(m_options.appDir) / Config::FILE_NAME).string();
        }
    }

    ~Impl() {
        stop();
    }

    bool start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Running) {
            m_lastError = "Already running";
            return false;
        }

        try {
            build();
        } catch (const std::exception& e) {
            m_lastError = e.what();
            spdlog::error("SyncService: Failed to initialize: {}", m_lastError);
            m_state = State::Error;
            return false;
        }

        Settings settings = m_config->get();
        uint16_t port = m_options.port ? *m_options.port : settings.port;

        m_events->start();
        if (!m_server->start(port, settings.bindAddress)) {
            m_lastError = "Failed to start server: " + m_server->getLastError();
            spdlog::error("SyncService: {}", m_lastError);
            m_events->stop();
            m_state = State::Error;
            return false;
        }

        if (m_clipboard) {
            m_clipboard->start();
        }
        if (m_notifications) {
            m_notifications->start();
        }

        m_state = State::Running;
        spdlog::info("SyncService: Running as '{}' ({}) on port {}",
                     m_pairing->getDeviceName(), m_pairing->getDeviceId(), m_server->getPort());
        spdlog::info("SyncService: Pairing code: {}", m_pairing->getCode());
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Running) {
            return;
        }

        if (m_notifications) {
            m_notifications->stop();
        }
        if (m_clipboard) {
            m_clipboard->stop();
        }
        m_server->stop();
        m_events->stop();

        m_state = State::Stopped;
        spdlog::info("SyncService: Stopped");
    }

    State getState() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastError;
    }

    uint16_t getPort() const {
        return m_server ? m_server->getPort() : 0;
    }

    std::string getDeviceId() const {
        return m_pairing ? m_pairing->getDeviceId() : std::string();
    }

    std::string getPairingCode() const {
        return m_pairing ? m_pairing->getCode() : std::string();
    }

    std::shared_ptr<MessageDispatcher> m_dispatcher;
    std::shared_ptr<DevicePairing> m_pairing;
    std::shared_ptr<TransferManager> m_transfers;
    std::shared_ptr<SessionRegistry> m_sessions;
    std::shared_ptr<Config> m_config;

private:
    /// Компоненты создаются один раз; повторный start переиспользует их
    void build() {
        if (m_server) {
            return;
        }

        m_config = std::make_shared<Config>(m_options.configPath);
        m_config->load();
        Settings settings = m_config->get();

        auto storage = std::make_shared<AppStorage>(m_options.appDir);

        m_pairing = std::make_shared<DevicePairing>(
            storage, static_cast<size_t>(settings.pairingCodeLength));
        m_pairing->setRateLimit(settings.maxFailedPairingAttempts,
                                std::chrono::seconds(settings.pairingLockoutSeconds));

        m_transfers = std::make_shared<TransferManager>(
            m_config->resolvedReceiveDir(), std::chrono::seconds(settings.cleanupDelaySeconds));

        std::weak_ptr<DevicePairing> pairing = m_pairing;
        m_sessions = std::make_shared<SessionRegistry>([pairing](const std::string& deviceId) {
            auto p = pairing.lock();
            return p && p->isPaired(deviceId);
        });

        std::weak_ptr<SessionRegistry> sessions = m_sessions;
        m_events = std::make_shared<EventBridge>([sessions](const OutboundEvent& event) {
            auto registry = sessions.lock();
            if (!registry) return;
            if (event.targetDevice) {
                registry->sendToDevice(*event.targetDevice, event.text);
            } else {
                registry->broadcast(event.text, event.exclude);
            }
        });

        if (m_options.enableClipboard) {
            auto backend = m_options.clipboardBackend;
            if (!backend) {
                backend = std::make_shared<CommandClipboard>(settings.clipboardGetCommand,
                                                             settings.clipboardSetCommand);
            }
            m_clipboard = std::make_shared<ClipboardMonitor>(
                backend, std::chrono::milliseconds(settings.clipboardPollMs));
        }

        MessageDispatcher::Services services;
        services.sessions = m_sessions;
        services.pairing = m_pairing;
        services.transfers = m_transfers;
        services.config = m_config;
        services.clipboard = m_clipboard;
        services.events = m_events;
        services.port = m_options.port ? *m_options.port : settings.port;
        m_dispatcher = std::make_shared<MessageDispatcher>(services);

        // Локальные изменения буфера и уведомления уходят через EventBridge
        if (m_clipboard) {
            m_clipboard->onChange([this](const std::string& text) {
                if (!m_config->get().clipboardSync) {
                    return;
                }
                spdlog::debug("SyncService: Local clipboard changed ({} chars)", text.size());
                m_dispatcher->publish(OutboundEvent{
                    Messages::clipboardSync(m_pairing->getDeviceId(), text), std::nullopt, std::nullopt});
            });
        }

        if (m_options.enableNotifications) {
            auto source = m_options.notificationSource;
            if (!source) {
                source = std::make_shared<DbusMonitorSource>();
            }
            m_notifications = std::make_shared<NotificationMonitor>(source);
            m_notifications->onNotification([this](const NotificationEvent& event) {
                if (!m_config->get().notificationMirroring) {
                    return;
                }
                m_dispatcher->publish(OutboundEvent{
                    Messages::notification(event.notificationType, event.message, event.appName,
                                           event.summary, event.body, event.timestamp),
                    std::nullopt, std::nullopt});
            });
        }

        m_server = std::make_unique<PeerServer>(m_dispatcher);
    }

    SyncOptions m_options;
    mutable std::mutex m_mutex;
    State m_state = State::Stopped;
    std::string m_lastError;

    std::shared_ptr<EventBridge> m_events;
    std::shared_ptr<ClipboardMonitor> m_clipboard;
    std::shared_ptr<NotificationMonitor> m_notifications;
    std::unique_ptr<PeerServer> m_server;
};

// ═══════════════════════════════════════════════════════════
// SyncService Public Interface
// ═══════════════════════════════════════════════════════════

SyncService::SyncService(SyncOptions options) : m_impl(std::make_unique<Impl>(std::move(options))) {}

SyncService::~SyncService() = default;

bool SyncService::start() {
    return m_impl->start();
}

void SyncService::stop() {
    m_impl->stop();
}

SyncService::State SyncService::getState() const {
    return m_impl->getState();
}

bool SyncService::isRunning() const {
    return m_impl->getState() == State::Running;
}

std::string SyncService::getLastError() const {
    return m_impl->getLastError();
}

uint16_t SyncService::getPort() const {
    return m_impl->getPort();
}

std::string SyncService::getDeviceId() const {
    return m_impl->getDeviceId();
}

std::string SyncService::getPairingCode() const {
    return m_impl->getPairingCode();
}

std::shared_ptr<MessageDispatcher> SyncService::dispatcher() const {
    return m_impl->m_dispatcher;
}

std::shared_ptr<DevicePairing> SyncService::pairing() const {
    return m_impl->m_pairing;
}

std::shared_ptr<TransferManager> SyncService::transfers() const {
    return m_impl->m_transfers;
}

std::shared_ptr<SessionRegistry> SyncService::sessions() const {
    return m_impl->m_sessions;
}

std::shared_ptr<Config> SyncService::config() const {
    return m_impl->m_config;
}

} // namespace PeerSync
