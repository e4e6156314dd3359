// NotificationMonitor.cpp — Поток чтения уведомлений

#include "peersync/Notifications/NotificationMonitor.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <mutex>
#include <atomic>

namespace PeerSync {

namespace {
constexpr auto SOURCE_WAIT = std::chrono::milliseconds(200);
}

class NotificationMonitor::Impl {
public:
    explicit Impl(std::shared_ptr<NotificationSource> source) : m_source(std::move(source)) {}

    ~Impl() {
        stop();
    }

    void onNotification(NotificationCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callback = std::move(callback);
    }

    bool start() {
        if (m_running) {
            spdlog::warn("NotificationMonitor: Already running");
            return false;
        }
        m_running = true;
        m_thread = std::thread([this]() { monitorLoop(); });
        spdlog::info("NotificationMonitor: Started");
        return true;
    }

    void stop() {
        if (!m_running) return;
        m_running = false;
        if (m_thread.joinable()) {
            m_thread.join();
        }
        spdlog::info("NotificationMonitor: Stopped");
    }

    bool isRunning() const { return m_running; }

private:
    void monitorLoop() {
        while (m_running) {
            auto event = m_source->next(SOURCE_WAIT);
            if (!event) {
                continue;
            }

            NotificationCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_callbackMutex);
                callback = m_callback;
            }
            if (!callback) {
                continue;
            }

            try {
                callback(*event);
            } catch (const std::exception& e) {
                spdlog::error("NotificationMonitor: Error in notification callback: {}", e.what());
            }
        }
    }

    std::shared_ptr<NotificationSource> m_source;
    std::mutex m_callbackMutex;
    NotificationCallback m_callback;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

NotificationMonitor::NotificationMonitor(std::shared_ptr<NotificationSource> source)
    : m_impl(std::make_unique<Impl>(std::move(source))) {}

NotificationMonitor::~NotificationMonitor() = default;

void NotificationMonitor::onNotification(NotificationCallback callback) {
    m_impl->onNotification(std::move(callback));
}

bool NotificationMonitor::start() {
    return m_impl->start();
}

void NotificationMonitor::stop() {
    m_impl->stop();
}

bool NotificationMonitor::isRunning() const {
    return m_impl->isRunning();
}

} // namespace PeerSync
