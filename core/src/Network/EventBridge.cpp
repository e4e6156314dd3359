// EventBridge.cpp — Очередь событий и поток доставки

#include "peersync/Network/EventBridge.h"
#include <spdlog/spdlog.h>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>

namespace PeerSync {

class EventBridge::Impl {
public:
    explicit Impl(Deliver deliver) : m_deliver(std::move(deliver)) {}

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) return;
        m_running = true;
        m_worker = std::thread([this]() { workerLoop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) return;
            m_running = false;
        }
        m_cv.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

    bool publish(OutboundEvent event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                spdlog::debug("EventBridge: Dropping event, bridge is stopped");
                return false;
            }
            m_queue.push(std::move(event));
        }
        m_cv.notify_one();
        return true;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    void workerLoop() {
        while (true) {
            OutboundEvent event;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this]() {
                    return !m_queue.empty() || !m_running;
                });

                if (!m_running && m_queue.empty()) {
                    break;
                }

                event = std::move(m_queue.front());
                m_queue.pop();
            }

            try {
                m_deliver(event);
            } catch (const std::exception& e) {
                spdlog::error("EventBridge: Delivery failed: {}", e.what());
            }
        }
    }

    Deliver m_deliver;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<OutboundEvent> m_queue;
    bool m_running = false;
    std::thread m_worker;
};

EventBridge::EventBridge(Deliver deliver) : m_impl(std::make_unique<Impl>(std::move(deliver))) {}
EventBridge::~EventBridge() = default;

void EventBridge::start() {
    m_impl->start();
}

void EventBridge::stop() {
    m_impl->stop();
}

bool EventBridge::publish(OutboundEvent event) {
    return m_impl->publish(std::move(event));
}

size_t EventBridge::pending() const {
    return m_impl->pending();
}

} // namespace PeerSync
