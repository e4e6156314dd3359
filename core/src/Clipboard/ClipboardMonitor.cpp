// ClipboardMonitor.cpp — Поток опроса буфера обмена

#include "peersync/Clipboard/ClipboardMonitor.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// ClipboardMonitor::Impl
// ═══════════════════════════════════════════════════════════

class ClipboardMonitor::Impl {
public:
    Impl(std::shared_ptr<ClipboardBackend> backend, std::chrono::milliseconds interval)
        : m_backend(std::move(backend))
        , m_interval(interval) {}

    ~Impl() {
        stop();
    }

    void onChange(ChangeCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callback = std::move(callback);
    }

    bool start() {
        if (m_running) {
            spdlog::warn("ClipboardMonitor: Already running");
            return false;
        }

        auto initial = m_backend->getText();
        m_suppressor.reset(initial.value_or(""));

        {
            std::lock_guard<std::mutex> lock(m_stopMutex);
            m_stopRequested = false;
        }
        m_running = true;
        m_thread = std::thread([this]() { pollLoop(); });

        spdlog::info("ClipboardMonitor: Started ({} ms interval)", m_interval.count());
        return true;
    }

    void stop() {
        if (!m_running) return;

        {
            std::lock_guard<std::mutex> lock(m_stopMutex);
            m_stopRequested = true;
        }
        m_stopCv.notify_all();

        if (m_thread.joinable()) {
            m_thread.join();
        }
        m_running = false;
        spdlog::info("ClipboardMonitor: Stopped");
    }

    bool isRunning() const { return m_running; }

    bool applyRemote(const std::string& text) {
        m_suppressor.markSynced(text);
        if (!m_backend->setText(text)) {
            m_suppressor.clearMarker(text);
            spdlog::error("ClipboardMonitor: Failed to set clipboard");
            return false;
        }
        spdlog::debug("ClipboardMonitor: Clipboard set from sync ({} chars)", text.size());
        return true;
    }

    void pollOnce() {
        auto current = m_backend->getText();
        if (!current) {
            return;
        }

        if (!m_suppressor.observe(*current)) {
            return;
        }

        spdlog::debug("ClipboardMonitor: Clipboard changed locally ({} chars)", current->size());

        ChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_callback;
        }
        if (!callback) {
            return;
        }

        try {
            callback(*current);
        } catch (const std::exception& e) {
            spdlog::error("ClipboardMonitor: Error in clipboard callback: {}", e.what());
        }
    }

    const EchoSuppressor& suppressor() const { return m_suppressor; }

private:
    void pollLoop() {
        std::unique_lock<std::mutex> lock(m_stopMutex);
        while (!m_stopRequested) {
            lock.unlock();
            pollOnce();
            lock.lock();
            m_stopCv.wait_for(lock, m_interval, [this]() { return m_stopRequested; });
        }
    }

    std::shared_ptr<ClipboardBackend> m_backend;
    std::chrono::milliseconds m_interval;
    EchoSuppressor m_suppressor;

    std::mutex m_callbackMutex;
    ChangeCallback m_callback;

    std::atomic<bool> m_running{false};
    std::mutex m_stopMutex;
    std::condition_variable m_stopCv;
    bool m_stopRequested = false;
    std::thread m_thread;
};

// ═══════════════════════════════════════════════════════════
// ClipboardMonitor Public Interface
// ═══════════════════════════════════════════════════════════

ClipboardMonitor::ClipboardMonitor(std::shared_ptr<ClipboardBackend> backend,
                                   std::chrono::milliseconds interval)
    : m_impl(std::make_unique<Impl>(std::move(backend), interval)) {}

ClipboardMonitor::~ClipboardMonitor() = default;

void ClipboardMonitor::onChange(ChangeCallback callback) {
    m_impl->onChange(std::move(callback));
}

bool ClipboardMonitor::start() {
    return m_impl->start();
}

void ClipboardMonitor::stop() {
    m_impl->stop();
}

bool ClipboardMonitor::isRunning() const {
    return m_impl->isRunning();
}

bool ClipboardMonitor::applyRemote(const std::string& text) {
    return m_impl->applyRemote(text);
}

void ClipboardMonitor::pollOnce() {
    m_impl->pollOnce();
}

const EchoSuppressor& ClipboardMonitor::suppressor() const {
    return m_impl->suppressor();
}

} // namespace PeerSync
