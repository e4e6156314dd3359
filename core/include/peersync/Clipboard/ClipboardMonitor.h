// ClipboardMonitor.h — Опрос буфера обмена в фоновом потоке

#pragma once

#include "../export.h"
#include "ClipboardBackend.h"
#include "EchoSuppressor.h"
#include <string>
#include <memory>
#include <functional>
#include <chrono>

namespace PeerSync {

constexpr int DEFAULT_CLIPBOARD_POLL_MS = 500;

// ═══════════════════════════════════════════════════════════
// ClipboardMonitor — локальные изменения буфера
// ═══════════════════════════════════════════════════════════

class PS_API ClipboardMonitor {
public:
    using ChangeCallback = std::function<void(const std::string& text)>;

    explicit ClipboardMonitor(
        std::shared_ptr<ClipboardBackend> backend,
        std::chrono::milliseconds interval = std::chrono::milliseconds(DEFAULT_CLIPBOARD_POLL_MS));
    ~ClipboardMonitor();

    // Запрет копирования
    ClipboardMonitor(const ClipboardMonitor&) = delete;
    ClipboardMonitor& operator=(const ClipboardMonitor&) = delete;

    /// Обработчик локального изменения (вызывается из потока опроса)
    void onChange(ChangeCallback callback);

    /// Запустить опрос
    /// @return false если уже запущен
    bool start();

    /// Остановить опрос и дождаться потока
    void stop();

    bool isRunning() const;

    /// Записать текст, пришедший с другого устройства (с меткой против эха)
    bool applyRemote(const std::string& text);

    /// Один цикл опроса
    void pollOnce();

    const EchoSuppressor& suppressor() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
