// NotificationMonitor.h — Фоновый приём системных уведомлений

#pragma once

#include "../export.h"
#include "NotificationSource.h"
#include <memory>
#include <functional>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// NotificationMonitor — поток, вычитывающий NotificationSource
// ═══════════════════════════════════════════════════════════

class PS_API NotificationMonitor {
public:
    using NotificationCallback = std::function<void(const NotificationEvent&)>;

    explicit NotificationMonitor(std::shared_ptr<NotificationSource> source);
    ~NotificationMonitor();

    // Запрет копирования
    NotificationMonitor(const NotificationMonitor&) = delete;
    NotificationMonitor& operator=(const NotificationMonitor&) = delete;

    /// Обработчик (вызывается из потока монитора)
    void onNotification(NotificationCallback callback);

    /// @return false если уже запущен
    bool start();
    void stop();
    bool isRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
