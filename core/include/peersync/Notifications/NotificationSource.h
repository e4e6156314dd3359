// NotificationSource.h — Источники системных уведомлений

#pragma once

#include "../export.h"
#include <string>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>

namespace PeerSync {

/// Перехваченное уведомление
struct PS_API NotificationEvent {
    std::string notificationType = "system";
    std::string appName;
    std::string summary;
    std::string body;
    std::string message;        // Текст для отображения на пире
    int64_t timestamp = 0;      // Unix timestamp
};

// ═══════════════════════════════════════════════════════════
// NotificationSource — откуда брать уведомления
// ═══════════════════════════════════════════════════════════

class PS_API NotificationSource {
public:
    virtual ~NotificationSource() = default;

    /// Дождаться следующего уведомления
    /// @return nullopt если за timeout ничего не пришло
    virtual std::optional<NotificationEvent> next(std::chrono::milliseconds timeout) = 0;
};

// ═══════════════════════════════════════════════════════════
// QueueNotificationSource — уведомления, переданные из кода
// ═══════════════════════════════════════════════════════════

class PS_API QueueNotificationSource : public NotificationSource {
public:
    QueueNotificationSource();
    ~QueueNotificationSource() override;

    void push(NotificationEvent event);
    std::optional<NotificationEvent> next(std::chrono::milliseconds timeout) override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ═══════════════════════════════════════════════════════════
// DbusMonitorSource — вывод dbus-monitor по org.freedesktop.Notifications
// ═══════════════════════════════════════════════════════════

constexpr const char* DEFAULT_NOTIFY_MONITOR_COMMAND =
    "dbus-monitor --session \"interface='org.freedesktop.Notifications',member='Notify'\"";

class PS_API DbusMonitorSource : public NotificationSource {
public:
    explicit DbusMonitorSource(std::string command = DEFAULT_NOTIFY_MONITOR_COMMAND);
    ~DbusMonitorSource() override;

    // Запрет копирования
    DbusMonitorSource(const DbusMonitorSource&) = delete;
    DbusMonitorSource& operator=(const DbusMonitorSource&) = delete;

    std::optional<NotificationEvent> next(std::chrono::milliseconds timeout) override;

    /// Разобрать строку вывода dbus-monitor.
    /// @return уведомление, когда накоплены все поля вызова Notify
    std::optional<NotificationEvent> feedLine(const std::string& line);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
