// EventBridge.h — Передача событий фоновых потоков в рассылку

#pragma once

#include "../export.h"
#include <string>
#include <cstddef>
#include <optional>
#include <memory>
#include <functional>

namespace PeerSync {

/// Исходящее событие
struct PS_API OutboundEvent {
    std::string text;                           // JSON-сообщение
    std::optional<std::string> exclude;         // connection_id, которому не отправлять
    std::optional<std::string> targetDevice;    // Только этому устройству
};

// ═══════════════════════════════════════════════════════════
// EventBridge — потокобезопасная очередь + поток доставки
// ═══════════════════════════════════════════════════════════

/// Фоновые мониторы не владеют сокетами: они кладут события в очередь,
/// а доставку выполняет отдельный поток через deliver.
class PS_API EventBridge {
public:
    using Deliver = std::function<void(const OutboundEvent&)>;

    explicit EventBridge(Deliver deliver);
    ~EventBridge();

    // Запрет копирования
    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

    void start();

    /// Остановить поток; оставшиеся события доставляются до выхода
    void stop();

    /// Поставить событие в очередь
    /// @return false если мост остановлен
    bool publish(OutboundEvent event);

    size_t pending() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
