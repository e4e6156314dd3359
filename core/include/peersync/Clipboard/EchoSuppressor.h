// EchoSuppressor.h — Подавление эха при синхронизации буфера обмена

#pragma once

#include "../export.h"
#include <string>
#include <optional>
#include <mutex>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// EchoSuppressor — одноразовая метка последней синхронизации
// ═══════════════════════════════════════════════════════════

/// Значение, записанное в буфер через синхронизацию, запоминается как метка.
/// Первое совпадающее наблюдение снимает метку и не считается изменением.
/// После снятия метки то же содержимое снова считается локальным изменением.
class PS_API EchoSuppressor {
public:
    EchoSuppressor() = default;

    /// Записать метку (вызывается до записи в буфер)
    void markSynced(const std::string& text);

    /// Снять метку, если она равна text (запись в буфер не удалась)
    void clearMarker(const std::string& text);

    /// Учесть очередное наблюдение буфера
    /// @return true если это локальное изменение, о котором нужно сообщить
    bool observe(const std::string& current);

    /// Задать последнее наблюдённое значение без уведомления (старт опроса)
    void reset(const std::string& lastObserved);

    std::optional<std::string> marker() const;
    std::string lastObserved() const;

private:
    mutable std::mutex m_mutex;
    std::string m_last;
    std::optional<std::string> m_marker;
};

} // namespace PeerSync
