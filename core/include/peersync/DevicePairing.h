// DevicePairing.h — Сопряжение устройств по короткому коду
// Проверка и ротация кода, хранение списка сопряжённых устройств

#pragma once

#include "export.h"
#include "AppStorage.h"
#include <string>
#include <cstddef>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr size_t DEFAULT_PAIRING_CODE_LENGTH = 6;
constexpr int DEFAULT_PAIRING_LOCKOUT_SEC = 30;

// ═══════════════════════════════════════════════════════════
// Структуры данных
// ═══════════════════════════════════════════════════════════

/// Сопряжённое устройство (хранится между перезапусками)
struct PS_API PairedDevice {
    std::string deviceId;
    std::string name;
    std::string type;
    int64_t pairedAt = 0;       // Unix timestamp
};

/// Запрос на сопряжение от удалённого устройства
struct PS_API PairingRequest {
    std::string code;
    std::string deviceId;
    std::string deviceName;
    std::string deviceType;
};

/// Результат проверки кода
struct PS_API PairingResult {
    bool success = false;
    std::optional<PairedDevice> device;     // Только при успехе
    std::string errorCode;                  // INVALID_CODE, RATE_LIMITED, INVALID_REQUEST, STORAGE_ERROR
    std::string errorMessage;
};

// ═══════════════════════════════════════════════════════════
// DevicePairing — проверка кода и реестр устройств
// ═══════════════════════════════════════════════════════════

class PS_API DevicePairing {
public:
    /// Вызывается после сохранения устройства, до ротации кода
    using AcceptedCallback = std::function<void(const PairedDevice&)>;

    /// Загружает идентификатор хоста, код и список устройств из storage
    /// (генерирует отсутствующие)
    explicit DevicePairing(std::shared_ptr<AppStorage> storage,
                           size_t codeLength = DEFAULT_PAIRING_CODE_LENGTH);
    ~DevicePairing();

    // Запрет копирования
    DevicePairing(const DevicePairing&) = delete;
    DevicePairing& operator=(const DevicePairing&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Это устройство
    // ═══════════════════════════════════════════════════════════

    std::string getDeviceId() const;
    std::string getDeviceName() const;
    void setDeviceName(const std::string& name);

    // ═══════════════════════════════════════════════════════════
    // Код сопряжения
    // ═══════════════════════════════════════════════════════════

    /// Текущий действующий код
    std::string getCode() const;

    /// Сгенерировать и сохранить новый код
    std::string regenerateCode();

    /// Проверить запрос.
    /// При совпадении: сохраняет устройство, вызывает onAccepted, затем меняет код.
    /// При несовпадении ничего не меняет и не раскрывает текущий код.
    PairingResult validate(const PairingRequest& request,
                           const AcceptedCallback& onAccepted = nullptr);

    /// Ограничение попыток (0 = выключено)
    void setRateLimit(int maxFailedAttempts, std::chrono::seconds lockout);

    // ═══════════════════════════════════════════════════════════
    // Сопряжённые устройства
    // ═══════════════════════════════════════════════════════════

    bool isPaired(const std::string& deviceId) const;
    std::optional<PairedDevice> getDevice(const std::string& deviceId) const;
    std::vector<PairedDevice> getPairedDevices() const;

    /// Удалить устройство из списка
    /// @return false если устройство не было сопряжено
    bool unpair(const std::string& deviceId);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
