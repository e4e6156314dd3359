// DevicePairing.cpp — Проверка кода сопряжения и реестр устройств

#include "peersync/DevicePairing.h"
#include "peersync/Crypto.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace PeerSync {

using json = nlohmann::json;

namespace {

int64_t nowUnix() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Клиенты вводят код вручную
std::string normalizeCode(const std::string& code) {
    std::string result;
    result.reserve(code.size());
    for (char c : code) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return result;
}

std::string defaultDeviceName() {
#ifdef _WIN32
    char computerName[256];
    DWORD size = sizeof(computerName);
    if (GetComputerNameA(computerName, &size)) {
        return std::string(computerName);
    }
    return "Windows PC";
#else
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        return std::string(hostname);
    }
    return "Linux Device";
#endif
}

} // namespace

// ═══════════════════════════════════════════════════════════
// DevicePairing::Impl
// ═══════════════════════════════════════════════════════════

class DevicePairing::Impl {
public:
    Impl(std::shared_ptr<AppStorage> storage, size_t codeLength)
        : m_storage(std::move(storage))
        , m_codeLength(codeLength == 0 ? DEFAULT_PAIRING_CODE_LENGTH : codeLength) {

        // Загружаем или генерируем device_id
        auto deviceIdOpt = m_storage->retrieveString(AppStorage::KEY_DEVICE_ID);
        if (deviceIdOpt && !deviceIdOpt->empty()) {
            m_deviceId = *deviceIdOpt;
        } else {
            m_deviceId = Crypto::generateUUID();
            if (!m_storage->storeString(AppStorage::KEY_DEVICE_ID, m_deviceId)) {
                spdlog::error("DevicePairing: Failed to persist device ID");
            }
            spdlog::info("DevicePairing: Generated new device ID: {}", m_deviceId);
        }
        m_deviceName = defaultDeviceName();

        // Код: используем сохранённый, если он подходит по длине
        auto codeOpt = m_storage->retrieveString(AppStorage::KEY_PAIRING_CODE);
        if (codeOpt && codeOpt->size() == m_codeLength) {
            m_code = *codeOpt;
        } else {
            m_code = Crypto::generateCode(m_codeLength);
            persistCode();
        }

        loadDevices();

        spdlog::info("DevicePairing: Initialized, device='{}', paired={}", m_deviceName, m_devices.size());
        spdlog::info("DevicePairing: Pairing code: {}", m_code);
    }

    std::string getDeviceId() const {
        return m_deviceId;
    }

    std::string getDeviceName() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_deviceName;
    }

    void setDeviceName(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_deviceName = name;
    }

    std::string getCode() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_code;
    }

    std::string regenerateCode() {
        std::lock_guard<std::mutex> lock(m_mutex);
        rotateLocked();
        return m_code;
    }

    void setRateLimit(int maxFailedAttempts, std::chrono::seconds lockout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_maxFailedAttempts = std::max(0, maxFailedAttempts);
        m_lockout = lockout;
        m_failedAttempts = 0;
        m_lockedUntil = {};
    }

    PairingResult validate(const PairingRequest& request, const AcceptedCallback& onAccepted) {
        PairingResult result;

        if (request.code.empty() || request.deviceId.empty()) {
            result.errorCode = "INVALID_REQUEST";
            result.errorMessage = "Pairing code and device ID are required";
            return result;
        }

        const std::string submitted = normalizeCode(request.code);
        PairedDevice device;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto now = std::chrono::steady_clock::now();
            if (m_maxFailedAttempts > 0 && now < m_lockedUntil) {
                auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
                    m_lockedUntil - now).count();
                spdlog::warn("DevicePairing: Rate limited request from '{}'", request.deviceName);
                result.errorCode = "RATE_LIMITED";
                result.errorMessage = "Too many attempts. Try again in " +
                                      std::to_string(remaining) + " seconds";
                return result;
            }

            if (!Crypto::constantTimeEquals(submitted, m_code)) {
                ++m_failedAttempts;
                spdlog::warn("DevicePairing: Invalid code from '{}' ({}), attempt {}",
                             request.deviceName, request.deviceId, m_failedAttempts);
                if (m_maxFailedAttempts > 0 && m_failedAttempts >= m_maxFailedAttempts) {
                    m_lockedUntil = now + m_lockout;
                    m_failedAttempts = 0;
                }
                result.errorCode = "INVALID_CODE";
                result.errorMessage = "Invalid pairing code";
                return result;
            }

            device.deviceId = request.deviceId;
            device.name = request.deviceName;
            device.type = request.deviceType;
            device.pairedAt = nowUnix();

            auto previous = m_devices.find(device.deviceId);
            std::optional<PairedDevice> backup;
            if (previous != m_devices.end()) {
                backup = previous->second;
            }

            m_devices[device.deviceId] = device;
            if (!persistDevicesLocked()) {
                if (backup) {
                    m_devices[device.deviceId] = *backup;
                } else {
                    m_devices.erase(device.deviceId);
                }
                result.errorCode = "STORAGE_ERROR";
                result.errorMessage = "Failed to save paired device";
                return result;
            }
            m_failedAttempts = 0;
        }

        spdlog::info("DevicePairing: Paired with '{}' ({}, {})",
                     device.name, device.deviceId, device.type);

        result.success = true;
        result.device = device;

        if (onAccepted) {
            onAccepted(device);
        }

        // Ротация после успеха; код, уже сменённый другим запросом, не трогаем
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_code == submitted) {
                rotateLocked();
            }
        }

        return result;
    }

    bool isPaired(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.count(deviceId) > 0;
    }

    std::optional<PairedDevice> getDevice(const std::string& deviceId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<PairedDevice> getPairedDevices() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<PairedDevice> result;
        result.reserve(m_devices.size());
        for (const auto& [id, device] : m_devices) {
            result.push_back(device);
        }
        return result;
    }

    bool unpair(const std::string& deviceId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) {
            return false;
        }
        m_devices.erase(it);
        if (!persistDevicesLocked()) {
            spdlog::error("DevicePairing: Failed to persist device list after unpair");
        }
        spdlog::info("DevicePairing: Unpaired device {}", deviceId);
        return true;
    }

private:
    void rotateLocked() {
        m_code = Crypto::generateCode(m_codeLength);
        persistCode();
        spdlog::info("DevicePairing: New pairing code: {}", m_code);
    }

    void persistCode() {
        if (!m_storage->storeString(AppStorage::KEY_PAIRING_CODE, m_code)) {
            spdlog::error("DevicePairing: Failed to persist pairing code");
        }
    }

    void loadDevices() {
        auto data = m_storage->retrieveString(AppStorage::KEY_PAIRED_DEVICES);
        if (!data || data->empty()) {
            return;
        }

        try {
            json j = json::parse(*data);
            for (auto& [id, entry] : j.items()) {
                PairedDevice device;
                device.deviceId = id;
                device.name = entry.value("name", "");
                device.type = entry.value("type", "");
                device.pairedAt = entry.value("paired_at", static_cast<int64_t>(0));
                m_devices[id] = device;
            }
        } catch (const json::exception& e) {
            spdlog::error("DevicePairing: Corrupt paired device list, starting empty: {}", e.what());
            m_devices.clear();
        }
    }

    bool persistDevicesLocked() {
        json j = json::object();
        for (const auto& [id, device] : m_devices) {
            j[id] = {
                {"name", device.name},
                {"type", device.type},
                {"paired_at", device.pairedAt}
            };
        }
        return m_storage->storeString(AppStorage::KEY_PAIRED_DEVICES, j.dump(2));
    }

    std::shared_ptr<AppStorage> m_storage;
    size_t m_codeLength;
    std::string m_deviceId;

    mutable std::mutex m_mutex;
    std::string m_deviceName;
    std::string m_code;
    std::map<std::string, PairedDevice> m_devices;

    int m_maxFailedAttempts = 0;
    std::chrono::seconds m_lockout{DEFAULT_PAIRING_LOCKOUT_SEC};
    int m_failedAttempts = 0;
    std::chrono::steady_clock::time_point m_lockedUntil{};
};

// ═══════════════════════════════════════════════════════════
// DevicePairing Public Interface
// ═══════════════════════════════════════════════════════════

DevicePairing::DevicePairing(std::shared_ptr<AppStorage> storage, size_t codeLength)
    : m_impl(std::make_unique<Impl>(std::move(storage), codeLength)) {
}

DevicePairing::~DevicePairing() = default;

std::string DevicePairing::getDeviceId() const {
    return m_impl->getDeviceId();
}

std::string DevicePairing::getDeviceName() const {
    return m_impl->getDeviceName();
}

void DevicePairing::setDeviceName(const std::string& name) {
    m_impl->setDeviceName(name);
}

std::string DevicePairing::getCode() const {
    return m_impl->getCode();
}

std::string DevicePairing::regenerateCode() {
    return m_impl->regenerateCode();
}

PairingResult DevicePairing::validate(const PairingRequest& request, const AcceptedCallback& onAccepted) {
    return m_impl->validate(request, onAccepted);
}

void DevicePairing::setRateLimit(int maxFailedAttempts, std::chrono::seconds lockout) {
    m_impl->setRateLimit(maxFailedAttempts, lockout);
}

bool DevicePairing::isPaired(const std::string& deviceId) const {
    return m_impl->isPaired(deviceId);
}

std::optional<PairedDevice> DevicePairing::getDevice(const std::string& deviceId) const {
    return m_impl->getDevice(deviceId);
}

std::vector<PairedDevice> DevicePairing::getPairedDevices() const {
    return m_impl->getPairedDevices();
}

bool DevicePairing::unpair(const std::string& deviceId) {
    return m_impl->unpair(deviceId);
}

} // namespace PeerSync
