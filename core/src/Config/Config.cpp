// Config.cpp — Чтение и запись config.json

#include "peersync/Config.h"
#include "peersync/Errors.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <mutex>
#include <cstdlib>

namespace PeerSync {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Ключ присутствует и имеет ожидаемый тип, иначе остаётся значение по умолчанию
template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("Config: Ignoring '{}': {}", key, e.what());
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Config::Impl
// ═══════════════════════════════════════════════════════════

class Config::Impl {
public:
    explicit Impl(const std::string& filePath) : m_path(filePath) {}

    bool load() {
        std::error_code ec;
        if (!fs::exists(m_path, ec)) {
            spdlog::info("Config: {} not found, writing defaults", m_path);
            if (!save()) {
                spdlog::warn("Config: Could not create {}", m_path);
            }
            return true;
        }

        std::ifstream file(m_path);
        if (!file) {
            spdlog::error("Config: Failed to open {}", m_path);
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        auto parsed = Config::parse(buffer.str());
        if (!parsed) {
            spdlog::error("Config: {} is not a JSON object, using defaults", m_path);
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = *parsed;
        spdlog::info("Config: Loaded {}", m_path);
        return true;
    }

    bool save() const {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            text = Config::serialize(m_settings);
        }

        std::error_code ec;
        fs::path path(m_path);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
        }

        std::string tmpPath = m_path + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file) {
                spdlog::error("Config: Failed to open {} for writing", tmpPath);
                return false;
            }
            file << text;
            if (!file) {
                spdlog::error("Config: Write failed for {}", tmpPath);
                return false;
            }
        }

        fs::rename(tmpPath, m_path, ec);
        if (ec) {
            spdlog::error("Config: Rename failed for {}: {}", m_path, ec.message());
            fs::remove(tmpPath, ec);
            return false;
        }
        return true;
    }

    Settings get() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_settings;
    }

    void set(const Settings& settings) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = settings;
    }

    void setSetting(const std::string& name, bool value) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            bool* target = toggle(m_settings, name);
            if (!target) {
                throw PeerSyncError(ErrorKind::Validation, "Unknown setting: " + name);
            }
            *target = value;
        }
        spdlog::info("Config: {} = {}", name, value);
        if (!save()) {
            spdlog::warn("Config: Setting {} changed but not persisted", name);
        }
    }

    std::optional<bool> getSetting(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        Settings copy = m_settings;
        bool* target = toggle(copy, name);
        if (!target) {
            return std::nullopt;
        }
        return *target;
    }

    std::string getPath() const {
        return m_path;
    }

private:
    static bool* toggle(Settings& settings, const std::string& name) {
        if (name == "clipboard_sync") return &settings.clipboardSync;
        if (name == "notification_mirroring") return &settings.notificationMirroring;
        if (name == "auto_reconnect") return &settings.autoReconnect;
        return nullptr;
    }

    std::string m_path;
    mutable std::mutex m_mutex;
    Settings m_settings;
};

// ═══════════════════════════════════════════════════════════
// Config Public Interface
// ═══════════════════════════════════════════════════════════

Config::Config(const std::string& filePath) : m_impl(std::make_unique<Impl>(filePath)) {}

Config::~Config() = default;

bool Config::load() {
    return m_impl->load();
}

bool Config::save() const {
    return m_impl->save();
}

Settings Config::get() const {
    return m_impl->get();
}

void Config::set(const Settings& settings) {
    m_impl->set(settings);
}

void Config::setSetting(const std::string& name, bool value) {
    m_impl->setSetting(name, value);
}

std::optional<bool> Config::getSetting(const std::string& name) const {
    return m_impl->getSetting(name);
}

std::string Config::getPath() const {
    return m_impl->getPath();
}

std::string Config::resolvedReceiveDir() const {
    Settings settings = m_impl->get();
    return settings.receiveDir.empty() ? defaultReceiveDir() : settings.receiveDir;
}

std::string Config::defaultReceiveDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / "Downloads" / "PeerSync").string();
    }
    return (fs::temp_directory_path() / "PeerSync").string();
}

std::optional<Settings> Config::parse(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    Settings s;
    readKey(j, "port", s.port);
    readKey(j, "bind_address", s.bindAddress);
    readKey(j, "receive_dir", s.receiveDir);
    readKey(j, "log_level", s.logLevel);
    readKey(j, "pairing_code_length", s.pairingCodeLength);
    readKey(j, "cleanup_delay_seconds", s.cleanupDelaySeconds);
    readKey(j, "clipboard_poll_ms", s.clipboardPollMs);
    readKey(j, "clipboard_sync", s.clipboardSync);
    readKey(j, "notification_mirroring", s.notificationMirroring);
    readKey(j, "auto_reconnect", s.autoReconnect);
    readKey(j, "max_failed_pairing_attempts", s.maxFailedPairingAttempts);
    readKey(j, "pairing_lockout_seconds", s.pairingLockoutSeconds);
    readKey(j, "admin_loopback_only", s.adminLoopbackOnly);
    readKey(j, "clipboard_get_command", s.clipboardGetCommand);
    readKey(j, "clipboard_set_command", s.clipboardSetCommand);

    if (s.pairingCodeLength <= 0) {
        spdlog::warn("Config: pairing_code_length must be positive, using 6");
        s.pairingCodeLength = 6;
    }
    if (s.clipboardPollMs <= 0) {
        s.clipboardPollMs = 500;
    }
    if (s.cleanupDelaySeconds < 0) {
        s.cleanupDelaySeconds = 60;
    }
    return s;
}

std::string Config::serialize(const Settings& s) {
    json j = {
        {"port", s.port},
        {"bind_address", s.bindAddress},
        {"receive_dir", s.receiveDir},
        {"log_level", s.logLevel},
        {"pairing_code_length", s.pairingCodeLength},
        {"cleanup_delay_seconds", s.cleanupDelaySeconds},
        {"clipboard_poll_ms", s.clipboardPollMs},
        {"clipboard_sync", s.clipboardSync},
        {"notification_mirroring", s.notificationMirroring},
        {"auto_reconnect", s.autoReconnect},
        {"max_failed_pairing_attempts", s.maxFailedPairingAttempts},
        {"pairing_lockout_seconds", s.pairingLockoutSeconds},
        {"admin_loopback_only", s.adminLoopbackOnly},
        {"clipboard_get_command", s.clipboardGetCommand},
        {"clipboard_set_command", s.clipboardSetCommand}
    };
    return j.dump(2);
}

} // namespace PeerSync
