// AppStorage.cpp — Файловое хранилище состояния приложения

#include "peersync/AppStorage.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace PeerSync {

namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════
// AppStorage::Impl
// ═══════════════════════════════════════════════════════════

class AppStorage::Impl {
public:
    explicit Impl(const std::string& appDir) : m_storageDir(appDir) {
        std::error_code ec;
        fs::create_directories(m_storageDir, ec);
        if (ec) {
            spdlog::error("AppStorage: Failed to create {}: {}", m_storageDir, ec.message());
        }
        spdlog::debug("AppStorage: File storage at {}", m_storageDir);
    }

    bool store(const std::string& key, const std::vector<uint8_t>& data) {
        if (key.empty()) return false;

        std::string path = getPath(key);
        std::string tmpPath = path + ".tmp";
        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                spdlog::error("AppStorage::store failed to open file for key '{}'", key);
                return false;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file) {
                spdlog::error("AppStorage::store write failed for key '{}'", key);
                return false;
            }
        }

        std::error_code ec;
        fs::rename(tmpPath, path, ec);
        if (ec) {
            spdlog::error("AppStorage::store rename failed for key '{}': {}", key, ec.message());
            fs::remove(tmpPath, ec);
            return false;
        }

        spdlog::debug("AppStorage::store success for key '{}'", key);
        return true;
    }

    std::optional<std::vector<uint8_t>> retrieve(const std::string& key) const {
        if (key.empty()) return std::nullopt;

        std::ifstream file(getPath(key), std::ios::binary | std::ios::ate);
        if (!file) {
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) return std::nullopt;
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> result(static_cast<size_t>(size));
        file.read(reinterpret_cast<char*>(result.data()), size);
        if (!file && !file.eof()) {
            spdlog::error("AppStorage::retrieve read failed for key '{}'", key);
            return std::nullopt;
        }

        spdlog::debug("AppStorage::retrieve success for key '{}' ({} bytes)", key, result.size());
        return result;
    }

    bool remove(const std::string& key) {
        if (key.empty()) return true;

        std::error_code ec;
        fs::remove(getPath(key), ec);
        if (ec) {
            spdlog::warn("AppStorage::remove failed for key '{}': {}", key, ec.message());
            return false;
        }
        return true;
    }

    bool exists(const std::string& key) const {
        if (key.empty()) return false;
        std::error_code ec;
        return fs::exists(getPath(key), ec);
    }

    std::string getDirectory() const { return m_storageDir; }

    std::string getPath(const std::string& key) const {
        // Разделители пути в ключе недопустимы
        std::string safeKey = key;
        for (char& c : safeKey) {
            if (c == '/' || c == '\\') c = '_';
        }
        return m_storageDir + "/" + safeKey;
    }

private:
    std::string m_storageDir;
};

// ═══════════════════════════════════════════════════════════
// AppStorage Public Interface
// ═══════════════════════════════════════════════════════════

AppStorage::AppStorage(const std::string& appDir) : m_impl(std::make_unique<Impl>(appDir)) {
}

AppStorage::~AppStorage() = default;

bool AppStorage::store(const std::string& key, const std::vector<uint8_t>& data) {
    return m_impl->store(key, data);
}

std::optional<std::vector<uint8_t>> AppStorage::retrieve(const std::string& key) const {
    return m_impl->retrieve(key);
}

bool AppStorage::remove(const std::string& key) {
    return m_impl->remove(key);
}

bool AppStorage::exists(const std::string& key) const {
    return m_impl->exists(key);
}

bool AppStorage::storeString(const std::string& key, const std::string& value) {
    std::vector<uint8_t> data(value.begin(), value.end());
    return store(key, data);
}

std::optional<std::string> AppStorage::retrieveString(const std::string& key) const {
    auto data = retrieve(key);
    if (!data) return std::nullopt;
    return std::string(data->begin(), data->end());
}

std::string AppStorage::getDirectory() const {
    return m_impl->getDirectory();
}

std::string AppStorage::pathFor(const std::string& key) const {
    return m_impl->getPath(key);
}

std::string AppStorage::defaultDirectory() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/peersync";
    }
    return "/tmp/peersync";
}

} // namespace PeerSync
