// AppStorage.h — Хранение состояния приложения
// Простые файлы в директории приложения: идентификатор устройства,
// список сопряжённых устройств, текущий код сопряжения

#pragma once

#include "export.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// AppStorage — файловое хранилище состояния
// ═══════════════════════════════════════════════════════════

/// Каждый ключ — отдельный файл в директории приложения.
/// Запись атомарна: данные пишутся во временный файл и переименовываются.
class PS_API AppStorage {
public:
    /// @param appDir Директория приложения (создаётся при необходимости)
    explicit AppStorage(const std::string& appDir);
    ~AppStorage();

    // Запрет копирования
    AppStorage(const AppStorage&) = delete;
    AppStorage& operator=(const AppStorage&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Основной интерфейс — бинарные данные
    // ═══════════════════════════════════════════════════════════

    /// Сохранить бинарные данные
    /// @return true если успешно
    bool store(const std::string& key, const std::vector<uint8_t>& data);

    /// Получить бинарные данные
    /// @return Данные или nullopt если не найдено
    std::optional<std::vector<uint8_t>> retrieve(const std::string& key) const;

    /// Удалить данные по ключу
    /// @return true если успешно удалено (или не существовало)
    bool remove(const std::string& key);

    /// Проверить существование ключа
    bool exists(const std::string& key) const;

    // ═══════════════════════════════════════════════════════════
    // Convenience методы для строк
    // ═══════════════════════════════════════════════════════════

    bool storeString(const std::string& key, const std::string& value);
    std::optional<std::string> retrieveString(const std::string& key) const;

    /// Директория приложения
    std::string getDirectory() const;

    /// Полный путь к файлу ключа
    std::string pathFor(const std::string& key) const;

    // ═══════════════════════════════════════════════════════════
    // Предопределённые ключи (имена файлов)
    // ═══════════════════════════════════════════════════════════

    static constexpr const char* KEY_DEVICE_ID = ".device_id";
    static constexpr const char* KEY_PAIRED_DEVICES = "paired_devices.json";
    static constexpr const char* KEY_PAIRING_CODE = ".pairing_code";

    /// Директория приложения по умолчанию ($HOME/.config/peersync)
    static std::string defaultDirectory();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
