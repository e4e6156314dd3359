// Config.h — Конфигурация демона (config.json в директории приложения)

#pragma once

#include "export.h"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// Settings — значения конфигурации
// ═══════════════════════════════════════════════════════════

struct PS_API Settings {
    uint16_t port = 8765;
    std::string bindAddress = "0.0.0.0";
    std::string receiveDir;                     // Пусто — ~/Downloads/PeerSync
    std::string logLevel = "info";
    int pairingCodeLength = 6;
    int cleanupDelaySeconds = 60;
    int clipboardPollMs = 500;

    // Переключаются через admin_request/set_setting
    bool clipboardSync = true;
    bool notificationMirroring = true;
    bool autoReconnect = true;

    int maxFailedPairingAttempts = 0;           // 0 — без ограничения
    int pairingLockoutSeconds = 30;
    bool adminLoopbackOnly = true;

    std::string clipboardGetCommand = "xclip -selection clipboard -o";
    std::string clipboardSetCommand = "xclip -selection clipboard -i";
};

// ═══════════════════════════════════════════════════════════
// Config — загрузка и сохранение настроек
// ═══════════════════════════════════════════════════════════

class PS_API Config {
public:
    static constexpr const char* FILE_NAME = "config.json";

    /// @param filePath Полный путь к config.json
    explicit Config(const std::string& filePath);
    ~Config();

    // Запрет копирования
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /// Прочитать файл. Если файла нет, он создаётся со значениями по умолчанию.
    /// Отсутствующие ключи берутся по умолчанию, ключи неверного типа пропускаются.
    /// @return false если файл повреждён (остаются значения по умолчанию)
    bool load();

    /// Записать текущие значения
    bool save() const;

    Settings get() const;
    void set(const Settings& settings);

    /// Изменить переключаемую настройку и сохранить файл
    /// @throws PeerSyncError(Validation) если имя неизвестно
    void setSetting(const std::string& name, bool value);

    /// Значение переключаемой настройки
    /// @return nullopt если имя неизвестно
    std::optional<bool> getSetting(const std::string& name) const;

    std::string getPath() const;

    /// Директория приёма с учётом значения по умолчанию
    std::string resolvedReceiveDir() const;

    /// ~/Downloads/PeerSync
    static std::string defaultReceiveDir();

    /// Разобрать JSON-текст поверх значений по умолчанию
    /// @return nullopt если текст не JSON-объект
    static std::optional<Settings> parse(const std::string& text);

    /// JSON-текст настроек
    static std::string serialize(const Settings& settings);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
