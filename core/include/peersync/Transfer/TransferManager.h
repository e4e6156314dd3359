// TransferManager.h — Передача файлов фрагментами с шифрованием

#pragma once

#include "../export.h"
#include "../Types.h"
#include <string>
#include <cstddef>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <chrono>
#include <cstdint>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr int64_t DEFAULT_CHUNK_SIZE = 64 * 1024;          // 64 KB
constexpr int64_t MAX_CHUNK_SIZE = DEFAULT_CHUNK_SIZE;     // Предел одного чтения
constexpr int DEFAULT_CLEANUP_DELAY_SEC = 60;              // После терминального статуса

// ═══════════════════════════════════════════════════════════
// Описание передачи (отправляется получателю один раз до фрагментов)
// ═══════════════════════════════════════════════════════════

struct PS_API TransferDescriptor {
    std::string fileId;
    std::string fileName;
    int64_t fileSize = 0;
    std::string key;            // base64, 32 байта
    std::string iv;             // base64, 16 байт
    std::string contentHash;    // sha-256 hex всего файла
    int64_t chunkSize = DEFAULT_CHUNK_SIZE;
};

/// Результат подготовки приёма
struct PS_API DownloadTicket {
    std::string fileId;
    std::string savePath;
    std::string status = "ready";
};

/// Прочитанный и зашифрованный фрагмент
struct PS_API ChunkResult {
    std::string fileId;
    int64_t chunkIndex = 0;
    std::string chunkData;      // base64 шифротекста, пусто за концом файла
    bool finalChunk = false;
    double progress = 0.0;      // 0..100
    TransferStatus status = TransferStatus::InProgress;
};

/// Подтверждение записанного фрагмента
struct PS_API ChunkAck {
    std::string fileId;
    int64_t chunkIndex = 0;
    std::string status;         // "received" или "completed"
    int64_t bytesReceived = 0;
    double progress = 0.0;
};

/// Снимок прогресса передачи
struct PS_API TransferProgress {
    std::string fileId;
    std::string fileName;
    std::string deviceId;
    TransferDirection direction = TransferDirection::Upload;
    TransferStatus status = TransferStatus::Initializing;
    double progress = 0.0;          // Проценты
    int64_t bytesTransferred = 0;
    int64_t totalBytes = 0;
    double speedBps = 0.0;
    double etaSeconds = 0.0;
};

// ═══════════════════════════════════════════════════════════
// TransferManager — владелец всех активных передач
// ═══════════════════════════════════════════════════════════

/// Состояния: initializing → in_progress → {completed | failed | canceled}.
/// Запись удаляется через cleanupDelay после терминального статуса.
/// Все методы потокобезопасны; операции над одной передачей сериализуются.
class PS_API TransferManager {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    /// @param receiveDir Директория для принимаемых файлов (создаётся при необходимости)
    /// @param cleanupDelay Задержка удаления завершённых передач
    explicit TransferManager(
        const std::string& receiveDir,
        std::chrono::milliseconds cleanupDelay = std::chrono::seconds(DEFAULT_CLEANUP_DELAY_SEC));
    ~TransferManager();

    // Запрет копирования
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Подготовка
    // ═══════════════════════════════════════════════════════════

    /// Подготовить отправку локального файла
    /// @throws PeerSyncError(NotFound) если файла нет
    TransferDescriptor prepareUpload(const std::string& filePath, const std::string& deviceId);

    /// Подготовить приём файла в директорию приёма.
    /// При совпадении имени добавляется суффикс " (n)" перед расширением.
    /// @throws PeerSyncError(Validation) при неполном описании или занятом fileId
    /// @throws PeerSyncError(IO) если файл не открывается на запись
    DownloadTicket prepareDownload(const TransferDescriptor& descriptor, const std::string& deviceId);

    // ═══════════════════════════════════════════════════════════
    // Фрагменты
    // ═══════════════════════════════════════════════════════════

    /// Прочитать и зашифровать фрагмент отправляемого файла.
    /// Индекс за концом файла завершает передачу.
    /// @throws PeerSyncError(Validation) если chunkSize вне (0, MAX_CHUNK_SIZE]
    /// @throws PeerSyncError (NotFound/IO)
    ChunkResult readChunk(const std::string& fileId, int64_t chunkIndex,
                          int64_t chunkSize = DEFAULT_CHUNK_SIZE);

    /// Расшифровать и дописать фрагмент принимаемого файла
    /// @throws PeerSyncError (Validation/NotFound/IO)
    ChunkAck writeChunk(const std::string& fileId, const std::string& chunkDataBase64,
                        int64_t chunkIndex, bool finalChunk);

    /// Отменить передачу. Частично принятый файл удаляется.
    /// @return false если передача уже в терминальном статусе
    /// @throws PeerSyncError(NotFound) если передачи нет
    bool cancel(const std::string& fileId);

    // ═══════════════════════════════════════════════════════════
    // Состояние
    // ═══════════════════════════════════════════════════════════

    std::optional<TransferProgress> getProgress(const std::string& fileId) const;
    std::vector<TransferProgress> getAllTransfers() const;
    size_t transferCount() const;

    /// Путь к файлу передачи (для отправки — исходный, для приёма — куда пишется)
    std::optional<std::string> getFilePath(const std::string& fileId) const;

    std::string getReceiveDirectory() const;

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    /// Зарегистрировать обработчик прогресса для передачи.
    /// Удаляется вместе с записью передачи.
    void registerCallback(const std::string& fileId, ProgressCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Утилиты
    // ═══════════════════════════════════════════════════════════

    struct Figures {
        double percent = 0.0;
        double speedBps = 0.0;
        double etaSeconds = 0.0;
    };

    /// Вычислить процент, скорость и оставшееся время
    static Figures computeFigures(int64_t transferred, int64_t total, double elapsedSeconds);

    /// Имя файла без компонентов пути (пустое и "."/".." заменяются на "file")
    static std::string sanitizeFileName(const std::string& fileName);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace PeerSync
