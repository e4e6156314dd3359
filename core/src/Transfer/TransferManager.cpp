// TransferManager.cpp — Состояние передач, чтение/запись фрагментов, очистка

#include "peersync/Transfer/TransferManager.h"
#include "peersync/Transfer/ChunkCodec.h"
#include "peersync/Crypto.h"
#include "peersync/Errors.h"
#include <spdlog/spdlog.h>
#include <fstream>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <algorithm>
#include <limits>

namespace PeerSync {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

// ═══════════════════════════════════════════════════════════
// Состояние одной передачи
// ═══════════════════════════════════════════════════════════

struct FileTransfer {
    std::mutex mutex;   // Сериализует операции над одной передачей

    std::string fileId;
    std::string deviceId;
    TransferDirection direction = TransferDirection::Upload;
    std::string path;
    std::string fileName;
    int64_t size = 0;
    int64_t bytesTransferred = 0;
    TransferStatus status = TransferStatus::Initializing;
    Clock::time_point startTime;
    Clock::time_point lastUpdateTime;
    std::vector<uint8_t> key;
    std::vector<uint8_t> iv;

    std::ifstream input;    // Upload
    std::ofstream output;   // Download
    int64_t expectedIndex = 0;

    void closeHandles() {
        if (input.is_open()) input.close();
        if (output.is_open()) output.close();
    }

    TransferProgress snapshot() const {
        TransferProgress p;
        p.fileId = fileId;
        p.fileName = fileName;
        p.deviceId = deviceId;
        p.direction = direction;
        p.status = status;
        p.bytesTransferred = bytesTransferred;
        p.totalBytes = size;

        double elapsed = std::chrono::duration<double>(Clock::now() - startTime).count();
        auto figures = TransferManager::computeFigures(bytesTransferred, size, elapsed);
        p.progress = figures.percent;
        p.speedBps = figures.speedBps;
        p.etaSeconds = figures.etaSeconds;
        return p;
    }

    double percent() const {
        return size > 0 ? static_cast<double>(bytesTransferred) / static_cast<double>(size) * 100.0 : 0.0;
    }
};

using TransferPtr = std::shared_ptr<FileTransfer>;

// ═══════════════════════════════════════════════════════════
// TransferManager::Impl
// ═══════════════════════════════════════════════════════════

class TransferManager::Impl {
public:
    Impl(const std::string& receiveDir, std::chrono::milliseconds cleanupDelay)
        : m_receiveDir(receiveDir)
        , m_cleanupDelay(cleanupDelay) {
        std::error_code ec;
        fs::create_directories(m_receiveDir, ec);
        if (ec) {
            spdlog::warn("TransferManager: Cannot create receive directory {}: {}",
                         m_receiveDir, ec.message());
        }

        m_cleanupRunning = true;
        m_cleanupWorker = std::thread([this]() { cleanupLoop(); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(m_cleanupMutex);
            m_cleanupRunning = false;
        }
        m_cleanupCv.notify_all();
        if (m_cleanupWorker.joinable()) {
            m_cleanupWorker.join();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, transfer] : m_transfers) {
            std::lock_guard<std::mutex> tlock(transfer->mutex);
            transfer->closeHandles();
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Prepare
    // ═══════════════════════════════════════════════════════════

    TransferDescriptor prepareUpload(const std::string& filePath, const std::string& deviceId) {
        std::error_code ec;
        if (!fs::is_regular_file(filePath, ec)) {
            spdlog::error("TransferManager: File not found: {}", filePath);
            throw PeerSyncError(ErrorKind::NotFound, "File not found: " + filePath);
        }

        auto size = fs::file_size(filePath, ec);
        if (ec) {
            throw PeerSyncError(ErrorKind::IO, "Cannot stat file: " + filePath);
        }

        std::string hash = Crypto::sha256FileHex(filePath);
        if (hash.empty()) {
            throw PeerSyncError(ErrorKind::IO, "Cannot read file: " + filePath);
        }

        auto transfer = std::make_shared<FileTransfer>();
        transfer->fileId = Crypto::generateUUID();
        transfer->deviceId = deviceId;
        transfer->direction = TransferDirection::Upload;
        transfer->path = filePath;
        transfer->fileName = fs::path(filePath).filename().string();
        transfer->size = static_cast<int64_t>(size);
        transfer->startTime = Clock::now();
        transfer->lastUpdateTime = transfer->startTime;
        transfer->key = Crypto::randomBytes(CHUNK_KEY_SIZE);
        transfer->iv = Crypto::randomBytes(CHUNK_IV_SIZE);

        TransferDescriptor descriptor;
        descriptor.fileId = transfer->fileId;
        descriptor.fileName = transfer->fileName;
        descriptor.fileSize = transfer->size;
        descriptor.key = Crypto::base64Encode(transfer->key);
        descriptor.iv = Crypto::base64Encode(transfer->iv);
        descriptor.contentHash = hash;
        descriptor.chunkSize = DEFAULT_CHUNK_SIZE;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_transfers[transfer->fileId] = transfer;
        }

        spdlog::info("TransferManager: Prepared upload {} ({}, {} bytes) for {}",
                     descriptor.fileId, descriptor.fileName, descriptor.fileSize, deviceId);
        return descriptor;
    }

    DownloadTicket prepareDownload(const TransferDescriptor& descriptor, const std::string& deviceId) {
        if (descriptor.fileId.empty() || descriptor.fileName.empty() ||
            descriptor.key.empty() || descriptor.iv.empty()) {
            throw PeerSyncError(ErrorKind::Validation, "Missing required file information");
        }
        if (descriptor.fileSize < 0) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid file size");
        }

        auto key = Crypto::base64Decode(descriptor.key);
        auto iv = Crypto::base64Decode(descriptor.iv);
        if (!key || key->size() != CHUNK_KEY_SIZE) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid transfer key");
        }
        if (!iv || iv->size() != CHUNK_IV_SIZE) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid transfer IV");
        }

        auto transfer = std::make_shared<FileTransfer>();
        transfer->fileId = descriptor.fileId;
        transfer->deviceId = deviceId;
        transfer->direction = TransferDirection::Download;
        transfer->fileName = descriptor.fileName;
        transfer->size = descriptor.fileSize;
        transfer->key = std::move(*key);
        transfer->iv = std::move(*iv);

        // Выбор имени и открытие под общим замком: два приёма не займут один путь
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_transfers.count(descriptor.fileId)) {
            throw PeerSyncError(ErrorKind::Validation,
                                "Transfer already exists: " + descriptor.fileId);
        }

        transfer->path = uniqueSavePath(sanitizeFileName(descriptor.fileName));
        transfer->output.open(transfer->path, std::ios::binary | std::ios::trunc);
        if (!transfer->output.is_open()) {
            spdlog::error("TransferManager: Failed to open file for writing: {}", transfer->path);
            throw PeerSyncError(ErrorKind::IO, "Failed to open file for writing: " + transfer->path);
        }

        transfer->status = TransferStatus::InProgress;
        transfer->startTime = Clock::now();
        transfer->lastUpdateTime = transfer->startTime;
        m_transfers[transfer->fileId] = transfer;

        spdlog::info("TransferManager: Prepared download {} -> {} ({} bytes) from {}",
                     transfer->fileId, transfer->path, transfer->size, deviceId);

        DownloadTicket ticket;
        ticket.fileId = transfer->fileId;
        ticket.savePath = transfer->path;
        return ticket;
    }

    // ═══════════════════════════════════════════════════════════
    // Chunks
    // ═══════════════════════════════════════════════════════════

    ChunkResult readChunk(const std::string& fileId, int64_t chunkIndex, int64_t chunkSize) {
        if (chunkIndex < 0) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid chunk index");
        }
        if (chunkSize <= 0 || chunkSize > MAX_CHUNK_SIZE) {
            throw PeerSyncError(ErrorKind::Validation,
                                "Invalid chunk size: " + std::to_string(chunkSize));
        }

        auto transfer = find(fileId);
        ChunkResult result;
        TransferProgress snapshot;

        {
            std::lock_guard<std::mutex> lock(transfer->mutex);
            if (transfer->direction != TransferDirection::Upload) {
                throw PeerSyncError(ErrorKind::Validation, "Transfer " + fileId + " is not an upload");
            }
            requireActive(*transfer);
            checkOrder(*transfer, chunkIndex);

            try {
                result = readChunkLocked(*transfer, chunkIndex, chunkSize);
            } catch (const PeerSyncError& e) {
                failLocked(*transfer, e.what());
                throw;
            } catch (const std::exception& e) {
                failLocked(*transfer, e.what());
                throw PeerSyncError(ErrorKind::IO, e.what());
            }
            snapshot = transfer->snapshot();
        }

        notify(fileId, snapshot);
        return result;
    }

    ChunkAck writeChunk(const std::string& fileId, const std::string& chunkData,
                        int64_t chunkIndex, bool finalChunk) {
        if (chunkIndex < 0) {
            throw PeerSyncError(ErrorKind::Validation, "Invalid chunk index");
        }

        auto transfer = find(fileId);
        ChunkAck ack;
        TransferProgress snapshot;

        {
            std::lock_guard<std::mutex> lock(transfer->mutex);
            if (transfer->direction != TransferDirection::Download) {
                throw PeerSyncError(ErrorKind::Validation, "Transfer " + fileId + " is not a download");
            }
            requireActive(*transfer);
            checkOrder(*transfer, chunkIndex);

            try {
                ack = writeChunkLocked(*transfer, chunkData, chunkIndex, finalChunk);
            } catch (const PeerSyncError& e) {
                failLocked(*transfer, e.what());
                throw;
            } catch (const std::exception& e) {
                failLocked(*transfer, e.what());
                throw PeerSyncError(ErrorKind::IO, e.what());
            }
            snapshot = transfer->snapshot();
        }

        notify(fileId, snapshot);
        return ack;
    }

    bool cancel(const std::string& fileId) {
        auto transfer = find(fileId);
        TransferProgress snapshot;

        {
            std::lock_guard<std::mutex> lock(transfer->mutex);
            if (isTerminal(transfer->status)) {
                spdlog::debug("TransferManager: Cancel ignored, {} already {}",
                              fileId, transferStatusToString(transfer->status));
                return false;
            }

            transfer->closeHandles();
            transfer->status = TransferStatus::Canceled;
            transfer->lastUpdateTime = Clock::now();

            if (transfer->direction == TransferDirection::Download) {
                removePartial(*transfer);
            }
            scheduleCleanup(fileId);
            snapshot = transfer->snapshot();
        }

        spdlog::info("TransferManager: Transfer {} canceled", fileId);
        notify(fileId, snapshot);
        return true;
    }

    // ═══════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════

    std::optional<TransferProgress> getProgress(const std::string& fileId) const {
        TransferPtr transfer;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_transfers.find(fileId);
            if (it == m_transfers.end()) {
                return std::nullopt;
            }
            transfer = it->second;
        }
        std::lock_guard<std::mutex> lock(transfer->mutex);
        return transfer->snapshot();
    }

    std::vector<TransferProgress> getAllTransfers() const {
        std::vector<TransferPtr> transfers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            transfers.reserve(m_transfers.size());
            for (const auto& [id, transfer] : m_transfers) {
                transfers.push_back(transfer);
            }
        }

        std::vector<TransferProgress> result;
        result.reserve(transfers.size());
        for (const auto& transfer : transfers) {
            std::lock_guard<std::mutex> lock(transfer->mutex);
            result.push_back(transfer->snapshot());
        }
        return result;
    }

    size_t transferCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_transfers.size();
    }

    std::optional<std::string> getFilePath(const std::string& fileId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_transfers.find(fileId);
        if (it == m_transfers.end()) {
            return std::nullopt;
        }
        return it->second->path;
    }

    std::string getReceiveDirectory() const {
        return m_receiveDir;
    }

    void registerCallback(const std::string& fileId, ProgressCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_transfers.count(fileId)) {
            spdlog::warn("TransferManager: Callback for unknown transfer {}", fileId);
            return;
        }
        m_callbacks[fileId] = std::move(callback);
    }

private:
    TransferPtr find(const std::string& fileId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_transfers.find(fileId);
        if (it == m_transfers.end()) {
            throw PeerSyncError(ErrorKind::NotFound, "Unknown transfer ID: " + fileId);
        }
        return it->second;
    }

    static void requireActive(const FileTransfer& transfer) {
        if (isTerminal(transfer.status)) {
            throw PeerSyncError(ErrorKind::Validation,
                                "Transfer " + transfer.fileId + " is " +
                                transferStatusToString(transfer.status));
        }
    }

    // Порядок задаёт отправитель; расхождение только логируется
    static void checkOrder(FileTransfer& transfer, int64_t chunkIndex) {
        if (chunkIndex != transfer.expectedIndex) {
            spdlog::warn("TransferManager: {} expected chunk {}, got {}",
                         transfer.fileId, transfer.expectedIndex, chunkIndex);
        }
        if (chunkIndex < std::numeric_limits<int64_t>::max()) {
            transfer.expectedIndex = chunkIndex + 1;
        }
    }

    ChunkResult readChunkLocked(FileTransfer& transfer, int64_t chunkIndex, int64_t chunkSize) {
        if (!transfer.input.is_open()) {
            transfer.input.open(transfer.path, std::ios::binary);
            if (!transfer.input.is_open()) {
                throw PeerSyncError(ErrorKind::IO, "Failed to open file: " + transfer.path);
            }
            transfer.status = TransferStatus::InProgress;
        }

        ChunkResult result;
        result.fileId = transfer.fileId;
        result.chunkIndex = chunkIndex;
        transfer.lastUpdateTime = Clock::now();

        // Начало фрагмента за концом файла: смещение не вычисляется
        if (chunkIndex > 0 && chunkIndex > transfer.size / chunkSize) {
            completeLocked(transfer);
            result.finalChunk = true;
            result.progress = transfer.percent();
            result.status = transfer.status;
            return result;
        }

        const int64_t offset = chunkIndex * chunkSize;
        transfer.input.clear();
        transfer.input.seekg(offset, std::ios::beg);
        if (!transfer.input) {
            throw PeerSyncError(ErrorKind::IO, "Seek failed: " + transfer.path);
        }

        std::vector<uint8_t> plain(static_cast<size_t>(chunkSize));
        transfer.input.read(reinterpret_cast<char*>(plain.data()), chunkSize);
        const auto got = static_cast<int64_t>(transfer.input.gcount());
        if (transfer.input.bad()) {
            throw PeerSyncError(ErrorKind::IO, "Read failed: " + transfer.path);
        }
        plain.resize(static_cast<size_t>(got));

        if (got == 0 && chunkIndex > 0) {
            // За концом файла
            completeLocked(transfer);
            result.finalChunk = true;
            result.progress = transfer.percent();
            result.status = transfer.status;
            return result;
        }

        auto cipher = ChunkCodec::encrypt(plain, transfer.key, transfer.iv);
        result.chunkData = Crypto::base64Encode(cipher);

        // Повторное чтение не уменьшает счётчик
        const int64_t reached = std::min(transfer.size, offset + got);
        transfer.bytesTransferred = std::max(transfer.bytesTransferred, reached);

        result.finalChunk = (chunkIndex + 1) * chunkSize >= transfer.size;
        if (result.finalChunk) {
            completeLocked(transfer);
        }

        result.progress = transfer.percent();
        result.status = transfer.status;
        return result;
    }

    ChunkAck writeChunkLocked(FileTransfer& transfer, const std::string& chunkData,
                              int64_t chunkIndex, bool finalChunk) {
        if (!transfer.output.is_open()) {
            throw PeerSyncError(ErrorKind::IO, "Sink is not open: " + transfer.path);
        }

        auto cipher = Crypto::base64Decode(chunkData);
        if (!cipher) {
            throw PeerSyncError(ErrorKind::Validation, "Chunk data is not valid base64");
        }

        std::vector<uint8_t> plain;
        if (!cipher->empty()) {
            plain = ChunkCodec::decrypt(*cipher, transfer.key, transfer.iv);
        }

        // Не выходим за объявленный размер
        auto remaining = static_cast<size_t>(transfer.size - transfer.bytesTransferred);
        if (plain.size() > remaining) {
            spdlog::warn("TransferManager: {} chunk {} exceeds declared size, dropping {} bytes",
                         transfer.fileId, chunkIndex, plain.size() - remaining);
            plain.resize(remaining);
        }

        if (!plain.empty()) {
            transfer.output.write(reinterpret_cast<const char*>(plain.data()),
                                  static_cast<std::streamsize>(plain.size()));
            if (!transfer.output) {
                throw PeerSyncError(ErrorKind::IO, "Write failed: " + transfer.path);
            }
        }

        transfer.bytesTransferred += static_cast<int64_t>(plain.size());
        transfer.lastUpdateTime = Clock::now();

        if (finalChunk) {
            transfer.output.flush();
            if (!transfer.output) {
                throw PeerSyncError(ErrorKind::IO, "Flush failed: " + transfer.path);
            }
            completeLocked(transfer);
            spdlog::info("TransferManager: Download {} completed: {}", transfer.fileId, transfer.path);
        }

        ChunkAck ack;
        ack.fileId = transfer.fileId;
        ack.chunkIndex = chunkIndex;
        ack.status = finalChunk ? "completed" : "received";
        ack.bytesReceived = transfer.bytesTransferred;
        ack.progress = transfer.percent();
        return ack;
    }

    void completeLocked(FileTransfer& transfer) {
        transfer.closeHandles();
        transfer.status = TransferStatus::Completed;
        transfer.lastUpdateTime = Clock::now();
        scheduleCleanup(transfer.fileId);
    }

    void failLocked(FileTransfer& transfer, const std::string& reason) {
        spdlog::error("TransferManager: Transfer {} failed: {}", transfer.fileId, reason);
        transfer.closeHandles();
        transfer.status = TransferStatus::Failed;
        transfer.lastUpdateTime = Clock::now();
        if (transfer.direction == TransferDirection::Download) {
            removePartial(transfer);
        }
        scheduleCleanup(transfer.fileId);
    }

    static void removePartial(const FileTransfer& transfer) {
        std::error_code ec;
        if (fs::exists(transfer.path, ec) && !fs::remove(transfer.path, ec)) {
            spdlog::error("TransferManager: Error removing partial download {}: {}",
                          transfer.path, ec.message());
        }
    }

    std::string uniqueSavePath(const std::string& fileName) const {
        fs::path dir(m_receiveDir);
        fs::path candidate = dir / fileName;

        const fs::path original(fileName);
        const std::string stem = original.stem().string();
        const std::string ext = original.extension().string();

        std::error_code ec;
        for (int counter = 1; fs::exists(candidate, ec) || pathInUse(candidate.string()); ++counter) {
            candidate = dir / (stem + " (" + std::to_string(counter) + ")" + ext);
        }
        return candidate.string();
    }

    // Вызывается под m_mutex
    bool pathInUse(const std::string& path) const {
        for (const auto& [id, transfer] : m_transfers) {
            if (transfer->direction == TransferDirection::Download && transfer->path == path) {
                return true;
            }
        }
        return false;
    }

    void notify(const std::string& fileId, const TransferProgress& snapshot) {
        ProgressCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_callbacks.find(fileId);
            if (it == m_callbacks.end()) {
                return;
            }
            callback = it->second;
        }
        callback(snapshot);
    }

    // ═══════════════════════════════════════════════════════════
    // Delayed cleanup
    // ═══════════════════════════════════════════════════════════

    void scheduleCleanup(const std::string& fileId) {
        {
            std::lock_guard<std::mutex> lock(m_cleanupMutex);
            m_cleanupQueue.emplace(Clock::now() + m_cleanupDelay, fileId);
        }
        m_cleanupCv.notify_all();
    }

    void cleanupLoop() {
        std::unique_lock<std::mutex> lock(m_cleanupMutex);
        while (m_cleanupRunning) {
            if (m_cleanupQueue.empty()) {
                m_cleanupCv.wait(lock, [this]() {
                    return !m_cleanupRunning || !m_cleanupQueue.empty();
                });
                continue;
            }

            auto next = m_cleanupQueue.begin();
            if (Clock::now() < next->first) {
                m_cleanupCv.wait_until(lock, next->first);
                continue;
            }

            std::string fileId = next->second;
            m_cleanupQueue.erase(next);

            lock.unlock();
            removeTransfer(fileId);
            lock.lock();
        }
    }

    void removeTransfer(const std::string& fileId) {
        TransferPtr transfer;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_transfers.find(fileId);
            if (it != m_transfers.end()) {
                transfer = it->second;
                m_transfers.erase(it);
            }
            m_callbacks.erase(fileId);
        }

        if (transfer) {
            std::lock_guard<std::mutex> lock(transfer->mutex);
            transfer->closeHandles();
            spdlog::debug("TransferManager: Removed transfer {}", fileId);
        }
    }

    std::string m_receiveDir;
    std::chrono::milliseconds m_cleanupDelay;

    mutable std::mutex m_mutex;
    std::map<std::string, TransferPtr> m_transfers;
    std::map<std::string, ProgressCallback> m_callbacks;

    std::mutex m_cleanupMutex;
    std::condition_variable m_cleanupCv;
    std::multimap<Clock::time_point, std::string> m_cleanupQueue;
    bool m_cleanupRunning = false;
    std::thread m_cleanupWorker;
};

// ═══════════════════════════════════════════════════════════
// TransferManager public interface
// ═══════════════════════════════════════════════════════════

TransferManager::TransferManager(const std::string& receiveDir, std::chrono::milliseconds cleanupDelay)
    : m_impl(std::make_unique<Impl>(receiveDir, cleanupDelay)) {}

TransferManager::~TransferManager() = default;

TransferDescriptor TransferManager::prepareUpload(const std::string& filePath, const std::string& deviceId) {
    return m_impl->prepareUpload(filePath, deviceId);
}

DownloadTicket TransferManager::prepareDownload(const TransferDescriptor& descriptor, const std::string& deviceId) {
    return m_impl->prepareDownload(descriptor, deviceId);
}

ChunkResult TransferManager::readChunk(const std::string& fileId, int64_t chunkIndex, int64_t chunkSize) {
    return m_impl->readChunk(fileId, chunkIndex, chunkSize);
}

ChunkAck TransferManager::writeChunk(const std::string& fileId, const std::string& chunkDataBase64,
                                     int64_t chunkIndex, bool finalChunk) {
    return m_impl->writeChunk(fileId, chunkDataBase64, chunkIndex, finalChunk);
}

bool TransferManager::cancel(const std::string& fileId) {
    return m_impl->cancel(fileId);
}

std::optional<TransferProgress> TransferManager::getProgress(const std::string& fileId) const {
    return m_impl->getProgress(fileId);
}

std::vector<TransferProgress> TransferManager::getAllTransfers() const {
    return m_impl->getAllTransfers();
}

size_t TransferManager::transferCount() const {
    return m_impl->transferCount();
}

std::optional<std::string> TransferManager::getFilePath(const std::string& fileId) const {
    return m_impl->getFilePath(fileId);
}

std::string TransferManager::getReceiveDirectory() const {
    return m_impl->getReceiveDirectory();
}

void TransferManager::registerCallback(const std::string& fileId, ProgressCallback callback) {
    m_impl->registerCallback(fileId, std::move(callback));
}

TransferManager::Figures TransferManager::computeFigures(int64_t transferred, int64_t total,
                                                         double elapsedSeconds) {
    Figures f;
    if (total > 0) {
        f.percent = static_cast<double>(transferred) / static_cast<double>(total) * 100.0;
    }
    if (elapsedSeconds > 0) {
        f.speedBps = static_cast<double>(transferred) / elapsedSeconds;
    }
    if (f.speedBps > 0 && transferred < total) {
        f.etaSeconds = static_cast<double>(total - transferred) / f.speedBps;
    }
    return f;
}

std::string TransferManager::sanitizeFileName(const std::string& fileName) {
    std::string cleaned = fileName;
    std::replace(cleaned.begin(), cleaned.end(), '\\', '/');
    std::string name = fs::path(cleaned).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return "file";
    }
    return name;
}

} // namespace PeerSync
