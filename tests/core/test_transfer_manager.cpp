// test_transfer_manager.cpp — Тесты для TransferManager

#include <gtest/gtest.h>
#include "peersync/Transfer/TransferManager.h"
#include "peersync/Transfer/ChunkCodec.h"
#include "peersync/Crypto.h"
#include "peersync/Errors.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <mutex>
#include <limits>

using namespace PeerSync;
namespace fs = std::filesystem;

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("peersync_transfer_" + Crypto::generateUUID());
        sourceDir = root / "source";
        receiveDir = root / "receive";
        fs::create_directories(sourceDir);

        sender = std::make_unique<TransferManager>(
            (root / "sender_inbox").string(), std::chrono::milliseconds(200));
        receiver = std::make_unique<TransferManager>(
            receiveDir.string(), std::chrono::milliseconds(200));
    }

    void TearDown() override {
        sender.reset();
        receiver.reset();
        fs::remove_all(root);
    }

    std::string createFile(const std::string& name, size_t size) {
        fs::path path = sourceDir / name;
        std::ofstream file(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>((i * 31 + 7) & 0xFF));
        }
        return path.string();
    }

    static std::string readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path root;
    fs::path sourceDir;
    fs::path receiveDir;
    std::unique_ptr<TransferManager> sender;
    std::unique_ptr<TransferManager> receiver;
};

// ═══════════════════════════════════════════════════════════
// Upload
// ═══════════════════════════════════════════════════════════

TEST_F(TransferManagerTest, PrepareUploadDescriptor) {
    std::string path = createFile("photo.jpg", 1000);

    auto descriptor = sender->prepareUpload(path, "device-1");
    EXPECT_FALSE(descriptor.fileId.empty());
    EXPECT_EQ(descriptor.fileName, "photo.jpg");
    EXPECT_EQ(descriptor.fileSize, 1000);
    EXPECT_EQ(descriptor.chunkSize, 65536);
    EXPECT_EQ(descriptor.contentHash, Crypto::sha256FileHex(path));

    auto key = Crypto::base64Decode(descriptor.key);
    auto iv = Crypto::base64Decode(descriptor.iv);
    ASSERT_TRUE(key && iv);
    EXPECT_EQ(key->size(), CHUNK_KEY_SIZE);
    EXPECT_EQ(iv->size(), CHUNK_IV_SIZE);

    auto progress = sender->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->direction, TransferDirection::Upload);
    EXPECT_EQ(progress->status, TransferStatus::Initializing);
    EXPECT_EQ(progress->deviceId, "device-1");
}

TEST_F(TransferManagerTest, PrepareUploadMissingFile) {
    try {
        sender->prepareUpload((sourceDir / "missing.bin").string(), "device-1");
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_EQ(sender->transferCount(), 0u);
}

TEST_F(TransferManagerTest, ChunkIndicesForMultiChunkFile) {
    std::string path = createFile("big.bin", 150000);
    auto descriptor = sender->prepareUpload(path, "device-1");

    auto c0 = sender->readChunk(descriptor.fileId, 0, 65536);
    auto c1 = sender->readChunk(descriptor.fileId, 1, 65536);
    auto c2 = sender->readChunk(descriptor.fileId, 2, 65536);

    EXPECT_FALSE(c0.finalChunk);
    EXPECT_FALSE(c1.finalChunk);
    EXPECT_TRUE(c2.finalChunk);
    EXPECT_EQ(c0.chunkIndex, 0);
    EXPECT_EQ(c2.chunkIndex, 2);
    EXPECT_DOUBLE_EQ(c2.progress, 100.0);

    auto progress = sender->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Completed);
    EXPECT_EQ(progress->bytesTransferred, 150000);
}

TEST_F(TransferManagerTest, ChunkDecryptsToFileContents) {
    std::string path = createFile("small.txt", 100);
    auto descriptor = sender->prepareUpload(path, "device-1");

    auto chunk = sender->readChunk(descriptor.fileId, 0);
    EXPECT_TRUE(chunk.finalChunk);

    auto cipher = Crypto::base64Decode(chunk.chunkData);
    ASSERT_TRUE(cipher.has_value());
    auto plain = ChunkCodec::decrypt(*cipher, *Crypto::base64Decode(descriptor.key),
                                     *Crypto::base64Decode(descriptor.iv));
    EXPECT_EQ(std::string(plain.begin(), plain.end()), readFile(path));
}

TEST_F(TransferManagerTest, ReadPastEndCompletes) {
    std::string path = createFile("exact.bin", 1000);
    auto descriptor = sender->prepareUpload(path, "device-1");

    auto chunk = sender->readChunk(descriptor.fileId, 5, 1000);
    EXPECT_TRUE(chunk.finalChunk);
    EXPECT_TRUE(chunk.chunkData.empty());

    auto progress = sender->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Completed);
}

TEST_F(TransferManagerTest, OversizedChunkSizeRejected) {
    std::string path = createFile("large.bin", 300000);
    auto descriptor = sender->prepareUpload(path, "device-1");

    for (int64_t size : {MAX_CHUNK_SIZE + 1, int64_t(1) << 20, int64_t(1) << 40}) {
        try {
            sender->readChunk(descriptor.fileId, 0, size);
            FAIL() << "Expected PeerSyncError for chunk size " << size;
        } catch (const PeerSyncError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Validation);
        }
    }

    // Отклонённый запрос не портит передачу
    auto progress = sender->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Initializing);
    EXPECT_EQ(progress->bytesTransferred, 0);

    auto chunk = sender->readChunk(descriptor.fileId, 0, MAX_CHUNK_SIZE);
    EXPECT_FALSE(chunk.finalChunk);
    auto cipher = Crypto::base64Decode(chunk.chunkData);
    ASSERT_TRUE(cipher.has_value());
    EXPECT_LE(cipher->size(), static_cast<size_t>(MAX_CHUNK_SIZE) + CHUNK_BLOCK_SIZE);
}

TEST_F(TransferManagerTest, HugeChunkIndexCompletesWithoutReading) {
    std::string path = createFile("tiny.bin", 1000);
    auto first = sender->prepareUpload(path, "device-1");
    auto second = sender->prepareUpload(path, "device-1");

    auto chunk = sender->readChunk(first.fileId, int64_t(1) << 40, MAX_CHUNK_SIZE);
    EXPECT_TRUE(chunk.finalChunk);
    EXPECT_TRUE(chunk.chunkData.empty());

    auto last = sender->readChunk(second.fileId, std::numeric_limits<int64_t>::max(), MAX_CHUNK_SIZE);
    EXPECT_TRUE(last.finalChunk);
    EXPECT_TRUE(last.chunkData.empty());

    for (const auto& id : {first.fileId, second.fileId}) {
        auto progress = sender->getProgress(id);
        ASSERT_TRUE(progress.has_value());
        EXPECT_EQ(progress->status, TransferStatus::Completed);
        EXPECT_EQ(progress->bytesTransferred, 0);
    }
}

TEST_F(TransferManagerTest, ReadChunkOnDownloadIsValidationError) {
    std::string path = createFile("a.bin", 10);
    auto descriptor = sender->prepareUpload(path, "device-1");
    receiver->prepareDownload(descriptor, "device-2");

    try {
        receiver->readChunk(descriptor.fileId, 0);
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }

    // Неверное направление не ломает передачу
    auto progress = receiver->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::InProgress);
}

TEST_F(TransferManagerTest, UnknownTransfer) {
    EXPECT_THROW(sender->readChunk("nope", 0), PeerSyncError);
    EXPECT_THROW(sender->cancel("nope"), PeerSyncError);
    EXPECT_FALSE(sender->getProgress("nope").has_value());
}

// ═══════════════════════════════════════════════════════════
// Download
// ═══════════════════════════════════════════════════════════

TEST_F(TransferManagerTest, FullTransferReproducesFile) {
    std::string path = createFile("report.pdf", 200000);
    auto descriptor = sender->prepareUpload(path, "device-1");
    auto ticket = receiver->prepareDownload(descriptor, "device-1");

    EXPECT_EQ(ticket.fileId, descriptor.fileId);
    EXPECT_EQ(ticket.status, "ready");
    EXPECT_EQ(fs::path(ticket.savePath).parent_path(), receiveDir);

    int64_t last = 0;
    for (int64_t index = 0;; ++index) {
        auto chunk = sender->readChunk(descriptor.fileId, index, descriptor.chunkSize);
        auto ack = receiver->writeChunk(descriptor.fileId, chunk.chunkData, index, chunk.finalChunk);

        EXPECT_GE(ack.bytesReceived, last);
        EXPECT_LE(ack.bytesReceived, descriptor.fileSize);
        last = ack.bytesReceived;

        if (chunk.finalChunk) {
            EXPECT_EQ(ack.status, "completed");
            break;
        }
        EXPECT_EQ(ack.status, "received");
    }

    EXPECT_EQ(readFile(ticket.savePath), readFile(path));
    EXPECT_EQ(Crypto::sha256FileHex(ticket.savePath), descriptor.contentHash);

    auto progress = receiver->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Completed);
    EXPECT_EQ(progress->bytesTransferred, 200000);
}

TEST_F(TransferManagerTest, NameCollisionAddsSuffix) {
    fs::create_directories(receiveDir);
    std::ofstream(receiveDir / "notes.txt") << "existing";

    std::string path = createFile("notes.txt", 10);
    auto first = sender->prepareUpload(path, "device-1");
    auto second = sender->prepareUpload(path, "device-1");

    auto t1 = receiver->prepareDownload(first, "device-1");
    auto t2 = receiver->prepareDownload(second, "device-1");

    EXPECT_EQ(fs::path(t1.savePath).filename().string(), "notes (1).txt");
    EXPECT_EQ(fs::path(t2.savePath).filename().string(), "notes (2).txt");
}

TEST_F(TransferManagerTest, DuplicateFileIdRejected) {
    std::string path = createFile("dup.bin", 10);
    auto descriptor = sender->prepareUpload(path, "device-1");

    receiver->prepareDownload(descriptor, "device-1");
    try {
        receiver->prepareDownload(descriptor, "device-1");
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}

TEST_F(TransferManagerTest, IncompleteDescriptorRejected) {
    TransferDescriptor descriptor;
    descriptor.fileId = "x";
    descriptor.fileName = "x.bin";
    descriptor.fileSize = 10;
    descriptor.key = "short";
    descriptor.iv = Crypto::base64Encode(Crypto::randomBytes(CHUNK_IV_SIZE));

    EXPECT_THROW(receiver->prepareDownload(descriptor, "device-1"), PeerSyncError);
    EXPECT_EQ(receiver->transferCount(), 0u);
}

TEST_F(TransferManagerTest, FileNameIsSanitized) {
    EXPECT_EQ(TransferManager::sanitizeFileName("../../etc/passwd"), "passwd");
    EXPECT_EQ(TransferManager::sanitizeFileName("C:\\Users\\a\\doc.txt"), "doc.txt");
    EXPECT_EQ(TransferManager::sanitizeFileName(".."), "file");
    EXPECT_EQ(TransferManager::sanitizeFileName(""), "file");
}

TEST_F(TransferManagerTest, InvalidChunkDataFailsAndRemovesPartial) {
    std::string path = createFile("c.bin", 100000);
    auto descriptor = sender->prepareUpload(path, "device-1");
    auto ticket = receiver->prepareDownload(descriptor, "device-1");

    auto chunk = sender->readChunk(descriptor.fileId, 0);
    receiver->writeChunk(descriptor.fileId, chunk.chunkData, 0, false);
    ASSERT_TRUE(fs::exists(ticket.savePath));

    EXPECT_THROW(receiver->writeChunk(descriptor.fileId, "***", 1, false), PeerSyncError);

    auto progress = receiver->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Failed);
    EXPECT_FALSE(fs::exists(ticket.savePath));

    // Терминальная передача больше не принимает фрагменты
    EXPECT_THROW(receiver->writeChunk(descriptor.fileId, chunk.chunkData, 1, false), PeerSyncError);
}

// ═══════════════════════════════════════════════════════════
// Cancel и cleanup
// ═══════════════════════════════════════════════════════════

TEST_F(TransferManagerTest, CancelDownloadDeletesPartialAndExpires) {
    std::string path = createFile("movie.mkv", 150000);
    auto descriptor = sender->prepareUpload(path, "device-1");
    auto ticket = receiver->prepareDownload(descriptor, "device-1");

    auto chunk = sender->readChunk(descriptor.fileId, 0);
    receiver->writeChunk(descriptor.fileId, chunk.chunkData, 0, false);
    ASSERT_TRUE(fs::exists(ticket.savePath));

    EXPECT_TRUE(receiver->cancel(descriptor.fileId));
    EXPECT_FALSE(fs::exists(ticket.savePath));

    auto progress = receiver->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::Canceled);

    // Повторная отмена ничего не меняет
    EXPECT_FALSE(receiver->cancel(descriptor.fileId));

    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    EXPECT_FALSE(receiver->getProgress(descriptor.fileId).has_value());
    EXPECT_EQ(receiver->transferCount(), 0u);
}

TEST_F(TransferManagerTest, CallbackReceivesMonotonicProgress) {
    std::string path = createFile("progress.bin", 300000);
    auto descriptor = sender->prepareUpload(path, "device-1");

    std::mutex mutex;
    std::vector<TransferProgress> updates;
    sender->registerCallback(descriptor.fileId, [&](const TransferProgress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        updates.push_back(p);
    });

    for (int64_t index = 0;; ++index) {
        auto chunk = sender->readChunk(descriptor.fileId, index);
        if (chunk.finalChunk) break;
    }

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(updates.size(), 5u);
    for (size_t i = 1; i < updates.size(); ++i) {
        EXPECT_GE(updates[i].bytesTransferred, updates[i - 1].bytesTransferred);
        EXPECT_LE(updates[i].bytesTransferred, updates[i].totalBytes);
    }
    EXPECT_EQ(updates.back().status, TransferStatus::Completed);
}

TEST_F(TransferManagerTest, RereadDoesNotDecreaseProgress) {
    std::string path = createFile("reread.bin", 150000);
    auto descriptor = sender->prepareUpload(path, "device-1");

    sender->readChunk(descriptor.fileId, 0);
    sender->readChunk(descriptor.fileId, 1);
    sender->readChunk(descriptor.fileId, 0);

    auto progress = sender->getProgress(descriptor.fileId);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->bytesTransferred, 131072);
}

TEST_F(TransferManagerTest, ComputeFigures) {
    auto empty = TransferManager::computeFigures(0, 0, 1.0);
    EXPECT_DOUBLE_EQ(empty.percent, 0.0);
    EXPECT_DOUBLE_EQ(empty.etaSeconds, 0.0);

    auto half = TransferManager::computeFigures(500, 1000, 2.0);
    EXPECT_DOUBLE_EQ(half.percent, 50.0);
    EXPECT_DOUBLE_EQ(half.speedBps, 250.0);
    EXPECT_DOUBLE_EQ(half.etaSeconds, 2.0);

    auto stalled = TransferManager::computeFigures(0, 1000, 0.0);
    EXPECT_DOUBLE_EQ(stalled.speedBps, 0.0);
    EXPECT_DOUBLE_EQ(stalled.etaSeconds, 0.0);

    auto done = TransferManager::computeFigures(1000, 1000, 4.0);
    EXPECT_DOUBLE_EQ(done.percent, 100.0);
    EXPECT_DOUBLE_EQ(done.etaSeconds, 0.0);
}
