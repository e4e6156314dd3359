// test_storage.cpp — Тесты для AppStorage и Config

#include <gtest/gtest.h>
#include "peersync/AppStorage.h"
#include "peersync/Config.h"
#include "peersync/Crypto.h"
#include "peersync/Errors.h"
#include <filesystem>
#include <fstream>
#include <vector>
#include <string>

using namespace PeerSync;
namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════
// AppStorage Tests
// ═══════════════════════════════════════════════════════════

class AppStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = (fs::temp_directory_path() / ("peersync_storage_" + Crypto::generateUUID())).string();
        storage = std::make_unique<AppStorage>(dir);
    }

    void TearDown() override {
        storage.reset();
        fs::remove_all(dir);
    }

    std::string dir;
    std::unique_ptr<AppStorage> storage;
};

TEST_F(AppStorageTest, CreatesDirectory) {
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_EQ(storage->getDirectory(), dir);
}

TEST_F(AppStorageTest, StoreAndRetrieve) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

    ASSERT_TRUE(storage->store("test.key1", data));

    auto retrieved = storage->retrieve("test.key1");
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(*retrieved, data);
}

TEST_F(AppStorageTest, RetrieveNonExistent) {
    EXPECT_FALSE(storage->retrieve("non.existent.key").has_value());
}

TEST_F(AppStorageTest, ExistsAndRemove) {
    EXPECT_FALSE(storage->exists("test.key2"));
    storage->storeString("test.key2", "value");
    EXPECT_TRUE(storage->exists("test.key2"));

    ASSERT_TRUE(storage->remove("test.key2"));
    EXPECT_FALSE(storage->exists("test.key2"));

    // Удаление несуществующего ключа должно быть OK
    EXPECT_TRUE(storage->remove("test.key2"));
}

TEST_F(AppStorageTest, StoreStringOverwrites) {
    ASSERT_TRUE(storage->storeString(AppStorage::KEY_PAIRING_CODE, "ABC123"));
    ASSERT_TRUE(storage->storeString(AppStorage::KEY_PAIRING_CODE, "XYZ789"));

    auto value = storage->retrieveString(AppStorage::KEY_PAIRING_CODE);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "XYZ789");
}

TEST_F(AppStorageTest, NoTemporaryFileLeftAfterStore) {
    ASSERT_TRUE(storage->storeString(AppStorage::KEY_DEVICE_ID, "device-1"));

    EXPECT_TRUE(fs::exists(storage->pathFor(AppStorage::KEY_DEVICE_ID)));
    EXPECT_FALSE(fs::exists(storage->pathFor(AppStorage::KEY_DEVICE_ID) + ".tmp"));
}

TEST_F(AppStorageTest, KeyCannotEscapeDirectory) {
    std::string path = storage->pathFor("../outside");
    EXPECT_EQ(fs::path(path).parent_path().string(), dir);
}

// ═══════════════════════════════════════════════════════════
// Config Tests
// ═══════════════════════════════════════════════════════════

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("peersync_config_" + Crypto::generateUUID());
        fs::create_directories(dir);
        path = (dir / Config::FILE_NAME).string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void writeFile(const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    fs::path dir;
    std::string path;
};

TEST_F(ConfigTest, CreatesDefaultsWhenMissing) {
    Config config(path);
    ASSERT_TRUE(config.load());
    EXPECT_TRUE(fs::exists(path));

    Settings s = config.get();
    EXPECT_EQ(s.port, 8765);
    EXPECT_EQ(s.pairingCodeLength, 6);
    EXPECT_EQ(s.cleanupDelaySeconds, 60);
    EXPECT_EQ(s.clipboardPollMs, 500);
    EXPECT_TRUE(s.clipboardSync);
    EXPECT_TRUE(s.notificationMirroring);
    EXPECT_TRUE(s.autoReconnect);
    EXPECT_EQ(s.maxFailedPairingAttempts, 0);
    EXPECT_TRUE(s.adminLoopbackOnly);
}

TEST_F(ConfigTest, ReadsValuesAndKeepsDefaultsForMissingKeys) {
    writeFile(R"({"port": 9000, "clipboard_sync": false, "receive_dir": "/tmp/in"})");

    Config config(path);
    ASSERT_TRUE(config.load());

    Settings s = config.get();
    EXPECT_EQ(s.port, 9000);
    EXPECT_FALSE(s.clipboardSync);
    EXPECT_EQ(s.receiveDir, "/tmp/in");
    EXPECT_EQ(config.resolvedReceiveDir(), "/tmp/in");
    EXPECT_TRUE(s.notificationMirroring);
    EXPECT_EQ(s.logLevel, "info");
}

TEST_F(ConfigTest, WrongTypeIsIgnored) {
    auto parsed = Config::parse(R"({"port": "not a number", "auto_reconnect": false})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->port, 8765);
    EXPECT_FALSE(parsed->autoReconnect);
}

TEST_F(ConfigTest, CorruptFileKeepsDefaults) {
    writeFile("{ not json");

    Config config(path);
    EXPECT_FALSE(config.load());
    EXPECT_EQ(config.get().port, 8765);
}

TEST_F(ConfigTest, SetSettingPersists) {
    {
        Config config(path);
        ASSERT_TRUE(config.load());
        config.setSetting("notification_mirroring", false);
        auto value = config.getSetting("notification_mirroring");
        ASSERT_TRUE(value.has_value());
        EXPECT_FALSE(*value);
    }

    Config reloaded(path);
    ASSERT_TRUE(reloaded.load());
    EXPECT_FALSE(reloaded.get().notificationMirroring);
}

TEST_F(ConfigTest, UnknownSettingThrows) {
    Config config(path);
    config.load();

    try {
        config.setSetting("port", true);
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
    EXPECT_FALSE(config.getSetting("unknown").has_value());
}

TEST_F(ConfigTest, DefaultReceiveDirIsUnderDownloads) {
    std::string receiveDir = Config::defaultReceiveDir();
    EXPECT_EQ(fs::path(receiveDir).filename().string(), "PeerSync");
}
