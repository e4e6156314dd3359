// test_crypto.cpp — Тесты для Crypto и ChunkCodec

#include <gtest/gtest.h>
#include "peersync/Crypto.h"
#include "peersync/Errors.h"
#include "peersync/Transfer/ChunkCodec.h"
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace PeerSync;
namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════
// Crypto Tests
// ═══════════════════════════════════════════════════════════

TEST(CryptoTest, RandomBytesLengthAndVariety) {
    auto a = Crypto::randomBytes(32);
    auto b = Crypto::randomBytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(b.size(), 32u);
    EXPECT_NE(a, b);
}

TEST(CryptoTest, UuidFormat) {
    std::string uuid = Crypto::generateUUID();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_NE(uuid, Crypto::generateUUID());
}

TEST(CryptoTest, CodeUsesAlphabetAndLength) {
    const std::string alphabet = Crypto::CODE_ALPHABET;
    for (int i = 0; i < 50; ++i) {
        std::string code = Crypto::generateCode(6);
        ASSERT_EQ(code.size(), 6u);
        for (char c : code) {
            EXPECT_NE(alphabet.find(c), std::string::npos) << "Unexpected character " << c;
        }
    }
}

TEST(CryptoTest, CodesDiffer) {
    std::set<std::string> codes;
    for (int i = 0; i < 20; ++i) {
        codes.insert(Crypto::generateCode(8));
    }
    EXPECT_GT(codes.size(), 15u);
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(Crypto::constantTimeEquals("ABC123", "ABC123"));
    EXPECT_FALSE(Crypto::constantTimeEquals("ABC123", "ABC124"));
    EXPECT_FALSE(Crypto::constantTimeEquals("ABC123", "ABC12"));
    EXPECT_TRUE(Crypto::constantTimeEquals("", ""));
}

TEST(CryptoTest, Base64KnownValues) {
    auto encode = [](const std::string& s) {
        return Crypto::base64Encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };
    EXPECT_EQ(encode(""), "");
    EXPECT_EQ(encode("f"), "Zg==");
    EXPECT_EQ(encode("fo"), "Zm8=");
    EXPECT_EQ(encode("foo"), "Zm9v");
    EXPECT_EQ(encode("foobar"), "Zm9vYmFy");

    auto decoded = Crypto::base64Decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foob");
}

TEST(CryptoTest, Base64RejectsMalformed) {
    EXPECT_FALSE(Crypto::base64Decode("abc").has_value());
    EXPECT_FALSE(Crypto::base64Decode("ab!d").has_value());
    EXPECT_FALSE(Crypto::base64Decode("Zg==Zg==").has_value());
}

TEST(CryptoTest, Sha256OfFile) {
    fs::path path = fs::temp_directory_path() / ("peersync_hash_" + Crypto::generateUUID());
    {
        std::ofstream file(path, std::ios::binary);
        file << "abc";
    }

    EXPECT_EQ(Crypto::sha256FileHex(path.string()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    fs::remove(path);

    EXPECT_EQ(Crypto::sha256FileHex(path.string()), "");
}

// ═══════════════════════════════════════════════════════════
// ChunkCodec Tests
// ═══════════════════════════════════════════════════════════

class ChunkCodecTest : public ::testing::Test {
protected:
    std::vector<uint8_t> key = Crypto::randomBytes(CHUNK_KEY_SIZE);
    std::vector<uint8_t> iv = Crypto::randomBytes(CHUNK_IV_SIZE);
};

TEST_F(ChunkCodecTest, DecryptInvertsEncrypt) {
    for (size_t size : {0u, 1u, 15u, 16u, 17u, 1000u, 65536u}) {
        std::vector<uint8_t> chunk = Crypto::randomBytes(size == 0 ? 1 : size);
        chunk.resize(size);

        auto cipher = ChunkCodec::encrypt(chunk, key, iv);
        EXPECT_EQ(cipher.size() % CHUNK_BLOCK_SIZE, 0u);
        EXPECT_GT(cipher.size(), chunk.size());

        EXPECT_EQ(ChunkCodec::decrypt(cipher, key, iv), chunk) << "size " << size;
    }
}

TEST_F(ChunkCodecTest, FullBlockGetsExtraPaddingBlock) {
    std::vector<uint8_t> chunk(32, 0x42);
    auto cipher = ChunkCodec::encrypt(chunk, key, iv);
    EXPECT_EQ(cipher.size(), 48u);
}

TEST_F(ChunkCodecTest, WrongKeySizeThrows) {
    std::vector<uint8_t> shortKey(16, 0x01);
    try {
        ChunkCodec::encrypt({1, 2, 3}, shortKey, iv);
        FAIL() << "Expected PeerSyncError";
    } catch (const PeerSyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}

TEST_F(ChunkCodecTest, CiphertextNotBlockAlignedThrows) {
    std::vector<uint8_t> cipher(20, 0x00);
    EXPECT_THROW(ChunkCodec::decrypt(cipher, key, iv), PeerSyncError);
    EXPECT_THROW(ChunkCodec::decrypt({}, key, iv), PeerSyncError);
}

TEST_F(ChunkCodecTest, BadPaddingReturnsRawBytes) {
    // Шифротекст без корректного дополнения: расшифровка не падает
    auto cipher = ChunkCodec::encrypt(std::vector<uint8_t>(40, 0x11), key, iv);
    std::vector<uint8_t> otherKey = Crypto::randomBytes(CHUNK_KEY_SIZE);

    std::vector<uint8_t> plain;
    ASSERT_NO_THROW(plain = ChunkCodec::decrypt(cipher, otherKey, iv));
    EXPECT_LE(plain.size(), cipher.size());
}

TEST(ChunkCodecPaddingTest, StripPadding) {
    std::vector<uint8_t> good(16, 'a');
    good[14] = 0x02;
    good[15] = 0x02;
    EXPECT_TRUE(ChunkCodec::stripPadding(good));
    EXPECT_EQ(good, std::vector<uint8_t>(14, 'a'));

    std::vector<uint8_t> bad(16, 'a');
    bad[14] = 0x01;
    bad[15] = 0x02;
    EXPECT_FALSE(ChunkCodec::stripPadding(bad));
    EXPECT_EQ(bad.size(), 16u);

    std::vector<uint8_t> zero(16, 0x00);
    EXPECT_FALSE(ChunkCodec::stripPadding(zero));

    std::vector<uint8_t> unaligned = {'a', 'b', 0x02, 0x02};
    EXPECT_FALSE(ChunkCodec::stripPadding(unaligned));
}
