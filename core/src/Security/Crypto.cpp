// Crypto.cpp — Криптографические утилиты через OpenSSL

#include "peersync/Crypto.h"
#include <spdlog/spdlog.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <fstream>
#include <stdexcept>
#include <cstring>
#include <cstdio>

#ifdef _WIN32
#include <rpc.h>
#pragma comment(lib, "rpcrt4.lib")
#else
#include <uuid/uuid.h>
#endif

namespace PeerSync {
namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) return result;
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

std::string generateUUID() {
#ifdef _WIN32
    UUID uuid;
    UuidCreate(&uuid);
    RPC_CSTR uuidStr;
    UuidToStringA(&uuid, &uuidStr);
    std::string result(reinterpret_cast<char*>(uuidStr));
    RpcStringFreeA(&uuidStr);
    return result;
#else
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
#endif
}

std::string generateCode(size_t length) {
    const size_t alphabetSize = std::strlen(CODE_ALPHABET);
    // Отбрасываем байты >= limit, чтобы не было смещения по модулю
    const size_t limit = 256 - (256 % alphabetSize);

    std::string code;
    code.reserve(length);
    while (code.size() < length) {
        auto bytes = randomBytes(length * 2);
        for (uint8_t b : bytes) {
            if (b >= limit) continue;
            code.push_back(CODE_ALPHABET[b % alphabetSize]);
            if (code.size() == length) break;
        }
    }
    return code;
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ═══════════════════════════════════════════════════════════
// Base64
// ═══════════════════════════════════════════════════════════

static const char* B64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64Encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(((size + 2) / 3) * 4);

    for (size_t i = 0; i < size; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < size) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < size) n |= data[i + 2];

        result.push_back(B64_CHARS[(n >> 18) & 0x3F]);
        result.push_back(B64_CHARS[(n >> 12) & 0x3F]);
        result.push_back(i + 1 < size ? B64_CHARS[(n >> 6) & 0x3F] : '=');
        result.push_back(i + 2 < size ? B64_CHARS[n & 0x3F] : '=');
    }

    return result;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

static int b64Index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<std::vector<uint8_t>> base64Decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve((input.size() / 4) * 3);

    for (size_t i = 0; i < input.size(); i += 4) {
        bool last = (i + 4 == input.size());
        int a = b64Index(input[i]);
        int b = b64Index(input[i + 1]);
        if (a < 0 || b < 0) return std::nullopt;

        uint32_t n = (static_cast<uint32_t>(a) << 18) | (static_cast<uint32_t>(b) << 12);
        result.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));

        if (input[i + 2] == '=') {
            // "xx==" допустимо только в последней группе
            if (!last || input[i + 3] != '=') return std::nullopt;
            continue;
        }
        int c = b64Index(input[i + 2]);
        if (c < 0) return std::nullopt;
        n |= static_cast<uint32_t>(c) << 6;
        result.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));

        if (input[i + 3] == '=') {
            if (!last) return std::nullopt;
            continue;
        }
        int d = b64Index(input[i + 3]);
        if (d < 0) return std::nullopt;
        n |= static_cast<uint32_t>(d);
        result.push_back(static_cast<uint8_t>(n & 0xFF));
    }

    return result;
}

// ═══════════════════════════════════════════════════════════
// Hashing
// ═══════════════════════════════════════════════════════════

std::string toHex(const uint8_t* data, size_t size) {
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        char buf[3];
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        hex.append(buf);
    }
    return hex;
}

std::string sha256FileHex(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return "";
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }
        if (file.eof()) break;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    EVP_MD_CTX_free(ctx);

    return toHex(hash, length);
}

} // namespace Crypto
} // namespace PeerSync
