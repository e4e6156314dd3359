// ChunkCodec.cpp — AES-256-CBC через OpenSSL EVP

#include "peersync/Transfer/ChunkCodec.h"
#include "peersync/Errors.h"
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <memory>

namespace PeerSync {
namespace ChunkCodec {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

void checkKeyIv(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
    if (key.size() != CHUNK_KEY_SIZE) {
        throw PeerSyncError(ErrorKind::Validation, "Chunk key must be 32 bytes");
    }
    if (iv.size() != CHUNK_IV_SIZE) {
        throw PeerSyncError(ErrorKind::Validation, "Chunk IV must be 16 bytes");
    }
}

} // namespace

std::vector<uint8_t> encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv) {

    checkKeyIv(key, iv);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw PeerSyncError(ErrorKind::IO, "Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw PeerSyncError(ErrorKind::IO, "EVP_EncryptInit_ex failed");
    }

    // Дополнение всегда добавляет от 1 до 16 байт
    std::vector<uint8_t> out(plaintext.size() + CHUNK_BLOCK_SIZE);
    int len = 0;
    int total = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw PeerSyncError(ErrorKind::IO, "EVP_EncryptUpdate failed");
        }
        total = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw PeerSyncError(ErrorKind::IO, "EVP_EncryptFinal_ex failed");
    }
    total += len;

    out.resize(static_cast<size_t>(total));
    return out;
}

bool stripPadding(std::vector<uint8_t>& data) {
    if (data.empty() || data.size() % CHUNK_BLOCK_SIZE != 0) {
        return false;
    }

    uint8_t pad = data.back();
    if (pad == 0 || pad > CHUNK_BLOCK_SIZE) {
        return false;
    }

    for (size_t i = data.size() - pad; i < data.size(); ++i) {
        if (data[i] != pad) {
            return false;
        }
    }

    data.resize(data.size() - pad);
    return true;
}

std::vector<uint8_t> decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv) {

    checkKeyIv(key, iv);

    if (ciphertext.empty() || ciphertext.size() % CHUNK_BLOCK_SIZE != 0) {
        throw PeerSyncError(ErrorKind::Validation, "Ciphertext is not a multiple of the block size");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw PeerSyncError(ErrorKind::IO, "Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw PeerSyncError(ErrorKind::IO, "EVP_DecryptInit_ex failed");
    }

    // Дополнение снимаем вручную, чтобы неверный padding не был ошибкой
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> out(ciphertext.size() + CHUNK_BLOCK_SIZE);
    int len = 0;
    int total = 0;

    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        throw PeerSyncError(ErrorKind::IO, "EVP_DecryptUpdate failed");
    }
    total = len;

    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw PeerSyncError(ErrorKind::IO, "EVP_DecryptFinal_ex failed");
    }
    total += len;
    out.resize(static_cast<size_t>(total));

    if (!stripPadding(out)) {
        spdlog::debug("ChunkCodec: padding not stripped, keeping {} raw bytes", out.size());
    }

    return out;
}

} // namespace ChunkCodec
} // namespace PeerSync
