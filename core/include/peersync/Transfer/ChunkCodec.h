// ChunkCodec.h — Шифрование фрагментов файла (AES-256-CBC)

#pragma once

#include "../export.h"
#include <vector>
#include <cstddef>
#include <cstdint>

namespace PeerSync {

constexpr std::size_t CHUNK_KEY_SIZE = 32;     // AES-256
constexpr std::size_t CHUNK_IV_SIZE = 16;      // Блок AES
constexpr std::size_t CHUNK_BLOCK_SIZE = 16;

// ═══════════════════════════════════════════════════════════
// ChunkCodec — симметричное шифрование одного фрагмента
// ═══════════════════════════════════════════════════════════

/// Каждый фрагмент шифруется независимо, с PKCS#7-дополнением до размера блока.
/// Один и тот же key/iv используется для всех фрагментов одной передачи.
namespace ChunkCodec {

/// Зашифровать фрагмент
/// @throws PeerSyncError(Validation) при неверной длине ключа/IV
/// @throws PeerSyncError(IO) при ошибке OpenSSL
PS_API std::vector<uint8_t> encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

/// Расшифровать фрагмент и снять дополнение.
/// Если дополнение некорректно, возвращаются расшифрованные байты как есть.
/// @throws PeerSyncError(Validation) при неверной длине ключа/IV или шифротекста
PS_API std::vector<uint8_t> decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

/// Снять PKCS#7-дополнение
/// @return false если дополнение некорректно (данные не меняются)
PS_API bool stripPadding(std::vector<uint8_t>& data);

} // namespace ChunkCodec
} // namespace PeerSync
