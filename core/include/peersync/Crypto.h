// Crypto.h — Криптографические утилиты (OpenSSL)

#pragma once

#include "export.h"
#include <string>
#include <cstddef>
#include <vector>
#include <optional>
#include <cstdint>

namespace PeerSync {
namespace Crypto {

/// Алфавит кода сопряжения (без похожих символов 0/O, 1/I)
constexpr const char* CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

/// Генерация криптографически стойких случайных байт
/// @throws std::runtime_error если RAND_bytes не смог
PS_API std::vector<uint8_t> randomBytes(size_t count);

/// Генерация UUID v4
PS_API std::string generateUUID();

/// Случайный код фиксированной длины из CODE_ALPHABET (без смещения по модулю)
PS_API std::string generateCode(size_t length);

/// Сравнение строк за постоянное время
PS_API bool constantTimeEquals(const std::string& a, const std::string& b);

/// Base64 (стандартный алфавит, с '=')
PS_API std::string base64Encode(const std::vector<uint8_t>& data);
PS_API std::string base64Encode(const uint8_t* data, size_t size);

/// Декодирование Base64
/// @return nullopt при некорректной длине или символах
PS_API std::optional<std::vector<uint8_t>> base64Decode(const std::string& input);

/// SHA-256 файла в hex (потоковое чтение)
/// @return пустая строка если файл не читается
PS_API std::string sha256FileHex(const std::string& filePath);

/// Hex-представление байт
PS_API std::string toHex(const uint8_t* data, size_t size);

} // namespace Crypto
} // namespace PeerSync
