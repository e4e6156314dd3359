#pragma once

#include <cstdint>
#include <string>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// Направление передачи файла (с точки зрения хоста)
// ═══════════════════════════════════════════════════════════

enum class TransferDirection : int32_t {
    Upload = 0,     // Хост отдаёт файл пиру
    Download = 1    // Хост принимает файл от пира
};

const char* transferDirectionToString(TransferDirection direction);
bool transferDirectionFromString(const std::string& str, TransferDirection& out);

// ═══════════════════════════════════════════════════════════
// Статус передачи
// initializing → in_progress → {completed | failed | canceled}
// ═══════════════════════════════════════════════════════════

enum class TransferStatus : int32_t {
    Initializing = 0,
    InProgress = 1,
    Completed = 2,
    Failed = 3,
    Canceled = 4
};

const char* transferStatusToString(TransferStatus status);

/// Терминальный статус: дальнейшие изменения запрещены (кроме удаления)
inline bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Canceled;
}

// ═══════════════════════════════════════════════════════════
// Состояние соединения
// ═══════════════════════════════════════════════════════════

enum class ConnectionState : int32_t {
    Disconnected = 0,
    Connected = 1,      // Временное (не привязано к устройству)
    Bound = 2           // Привязано к сопряжённому устройству
};

} // namespace PeerSync
