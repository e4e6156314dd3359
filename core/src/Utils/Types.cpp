#include "peersync/Types.h"
#include "peersync/Errors.h"
#include <algorithm>
#include <cctype>

namespace PeerSync {

// ═══════════════════════════════════════════════════════════
// TransferDirection
// ═══════════════════════════════════════════════════════════

const char* transferDirectionToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Upload:   return "upload";
        case TransferDirection::Download: return "download";
        default:                          return "unknown";
    }
}

bool transferDirectionFromString(const std::string& str, TransferDirection& out) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "upload") {
        out = TransferDirection::Upload;
        return true;
    }
    if (lower == "download") {
        out = TransferDirection::Download;
        return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════
// TransferStatus
// ═══════════════════════════════════════════════════════════

const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Initializing: return "initializing";
        case TransferStatus::InProgress:   return "in_progress";
        case TransferStatus::Completed:    return "completed";
        case TransferStatus::Failed:       return "failed";
        case TransferStatus::Canceled:     return "canceled";
        default:                           return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// ErrorKind
// ═══════════════════════════════════════════════════════════

const char* errorKindCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "VALIDATION_ERROR";
        case ErrorKind::NotFound:   return "NOT_FOUND";
        case ErrorKind::IO:         return "IO_ERROR";
        case ErrorKind::Auth:       return "AUTH_REQUIRED";
        case ErrorKind::Protocol:   return "PROTOCOL_ERROR";
        default:                    return "INTERNAL_ERROR";
    }
}

} // namespace PeerSync
