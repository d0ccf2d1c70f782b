#include "meshload/base/error_code.h"

namespace meshload {

namespace {

class MeshLoadCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "MeshLoad";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const MeshLoadCategory& get_category() {
    static MeshLoadCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Canceled: return "Canceled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::PeerRefused: return "Peer refused";
        case ErrorCode::NoPeersAvailable: return "No peers available";
        case ErrorCode::UnsupportedProtocol: return "Unsupported protocol";
        case ErrorCode::CorruptChunk: return "Corrupt chunk";
        case ErrorCode::FileCorruption: return "File corruption";
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::InvalidDescriptor: return "Invalid descriptor";
        case ErrorCode::InsufficientReputationPeers: return "Insufficient reputation peers";
        case ErrorCode::RetriesExhausted: return "Retries exhausted";
        case ErrorCode::SessionNotFound: return "Session not found";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::SnapshotError: return "Snapshot error";
        default: return "Unknown error";
    }
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionLost:
        case ErrorCode::Timeout:
        case ErrorCode::CorruptChunk:
        case ErrorCode::PeerRefused:
            return true;
        default:
            return false;
    }
}

MeshLoadError::MeshLoadError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* MeshLoadError::what() const noexcept {
    return message_.c_str();
}

std::string SessionError::describe() const {
    std::string out = to_string(code);
    if (!message.empty()) {
        out += ": " + message;
    }
    if (chunk_index) {
        out += " (chunk " + std::to_string(*chunk_index) + ")";
    }
    if (peer_id) {
        out += " (peer " + *peer_id + ")";
    }
    return out;
}

} // namespace meshload
