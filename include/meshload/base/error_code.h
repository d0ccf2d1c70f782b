#ifndef MESHLOAD_BASE_ERROR_CODE_H
#define MESHLOAD_BASE_ERROR_CODE_H

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace meshload {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    Timeout = 1003,
    Canceled = 1004,
    InternalError = 1005,
    InvalidState = 1006,

    // Network errors (2000-2999)
    ConnectionLost = 2001,
    PeerRefused = 2002,
    NoPeersAvailable = 2003,
    UnsupportedProtocol = 2004,

    // Integrity errors (3000-3999)
    CorruptChunk = 3001,
    FileCorruption = 3002,
    DecryptionFailed = 3003,
    InvalidDescriptor = 3004,

    // Download errors (4000-4999)
    InsufficientReputationPeers = 4001,
    RetriesExhausted = 4002,
    SessionNotFound = 4003,

    // Storage errors (5000-5999)
    StorageError = 5001,
    SnapshotError = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Retryable errors go back through peer reassignment instead of failing the session
bool is_retryable(ErrorCode code);

class MeshLoadError : public std::exception {
public:
    MeshLoadError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

// Terminal failure of a download session, with enough context to diagnose it
struct SessionError {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::optional<uint32_t> chunk_index;
    std::optional<std::string> peer_id;

    std::string describe() const;
};

} // namespace meshload

namespace std {
template <>
struct is_error_code_enum<meshload::ErrorCode> : true_type {};
} // namespace std

#endif // MESHLOAD_BASE_ERROR_CODE_H
