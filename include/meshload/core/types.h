#ifndef MESHLOAD_CORE_TYPES_H
#define MESHLOAD_CORE_TYPES_H

#include "meshload/base/error_code.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// Transport protocol a candidate peer speaks
enum class ProtocolTag {
    Tcp,          // CHKP chunk protocol
    Http,         // HTTP range requests
    File,         // local or mounted file
    WebRtc,
    Bitswap,
    BitTorrent,
    Ed2k
};

std::string to_string(ProtocolTag tag);
std::optional<ProtocolTag> parse_protocol_tag(const std::string& name);

struct CandidatePeer {
    std::string peer_id;
    ProtocolTag protocol = ProtocolTag::Tcp;
    std::string address;  // host:port, URL or path depending on protocol

    bool operator==(const CandidatePeer& other) const {
        return peer_id == other.peer_id && protocol == other.protocol && address == other.address;
    }
};

enum class IntegrityScheme {
    ChunkHashes,  // per-chunk SHA-256, whole file checked against file_hash
    MerkleRoot    // chunk_hashes are Merkle leaves, whole file checked against merkle_root
};

struct IntegrityManifest {
    IntegrityScheme scheme = IntegrityScheme::ChunkHashes;
    std::vector<std::string> chunk_hashes;  // lowercase hex, one per chunk
    std::string merkle_root;                // lowercase hex, MerkleRoot scheme only
};

// Immutable description of a content-addressed file
struct FileDescriptor {
    std::string file_hash;   // SHA-256 hex of the plaintext-on-wire content
    std::string file_name;
    uint64_t size = 0;
    uint32_t chunk_size = 0;
    uint32_t total_chunks = 0;
    IntegrityManifest manifest;
    std::vector<CandidatePeer> peers;
    bool encrypted = false;

    uint64_t chunk_offset(uint32_t index) const;
    uint32_t chunk_length(uint32_t index) const;
};

enum class SessionStatus {
    Queued,
    Initializing,
    Downloading,
    Paused,
    Verifying,
    Completed,
    Failed,
    Canceled
};

std::string to_string(SessionStatus status);
bool is_terminal(SessionStatus status);

enum class ChunkStatus {
    Pending,
    InFlight,
    Completed,
    Failed
};

std::string to_string(ChunkStatus status);

// Errors a transport adapter reports for one chunk fetch
enum class FetchError {
    Timeout,
    ConnectionLost,
    PeerRefused,
    Corrupt
};

std::string to_string(FetchError error);
ErrorCode to_error_code(FetchError error);

enum class TransferOutcome {
    Success,
    Failure,
    Corrupt
};

// One finished transfer attempt, fed to the reputation engine and payment hook
struct TransferEvent {
    WallTime timestamp;
    std::string peer_id;
    uint64_t bytes = 0;
    uint64_t duration_ms = 0;
    TransferOutcome outcome = TransferOutcome::Success;
    FetchError reason = FetchError::Timeout;   // Failure outcomes only
};

// Lowercase hex helpers shared by integrity and persistence code
std::string to_hex(const uint8_t* data, size_t size);
std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);
bool is_sha256_hex(const std::string& value);

} // namespace meshload

#endif // MESHLOAD_CORE_TYPES_H
