#include "meshload/core/types.h"
#include <algorithm>
#include <cctype>

namespace meshload {

std::string to_string(ProtocolTag tag) {
    switch (tag) {
        case ProtocolTag::Tcp: return "tcp";
        case ProtocolTag::Http: return "http";
        case ProtocolTag::File: return "file";
        case ProtocolTag::WebRtc: return "webrtc";
        case ProtocolTag::Bitswap: return "bitswap";
        case ProtocolTag::BitTorrent: return "bittorrent";
        case ProtocolTag::Ed2k: return "ed2k";
    }
    return "unknown";
}

std::optional<ProtocolTag> parse_protocol_tag(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "tcp") return ProtocolTag::Tcp;
    if (lower == "http" || lower == "https") return ProtocolTag::Http;
    if (lower == "file") return ProtocolTag::File;
    if (lower == "webrtc") return ProtocolTag::WebRtc;
    if (lower == "bitswap") return ProtocolTag::Bitswap;
    if (lower == "bittorrent") return ProtocolTag::BitTorrent;
    if (lower == "ed2k") return ProtocolTag::Ed2k;
    return std::nullopt;
}

uint64_t FileDescriptor::chunk_offset(uint32_t index) const {
    return static_cast<uint64_t>(index) * chunk_size;
}

uint32_t FileDescriptor::chunk_length(uint32_t index) const {
    uint64_t offset = chunk_offset(index);
    if (offset >= size) return 0;
    return static_cast<uint32_t>(std::min<uint64_t>(chunk_size, size - offset));
}

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Queued: return "Queued";
        case SessionStatus::Initializing: return "Initializing";
        case SessionStatus::Downloading: return "Downloading";
        case SessionStatus::Paused: return "Paused";
        case SessionStatus::Verifying: return "Verifying";
        case SessionStatus::Completed: return "Completed";
        case SessionStatus::Failed: return "Failed";
        case SessionStatus::Canceled: return "Canceled";
    }
    return "Unknown";
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::Completed ||
           status == SessionStatus::Failed ||
           status == SessionStatus::Canceled;
}

std::string to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "Pending";
        case ChunkStatus::InFlight: return "InFlight";
        case ChunkStatus::Completed: return "Completed";
        case ChunkStatus::Failed: return "Failed";
    }
    return "Unknown";
}

std::string to_string(FetchError error) {
    switch (error) {
        case FetchError::Timeout: return "timeout";
        case FetchError::ConnectionLost: return "connection lost";
        case FetchError::PeerRefused: return "peer refused";
        case FetchError::Corrupt: return "corrupt";
    }
    return "unknown";
}

ErrorCode to_error_code(FetchError error) {
    switch (error) {
        case FetchError::Timeout: return ErrorCode::Timeout;
        case FetchError::ConnectionLost: return ErrorCode::ConnectionLost;
        case FetchError::PeerRefused: return ErrorCode::PeerRefused;
        case FetchError::Corrupt: return ErrorCode::CorruptChunk;
    }
    return ErrorCode::InternalError;
}

std::string to_hex(const uint8_t* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool is_sha256_hex(const std::string& value) {
    return value.size() == 64 && from_hex(value).has_value();
}

} // namespace meshload
