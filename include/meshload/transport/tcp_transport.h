#ifndef MESHLOAD_TRANSPORT_TCP_TRANSPORT_H
#define MESHLOAD_TRANSPORT_TCP_TRANSPORT_H

#include "meshload/base/config.h"
#include "meshload/transport/fetch_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <elio/elio.hpp>

namespace meshload {

// Chunk transfer protocol constants
static constexpr uint32_t CHUNK_TRANSFER_MAGIC = 0x43484B50;  // "CHKP"
static constexpr uint32_t CHUNK_TRANSFER_VERSION = 1;

// Message types for chunk transfer protocol
enum class ChunkMessageType : uint32_t {
    Request = 1,    // Request chunk from peer
    Response = 2,   // Response with chunk data
    Error = 3,      // Error response
    Ack = 4         // Acknowledgment
};

// Chunk transfer message header
struct ChunkMessageHeader {
    uint32_t magic;              // CHUNK_TRANSFER_MAGIC
    uint32_t version;            // Protocol version
    uint32_t message_type;       // ChunkMessageType
    uint32_t chunk_id_length;    // Length of chunk_id
    uint32_t data_length;        // Length of data (0 for request)
    uint8_t hash[32];            // SHA256 of data, all zero when not supplied
    uint32_t sequence_number;
    uint8_t flags;

    static constexpr uint8_t FLAG_RESUME = 0x01;
    static constexpr uint8_t FLAG_COMPRESSED = 0x02;
    static constexpr uint8_t FLAG_LAST_PART = 0x04;
} __attribute__((packed));

// "<file_hash>:<chunk_index>", the chunk id a CHKP peer serves
std::string chunk_id_for(const std::string& file_hash, uint32_t index);

ChunkMessageHeader make_request_header(const std::string& chunk_id, uint32_t sequence);

// Splits "host:port"; nullopt when the port is missing or invalid
std::optional<std::pair<std::string, uint16_t>> parse_host_port(const std::string& address);

// CHKP client: one TCP connection per chunk request, as the serving side
// closes after each response
class TcpChunkTransport {
public:
    TcpChunkTransport(CandidatePeer peer, const TransportConfig& config);

    const std::string& peer_id() const { return peer_.peer_id; }
    const CandidatePeer& peer() const { return peer_; }

    elio::coro::task<bool> connect();
    elio::coro::task<FetchResult> fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel);
    void disconnect();

private:
    CandidatePeer peer_;
    TransportConfig config_;
    std::string host_;
    uint16_t port_ = 0;
    uint32_t sequence_ = 0;
    bool connected_ = false;
};

} // namespace meshload

#endif // MESHLOAD_TRANSPORT_TCP_TRANSPORT_H
