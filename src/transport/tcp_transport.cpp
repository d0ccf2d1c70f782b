#include "meshload/transport/tcp_transport.h"
#include "meshload/base/logger.h"
#include "meshload/integrity/merkle.h"
#include <elio/net/tcp.hpp>
#include <algorithm>
#include <cstring>

namespace meshload {

std::string chunk_id_for(const std::string& file_hash, uint32_t index) {
    return file_hash + ":" + std::to_string(index);
}

ChunkMessageHeader make_request_header(const std::string& chunk_id, uint32_t sequence) {
    ChunkMessageHeader header{};
    header.magic = CHUNK_TRANSFER_MAGIC;
    header.version = CHUNK_TRANSFER_VERSION;
    header.message_type = static_cast<uint32_t>(ChunkMessageType::Request);
    header.chunk_id_length = static_cast<uint32_t>(chunk_id.size());
    header.data_length = 0;  // No data in request
    header.sequence_number = sequence;
    header.flags = 0;
    return header;
}

std::optional<std::pair<std::string, uint16_t>> parse_host_port(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return std::nullopt;
    }
    std::string host = address.substr(0, colon);
    std::string port_str = address.substr(colon + 1);
    if (!std::all_of(port_str.begin(), port_str.end(), ::isdigit) || port_str.size() > 5) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return std::make_pair(host, static_cast<uint16_t>(port));
}

TcpChunkTransport::TcpChunkTransport(CandidatePeer peer, const TransportConfig& config)
    : peer_(std::move(peer)), config_(config) {
    auto hp = parse_host_port(peer_.address);
    if (hp) {
        host_ = hp->first;
        port_ = hp->second;
    }
}

elio::coro::task<bool> TcpChunkTransport::connect() {
    if (port_ == 0) {
        Logger::instance().warning("Invalid CHKP address for peer " + peer_.peer_id + ": " + peer_.address);
        co_return false;
    }

    elio::net::tcp_options opts;
    opts.no_delay = true;

    // Reachability probe; the connection is not kept
    auto connect_result = co_await elio::net::tcp_connect(host_, port_, opts);
    if (!connect_result) {
        Logger::instance().warning("Failed to connect to peer: " + peer_.peer_id + " at " + peer_.address);
        co_return false;
    }
    co_await connect_result->close();

    connected_ = true;
    Logger::instance().debug("Peer reachable: " + peer_.peer_id + " at " + peer_.address);
    co_return true;
}

elio::coro::task<FetchResult> TcpChunkTransport::fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel) {
    if (!connected_) {
        co_return FetchResult::failure(FetchError::ConnectionLost);
    }

    try {
        elio::net::tcp_options opts;
        opts.no_delay = true;

        auto connect_result = co_await elio::net::tcp_connect(host_, port_, opts);
        if (!connect_result) {
            Logger::instance().warning("Lost connection to peer: " + peer_.peer_id);
            co_return FetchResult::failure(FetchError::ConnectionLost);
        }
        elio::net::tcp_stream& stream = *connect_result;

        std::string chunk_id = chunk_id_for(range.file_hash, range.index);
        ChunkMessageHeader header = make_request_header(chunk_id, ++sequence_);

        auto write_result = co_await stream.write(&header, sizeof(header));
        if (write_result.result != sizeof(header)) {
            Logger::instance().warning("Failed to send request header to peer: " + peer_.peer_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::ConnectionLost);
        }

        auto id_result = co_await stream.write(chunk_id.data(), chunk_id.size());
        if (id_result.result != static_cast<ssize_t>(chunk_id.size())) {
            Logger::instance().warning("Failed to send chunk_id to peer: " + peer_.peer_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::ConnectionLost);
        }

        ChunkMessageHeader resp_header{};
        auto read_result = co_await stream.read(&resp_header, sizeof(resp_header));
        if (read_result.result != sizeof(resp_header)) {
            Logger::instance().warning("Failed to read response header from peer: " + peer_.peer_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::ConnectionLost);
        }

        if (resp_header.magic != CHUNK_TRANSFER_MAGIC) {
            Logger::instance().warning("Invalid magic in response from peer: " + peer_.peer_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::Corrupt);
        }

        if (resp_header.message_type == static_cast<uint32_t>(ChunkMessageType::Error)) {
            Logger::instance().warning("Peer " + peer_.peer_id + " refused chunk " + chunk_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::PeerRefused);
        }

        if (resp_header.message_type != static_cast<uint32_t>(ChunkMessageType::Response)) {
            Logger::instance().warning("Unexpected message type from peer: " + peer_.peer_id);
            co_await stream.close();
            co_return FetchResult::failure(FetchError::Corrupt);
        }

        // The response echoes the chunk id before the payload
        if (resp_header.chunk_id_length > 0) {
            std::string echoed(resp_header.chunk_id_length, '\0');
            auto echo_result = co_await stream.read(echoed.data(), echoed.size());
            if (echo_result.result != static_cast<ssize_t>(echoed.size())) {
                co_await stream.close();
                co_return FetchResult::failure(FetchError::ConnectionLost);
            }
            if (echoed != chunk_id) {
                Logger::instance().warning("Peer " + peer_.peer_id + " answered " + echoed +
                                           " for " + chunk_id);
                co_await stream.close();
                co_return FetchResult::failure(FetchError::Corrupt);
            }
        }

        uint64_t total_data_length = resp_header.data_length;
        if (total_data_length > range.length) {
            Logger::instance().warning("Oversized chunk from peer " + peer_.peer_id + ": " +
                                       std::to_string(total_data_length) + " bytes");
            co_await stream.close();
            co_return FetchResult::failure(FetchError::Corrupt);
        }

        std::vector<uint8_t> data;
        data.reserve(total_data_length);
        const uint64_t read_block = std::max<uint64_t>(1, config_.read_buffer_size);
        std::vector<uint8_t> buffer(std::min(read_block, std::max<uint64_t>(total_data_length, 1)));

        uint64_t offset = 0;
        while (offset < total_data_length) {
            if (cancel && cancel->is_canceled()) {
                Logger::instance().debug("Transfer cancelled: " + chunk_id);
                co_await stream.close();
                co_return FetchResult::failure(FetchError::Timeout);
            }

            uint64_t read_size = std::min<uint64_t>(buffer.size(), total_data_length - offset);
            auto data_result = co_await stream.read(buffer.data(), read_size);
            if (data_result.result <= 0) {
                Logger::instance().warning("Connection closed while reading data from peer: " + peer_.peer_id);
                co_await stream.close();
                co_return FetchResult::failure(FetchError::ConnectionLost);
            }

            data.insert(data.end(), buffer.begin(), buffer.begin() + data_result.result);
            offset += data_result.result;
        }

        co_await stream.close();

        static const uint8_t zero_hash[32] = {};
        if (std::memcmp(resp_header.hash, zero_hash, sizeof(zero_hash)) != 0) {
            Digest digest = sha256_digest(data.data(), data.size());
            if (std::memcmp(resp_header.hash, digest.data(), digest.size()) != 0) {
                Logger::instance().warning("Hash mismatch in CHKP response from peer " + peer_.peer_id +
                                           " for " + chunk_id);
                co_return FetchResult::failure(FetchError::Corrupt);
            }
        }

        co_return FetchResult::success(std::move(data));

    } catch (const std::exception& e) {
        Logger::instance().error("CHKP fetch failed from peer " + peer_.peer_id + ": " + e.what());
        co_return FetchResult::failure(FetchError::ConnectionLost);
    }
}

void TcpChunkTransport::disconnect() {
    connected_ = false;
}

} // namespace meshload
