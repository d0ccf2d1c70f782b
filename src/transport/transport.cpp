#include "meshload/transport/transport.h"
#include "meshload/base/logger.h"

namespace meshload {

bool is_supported(ProtocolTag tag) {
    switch (tag) {
        case ProtocolTag::Tcp:
        case ProtocolTag::Http:
        case ProtocolTag::File:
            return true;
        default:
            return false;
    }
}

std::optional<Transport> create_transport(const CandidatePeer& peer, const TransportConfig& config) {
    switch (peer.protocol) {
        case ProtocolTag::Tcp:
            return Transport(std::in_place_type<TcpChunkTransport>, peer, config);
        case ProtocolTag::Http:
            return Transport(std::in_place_type<HttpRangeTransport>, peer, config);
        case ProtocolTag::File:
            return Transport(std::in_place_type<LocalFileTransport>, peer, config);
        default:
            Logger::instance().warning("No transport for protocol " + to_string(peer.protocol) +
                                       " (peer " + peer.peer_id + ")");
            return std::nullopt;
    }
}

// The visitors return the member coroutine unstarted; the caller awaits it
// while the transport is still alive.
elio::coro::task<bool> connect(Transport& transport) {
    return std::visit([](auto& t) { return t.connect(); }, transport);
}

elio::coro::task<FetchResult> fetch_chunk(Transport& transport, ChunkRange range,
                                          std::shared_ptr<CancelToken> cancel) {
    return std::visit([&](auto& t) { return t.fetch(std::move(range), std::move(cancel)); }, transport);
}

void disconnect(Transport& transport) {
    std::visit([](auto& t) { t.disconnect(); }, transport);
}

const std::string& peer_id_of(const Transport& transport) {
    return std::visit([](const auto& t) -> const std::string& { return t.peer_id(); }, transport);
}

} // namespace meshload
