#ifndef MESHLOAD_TRANSPORT_TRANSPORT_H
#define MESHLOAD_TRANSPORT_TRANSPORT_H

#include "meshload/base/config.h"
#include "meshload/transport/fetch_types.h"
#include "meshload/transport/tcp_transport.h"
#include "meshload/transport/http_transport.h"
#include "meshload/transport/file_transport.h"
#include <variant>
#include <elio/elio.hpp>

namespace meshload {

// Closed set of transports, one alternative per supported protocol tag
using Transport = std::variant<TcpChunkTransport, HttpRangeTransport, LocalFileTransport>;

// nullopt for protocol tags without an implementation (webrtc, bitswap, ...)
std::optional<Transport> create_transport(const CandidatePeer& peer, const TransportConfig& config);

bool is_supported(ProtocolTag tag);

// Open the peer; false when it cannot be reached
elio::coro::task<bool> connect(Transport& transport);

elio::coro::task<FetchResult> fetch_chunk(Transport& transport, ChunkRange range,
                                          std::shared_ptr<CancelToken> cancel);

void disconnect(Transport& transport);

const std::string& peer_id_of(const Transport& transport);

} // namespace meshload

#endif // MESHLOAD_TRANSPORT_TRANSPORT_H
