#ifndef MESHLOAD_TRANSPORT_FILE_TRANSPORT_H
#define MESHLOAD_TRANSPORT_FILE_TRANSPORT_H

#include "meshload/base/config.h"
#include "meshload/transport/fetch_types.h"
#include <string>
#include <elio/elio.hpp>

namespace meshload {

// Source backed by a local or mounted copy of the file; address is its path
class LocalFileTransport {
public:
    LocalFileTransport(CandidatePeer peer, const TransportConfig& config);

    const std::string& peer_id() const { return peer_.peer_id; }
    const CandidatePeer& peer() const { return peer_; }

    elio::coro::task<bool> connect();
    elio::coro::task<FetchResult> fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel);
    void disconnect();

    // Synchronous read used by the coroutine; a short read returns what exists
    FetchResult read_range(const ChunkRange& range) const;

private:
    CandidatePeer peer_;
    TransportConfig config_;
    bool connected_ = false;
};

} // namespace meshload

#endif // MESHLOAD_TRANSPORT_FILE_TRANSPORT_H
