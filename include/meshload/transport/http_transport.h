#ifndef MESHLOAD_TRANSPORT_HTTP_TRANSPORT_H
#define MESHLOAD_TRANSPORT_HTTP_TRANSPORT_H

#include "meshload/base/config.h"
#include "meshload/transport/fetch_types.h"
#include <string>
#include <elio/elio.hpp>

namespace meshload {

// "bytes=<first>-<last>" for an inclusive range
std::string range_header(uint64_t offset, uint32_t length);

// Maps an HTTP status of a range request onto a fetch error; nullopt for 206
// and for 200 carrying exactly the requested bytes
std::optional<FetchError> classify_http_status(int status, size_t body_size, uint32_t expected);

// Restartable HTTP range download from a URL serving the whole file
class HttpRangeTransport {
public:
    HttpRangeTransport(CandidatePeer peer, const TransportConfig& config);

    const std::string& peer_id() const { return peer_.peer_id; }
    const CandidatePeer& peer() const { return peer_; }

    elio::coro::task<bool> connect();
    elio::coro::task<FetchResult> fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel);
    void disconnect();

private:
    CandidatePeer peer_;
    TransportConfig config_;
    bool connected_ = false;
};

} // namespace meshload

#endif // MESHLOAD_TRANSPORT_HTTP_TRANSPORT_H
