#include "meshload/transport/http_transport.h"
#include "meshload/base/logger.h"
#include <elio/http/http_client.hpp>

namespace meshload {

namespace {

// Host (with port) and request target of an absolute http(s) URL
std::pair<std::string, std::string> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url.substr(host_start), "/"};
    }
    return {url.substr(host_start, path_start - host_start), url.substr(path_start)};
}

} // anonymous namespace

std::string range_header(uint64_t offset, uint32_t length) {
    uint64_t last = length == 0 ? offset : offset + length - 1;
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(last);
}

std::optional<FetchError> classify_http_status(int status, size_t body_size, uint32_t expected) {
    if (status == 206) {
        return std::nullopt;
    }
    if (status == 200) {
        // Server ignored the Range header; only usable when the file is one chunk
        if (body_size == expected) {
            return std::nullopt;
        }
        return FetchError::PeerRefused;
    }
    if (status == 408 || status == 504) {
        return FetchError::Timeout;
    }
    if (status >= 400 && status < 500) {
        return FetchError::PeerRefused;
    }
    return FetchError::ConnectionLost;
}

HttpRangeTransport::HttpRangeTransport(CandidatePeer peer, const TransportConfig& config)
    : peer_(std::move(peer)), config_(config) {}

elio::coro::task<bool> HttpRangeTransport::connect() {
    auto parsed_url = elio::http::url::parse(peer_.address);
    if (!parsed_url) {
        Logger::instance().warning("Failed to parse URL for peer " + peer_.peer_id + ": " + peer_.address);
        co_return false;
    }
    connected_ = true;
    co_return true;
}

elio::coro::task<FetchResult> HttpRangeTransport::fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel) {
    if (!connected_) {
        co_return FetchResult::failure(FetchError::ConnectionLost);
    }

    auto parsed_url = elio::http::url::parse(peer_.address);
    if (!parsed_url) {
        co_return FetchResult::failure(FetchError::PeerRefused);
    }

    try {
        elio::http::client http_client;
        auto [host, path] = split_url(peer_.address);
        elio::http::request req(elio::http::method::GET, path);
        req.set_host(host);
        req.set_header("Range", range_header(range.offset, range.length));

        auto response = co_await http_client.send(req, *parsed_url);
        if (!response) {
            Logger::instance().warning("No HTTP response from peer " + peer_.peer_id + " for chunk " +
                                       std::to_string(range.index));
            co_return FetchResult::failure(FetchError::ConnectionLost);
        }

        if (cancel && cancel->is_canceled()) {
            co_return FetchResult::failure(FetchError::Timeout);
        }

        auto status = response->status_code();
        std::string body_str = std::string(response->body());
        auto error = classify_http_status(static_cast<int>(status), body_str.size(), range.length);
        if (error) {
            Logger::instance().warning("Range request to peer " + peer_.peer_id + " failed with status: " +
                                       std::to_string(static_cast<int>(status)));
            co_return FetchResult::failure(*error);
        }

        co_return FetchResult::success(std::vector<uint8_t>(body_str.begin(), body_str.end()));

    } catch (const std::exception& e) {
        Logger::instance().error("HTTP fetch failed from peer " + peer_.peer_id + ": " + e.what());
        co_return FetchResult::failure(FetchError::ConnectionLost);
    }
}

void HttpRangeTransport::disconnect() {
    connected_ = false;
}

} // namespace meshload
