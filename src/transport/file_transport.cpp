#include "meshload/transport/file_transport.h"
#include "meshload/base/logger.h"
#include <filesystem>
#include <fstream>

namespace meshload {

LocalFileTransport::LocalFileTransport(CandidatePeer peer, const TransportConfig& config)
    : peer_(std::move(peer)), config_(config) {}

elio::coro::task<bool> LocalFileTransport::connect() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(peer_.address, ec)) {
        Logger::instance().warning("File source for peer " + peer_.peer_id + " not found: " + peer_.address);
        co_return false;
    }
    connected_ = true;
    co_return true;
}

FetchResult LocalFileTransport::read_range(const ChunkRange& range) const {
    std::ifstream file(peer_.address, std::ios::binary);
    if (!file.is_open()) {
        return FetchResult::failure(FetchError::ConnectionLost);
    }

    std::vector<uint8_t> data(range.length);
    file.seekg(static_cast<std::streamoff>(range.offset));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(range.length));
    auto got = file.gcount();
    if (got < 0) {
        return FetchResult::failure(FetchError::ConnectionLost);
    }
    data.resize(static_cast<size_t>(got));
    return FetchResult::success(std::move(data));
}

elio::coro::task<FetchResult> LocalFileTransport::fetch(ChunkRange range, std::shared_ptr<CancelToken> cancel) {
    if (!connected_) {
        co_return FetchResult::failure(FetchError::ConnectionLost);
    }
    if (cancel && cancel->is_canceled()) {
        co_return FetchResult::failure(FetchError::Timeout);
    }
    co_return read_range(range);
}

void LocalFileTransport::disconnect() {
    connected_ = false;
}

} // namespace meshload
