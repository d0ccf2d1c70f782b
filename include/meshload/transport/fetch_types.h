#ifndef MESHLOAD_TRANSPORT_FETCH_TYPES_H
#define MESHLOAD_TRANSPORT_FETCH_TYPES_H

#include "meshload/core/types.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// Byte range of one chunk of a file
struct ChunkRange {
    std::string file_hash;
    uint32_t index = 0;
    uint64_t offset = 0;
    uint32_t length = 0;
};

struct FetchResult {
    std::vector<uint8_t> data;
    std::optional<FetchError> error;

    bool ok() const { return !error.has_value(); }

    static FetchResult success(std::vector<uint8_t> bytes) {
        FetchResult r;
        r.data = std::move(bytes);
        return r;
    }
    static FetchResult failure(FetchError e) {
        FetchResult r;
        r.error = e;
        return r;
    }
};

// Cancellation flag shared between the coordinator and a running fetch.
// A token with a parent is also canceled when the parent is.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<CancelToken> parent) : parent_(std::move(parent)) {}

    void cancel() { canceled_.store(true, std::memory_order_release); }
    bool is_canceled() const {
        return canceled_.load(std::memory_order_acquire) || (parent_ && parent_->is_canceled());
    }

private:
    std::atomic<bool> canceled_{false};
    std::shared_ptr<CancelToken> parent_;
};

} // namespace meshload

#endif // MESHLOAD_TRANSPORT_FETCH_TYPES_H
