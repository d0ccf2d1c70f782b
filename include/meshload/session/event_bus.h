#ifndef MESHLOAD_SESSION_EVENT_BUS_H
#define MESHLOAD_SESSION_EVENT_BUS_H

#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include "meshload/progress/progress_aggregator.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace meshload {

struct DownloadStarted {
    std::string file_hash;
    std::vector<std::string> peers;
    bool single_source = false;
};

struct SessionStateChanged {
    std::string file_hash;
    SessionStatus from = SessionStatus::Queued;
    SessionStatus to = SessionStatus::Queued;
};

struct PeerRemoved {
    std::string file_hash;
    std::string peer_id;
    std::string reason;
};

struct ChunkCompleted {
    std::string file_hash;
    uint32_t index = 0;
    std::string peer_id;
};

struct ChunkFailed {
    std::string file_hash;
    uint32_t index = 0;
    std::string peer_id;
    FetchError reason = FetchError::Timeout;
    uint32_t retry_count = 0;
    bool exhausted = false;
};

struct DownloadCompleted {
    std::string file_hash;
    std::string output_path;
    uint64_t duration_ms = 0;
    double average_speed_bps = 0.0;
};

struct DownloadFailed {
    std::string file_hash;
    SessionError error;
};

// Owed to a peer that served part of a completed download
struct PaymentDue {
    std::string file_hash;
    uint64_t size = 0;
    std::string peer_id;
};

using SessionEvent = std::variant<ProgressUpdate, DownloadStarted, SessionStateChanged, PeerRemoved,
                                  ChunkCompleted, ChunkFailed, DownloadCompleted, DownloadFailed,
                                  PaymentDue>;

// Read-only observer channel. Handlers run on the publishing thread, outside the lock.
class EventBus {
public:
    using Handler = std::function<void(const SessionEvent&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const SessionEvent& event);

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

// External collaborator notified of every transfer outcome (reputation export, payments)
class TransferHook {
public:
    virtual ~TransferHook() = default;

    virtual void on_transfer(const TransferEvent& event) = 0;
    virtual void on_payment_due(const PaymentDue& payment) = 0;
};

} // namespace meshload

#endif // MESHLOAD_SESSION_EVENT_BUS_H
