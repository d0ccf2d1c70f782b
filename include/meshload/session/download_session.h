#ifndef MESHLOAD_SESSION_DOWNLOAD_SESSION_H
#define MESHLOAD_SESSION_DOWNLOAD_SESSION_H

#include "meshload/base/config.h"
#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include "meshload/persistence/snapshot_store.h"
#include "meshload/progress/progress_aggregator.h"
#include "meshload/reputation/reputation_engine.h"
#include "meshload/scheduler/chunk_planner.h"
#include "meshload/scheduler/chunk_scheduler.h"
#include "meshload/session/event_bus.h"
#include "meshload/transport/transport.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

struct SessionOptions {
    std::string output_path;              // final location of the file
    std::vector<uint8_t> decryption_key;  // required when the descriptor is encrypted
};

// Transport to open before the peer joins the plan
struct ConnectOrder {
    std::string peer_id;
    std::shared_ptr<Transport> transport;
};

// One chunk fetch to run on the transport
struct FetchOrder {
    ChunkRequest request;
    ChunkRange range;
    std::shared_ptr<Transport> transport;
    std::shared_ptr<CancelToken> cancel;
};

struct FinalizeResult {
    ErrorCode code = ErrorCode::Success;
    std::string message;
};

// Whole-file verification, decryption and promotion of a fully fetched part
// file. Touches only the filesystem, so it may run on any thread.
struct FinalizeOrder {
    FileDescriptor descriptor;
    std::string output_path;
    std::vector<uint8_t> decryption_key;

    FinalizeResult run() const;
};

// I/O a tick asks the caller to perform; results come back through
// on_connect_result(), on_fetch_result() and on_finalize_result()
struct SessionWork {
    std::vector<ConnectOrder> connects;
    std::vector<FetchOrder> fetches;
    std::optional<FinalizeOrder> finalize;

    bool empty() const { return connects.empty() && fetches.empty() && !finalize; }
};

// Coordinator of one file download. Every mutation of the chunk table goes
// through this object from a single thread; transports run elsewhere and
// report back.
class DownloadSession {
public:
    DownloadSession(FileDescriptor descriptor, SessionOptions options, const GlobalConfig& config,
                    ReputationEngine& reputation, EventBus& events,
                    SnapshotStore* snapshots = nullptr, TransferHook* hook = nullptr);
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    const std::string& file_hash() const;
    const FileDescriptor& descriptor() const;
    const SessionOptions& options() const;
    SessionStatus status() const;
    const std::optional<SessionError>& error() const;

    // Initializing -> Downloading, or Failed when no usable peer exists
    void start(SteadyTime now);

    // Applies a resume snapshot; the session ends up Paused
    bool restore(const SessionSnapshot& snapshot, SteadyTime now);

    // Timeouts, stall detection, dispatch, progress and snapshots
    SessionWork tick(SteadyTime now);

    void on_connect_result(const std::string& peer_id, bool ok, SteadyTime now);
    void on_fetch_result(const ChunkRequest& request, FetchResult result, uint64_t duration_ms,
                         SteadyTime now);
    // Verifying -> Completed, or Failed with the finalize error
    void on_finalize_result(const FinalizeResult& result, SteadyTime now);

    bool pause(SteadyTime now);
    bool resume(SteadyTime now);
    void cancel();

    // Exhausted chunks back to Pending with a fresh budget; returns the number reset
    size_t retry_failed(SteadyTime now);

    // Bare disconnect: in-flight chunks go back to Pending, reputation untouched
    bool disconnect_peer(const std::string& peer_id, SteadyTime now);

    // Multi-peer scheduler, null in single-source mode or before start
    ChunkScheduler* scheduler();
    const ChunkPlanner* planner() const;
    bool is_single_source() const;

    std::vector<std::string> active_peers() const;
    std::vector<bool> completion_bitmap() const;
    ProgressUpdate progress(SteadyTime now);
    std::vector<PeerProgress> peer_progress(SteadyTime now);

    SessionSnapshot make_snapshot() const;
    bool save_snapshot();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meshload

#endif // MESHLOAD_SESSION_DOWNLOAD_SESSION_H
