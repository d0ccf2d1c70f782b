#ifndef MESHLOAD_SCHEDULER_CHUNK_PLANNER_H
#define MESHLOAD_SCHEDULER_CHUNK_PLANNER_H

#include "meshload/base/config.h"
#include "meshload/core/types.h"
#include "meshload/scheduler/chunk_state.h"
#include <functional>
#include <string>
#include <vector>

namespace meshload {

// One dispatched chunk fetch
struct ChunkRequest {
    uint32_t index = 0;
    std::string peer_id;
    uint64_t attempt = 0;
};

enum class ChunkOutcome {
    Accepted,   // chunk is now Completed
    Stale,      // result of an attempt that is no longer current; dropped
    Retrying,   // failed, back to Pending for another peer
    Exhausted   // failed with no retry budget left
};

// Returns false for peers that must not receive new work right now (e.g. backing off)
using PeerFilter = std::function<bool(const std::string& peer_id)>;

// Decides which chunk goes to which peer. Owned and driven by exactly one session.
class ChunkPlanner {
public:
    ChunkPlanner(uint32_t total_chunks, const SchedulerConfig& config);
    virtual ~ChunkPlanner() = default;

    virtual bool is_multi_source() const = 0;

    virtual bool add_peer(const CandidatePeer& peer, double weight) = 0;

    // Removes the peer and releases its in-flight chunks to Pending without charging retries
    virtual std::vector<uint32_t> remove_peer(const std::string& peer_id) = 0;

    virtual bool has_peer(const std::string& peer_id) const = 0;
    virtual std::vector<std::string> peer_ids() const = 0;

    // Fills free per-peer windows with Pending chunks
    virtual std::vector<ChunkRequest> next_requests(SteadyTime now, const PeerFilter& accept) = 0;

    // True while some unfinished chunk is in flight or could be served by a current peer
    virtual bool can_serve_remaining() const = 0;

    ChunkOutcome on_success(const ChunkRequest& request);
    ChunkOutcome on_failure(const ChunkRequest& request);
    bool release(const ChunkRequest& request);

    // Releases every in-flight chunk (pause and cancel)
    std::vector<ChunkRequest> release_all();

    std::vector<ChunkRequest> in_flight() const;
    std::vector<ChunkRequest> collect_timeouts(SteadyTime now) const;

    bool restore_completed(uint32_t index);
    size_t reset_exhausted();

    ChunkTable& table() { return table_; }
    const ChunkTable& table() const { return table_; }
    const SchedulerConfig& config() const { return config_; }

protected:
    std::vector<uint32_t> release_peer_chunks(const std::string& peer_id);
    bool dispatch(uint32_t index, const std::string& peer_id, SteadyTime now,
                  std::vector<ChunkRequest>& out);

    ChunkTable table_;
    SchedulerConfig config_;
};

} // namespace meshload

#endif // MESHLOAD_SCHEDULER_CHUNK_PLANNER_H
