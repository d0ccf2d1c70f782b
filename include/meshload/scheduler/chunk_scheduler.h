#ifndef MESHLOAD_SCHEDULER_CHUNK_SCHEDULER_H
#define MESHLOAD_SCHEDULER_CHUNK_SCHEDULER_H

#include "meshload/scheduler/chunk_planner.h"
#include <string>
#include <vector>

namespace meshload {

// Multi-peer scheduler: smooth weighted round-robin over Pending chunks,
// weights from reputation, each peer bounded by its in-flight window.
// A chunk is never offered again to a peer that already failed it.
class ChunkScheduler : public ChunkPlanner {
public:
    ChunkScheduler(uint32_t total_chunks, const SchedulerConfig& config);

    bool is_multi_source() const override { return true; }

    bool add_peer(const CandidatePeer& peer, double weight) override;
    std::vector<uint32_t> remove_peer(const std::string& peer_id) override;
    bool has_peer(const std::string& peer_id) const override;
    std::vector<std::string> peer_ids() const override;

    std::vector<ChunkRequest> next_requests(SteadyTime now, const PeerFilter& accept) override;
    bool can_serve_remaining() const override;

    void set_weight(const std::string& peer_id, double weight);

private:
    struct PeerSlot {
        CandidatePeer peer;
        int weight = 1;
        int current_weight = 0;
    };

    // Lowest Pending chunk index this peer may take, or -1
    int64_t first_dispatchable(const std::string& peer_id) const;

    std::vector<PeerSlot> peers_;
};

} // namespace meshload

#endif // MESHLOAD_SCHEDULER_CHUNK_SCHEDULER_H
