#ifndef MESHLOAD_SCHEDULER_SINGLE_SOURCE_H
#define MESHLOAD_SCHEDULER_SINGLE_SOURCE_H

#include "meshload/scheduler/chunk_planner.h"
#include <optional>

namespace meshload {

// Sequential plan for a single peer: chunks go out in index order and a
// failed chunk is retried against the same peer until its budget runs out.
class SingleSourcePlanner : public ChunkPlanner {
public:
    SingleSourcePlanner(uint32_t total_chunks, const SchedulerConfig& config);

    bool is_multi_source() const override { return false; }

    // Replaces the current peer, if any, releasing its chunks
    bool add_peer(const CandidatePeer& peer, double weight) override;
    std::vector<uint32_t> remove_peer(const std::string& peer_id) override;
    bool has_peer(const std::string& peer_id) const override;
    std::vector<std::string> peer_ids() const override;

    std::vector<ChunkRequest> next_requests(SteadyTime now, const PeerFilter& accept) override;
    bool can_serve_remaining() const override;

private:
    std::optional<CandidatePeer> peer_;
};

} // namespace meshload

#endif // MESHLOAD_SCHEDULER_SINGLE_SOURCE_H
