#include "meshload/scheduler/chunk_planner.h"

namespace meshload {

ChunkPlanner::ChunkPlanner(uint32_t total_chunks, const SchedulerConfig& config)
    : table_(total_chunks, config.max_retries), config_(config) {}

ChunkOutcome ChunkPlanner::on_success(const ChunkRequest& request) {
    auto t = table_.apply(request.index, {ChunkEventKind::Success, request.peer_id, request.attempt, {}});
    return t.accepted ? ChunkOutcome::Accepted : ChunkOutcome::Stale;
}

ChunkOutcome ChunkPlanner::on_failure(const ChunkRequest& request) {
    auto t = table_.apply(request.index, {ChunkEventKind::Failure, request.peer_id, request.attempt, {}});
    if (!t.accepted) {
        return ChunkOutcome::Stale;
    }
    return t.next.exhausted ? ChunkOutcome::Exhausted : ChunkOutcome::Retrying;
}

bool ChunkPlanner::release(const ChunkRequest& request) {
    return table_.apply(request.index, {ChunkEventKind::Release, request.peer_id, request.attempt, {}}).accepted;
}

std::vector<ChunkRequest> ChunkPlanner::release_all() {
    auto requests = in_flight();
    for (const auto& r : requests) {
        release(r);
    }
    return requests;
}

std::vector<ChunkRequest> ChunkPlanner::in_flight() const {
    std::vector<ChunkRequest> out;
    for (const auto& c : table_.chunks()) {
        if (c.status == ChunkStatus::InFlight && c.assigned_peer) {
            out.push_back({c.index, *c.assigned_peer, c.attempt});
        }
    }
    return out;
}

std::vector<ChunkRequest> ChunkPlanner::collect_timeouts(SteadyTime now) const {
    auto timeout = std::chrono::milliseconds(config_.chunk_timeout_ms);
    std::vector<ChunkRequest> out;
    for (const auto& c : table_.chunks()) {
        if (c.status == ChunkStatus::InFlight && c.assigned_peer && now - c.dispatched_at >= timeout) {
            out.push_back({c.index, *c.assigned_peer, c.attempt});
        }
    }
    return out;
}

bool ChunkPlanner::restore_completed(uint32_t index) {
    return table_.apply(index, {ChunkEventKind::Restore, {}, 0, {}}).accepted;
}

size_t ChunkPlanner::reset_exhausted() {
    size_t reset = 0;
    for (uint32_t i = 0; i < table_.size(); ++i) {
        if (table_.apply(i, {ChunkEventKind::Reset, {}, 0, {}}).accepted) {
            ++reset;
        }
    }
    return reset;
}

std::vector<uint32_t> ChunkPlanner::release_peer_chunks(const std::string& peer_id) {
    // Copy: apply() edits the side index
    std::set<uint32_t> chunks = table_.in_flight_for(peer_id);
    std::vector<uint32_t> released;
    for (uint32_t index : chunks) {
        const auto& c = table_.at(index);
        if (table_.apply(index, {ChunkEventKind::Release, peer_id, c.attempt, {}}).accepted) {
            released.push_back(index);
        }
    }
    return released;
}

bool ChunkPlanner::dispatch(uint32_t index, const std::string& peer_id, SteadyTime now,
                            std::vector<ChunkRequest>& out) {
    auto t = table_.apply(index, {ChunkEventKind::Dispatch, peer_id, 0, now});
    if (!t.accepted) {
        return false;
    }
    out.push_back({index, peer_id, t.next.attempt});
    return true;
}

} // namespace meshload
