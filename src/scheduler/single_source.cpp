#include "meshload/scheduler/single_source.h"
#include "meshload/base/logger.h"

namespace meshload {

SingleSourcePlanner::SingleSourcePlanner(uint32_t total_chunks, const SchedulerConfig& config)
    : ChunkPlanner(total_chunks, config) {}

bool SingleSourcePlanner::add_peer(const CandidatePeer& peer, double /*weight*/) {
    if (peer_ && peer_->peer_id == peer.peer_id) {
        return false;
    }
    if (peer_) {
        remove_peer(peer_->peer_id);
    }
    peer_ = peer;
    Logger::instance().debug("Single-source plan using peer " + peer.peer_id);
    return true;
}

std::vector<uint32_t> SingleSourcePlanner::remove_peer(const std::string& peer_id) {
    if (!peer_ || peer_->peer_id != peer_id) {
        return {};
    }
    peer_.reset();
    return release_peer_chunks(peer_id);
}

bool SingleSourcePlanner::has_peer(const std::string& peer_id) const {
    return peer_ && peer_->peer_id == peer_id;
}

std::vector<std::string> SingleSourcePlanner::peer_ids() const {
    if (!peer_) return {};
    return {peer_->peer_id};
}

std::vector<ChunkRequest> SingleSourcePlanner::next_requests(SteadyTime now, const PeerFilter& accept) {
    std::vector<ChunkRequest> out;
    if (!peer_ || (accept && !accept(peer_->peer_id))) {
        return out;
    }

    size_t in_flight = table_.in_flight_for(peer_->peer_id).size();
    for (const auto& c : table_.chunks()) {
        if (in_flight >= config_.max_in_flight_per_peer) break;
        if (c.status != ChunkStatus::Pending) continue;
        if (dispatch(c.index, peer_->peer_id, now, out)) {
            ++in_flight;
        }
    }
    return out;
}

bool SingleSourcePlanner::can_serve_remaining() const {
    if (table_.count(ChunkStatus::InFlight) > 0) {
        return true;
    }
    return peer_.has_value() && table_.count(ChunkStatus::Pending) > 0;
}

} // namespace meshload
