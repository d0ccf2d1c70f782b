#include "meshload/scheduler/chunk_scheduler.h"
#include "meshload/base/logger.h"
#include <algorithm>
#include <cmath>

namespace meshload {

namespace {

int to_weight(double score) {
    return std::max(1, static_cast<int>(std::lround(score)));
}

} // anonymous namespace

ChunkScheduler::ChunkScheduler(uint32_t total_chunks, const SchedulerConfig& config)
    : ChunkPlanner(total_chunks, config) {}

bool ChunkScheduler::add_peer(const CandidatePeer& peer, double weight) {
    if (has_peer(peer.peer_id)) {
        return false;
    }
    peers_.push_back({peer, to_weight(weight), 0});
    Logger::instance().debug("Scheduler: added peer " + peer.peer_id + " weight " +
                             std::to_string(to_weight(weight)));
    return true;
}

std::vector<uint32_t> ChunkScheduler::remove_peer(const std::string& peer_id) {
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const PeerSlot& s) { return s.peer.peer_id == peer_id; });
    if (it == peers_.end()) {
        return {};
    }
    peers_.erase(it);
    auto released = release_peer_chunks(peer_id);
    Logger::instance().debug("Scheduler: removed peer " + peer_id + ", released " +
                             std::to_string(released.size()) + " chunks");
    return released;
}

bool ChunkScheduler::has_peer(const std::string& peer_id) const {
    return std::any_of(peers_.begin(), peers_.end(),
                       [&](const PeerSlot& s) { return s.peer.peer_id == peer_id; });
}

std::vector<std::string> ChunkScheduler::peer_ids() const {
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& s : peers_) {
        ids.push_back(s.peer.peer_id);
    }
    return ids;
}

void ChunkScheduler::set_weight(const std::string& peer_id, double weight) {
    for (auto& s : peers_) {
        if (s.peer.peer_id == peer_id) {
            s.weight = to_weight(weight);
        }
    }
}

int64_t ChunkScheduler::first_dispatchable(const std::string& peer_id) const {
    for (const auto& c : table_.chunks()) {
        if (c.status == ChunkStatus::Pending && !c.has_failed(peer_id)) {
            return c.index;
        }
    }
    return -1;
}

std::vector<ChunkRequest> ChunkScheduler::next_requests(SteadyTime now, const PeerFilter& accept) {
    std::vector<ChunkRequest> out;
    if (table_.count(ChunkStatus::Pending) == 0) {
        return out;
    }

    while (true) {
        // Peers with window space and something they are allowed to take
        std::vector<std::pair<size_t, int64_t>> eligible;
        for (size_t i = 0; i < peers_.size(); ++i) {
            const auto& id = peers_[i].peer.peer_id;
            if (table_.in_flight_for(id).size() >= config_.max_in_flight_per_peer) continue;
            if (accept && !accept(id)) continue;
            int64_t chunk = first_dispatchable(id);
            if (chunk >= 0) {
                eligible.emplace_back(i, chunk);
            }
        }
        if (eligible.empty()) {
            break;
        }

        // Smooth weighted round-robin among eligible peers
        int total = 0;
        size_t best = 0;
        for (size_t k = 0; k < eligible.size(); ++k) {
            auto& slot = peers_[eligible[k].first];
            slot.current_weight += slot.weight;
            total += slot.weight;
            if (slot.current_weight > peers_[eligible[best].first].current_weight) {
                best = k;
            }
        }
        auto& chosen = peers_[eligible[best].first];
        chosen.current_weight -= total;

        if (!dispatch(static_cast<uint32_t>(eligible[best].second), chosen.peer.peer_id, now, out)) {
            break;
        }
    }
    return out;
}

bool ChunkScheduler::can_serve_remaining() const {
    for (const auto& c : table_.chunks()) {
        if (c.status == ChunkStatus::InFlight) {
            return true;
        }
        if (c.status != ChunkStatus::Pending) {
            continue;
        }
        for (const auto& s : peers_) {
            if (!c.has_failed(s.peer.peer_id)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace meshload
