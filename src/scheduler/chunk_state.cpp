#include "meshload/scheduler/chunk_state.h"
#include <algorithm>

namespace meshload {

bool ChunkState::has_failed(const std::string& peer_id) const {
    return std::find(failed_peers.begin(), failed_peers.end(), peer_id) != failed_peers.end();
}

namespace {

bool matches_attempt(const ChunkState& state, const ChunkEvent& event) {
    return state.status == ChunkStatus::InFlight &&
           state.attempt == event.attempt &&
           state.assigned_peer && *state.assigned_peer == event.peer_id;
}

} // anonymous namespace

ChunkTransition transition(const ChunkState& state, const ChunkEvent& event, uint32_t max_retries) {
    ChunkTransition result{state, {}, false};
    ChunkState& next = result.next;

    switch (event.kind) {
        case ChunkEventKind::Dispatch:
            if (state.status != ChunkStatus::Pending) break;
            next.status = ChunkStatus::InFlight;
            next.assigned_peer = event.peer_id;
            next.attempt = state.attempt + 1;
            next.dispatched_at = event.at;
            result.visited = {ChunkStatus::InFlight};
            break;

        case ChunkEventKind::Success:
            if (!matches_attempt(state, event)) break;
            next.status = ChunkStatus::Completed;
            result.visited = {ChunkStatus::Completed};
            break;

        case ChunkEventKind::Failure:
            if (!matches_attempt(state, event)) break;
            next.retry_count = state.retry_count + 1;
            if (!state.has_failed(event.peer_id)) {
                next.failed_peers.push_back(event.peer_id);
            }
            next.assigned_peer.reset();
            if (next.retry_count >= max_retries) {
                next.status = ChunkStatus::Failed;
                next.exhausted = true;
                result.visited = {ChunkStatus::Failed};
            } else {
                next.status = ChunkStatus::Pending;
                result.visited = {ChunkStatus::Failed, ChunkStatus::Pending};
            }
            break;

        case ChunkEventKind::Release:
            if (!matches_attempt(state, event)) break;
            next.status = ChunkStatus::Pending;
            next.assigned_peer.reset();
            result.visited = {ChunkStatus::Pending};
            break;

        case ChunkEventKind::Restore:
            if (state.status != ChunkStatus::Pending) break;
            next.status = ChunkStatus::Completed;
            result.visited = {ChunkStatus::Completed};
            break;

        case ChunkEventKind::Reset:
            if (state.status != ChunkStatus::Failed || !state.exhausted) break;
            next.status = ChunkStatus::Pending;
            next.exhausted = false;
            next.retry_count = 0;
            next.failed_peers.clear();
            result.visited = {ChunkStatus::Pending};
            break;
    }

    result.accepted = !result.visited.empty();
    return result;
}

ChunkTable::ChunkTable(uint32_t total_chunks, uint32_t max_retries)
    : chunks_(total_chunks),
      status_counts_(4, 0),
      max_retries_(max_retries) {
    for (uint32_t i = 0; i < total_chunks; ++i) {
        chunks_[i].index = i;
    }
    status_counts_[static_cast<size_t>(ChunkStatus::Pending)] = total_chunks;
}

ChunkTransition ChunkTable::apply(uint32_t index, const ChunkEvent& event) {
    if (index >= chunks_.size()) {
        return ChunkTransition{};
    }

    ChunkState& current = chunks_[index];
    ChunkTransition result = transition(current, event, max_retries_);
    if (!result.accepted) {
        return result;
    }

    if (current.status == ChunkStatus::InFlight && current.assigned_peer) {
        auto it = in_flight_.find(*current.assigned_peer);
        if (it != in_flight_.end()) {
            it->second.erase(index);
            if (it->second.empty()) {
                in_flight_.erase(it);
            }
        }
    }
    if (result.next.status == ChunkStatus::InFlight && result.next.assigned_peer) {
        in_flight_[*result.next.assigned_peer].insert(index);
    }

    status_counts_[static_cast<size_t>(current.status)]--;
    status_counts_[static_cast<size_t>(result.next.status)]++;
    current = result.next;

    if (listener_) {
        for (ChunkStatus status : result.visited) {
            listener_(index, status);
        }
    }
    return result;
}

const std::set<uint32_t>& ChunkTable::in_flight_for(const std::string& peer_id) const {
    static const std::set<uint32_t> empty;
    auto it = in_flight_.find(peer_id);
    return it == in_flight_.end() ? empty : it->second;
}

size_t ChunkTable::count(ChunkStatus status) const {
    return status_counts_[static_cast<size_t>(status)];
}

size_t ChunkTable::exhausted_count() const {
    return static_cast<size_t>(std::count_if(chunks_.begin(), chunks_.end(),
                                             [](const ChunkState& c) { return c.exhausted; }));
}

std::vector<bool> ChunkTable::completion_bitmap() const {
    std::vector<bool> bitmap(chunks_.size());
    for (size_t i = 0; i < chunks_.size(); ++i) {
        bitmap[i] = chunks_[i].status == ChunkStatus::Completed;
    }
    return bitmap;
}

} // namespace meshload
