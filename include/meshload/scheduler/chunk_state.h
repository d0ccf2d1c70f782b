#ifndef MESHLOAD_SCHEDULER_CHUNK_STATE_H
#define MESHLOAD_SCHEDULER_CHUNK_STATE_H

#include "meshload/core/types.h"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshload {

// Assignment record of one chunk
struct ChunkState {
    uint32_t index = 0;
    ChunkStatus status = ChunkStatus::Pending;
    std::optional<std::string> assigned_peer;
    uint32_t retry_count = 0;
    std::vector<std::string> failed_peers;   // peers that must not get this chunk again
    uint64_t attempt = 0;                     // id of the latest dispatch
    bool exhausted = false;                   // Failed with no retry budget left
    SteadyTime dispatched_at{};

    bool has_failed(const std::string& peer_id) const;
};

enum class ChunkEventKind {
    Dispatch,    // Pending -> InFlight on peer_id
    Success,     // InFlight -> Completed
    Failure,     // InFlight -> Failed -> Pending, or Failed(exhausted)
    Release,     // InFlight -> Pending without charging the retry budget
    Restore,     // Pending -> Completed from a snapshot
    Reset        // Failed(exhausted) -> Pending with a fresh budget
};

struct ChunkEvent {
    ChunkEventKind kind = ChunkEventKind::Dispatch;
    std::string peer_id;
    uint64_t attempt = 0;      // must match for Success/Failure/Release
    SteadyTime at{};
};

struct ChunkTransition {
    ChunkState next;
    std::vector<ChunkStatus> visited;  // statuses entered, in order; empty when rejected
    bool accepted = false;
};

// Pure transition function; never touches I/O
ChunkTransition transition(const ChunkState& state, const ChunkEvent& event, uint32_t max_retries);

// Arena of chunk states indexed by chunk index, plus the peer -> in-flight side index
class ChunkTable {
public:
    using TransitionListener = std::function<void(uint32_t index, ChunkStatus status)>;

    ChunkTable(uint32_t total_chunks, uint32_t max_retries);

    // Applies the event; returns the transition (accepted == false for stale or illegal events)
    ChunkTransition apply(uint32_t index, const ChunkEvent& event);

    const ChunkState& at(uint32_t index) const { return chunks_.at(index); }
    const std::vector<ChunkState>& chunks() const { return chunks_; }
    uint32_t size() const { return static_cast<uint32_t>(chunks_.size()); }

    const std::set<uint32_t>& in_flight_for(const std::string& peer_id) const;
    size_t count(ChunkStatus status) const;
    size_t exhausted_count() const;
    bool all_completed() const { return count(ChunkStatus::Completed) == chunks_.size(); }
    std::vector<bool> completion_bitmap() const;
    uint32_t max_retries() const { return max_retries_; }

    void set_listener(TransitionListener listener) { listener_ = std::move(listener); }

private:
    std::vector<ChunkState> chunks_;
    std::unordered_map<std::string, std::set<uint32_t>> in_flight_;
    std::vector<size_t> status_counts_;
    uint32_t max_retries_;
    TransitionListener listener_;
};

} // namespace meshload

#endif // MESHLOAD_SCHEDULER_CHUNK_STATE_H
