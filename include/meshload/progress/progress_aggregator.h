#ifndef MESHLOAD_PROGRESS_PROGRESS_AGGREGATOR_H
#define MESHLOAD_PROGRESS_PROGRESS_AGGREGATOR_H

#include "meshload/base/config.h"
#include "meshload/core/types.h"
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

struct ProgressUpdate {
    std::string file_hash;
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    uint32_t completed_chunks = 0;
    uint32_t total_chunks = 0;
    uint32_t active_sources = 0;
    double speed_bps = 0.0;
    std::optional<double> eta_seconds;  // unknown while speed is zero

    double percent() const;
};

struct PeerProgress {
    std::string peer_id;
    uint32_t chunks_assigned = 0;
    uint32_t chunks_completed = 0;
    uint64_t bytes_downloaded = 0;
    double speed_bps = 0.0;
    bool active = false;
};

// Derives per-peer and overall speed, progress and ETA for one session
class ProgressAggregator {
public:
    ProgressAggregator(std::string file_hash, uint64_t total_bytes, uint32_t total_chunks,
                       const ProgressConfig& config);

    void set_peer_active(const std::string& peer_id, bool active);
    void on_assigned(const std::string& peer_id);
    void on_completed(const std::string& peer_id, uint64_t bytes, SteadyTime now);

    // Chunks that were already on disk (resume); they count as progress but not speed
    void add_restored(uint32_t chunks, uint64_t bytes);

    double peer_speed(const std::string& peer_id, SteadyTime now);
    double overall_speed(SteadyTime now);

    ProgressUpdate current(SteadyTime now);
    std::vector<PeerProgress> peers(SteadyTime now);

    // Throttled emission: at most one update per tick interval, only when something changed
    std::optional<ProgressUpdate> poll(SteadyTime now);

    uint64_t downloaded_bytes() const { return downloaded_bytes_; }
    uint32_t completed_chunks() const { return completed_chunks_; }

private:
    struct Sample {
        SteadyTime at;
        uint64_t bytes;
    };

    struct PeerCounters {
        PeerProgress progress;
        std::deque<Sample> window;
    };

    void trim(PeerCounters& counters, SteadyTime now) const;

    std::string file_hash_;
    uint64_t total_bytes_;
    uint32_t total_chunks_;
    ProgressConfig config_;
    uint64_t downloaded_bytes_ = 0;
    uint32_t completed_chunks_ = 0;
    std::map<std::string, PeerCounters> peers_;
    std::optional<SteadyTime> last_emit_;
    double last_speed_ = 0.0;
    bool dirty_ = true;
};

} // namespace meshload

#endif // MESHLOAD_PROGRESS_PROGRESS_AGGREGATOR_H
