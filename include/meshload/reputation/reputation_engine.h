#ifndef MESHLOAD_REPUTATION_REPUTATION_ENGINE_H
#define MESHLOAD_REPUTATION_REPUTATION_ENGINE_H

#include "meshload/base/config.h"
#include "meshload/core/types.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// Discretized reputation bands
enum class TrustLevel {
    Unknown,   // < 20
    Low,       // 20-39
    Medium,    // 40-59
    High,      // 60-79
    Trusted    // >= 80
};

TrustLevel trust_level_for(double score);
std::string to_string(TrustLevel level);

// Per-peer history. Components without history sit at 0.5 so a new peer scores 50.
struct PeerRecord {
    std::string peer_id;
    std::optional<ProtocolTag> protocol;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    uint64_t bytes_served = 0;
    double avg_latency_ms = 0.0;
    double avg_bandwidth_bps = 0.0;    // initialized to half the reference bandwidth
    double uptime_ratio = 0.5;
    double recent_success = 0.5;       // EMA of outcomes, 1 = success
    double adjustment = 0.0;           // accumulated success bonuses and failure penalties
    uint32_t consecutive_failures = 0;
    WallTime last_seen_at{};
    WallTime backoff_until{};
    uint32_t active_refs = 0;          // sessions currently using this peer

    double success_rate() const;
};

// Scores peers from transfer history. Thread-safe; shared by all sessions.
class ReputationEngine {
public:
    explicit ReputationEngine(const ReputationConfig& config);
    ~ReputationEngine();

    // Weighted formula without adjustment or decay, each input in [0, 1]
    static double composite_score(double success_rate, double speed_score,
                                  double uptime_ratio, double recent_success);

    // score0 * (1 - rate)^days, never below floor; scores already at or below floor are kept
    static double decayed_score(double score0, double days, double rate, double floor);

    // Create the record on first contact; no-op for known peers
    void touch(const std::string& peer_id, std::optional<ProtocolTag> protocol = std::nullopt);

    void record_success(const std::string& peer_id, uint64_t bytes, uint64_t duration_ms);
    void record_success(const std::string& peer_id, uint64_t bytes, uint64_t duration_ms, WallTime now);
    void record_failure(const std::string& peer_id, FetchError reason);
    void record_failure(const std::string& peer_id, FetchError reason, WallTime now);
    void record_event(const TransferEvent& event);
    // Connect round trip; fetch durations feed bandwidth instead
    void record_latency(const std::string& peer_id, double latency_ms);
    // Connect outcome, folded into uptime_ratio
    void record_uptime(const std::string& peer_id, bool reachable);

    // Score in [0, 100]; unknown peers get the neutral default 50
    double get_score(const std::string& peer_id) const;
    double get_score(const std::string& peer_id, WallTime now) const;
    TrustLevel get_trust_level(const std::string& peer_id) const;

    // Sorted by score descending, ties broken by peer id ascending
    std::vector<std::string> rank(const std::vector<std::string>& peer_ids) const;
    std::vector<std::string> rank(const std::vector<std::string>& peer_ids, WallTime now) const;

    // Health gating: enough transfers with a high failure rate excludes the peer
    bool is_healthy(const std::string& peer_id) const;
    bool is_backing_off(const std::string& peer_id, WallTime now) const;

    std::optional<PeerRecord> get_record(const std::string& peer_id) const;
    void upsert(const PeerRecord& record);
    size_t size() const;

    // Active sessions pin records so prune() leaves them alone
    void retain(const std::string& peer_id);
    void release(const std::string& peer_id);

    // Drop unpinned records not seen for max_age; returns removed count
    size_t prune(std::chrono::hours max_age, WallTime now);

    bool save_to_file(const std::string& path) const;
    bool load_from_file(const std::string& path);

    const ReputationConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meshload

#endif // MESHLOAD_REPUTATION_REPUTATION_ENGINE_H
