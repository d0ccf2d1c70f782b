#include "meshload/reputation/reputation_engine.h"
#include "meshload/base/logger.h"
#include "meshload/core/serialization.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_map>

namespace meshload {

namespace {

constexpr double kNeutralScore = 50.0;
constexpr double kBytesPerMiB = 1024.0 * 1024.0;
constexpr int kReputationFileVersion = 1;

double clamp_score(double value) {
    return std::clamp(value, 0.0, 100.0);
}

} // anonymous namespace

TrustLevel trust_level_for(double score) {
    if (score >= 80.0) return TrustLevel::Trusted;
    if (score >= 60.0) return TrustLevel::High;
    if (score >= 40.0) return TrustLevel::Medium;
    if (score >= 20.0) return TrustLevel::Low;
    return TrustLevel::Unknown;
}

std::string to_string(TrustLevel level) {
    switch (level) {
        case TrustLevel::Unknown: return "Unknown";
        case TrustLevel::Low: return "Low";
        case TrustLevel::Medium: return "Medium";
        case TrustLevel::High: return "High";
        case TrustLevel::Trusted: return "Trusted";
    }
    return "Unknown";
}

double PeerRecord::success_rate() const {
    uint64_t total = success_count + failure_count;
    if (total == 0) return 0.5;
    return static_cast<double>(success_count) / static_cast<double>(total);
}

struct ReputationEngine::Impl {
    ReputationConfig config;
    std::unordered_map<std::string, PeerRecord> records;
    mutable std::mutex mutex;

    explicit Impl(const ReputationConfig& cfg) : config(cfg) {}

    PeerRecord& get_or_create(const std::string& peer_id, WallTime now) {
        auto it = records.find(peer_id);
        if (it != records.end()) {
            return it->second;
        }
        PeerRecord record;
        record.peer_id = peer_id;
        record.avg_bandwidth_bps = config.reference_bandwidth_bps * 0.5;
        record.last_seen_at = now;
        Logger::instance().debug("New reputation record for peer " + peer_id);
        return records.emplace(peer_id, std::move(record)).first->second;
    }

    double base_score(const PeerRecord& r) const {
        double speed = std::min(1.0, r.avg_bandwidth_bps / config.reference_bandwidth_bps);
        return composite_score(r.success_rate(), speed, r.uptime_ratio, r.recent_success);
    }

    double raw_score(const PeerRecord& r) const {
        return clamp_score(base_score(r) + r.adjustment);
    }

    double score_at(const PeerRecord& r, WallTime now) const {
        double days = 0.0;
        if (now > r.last_seen_at) {
            days = std::chrono::duration<double>(now - r.last_seen_at).count() / 86400.0;
        }
        return decayed_score(raw_score(r), days, config.decay_rate, config.decay_floor);
    }

    // Keep base + adjustment inside [0, 100]
    void clamp_adjustment(PeerRecord& r) const {
        double base = base_score(r);
        r.adjustment = std::clamp(r.adjustment, -base, 100.0 - base);
    }

    void apply_failure(PeerRecord& r, double penalty, bool responded, WallTime now) {
        r.failure_count++;
        r.recent_success = (1.0 - config.recent_alpha) * r.recent_success;
        r.adjustment -= penalty;
        r.consecutive_failures++;
        if (responded) {
            r.last_seen_at = now;
        }

        // Exponential backoff: base * 2^(n-1), capped
        uint32_t shift = std::min<uint32_t>(r.consecutive_failures - 1, 20);
        uint64_t backoff_ms = std::min<uint64_t>(
            static_cast<uint64_t>(config.backoff_base_ms) << shift, config.backoff_max_ms);
        r.backoff_until = now + std::chrono::milliseconds(backoff_ms);

        clamp_adjustment(r);
    }
};

ReputationEngine::ReputationEngine(const ReputationConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

ReputationEngine::~ReputationEngine() = default;

double ReputationEngine::composite_score(double success_rate, double speed_score,
                                         double uptime_ratio, double recent_success) {
    return clamp_score(100.0 * (0.3 * success_rate + 0.2 * speed_score +
                                0.2 * uptime_ratio + 0.3 * recent_success));
}

double ReputationEngine::decayed_score(double score0, double days, double rate, double floor) {
    if (score0 <= floor || days <= 0.0) {
        return score0;
    }
    return std::max(floor, score0 * std::pow(1.0 - rate, days));
}

void ReputationEngine::touch(const std::string& peer_id, std::optional<ProtocolTag> protocol) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& record = impl_->get_or_create(peer_id, std::chrono::system_clock::now());
    if (protocol && !record.protocol) {
        record.protocol = protocol;
    }
}

void ReputationEngine::record_success(const std::string& peer_id, uint64_t bytes, uint64_t duration_ms) {
    record_success(peer_id, bytes, duration_ms, std::chrono::system_clock::now());
}

void ReputationEngine::record_success(const std::string& peer_id, uint64_t bytes,
                                      uint64_t duration_ms, WallTime now) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const auto& cfg = impl_->config;
    auto& r = impl_->get_or_create(peer_id, now);

    r.success_count++;
    r.bytes_served += bytes;
    r.recent_success = (1.0 - cfg.recent_alpha) * r.recent_success + cfg.recent_alpha;
    r.consecutive_failures = 0;
    r.backoff_until = WallTime{};
    r.last_seen_at = now;

    if (duration_ms > 0) {
        double sample_bps = static_cast<double>(bytes) * 1000.0 / static_cast<double>(duration_ms);
        r.avg_bandwidth_bps = (1.0 - cfg.bandwidth_alpha) * r.avg_bandwidth_bps + cfg.bandwidth_alpha * sample_bps;
    }

    double bonus = cfg.success_bonus_base + cfg.success_bonus_per_mib * (static_cast<double>(bytes) / kBytesPerMiB);
    r.adjustment += std::min(cfg.max_success_bonus, bonus);
    impl_->clamp_adjustment(r);
}

void ReputationEngine::record_failure(const std::string& peer_id, FetchError reason) {
    record_failure(peer_id, reason, std::chrono::system_clock::now());
}

void ReputationEngine::record_failure(const std::string& peer_id, FetchError reason, WallTime now) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& r = impl_->get_or_create(peer_id, now);

    double penalty = reason == FetchError::Corrupt
        ? impl_->config.corrupt_penalty
        : impl_->config.failure_penalty;
    // Refusals and corrupt data prove the peer is alive; timeouts and drops do not
    bool responded = reason == FetchError::Corrupt || reason == FetchError::PeerRefused;
    impl_->apply_failure(r, penalty, responded, now);

    Logger::instance().debug("Peer {} failure ({}), score now {:.1f}", peer_id, to_string(reason),
                             impl_->score_at(r, now));
}

void ReputationEngine::record_event(const TransferEvent& event) {
    switch (event.outcome) {
        case TransferOutcome::Success:
            record_success(event.peer_id, event.bytes, event.duration_ms, event.timestamp);
            break;
        case TransferOutcome::Failure:
            record_failure(event.peer_id, event.reason, event.timestamp);
            break;
        case TransferOutcome::Corrupt:
            record_failure(event.peer_id, FetchError::Corrupt, event.timestamp);
            break;
    }
}

void ReputationEngine::record_latency(const std::string& peer_id, double latency_ms) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& r = impl_->get_or_create(peer_id, std::chrono::system_clock::now());
    double alpha = impl_->config.latency_alpha;
    r.avg_latency_ms = r.avg_latency_ms == 0.0
        ? latency_ms
        : (1.0 - alpha) * r.avg_latency_ms + alpha * latency_ms;
}

void ReputationEngine::record_uptime(const std::string& peer_id, bool reachable) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto now = std::chrono::system_clock::now();
    auto& r = impl_->get_or_create(peer_id, now);
    double alpha = impl_->config.uptime_alpha;
    r.uptime_ratio = (1.0 - alpha) * r.uptime_ratio + (reachable ? alpha : 0.0);
    if (reachable) {
        r.last_seen_at = now;
    }
    impl_->clamp_adjustment(r);
}

double ReputationEngine::get_score(const std::string& peer_id) const {
    return get_score(peer_id, std::chrono::system_clock::now());
}

double ReputationEngine::get_score(const std::string& peer_id, WallTime now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(peer_id);
    if (it == impl_->records.end()) {
        return kNeutralScore;
    }
    return impl_->score_at(it->second, now);
}

TrustLevel ReputationEngine::get_trust_level(const std::string& peer_id) const {
    return trust_level_for(get_score(peer_id));
}

std::vector<std::string> ReputationEngine::rank(const std::vector<std::string>& peer_ids) const {
    return rank(peer_ids, std::chrono::system_clock::now());
}

std::vector<std::string> ReputationEngine::rank(const std::vector<std::string>& peer_ids, WallTime now) const {
    std::vector<std::pair<double, std::string>> scored;
    scored.reserve(peer_ids.size());
    for (const auto& id : peer_ids) {
        scored.emplace_back(get_score(id, now), id);
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second < b.second;
    });

    std::vector<std::string> result;
    result.reserve(scored.size());
    for (auto& [score, id] : scored) {
        result.push_back(std::move(id));
    }
    return result;
}

bool ReputationEngine::is_healthy(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(peer_id);
    if (it == impl_->records.end()) {
        return true;
    }
    const auto& r = it->second;
    uint64_t total = r.success_count + r.failure_count;
    if (total < impl_->config.health_min_transfers) {
        return true;
    }
    double failure_rate = static_cast<double>(r.failure_count) / static_cast<double>(total);
    return failure_rate <= impl_->config.health_max_failure_rate;
}

bool ReputationEngine::is_backing_off(const std::string& peer_id, WallTime now) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(peer_id);
    return it != impl_->records.end() && now < it->second.backoff_until;
}

std::optional<PeerRecord> ReputationEngine::get_record(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(peer_id);
    if (it == impl_->records.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ReputationEngine::upsert(const PeerRecord& record) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(record.peer_id);
    uint32_t refs = it != impl_->records.end() ? it->second.active_refs : 0;
    auto& slot = impl_->records[record.peer_id];
    slot = record;
    slot.active_refs = refs;
    impl_->clamp_adjustment(slot);
}

size_t ReputationEngine::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->records.size();
}

void ReputationEngine::retain(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->get_or_create(peer_id, std::chrono::system_clock::now()).active_refs++;
}

void ReputationEngine::release(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(peer_id);
    if (it != impl_->records.end() && it->second.active_refs > 0) {
        it->second.active_refs--;
    }
}

size_t ReputationEngine::prune(std::chrono::hours max_age, WallTime now) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t removed = 0;
    for (auto it = impl_->records.begin(); it != impl_->records.end();) {
        const auto& r = it->second;
        if (r.active_refs == 0 && now - r.last_seen_at > max_age) {
            it = impl_->records.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        Logger::instance().info("Pruned " + std::to_string(removed) + " stale reputation records");
    }
    return removed;
}

bool ReputationEngine::save_to_file(const std::string& path) const {
    nlohmann::json root;
    root["version"] = kReputationFileVersion;
    root["peers"] = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, r] : impl_->records) {
            nlohmann::json peer = {
                {"peer_id", r.peer_id},
                {"success_count", r.success_count},
                {"failure_count", r.failure_count},
                {"bytes_served", r.bytes_served},
                {"avg_latency_ms", r.avg_latency_ms},
                {"avg_bandwidth_bps", r.avg_bandwidth_bps},
                {"uptime_ratio", r.uptime_ratio},
                {"recent_success", r.recent_success},
                {"adjustment", r.adjustment},
                {"consecutive_failures", r.consecutive_failures},
                {"last_seen_at", to_unix_millis(r.last_seen_at)}
            };
            if (r.protocol) {
                peer["protocol"] = to_string(*r.protocol);
            }
            root["peers"].push_back(std::move(peer));
        }
    }

    try {
        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }
        std::string tmp = path + ".tmp";
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file.is_open()) {
                Logger::instance().error("Failed to open reputation file for writing: " + tmp);
                return false;
            }
            file << root.dump(2);
            if (!file) {
                Logger::instance().error("Failed to write reputation file: " + tmp);
                return false;
            }
        }
        std::filesystem::rename(tmp, path);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Failed to save reputation table: " + std::string(e.what()));
        return false;
    }

    Logger::instance().debug("Saved reputation table to " + path);
    return true;
}

bool ReputationEngine::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().warning("Reputation file not found: " + path);
        return false;
    }

    std::vector<PeerRecord> loaded;
    try {
        nlohmann::json root = nlohmann::json::parse(file);
        int version = root.value("version", 0);
        if (version > kReputationFileVersion) {
            Logger::instance().warning("Unsupported reputation file version " + std::to_string(version));
            return false;
        }
        for (const auto& peer : root.at("peers")) {
            PeerRecord r;
            peer.at("peer_id").get_to(r.peer_id);
            r.success_count = peer.value("success_count", uint64_t{0});
            r.failure_count = peer.value("failure_count", uint64_t{0});
            r.bytes_served = peer.value("bytes_served", uint64_t{0});
            r.avg_latency_ms = peer.value("avg_latency_ms", 0.0);
            r.avg_bandwidth_bps = peer.value("avg_bandwidth_bps", impl_->config.reference_bandwidth_bps * 0.5);
            r.uptime_ratio = peer.value("uptime_ratio", 0.5);
            r.recent_success = peer.value("recent_success", 0.5);
            r.adjustment = peer.value("adjustment", 0.0);
            r.consecutive_failures = peer.value("consecutive_failures", 0u);
            r.last_seen_at = from_unix_millis(peer.value("last_seen_at", int64_t{0}));
            if (peer.contains("protocol")) {
                r.protocol = parse_protocol_tag(peer["protocol"].get<std::string>());
            }
            loaded.push_back(std::move(r));
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().error("Failed to parse reputation file " + path + ": " + e.what());
        return false;
    }

    for (const auto& r : loaded) {
        upsert(r);
    }
    Logger::instance().info("Loaded " + std::to_string(loaded.size()) + " reputation records from " + path);
    return true;
}

const ReputationConfig& ReputationEngine::config() const {
    return impl_->config;
}

} // namespace meshload
