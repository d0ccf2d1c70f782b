#include "meshload/progress/progress_aggregator.h"
#include <algorithm>

namespace meshload {

double ProgressUpdate::percent() const {
    if (total_chunks == 0) return 100.0;
    return static_cast<double>(completed_chunks) / static_cast<double>(total_chunks) * 100.0;
}

ProgressAggregator::ProgressAggregator(std::string file_hash, uint64_t total_bytes,
                                       uint32_t total_chunks, const ProgressConfig& config)
    : file_hash_(std::move(file_hash)),
      total_bytes_(total_bytes),
      total_chunks_(total_chunks),
      config_(config) {}

void ProgressAggregator::set_peer_active(const std::string& peer_id, bool active) {
    auto& counters = peers_[peer_id];
    counters.progress.peer_id = peer_id;
    if (counters.progress.active != active) {
        counters.progress.active = active;
        dirty_ = true;
    }
}

void ProgressAggregator::on_assigned(const std::string& peer_id) {
    auto& counters = peers_[peer_id];
    counters.progress.peer_id = peer_id;
    counters.progress.chunks_assigned++;
}

void ProgressAggregator::on_completed(const std::string& peer_id, uint64_t bytes, SteadyTime now) {
    auto& counters = peers_[peer_id];
    counters.progress.peer_id = peer_id;
    counters.progress.chunks_completed++;
    counters.progress.bytes_downloaded += bytes;
    counters.window.push_back({now, bytes});
    trim(counters, now);

    downloaded_bytes_ += bytes;
    completed_chunks_++;
    dirty_ = true;
}

void ProgressAggregator::add_restored(uint32_t chunks, uint64_t bytes) {
    completed_chunks_ += chunks;
    downloaded_bytes_ += bytes;
    dirty_ = true;
}

void ProgressAggregator::trim(PeerCounters& counters, SteadyTime now) const {
    auto window = std::chrono::milliseconds(config_.speed_window_ms);
    while (!counters.window.empty() && now - counters.window.front().at > window) {
        counters.window.pop_front();
    }
}

double ProgressAggregator::peer_speed(const std::string& peer_id, SteadyTime now) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) return 0.0;

    trim(it->second, now);
    uint64_t bytes = 0;
    for (const auto& s : it->second.window) {
        bytes += s.bytes;
    }
    double seconds = static_cast<double>(config_.speed_window_ms) / 1000.0;
    it->second.progress.speed_bps = static_cast<double>(bytes) / seconds;
    return it->second.progress.speed_bps;
}

double ProgressAggregator::overall_speed(SteadyTime now) {
    double total = 0.0;
    for (auto& [id, counters] : peers_) {
        if (counters.progress.active) {
            total += peer_speed(id, now);
        }
    }
    return total;
}

ProgressUpdate ProgressAggregator::current(SteadyTime now) {
    ProgressUpdate update;
    update.file_hash = file_hash_;
    update.downloaded_bytes = downloaded_bytes_;
    update.total_bytes = total_bytes_;
    update.completed_chunks = completed_chunks_;
    update.total_chunks = total_chunks_;
    update.active_sources = static_cast<uint32_t>(std::count_if(peers_.begin(), peers_.end(),
        [](const auto& entry) { return entry.second.progress.active; }));
    update.speed_bps = overall_speed(now);
    if (update.speed_bps > 0.0) {
        uint64_t remaining = total_bytes_ - std::min(total_bytes_, downloaded_bytes_);
        update.eta_seconds = static_cast<double>(remaining) / update.speed_bps;
    }
    return update;
}

std::vector<PeerProgress> ProgressAggregator::peers(SteadyTime now) {
    std::vector<PeerProgress> out;
    out.reserve(peers_.size());
    for (auto& [id, counters] : peers_) {
        peer_speed(id, now);
        out.push_back(counters.progress);
    }
    return out;
}

std::optional<ProgressUpdate> ProgressAggregator::poll(SteadyTime now) {
    if (last_emit_ && now - *last_emit_ < std::chrono::milliseconds(config_.tick_interval_ms)) {
        return std::nullopt;
    }
    // Speed decays as the window empties, so an active transfer always counts as a change
    for (auto& [id, counters] : peers_) {
        trim(counters, now);
    }
    bool moving = std::any_of(peers_.begin(), peers_.end(),
                              [](const auto& entry) { return !entry.second.window.empty(); });
    if (!dirty_ && !moving && last_speed_ == 0.0) {
        return std::nullopt;
    }
    dirty_ = false;
    last_emit_ = now;
    auto update = current(now);
    last_speed_ = update.speed_bps;
    return update;
}

} // namespace meshload
