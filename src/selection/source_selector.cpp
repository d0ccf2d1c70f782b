#include "meshload/selection/source_selector.h"
#include "meshload/base/logger.h"
#include <algorithm>
#include <unordered_map>

namespace meshload {

SourceSelector::SourceSelector(const SelectionConfig& config, const ReputationEngine& reputation)
    : config_(config), reputation_(reputation) {}

bool SourceSelector::is_eligible(const std::string& peer_id) const {
    return reputation_.get_score(peer_id) >= config_.min_trust_score &&
           reputation_.is_healthy(peer_id);
}

// Deduplicated by peer id (first entry wins), ranked by reputation
std::vector<CandidatePeer> SourceSelector::rank_candidates(const std::vector<CandidatePeer>& candidates,
                                                           const std::set<std::string>& skip) const {
    std::unordered_map<std::string, CandidatePeer> by_id;
    std::vector<std::string> ids;
    for (const auto& c : candidates) {
        if (skip.count(c.peer_id) || by_id.count(c.peer_id)) continue;
        by_id.emplace(c.peer_id, c);
        ids.push_back(c.peer_id);
    }

    std::vector<CandidatePeer> ranked;
    ranked.reserve(ids.size());
    for (const auto& id : reputation_.rank(ids)) {
        ranked.push_back(by_id.at(id));
    }
    return ranked;
}

SelectionResult SourceSelector::select(const std::vector<CandidatePeer>& candidates,
                                       const std::set<std::string>& excluded) const {
    SelectionResult result;

    auto ranked = rank_candidates(candidates, excluded);
    if (ranked.empty()) {
        result.error = ErrorCode::NoPeersAvailable;
        Logger::instance().warning("Source selection: no candidate peers");
        return result;
    }

    std::vector<CandidatePeer> eligible;
    for (const auto& c : ranked) {
        if (is_eligible(c.peer_id)) {
            eligible.push_back(c);
        }
    }

    if (eligible.empty()) {
        if (!config_.allow_untrusted_fallback) {
            result.error = ErrorCode::InsufficientReputationPeers;
            Logger::instance().warning("Source selection: " + std::to_string(ranked.size()) +
                                       " candidates, none above trust threshold");
            return result;
        }
        result.selected.push_back(ranked.front());
        result.single_source = true;
        result.degraded = true;
        Logger::instance().warning("Source selection degraded to untrusted peer " + ranked.front().peer_id);
        return result;
    }

    size_t limit = std::min<size_t>(config_.max_peers, eligible.size());

    // Reserve one slot per distinct protocol, best peer of each, in rank order
    std::vector<bool> taken(eligible.size(), false);
    std::set<ProtocolTag> protocols;
    for (const auto& c : eligible) {
        protocols.insert(c.protocol);
    }
    if (protocols.size() > 1) {
        std::set<ProtocolTag> covered;
        for (size_t i = 0; i < eligible.size() && covered.size() < limit; ++i) {
            if (covered.insert(eligible[i].protocol).second) {
                taken[i] = true;
            }
        }
    }

    // Fill the remaining slots purely by score
    size_t count = static_cast<size_t>(std::count(taken.begin(), taken.end(), true));
    for (size_t i = 0; i < eligible.size() && count < limit; ++i) {
        if (!taken[i]) {
            taken[i] = true;
            ++count;
        }
    }

    for (size_t i = 0; i < eligible.size(); ++i) {
        if (taken[i]) {
            result.selected.push_back(eligible[i]);
        }
    }
    // A capped selection still backfills from the other eligible peers
    result.single_source = eligible.size() < 2;

    std::string names;
    for (const auto& p : result.selected) {
        if (!names.empty()) names += ", ";
        names += p.peer_id + "/" + to_string(p.protocol);
    }
    Logger::instance().info("Selected " + std::to_string(result.selected.size()) + " of " +
                            std::to_string(eligible.size()) + " eligible peers: " + names);
    return result;
}

std::optional<CandidatePeer> SourceSelector::backfill(const std::vector<CandidatePeer>& candidates,
                                                      const std::set<std::string>& active,
                                                      const std::set<std::string>& excluded) const {
    std::set<std::string> skip = excluded;
    skip.insert(active.begin(), active.end());

    for (const auto& c : rank_candidates(candidates, skip)) {
        if (is_eligible(c.peer_id)) {
            Logger::instance().info("Backfilling with peer " + c.peer_id);
            return c;
        }
    }
    return std::nullopt;
}

} // namespace meshload
