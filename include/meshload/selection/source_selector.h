#ifndef MESHLOAD_SELECTION_SOURCE_SELECTOR_H
#define MESHLOAD_SELECTION_SOURCE_SELECTOR_H

#include "meshload/base/config.h"
#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include "meshload/reputation/reputation_engine.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshload {

struct SelectionResult {
    std::vector<CandidatePeer> selected;  // best first
    bool single_source = false;           // fewer than two eligible peers
    bool degraded = false;                // nobody met the trust threshold, best untrusted peer used
    ErrorCode error = ErrorCode::Success;

    bool ok() const { return error == ErrorCode::Success; }
};

// Picks a bounded, reputation-ranked peer subset for one download
class SourceSelector {
public:
    SourceSelector(const SelectionConfig& config, const ReputationEngine& reputation);

    // excluded: peers already removed from this session
    SelectionResult select(const std::vector<CandidatePeer>& candidates,
                           const std::set<std::string>& excluded = {}) const;

    // Best eligible candidate not active and not excluded, used after a permanent peer removal
    std::optional<CandidatePeer> backfill(const std::vector<CandidatePeer>& candidates,
                                          const std::set<std::string>& active,
                                          const std::set<std::string>& excluded) const;

    bool is_eligible(const std::string& peer_id) const;

private:
    std::vector<CandidatePeer> rank_candidates(const std::vector<CandidatePeer>& candidates,
                                               const std::set<std::string>& skip) const;

    SelectionConfig config_;
    const ReputationEngine& reputation_;
};

} // namespace meshload

#endif // MESHLOAD_SELECTION_SOURCE_SELECTOR_H
