#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>
#include "meshload/selection/source_selector.h"

using namespace meshload;

namespace {

// Neutral components (base 50) shifted to the wanted score, seen just now
void set_score(ReputationEngine& engine, const std::string& peer_id, double score) {
    PeerRecord r;
    r.peer_id = peer_id;
    r.avg_bandwidth_bps = engine.config().reference_bandwidth_bps * 0.5;
    r.adjustment = score - 50.0;
    r.last_seen_at = std::chrono::system_clock::now();
    engine.upsert(r);
}

CandidatePeer peer(const std::string& id, ProtocolTag protocol = ProtocolTag::Tcp) {
    return CandidatePeer{id, protocol, id + ".example:7000"};
}

std::vector<std::string> ids(const std::vector<CandidatePeer>& peers) {
    std::vector<std::string> out;
    for (const auto& p : peers) {
        out.push_back(p.peer_id);
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Selection Picks Best Scored Peers", "[selection]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    set_score(engine, "p90", 90.0);
    set_score(engine, "p70", 70.0);
    set_score(engine, "p50", 50.0);

    SelectionConfig config;
    config.max_peers = 2;
    SourceSelector selector(config, engine);

    auto result = selector.select({peer("p50"), peer("p90"), peer("p70")});
    REQUIRE(result.ok());
    REQUIRE(ids(result.selected) == std::vector<std::string>{"p90", "p70"});
    REQUIRE_FALSE(result.single_source);
    REQUIRE_FALSE(result.degraded);
}

TEST_CASE("Selection Single Candidate Runs Single Source", "[selection][single]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    SelectionConfig config;
    SourceSelector selector(config, engine);

    auto result = selector.select({peer("only")});
    REQUIRE(result.ok());
    REQUIRE(result.selected.size() == 1);
    REQUIRE(result.single_source);
}

TEST_CASE("Selection Capped To One Peer Stays Multi Source", "[selection][single]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    set_score(engine, "best", 80.0);
    set_score(engine, "spare", 60.0);

    SelectionConfig config;
    config.max_peers = 1;
    SourceSelector selector(config, engine);

    // The spare peer is still there to take over failed chunks
    auto result = selector.select({peer("spare"), peer("best")});
    REQUIRE(result.ok());
    REQUIRE(ids(result.selected) == std::vector<std::string>{"best"});
    REQUIRE_FALSE(result.single_source);
}

TEST_CASE("Selection Without Candidates", "[selection][error]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    SelectionConfig config;
    SourceSelector selector(config, engine);

    auto result = selector.select({});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == ErrorCode::NoPeersAvailable);

    // Every candidate already excluded
    result = selector.select({peer("a"), peer("b")}, {"a", "b"});
    REQUIRE(result.error == ErrorCode::NoPeersAvailable);
}

TEST_CASE("Selection Below Trust Threshold", "[selection][trust]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    set_score(engine, "weak", 15.0);
    set_score(engine, "weaker", 5.0);

    SECTION("Falls back to the best untrusted peer") {
        SelectionConfig config;
        config.allow_untrusted_fallback = true;
        SourceSelector selector(config, engine);

        auto result = selector.select({peer("weaker"), peer("weak")});
        REQUIRE(result.ok());
        REQUIRE(result.degraded);
        REQUIRE(result.single_source);
        REQUIRE(ids(result.selected) == std::vector<std::string>{"weak"});
    }

    SECTION("Fails when fallback is disabled") {
        SelectionConfig config;
        config.allow_untrusted_fallback = false;
        SourceSelector selector(config, engine);

        auto result = selector.select({peer("weaker"), peer("weak")});
        REQUIRE(result.error == ErrorCode::InsufficientReputationPeers);
        REQUIRE(result.selected.empty());
    }
}

TEST_CASE("Selection Skips Unhealthy Peers", "[selection][health]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);

    PeerRecord sick;
    sick.peer_id = "sick";
    sick.success_count = 2;
    sick.failure_count = 8;
    sick.avg_bandwidth_bps = rep_config.reference_bandwidth_bps;
    sick.uptime_ratio = 1.0;
    sick.recent_success = 1.0;
    sick.adjustment = 40.0;
    sick.last_seen_at = std::chrono::system_clock::now();
    engine.upsert(sick);
    set_score(engine, "ok", 60.0);

    SelectionConfig config;
    SourceSelector selector(config, engine);
    REQUIRE_FALSE(selector.is_eligible("sick"));

    auto result = selector.select({peer("sick"), peer("ok")});
    REQUIRE(ids(result.selected) == std::vector<std::string>{"ok"});
}

TEST_CASE("Selection Keeps Protocol Diversity", "[selection][protocol]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    set_score(engine, "tcp-a", 90.0);
    set_score(engine, "tcp-b", 80.0);
    set_score(engine, "http-c", 40.0);

    SelectionConfig config;
    config.max_peers = 2;
    SourceSelector selector(config, engine);

    auto result = selector.select({peer("tcp-a"), peer("tcp-b"), peer("http-c", ProtocolTag::Http)});
    REQUIRE(ids(result.selected) == std::vector<std::string>{"tcp-a", "http-c"});
}

TEST_CASE("Selection Deduplicates Candidates", "[selection]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    SelectionConfig config;
    SourceSelector selector(config, engine);

    CandidatePeer first{"dup", ProtocolTag::Tcp, "10.0.0.1:7000"};
    CandidatePeer second{"dup", ProtocolTag::Http, "http://10.0.0.2/file"};
    auto result = selector.select({first, second, peer("other")});
    REQUIRE(result.selected.size() == 2);
    for (const auto& p : result.selected) {
        if (p.peer_id == "dup") {
            REQUIRE(p == first);
        }
    }
}

TEST_CASE("Selection Backfill", "[selection][backfill]") {
    ReputationConfig rep_config;
    ReputationEngine engine(rep_config);
    set_score(engine, "a", 90.0);
    set_score(engine, "b", 70.0);
    set_score(engine, "c", 60.0);
    set_score(engine, "d", 10.0);

    SelectionConfig config;
    SourceSelector selector(config, engine);
    std::vector<CandidatePeer> candidates{peer("a"), peer("b"), peer("c"), peer("d")};

    auto next = selector.backfill(candidates, {"a"}, {"b"});
    REQUIRE(next.has_value());
    REQUIRE(next->peer_id == "c");

    // d is below the trust threshold
    next = selector.backfill(candidates, {"a", "c"}, {"b"});
    REQUIRE_FALSE(next.has_value());
}
