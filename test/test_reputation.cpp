#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>
#include "meshload/reputation/reputation_engine.h"

using namespace meshload;
using Catch::Matchers::WithinAbs;

namespace {

const WallTime kNow = std::chrono::system_clock::time_point(std::chrono::hours(24 * 20000));

// A peer whose history yields a base score of exactly 100
PeerRecord perfect_record(const std::string& peer_id, const ReputationConfig& config, WallTime seen) {
    PeerRecord r;
    r.peer_id = peer_id;
    r.success_count = 10;
    r.avg_bandwidth_bps = config.reference_bandwidth_bps;
    r.uptime_ratio = 1.0;
    r.recent_success = 1.0;
    r.last_seen_at = seen;
    return r;
}

} // anonymous namespace

TEST_CASE("Reputation Composite Score", "[reputation][score]") {
    REQUIRE_THAT(ReputationEngine::composite_score(1.0, 1.0, 1.0, 1.0), WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(ReputationEngine::composite_score(0.0, 0.0, 0.0, 0.0), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(ReputationEngine::composite_score(0.5, 0.5, 0.5, 0.5), WithinAbs(50.0, 1e-9));
    // 30% success rate, 20% speed, 20% uptime, 30% recent success
    REQUIRE_THAT(ReputationEngine::composite_score(0.9, 0.8, 1.0, 0.5), WithinAbs(78.0, 1e-9));
}

TEST_CASE("Reputation Decay", "[reputation][decay]") {
    SECTION("Score decays per day since last seen") {
        REQUIRE_THAT(ReputationEngine::decayed_score(80.0, 10.0, 0.05, 10.0),
                     WithinAbs(80.0 * std::pow(0.95, 10.0), 1e-9));
        REQUIRE_THAT(ReputationEngine::decayed_score(80.0, 0.0, 0.05, 10.0), WithinAbs(80.0, 1e-9));
    }

    SECTION("Decay stops at the floor") {
        REQUIRE_THAT(ReputationEngine::decayed_score(80.0, 200.0, 0.05, 10.0), WithinAbs(10.0, 1e-9));
    }

    SECTION("Scores below the floor are not raised") {
        REQUIRE_THAT(ReputationEngine::decayed_score(5.0, 30.0, 0.05, 10.0), WithinAbs(5.0, 1e-9));
    }

    SECTION("Engine applies decay to stored records") {
        ReputationConfig config;
        ReputationEngine engine(config);
        auto record = perfect_record("idle", config, kNow);
        record.adjustment = -20.0;
        engine.upsert(record);

        REQUIRE_THAT(engine.get_score("idle", kNow), WithinAbs(80.0, 1e-6));
        REQUIRE_THAT(engine.get_score("idle", kNow + std::chrono::hours(24 * 10)),
                     WithinAbs(80.0 * std::pow(0.95, 10.0), 1e-6));
    }
}

TEST_CASE("Reputation Unknown Peer Is Neutral", "[reputation]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    REQUIRE_THAT(engine.get_score("stranger", kNow), WithinAbs(50.0, 1e-9));
    REQUIRE(engine.get_trust_level("stranger") == TrustLevel::Medium);
    REQUIRE(engine.is_healthy("stranger"));
    REQUIRE_FALSE(engine.is_backing_off("stranger", kNow));

    engine.touch("stranger", ProtocolTag::Http);
    REQUIRE(engine.size() == 1);
    REQUIRE_THAT(engine.get_score("stranger", kNow), WithinAbs(50.0, 1e-9));
    auto record = engine.get_record("stranger");
    REQUIRE(record.has_value());
    REQUIRE(record->protocol == ProtocolTag::Http);
}

TEST_CASE("Reputation Success Raises Score", "[reputation][success]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    engine.record_success("fast", 1024 * 1024, 1000, kNow);
    double score = engine.get_score("fast", kNow);
    REQUIRE(score > 50.0);
    // base 71.5 plus a 0.75 bonus for one MiB
    REQUIRE_THAT(score, WithinAbs(72.25, 1e-6));

    auto record = engine.get_record("fast");
    REQUIRE(record->success_count == 1);
    REQUIRE(record->bytes_served == 1024 * 1024);
    REQUIRE_THAT(record->avg_bandwidth_bps, WithinAbs(0.6 * 1024 * 1024, 1e-6));
}

TEST_CASE("Reputation Connect Outcomes Drive Uptime", "[reputation][uptime]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    for (int i = 0; i < 4; ++i) {
        engine.record_uptime("reachable", true);
        engine.record_uptime("unreachable", false);
    }
    engine.record_latency("reachable", 40.0);
    engine.record_latency("reachable", 90.0);

    auto up = engine.get_record("reachable");
    auto down = engine.get_record("unreachable");
    REQUIRE(up->uptime_ratio > 0.5);
    REQUIRE(down->uptime_ratio < 0.5);
    REQUIRE_THAT(down->uptime_ratio, WithinAbs(0.5 * 0.8 * 0.8 * 0.8 * 0.8, 1e-9));
    REQUIRE_THAT(up->avg_latency_ms, WithinAbs(50.0, 1e-9));

    REQUIRE(engine.get_score("reachable") > 50.0);
    REQUIRE(engine.get_score("unreachable") < 50.0);
    REQUIRE(engine.rank({"unreachable", "reachable"}) ==
            std::vector<std::string>{"reachable", "unreachable"});
}

TEST_CASE("Reputation Failure Lowers Score", "[reputation][failure]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    engine.record_failure("slow", FetchError::Timeout, kNow);
    engine.record_failure("liar", FetchError::Corrupt, kNow);

    double timeout_score = engine.get_score("slow", kNow);
    double corrupt_score = engine.get_score("liar", kNow);
    REQUIRE_THAT(timeout_score, WithinAbs(25.5, 1e-6));
    REQUIRE(corrupt_score < timeout_score);
    REQUIRE(engine.get_record("slow")->failure_count == 1);
    REQUIRE(engine.get_record("slow")->consecutive_failures == 1);
}

TEST_CASE("Reputation Score Stays In Range", "[reputation][clamp]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    for (int i = 0; i < 100; ++i) {
        engine.record_failure("bad", FetchError::Corrupt, kNow);
        engine.record_success("good", 64 * 1024 * 1024, 100, kNow);
    }
    REQUIRE(engine.get_score("bad", kNow) >= 0.0);
    REQUIRE(engine.get_score("good", kNow) <= 100.0);
    REQUIRE(trust_level_for(engine.get_score("bad", kNow)) == TrustLevel::Unknown);
    REQUIRE(trust_level_for(engine.get_score("good", kNow)) == TrustLevel::Trusted);
}

TEST_CASE("Reputation Backoff", "[reputation][backoff]") {
    ReputationConfig config;
    config.backoff_base_ms = 1000;
    config.backoff_max_ms = 3000;
    ReputationEngine engine(config);

    engine.record_failure("flaky", FetchError::Timeout, kNow);
    REQUIRE(engine.is_backing_off("flaky", kNow + std::chrono::milliseconds(500)));
    REQUIRE_FALSE(engine.is_backing_off("flaky", kNow + std::chrono::milliseconds(1500)));

    engine.record_failure("flaky", FetchError::Timeout, kNow);
    REQUIRE(engine.is_backing_off("flaky", kNow + std::chrono::milliseconds(1500)));

    // Capped at backoff_max_ms
    for (int i = 0; i < 5; ++i) {
        engine.record_failure("flaky", FetchError::Timeout, kNow);
    }
    REQUIRE(engine.is_backing_off("flaky", kNow + std::chrono::milliseconds(2900)));
    REQUIRE_FALSE(engine.is_backing_off("flaky", kNow + std::chrono::milliseconds(3100)));

    engine.record_success("flaky", 1024, 10, kNow);
    REQUIRE_FALSE(engine.is_backing_off("flaky", kNow));
    REQUIRE(engine.get_record("flaky")->consecutive_failures == 0);
}

TEST_CASE("Reputation Health Gate", "[reputation][health]") {
    ReputationConfig config;
    config.health_min_transfers = 5;
    config.health_max_failure_rate = 0.3;
    ReputationEngine engine(config);

    // Too few transfers to judge
    for (int i = 0; i < 4; ++i) {
        engine.record_failure("new", FetchError::Timeout, kNow);
    }
    REQUIRE(engine.is_healthy("new"));

    for (int i = 0; i < 3; ++i) {
        engine.record_success("mixed", 1024, 10, kNow);
    }
    engine.record_failure("mixed", FetchError::Timeout, kNow);
    engine.record_failure("mixed", FetchError::Timeout, kNow);
    REQUIRE_FALSE(engine.is_healthy("mixed"));

    for (int i = 0; i < 9; ++i) {
        engine.record_success("steady", 1024, 10, kNow);
    }
    engine.record_failure("steady", FetchError::PeerRefused, kNow);
    REQUIRE(engine.is_healthy("steady"));
}

TEST_CASE("Reputation Ranking", "[reputation][rank]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    engine.record_success("b", 1024 * 1024, 500, kNow);
    engine.record_failure("c", FetchError::Timeout, kNow);

    auto ranked = engine.rank({"c", "zz", "b", "aa"}, kNow);
    // Ties on the neutral score fall back to peer id order
    REQUIRE(ranked == std::vector<std::string>{"b", "aa", "zz", "c"});
}

TEST_CASE("Reputation Record Event", "[reputation][event]") {
    ReputationConfig config;
    ReputationEngine engine(config);

    engine.record_event({kNow, "p", 4096, 20, TransferOutcome::Success});
    engine.record_event({kNow, "p", 0, 0, TransferOutcome::Corrupt});
    auto record = engine.get_record("p");
    REQUIRE(record->success_count == 1);
    REQUIRE(record->failure_count == 1);
    REQUIRE(record->bytes_served == 4096);

    // A failure keeps its reason: refusals count as seen, timeouts do not
    engine.record_event({kNow, "refuser", 0, 0, TransferOutcome::Failure, FetchError::PeerRefused});
    engine.record_event({kNow + std::chrono::hours(1), "refuser", 0, 0, TransferOutcome::Failure,
                         FetchError::PeerRefused});
    engine.record_event({kNow, "silent", 0, 0, TransferOutcome::Failure, FetchError::Timeout});
    engine.record_event({kNow + std::chrono::hours(1), "silent", 0, 0, TransferOutcome::Failure,
                         FetchError::Timeout});
    REQUIRE(engine.get_record("refuser")->last_seen_at == kNow + std::chrono::hours(1));
    REQUIRE(engine.get_record("silent")->last_seen_at == kNow);
    REQUIRE(engine.get_trust_level("refuser") == trust_level_for(engine.get_score("refuser")));
}

TEST_CASE("Reputation Prune Keeps Pinned Records", "[reputation][prune]") {
    ReputationConfig config;
    ReputationEngine engine(config);
    auto old = kNow - std::chrono::hours(24 * 40);

    engine.upsert(perfect_record("stale", config, old));
    engine.upsert(perfect_record("pinned", config, old));
    engine.upsert(perfect_record("recent", config, kNow));
    engine.retain("pinned");

    REQUIRE(engine.prune(std::chrono::hours(24 * 30), kNow) == 1);
    REQUIRE_FALSE(engine.get_record("stale").has_value());
    REQUIRE(engine.get_record("pinned").has_value());
    REQUIRE(engine.get_record("recent").has_value());

    engine.release("pinned");
    REQUIRE(engine.prune(std::chrono::hours(24 * 30), kNow) == 1);
    REQUIRE(engine.size() == 1);
}

TEST_CASE("Reputation Store Round Trip", "[reputation][persistence]") {
    auto path = std::filesystem::temp_directory_path() / "meshload_test_reputation" / "peers.json";
    std::filesystem::remove_all(path.parent_path());

    ReputationConfig config;
    ReputationEngine engine(config);
    engine.touch("tcp-peer", ProtocolTag::Tcp);
    engine.record_success("tcp-peer", 2 * 1024 * 1024, 800, kNow);
    engine.record_failure("http-peer", FetchError::PeerRefused, kNow);
    REQUIRE(engine.save_to_file(path.string()));

    ReputationEngine loaded(config);
    REQUIRE(loaded.load_from_file(path.string()));
    REQUIRE(loaded.size() == 2);
    REQUIRE_THAT(loaded.get_score("tcp-peer", kNow), WithinAbs(engine.get_score("tcp-peer", kNow), 1e-6));
    REQUIRE_THAT(loaded.get_score("http-peer", kNow), WithinAbs(engine.get_score("http-peer", kNow), 1e-6));
    REQUIRE(loaded.get_record("tcp-peer")->protocol == ProtocolTag::Tcp);

    REQUIRE_FALSE(loaded.load_from_file((path.parent_path() / "missing.json").string()));
    std::filesystem::remove_all(path.parent_path());
}
