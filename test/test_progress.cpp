#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <chrono>
#include "meshload/progress/progress_aggregator.h"

using namespace meshload;
using Catch::Matchers::WithinAbs;

namespace {

const SteadyTime kStart = SteadyTime(std::chrono::seconds(500));

ProgressConfig progress_config() {
    ProgressConfig config;
    config.speed_window_ms = 1000;
    config.tick_interval_ms = 500;
    return config;
}

SteadyTime at_ms(int64_t ms) {
    return kStart + std::chrono::milliseconds(ms);
}

} // anonymous namespace

TEST_CASE("Progress Counts Chunks And Bytes", "[progress]") {
    ProgressAggregator progress("hash", 10000, 10, progress_config());
    progress.set_peer_active("a", true);
    progress.on_assigned("a");
    progress.on_assigned("a");
    progress.on_completed("a", 1000, at_ms(0));

    auto update = progress.current(at_ms(0));
    REQUIRE(update.file_hash == "hash");
    REQUIRE(update.completed_chunks == 1);
    REQUIRE(update.downloaded_bytes == 1000);
    REQUIRE(update.total_bytes == 10000);
    REQUIRE(update.active_sources == 1);
    REQUIRE_THAT(update.percent(), WithinAbs(10.0, 1e-9));

    auto peers = progress.peers(at_ms(0));
    REQUIRE(peers.size() == 1);
    REQUIRE(peers[0].chunks_assigned == 2);
    REQUIRE(peers[0].chunks_completed == 1);
    REQUIRE(peers[0].bytes_downloaded == 1000);
}

TEST_CASE("Progress Speed Over Sliding Window", "[progress][speed]") {
    ProgressAggregator progress("hash", 10000, 10, progress_config());
    progress.set_peer_active("a", true);
    progress.set_peer_active("b", true);

    progress.on_completed("a", 1000, at_ms(0));
    progress.on_completed("a", 1000, at_ms(400));
    progress.on_completed("b", 500, at_ms(800));

    REQUIRE_THAT(progress.peer_speed("a", at_ms(900)), WithinAbs(2000.0, 1e-9));
    REQUIRE_THAT(progress.peer_speed("b", at_ms(900)), WithinAbs(500.0, 1e-9));
    REQUIRE_THAT(progress.overall_speed(at_ms(900)), WithinAbs(2500.0, 1e-9));

    // The first sample of a has left the window
    REQUIRE_THAT(progress.peer_speed("a", at_ms(1200)), WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(progress.peer_speed("a", at_ms(5000)), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(progress.peer_speed("unknown", at_ms(0)), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Progress ETA", "[progress][eta]") {
    ProgressAggregator progress("hash", 10000, 10, progress_config());
    REQUIRE_FALSE(progress.current(at_ms(0)).eta_seconds.has_value());

    progress.set_peer_active("a", true);
    progress.on_completed("a", 1000, at_ms(0));
    progress.on_completed("a", 1000, at_ms(100));

    auto update = progress.current(at_ms(200));
    REQUIRE(update.eta_seconds.has_value());
    REQUIRE_THAT(*update.eta_seconds, WithinAbs(4.0, 1e-9));
}

TEST_CASE("Progress Ignores Inactive Peers For Speed", "[progress][speed]") {
    ProgressAggregator progress("hash", 10000, 10, progress_config());
    progress.set_peer_active("a", true);
    progress.on_completed("a", 1000, at_ms(0));
    progress.set_peer_active("a", false);

    auto update = progress.current(at_ms(100));
    REQUIRE(update.active_sources == 0);
    REQUIRE_THAT(update.speed_bps, WithinAbs(0.0, 1e-9));
    REQUIRE(update.downloaded_bytes == 1000);
}

TEST_CASE("Progress Restored Chunks", "[progress][resume]") {
    ProgressAggregator progress("hash", 100 * 1024, 100, progress_config());
    progress.add_restored(60, 60 * 1024);

    auto update = progress.current(at_ms(0));
    REQUIRE(update.completed_chunks == 60);
    REQUIRE(update.downloaded_bytes == 60 * 1024);
    REQUIRE_THAT(update.percent(), WithinAbs(60.0, 1e-9));
    REQUIRE_THAT(update.speed_bps, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Progress Poll Is Throttled", "[progress][poll]") {
    ProgressAggregator progress("hash", 10000, 10, progress_config());

    // Initial state is reported once
    auto initial = progress.poll(at_ms(0));
    REQUIRE(initial.has_value());
    REQUIRE(initial->completed_chunks == 0);
    REQUIRE_FALSE(progress.poll(at_ms(600)).has_value());

    progress.set_peer_active("a", true);
    progress.on_completed("a", 1000, at_ms(700));

    auto first = progress.poll(at_ms(800));
    REQUIRE(first.has_value());
    REQUIRE(first->completed_chunks == 1);

    progress.on_completed("a", 1000, at_ms(900));
    REQUIRE_FALSE(progress.poll(at_ms(1000)).has_value());

    auto second = progress.poll(at_ms(1300));
    REQUIRE(second.has_value());
    REQUIRE(second->completed_chunks == 2);
    REQUIRE_THAT(second->speed_bps, WithinAbs(2000.0, 1e-9));

    // Transfer stopped: one more update reports the speed dropping to zero
    auto drained = progress.poll(at_ms(4000));
    REQUIRE(drained.has_value());
    REQUIRE_THAT(drained->speed_bps, WithinAbs(0.0, 1e-9));
    REQUIRE_FALSE(progress.poll(at_ms(5000)).has_value());
}

TEST_CASE("Progress Percent Of Empty Download", "[progress]") {
    ProgressUpdate update;
    REQUIRE_THAT(update.percent(), WithinAbs(100.0, 1e-9));
}
