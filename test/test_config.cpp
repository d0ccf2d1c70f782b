#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "meshload/base/config.h"
#include "meshload/base/error_code.h"

using namespace meshload;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path temp_file(const std::string& name, const std::string& content) {
    auto dir = std::filesystem::temp_directory_path() / "meshload_test_config";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

// CLI11 wants a mutable argv
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
    }
    int argc() const { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // anonymous namespace

TEST_CASE("Config Defaults", "[config]") {
    Config::instance().reset();
    const auto& config = Config::instance().get();

    REQUIRE(config.selection.max_peers == 3);
    REQUIRE(config.scheduler.max_in_flight_per_peer == 3);
    REQUIRE(config.scheduler.max_retries == 3);
    REQUIRE(config.scheduler.chunk_timeout_ms == 30000);
    REQUIRE(config.download.max_concurrent_downloads == 3);
    REQUIRE(config.persistence.freshness_window_sec == 24 * 3600);
    REQUIRE_THAT(config.selection.min_trust_score, WithinAbs(20.0, 1e-9));
    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config Load INI File", "[config][file]") {
    Config::instance().reset();
    auto path = temp_file("meshload.ini",
                          "# comment\n"
                          "[selection]\n"
                          "max_peers = 5\n"
                          "min_trust_score = 40\n"
                          "\n"
                          "[scheduler]\n"
                          "max_in_flight_per_peer = 2\n"
                          "chunk_timeout_ms = 1500\n"
                          "\n"
                          "[persistence]\n"
                          "snapshot_dir = \"/tmp/meshload-snapshots\"\n"
                          "keep_verified_on_cancel = false\n"
                          "\n"
                          "[log]\n"
                          "level = warning\n");

    REQUIRE(Config::instance().load_from_file(path.string()));
    const auto& config = Config::instance().get();
    REQUIRE(config.selection.max_peers == 5);
    REQUIRE_THAT(config.selection.min_trust_score, WithinAbs(40.0, 1e-9));
    REQUIRE(config.scheduler.max_in_flight_per_peer == 2);
    REQUIRE(config.scheduler.chunk_timeout_ms == 1500);
    REQUIRE(config.persistence.snapshot_dir == "/tmp/meshload-snapshots");
    REQUIRE(config.persistence.keep_verified_on_cancel == false);
    REQUIRE(Config::instance().get_config_file() == path.string());

    Config::instance().reset();
}

TEST_CASE("Config Load JSON File", "[config][file][json]") {
    Config::instance().reset();
    auto path = temp_file("meshload.json", R"({
        "download": {"output_dir": "/tmp/out", "max_concurrent_downloads": 1},
        "reputation": {"decay_rate": 0.1, "store_path": "/tmp/rep.json"}
    })");

    REQUIRE(Config::instance().load_from_file(path.string()));
    const auto& config = Config::instance().get();
    REQUIRE(config.download.output_dir == "/tmp/out");
    REQUIRE(config.download.max_concurrent_downloads == 1);
    REQUIRE_THAT(config.reputation.decay_rate, WithinAbs(0.1, 1e-9));
    REQUIRE(config.reputation.store_path == "/tmp/rep.json");

    Config::instance().reset();
}

TEST_CASE("Config Rejects Bad Files", "[config][file]") {
    Config::instance().reset();

    REQUIRE_FALSE(Config::instance().load_from_file("/nonexistent/meshload.ini"));

    auto broken = temp_file("broken.json", "{ not json");
    REQUIRE_FALSE(Config::instance().load_from_file(broken.string()));

    auto bad_number = temp_file("bad_number.ini", "[selection]\nmax_peers = many\n");
    REQUIRE_FALSE(Config::instance().load_from_file(bad_number.string()));

    Config::instance().reset();
}

TEST_CASE("Config Load From Environment", "[config][env]") {
    Config::instance().reset();
    setenv("MESHLOAD_MAX_PEERS", "7", 1);
    setenv("MESHLOAD_OUTPUT_DIR", "/tmp/env-out", 1);

    REQUIRE(Config::instance().load_from_env());
    REQUIRE(Config::instance().get().selection.max_peers == 7);
    REQUIRE(Config::instance().get().download.output_dir == "/tmp/env-out");

    setenv("MESHLOAD_MAX_PEERS", "lots", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());

    unsetenv("MESHLOAD_MAX_PEERS");
    unsetenv("MESHLOAD_OUTPUT_DIR");
    Config::instance().reset();
}

TEST_CASE("Config Parse Command Line", "[config][cli]") {
    Config::instance().reset();
    Argv args({"meshload", "--max-peers", "4", "--window", "6", "-o", "/tmp/cli-out", "--resume",
               "aaaa", "bbbb"});

    REQUIRE(Config::instance().parse_command_line(args.argc(), args.argv()));
    const auto& config = Config::instance().get();
    const auto& cmd = Config::instance().command_line();
    REQUIRE(config.selection.max_peers == 4);
    REQUIRE(config.scheduler.max_in_flight_per_peer == 6);
    REQUIRE(config.download.output_dir == "/tmp/cli-out");
    REQUIRE(cmd.resume);
    REQUIRE(cmd.file_hashes == std::vector<std::string>{"aaaa", "bbbb"});

    Config::instance().reset();
}

TEST_CASE("Config Command Line Overrides File", "[config][cli][file]") {
    Config::instance().reset();
    auto path = temp_file("override.ini", "[selection]\nmax_peers = 9\nmin_trust_score = 60\n");
    Argv args({"meshload", "-c", path.string(), "--max-peers", "2"});

    REQUIRE(Config::instance().parse_command_line(args.argc(), args.argv()));
    REQUIRE(Config::instance().get().selection.max_peers == 2);
    REQUIRE_THAT(Config::instance().get().selection.min_trust_score, WithinAbs(60.0, 1e-9));

    Config::instance().reset();
}

TEST_CASE("Config Validation", "[config][validate]") {
    Config::instance().reset();
    auto& config = Config::instance().get();

    config.selection.max_peers = 0;
    REQUIRE_FALSE(Config::instance().validate());
    config.selection.max_peers = 3;

    config.reputation.decay_rate = 1.5;
    REQUIRE_FALSE(Config::instance().validate());
    config.reputation.decay_rate = 0.05;

    config.selection.min_trust_score = 120.0;
    REQUIRE_FALSE(Config::instance().validate());
    config.selection.min_trust_score = 20.0;

    config.scheduler.max_retries = 0;
    REQUIRE_FALSE(Config::instance().validate());
    config.scheduler.max_retries = 3;

    REQUIRE(Config::instance().validate());
    Config::instance().reset();
}

TEST_CASE("Error Code Helpers", "[config][error]") {
    REQUIRE(is_retryable(ErrorCode::ConnectionLost));
    REQUIRE(is_retryable(ErrorCode::CorruptChunk));
    REQUIRE_FALSE(is_retryable(ErrorCode::FileCorruption));
    REQUIRE_FALSE(is_retryable(ErrorCode::InvalidDescriptor));

    std::error_code ec = ErrorCode::NoPeersAvailable;
    REQUIRE(ec.value() == static_cast<int>(ErrorCode::NoPeersAvailable));
    REQUIRE_FALSE(ec.message().empty());

    SessionError err{ErrorCode::RetriesExhausted, "chunk failed everywhere", 4u, std::string("peer-b")};
    auto text = err.describe();
    REQUIRE(text.find("chunk failed everywhere") != std::string::npos);
    REQUIRE(text.find("4") != std::string::npos);
    REQUIRE(text.find("peer-b") != std::string::npos);

    MeshLoadError error(ErrorCode::SnapshotError, "bad bitmap");
    REQUIRE(error.code() == ErrorCode::SnapshotError);
    REQUIRE(std::string(error.what()).find("bad bitmap") != std::string::npos);
}
