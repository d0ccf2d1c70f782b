// End-to-end downloads through the download manager's event loop, with
// local file peers standing in for remote sources

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "meshload/core/serialization.h"
#include "meshload/session/download_manager.h"
#include "meshload/storage/part_file.h"
#include "test_util.h"

using namespace meshload;
namespace fs = std::filesystem;

namespace {

struct ManagerFixture {
    fs::path dir;
    GlobalConfig config;
    ReputationEngine reputation{ReputationConfig{}};
    std::shared_ptr<ManifestDirectoryResolver> resolver;

    explicit ManagerFixture(const std::string& name) {
        dir = test::make_temp_dir(name);
        fs::create_directories(dir / "manifests");
        fs::create_directories(dir / "seed");
        config.download.output_dir = (dir / "out").string();
        config.download.manifest_dir = (dir / "manifests").string();
        config.download.resolve_timeout_ms = 300;
        config.persistence.snapshot_dir = (dir / "snapshots").string();
        resolver = std::make_shared<ManifestDirectoryResolver>(config.download.manifest_dir,
                                                               std::chrono::milliseconds(20));
    }

    ~ManagerFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Seeds a file and publishes its manifest with the given number of file peers
    FileDescriptor publish(const std::string& name, const std::vector<uint8_t>& content, uint32_t peers,
                           IntegrityScheme scheme = IntegrityScheme::ChunkHashes) {
        auto descriptor = test::describe_content(dir / "seed", name, content, 4096, scheme);
        for (uint32_t i = 0; i < peers; ++i) {
            descriptor.peers.push_back(CandidatePeer{name + "-peer-" + std::to_string(i), ProtocolTag::File,
                                                     (dir / "seed" / name).string()});
        }
        std::ofstream out(resolver->path_for(descriptor.file_hash));
        out << nlohmann::json(descriptor).dump(2);
        return descriptor;
    }
};

} // anonymous namespace

TEST_CASE("E2E Download Completes", "[e2e]") {
    ManagerFixture fx("e2e_download");
    auto content = test::pattern_bytes(40 * 4096 + 123);
    auto descriptor = fx.publish("movie.bin", content, 3);

    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    std::atomic<int> completed{0};
    std::atomic<int> payments{0};
    manager.events().subscribe([&](const SessionEvent& e) {
        if (std::holds_alternative<DownloadCompleted>(e)) ++completed;
        if (std::holds_alternative<PaymentDue>(e)) ++payments;
    });

    REQUIRE(manager.start());
    REQUIRE(manager.is_running());
    REQUIRE(manager.enqueue(descriptor.file_hash));
    REQUIRE_FALSE(manager.enqueue(descriptor.file_hash));

    REQUIRE(manager.wait_idle(std::chrono::seconds(30)));
    auto info = manager.status(descriptor.file_hash);
    REQUIRE(info.has_value());
    REQUIRE(info->status == SessionStatus::Completed);
    REQUIRE(info->output_path == (fs::path(fx.config.download.output_dir) / "movie.bin").string());
    REQUIRE(test::read_file(info->output_path) == content);

    uint32_t by_peers = 0;
    for (const auto& p : info->peer_progress) {
        by_peers += p.chunks_completed;
    }
    REQUIRE(by_peers == descriptor.total_chunks);

    manager.stop();
    REQUIRE_FALSE(manager.is_running());
    REQUIRE(completed == 1);
    REQUIRE(payments >= 1);
    REQUIRE_FALSE(fs::exists(fs::path(fx.config.persistence.snapshot_dir) /
                             (descriptor.file_hash + ".state")));
}

TEST_CASE("E2E Concurrent Downloads", "[e2e]") {
    ManagerFixture fx("e2e_concurrent");
    auto first = test::pattern_bytes(12 * 4096, 1);
    auto second = test::pattern_bytes(9 * 4096 + 7, 2);
    auto d1 = fx.publish("first.bin", first, 2);
    auto d2 = fx.publish("second.bin", second, 1, IntegrityScheme::MerkleRoot);

    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    REQUIRE(manager.start());
    REQUIRE(manager.enqueue(d1.file_hash));
    REQUIRE(manager.enqueue(d2.file_hash, DownloadRequest{(fx.dir / "custom.bin").string(), {}}));

    REQUIRE(manager.wait_idle(std::chrono::seconds(30)));
    REQUIRE(manager.list().size() == 2);
    REQUIRE(manager.status(d1.file_hash)->status == SessionStatus::Completed);
    REQUIRE(manager.status(d2.file_hash)->status == SessionStatus::Completed);
    REQUIRE(test::read_file(fx.dir / "out" / "first.bin") == first);
    REQUIRE(test::read_file(fx.dir / "custom.bin") == second);
    manager.stop();
}

TEST_CASE("E2E Concurrency Limit Queues Second Download", "[e2e][queue]") {
    ManagerFixture fx("e2e_queue");
    fx.config.download.max_concurrent_downloads = 1;
    auto first = test::pattern_bytes(16 * 4096, 4);
    auto second = test::pattern_bytes(6 * 4096, 5);
    auto d1 = fx.publish("one.bin", first, 2);
    auto d2 = fx.publish("two.bin", second, 2);

    std::mutex mutex;
    std::vector<SessionStateChanged> log;
    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    manager.events().subscribe([&](const SessionEvent& e) {
        if (const auto* changed = std::get_if<SessionStateChanged>(&e)) {
            std::lock_guard<std::mutex> lock(mutex);
            log.push_back(*changed);
        }
    });

    REQUIRE(manager.start());
    REQUIRE(manager.enqueue(d1.file_hash));
    REQUIRE(manager.enqueue(d2.file_hash));
    REQUIRE(manager.wait_idle(std::chrono::seconds(30)));
    manager.stop();

    REQUIRE(manager.status(d1.file_hash)->status == SessionStatus::Completed);
    REQUIRE(manager.status(d2.file_hash)->status == SessionStatus::Completed);
    REQUIRE(test::read_file(fx.dir / "out" / "two.bin") == second);

    // The second session only leaves Queued once the first is done
    std::lock_guard<std::mutex> lock(mutex);
    auto first_done = std::find_if(log.begin(), log.end(), [&](const SessionStateChanged& c) {
        return c.file_hash == d1.file_hash && c.to == SessionStatus::Completed;
    });
    auto second_starts = std::find_if(log.begin(), log.end(), [&](const SessionStateChanged& c) {
        return c.file_hash == d2.file_hash;
    });
    REQUIRE(first_done != log.end());
    REQUIRE(second_starts != log.end());
    REQUIRE(second_starts->from == SessionStatus::Queued);
    REQUIRE(first_done < second_starts);
}

TEST_CASE("E2E Manager Torn Down Mid Download", "[e2e][lifecycle]") {
    ManagerFixture fx("e2e_teardown");
    auto content = test::pattern_bytes(64 * 4096, 6);
    auto descriptor = fx.publish("big.bin", content, 3);

    for (int i = 0; i < 3; ++i) {
        DownloadManager manager(fx.config, fx.reputation, fx.resolver);
        REQUIRE(manager.start());
        REQUIRE(manager.enqueue(descriptor.file_hash));
    }

    // Nothing left running from the torn-down managers; a fresh one finishes the file
    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    REQUIRE(manager.start());
    manager.stop();
    REQUIRE(manager.start());
    REQUIRE(manager.enqueue(descriptor.file_hash));
    REQUIRE(manager.wait_idle(std::chrono::seconds(30)));
    REQUIRE(manager.status(descriptor.file_hash)->status == SessionStatus::Completed);
    REQUIRE(test::read_file(fx.dir / "out" / "big.bin") == content);
    manager.stop();
}

TEST_CASE("E2E Unknown Hash Fails", "[e2e][error]") {
    ManagerFixture fx("e2e_unknown");
    std::string missing(64, 'd');

    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    REQUIRE(manager.start());
    REQUIRE(manager.enqueue(missing));

    REQUIRE(manager.wait_idle(std::chrono::seconds(10)));
    auto info = manager.status(missing);
    REQUIRE(info.has_value());
    REQUIRE(info->status == SessionStatus::Failed);
    REQUIRE(info->error.has_value());
    REQUIRE(info->error->code == ErrorCode::NotFound);

    REQUIRE(manager.remove(missing));
    manager.stop();
}

TEST_CASE("E2E Resume From Snapshot", "[e2e][resume]") {
    ManagerFixture fx("e2e_resume");
    auto content = test::pattern_bytes(20 * 4096, 3);
    auto descriptor = fx.publish("resume.bin", content, 2);
    std::string output = (fx.dir / "out" / "resume.bin").string();

    // Half of the file was fetched by an earlier run
    fs::create_directories(fx.dir / "out");
    PartFile part(output, content.size());
    std::vector<uint8_t> partial = content;
    std::fill(partial.begin() + 10 * 4096, partial.end(), 0);
    test::write_file(part.path(), partial);

    SessionSnapshot snapshot;
    snapshot.descriptor = descriptor;
    snapshot.completed.assign(descriptor.total_chunks, false);
    for (uint32_t i = 0; i < 10; ++i) {
        snapshot.completed[i] = true;
    }
    snapshot.output_path = output;
    snapshot.saved_at = std::chrono::system_clock::now() - std::chrono::minutes(5);
    SnapshotStore store(fx.config.persistence);
    REQUIRE(store.save(snapshot));

    DownloadManager manager(fx.config, fx.reputation, fx.resolver);
    REQUIRE(manager.start());
    REQUIRE(manager.restore_snapshots() == 1);
    REQUIRE(manager.wait_idle(std::chrono::seconds(10)));
    REQUIRE(manager.status(descriptor.file_hash)->status == SessionStatus::Paused);

    REQUIRE(manager.resume(descriptor.file_hash));
    REQUIRE(manager.wait_idle(std::chrono::seconds(30)));
    REQUIRE(manager.status(descriptor.file_hash)->status == SessionStatus::Completed);
    REQUIRE(test::read_file(output) == content);
    manager.stop();
}
