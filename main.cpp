#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <csignal>
#include <chrono>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include "meshload/base/logger.h"
#include "meshload/base/config.h"
#include "meshload/core/serialization.h"
#include "meshload/discovery/descriptor_resolver.h"
#include "meshload/integrity/decryptor.h"
#include "meshload/persistence/snapshot_store.h"
#include "meshload/reputation/reputation_engine.h"
#include "meshload/session/download_manager.h"

using namespace meshload;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

class MeshLoadApplication {
public:
    MeshLoadApplication() = default;
    ~MeshLoadApplication() {
        if (manager_) {
            manager_->stop();
        }
    }

    bool initialize(int argc, char* argv[]) {
        // Environment first, command line (and its config file) on top
        Config::instance().load_from_env();
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            std::cerr << "Invalid configuration" << std::endl;
            return false;
        }
        return true;
    }

    int run() {
        const auto& cmd = Config::instance().command_line();

        if (!cmd.describe_path.empty()) {
            return describe(cmd);
        }
        if (cmd.list_snapshots) {
            return list_snapshots();
        }
        if (cmd.file_hashes.empty() && !cmd.resume) {
            std::cerr << "Nothing to download: pass one or more content hashes, or --resume" << std::endl;
            return 1;
        }
        return download(cmd);
    }

private:
    int describe(const CommandLine& cmd) {
        auto scheme = cmd.describe_merkle ? IntegrityScheme::MerkleRoot : IntegrityScheme::ChunkHashes;
        auto descriptor = describe_file(cmd.describe_path, cmd.describe_chunk_size, scheme);
        if (!descriptor) {
            std::cerr << "Cannot describe " << cmd.describe_path << std::endl;
            return 1;
        }
        nlohmann::json j = *descriptor;
        std::cout << j.dump(2) << std::endl;
        return 0;
    }

    int list_snapshots() {
        const auto& config = Config::instance().get();
        SnapshotStore store(config.persistence);
        auto snapshots = store.load_all(std::chrono::system_clock::now());
        if (snapshots.empty()) {
            std::cout << "No resumable downloads" << std::endl;
            return 0;
        }
        for (const auto& s : snapshots) {
            auto age = std::chrono::duration_cast<std::chrono::minutes>(
                std::chrono::system_clock::now() - s.saved_at);
            std::cout << s.file_hash() << "  " << s.completed_count() << "/" << s.completed.size()
                      << " chunks  " << (s.descriptor.file_name.empty() ? "-" : s.descriptor.file_name)
                      << "  saved " << age.count() << " min ago" << std::endl;
        }
        return 0;
    }

    int download(const CommandLine& cmd) {
        const auto& config = Config::instance().get();

        std::vector<uint8_t> key;
        if (!cmd.decryption_key_hex.empty()) {
            auto parsed = from_hex(cmd.decryption_key_hex);
            if (!parsed || parsed->size() != kAesKeySize) {
                std::cerr << "--key must be " << kAesKeySize * 2 << " hex characters" << std::endl;
                return 1;
            }
            key = std::move(*parsed);
        }

        reputation_ = std::make_unique<ReputationEngine>(config.reputation);
        if (!config.reputation.store_path.empty()) {
            if (!reputation_->load_from_file(config.reputation.store_path)) {
                Logger::instance().info("Starting with an empty reputation store");
            }
            auto pruned = reputation_->prune(std::chrono::hours(24 * config.reputation.prune_max_age_days),
                                             std::chrono::system_clock::now());
            if (pruned > 0) {
                Logger::instance().info("Pruned " + std::to_string(pruned) + " stale peer records");
            }
        }

        auto resolver = std::make_shared<ManifestDirectoryResolver>(config.download.manifest_dir);
        manager_ = std::make_unique<DownloadManager>(config, *reputation_, resolver);

        manager_->events().subscribe([](const SessionEvent& event) {
            if (const auto* update = std::get_if<ProgressUpdate>(&event)) {
                std::cout << update->file_hash.substr(0, 12) << "  " << std::fixed << std::setprecision(1)
                          << update->percent() << "%  " << update->completed_chunks << "/"
                          << update->total_chunks << " chunks  "
                          << static_cast<uint64_t>(update->speed_bps / 1024.0) << " KiB/s  "
                          << update->active_sources << " source(s)";
                if (update->eta_seconds) {
                    std::cout << "  eta " << static_cast<uint64_t>(*update->eta_seconds) << "s";
                }
                std::cout << std::endl;
            } else if (const auto* done = std::get_if<DownloadCompleted>(&event)) {
                std::cout << "Completed " << done->file_hash << " -> " << done->output_path << std::endl;
            } else if (const auto* failed = std::get_if<DownloadFailed>(&event)) {
                std::cerr << "Failed " << failed->file_hash << ": " << failed->error.describe() << std::endl;
            }
        });

        if (cmd.resume) {
            auto restored = manager_->restore_snapshots(key);
            std::cout << "Restored " << restored << " download(s)" << std::endl;
            // Restored sessions start paused; --resume is the explicit go-ahead
            for (const auto& info : manager_->list()) {
                if (info.status == SessionStatus::Paused && !manager_->resume(info.file_hash)) {
                    std::cerr << "Cannot resume " << info.file_hash << std::endl;
                }
            }
        }
        for (const auto& hash : cmd.file_hashes) {
            DownloadRequest request;
            request.decryption_key = key;
            if (!manager_->enqueue(hash, std::move(request))) {
                std::cerr << "Skipping duplicate hash " << hash << std::endl;
            }
        }

        if (!manager_->start()) {
            return 1;
        }

        bool interrupted = false;
        while (!manager_->wait_idle(std::chrono::milliseconds(200))) {
            if (!g_running) {
                interrupted = true;
                Logger::instance().info("Interrupted, pausing downloads");
                break;
            }
        }

        manager_->stop();
        if (!config.reputation.store_path.empty()) {
            if (!reputation_->save_to_file(config.reputation.store_path)) {
                std::cerr << "Could not save reputation store " << config.reputation.store_path << std::endl;
            }
        }

        if (interrupted) {
            return 130;
        }
        int rc = 0;
        for (const auto& info : manager_->list()) {
            if (info.status != SessionStatus::Completed) {
                rc = 1;
            }
            for (const auto& peer : info.peer_progress) {
                if (peer.chunks_completed == 0) continue;
                std::cout << "  " << info.file_hash.substr(0, 12) << " from " << peer.peer_id << ": "
                          << peer.chunks_completed << "/" << peer.chunks_assigned << " chunks, "
                          << peer.bytes_downloaded << " bytes" << std::endl;
            }
        }
        return rc;
    }

    std::unique_ptr<ReputationEngine> reputation_;
    std::unique_ptr<DownloadManager> manager_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        MeshLoadApplication app;
        if (!app.initialize(argc, argv)) {
            return 1;
        }
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
