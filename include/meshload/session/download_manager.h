#ifndef MESHLOAD_SESSION_DOWNLOAD_MANAGER_H
#define MESHLOAD_SESSION_DOWNLOAD_MANAGER_H

#include "meshload/base/config.h"
#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include "meshload/discovery/descriptor_resolver.h"
#include "meshload/persistence/snapshot_store.h"
#include "meshload/progress/progress_aggregator.h"
#include "meshload/reputation/reputation_engine.h"
#include "meshload/session/event_bus.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

struct DownloadRequest {
    std::string output_path;              // empty: <output_dir>/<file name or hash>
    std::vector<uint8_t> decryption_key;
};

// Point-in-time view of one download, safe to read from any thread
struct SessionInfo {
    std::string file_hash;
    std::string file_name;
    SessionStatus status = SessionStatus::Queued;
    ProgressUpdate progress;
    std::vector<PeerProgress> peer_progress;
    std::vector<std::string> peers;
    std::optional<SessionError> error;
    std::string output_path;
};

// Runs every download session on one Elio event loop thread. Commands are
// queued to that thread; observers read cached status or subscribe to events.
class DownloadManager {
public:
    DownloadManager(const GlobalConfig& config, ReputationEngine& reputation,
                    std::shared_ptr<DescriptorResolver> resolver);
    ~DownloadManager();

    bool start();
    void stop();
    bool is_running() const;

    // Queues a download; false when the hash is already managed
    bool enqueue(const std::string& file_hash, DownloadRequest request = {});

    bool pause(const std::string& file_hash);
    bool resume(const std::string& file_hash);
    bool cancel(const std::string& file_hash);
    bool retry_failed(const std::string& file_hash);

    // Drops a session; active downloads are canceled first
    bool remove(const std::string& file_hash);

    // Loads fresh snapshots as Paused sessions; returns how many were restored.
    // The key is handed to restored sessions whose content is encrypted.
    size_t restore_snapshots(const std::vector<uint8_t>& decryption_key = {});

    std::optional<SessionInfo> status(const std::string& file_hash) const;
    std::vector<SessionInfo> list() const;

    // Blocks until every session is terminal or paused, or the timeout passes
    bool wait_idle(std::chrono::milliseconds timeout) const;

    EventBus& events();

    // Not owned; must outlive the manager
    void set_transfer_hook(TransferHook* hook);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace meshload

#endif // MESHLOAD_SESSION_DOWNLOAD_MANAGER_H
