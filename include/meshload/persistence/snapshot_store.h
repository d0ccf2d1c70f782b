#ifndef MESHLOAD_PERSISTENCE_SNAPSHOT_STORE_H
#define MESHLOAD_PERSISTENCE_SNAPSHOT_STORE_H

#include "meshload/base/config.h"
#include "meshload/core/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace meshload {

// Current snapshot format. Version 1 stored a list of completed indices and
// no peer assignments; it is still readable.
constexpr int kSnapshotVersion = 2;

struct SessionSnapshot {
    int version = kSnapshotVersion;
    FileDescriptor descriptor;
    std::vector<bool> completed;            // one bit per chunk
    std::vector<std::string> last_peers;    // peers assigned when the snapshot was taken
    std::string output_path;
    WallTime saved_at{};

    const std::string& file_hash() const { return descriptor.file_hash; }
    uint32_t completed_count() const;
};

// Bitmap as lowercase hex, chunk i is bit (i % 8) of byte (i / 8)
std::string encode_bitmap(const std::vector<bool>& bits);
std::optional<std::vector<bool>> decode_bitmap(const std::string& hex, size_t count);

nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot);
std::optional<SessionSnapshot> snapshot_from_json(const nlohmann::json& j);

// One "<file_hash>.state" JSON file per in-progress download
class SnapshotStore {
public:
    explicit SnapshotStore(const PersistenceConfig& config);

    std::string path_for(const std::string& file_hash) const;

    // temp file + rename
    bool save(const SessionSnapshot& snapshot);

    // Fresh snapshot or nullopt. Stale, corrupt or mismatched files are deleted.
    std::optional<SessionSnapshot> load(const std::string& file_hash, WallTime now);

    // Every fresh snapshot in the directory
    std::vector<SessionSnapshot> load_all(WallTime now);

    bool remove(const std::string& file_hash);

    // Deletes stale and unreadable snapshots; returns removed count
    size_t cleanup(WallTime now);

    bool is_fresh(const SessionSnapshot& snapshot, WallTime now) const;

private:
    std::optional<SessionSnapshot> load_path(const std::string& path, WallTime now,
                                             const std::string& expected_hash);

    PersistenceConfig config_;
};

} // namespace meshload

#endif // MESHLOAD_PERSISTENCE_SNAPSHOT_STORE_H
