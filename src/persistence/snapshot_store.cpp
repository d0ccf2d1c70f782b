#include "meshload/persistence/snapshot_store.h"
#include "meshload/base/logger.h"
#include "meshload/core/serialization.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace meshload {

namespace {

constexpr const char* kSnapshotExtension = ".state";

void delete_file(const std::string& path, const std::string& why) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Logger::instance().warning("Failed to delete snapshot " + path + ": " + ec.message());
    } else {
        Logger::instance().info("Deleted " + why + " snapshot " + path);
    }
}

} // anonymous namespace

uint32_t SessionSnapshot::completed_count() const {
    return static_cast<uint32_t>(std::count(completed.begin(), completed.end(), true));
}

std::string encode_bitmap(const std::vector<bool>& bits) {
    std::vector<uint8_t> bytes((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            bytes[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
    }
    return to_hex(bytes.data(), bytes.size());
}

std::optional<std::vector<bool>> decode_bitmap(const std::string& hex, size_t count) {
    auto bytes = from_hex(hex);
    if (!bytes || bytes->size() != (count + 7) / 8) {
        return std::nullopt;
    }
    std::vector<bool> bits(count);
    for (size_t i = 0; i < count; ++i) {
        bits[i] = ((*bytes)[i / 8] >> (i % 8)) & 1u;
    }
    return bits;
}

nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot) {
    return nlohmann::json{
        {"version", kSnapshotVersion},
        {"file_hash", snapshot.descriptor.file_hash},
        {"descriptor", snapshot.descriptor},
        {"bitmap", encode_bitmap(snapshot.completed)},
        {"last_peers", snapshot.last_peers},
        {"output_path", snapshot.output_path},
        {"saved_at", to_unix_millis(snapshot.saved_at)}
    };
}

std::optional<SessionSnapshot> snapshot_from_json(const nlohmann::json& j) {
    try {
        SessionSnapshot snapshot;
        snapshot.version = j.value("version", 1);
        if (snapshot.version < 1 || snapshot.version > kSnapshotVersion) {
            return std::nullopt;
        }

        j.at("descriptor").get_to(snapshot.descriptor);
        if (j.at("file_hash").get<std::string>() != snapshot.descriptor.file_hash) {
            return std::nullopt;
        }
        snapshot.saved_at = from_unix_millis(j.at("saved_at").get<int64_t>());
        snapshot.output_path = j.value("output_path", std::string{});

        uint32_t total = snapshot.descriptor.total_chunks;
        if (snapshot.version == 1) {
            snapshot.completed.assign(total, false);
            for (uint32_t index : j.at("completed_chunks").get<std::vector<uint32_t>>()) {
                if (index >= total) {
                    return std::nullopt;
                }
                snapshot.completed[index] = true;
            }
        } else {
            auto bits = decode_bitmap(j.at("bitmap").get<std::string>(), total);
            if (!bits) {
                return std::nullopt;
            }
            snapshot.completed = std::move(*bits);
            snapshot.last_peers = j.value("last_peers", std::vector<std::string>{});
        }
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().warning("Malformed snapshot: " + std::string(e.what()));
        return std::nullopt;
    } catch (const MeshLoadError& e) {
        Logger::instance().warning("Malformed snapshot descriptor: " + std::string(e.what()));
        return std::nullopt;
    }
}

SnapshotStore::SnapshotStore(const PersistenceConfig& config)
    : config_(config) {}

std::string SnapshotStore::path_for(const std::string& file_hash) const {
    return (std::filesystem::path(config_.snapshot_dir) / (file_hash + kSnapshotExtension)).string();
}

bool SnapshotStore::is_fresh(const SessionSnapshot& snapshot, WallTime now) const {
    return now - snapshot.saved_at < std::chrono::seconds(config_.freshness_window_sec);
}

bool SnapshotStore::save(const SessionSnapshot& snapshot) {
    std::string path = path_for(snapshot.file_hash());
    std::string tmp = path + ".tmp";

    try {
        std::filesystem::create_directories(config_.snapshot_dir);
        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file.is_open()) {
                Logger::instance().error("Failed to open snapshot for writing: " + tmp);
                return false;
            }
            file << snapshot_to_json(snapshot).dump();
            if (!file) {
                Logger::instance().error("Failed to write snapshot: " + tmp);
                return false;
            }
        }
        std::filesystem::rename(tmp, path);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("Failed to save snapshot " + path + ": " + e.what());
        return false;
    }

    Logger::instance().debug("Snapshot saved for " + snapshot.file_hash() + ": " +
                             std::to_string(snapshot.completed_count()) + "/" +
                             std::to_string(snapshot.completed.size()) + " chunks");
    return true;
}

std::optional<SessionSnapshot> SnapshotStore::load_path(const std::string& path, WallTime now,
                                                        const std::string& expected_hash) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::instance().warning("Corrupt snapshot " + path + ": " + e.what());
        file.close();
        delete_file(path, "corrupt");
        return std::nullopt;
    }
    file.close();

    if (j.is_object() && j.value("version", 1) > kSnapshotVersion) {
        Logger::instance().warning("Snapshot " + path + " has unsupported version " +
                                   std::to_string(j.value("version", 1)) + ", leaving it in place");
        return std::nullopt;
    }

    auto snapshot = snapshot_from_json(j);
    if (!snapshot) {
        delete_file(path, "corrupt");
        return std::nullopt;
    }
    if (!expected_hash.empty() && snapshot->file_hash() != expected_hash) {
        delete_file(path, "mismatched");
        return std::nullopt;
    }
    if (!is_fresh(*snapshot, now)) {
        delete_file(path, "stale");
        return std::nullopt;
    }
    return snapshot;
}

std::optional<SessionSnapshot> SnapshotStore::load(const std::string& file_hash, WallTime now) {
    return load_path(path_for(file_hash), now, file_hash);
}

std::vector<SessionSnapshot> SnapshotStore::load_all(WallTime now) {
    std::vector<SessionSnapshot> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.snapshot_dir, ec)) {
        return out;
    }

    std::vector<std::filesystem::path> paths;
    for (const auto& entry : std::filesystem::directory_iterator(config_.snapshot_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kSnapshotExtension) {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& p : paths) {
        auto snapshot = load_path(p.string(), now, p.stem().string());
        if (snapshot) {
            out.push_back(std::move(*snapshot));
        }
    }
    Logger::instance().info("Loaded " + std::to_string(out.size()) + " resumable snapshots from " +
                            config_.snapshot_dir);
    return out;
}

bool SnapshotStore::remove(const std::string& file_hash) {
    std::error_code ec;
    bool removed = std::filesystem::remove(path_for(file_hash), ec);
    if (ec) {
        Logger::instance().warning("Failed to remove snapshot for " + file_hash + ": " + ec.message());
        return false;
    }
    return removed;
}

size_t SnapshotStore::cleanup(WallTime now) {
    auto count_files = [this]() {
        size_t n = 0;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(config_.snapshot_dir, ec)) {
            if (entry.path().extension() == kSnapshotExtension) ++n;
        }
        return n;
    };

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.snapshot_dir, ec)) {
        return 0;
    }
    size_t before = count_files();
    load_all(now);
    size_t after = count_files();
    return before > after ? before - after : 0;
}

} // namespace meshload
