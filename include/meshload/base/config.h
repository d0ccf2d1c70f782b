#ifndef MESHLOAD_BASE_CONFIG_H
#define MESHLOAD_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace meshload {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Peer reputation scoring
struct ReputationConfig {
    double reference_bandwidth_bps = 1024.0 * 1024.0;  // speedScore reaches 1.0 here
    double decay_rate = 0.05;          // per day since last seen
    double decay_floor = 10.0;
    double success_bonus_base = 0.5;
    double success_bonus_per_mib = 0.25;
    double max_success_bonus = 5.0;
    double failure_penalty = 5.0;
    double corrupt_penalty = 10.0;
    double recent_alpha = 0.3;         // EMA weight of the newest outcome
    double latency_alpha = 0.2;
    double uptime_alpha = 0.2;         // EMA weight of the newest connect outcome
    double bandwidth_alpha = 0.2;
    uint32_t backoff_base_ms = 1000;
    uint32_t backoff_max_ms = 300000;
    uint32_t health_min_transfers = 5;
    double health_max_failure_rate = 0.3;
    uint32_t prune_max_age_days = 30;
    std::string store_path = "";       // empty = in-memory only
};

// Source selection policy
struct SelectionConfig {
    uint32_t max_peers = 3;
    double min_trust_score = 20.0;     // Low band and above
    bool allow_untrusted_fallback = true;
};

// Chunk scheduler
struct SchedulerConfig {
    uint32_t max_in_flight_per_peer = 3;
    uint32_t max_retries = 3;
    uint32_t chunk_timeout_ms = 30000;
};

// Progress aggregation
struct ProgressConfig {
    uint32_t speed_window_ms = 1000;
    uint32_t tick_interval_ms = 500;
};

// Resume snapshots
struct PersistenceConfig {
    std::string snapshot_dir = "/var/lib/meshload/snapshots";
    uint32_t snapshot_every_chunks = 8;
    uint32_t snapshot_interval_sec = 30;
    uint32_t freshness_window_sec = 24 * 3600;
    bool keep_verified_on_cancel = true;
};

// Download manager
struct DownloadConfig {
    std::string output_dir = ".";
    std::string manifest_dir = "/var/lib/meshload/manifests";
    uint32_t max_concurrent_downloads = 3;
    uint32_t resolve_timeout_ms = 10000;
    uint32_t loop_interval_ms = 20;
};

// Transport adapters
struct TransportConfig {
    uint32_t connect_timeout_ms = 5000;
    uint32_t read_buffer_size = 256 * 1024;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    ReputationConfig reputation;
    SelectionConfig selection;
    SchedulerConfig scheduler;
    ProgressConfig progress;
    PersistenceConfig persistence;
    DownloadConfig download;
    TransportConfig transport;
};

// Options of the command line front end that are not configuration values
struct CommandLine {
    std::vector<std::string> file_hashes;
    std::string describe_path;
    uint32_t describe_chunk_size = 256 * 1024;
    bool describe_merkle = false;
    bool list_snapshots = false;
    bool resume = false;
    std::string decryption_key_hex;
};

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON when the extension is .json)
    bool load_from_file(const std::string& path);

    // Load configuration from MESHLOAD_* environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const CommandLine& command_line() const { return command_line_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check value ranges
    bool validate() const;

    // Reset to defaults (tests)
    void reset();

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);
    void apply_section(const std::string& section, const std::map<std::string, std::string>& values);
    void apply_log_settings();

    GlobalConfig config_;
    CommandLine command_line_;
    std::string config_file_;
};

} // namespace meshload

#endif // MESHLOAD_BASE_CONFIG_H
