#include "meshload/base/config.h"
#include "meshload/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace meshload {

namespace {

using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, SectionMap& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void set_if(const std::map<std::string, std::string>& s, const char* key, std::string& out) {
    auto it = s.find(key);
    if (it != s.end()) out = it->second;
}

void set_if(const std::map<std::string, std::string>& s, const char* key, uint32_t& out) {
    auto it = s.find(key);
    if (it != s.end()) out = static_cast<uint32_t>(std::stoul(it->second));
}

void set_if(const std::map<std::string, std::string>& s, const char* key, double& out) {
    auto it = s.find(key);
    if (it != s.end()) out = std::stod(it->second);
}

void set_if(const std::map<std::string, std::string>& s, const char* key, bool& out) {
    auto it = s.find(key);
    if (it != s.end()) out = parse_bool(it->second);
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    bool ok = false;
    try {
        if (std::filesystem::path(path).extension() == ".json") {
            ok = load_json(path);
        } else {
            ok = load_ini(path);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    if (ok) {
        apply_log_settings();
        Logger::instance().info("Config loaded successfully from: " + path);
    }
    return ok;
}

bool Config::load_ini(const std::string& path) {
    SectionMap sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }
    for (const auto& [section, values] : sections) {
        apply_section(section, values);
    }
    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& e) {
        Logger::instance().error("Failed to parse JSON config " + path + ": " + e.what());
        return false;
    }
    if (!root.is_object()) {
        Logger::instance().error("JSON config root must be an object: " + path);
        return false;
    }

    // Flatten each section into the same key/value form the INI reader produces
    for (const auto& [section, body] : root.items()) {
        if (!body.is_object()) continue;
        std::map<std::string, std::string> values;
        for (const auto& [key, value] : body.items()) {
            values[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        apply_section(section, values);
    }
    return true;
}

void Config::apply_section(const std::string& section, const std::map<std::string, std::string>& s) {
    if (section == "log") {
        set_if(s, "level", config_.log.level);
        set_if(s, "output", config_.log.output);
        set_if(s, "file_path", config_.log.file_path);
    } else if (section == "reputation") {
        auto& r = config_.reputation;
        set_if(s, "reference_bandwidth_bps", r.reference_bandwidth_bps);
        set_if(s, "decay_rate", r.decay_rate);
        set_if(s, "decay_floor", r.decay_floor);
        set_if(s, "success_bonus_base", r.success_bonus_base);
        set_if(s, "success_bonus_per_mib", r.success_bonus_per_mib);
        set_if(s, "max_success_bonus", r.max_success_bonus);
        set_if(s, "failure_penalty", r.failure_penalty);
        set_if(s, "corrupt_penalty", r.corrupt_penalty);
        set_if(s, "backoff_base_ms", r.backoff_base_ms);
        set_if(s, "backoff_max_ms", r.backoff_max_ms);
        set_if(s, "prune_max_age_days", r.prune_max_age_days);
        set_if(s, "store_path", r.store_path);
    } else if (section == "selection") {
        set_if(s, "max_peers", config_.selection.max_peers);
        set_if(s, "min_trust_score", config_.selection.min_trust_score);
        set_if(s, "allow_untrusted_fallback", config_.selection.allow_untrusted_fallback);
    } else if (section == "scheduler") {
        set_if(s, "max_in_flight_per_peer", config_.scheduler.max_in_flight_per_peer);
        set_if(s, "max_retries", config_.scheduler.max_retries);
        set_if(s, "chunk_timeout_ms", config_.scheduler.chunk_timeout_ms);
    } else if (section == "progress") {
        set_if(s, "speed_window_ms", config_.progress.speed_window_ms);
        set_if(s, "tick_interval_ms", config_.progress.tick_interval_ms);
    } else if (section == "persistence") {
        auto& p = config_.persistence;
        set_if(s, "snapshot_dir", p.snapshot_dir);
        set_if(s, "snapshot_every_chunks", p.snapshot_every_chunks);
        set_if(s, "snapshot_interval_sec", p.snapshot_interval_sec);
        set_if(s, "freshness_window_sec", p.freshness_window_sec);
        set_if(s, "keep_verified_on_cancel", p.keep_verified_on_cancel);
    } else if (section == "download") {
        set_if(s, "output_dir", config_.download.output_dir);
        set_if(s, "manifest_dir", config_.download.manifest_dir);
        set_if(s, "max_concurrent_downloads", config_.download.max_concurrent_downloads);
        set_if(s, "resolve_timeout_ms", config_.download.resolve_timeout_ms);
    } else if (section == "transport") {
        set_if(s, "connect_timeout_ms", config_.transport.connect_timeout_ms);
        set_if(s, "read_buffer_size", config_.transport.read_buffer_size);
    } else {
        Logger::instance().warning("Unknown config section: " + section);
    }
}

bool Config::load_from_env() {
    Logger::instance().info("Loading config from environment variables");

    try {
        if (const char* val = std::getenv("MESHLOAD_LOG_LEVEL")) {
            config_.log.level = val;
        }
        if (const char* val = std::getenv("MESHLOAD_OUTPUT_DIR")) {
            config_.download.output_dir = val;
        }
        if (const char* val = std::getenv("MESHLOAD_MANIFEST_DIR")) {
            config_.download.manifest_dir = val;
        }
        if (const char* val = std::getenv("MESHLOAD_SNAPSHOT_DIR")) {
            config_.persistence.snapshot_dir = val;
        }
        if (const char* val = std::getenv("MESHLOAD_REPUTATION_STORE")) {
            config_.reputation.store_path = val;
        }
        if (const char* val = std::getenv("MESHLOAD_MAX_PEERS")) {
            config_.selection.max_peers = static_cast<uint32_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("MESHLOAD_MAX_CONCURRENT_DOWNLOADS")) {
            config_.download.max_concurrent_downloads = static_cast<uint32_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("MESHLOAD_CHUNK_TIMEOUT_MS")) {
            config_.scheduler.chunk_timeout_ms = static_cast<uint32_t>(std::stoul(val));
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid MESHLOAD_* environment value: " + std::string(e.what()));
        return false;
    }

    apply_log_settings();
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"MeshLoad - multi-source peer-to-peer downloader"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Positional content hashes
    app.add_option("hashes", command_line_.file_hashes, "Content hashes to download");
    app.add_flag("--resume", command_line_.resume, "Resume downloads restored from snapshots");
    app.add_flag("--list-snapshots", command_line_.list_snapshots, "List resumable downloads and exit");
    app.add_option("--describe", command_line_.describe_path, "Print a descriptor manifest for a local file and exit");
    app.add_option("--describe-chunk-size", command_line_.describe_chunk_size, "Chunk size used by --describe");
    app.add_flag("--describe-merkle", command_line_.describe_merkle, "Use a Merkle root in --describe output");
    app.add_option("--key", command_line_.decryption_key_hex, "AES-256-GCM key (hex) for encrypted files");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Download options
    app.add_option("-o,--output-dir", config_.download.output_dir, "Directory for completed files");
    app.add_option("--manifest-dir", config_.download.manifest_dir, "Directory of <hash>.json descriptors");
    app.add_option("--max-downloads", config_.download.max_concurrent_downloads, "Maximum concurrently active downloads");
    app.add_option("--resolve-timeout", config_.download.resolve_timeout_ms, "Descriptor lookup timeout (ms)");

    // Selection and scheduling options
    app.add_option("--max-peers", config_.selection.max_peers, "Maximum peers per download");
    app.add_option("--min-trust", config_.selection.min_trust_score, "Minimum reputation score (0-100)");
    app.add_option("--window", config_.scheduler.max_in_flight_per_peer, "In-flight chunk fetches per peer");
    app.add_option("--max-retries", config_.scheduler.max_retries, "Distinct peers that may fail a chunk");
    app.add_option("--chunk-timeout", config_.scheduler.chunk_timeout_ms, "Per chunk fetch timeout (ms)");

    // Persistence options
    app.add_option("--snapshot-dir", config_.persistence.snapshot_dir, "Resume snapshot directory");
    app.add_option("--reputation-store", config_.reputation.store_path, "Reputation table JSON file");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit with code 0 after printing
        if (e.get_exit_code() == 0) {
            app.exit(e);
            return false;
        }
        std::cerr << "Command line parse error: " << e.what() << std::endl;
        return false;
    }

    if (!config_file.empty()) {
        if (!load_from_file(config_file)) {
            return false;
        }
        // Command line wins over the file
        app.parse(argc, argv);
    }

    apply_log_settings();
    return true;
}

void Config::apply_log_settings() {
    auto& logger = Logger::instance();
    if (!config_.log.level.empty()) {
        logger.set_level(parse_log_level(config_.log.level));
    }
    if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else {
        logger.set_output(LogOutput::Stdout);
    }
}

bool Config::validate() const {
    const auto& r = config_.reputation;
    if (r.reference_bandwidth_bps <= 0.0) {
        Logger::instance().error("reputation.reference_bandwidth_bps must be positive");
        return false;
    }
    if (r.decay_rate < 0.0 || r.decay_rate >= 1.0) {
        Logger::instance().error("reputation.decay_rate must be in [0, 1)");
        return false;
    }
    if (r.decay_floor < 0.0 || r.decay_floor > 100.0) {
        Logger::instance().error("reputation.decay_floor must be in [0, 100]");
        return false;
    }
    if (config_.selection.max_peers == 0) {
        Logger::instance().error("selection.max_peers must be at least 1");
        return false;
    }
    if (config_.selection.min_trust_score < 0.0 || config_.selection.min_trust_score > 100.0) {
        Logger::instance().error("selection.min_trust_score must be in [0, 100]");
        return false;
    }
    if (config_.scheduler.max_in_flight_per_peer == 0) {
        Logger::instance().error("scheduler.max_in_flight_per_peer must be at least 1");
        return false;
    }
    if (config_.scheduler.max_retries == 0) {
        Logger::instance().error("scheduler.max_retries must be at least 1");
        return false;
    }
    if (config_.scheduler.chunk_timeout_ms == 0) {
        Logger::instance().error("scheduler.chunk_timeout_ms must be set");
        return false;
    }
    if (config_.download.max_concurrent_downloads == 0) {
        Logger::instance().error("download.max_concurrent_downloads must be at least 1");
        return false;
    }
    if (config_.progress.speed_window_ms == 0) {
        Logger::instance().error("progress.speed_window_ms must be set");
        return false;
    }
    return true;
}

void Config::reset() {
    config_ = GlobalConfig{};
    command_line_ = CommandLine{};
    config_file_.clear();
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Output Dir: " + config_.download.output_dir);
    Logger::instance().info("Manifest Dir: " + config_.download.manifest_dir);
    Logger::instance().info("Snapshot Dir: " + config_.persistence.snapshot_dir);
    Logger::instance().info("Max Peers: " + std::to_string(config_.selection.max_peers));
    Logger::instance().info("Min Trust: " + std::to_string(config_.selection.min_trust_score));
    Logger::instance().info("Window: " + std::to_string(config_.scheduler.max_in_flight_per_peer));
    Logger::instance().info("Max Retries: " + std::to_string(config_.scheduler.max_retries));
    Logger::instance().info("Max Downloads: " + std::to_string(config_.download.max_concurrent_downloads));
}

} // namespace meshload
