#ifndef XFERQ_BASE_CONFIG_H
#define XFERQ_BASE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace xferq {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string file_path = "";  // empty: no file mirror
};

// Scheduling policy of the transfer queues
struct QueueConfig {
    int max_concurrent = 3;
    bool auto_start = true;
    bool auto_retry = false;
    int max_retries = 3;
    uint32_t retry_base_delay_ms = 0;   // 0 = requeue immediately
    double backoff_multiplier = 2.0;
    uint32_t retry_max_delay_ms = 30000;
    bool retry_non_recoverable = false;
};

// Cache-coalescing controller configuration
struct ControllerConfig {
    bool auto_start = true;
    std::string download_directory = "downloads";
    std::string record_store_path = "";  // empty: records kept in memory
    uint32_t max_cached_paths = 1000;     // completed-path cache capacity
    bool verify_cached_files = true;      // a cached path whose file is gone is a miss
};

// Defaults applied to newly created transfer tasks
struct TransferDefaults {
    uint32_t timeout_sec = 30;
    int max_retries = 3;
    uint32_t retry_delay_ms = 2000;
    bool allow_resume = true;
    uint64_t chunk_size = 0;  // 0 = transport default
    uint32_t parallel_chunks = 1;
    bool skip_existing_files = false;
    bool run_in_background = false;
};

// Simulated transport used by the demo binary
struct SimulationConfig {
    uint32_t tick_ms = 100;
    uint64_t bytes_per_tick = 256 * 1024;
    uint64_t default_size = 2 * 1024 * 1024;
    std::string failure_marker = "fail";  // URLs containing this fail mid-way
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    QueueConfig queue;
    ControllerConfig controller;
    TransferDefaults transfer;
    SimulationConfig simulation;
};

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON when the extension is .json)
    bool load_from_file(const std::string& path);

    // Load configuration from XFERQ_* environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false for --help/--version or parse errors; see exit_code().
    bool parse_command_line(int argc, char* argv[]);

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    // Positional arguments left over after option parsing
    const std::vector<std::string>& positional() const { return positional_; }

    // Exit code to use when parse_command_line() returned false
    int exit_code() const { return exit_code_; }

    bool validate() const;

    void print() const;

    // Restore defaults
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);
    void apply_log_settings() const;

    GlobalConfig config_;
    std::string config_file_;
    std::vector<std::string> positional_;
    int exit_code_ = 0;
};

} // namespace xferq

#endif // XFERQ_BASE_CONFIG_H
