#include "xferq/base/config.h"
#include "xferq/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace xferq {

namespace {

using Sections = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// std::stoul accepts a leading '-' and wraps; reject it instead
template <typename T>
T parse_unsigned(const std::string& value) {
    std::string text = trim(value);
    if (!text.empty() && text.front() == '-') {
        throw std::out_of_range("negative value '" + text + "' for an unsigned setting");
    }
    unsigned long long parsed = std::stoull(text);
    if (parsed > std::numeric_limits<T>::max()) {
        throw std::out_of_range("value '" + text + "' is too large");
    }
    return static_cast<T>(parsed);
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, Sections& sections) {
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
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

void apply_sections(Sections& sections, GlobalConfig& config) {
    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config.log.level = s["level"];
        if (s.count("file_path")) config.log.file_path = s["file_path"];
    }

    if (sections.count("queue")) {
        auto& s = sections["queue"];
        if (s.count("max_concurrent")) config.queue.max_concurrent = std::stoi(s["max_concurrent"]);
        if (s.count("auto_start")) config.queue.auto_start = parse_bool(s["auto_start"]);
        if (s.count("auto_retry")) config.queue.auto_retry = parse_bool(s["auto_retry"]);
        if (s.count("max_retries")) config.queue.max_retries = std::stoi(s["max_retries"]);
        if (s.count("retry_base_delay_ms")) config.queue.retry_base_delay_ms = parse_unsigned<uint32_t>(s["retry_base_delay_ms"]);
        if (s.count("backoff_multiplier")) config.queue.backoff_multiplier = std::stod(s["backoff_multiplier"]);
        if (s.count("retry_max_delay_ms")) config.queue.retry_max_delay_ms = parse_unsigned<uint32_t>(s["retry_max_delay_ms"]);
        if (s.count("retry_non_recoverable")) config.queue.retry_non_recoverable = parse_bool(s["retry_non_recoverable"]);
    }

    if (sections.count("controller")) {
        auto& s = sections["controller"];
        if (s.count("auto_start")) config.controller.auto_start = parse_bool(s["auto_start"]);
        if (s.count("download_directory")) config.controller.download_directory = s["download_directory"];
        if (s.count("record_store_path")) config.controller.record_store_path = s["record_store_path"];
        if (s.count("max_cached_paths")) config.controller.max_cached_paths = parse_unsigned<uint32_t>(s["max_cached_paths"]);
        if (s.count("verify_cached_files")) config.controller.verify_cached_files = parse_bool(s["verify_cached_files"]);
    }

    if (sections.count("transfer")) {
        auto& s = sections["transfer"];
        if (s.count("timeout_sec")) config.transfer.timeout_sec = parse_unsigned<uint32_t>(s["timeout_sec"]);
        if (s.count("max_retries")) config.transfer.max_retries = std::stoi(s["max_retries"]);
        if (s.count("retry_delay_ms")) config.transfer.retry_delay_ms = parse_unsigned<uint32_t>(s["retry_delay_ms"]);
        if (s.count("allow_resume")) config.transfer.allow_resume = parse_bool(s["allow_resume"]);
        if (s.count("chunk_size")) config.transfer.chunk_size = parse_unsigned<uint64_t>(s["chunk_size"]);
        if (s.count("parallel_chunks")) config.transfer.parallel_chunks = parse_unsigned<uint32_t>(s["parallel_chunks"]);
        if (s.count("skip_existing_files")) config.transfer.skip_existing_files = parse_bool(s["skip_existing_files"]);
        if (s.count("run_in_background")) config.transfer.run_in_background = parse_bool(s["run_in_background"]);
    }

    if (sections.count("simulation")) {
        auto& s = sections["simulation"];
        if (s.count("tick_ms")) config.simulation.tick_ms = parse_unsigned<uint32_t>(s["tick_ms"]);
        if (s.count("bytes_per_tick")) config.simulation.bytes_per_tick = parse_unsigned<uint64_t>(s["bytes_per_tick"]);
        if (s.count("default_size")) config.simulation.default_size = parse_unsigned<uint64_t>(s["default_size"]);
        if (s.count("failure_marker")) config.simulation.failure_marker = s["failure_marker"];
    }
}

// Copy "key" from a JSON object into target when present
template <typename T>
void read_json(const nlohmann::json& obj, const char* key, T& target) {
    if (!obj.contains(key)) return;
    const auto& value = obj.at(key);
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (value.is_number_integer() && value.get<int64_t>() < 0) {
            throw std::out_of_range(std::string("negative value for ") + key);
        }
    }
    target = value.get<T>();
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
    positional_.clear();
    exit_code_ = 0;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: {}", path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: {}", path);
        return false;
    }

    config_file_ = path;

    bool ok = std::filesystem::path(path).extension() == ".json" ? load_json(path) : load_ini(path);
    if (ok) {
        apply_log_settings();
        Logger::instance().info("Config loaded successfully from: {}", path);
    }
    return ok;
}

bool Config::load_ini(const std::string& path) {
    Sections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Cannot open config file: {}", path);
        return false;
    }

    GlobalConfig updated = config_;
    try {
        apply_sections(sections, updated);
    } catch (const std::logic_error& e) {
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }
    config_ = updated;
    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open config file: {}", path);
        return false;
    }

    GlobalConfig updated = config_;
    try {
        auto root = nlohmann::json::parse(file);
        if (root.contains("log")) {
            const auto& s = root.at("log");
            read_json(s, "level", updated.log.level);
            read_json(s, "file_path", updated.log.file_path);
        }
        if (root.contains("queue")) {
            const auto& s = root.at("queue");
            read_json(s, "max_concurrent", updated.queue.max_concurrent);
            read_json(s, "auto_start", updated.queue.auto_start);
            read_json(s, "auto_retry", updated.queue.auto_retry);
            read_json(s, "max_retries", updated.queue.max_retries);
            read_json(s, "retry_base_delay_ms", updated.queue.retry_base_delay_ms);
            read_json(s, "backoff_multiplier", updated.queue.backoff_multiplier);
            read_json(s, "retry_max_delay_ms", updated.queue.retry_max_delay_ms);
            read_json(s, "retry_non_recoverable", updated.queue.retry_non_recoverable);
        }
        if (root.contains("controller")) {
            const auto& s = root.at("controller");
            read_json(s, "auto_start", updated.controller.auto_start);
            read_json(s, "download_directory", updated.controller.download_directory);
            read_json(s, "record_store_path", updated.controller.record_store_path);
            read_json(s, "max_cached_paths", updated.controller.max_cached_paths);
            read_json(s, "verify_cached_files", updated.controller.verify_cached_files);
        }
        if (root.contains("transfer")) {
            const auto& s = root.at("transfer");
            read_json(s, "timeout_sec", updated.transfer.timeout_sec);
            read_json(s, "max_retries", updated.transfer.max_retries);
            read_json(s, "retry_delay_ms", updated.transfer.retry_delay_ms);
            read_json(s, "allow_resume", updated.transfer.allow_resume);
            read_json(s, "chunk_size", updated.transfer.chunk_size);
            read_json(s, "parallel_chunks", updated.transfer.parallel_chunks);
            read_json(s, "skip_existing_files", updated.transfer.skip_existing_files);
            read_json(s, "run_in_background", updated.transfer.run_in_background);
        }
        if (root.contains("simulation")) {
            const auto& s = root.at("simulation");
            read_json(s, "tick_ms", updated.simulation.tick_ms);
            read_json(s, "bytes_per_tick", updated.simulation.bytes_per_tick);
            read_json(s, "default_size", updated.simulation.default_size);
            read_json(s, "failure_marker", updated.simulation.failure_marker);
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().error("Invalid JSON config {}: {}", path, e.what());
        return false;
    } catch (const std::out_of_range& e) {
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }
    config_ = updated;
    return true;
}

bool Config::load_from_env() {
    Logger::instance().info("Loading config from environment variables");

    try {
        if (const char* val = std::getenv("XFERQ_LOG_LEVEL")) {
            config_.log.level = val;
        }
        if (const char* val = std::getenv("XFERQ_LOG_FILE")) {
            config_.log.file_path = val;
        }
        if (const char* val = std::getenv("XFERQ_MAX_CONCURRENT")) {
            config_.queue.max_concurrent = std::stoi(val);
        }
        if (const char* val = std::getenv("XFERQ_AUTO_RETRY")) {
            config_.queue.auto_retry = parse_bool(val);
        }
        if (const char* val = std::getenv("XFERQ_MAX_RETRIES")) {
            config_.queue.max_retries = std::stoi(val);
        }
        if (const char* val = std::getenv("XFERQ_RETRY_DELAY_MS")) {
            config_.queue.retry_base_delay_ms = parse_unsigned<uint32_t>(val);
        }
        if (const char* val = std::getenv("XFERQ_DOWNLOAD_DIR")) {
            config_.controller.download_directory = val;
        }
        if (const char* val = std::getenv("XFERQ_RECORD_STORE")) {
            config_.controller.record_store_path = val;
        }
    } catch (const std::logic_error& e) {
        Logger::instance().error("Invalid XFERQ_* environment value: {}", e.what());
        return false;
    }

    apply_log_settings();
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"xferq - prioritized, coalescing transfer queue"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file (INI or JSON)");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-file", config_.log.file_path, "Mirror log records into this file");

    // Queue options
    app.add_option("-j,--max-concurrent", config_.queue.max_concurrent, "Maximum concurrent transfers")
        ->check(CLI::PositiveNumber);
    app.add_flag("--auto-retry", config_.queue.auto_retry, "Retry failed transfers automatically");
    app.add_option("--max-retries", config_.queue.max_retries, "Automatic retries per transfer");
    app.add_option("--retry-delay", config_.queue.retry_base_delay_ms, "Base retry delay (ms)");
    app.add_option("--backoff", config_.queue.backoff_multiplier, "Retry backoff multiplier");
    app.add_option("--retry-max-delay", config_.queue.retry_max_delay_ms, "Maximum retry delay (ms)");
    app.add_flag("--retry-non-recoverable", config_.queue.retry_non_recoverable,
                 "Also retry failures marked non-recoverable");

    // Controller options
    app.add_option("-o,--output-dir", config_.controller.download_directory, "Download directory");
    app.add_option("--records", config_.controller.record_store_path, "JSON transfer record file");
    app.add_option("--cache-size", config_.controller.max_cached_paths, "Completed paths kept in memory");

    // Simulation options
    app.add_option("--tick", config_.simulation.tick_ms, "Simulation tick (ms)");
    app.add_option("--bytes-per-tick", config_.simulation.bytes_per_tick, "Simulated bytes per tick");
    app.add_option("--size", config_.simulation.default_size, "Simulated file size (bytes)");
    app.add_option("--fail-marker", config_.simulation.failure_marker,
                   "URLs containing this text fail mid-transfer");

    app.add_option("urls", positional_, "URLs to transfer");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help/version or the parse error
        exit_code_ = app.exit(e);
        return false;
    }

    // Command line values win over the file, so parse once more after loading it
    if (!config_file.empty()) {
        if (!load_from_file(config_file)) {
            exit_code_ = 1;
            return false;
        }
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit_code_ = app.exit(e);
            return false;
        }
    }

    apply_log_settings();
    return true;
}

void Config::apply_log_settings() const {
    if (!config_.log.level.empty()) {
        Logger::instance().set_level(parse_log_level(config_.log.level));
    }
    if (!config_.log.file_path.empty() && !Logger::instance().set_file_output(config_.log.file_path)) {
        Logger::instance().warning("Cannot open log file {}", config_.log.file_path);
    }
}

bool Config::validate() const {
    if (config_.queue.max_concurrent <= 0) {
        Logger::instance().error("queue.max_concurrent must be positive");
        return false;
    }
    if (config_.queue.max_retries < 0) {
        Logger::instance().error("queue.max_retries must not be negative");
        return false;
    }
    if (config_.queue.backoff_multiplier < 1.0) {
        Logger::instance().error("queue.backoff_multiplier must be at least 1.0");
        return false;
    }
    if (config_.controller.max_cached_paths == 0) {
        Logger::instance().error("controller.max_cached_paths must be positive");
        return false;
    }
    if (config_.simulation.tick_ms == 0 || config_.simulation.bytes_per_tick == 0) {
        Logger::instance().error("simulation.tick_ms and simulation.bytes_per_tick must be positive");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: {}", config_.log.level);
    Logger::instance().info("Max Concurrent: {}", config_.queue.max_concurrent);
    Logger::instance().info("Auto Retry: {} (max {}, base delay {} ms)",
                            config_.queue.auto_retry, config_.queue.max_retries,
                            config_.queue.retry_base_delay_ms);
    Logger::instance().info("Download Directory: {}", config_.controller.download_directory);
    Logger::instance().info("Record Store: {}",
                            config_.controller.record_store_path.empty() ? "memory"
                                                                         : config_.controller.record_store_path);
}

} // namespace xferq
