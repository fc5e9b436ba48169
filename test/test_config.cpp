#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "xferq/base/config.h"
#include "xferq/base/logger.h"
#include "xferq/control/record_store.h"

using namespace xferq;

namespace {

std::filesystem::path temp_file(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

bool parse(std::vector<std::string> args) {
    args.insert(args.begin(), "xferq-demo");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return Config::instance().parse_command_line(static_cast<int>(argv.size()), argv.data());
}

} // anonymous namespace

TEST_CASE("Defaults are valid", "[config]") {
    Config::instance().reset();
    const auto& config = Config::instance().get();
    REQUIRE(config.queue.max_concurrent == 3);
    REQUIRE_FALSE(config.queue.auto_retry);
    REQUIRE(config.controller.download_directory == "downloads");
    REQUIRE(Config::instance().validate());
}

TEST_CASE("INI files override defaults section by section", "[config][ini]") {
    Config::instance().reset();
    auto path = temp_file("xferq_config_test.ini");
    {
        std::ofstream out(path);
        out << "# queue tuning\n"
            << "[queue]\n"
            << "max_concurrent = 5\n"
            << "auto_retry = yes\n"
            << "retry_base_delay_ms = 250\n"
            << "[controller]\n"
            << "download_directory = \"/data/in\"\n"
            << "max_cached_paths = 50\n"
            << "verify_cached_files = false\n"
            << "[simulation]\n"
            << "failure_marker = broken\n";
    }

    REQUIRE(Config::instance().load_from_file(path.string()));
    const auto& config = Config::instance().get();
    REQUIRE(config.queue.max_concurrent == 5);
    REQUIRE(config.queue.auto_retry);
    REQUIRE(config.queue.retry_base_delay_ms == 250);
    REQUIRE(config.controller.download_directory == "/data/in");
    REQUIRE(config.controller.max_cached_paths == 50);
    REQUIRE_FALSE(config.controller.verify_cached_files);
    REQUIRE(config.simulation.failure_marker == "broken");
    REQUIRE(Config::instance().get_config_file() == path.string());

    std::filesystem::remove(path);
}

TEST_CASE("Malformed INI values leave the config untouched", "[config][ini]") {
    Config::instance().reset();
    auto path = temp_file("xferq_config_bad.ini");
    {
        std::ofstream out(path);
        out << "[queue]\nmax_concurrent = 7\nmax_retries = many\n";
    }

    REQUIRE_FALSE(Config::instance().load_from_file(path.string()));
    REQUIRE(Config::instance().get().queue.max_concurrent == 3);
    std::filesystem::remove(path);

    REQUIRE_FALSE(Config::instance().load_from_file("/nonexistent/xferq.ini"));
}

TEST_CASE("Negative values for unsigned settings are rejected", "[config][ini]") {
    Config::instance().reset();
    auto ini = temp_file("xferq_config_negative.ini");
    {
        std::ofstream out(ini);
        out << "[queue]\nretry_base_delay_ms = -5\n";
    }
    REQUIRE_FALSE(Config::instance().load_from_file(ini.string()));
    REQUIRE(Config::instance().get().queue.retry_base_delay_ms == 0);
    std::filesystem::remove(ini);

    auto json = temp_file("xferq_config_negative.json");
    {
        std::ofstream out(json);
        out << R"({"simulation": {"bytes_per_tick": -1}})";
    }
    REQUIRE_FALSE(Config::instance().load_from_file(json.string()));
    REQUIRE(Config::instance().get().simulation.bytes_per_tick == 256 * 1024);
    std::filesystem::remove(json);

    setenv("XFERQ_RETRY_DELAY_MS", " -5", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());
    REQUIRE(Config::instance().get().queue.retry_base_delay_ms == 0);
    unsetenv("XFERQ_RETRY_DELAY_MS");
}

TEST_CASE("JSON files are read with the same keys", "[config][json]") {
    Config::instance().reset();
    auto path = temp_file("xferq_config_test.json");
    {
        nlohmann::json root;
        root["queue"]["max_concurrent"] = 2;
        root["queue"]["backoff_multiplier"] = 1.5;
        root["transfer"]["allow_resume"] = false;
        root["simulation"]["bytes_per_tick"] = 4096;
        std::ofstream out(path);
        out << root.dump(2);
    }

    REQUIRE(Config::instance().load_from_file(path.string()));
    const auto& config = Config::instance().get();
    REQUIRE(config.queue.max_concurrent == 2);
    REQUIRE(config.queue.backoff_multiplier == 1.5);
    REQUIRE_FALSE(config.transfer.allow_resume);
    REQUIRE(config.simulation.bytes_per_tick == 4096);

    std::filesystem::remove(path);
}

TEST_CASE("Environment variables are applied", "[config][env]") {
    Config::instance().reset();
    setenv("XFERQ_MAX_CONCURRENT", "6", 1);
    setenv("XFERQ_DOWNLOAD_DIR", "/env/dir", 1);

    REQUIRE(Config::instance().load_from_env());
    REQUIRE(Config::instance().get().queue.max_concurrent == 6);
    REQUIRE(Config::instance().get().controller.download_directory == "/env/dir");

    setenv("XFERQ_MAX_CONCURRENT", "lots", 1);
    REQUIRE_FALSE(Config::instance().load_from_env());

    unsetenv("XFERQ_MAX_CONCURRENT");
    unsetenv("XFERQ_DOWNLOAD_DIR");
}

TEST_CASE("Command line options and positional URLs", "[config][cli]") {
    Config::instance().reset();
    REQUIRE(parse({"-j", "4", "--auto-retry", "--retry-delay", "100", "-o", "out", "https://a", "https://b"}));

    const auto& config = Config::instance().get();
    REQUIRE(config.queue.max_concurrent == 4);
    REQUIRE(config.queue.auto_retry);
    REQUIRE(config.queue.retry_base_delay_ms == 100);
    REQUIRE(config.controller.download_directory == "out");
    REQUIRE(Config::instance().positional() == std::vector<std::string>{"https://a", "https://b"});
}

TEST_CASE("Command line wins over the config file", "[config][cli]") {
    Config::instance().reset();
    auto path = temp_file("xferq_config_cli.ini");
    {
        std::ofstream out(path);
        out << "[queue]\nmax_concurrent = 9\nmax_retries = 7\n";
    }

    REQUIRE(parse({"-c", path.string(), "-j", "2"}));
    REQUIRE(Config::instance().get().queue.max_concurrent == 2);
    REQUIRE(Config::instance().get().queue.max_retries == 7);
    std::filesystem::remove(path);
}

TEST_CASE("Invalid command lines report an exit code", "[config][cli]") {
    Config::instance().reset();
    REQUIRE_FALSE(parse({"-j", "0"}));
    REQUIRE(Config::instance().exit_code() != 0);

    Config::instance().reset();
    REQUIRE_FALSE(parse({"--version"}));
    REQUIRE(Config::instance().exit_code() == 0);
}

TEST_CASE("validate rejects impossible settings", "[config]") {
    Config::instance().reset();
    Config::instance().get().queue.backoff_multiplier = 0.5;
    REQUIRE_FALSE(Config::instance().validate());

    Config::instance().reset();
    Config::instance().get().simulation.tick_ms = 0;
    REQUIRE_FALSE(Config::instance().validate());

    Config::instance().reset();
    Config::instance().get().controller.max_cached_paths = 0;
    REQUIRE_FALSE(Config::instance().validate());
    Config::instance().reset();
}

TEST_CASE("Log level names parse case-insensitively", "[config][logger]") {
    REQUIRE(parse_log_level("debug") == LogLevel::debug);
    REQUIRE(parse_log_level("WARNING") == LogLevel::warning);
    REQUIRE(parse_log_level("nonsense") == LogLevel::info);

    auto& logger = Logger::instance();
    auto previous = logger.get_level();
    logger.set_level(LogLevel::error);
    REQUIRE_FALSE(logger.enabled(LogLevel::info));
    REQUIRE(logger.enabled(LogLevel::error));
    logger.set_level(previous);
}

TEST_CASE("JSON record store persists across instances", "[config][records]") {
    auto path = temp_file("xferq_records_test.json");
    std::filesystem::remove(path);

    TransferRecord record;
    record.key = "https://example.com/a";
    record.task_id = "abc";
    record.local_path = "/tmp/a";
    record.status = TaskStatus::complete;
    record.expected_size = 42;
    {
        JsonFileRecordStore store(path.string());
        REQUIRE(store.load_all().empty());
        REQUIRE(store.upsert(record));
    }

    JsonFileRecordStore reopened(path.string());
    auto loaded = reopened.load_all();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0].key == record.key);
    REQUIRE(loaded[0].status == TaskStatus::complete);
    REQUIRE(loaded[0].expected_size == 42);

    REQUIRE(reopened.remove(record.key));
    REQUIRE_FALSE(reopened.remove(record.key));
    reopened.clear();
    std::filesystem::remove(path);
}
