#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "xferq/cache/path_cache.h"

using namespace xferq;

namespace {

std::filesystem::path make_file(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << name;
    return path;
}

} // anonymous namespace

TEST_CASE("Path cache basic operations", "[cache][path]") {
    PathCache cache(10, false);

    cache.put("https://example.com/a", "/data/a");
    REQUIRE(cache.exists("https://example.com/a"));
    REQUIRE(cache.lookup("https://example.com/a") == std::optional<std::string>("/data/a"));
    REQUIRE_FALSE(cache.lookup("https://example.com/b").has_value());

    // Replacing keeps one entry
    cache.put("https://example.com/a", "/data/a2");
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.peek("https://example.com/a") == std::optional<std::string>("/data/a2"));

    REQUIRE(cache.remove("https://example.com/a"));
    REQUIRE_FALSE(cache.remove("https://example.com/a"));

    auto stats = cache.stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hit_rate() == 0.5f);
}

TEST_CASE("Path cache evicts the least recently used entry", "[cache][path][eviction]") {
    PathCache cache(3, false);
    std::vector<std::string> evicted;
    cache.set_eviction_callback([&](const std::string& key, const std::string&) { evicted.push_back(key); });

    cache.put("k1", "/p1");
    cache.put("k2", "/p2");
    cache.put("k3", "/p3");
    REQUIRE(cache.lookup("k1").has_value());

    cache.put("k4", "/p4");
    cache.put("k5", "/p5");

    REQUIRE(cache.size() == 3);
    REQUIRE(evicted == std::vector<std::string>{"k2", "k3"});
    REQUIRE(cache.exists("k1"));
    REQUIRE(cache.stats().evictions == 2);

    // peek does not refresh recency
    REQUIRE(cache.peek("k4").has_value());
    cache.put("k6", "/p6");
    REQUIRE_FALSE(cache.exists("k1"));
    REQUIRE(cache.exists("k4"));
}

TEST_CASE("Path cache drops entries whose file is gone", "[cache][path][stale]") {
    auto kept = make_file("xferq_path_cache_kept.txt");
    auto removed = make_file("xferq_path_cache_removed.txt");

    PathCache cache(10);
    cache.put("kept", kept.string());
    cache.put("removed", removed.string());
    cache.put("never", (std::filesystem::temp_directory_path() / "xferq_path_cache_never.txt").string());

    std::filesystem::remove(removed);
    REQUIRE(cache.lookup("kept") == std::optional<std::string>(kept.string()));
    REQUIRE_FALSE(cache.lookup("removed").has_value());
    REQUIRE_FALSE(cache.exists("removed"));

    REQUIRE(cache.clean_stale() == 1);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.stats().stale == 2);

    std::filesystem::remove(kept);
}
