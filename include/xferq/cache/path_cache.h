#ifndef XFERQ_CACHE_PATH_CACHE_H
#define XFERQ_CACHE_PATH_CACHE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace xferq {

struct PathCacheStats {
    uint64_t total_items = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t stale = 0;      // entries dropped because the file was gone
    uint64_t evictions = 0;
    float hit_rate() const {
        uint64_t total = hits + misses;
        return total > 0 ? static_cast<float>(hits) / total : 0.0f;
    }
};

// Key -> local path of a finished transfer, bounded by entry count with
// least-recently-used eviction
class PathCache {
public:
    using EvictionCallback = std::function<void(const std::string& key, const std::string& path)>;

    // verify_files: lookup() treats an entry whose file no longer exists as a miss
    explicit PathCache(size_t max_entries, bool verify_files = true);
    ~PathCache();

    // Disable copy
    PathCache(const PathCache&) = delete;
    PathCache& operator=(const PathCache&) = delete;

    // Enable move
    PathCache(PathCache&& other) noexcept;
    PathCache& operator=(PathCache&& other) noexcept;

    // Marks the entry as recently used. A stale entry is dropped and
    // reported as a miss.
    std::optional<std::string> lookup(const std::string& key);

    // No file check, no recency update
    std::optional<std::string> peek(const std::string& key) const;

    void put(const std::string& key, const std::string& path);
    bool remove(const std::string& key);
    bool exists(const std::string& key) const;
    void clear();

    // Drops every entry whose file is gone; returns how many
    size_t clean_stale();

    // Called for capacity evictions only
    void set_eviction_callback(EvictionCallback callback);

    PathCacheStats stats() const;
    size_t size() const;
    size_t max_entries() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xferq

#endif // XFERQ_CACHE_PATH_CACHE_H
