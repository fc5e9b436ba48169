#include "xferq/cache/path_cache.h"
#include "xferq/base/logger.h"
#include <filesystem>
#include <list>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace xferq {

struct PathCache::Impl {
    size_t max_entries_;
    bool verify_files_;
    PathCacheStats stats_;

    // recursive: the eviction callback may query the cache
    mutable std::recursive_mutex mutex_;

    // LRU list: most recently used at front
    std::list<std::string> lru_list_;
    std::unordered_map<std::string, std::string> paths_;
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    EvictionCallback eviction_callback;

    Impl(size_t max_entries, bool verify_files)
        : max_entries_(max_entries > 0 ? max_entries : 1), verify_files_(verify_files) {}

    static bool file_exists(const std::string& path) {
        std::error_code ec;
        return std::filesystem::exists(path, ec) && !ec;
    }

    void touch(const std::string& key) {
        auto it = lru_map_.find(key);
        if (it != lru_map_.end()) {
            lru_list_.erase(it->second);
            lru_list_.push_front(key);
            it->second = lru_list_.begin();
        }
    }

    void erase(const std::string& key) {
        auto lru_it = lru_map_.find(key);
        if (lru_it != lru_map_.end()) {
            lru_list_.erase(lru_it->second);
            lru_map_.erase(lru_it);
        }
        paths_.erase(key);
    }

    void evict_one() {
        if (lru_list_.empty()) return;

        std::string key = lru_list_.back();
        std::string path = paths_[key];
        erase(key);
        stats_.evictions++;
        Logger::instance().debug("PathCache: evicted {}", key);

        if (eviction_callback) {
            eviction_callback(key, path);
        }
    }
};

PathCache::PathCache(size_t max_entries, bool verify_files)
    : impl_(std::make_unique<Impl>(max_entries, verify_files)) {}

PathCache::~PathCache() = default;

PathCache::PathCache(PathCache&& other) noexcept = default;
PathCache& PathCache::operator=(PathCache&& other) noexcept = default;

std::optional<std::string> PathCache::lookup(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);

    auto it = impl_->paths_.find(key);
    if (it == impl_->paths_.end()) {
        impl_->stats_.misses++;
        return std::nullopt;
    }

    // File deleted behind our back
    if (impl_->verify_files_ && !Impl::file_exists(it->second)) {
        Logger::instance().debug("PathCache: {} is stale, {} is gone", key, it->second);
        impl_->erase(key);
        impl_->stats_.stale++;
        impl_->stats_.misses++;
        return std::nullopt;
    }

    impl_->touch(key);
    impl_->stats_.hits++;
    return it->second;
}

std::optional<std::string> PathCache::peek(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    auto it = impl_->paths_.find(key);
    if (it == impl_->paths_.end()) return std::nullopt;
    return it->second;
}

void PathCache::put(const std::string& key, const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);

    auto it = impl_->paths_.find(key);
    if (it != impl_->paths_.end()) {
        it->second = path;
        impl_->touch(key);
        return;
    }

    while (impl_->paths_.size() >= impl_->max_entries_ && !impl_->lru_list_.empty()) {
        impl_->evict_one();
    }

    impl_->paths_[key] = path;
    impl_->lru_list_.push_front(key);
    impl_->lru_map_[key] = impl_->lru_list_.begin();
    impl_->stats_.total_items++;
}

bool PathCache::remove(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    if (impl_->paths_.find(key) == impl_->paths_.end()) {
        return false;
    }
    impl_->erase(key);
    return true;
}

bool PathCache::exists(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    return impl_->paths_.find(key) != impl_->paths_.end();
}

void PathCache::clear() {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    impl_->paths_.clear();
    impl_->lru_list_.clear();
    impl_->lru_map_.clear();
    impl_->stats_ = PathCacheStats();
}

size_t PathCache::clean_stale() {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);

    std::vector<std::string> gone;
    for (const auto& [key, path] : impl_->paths_) {
        if (!Impl::file_exists(path)) gone.push_back(key);
    }
    for (const auto& key : gone) {
        impl_->erase(key);
    }
    impl_->stats_.stale += gone.size();

    if (!gone.empty()) {
        Logger::instance().debug("PathCache: cleaned {} stale entries", gone.size());
    }
    return gone.size();
}

void PathCache::set_eviction_callback(EvictionCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    impl_->eviction_callback = std::move(callback);
}

PathCacheStats PathCache::stats() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    return impl_->stats_;
}

size_t PathCache::size() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    return impl_->paths_.size();
}

size_t PathCache::max_entries() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex_);
    return impl_->max_entries_;
}

} // namespace xferq
