#include "xferq/control/transfer_controller.h"
#include "xferq/base/error_code.h"
#include "xferq/base/keyed_mutex.h"
#include "xferq/base/logger.h"
#include "xferq/cache/path_cache.h"
#include <filesystem>
#include <map>
#include <set>
#include <system_error>

namespace xferq {

std::string to_string(const EnqueueResult& result) {
    switch (result.index()) {
        case 0: return "cached";
        case 1: return "in_progress";
        case 2: return "started";
        case 3: return "pending";
    }
    return "unknown";
}

std::optional<BroadcastStream<TransferItem>> stream_of(const EnqueueResult& result) {
    if (auto* r = std::get_if<EnqueueInProgress>(&result)) return r->stream;
    if (auto* r = std::get_if<EnqueueStarted>(&result)) return r->stream;
    if (auto* r = std::get_if<EnqueuePending>(&result)) return r->stream;
    return std::nullopt;
}

struct TransferController::Impl {
    std::shared_ptr<Transport> transport;
    std::shared_ptr<TransferRecordStore> records;
    ControllerConfig config;

    KeyedMutex mutex;
    PathCache completed_paths;
    std::set<std::string> active_keys;
    std::set<std::string> unstarted_keys;
    // Handed to the transport, acceptance not yet reported
    std::set<std::string> confirming;
    std::map<std::string, TransferTask> tasks;
    // Latest item and update stream, only while the key is in flight
    std::map<std::string, TransferItem> items;
    std::map<std::string, BroadcastStream<TransferItem>> streams;
    BroadcastStream<TransferItem> updates;

    std::shared_ptr<bool> alive = std::make_shared<bool>(true);
    bool initialized = false;
    bool shut_down = false;

    Impl(std::shared_ptr<Transport> t, std::shared_ptr<TransferRecordStore> r, ControllerConfig c)
        : transport(std::move(t)), records(std::move(r)), config(std::move(c)),
          completed_paths(config.max_cached_paths, config.verify_cached_files) {}

    BroadcastStream<TransferItem> stream_for_key(const std::string& key) {
        auto it = streams.find(key);
        if (it != streams.end()) return it->second;
        return streams.emplace(key, BroadcastStream<TransferItem>()).first->second;
    }

    std::optional<TransferTask> task_for(const std::string& key) const {
        if (auto it = tasks.find(key); it != tasks.end()) return it->second;
        if (auto it = items.find(key); it != items.end()) return it->second.task;
        return std::nullopt;
    }

    void forget_active(const std::string& key) {
        active_keys.erase(key);
        unstarted_keys.erase(key);
        tasks.erase(key);
    }

    // Closes and drops the stream and item of a key that is no longer in flight
    void prune(const std::string& key) {
        if (active_keys.count(key) || confirming.count(key)) return;
        items.erase(key);
        auto it = streams.find(key);
        if (it == streams.end()) return;
        auto stream = it->second;
        streams.erase(it);
        stream.close();
    }

    // Single writer of cache and item state
    void on_transport_update(const TransferItem& item) {
        const std::string key = item.key();
        auto previous = items.find(key);
        bool status_changed = previous == items.end() || previous->second.status != item.status;
        items[key] = item;

        if (item.is_complete()) {
            completed_paths.put(key, item.task.local_path());
            forget_active(key);
            Logger::instance().debug("Controller: {} complete -> {}", key, item.task.local_path());
        } else if (item.is_failed() || item.is_canceled()) {
            forget_active(key);
            Logger::instance().debug("Controller: {} ended as {}", key, to_string(item.status));
        }

        // Progress ticks are not persisted, only status transitions
        if (status_changed && !records->upsert(TransferRecord::from_item(item))) {
            Logger::instance().warning("Controller: could not persist record for {}", key);
        }

        stream_for_key(key).add(item);
        updates.add(item);
        prune(key);
    }

    void start_transport(const TransferTask& task, KeyedMutex::Lock lock, EnqueueCallback done,
                         BroadcastStream<TransferItem> stream) {
        const std::string key = task.key();
        std::weak_ptr<bool> weak = alive;

        auto on_enqueued = [this, weak, key, lock, done, stream](bool ok) mutable {
            if (weak.expired()) return;
            if (confirming.erase(key) == 0) return;
            if (!ok) {
                Logger::instance().warning("Controller: transport rejected {}", key);
                forget_active(key);
                lock.unlock();
                done(std::nullopt);
                prune(key);
                return;
            }
            unstarted_keys.erase(key);
            lock.unlock();
            // The key may already have ended; latest() still holds its last item
            done(EnqueueResult{EnqueueStarted{stream}});
            prune(key);
        };

        confirming.insert(key);
        try {
            transport->enqueue(task, on_enqueued);
        } catch (const std::exception& e) {
            Logger::instance().error("Controller: transport enqueue of {} threw: {}", key, e.what());
            on_enqueued(false);
        }
    }

    void run_for_key(const std::string& key, void (Transport::*op)(const TransferTask&, Completion),
                     const char* name, Completion done) {
        auto task = task_for(key);
        if (!task) {
            Logger::instance().debug("Controller: {} unknown key {}", name, key);
            done(false);
            return;
        }
        try {
            (transport.get()->*op)(*task, std::move(done));
        } catch (const std::exception& e) {
            Logger::instance().error("Controller: transport {} of {} threw: {}", name, key, e.what());
            done(false);
        }
    }

    // Runs op for every key and reports the per-key results in input order
    void run_batch(const std::vector<std::string>& keys,
                   const std::function<void(const std::string&, Completion)>& op, BatchCompletion done) {
        if (keys.empty()) {
            done({});
            return;
        }

        struct Batch {
            std::vector<bool> results;
            size_t remaining = 0;
            BatchCompletion done;
        };
        auto batch = std::make_shared<Batch>();
        batch->results.assign(keys.size(), false);
        batch->remaining = keys.size();
        batch->done = std::move(done);

        for (size_t i = 0; i < keys.size(); ++i) {
            op(keys[i], [batch, i](bool ok) {
                batch->results[i] = ok;
                if (--batch->remaining == 0) batch->done(batch->results);
            });
        }
    }
};

TransferController::TransferController(std::shared_ptr<Transport> transport,
                                       std::shared_ptr<TransferRecordStore> records, ControllerConfig config)
{
    if (!transport) {
        throw XferqError(ErrorCode::InvalidArgument, "transport is required");
    }
    if (!records) records = std::make_shared<MemoryRecordStore>();
    impl_ = std::make_unique<Impl>(std::move(transport), std::move(records), std::move(config));
    impl_->completed_paths.set_eviction_callback([](const std::string& key, const std::string& path) {
        Logger::instance().debug("Controller: {} ({}) left the completed cache", key, path);
    });
}

TransferController::~TransferController() {
    shutdown();
}

bool TransferController::initialize() {
    if (impl_->shut_down) {
        throw XferqError(ErrorCode::Disposed, "TransferController has been shut down");
    }
    if (impl_->initialized) return true;

    std::weak_ptr<bool> weak = impl_->alive;
    Impl* impl = impl_.get();
    impl_->transport->set_update_listener([impl, weak](const TransferItem& item) {
        if (!weak.expired()) impl->on_transport_update(item);
    });

    size_t seeded = 0;
    for (const auto& record : impl_->records->load_all()) {
        if (record.status == TaskStatus::complete && !record.local_path.empty()) {
            impl_->completed_paths.put(record.key, record.local_path);
            ++seeded;
        }
    }

    impl_->initialized = true;
    Logger::instance().info("Controller initialized, {} completed transfers cached", seeded);
    return true;
}

void TransferController::shutdown() {
    if (impl_->shut_down) return;
    impl_->shut_down = true;
    impl_->alive.reset();

    if (impl_->initialized) {
        impl_->transport->set_update_listener(nullptr);
    }
    for (auto& [key, stream] : impl_->streams) {
        stream.close();
    }
    impl_->updates.close();
    impl_->streams.clear();
    impl_->items.clear();
    impl_->mutex.clear();
    impl_->active_keys.clear();
    impl_->unstarted_keys.clear();
    impl_->confirming.clear();
    impl_->tasks.clear();
    impl_->initialized = false;
    Logger::instance().debug("Controller shut down");
}

bool TransferController::is_initialized() const {
    return impl_->initialized;
}

void TransferController::enqueue(const TransferTask& task, EnqueueCallback done) {
    enqueue(task, impl_->config.auto_start, std::move(done));
}

void TransferController::enqueue(const TransferTask& task, bool auto_start, EnqueueCallback done) {
    if (impl_->shut_down) {
        throw XferqError(ErrorCode::Disposed, "TransferController has been shut down");
    }
    if (!impl_->initialized) initialize();

    Impl* impl = impl_.get();
    std::weak_ptr<bool> weak = impl_->alive;
    const std::string key = task.key();

    impl_->mutex.acquire(key, [impl, weak, task, key, auto_start, done](KeyedMutex::Lock lock) {
        if (weak.expired()) return;

        bool was_cached = impl->completed_paths.exists(key);
        if (auto path = impl->completed_paths.lookup(key)) {
            Logger::instance().debug("Controller: {} served from cache", key);
            lock.unlock();
            done(EnqueueResult{EnqueueCached{*path}});
            return;
        }
        if (was_cached) {
            Logger::instance().info("Controller: cached file of {} is gone, transferring again", key);
            impl->records->remove(key);
        }

        if (impl->active_keys.count(key)) {
            Logger::instance().debug("Controller: {} already in progress", key);
            auto stream = impl->stream_for_key(key);
            lock.unlock();
            done(EnqueueResult{EnqueueInProgress{stream}});
            return;
        }

        impl->active_keys.insert(key);
        impl->tasks[key] = task;
        auto stream = impl->stream_for_key(key);

        if (!auto_start) {
            impl->unstarted_keys.insert(key);
            Logger::instance().debug("Controller: {} registered without starting", key);
            lock.unlock();
            done(EnqueueResult{EnqueuePending{stream}});
            return;
        }

        Logger::instance().debug("Controller: starting {}", key);
        impl->start_transport(task, std::move(lock), done, stream);
    });
}

void TransferController::start_pending(const std::string& key, Completion done) {
    if (!impl_->unstarted_keys.count(key)) {
        done(false);
        return;
    }

    Impl* impl = impl_.get();
    std::weak_ptr<bool> weak = impl_->alive;
    impl_->mutex.acquire(key, [impl, weak, key, done](KeyedMutex::Lock lock) {
        if (weak.expired()) return;
        // Someone else may have started or cancelled it while we waited
        if (!impl->unstarted_keys.count(key)) {
            lock.unlock();
            done(false);
            return;
        }
        auto task = impl->tasks.at(key);
        impl->start_transport(task, std::move(lock),
                              [done](std::optional<EnqueueResult> result) { done(result.has_value()); },
                              impl->stream_for_key(key));
    });
}

void TransferController::pause(const std::string& key, Completion done) {
    auto task = impl_->task_for(key);
    if (task && !task->allow_pause) {
        done(false);
        return;
    }
    impl_->run_for_key(key, &Transport::pause, "pause", std::move(done));
}

void TransferController::resume(const std::string& key, Completion done) {
    impl_->run_for_key(key, &Transport::resume, "resume", std::move(done));
}

void TransferController::cancel(const std::string& key, Completion done) {
    // Never handed to the transport: cancel locally
    if (impl_->unstarted_keys.count(key)) {
        TransferItem item;
        item.task = impl_->tasks.at(key);
        item.status = TaskStatus::canceled;
        impl_->on_transport_update(item);
        done(true);
        return;
    }
    impl_->run_for_key(key, &Transport::cancel, "cancel", std::move(done));
}

void TransferController::pause_all(const std::vector<std::string>& keys, BatchCompletion done) {
    impl_->run_batch(keys, [this](const std::string& key, Completion cb) { pause(key, std::move(cb)); },
                     std::move(done));
}

void TransferController::resume_all(const std::vector<std::string>& keys, BatchCompletion done) {
    impl_->run_batch(keys, [this](const std::string& key, Completion cb) { resume(key, std::move(cb)); },
                     std::move(done));
}

void TransferController::cancel_all(const std::vector<std::string>& keys, Completion done) {
    impl_->run_batch(keys, [this](const std::string& key, Completion cb) { cancel(key, std::move(cb)); },
                     [done](std::vector<bool> results) {
                         bool all = true;
                         for (bool ok : results) all = all && ok;
                         done(all);
                     });
}

bool TransferController::delete_file(const std::string& key) {
    if (impl_->active_keys.count(key)) {
        Logger::instance().warning("Controller: refusing to delete active transfer {}", key);
        return false;
    }

    std::optional<std::string> path = impl_->completed_paths.peek(key);
    if (!path) {
        // Failed or evicted downloads are only known from their record
        for (const auto& record : impl_->records->load_all()) {
            if (record.key == key && record.kind == TransferKind::download && !record.local_path.empty()) {
                path = record.local_path;
                break;
            }
        }
    }

    bool removed = impl_->records->remove(key);
    removed = impl_->completed_paths.remove(key) || removed;
    removed = impl_->items.erase(key) > 0 || removed;
    if (auto it = impl_->streams.find(key); it != impl_->streams.end()) {
        it->second.close();
        impl_->streams.erase(it);
    }

    if (path) {
        std::error_code ec;
        if (std::filesystem::remove(*path, ec)) {
            Logger::instance().debug("Controller: deleted {}", *path);
        } else if (ec) {
            Logger::instance().warning("Controller: cannot delete {}: {}", *path, ec.message());
        }
    }
    return removed;
}

std::optional<std::string> TransferController::cached_path(const std::string& key) const {
    return impl_->completed_paths.peek(key);
}

bool TransferController::is_active(const std::string& key) const {
    return impl_->active_keys.count(key) > 0;
}

bool TransferController::is_locked(const std::string& key) const {
    return impl_->mutex.is_locked(key);
}

std::optional<TransferItem> TransferController::latest(const std::string& key) const {
    auto it = impl_->items.find(key);
    if (it == impl_->items.end()) return std::nullopt;
    return it->second;
}

std::optional<BroadcastStream<TransferItem>> TransferController::stream_for(const std::string& key) const {
    auto it = impl_->streams.find(key);
    if (it == impl_->streams.end()) return std::nullopt;
    return it->second;
}

size_t TransferController::active_count() const {
    return impl_->active_keys.size();
}

size_t TransferController::cached_count() const {
    return impl_->completed_paths.size();
}

PathCacheStats TransferController::cache_stats() const {
    return impl_->completed_paths.stats();
}

BroadcastStream<TransferItem> TransferController::item_updates() const {
    return impl_->updates;
}

const ControllerConfig& TransferController::config() const {
    return impl_->config;
}

} // namespace xferq
