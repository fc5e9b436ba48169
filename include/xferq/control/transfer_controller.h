#ifndef XFERQ_CONTROL_TRANSFER_CONTROLLER_H
#define XFERQ_CONTROL_TRANSFER_CONTROLLER_H

#include "xferq/base/config.h"
#include "xferq/base/stream.h"
#include "xferq/cache/path_cache.h"
#include "xferq/control/record_store.h"
#include "xferq/control/transport.h"
#include "xferq/transfer/transfer_task.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xferq {

// The key already finished; nothing was started
struct EnqueueCached {
    std::string file_path;
};

// Another caller already started the key; attach to its updates
struct EnqueueInProgress {
    BroadcastStream<TransferItem> stream;
};

// The transport accepted new work for the key
struct EnqueueStarted {
    BroadcastStream<TransferItem> stream;
};

// Registered without starting; see TransferController::start_pending()
struct EnqueuePending {
    BroadcastStream<TransferItem> stream;
};

using EnqueueResult = std::variant<EnqueueCached, EnqueueInProgress, EnqueueStarted, EnqueuePending>;

std::string to_string(const EnqueueResult& result);

// Stream carried by every variant except EnqueueCached
std::optional<BroadcastStream<TransferItem>> stream_of(const EnqueueResult& result);

// Coalesces transfer requests by key: at most one transport operation per
// key at any time, finished keys answered from the completed-path cache.
// Owned by the application; call shutdown() before dropping the transport.
class TransferController {
public:
    // nullopt when the transport refused the task
    using EnqueueCallback = std::function<void(std::optional<EnqueueResult>)>;
    using Completion = Transport::Completion;
    using BatchCompletion = std::function<void(std::vector<bool>)>;

    TransferController(std::shared_ptr<Transport> transport, std::shared_ptr<TransferRecordStore> records,
                       ControllerConfig config = {});
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    // Subscribes to the transport and seeds the cache from stored records
    bool initialize();
    void shutdown();
    bool is_initialized() const;

    // Under the key's lock: cached, else in progress, else start (or
    // register as pending when auto_start is false)
    void enqueue(const TransferTask& task, EnqueueCallback done);
    void enqueue(const TransferTask& task, bool auto_start, EnqueueCallback done);

    // Starts a key registered through EnqueuePending
    void start_pending(const std::string& key, Completion done);

    void pause(const std::string& key, Completion done);
    void resume(const std::string& key, Completion done);
    void cancel(const std::string& key, Completion done);

    void pause_all(const std::vector<std::string>& keys, BatchCompletion done);
    void resume_all(const std::vector<std::string>& keys, BatchCompletion done);
    void cancel_all(const std::vector<std::string>& keys, Completion done);

    // Forgets a finished key and removes its file; refuses active keys
    bool delete_file(const std::string& key);

    // Cache entry as stored; enqueue() additionally checks the file exists
    std::optional<std::string> cached_path(const std::string& key) const;
    bool is_active(const std::string& key) const;
    bool is_locked(const std::string& key) const;
    // Only while the key is in flight; a finished key's item and stream are dropped
    std::optional<TransferItem> latest(const std::string& key) const;
    std::optional<BroadcastStream<TransferItem>> stream_for(const std::string& key) const;
    size_t active_count() const;
    size_t cached_count() const;
    PathCacheStats cache_stats() const;

    // Every transport update, after the controller state reflects it
    BroadcastStream<TransferItem> item_updates() const;

    const ControllerConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xferq

#endif // XFERQ_CONTROL_TRANSFER_CONTROLLER_H
