#include "xferq/queue/transport_queue_manager.h"
#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"

namespace xferq {

TransportQueueManager::TransportQueueManager(std::shared_ptr<TransferController> controller, QueueOptions options,
                                             DeferFunction defer)
    : controller_(std::move(controller)), alive_(std::make_shared<bool>(true)) {
    if (!controller_) {
        throw XferqError(ErrorCode::InvalidArgument, "controller is required");
    }
    queue_ = std::make_unique<Queue>([this](const TransferPtr& transfer) { return execute(transfer); },
                                     std::move(options), std::move(defer));
}

TransportQueueManager::~TransportQueueManager() {
    if (!queue_->is_disposed()) dispose();
}

TransportQueueManager::TransferPtr TransportQueueManager::enqueue(TransferTask task, const std::string& id,
                                                                  TransferPriority priority, Metadata metadata) {
    return queue_->add(std::move(task), id, priority, std::move(metadata));
}

UnicastStream<TransferProgress> TransportQueueManager::execute(const TransferPtr& transfer) {
    UnicastStream<TransferProgress> out;
    const TransferTask task = transfer->task();
    std::weak_ptr<bool> weak = alive_;

    controller_->enqueue(task, true, [this, weak, transfer, task, out](std::optional<EnqueueResult> result) mutable {
        if (weak.expired()) return;

        if (!result) {
            out.add(TransferProgress::failed("Transport rejected the transfer",
                                             error_code_name(ErrorCode::TransportRejected)));
            out.close();
            return;
        }

        if (auto* cached = std::get_if<EnqueueCached>(&*result)) {
            Logger::instance().debug("TransferQueue: {} already available at {}", transfer->id(), cached->file_path);
            out.add(TransferProgress::completed(-1, {{kLocalPathKey, cached->file_path}}));
            out.close();
            return;
        }

        // Cancelled while the controller was busy with the key
        if (transfer->cancellation_token().is_cancelled()) {
            if (std::holds_alternative<EnqueueStarted>(*result)) {
                controller_->cancel(task.key(), [key = task.key()](bool ok) {
                    if (!ok) Logger::instance().warning("TransferQueue: Transport cancel of {} failed", key);
                });
            }
            out.add(TransferProgress::cancelled());
            out.close();
            return;
        }

        if (std::holds_alternative<EnqueuePending>(*result)) {
            controller_->start_pending(task.key(), [key = task.key()](bool ok) {
                if (!ok) Logger::instance().warning("TransferQueue: Could not start {}", key);
            });
        }

        attach(transfer, *stream_of(*result), out);

        // The transport may report the end before it confirms the enqueue
        const std::string key = task.key();
        if (out.is_closed() || controller_->is_active(key)) return;
        if (auto last = controller_->latest(key); last && last->is_final()) {
            on_item(transfer, *last, out);
        } else if (auto path = controller_->cached_path(key)) {
            out.add(TransferProgress::completed(-1, {{kLocalPathKey, *path}}));
            out.close();
            forget(transfer->id());
        } else {
            out.close();
            forget(transfer->id());
        }
    });

    return out;
}

void TransportQueueManager::attach(const TransferPtr& transfer, BroadcastStream<TransferItem> items,
                                   UnicastStream<TransferProgress> out) {
    const std::string id = transfer->id();
    std::weak_ptr<bool> weak = alive_;

    auto subscription = items.listen(
        [this, weak, transfer, out](const TransferItem& item) mutable {
            if (!weak.expired()) on_item(transfer, item, out);
        },
        [weak, out]() mutable {
            // Stream ended without a terminal item; the queue reports the unexpected end
            if (!weak.expired()) out.close();
        });

    if (!out.is_closed()) {
        subscriptions_[id] = std::move(subscription);
    } else {
        subscription.cancel();
    }
}

void TransportQueueManager::on_item(const TransferPtr& transfer, const TransferItem& item,
                                    UnicastStream<TransferProgress>& out) {
    const std::string id = transfer->id();

    if (transfer->cancellation_token().is_cancelled()) {
        out.add(TransferProgress::cancelled(item.transferred_bytes, item.expected_file_size));
        out.close();
        forget(id);
        return;
    }

    items_[id] = item;

    if (item.is_complete()) {
        out.add(TransferProgress::completed(item.expected_file_size, {{kLocalPathKey, item.task.local_path()}}));
        out.close();
        forget(id);
    } else if (item.is_failed()) {
        TransferProgress failed = item.to_progress();
        if (!failed.error_message || failed.error_message->empty()) {
            failed.error_message = item.task.is_download() ? "Download failed" : "Upload failed";
        }
        out.add(failed);
        out.close();
        forget(id);
    } else if (item.is_canceled()) {
        out.add(TransferProgress::cancelled(item.transferred_bytes, item.expected_file_size));
        out.close();
        forget(id);
    } else {
        auto progress = item.to_progress();
        progress_[id] = progress;
        out.add(progress);
        publish_progress();
    }
}

void TransportQueueManager::forget(const std::string& id) {
    if (auto it = subscriptions_.find(id); it != subscriptions_.end()) {
        it->second.cancel();
        subscriptions_.erase(it);
    }
    if (progress_.erase(id) > 0) {
        publish_progress();
    }
}

void TransportQueueManager::publish_progress() {
    if (!progress_stream_.is_closed()) {
        progress_stream_.add(progress_);
    }
}

bool TransportQueueManager::cancel(const std::string& id) {
    auto transfer = queue_->get(id);
    bool attached = subscriptions_.count(id) > 0;
    forget(id);

    if (!queue_->cancel(id)) return false;

    if (attached && transfer) {
        controller_->cancel(transfer->task().key(), [id](bool ok) {
            if (!ok) Logger::instance().warning("TransferQueue: Transport cancel of {} failed", id);
        });
    }
    return true;
}

void TransportQueueManager::cancel_all() {
    std::vector<std::string> keys;
    for (const auto& transfer : queue_->running_transfers()) {
        if (subscriptions_.count(transfer->id())) keys.push_back(transfer->task().key());
    }
    for (auto& [id, subscription] : subscriptions_) {
        subscription.cancel();
    }
    subscriptions_.clear();
    progress_.clear();
    publish_progress();

    queue_->cancel_all();
    if (!keys.empty()) {
        controller_->cancel_all(keys, [](bool ok) {
            if (!ok) Logger::instance().warning("TransferQueue: Some transport cancellations failed");
        });
    }
}

bool TransportQueueManager::remove(const std::string& id) {
    auto transfer = queue_->get(id);
    bool attached = subscriptions_.count(id) > 0;
    forget(id);
    items_.erase(id);

    if (!queue_->remove(id)) return false;

    if (attached && transfer) {
        controller_->cancel(transfer->task().key(), [id](bool ok) {
            if (!ok) Logger::instance().debug("TransferQueue: Transport cancel of removed {} failed", id);
        });
    }
    return true;
}

void TransportQueueManager::clear_finished() {
    for (const auto& transfer : queue_->all_transfers()) {
        if (transfer->is_finished()) items_.erase(transfer->id());
    }
    queue_->clear_finished();
}

void TransportQueueManager::dispose() {
    if (queue_->is_disposed()) return;

    std::vector<std::string> keys;
    for (const auto& transfer : queue_->running_transfers()) {
        if (subscriptions_.count(transfer->id())) keys.push_back(transfer->task().key());
    }
    for (auto& [id, subscription] : subscriptions_) {
        subscription.cancel();
    }
    subscriptions_.clear();

    queue_->dispose();
    alive_.reset();
    progress_.clear();
    progress_stream_.close();

    if (!keys.empty()) {
        controller_->cancel_all(keys, [](bool ok) {
            if (!ok) Logger::instance().warning("TransferQueue: Some transport cancellations failed on dispose");
        });
    }
}

void TransportQueueManager::wait_for(const std::string& id, ResultCallback callback) {
    auto transfer = queue_->get(id);
    if (!transfer) {
        throw XferqError(ErrorCode::NotFound, "Transfer not found: " + id);
    }
    transfer->on_result(std::move(callback));
}

void TransportQueueManager::wait_for_all(AllResultsCallback callback) {
    auto transfers = queue_->all_transfers();
    if (transfers.empty()) {
        callback({});
        return;
    }

    struct Collector {
        std::vector<QueueResult> results;
        size_t remaining = 0;
        AllResultsCallback done;
    };
    auto collector = std::make_shared<Collector>();
    collector->results.resize(transfers.size());
    collector->remaining = transfers.size();
    collector->done = std::move(callback);

    for (size_t i = 0; i < transfers.size(); ++i) {
        transfers[i]->on_result([collector, i](const QueueResult& result) {
            collector->results[i] = result;
            if (--collector->remaining == 0) collector->done(collector->results);
        });
    }
}

std::optional<TransferItem> TransportQueueManager::item(const std::string& id) const {
    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

} // namespace xferq
