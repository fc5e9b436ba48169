#ifndef XFERQ_QUEUE_TRANSPORT_QUEUE_MANAGER_H
#define XFERQ_QUEUE_TRANSPORT_QUEUE_MANAGER_H

#include "xferq/base/stream.h"
#include "xferq/control/transfer_controller.h"
#include "xferq/queue/transfer_queue_manager.h"
#include "xferq/transfer/transfer_task.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xferq {

// Queue whose executor hands every task to a TransferController and turns
// the transport's item updates into progress events
class TransportQueueManager {
public:
    using Queue = TransferQueueManager<TransferTask>;
    using TransferPtr = Queue::TransferPtr;
    using ProgressMap = std::map<std::string, TransferProgress>;
    using ResultCallback = QueuedTransfer<TransferTask>::ResultCallback;
    using AllResultsCallback = std::function<void(std::vector<QueueResult>)>;

    TransportQueueManager(std::shared_ptr<TransferController> controller, QueueOptions options = {},
                          DeferFunction defer = nullptr);
    virtual ~TransportQueueManager();

    TransportQueueManager(const TransportQueueManager&) = delete;
    TransportQueueManager& operator=(const TransportQueueManager&) = delete;

    void start() { queue_->start(); }
    void pause() { queue_->pause(); }
    void pause_all() { queue_->pause_all(); }
    void resume_all() { queue_->resume_all(); }

    // Cancels in the queue and, once the transport knows the task, there too
    bool cancel(const std::string& id);
    void cancel_all();

    bool retry(const std::string& id) { return queue_->retry(id); }
    bool change_priority(const std::string& id, TransferPriority priority) {
        return queue_->change_priority(id, priority);
    }
    bool move_to_front(const std::string& id) { return queue_->move_to_front(id); }
    bool remove(const std::string& id);
    void clear_finished();
    void dispose();

    // Throws XferqError(NotFound) for an unknown id
    void wait_for(const std::string& id, ResultCallback callback);
    // Called once every transfer known right now has a result
    void wait_for_all(AllResultsCallback callback);

    TransferPtr get(const std::string& id) const { return queue_->get(id); }
    std::optional<TransferItem> item(const std::string& id) const;

    // Latest progress of transfers that have not finished yet
    const ProgressMap& active_progress() const { return progress_; }
    BroadcastStream<ProgressMap> progress_stream() const { return progress_stream_; }

    Queue& queue() { return *queue_; }
    const Queue& queue() const { return *queue_; }
    TransferController& controller() { return *controller_; }

protected:
    TransferPtr enqueue(TransferTask task, const std::string& id, TransferPriority priority, Metadata metadata);

private:
    UnicastStream<TransferProgress> execute(const TransferPtr& transfer);
    void attach(const TransferPtr& transfer, BroadcastStream<TransferItem> items,
                UnicastStream<TransferProgress> out);
    void on_item(const TransferPtr& transfer, const TransferItem& item, UnicastStream<TransferProgress>& out);
    void forget(const std::string& id);
    void publish_progress();

    std::shared_ptr<TransferController> controller_;
    std::unique_ptr<Queue> queue_;

    std::map<std::string, TransferItem> items_;
    ProgressMap progress_;
    std::map<std::string, Subscription> subscriptions_;
    BroadcastStream<ProgressMap> progress_stream_;
    std::shared_ptr<bool> alive_;
};

} // namespace xferq

#endif // XFERQ_QUEUE_TRANSPORT_QUEUE_MANAGER_H
