#ifndef XFERQ_QUEUE_QUEUED_TRANSFER_H
#define XFERQ_QUEUE_QUEUED_TRANSFER_H

#include "xferq/base/cancellation_token.h"
#include "xferq/base/logger.h"
#include "xferq/base/stream.h"
#include "xferq/transfer/transfer_progress.h"
#include "xferq/transfer/transfer_result.h"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xferq {

// Higher value is served first
enum class TransferPriority {
    low = 0,
    normal = 1,
    high = 2,
    urgent = 3
};

enum class QueuedTransferStatus {
    queued,
    running,
    completed,
    failed,
    cancelled,
    paused
};

std::string to_string(TransferPriority priority);
std::string to_string(QueuedTransferStatus status);

struct QueueResult {
    std::string transfer_id;
    TransferResult result;

    bool is_success() const { return xferq::is_success(result); }
    bool is_failure() const { return xferq::is_failure(result); }
    bool is_cancelled() const { return xferq::is_cancelled(result); }

    // Failure message, when the transfer failed
    std::optional<std::string> error() const {
        if (auto* f = std::get_if<TransferFailure>(&result)) return f->message;
        return std::nullopt;
    }
};

template <typename T>
class TransferQueueManager;

// One entry of a TransferQueueManager. Identity, payload and priority are
// fixed; everything that changes over the lifetime lives in a shared block
// so handles obtained before a priority change keep observing the transfer.
template <typename T>
class QueuedTransfer {
public:
    using Ptr = std::shared_ptr<QueuedTransfer<T>>;
    using ResultCallback = std::function<void(const QueueResult&)>;

    const std::string& id() const { return id_; }
    const T& task() const { return task_; }
    TransferPriority priority() const { return priority_; }
    std::chrono::system_clock::time_point added_at() const { return added_at_; }
    const Metadata& metadata() const { return metadata_; }

    QueuedTransferStatus status() const { return shared_->status; }
    double progress() const { return shared_->progress; }
    const std::optional<std::string>& error_message() const { return shared_->error_message; }
    int queue_position() const { return shared_->queue_position; }
    const std::optional<TransferProgress>& last_progress() const { return shared_->last_progress; }

    bool is_queued() const { return status() == QueuedTransferStatus::queued; }
    bool is_running() const { return status() == QueuedTransferStatus::running; }
    bool is_paused() const { return status() == QueuedTransferStatus::paused; }
    bool is_finished() const {
        auto s = status();
        return s == QueuedTransferStatus::completed || s == QueuedTransferStatus::failed ||
               s == QueuedTransferStatus::cancelled;
    }
    bool is_resolved() const { return shared_->resolved; }

    CancellationToken& cancellation_token() { return *shared_->token; }
    const CancellationToken& cancellation_token() const { return *shared_->token; }

    // Resolves exactly once with the terminal outcome
    std::shared_future<QueueResult> future() const { return shared_->future; }

    // Runs callback with the outcome, immediately when already resolved
    void on_result(ResultCallback callback) {
        if (shared_->resolved) {
            callback(shared_->future.get());
            return;
        }
        shared_->result_callbacks.push_back(std::move(callback));
    }

    // Closed once the transfer reaches a terminal state
    BroadcastStream<TransferProgress> progress_stream() const { return shared_->stream; }

private:
    friend class TransferQueueManager<T>;

    struct Shared {
        QueuedTransferStatus status = QueuedTransferStatus::queued;
        double progress = 0.0;
        std::optional<std::string> error_message;
        std::optional<TransferProgress> last_progress;
        int queue_position = -1;
        std::chrono::steady_clock::time_point started_at{};

        std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>();
        std::promise<QueueResult> promise;
        std::shared_future<QueueResult> future = promise.get_future().share();
        std::vector<ResultCallback> result_callbacks;
        bool resolved = false;
        BroadcastStream<TransferProgress> stream;
    };

    QueuedTransfer(std::string id, T task, TransferPriority priority, Metadata metadata,
                   std::chrono::system_clock::time_point added_at, std::shared_ptr<Shared> shared)
        : id_(std::move(id)), task_(std::move(task)), priority_(priority), added_at_(added_at),
          metadata_(std::move(metadata)), shared_(std::move(shared)) {}

    static Ptr create(std::string id, T task, TransferPriority priority, Metadata metadata) {
        return Ptr(new QueuedTransfer<T>(std::move(id), std::move(task), priority, std::move(metadata),
                                         std::chrono::system_clock::now(), std::make_shared<Shared>()));
    }

    // Same transfer under another priority; the state block is shared
    Ptr with_priority(TransferPriority priority) const {
        return Ptr(new QueuedTransfer<T>(id_, task_, priority, metadata_, added_at_, shared_));
    }

    void mark_running() {
        shared_->status = QueuedTransferStatus::running;
        shared_->queue_position = 0;
        shared_->started_at = std::chrono::steady_clock::now();
    }

    void set_status(QueuedTransferStatus status) { shared_->status = status; }
    void set_queue_position(int position) { shared_->queue_position = position; }

    void update_progress(const TransferProgress& update) {
        shared_->progress = update.progress();
        shared_->last_progress = update;
        if (!shared_->stream.is_closed()) {
            shared_->stream.add(update);
        }
    }

    // Back to queued for another attempt; the outcome stays pending
    void reset_for_retry() {
        shared_->status = QueuedTransferStatus::queued;
        shared_->progress = 0.0;
        shared_->error_message.reset();
    }

    // Fresh completion, stream and token for a manual retry of a failed
    // transfer. Earlier future() handles keep the failure.
    void rearm() {
        reset_for_retry();
        shared_->last_progress.reset();
        shared_->token = std::make_shared<CancellationToken>();
        shared_->promise = std::promise<QueueResult>();
        shared_->future = shared_->promise.get_future().share();
        shared_->result_callbacks.clear();
        shared_->resolved = false;
        shared_->stream = BroadcastStream<TransferProgress>();
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                     shared_->started_at);
    }

    void mark_completed(TransferSuccess success) {
        shared_->status = QueuedTransferStatus::completed;
        shared_->progress = 1.0;
        finish(TransferResult{std::move(success)}, TransferStatus::completed);
    }

    void mark_failed(TransferFailure failure) {
        shared_->status = QueuedTransferStatus::failed;
        shared_->error_message = failure.message;
        finish(TransferResult{std::move(failure)}, TransferStatus::failed);
    }

    void mark_cancelled(std::optional<std::string> reason = std::string("User cancelled")) {
        shared_->status = QueuedTransferStatus::cancelled;
        shared_->token->cancel(reason);
        TransferCancelled cancelled;
        cancelled.reason = std::move(reason);
        if (shared_->last_progress) cancelled.bytes_transferred = shared_->last_progress->bytes_transferred;
        finish(TransferResult{std::move(cancelled)}, TransferStatus::cancelled);
    }

    // Cancels the token, closes the stream and settles an unresolved outcome
    // as cancelled so no waiter is left hanging
    void dispose() {
        if (!shared_->resolved) {
            TransferCancelled cancelled;
            cancelled.reason = "Transfer disposed";
            resolve(TransferResult{std::move(cancelled)});
        }
        shared_->token->cancel(std::string("Transfer disposed"));
        shared_->token->dispose();
        shared_->stream.close();
    }

    void finish(TransferResult result, TransferStatus terminal) {
        // A terminal snapshot goes out unless the executor already sent one
        if (!shared_->stream.is_closed() &&
            !(shared_->last_progress && shared_->last_progress->status == terminal)) {
            TransferProgress last = shared_->last_progress ? shared_->last_progress->with_status(terminal)
                                                           : TransferProgress{}.with_status(terminal);
            if (auto* f = std::get_if<TransferFailure>(&result)) {
                last.error_message = f->message;
                last.error_code = f->code;
            }
            if (terminal == TransferStatus::completed && last.total_bytes > 0) {
                last.bytes_transferred = last.total_bytes;
            }
            shared_->last_progress = last;
            shared_->stream.add(last);
        }
        resolve(std::move(result));
        shared_->stream.close();
    }

    void resolve(TransferResult result) {
        if (shared_->resolved) return;
        shared_->resolved = true;

        QueueResult outcome{id_, std::move(result)};
        shared_->promise.set_value(outcome);

        auto callbacks = std::move(shared_->result_callbacks);
        shared_->result_callbacks.clear();
        for (auto& callback : callbacks) {
            try {
                callback(outcome);
            } catch (const std::exception& e) {
                Logger::instance().warning("Result callback of {} threw: {}", id_, e.what());
            }
        }
    }

    std::string id_;
    T task_;
    TransferPriority priority_;
    std::chrono::system_clock::time_point added_at_;
    Metadata metadata_;
    std::shared_ptr<Shared> shared_;
};

} // namespace xferq

#endif // XFERQ_QUEUE_QUEUED_TRANSFER_H
