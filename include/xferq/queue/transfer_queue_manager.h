#ifndef XFERQ_QUEUE_TRANSFER_QUEUE_MANAGER_H
#define XFERQ_QUEUE_TRANSFER_QUEUE_MANAGER_H

#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"
#include "xferq/base/stream.h"
#include "xferq/queue/queue_options.h"
#include "xferq/queue/queue_state.h"
#include "xferq/queue/queued_transfer.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace xferq {

// Priority-ordered, concurrency-bounded scheduler. Single-threaded: every
// call, every executor event and every deferred retry must arrive on the
// same thread.
template <typename T>
class TransferQueueManager {
public:
    using TransferPtr = typename QueuedTransfer<T>::Ptr;
    using State = TransferQueueState<T>;

    // Produces the progress events of one transfer. Events may be added
    // before the function returns; the stream buffers until it is consumed.
    using Executor = std::function<UnicastStream<TransferProgress>(const TransferPtr&)>;

    TransferQueueManager(Executor executor, QueueOptions options = {}, DeferFunction defer = nullptr)
        : executor_(std::move(executor)), options_(std::move(options)), defer_(std::move(defer)),
          max_concurrent_(options_.max_concurrent), alive_(std::make_shared<bool>(true)) {
        if (max_concurrent_ <= 0) {
            throw XferqError(ErrorCode::InvalidArgument, "max_concurrent must be greater than 0");
        }
        if (!executor_) {
            throw XferqError(ErrorCode::InvalidArgument, "executor is required");
        }
    }

    ~TransferQueueManager() {
        if (!disposed_) dispose();
    }

    TransferQueueManager(const TransferQueueManager&) = delete;
    TransferQueueManager& operator=(const TransferQueueManager&) = delete;

    // Returns the existing entry unchanged when id is already tracked
    TransferPtr add(T task, std::optional<std::string> id = std::nullopt,
                    TransferPriority priority = TransferPriority::normal, Metadata metadata = {}) {
        ensure_not_disposed();

        std::string transfer_id = id ? *id : generate_id();
        if (auto it = transfers_.find(transfer_id); it != transfers_.end()) {
            return it->second;
        }

        auto transfer = QueuedTransfer<T>::create(transfer_id, std::move(task), priority, std::move(metadata));
        transfers_[transfer_id] = transfer;
        insert_pending(transfer);
        update_queue_positions();
        emit_state();

        Logger::instance().debug("TransferQueue: Added {} (priority {})", transfer_id, to_string(priority));

        if (options_.auto_start && !paused_) {
            process_queue();
        }
        return transfer;
    }

    std::vector<TransferPtr> add_all(std::vector<T> tasks, TransferPriority priority = TransferPriority::normal) {
        std::vector<TransferPtr> added;
        added.reserve(tasks.size());
        for (auto& task : tasks) {
            added.push_back(add(std::move(task), std::nullopt, priority));
        }
        return added;
    }

    void start() {
        ensure_not_disposed();
        paused_ = false;
        process_queue();
        emit_state();
    }

    // Stops admissions; running transfers continue
    void pause() {
        ensure_not_disposed();
        paused_ = true;
        emit_state();
    }

    // Stops admissions and flags running transfers as paused. The executors
    // are not interrupted.
    void pause_all() {
        ensure_not_disposed();
        paused_ = true;
        for (auto& transfer : running_) {
            transfer->set_status(QueuedTransferStatus::paused);
        }
        emit_state();
    }

    void resume_all() {
        ensure_not_disposed();
        paused_ = false;
        for (auto& transfer : running_) {
            if (transfer->is_paused()) transfer->set_status(QueuedTransferStatus::running);
        }
        process_queue();
        emit_state();
    }

    // Pending entries are cancelled without their executor ever running
    bool cancel(const std::string& id) {
        ensure_not_disposed();
        auto transfer = get(id);
        if (!transfer || transfer->is_finished()) return false;

        detach(transfer);
        transfer->mark_cancelled();
        Logger::instance().debug("TransferQueue: Cancelled {}", id);

        update_queue_positions();
        process_queue();
        emit_state();
        return true;
    }

    void cancel_all() {
        ensure_not_disposed();
        cancel_everything("User cancelled");
        emit_state();
    }

    // Detaches and disposes an entry whatever its status
    bool remove(const std::string& id) {
        ensure_not_disposed();
        auto it = transfers_.find(id);
        if (it == transfers_.end()) return false;

        auto transfer = it->second;
        transfers_.erase(it);
        detach(transfer);
        transfer->dispose();

        update_queue_positions();
        process_queue();
        emit_state();
        return true;
    }

    void clear_finished() {
        ensure_not_disposed();
        std::vector<std::string> finished;
        for (const auto& [id, transfer] : transfers_) {
            if (transfer->is_finished()) finished.push_back(id);
        }
        for (const auto& id : finished) {
            remove(id);
        }
    }

    // Requeues a failed transfer with a fresh future and progress stream
    bool retry(const std::string& id) {
        ensure_not_disposed();
        auto transfer = get(id);
        if (!transfer || transfer->status() != QueuedTransferStatus::failed) return false;

        retry_counts_.erase(id);
        transfer->rearm();
        insert_pending(transfer);
        update_queue_positions();
        Logger::instance().debug("TransferQueue: Manual retry of {}", id);

        process_queue();
        emit_state();
        return true;
    }

    // Only while the transfer still waits for a slot
    bool change_priority(const std::string& id, TransferPriority priority) {
        ensure_not_disposed();
        auto transfer = get(id);
        if (!transfer || !transfer->is_queued()) return false;

        bool in_pending = remove_pending(transfer);
        auto updated = transfer->with_priority(priority);
        transfers_[id] = updated;
        if (in_pending) {
            insert_pending(updated);
        }
        update_queue_positions();
        emit_state();
        return true;
    }

    bool move_to_front(const std::string& id) {
        return change_priority(id, TransferPriority::urgent);
    }

    // Cancels everything and closes the state stream; the manager is unusable afterwards
    void dispose() {
        if (disposed_) return;
        disposed_ = true;

        cancel_everything("Queue disposed");
        for (auto& [id, transfer] : transfers_) {
            transfer->dispose();
        }
        transfers_.clear();
        retry_counts_.clear();
        alive_.reset();
        state_stream_.close();
    }

    int max_concurrent() const { return max_concurrent_; }

    void set_max_concurrent(int value) {
        ensure_not_disposed();
        if (value <= 0) {
            throw XferqError(ErrorCode::InvalidArgument, "max_concurrent must be greater than 0");
        }
        max_concurrent_ = value;
        process_queue();
        emit_state();
    }

    int running_count() const { return static_cast<int>(running_.size()); }
    int pending_count() const { return static_cast<int>(pending_.size()); }
    int total_count() const { return static_cast<int>(transfers_.size()); }
    bool is_paused() const { return paused_; }
    bool is_disposed() const { return disposed_; }
    bool has_available_slots() const { return running_count() < max_concurrent_; }

    int retry_count(const std::string& id) const {
        auto it = retry_counts_.find(id);
        return it == retry_counts_.end() ? 0 : it->second;
    }

    // Transfers waiting for a backoff delay to elapse
    size_t waiting_retry_count() const { return waiting_retry_.size(); }

    TransferPtr get(const std::string& id) const {
        auto it = transfers_.find(id);
        return it == transfers_.end() ? nullptr : it->second;
    }

    std::vector<TransferPtr> running_transfers() const { return running_; }
    std::vector<TransferPtr> pending_transfers() const { return pending_; }

    std::vector<TransferPtr> all_transfers() const {
        std::vector<TransferPtr> all;
        all.reserve(transfers_.size());
        for (const auto& [id, transfer] : transfers_) all.push_back(transfer);
        return all;
    }

    State state() const {
        State s;
        s.running_count = running_count();
        s.pending_count = pending_count();
        s.max_concurrent = max_concurrent_;
        s.is_paused = paused_;
        s.running_transfers = running_;
        s.pending_transfers = pending_;
        for (const auto& transfer : running_) {
            s.running_progress_sum += transfer->progress();
        }
        return s;
    }

    BroadcastStream<State> state_stream() const { return state_stream_; }

private:
    struct Execution {
        bool finished = false;
        Subscription subscription;
    };

    void ensure_not_disposed() const {
        if (disposed_) {
            throw XferqError(ErrorCode::Disposed, "TransferQueueManager has been disposed");
        }
    }

    std::string generate_id() {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
        return fmt::format("{}_{}", micros, next_id_++);
    }

    // Before the first entry of strictly lower priority, so equal priorities stay FIFO
    void insert_pending(const TransferPtr& transfer) {
        auto pos = std::find_if(pending_.begin(), pending_.end(), [&](const TransferPtr& other) {
            return static_cast<int>(transfer->priority()) > static_cast<int>(other->priority());
        });
        pending_.insert(pos, transfer);
    }

    bool remove_pending(const TransferPtr& transfer) {
        auto it = std::find_if(pending_.begin(), pending_.end(),
                               [&](const TransferPtr& other) { return other->id() == transfer->id(); });
        if (it == pending_.end()) return false;
        pending_.erase(it);
        return true;
    }

    bool remove_running(const std::string& id) {
        auto it = std::find_if(running_.begin(), running_.end(),
                               [&](const TransferPtr& other) { return other->id() == id; });
        if (it == running_.end()) return false;
        running_.erase(it);
        return true;
    }

    // Takes the transfer out of every scheduling structure and stops
    // consuming its executor
    void detach(const TransferPtr& transfer) {
        remove_pending(transfer);
        remove_running(transfer->id());
        waiting_retry_.erase(transfer->id());
        retry_counts_.erase(transfer->id());
        stop_execution(transfer->id());
    }

    void stop_execution(const std::string& id) {
        auto it = executions_.find(id);
        if (it == executions_.end()) return;
        auto execution = it->second;
        executions_.erase(it);
        execution->finished = true;
        execution->subscription.cancel();
    }

    void cancel_everything(const std::string& reason) {
        auto pending = pending_;
        pending_.clear();
        for (auto& transfer : pending) {
            transfer->mark_cancelled(reason);
        }

        auto running = running_;
        running_.clear();
        for (auto& transfer : running) {
            stop_execution(transfer->id());
            transfer->mark_cancelled(reason);
        }

        // Result callbacks may remove or cancel entries while this runs
        auto waiting = std::exchange(waiting_retry_, {});
        for (const auto& id : waiting) {
            if (auto transfer = get(id)) transfer->mark_cancelled(reason);
        }
        retry_counts_.clear();
    }

    void process_queue() {
        if (disposed_ || paused_ || processing_) return;
        processing_ = true;

        // Executors may finish synchronously and free slots again; the loop
        // condition picks those up instead of recursing
        while (has_available_slots() && !pending_.empty() && !paused_ && !disposed_) {
            auto transfer = pending_.front();
            pending_.erase(pending_.begin());
            start_transfer(transfer);
        }

        processing_ = false;
        update_queue_positions();
    }

    void start_transfer(const TransferPtr& transfer) {
        transfer->mark_running();
        running_.push_back(transfer);
        update_queue_positions();
        emit_state();
        Logger::instance().debug("TransferQueue: Started {}", transfer->id());

        execute(transfer);
    }

    void execute(const TransferPtr& transfer) {
        auto execution = std::make_shared<Execution>();
        executions_[transfer->id()] = execution;

        UnicastStream<TransferProgress> stream;
        try {
            stream = executor_(transfer);
        } catch (const std::exception& e) {
            finish_failed(execution, transfer, TransferFailure::from_exception(e));
            return;
        }

        std::weak_ptr<bool> alive = alive_;
        auto guard = [this, alive, execution]() { return !alive.expired() && !execution->finished; };

        try {
            auto subscription = stream.listen(
                [this, guard, execution, transfer](const TransferProgress& progress) {
                    if (guard()) on_progress(execution, transfer, progress);
                },
                [this, guard, execution, transfer](const std::string& error) {
                    if (!guard()) return;
                    TransferFailure failure;
                    failure.message = error;
                    finish_failed(execution, transfer, std::move(failure));
                },
                [this, guard, execution, transfer]() {
                    if (guard()) on_stream_done(execution, transfer);
                });

            if (execution->finished) {
                subscription.cancel();
            } else {
                execution->subscription = std::move(subscription);
            }
        } catch (const std::exception& e) {
            if (!execution->finished) {
                finish_failed(execution, transfer, TransferFailure::from_exception(e));
            }
        }
    }

    void on_progress(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer,
                     const TransferProgress& progress) {
        try {
            // Cancelled from outside the manager: stop consuming
            if (transfer->cancellation_token().is_cancelled()) {
                finish_cancelled(execution, transfer);
                return;
            }

            transfer->update_progress(progress);

            if (progress.is_completed()) {
                finish_completed(execution, transfer, progress);
            } else if (progress.is_failed()) {
                finish_failed(execution, transfer, failure_from(progress));
            } else if (progress.is_cancelled()) {
                finish_cancelled(execution, transfer);
            }
        } catch (const std::exception& e) {
            if (!execution->finished) {
                finish_failed(execution, transfer, TransferFailure::from_exception(e));
            }
        }
    }

    // Stream closed without a terminal event
    void on_stream_done(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer) {
        if (transfer->progress() >= 1.0) {
            TransferProgress last = transfer->last_progress() ? *transfer->last_progress()
                                                              : TransferProgress::completed(-1);
            finish_completed(execution, transfer, last);
        } else if (transfer->cancellation_token().is_cancelled()) {
            finish_cancelled(execution, transfer);
        } else {
            std::optional<int64_t> bytes;
            if (transfer->last_progress()) bytes = transfer->last_progress()->bytes_transferred;
            finish_failed(execution, transfer, TransferFailure::unexpected_end(bytes));
        }
    }

    static TransferFailure failure_from(const TransferProgress& progress) {
        TransferFailure failure;
        failure.message = progress.error_message.value_or("Unknown error");
        failure.code = progress.error_code;
        failure.bytes_transferred = progress.bytes_transferred;
        if (progress.error_code) {
            if (auto code = error_code_from_name(*progress.error_code)) {
                failure.recoverable = is_recoverable(*code);
            }
        }
        if (auto it = progress.metadata.find("http_status"); it != progress.metadata.end()) {
            try {
                failure.http_status = std::stoi(it->second);
                if (failure.code == error_code_name(ErrorCode::ServerError)) {
                    failure.recoverable = *failure.http_status >= 500;
                }
            } catch (const std::logic_error&) {
                Logger::instance().debug("TransferQueue: Ignoring malformed http_status '{}'", it->second);
            }
        }
        return failure;
    }

    void end_execution(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer) {
        execution->finished = true;
        execution->subscription.cancel();
        auto it = executions_.find(transfer->id());
        if (it != executions_.end() && it->second == execution) executions_.erase(it);
    }

    void finish_completed(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer,
                          const TransferProgress& last) {
        end_execution(execution, transfer);
        remove_running(transfer->id());

        TransferSuccess success;
        if (auto it = last.metadata.find(kLocalPathKey); it != last.metadata.end()) {
            success.local_path = it->second;
        }
        if (last.total_bytes > 0) success.file_size = last.total_bytes;
        success.duration = transfer->elapsed();
        if (success.file_size && success.duration->count() > 0) {
            success.average_speed = static_cast<double>(*success.file_size) * 1000.0 /
                                    static_cast<double>(success.duration->count());
        }
        success.metadata = last.metadata;

        transfer->mark_completed(std::move(success));
        retry_counts_.erase(transfer->id());
        Logger::instance().debug("TransferQueue: Completed {}", transfer->id());

        process_queue();
        emit_state();
    }

    void finish_failed(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer,
                       TransferFailure failure) {
        end_execution(execution, transfer);
        remove_running(transfer->id());

        if (options_.auto_retry && (failure.recoverable || options_.retry_non_recoverable)) {
            int attempts = retry_count(transfer->id());
            if (attempts < options_.max_retries) {
                retry_counts_[transfer->id()] = attempts + 1;
                schedule_retry(transfer, attempts + 1);
                return;
            }
        }

        retry_counts_.erase(transfer->id());
        Logger::instance().warning("TransferQueue: Failed {} - {}", transfer->id(), failure.message);
        transfer->mark_failed(std::move(failure));

        process_queue();
        emit_state();
    }

    void finish_cancelled(const std::shared_ptr<Execution>& execution, const TransferPtr& transfer) {
        end_execution(execution, transfer);
        remove_running(transfer->id());
        transfer->mark_cancelled(transfer->cancellation_token().reason());
        Logger::instance().debug("TransferQueue: Cancelled {}", transfer->id());

        process_queue();
        emit_state();
    }

    // Silent requeue at the original priority, after the backoff delay when one applies
    void schedule_retry(const TransferPtr& transfer, int attempt) {
        transfer->reset_for_retry();
        auto delay = options_.retry_delay(attempt);
        Logger::instance().debug("TransferQueue: Retrying {} (attempt {}, delay {} ms)", transfer->id(), attempt,
                                 delay.count());

        if (delay.count() > 0 && defer_) {
            const std::string id = transfer->id();
            waiting_retry_.insert(id);
            transfer->set_queue_position(-1);

            std::weak_ptr<bool> alive = alive_;
            defer_(delay, [this, alive, id]() {
                if (alive.expired() || disposed_) return;
                if (waiting_retry_.erase(id) == 0) return;
                auto current = get(id);
                if (!current) return;
                insert_pending(current);
                update_queue_positions();
                process_queue();
                emit_state();
            });
        } else {
            insert_pending(transfer);
        }

        update_queue_positions();
        process_queue();
        emit_state();
    }

    void update_queue_positions() {
        int position = running_count();
        for (auto& transfer : pending_) {
            transfer->set_queue_position(position++);
        }
    }

    void emit_state() {
        if (!state_stream_.is_closed()) {
            state_stream_.add(state());
        }
    }

    Executor executor_;
    QueueOptions options_;
    DeferFunction defer_;
    int max_concurrent_;

    std::map<std::string, TransferPtr> transfers_;
    std::vector<TransferPtr> pending_;
    std::vector<TransferPtr> running_;
    std::set<std::string> waiting_retry_;
    std::map<std::string, int> retry_counts_;
    std::map<std::string, std::shared_ptr<Execution>> executions_;

    BroadcastStream<State> state_stream_;
    std::shared_ptr<bool> alive_;
    uint64_t next_id_ = 0;
    bool paused_ = false;
    bool disposed_ = false;
    bool processing_ = false;
};

} // namespace xferq

#endif // XFERQ_QUEUE_TRANSFER_QUEUE_MANAGER_H
