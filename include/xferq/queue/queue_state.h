#ifndef XFERQ_QUEUE_QUEUE_STATE_H
#define XFERQ_QUEUE_QUEUE_STATE_H

#include "xferq/queue/queued_transfer.h"
#include <fmt/format.h>
#include <string>
#include <vector>

namespace xferq {

// Snapshot of a queue taken right after a mutation
template <typename T>
struct TransferQueueState {
    int running_count = 0;
    int pending_count = 0;
    int max_concurrent = 0;
    bool is_paused = false;
    std::vector<typename QueuedTransfer<T>::Ptr> running_transfers;
    std::vector<typename QueuedTransfer<T>::Ptr> pending_transfers;
    double running_progress_sum = 0.0;  // captured when the snapshot was taken

    int total_count() const { return running_count + pending_count; }
    bool is_empty() const { return total_count() == 0; }
    bool is_full() const { return running_count >= max_concurrent; }
    int available_slots() const { return max_concurrent - running_count; }

    // Pending transfers count as zero progress
    double overall_progress() const {
        if (total_count() == 0) return 0.0;
        return running_progress_sum / total_count();
    }

    std::string to_string() const {
        return fmt::format("TransferQueueState(running: {}/{}, pending: {}, paused: {})", running_count,
                           max_concurrent, pending_count, is_paused);
    }
};

} // namespace xferq

#endif // XFERQ_QUEUE_QUEUE_STATE_H
