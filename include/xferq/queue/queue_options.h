#ifndef XFERQ_QUEUE_QUEUE_OPTIONS_H
#define XFERQ_QUEUE_QUEUE_OPTIONS_H

#include "xferq/base/config.h"
#include <chrono>
#include <functional>

namespace xferq {

struct QueueOptions {
    int max_concurrent = 3;
    bool auto_start = true;
    bool auto_retry = false;
    int max_retries = 3;

    // Exponential backoff between automatic retries; zero requeues at once
    std::chrono::milliseconds retry_base_delay{0};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds retry_max_delay{30000};

    // Retry failures whose code marks them non-recoverable as well
    bool retry_non_recoverable = false;

    // Delay before automatic retry number `attempt` (1-based)
    std::chrono::milliseconds retry_delay(int attempt) const;

    static QueueOptions from_config(const QueueConfig& config);
};

// Runs callback after delay on the thread that owns the queue
using DeferFunction = std::function<void(std::chrono::milliseconds, std::function<void()>)>;

} // namespace xferq

#endif // XFERQ_QUEUE_QUEUE_OPTIONS_H
