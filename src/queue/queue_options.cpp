#include "xferq/queue/queue_options.h"
#include <algorithm>
#include <cmath>

namespace xferq {

std::chrono::milliseconds QueueOptions::retry_delay(int attempt) const {
    if (retry_base_delay.count() <= 0 || attempt <= 0) {
        return std::chrono::milliseconds(0);
    }

    double multiplier = std::pow(std::max(backoff_multiplier, 1.0), attempt - 1);
    double delay = static_cast<double>(retry_base_delay.count()) * multiplier;
    // A non-positive cap leaves the delay bounded only by the duration type
    if (retry_max_delay.count() > 0) {
        if (delay >= static_cast<double>(retry_max_delay.count())) return retry_max_delay;
    } else if (!(delay < static_cast<double>(std::chrono::milliseconds::max().count()))) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

QueueOptions QueueOptions::from_config(const QueueConfig& config) {
    QueueOptions options;
    options.max_concurrent = config.max_concurrent;
    options.auto_start = config.auto_start;
    options.auto_retry = config.auto_retry;
    options.max_retries = config.max_retries;
    options.retry_base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    options.backoff_multiplier = config.backoff_multiplier;
    options.retry_max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
    options.retry_non_recoverable = config.retry_non_recoverable;
    return options;
}

} // namespace xferq
