#include "xferq/transport/simulated_transport.h"
#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"
#include <algorithm>

namespace xferq {

SimulatedTransport::SimulatedTransport(SimulationConfig config) : config_(std::move(config)) {
    if (config_.tick_ms == 0 || config_.bytes_per_tick == 0) {
        throw XferqError(ErrorCode::InvalidArgument, "simulation needs a non-zero tick and rate");
    }
}

void SimulatedTransport::set_update_listener(UpdateListener listener) {
    listener_ = std::move(listener);
}

void SimulatedTransport::set_size(const std::string& key, int64_t bytes) {
    sizes_[key] = bytes;
}

bool SimulatedTransport::idle() const {
    return jobs_.empty() && deferred_.empty();
}

void SimulatedTransport::defer(std::function<void()> action) {
    deferred_.push_back(std::move(action));
}

void SimulatedTransport::publish(const TransferItem& item) {
    if (!listener_) return;
    try {
        listener_(item);
    } catch (const std::exception& e) {
        Logger::instance().error("SimulatedTransport: update listener threw: {}", e.what());
    }
}

void SimulatedTransport::enqueue(const TransferTask& task, Completion done) {
    const std::string key = task.key();
    if (jobs_.count(key)) {
        Logger::instance().warning("SimulatedTransport: {} is already queued", key);
        defer([done]() { done(false); });
        return;
    }

    Job job;
    job.item.task = task;
    job.item.status = TaskStatus::enqueued;
    auto size = sizes_.find(key);
    job.item.expected_file_size = size != sizes_.end() ? size->second : static_cast<int64_t>(config_.default_size);
    if (!config_.failure_marker.empty() && task.url.find(config_.failure_marker) != std::string::npos) {
        job.fail_at = job.item.expected_file_size / 2;
    }
    jobs_[key] = job;

    TransferItem item = job.item;
    defer([this, done, item]() {
        done(true);
        publish(item);
    });
}

void SimulatedTransport::pause(const TransferTask& task, Completion done) {
    auto it = jobs_.find(task.key());
    if (it == jobs_.end() || it->second.item.is_paused()) {
        defer([done]() { done(false); });
        return;
    }
    it->second.item.status = TaskStatus::paused;
    it->second.item.network_speed = 0.0;
    TransferItem item = it->second.item;
    defer([this, done, item]() {
        done(true);
        publish(item);
    });
}

void SimulatedTransport::resume(const TransferTask& task, Completion done) {
    auto it = jobs_.find(task.key());
    if (it == jobs_.end() || !it->second.item.is_paused()) {
        defer([done]() { done(false); });
        return;
    }
    it->second.item.status = TaskStatus::running;
    TransferItem item = it->second.item;
    defer([this, done, item]() {
        done(true);
        publish(item);
    });
}

void SimulatedTransport::cancel(const TransferTask& task, Completion done) {
    auto it = jobs_.find(task.key());
    if (it == jobs_.end()) {
        defer([done]() { done(false); });
        return;
    }
    TransferItem item = it->second.item;
    item.status = TaskStatus::canceled;
    item.network_speed = 0.0;
    item.updated_at = std::chrono::system_clock::now();
    jobs_.erase(it);
    defer([this, done, item]() {
        done(true);
        publish(item);
    });
}

void SimulatedTransport::tick() {
    ++ticks_;

    // Listeners may call back into the transport; work on copies
    auto deferred = std::move(deferred_);
    deferred_.clear();
    for (auto& action : deferred) {
        action();
    }

    const auto rate = static_cast<int64_t>(config_.bytes_per_tick);
    const double speed = static_cast<double>(rate) * 1000.0 / config_.tick_ms;

    std::vector<TransferItem> updates;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        auto& job = it->second;
        auto& item = job.item;
        if (item.is_paused()) {
            ++it;
            continue;
        }

        item.status = TaskStatus::running;
        item.transferred_bytes = std::min(item.transferred_bytes + rate, item.expected_file_size);
        item.network_speed = speed;
        item.updated_at = std::chrono::system_clock::now();
        item.progress = item.expected_file_size > 0
                            ? static_cast<double>(item.transferred_bytes) / item.expected_file_size
                            : 1.0;
        auto remaining = item.expected_file_size - item.transferred_bytes;
        item.time_remaining = std::chrono::seconds(static_cast<int64_t>(remaining / speed));

        bool finished = false;
        if (job.fail_at >= 0 && item.transferred_bytes >= job.fail_at) {
            item.status = TaskStatus::failed;
            item.progress = std::min(item.progress, 0.99);
            item.exception = TransferException{"Simulated network failure", error_code_name(ErrorCode::NetworkError),
                                               std::nullopt};
            finished = true;
        } else if (item.transferred_bytes >= item.expected_file_size) {
            item.status = TaskStatus::complete;
            item.progress = 1.0;
            item.time_remaining = std::chrono::seconds(0);
            finished = true;
        }

        updates.push_back(item);
        it = finished ? jobs_.erase(it) : std::next(it);
    }

    for (const auto& item : updates) {
        publish(item);
    }
}

} // namespace xferq
