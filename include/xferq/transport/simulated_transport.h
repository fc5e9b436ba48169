#ifndef XFERQ_TRANSPORT_SIMULATED_TRANSPORT_H
#define XFERQ_TRANSPORT_SIMULATED_TRANSPORT_H

#include "xferq/base/config.h"
#include "xferq/control/transport.h"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace xferq {

// Transport that moves no bytes. Each tick() advances every running task by
// a fixed amount; operation completions are delivered on the following tick.
// URLs containing the configured failure marker fail half way through.
class SimulatedTransport : public Transport {
public:
    explicit SimulatedTransport(SimulationConfig config = {});

    void set_update_listener(UpdateListener listener) override;

    void enqueue(const TransferTask& task, Completion done) override;
    void pause(const TransferTask& task, Completion done) override;
    void resume(const TransferTask& task, Completion done) override;
    void cancel(const TransferTask& task, Completion done) override;

    void tick();

    // Size reported for the given key instead of the configured default
    void set_size(const std::string& key, int64_t bytes);

    // No task in flight and no completion waiting to be delivered
    bool idle() const;
    size_t active_count() const { return jobs_.size(); }
    uint64_t tick_count() const { return ticks_; }

private:
    struct Job {
        TransferItem item;
        int64_t fail_at = -1;
    };

    void defer(std::function<void()> action);
    void publish(const TransferItem& item);

    SimulationConfig config_;
    UpdateListener listener_;
    std::map<std::string, Job> jobs_;
    std::map<std::string, int64_t> sizes_;
    std::vector<std::function<void()>> deferred_;
    uint64_t ticks_ = 0;
};

} // namespace xferq

#endif // XFERQ_TRANSPORT_SIMULATED_TRANSPORT_H
