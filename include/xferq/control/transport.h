#ifndef XFERQ_CONTROL_TRANSPORT_H
#define XFERQ_CONTROL_TRANSPORT_H

#include "xferq/transfer/transfer_task.h"
#include <functional>

namespace xferq {

// The engine that moves bytes. Every operation completes asynchronously
// through its callback; status changes arrive through the update listener.
class Transport {
public:
    using UpdateListener = std::function<void(const TransferItem&)>;
    using Completion = std::function<void(bool)>;

    virtual ~Transport() = default;

    virtual void set_update_listener(UpdateListener listener) = 0;

    virtual void enqueue(const TransferTask& task, Completion done) = 0;
    virtual void pause(const TransferTask& task, Completion done) = 0;
    virtual void resume(const TransferTask& task, Completion done) = 0;
    virtual void cancel(const TransferTask& task, Completion done) = 0;
};

} // namespace xferq

#endif // XFERQ_CONTROL_TRANSPORT_H
