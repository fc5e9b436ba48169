#include "xferq/queue/queued_transfer.h"

namespace xferq {

std::string to_string(TransferPriority priority) {
    switch (priority) {
        case TransferPriority::low: return "low";
        case TransferPriority::normal: return "normal";
        case TransferPriority::high: return "high";
        case TransferPriority::urgent: return "urgent";
    }
    return "unknown";
}

std::string to_string(QueuedTransferStatus status) {
    switch (status) {
        case QueuedTransferStatus::queued: return "queued";
        case QueuedTransferStatus::running: return "running";
        case QueuedTransferStatus::completed: return "completed";
        case QueuedTransferStatus::failed: return "failed";
        case QueuedTransferStatus::cancelled: return "cancelled";
        case QueuedTransferStatus::paused: return "paused";
    }
    return "unknown";
}

} // namespace xferq
