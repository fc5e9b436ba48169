#ifndef XFERQ_QUEUE_UPLOAD_QUEUE_MANAGER_H
#define XFERQ_QUEUE_UPLOAD_QUEUE_MANAGER_H

#include "xferq/queue/transport_queue_manager.h"
#include <map>
#include <string>

namespace xferq {

// Uploads keyed by task id, so one file can go to several endpoints
class UploadQueueManager : public TransportQueueManager {
public:
    using TransportQueueManager::TransportQueueManager;

    TransferPtr add_file(const std::string& url, const std::string& file_path,
                         std::map<std::string, std::string> fields = {},
                         std::map<std::string, std::string> headers = {},
                         TransferPriority priority = TransferPriority::normal);

    TransferPtr add_task(TransferTask task, TransferPriority priority = TransferPriority::normal,
                         Metadata metadata = {});
};

} // namespace xferq

#endif // XFERQ_QUEUE_UPLOAD_QUEUE_MANAGER_H
