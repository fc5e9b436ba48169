#ifndef XFERQ_QUEUE_DOWNLOAD_QUEUE_MANAGER_H
#define XFERQ_QUEUE_DOWNLOAD_QUEUE_MANAGER_H

#include "xferq/base/config.h"
#include "xferq/queue/transport_queue_manager.h"
#include <map>
#include <string>
#include <vector>

namespace xferq {

// Downloads keyed by URL. Files land in the controller's download directory
// unless the task names another one.
class DownloadQueueManager : public TransportQueueManager {
public:
    DownloadQueueManager(std::shared_ptr<TransferController> controller, QueueOptions options = {},
                         DeferFunction defer = nullptr, TransferDefaults defaults = {});

    TransferPtr add_url(const std::string& url, TransferPriority priority = TransferPriority::normal,
                        const std::string& filename = "", std::map<std::string, std::string> headers = {},
                        Metadata metadata = {});
    std::vector<TransferPtr> add_urls(const std::vector<std::string>& urls,
                                      TransferPriority priority = TransferPriority::normal);

    TransferPtr add_task(TransferTask task, TransferPriority priority = TransferPriority::normal,
                         Metadata metadata = {});
    std::vector<TransferPtr> add_tasks(std::vector<TransferTask> tasks,
                                       TransferPriority priority = TransferPriority::normal);

    // Pause and resume at the transport; the queue slot stays taken
    void pause_download(const std::string& url, TransferController::Completion done);
    void resume_download(const std::string& url, TransferController::Completion done);

    const TransferDefaults& defaults() const { return defaults_; }

private:
    TransferDefaults defaults_;
};

} // namespace xferq

#endif // XFERQ_QUEUE_DOWNLOAD_QUEUE_MANAGER_H
