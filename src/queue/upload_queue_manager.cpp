#include "xferq/queue/upload_queue_manager.h"
#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"

namespace xferq {

UploadQueueManager::TransferPtr UploadQueueManager::add_file(const std::string& url, const std::string& file_path,
                                                             std::map<std::string, std::string> fields,
                                                             std::map<std::string, std::string> headers,
                                                             TransferPriority priority) {
    if (url.empty() || file_path.empty()) {
        throw XferqError(ErrorCode::InvalidArgument, "upload needs both a url and a file");
    }
    auto task = TransferTask::upload(url, file_path);
    task.fields = std::move(fields);
    task.headers = std::move(headers);
    return add_task(std::move(task), priority);
}

UploadQueueManager::TransferPtr UploadQueueManager::add_task(TransferTask task, TransferPriority priority,
                                                             Metadata metadata) {
    if (task.is_download()) {
        throw XferqError(ErrorCode::InvalidArgument, "not an upload task: " + task.task_id);
    }
    metadata["url"] = task.url;
    const std::string id = task.task_id;
    Logger::instance().debug("UploadQueue: Adding {} ({} -> {})", id, task.file_path, task.url);
    return enqueue(std::move(task), id, priority, std::move(metadata));
}

} // namespace xferq
