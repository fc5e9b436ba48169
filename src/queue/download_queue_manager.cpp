#include "xferq/queue/download_queue_manager.h"
#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"

namespace xferq {

DownloadQueueManager::DownloadQueueManager(std::shared_ptr<TransferController> controller, QueueOptions options,
                                           DeferFunction defer, TransferDefaults defaults)
    : TransportQueueManager(std::move(controller), std::move(options), std::move(defer)),
      defaults_(std::move(defaults)) {}

DownloadQueueManager::TransferPtr DownloadQueueManager::add_url(const std::string& url, TransferPriority priority,
                                                                const std::string& filename,
                                                                std::map<std::string, std::string> headers,
                                                                Metadata metadata) {
    if (url.empty()) {
        throw XferqError(ErrorCode::InvalidArgument, "url must not be empty");
    }
    auto task = TransferTask::download(url, controller().config().download_directory, filename);
    task.headers = std::move(headers);
    return add_task(std::move(task), priority, std::move(metadata));
}

std::vector<DownloadQueueManager::TransferPtr> DownloadQueueManager::add_urls(const std::vector<std::string>& urls,
                                                                              TransferPriority priority) {
    std::vector<TransferPtr> added;
    added.reserve(urls.size());
    for (const auto& url : urls) {
        added.push_back(add_url(url, priority));
    }
    return added;
}

DownloadQueueManager::TransferPtr DownloadQueueManager::add_task(TransferTask task, TransferPriority priority,
                                                                 Metadata metadata) {
    if (!task.is_download()) {
        throw XferqError(ErrorCode::InvalidArgument, "not a download task: " + task.task_id);
    }
    if (task.directory.empty()) {
        task.directory = controller().config().download_directory;
    }
    task.allow_pause = task.allow_pause && defaults_.allow_resume;
    task.run_in_background = task.run_in_background || defaults_.run_in_background;

    metadata["task_id"] = task.task_id;
    const std::string id = task.url;
    Logger::instance().debug("DownloadQueue: Adding {} -> {}", id, task.local_path());
    return enqueue(std::move(task), id, priority, std::move(metadata));
}

std::vector<DownloadQueueManager::TransferPtr> DownloadQueueManager::add_tasks(std::vector<TransferTask> tasks,
                                                                               TransferPriority priority) {
    std::vector<TransferPtr> added;
    added.reserve(tasks.size());
    for (auto& task : tasks) {
        added.push_back(add_task(std::move(task), priority));
    }
    return added;
}

void DownloadQueueManager::pause_download(const std::string& url, TransferController::Completion done) {
    controller().pause(url, std::move(done));
}

void DownloadQueueManager::resume_download(const std::string& url, TransferController::Completion done) {
    controller().resume(url, std::move(done));
}

} // namespace xferq
