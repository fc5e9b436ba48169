#include "xferq/transfer/transfer_task.h"
#include <elio/hash/sha256.hpp>
#include <filesystem>

namespace xferq {

namespace {

// Extension of the URL path, ignoring query and fragment
std::string url_extension(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    auto slash = path.find_last_of('/');
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    return path.substr(dot);
}

} // anonymous namespace

std::string sha256_hex(const std::string& text) {
    auto digest = elio::hash::sha256(text.data(), text.size());
    return elio::hash::sha256_hex(digest);
}

std::string hash_name(const std::string& url) {
    return sha256_hex(url) + url_extension(url);
}

TransferTask TransferTask::download(const std::string& url, const std::string& directory,
                                    const std::string& filename) {
    TransferTask task;
    task.kind = TransferKind::download;
    task.url = url;
    task.directory = directory;
    task.filename = filename.empty() ? hash_name(url) : filename;
    task.task_id = sha256_hex(url).substr(0, 16);
    return task;
}

TransferTask TransferTask::upload(const std::string& url, const std::string& file_path,
                                  const std::string& filename) {
    TransferTask task;
    task.kind = TransferKind::upload;
    task.url = url;
    task.file_path = file_path;
    task.http_method = "POST";
    task.filename = filename.empty() ? std::filesystem::path(file_path).filename().string() : filename;
    // Same file may be sent to the same endpoint twice, so the id includes the file
    task.task_id = sha256_hex(url + "\n" + file_path).substr(0, 16);
    return task;
}

std::string TransferTask::local_path() const {
    if (!is_download()) return file_path;
    if (directory.empty()) return filename;
    return (std::filesystem::path(directory) / filename).string();
}

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::enqueued: return "enqueued";
        case TaskStatus::running: return "running";
        case TaskStatus::paused: return "paused";
        case TaskStatus::complete: return "complete";
        case TaskStatus::failed: return "failed";
        case TaskStatus::canceled: return "canceled";
        case TaskStatus::waiting_to_retry: return "waiting_to_retry";
        case TaskStatus::not_found: return "not_found";
    }
    return "unknown";
}

std::optional<TaskStatus> task_status_from_string(const std::string& name) {
    for (auto status : {TaskStatus::enqueued, TaskStatus::running, TaskStatus::paused, TaskStatus::complete,
                        TaskStatus::failed, TaskStatus::canceled, TaskStatus::waiting_to_retry,
                        TaskStatus::not_found}) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

TransferStatus to_transfer_status(TaskStatus status) {
    switch (status) {
        case TaskStatus::enqueued: return TransferStatus::pending;
        case TaskStatus::running: return TransferStatus::running;
        case TaskStatus::paused: return TransferStatus::paused;
        case TaskStatus::complete: return TransferStatus::completed;
        case TaskStatus::failed: return TransferStatus::failed;
        case TaskStatus::canceled: return TransferStatus::cancelled;
        case TaskStatus::waiting_to_retry: return TransferStatus::waiting_to_retry;
        case TaskStatus::not_found: return TransferStatus::failed;
    }
    return TransferStatus::failed;
}

TransferProgress TransferItem::to_progress() const {
    TransferProgress p;
    p.bytes_transferred = transferred_bytes;
    p.total_bytes = expected_file_size;
    p.bytes_per_second = network_speed;
    p.eta = time_remaining;
    p.status = to_transfer_status(status);
    p.timestamp = updated_at;
    if (exception) {
        p.error_message = exception->description;
        p.error_code = exception->code;
        if (exception->http_status) p.metadata["http_status"] = std::to_string(*exception->http_status);
    }
    if (status == TaskStatus::not_found && !p.error_code) {
        p.error_code = "NOT_FOUND";
    }
    p.metadata[kLocalPathKey] = task.local_path();
    return p;
}

} // namespace xferq
