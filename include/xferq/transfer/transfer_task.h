#ifndef XFERQ_TRANSFER_TRANSFER_TASK_H
#define XFERQ_TRANSFER_TRANSFER_TASK_H

#include "xferq/transfer/transfer_progress.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace xferq {

enum class TransferKind {
    download,
    upload
};

// Description of one transport-level operation
struct TransferTask {
    std::string task_id;
    TransferKind kind = TransferKind::download;
    std::string url;
    std::string filename;
    std::string directory;
    std::string file_path;  // upload source
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> fields;  // multipart form fields for uploads
    std::string http_method = "GET";
    std::string meta_data;
    bool allow_pause = true;
    int retries = 0;
    // Passed through to the transport untouched
    bool run_in_background = false;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    // Filename defaults to the hashed URL, keeping the URL's extension
    static TransferTask download(const std::string& url, const std::string& directory = "",
                                 const std::string& filename = "");
    static TransferTask upload(const std::string& url, const std::string& file_path,
                               const std::string& filename = "");

    bool is_download() const { return kind == TransferKind::download; }

    // Coalescing key: the URL for downloads, the task id for uploads
    const std::string& key() const { return is_download() ? url : task_id; }

    // Where a download lands, or the upload source
    std::string local_path() const;
};

// Status as reported by the transport
enum class TaskStatus {
    enqueued,
    running,
    paused,
    complete,
    failed,
    canceled,
    waiting_to_retry,
    not_found
};

std::string to_string(TaskStatus status);
std::optional<TaskStatus> task_status_from_string(const std::string& name);
TransferStatus to_transfer_status(TaskStatus status);

struct TransferException {
    std::string description;
    std::optional<std::string> code;
    std::optional<int> http_status;
};

// Latest transport view of a task
struct TransferItem {
    TransferTask task;
    TaskStatus status = TaskStatus::enqueued;
    int64_t expected_file_size = -1;
    int64_t transferred_bytes = 0;
    double progress = 0.0;
    double network_speed = 0.0;  // bytes per second
    std::optional<std::chrono::seconds> time_remaining;
    std::optional<TransferException> exception;
    std::chrono::system_clock::time_point updated_at = std::chrono::system_clock::now();

    const std::string& key() const { return task.key(); }
    bool is_complete() const { return status == TaskStatus::complete || progress >= 1.0; }
    bool is_running() const { return status == TaskStatus::running; }
    bool is_paused() const { return status == TaskStatus::paused; }
    bool is_failed() const { return status == TaskStatus::failed || status == TaskStatus::not_found; }
    bool is_canceled() const { return status == TaskStatus::canceled; }
    bool is_final() const { return is_complete() || is_failed() || is_canceled(); }

    TransferProgress to_progress() const;
};

// Hex SHA-256 of text
std::string sha256_hex(const std::string& text);

// "<sha256(url)><extension of the url path>"
std::string hash_name(const std::string& url);

} // namespace xferq

#endif // XFERQ_TRANSFER_TRANSFER_TASK_H
