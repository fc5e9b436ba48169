#include "xferq/transfer/transfer_progress.h"
#include <algorithm>
#include <fmt/format.h>

namespace xferq {

namespace {

constexpr double kKiB = 1024.0;
constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

} // anonymous namespace

std::string to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::pending: return "pending";
        case TransferStatus::running: return "running";
        case TransferStatus::paused: return "paused";
        case TransferStatus::completed: return "completed";
        case TransferStatus::failed: return "failed";
        case TransferStatus::cancelled: return "cancelled";
        case TransferStatus::waiting_to_retry: return "waiting_to_retry";
    }
    return "unknown";
}

TransferProgress TransferProgress::initial(int64_t total_bytes, Metadata metadata) {
    TransferProgress p;
    p.total_bytes = total_bytes;
    p.status = TransferStatus::pending;
    p.metadata = std::move(metadata);
    return p;
}

TransferProgress TransferProgress::completed(int64_t total_bytes, Metadata metadata) {
    TransferProgress p;
    p.bytes_transferred = total_bytes;
    p.total_bytes = total_bytes;
    p.status = TransferStatus::completed;
    p.metadata = std::move(metadata);
    return p;
}

TransferProgress TransferProgress::failed(std::string message, std::optional<std::string> code,
                                          int64_t bytes_transferred, int64_t total_bytes) {
    TransferProgress p;
    p.bytes_transferred = bytes_transferred;
    p.total_bytes = total_bytes;
    p.status = TransferStatus::failed;
    p.error_message = std::move(message);
    p.error_code = std::move(code);
    return p;
}

TransferProgress TransferProgress::paused(int64_t bytes_transferred, int64_t total_bytes) {
    TransferProgress p;
    p.bytes_transferred = bytes_transferred;
    p.total_bytes = total_bytes;
    p.status = TransferStatus::paused;
    return p;
}

TransferProgress TransferProgress::cancelled(int64_t bytes_transferred, int64_t total_bytes) {
    TransferProgress p;
    p.bytes_transferred = bytes_transferred;
    p.total_bytes = total_bytes;
    p.status = TransferStatus::cancelled;
    return p;
}

double TransferProgress::progress() const {
    if (total_bytes <= 0) return 0.0;
    return std::clamp(static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes), 0.0, 1.0);
}

std::string TransferProgress::progress_text() const {
    return fmt::format("{:.1f}%", progress_percent());
}

std::string TransferProgress::bytes_transferred_text() const {
    return format_bytes(bytes_transferred);
}

std::string TransferProgress::total_bytes_text() const {
    return has_total_bytes() ? format_bytes(total_bytes) : "--";
}

std::string TransferProgress::speed_text() const {
    return format_speed(bytes_per_second);
}

std::string TransferProgress::eta_text() const {
    return format_duration(eta);
}

TransferProgress TransferProgress::with_status(TransferStatus new_status) const {
    TransferProgress copy = *this;
    copy.status = new_status;
    copy.timestamp = std::chrono::system_clock::now();
    return copy;
}

std::string TransferProgress::to_string() const {
    return fmt::format("TransferProgress(status: {}, progress: {}, bytes: {} / {}, speed: {})",
                       xferq::to_string(status), progress_text(), bytes_transferred_text(),
                       total_bytes_text(), speed_text());
}

std::string format_bytes(int64_t bytes) {
    if (bytes <= 0) return "0 B";
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double value = static_cast<double>(bytes);
    if (value < kMiB) return fmt::format("{:.1f} KB", value / kKiB);
    if (value < kGiB) return fmt::format("{:.1f} MB", value / kMiB);
    return fmt::format("{:.1f} GB", value / kGiB);
}

std::string format_speed(double bytes_per_second) {
    if (bytes_per_second <= 0) return "--";
    if (bytes_per_second < kKiB) return fmt::format("{:.0f} B/s", bytes_per_second);
    if (bytes_per_second < kMiB) return fmt::format("{:.1f} KB/s", bytes_per_second / kKiB);
    return fmt::format("{:.1f} MB/s", bytes_per_second / kMiB);
}

std::string format_duration(std::optional<std::chrono::seconds> duration) {
    if (!duration || duration->count() <= 0) return "--";

    auto total = duration->count();
    auto hours = total / 3600;
    auto minutes = (total / 60) % 60;
    auto seconds = total % 60;

    if (hours > 0) return fmt::format("{}h {}m", hours, minutes);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, seconds);
    return fmt::format("{}s", seconds);
}

} // namespace xferq
