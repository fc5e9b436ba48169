#ifndef XFERQ_TRANSFER_TRANSFER_PROGRESS_H
#define XFERQ_TRANSFER_TRANSFER_PROGRESS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace xferq {

using Metadata = std::map<std::string, std::string>;

enum class TransferStatus {
    pending,
    running,
    paused,
    completed,
    failed,
    cancelled,
    waiting_to_retry
};

std::string to_string(TransferStatus status);

// Metadata key under which executors report the local file of a finished transfer
inline constexpr const char* kLocalPathKey = "local_path";

// Point-in-time snapshot of one transfer
struct TransferProgress {
    int64_t bytes_transferred = 0;
    int64_t total_bytes = -1;  // -1 = unknown
    double bytes_per_second = 0.0;
    std::optional<std::chrono::seconds> eta;
    TransferStatus status = TransferStatus::running;
    std::optional<std::string> error_message;
    std::optional<std::string> error_code;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    Metadata metadata;

    static TransferProgress initial(int64_t total_bytes = -1, Metadata metadata = {});
    static TransferProgress completed(int64_t total_bytes, Metadata metadata = {});
    static TransferProgress failed(std::string message, std::optional<std::string> code = std::nullopt,
                                   int64_t bytes_transferred = 0, int64_t total_bytes = -1);
    static TransferProgress paused(int64_t bytes_transferred, int64_t total_bytes);
    static TransferProgress cancelled(int64_t bytes_transferred = 0, int64_t total_bytes = -1);

    // Fraction in [0, 1]; 0 while the total is unknown
    double progress() const;
    double progress_percent() const { return progress() * 100.0; }
    bool has_total_bytes() const { return total_bytes > 0; }

    bool is_pending() const { return status == TransferStatus::pending; }
    bool is_running() const { return status == TransferStatus::running; }
    bool is_paused() const { return status == TransferStatus::paused; }
    bool is_completed() const { return status == TransferStatus::completed; }
    bool is_failed() const { return status == TransferStatus::failed; }
    bool is_cancelled() const { return status == TransferStatus::cancelled; }
    bool is_terminal() const { return is_completed() || is_failed() || is_cancelled(); }

    std::string progress_text() const;
    std::string bytes_transferred_text() const;
    std::string total_bytes_text() const;
    std::string speed_text() const;
    std::string eta_text() const;

    TransferProgress with_status(TransferStatus new_status) const;

    std::string to_string() const;
};

std::string format_bytes(int64_t bytes);
std::string format_speed(double bytes_per_second);
std::string format_duration(std::optional<std::chrono::seconds> duration);

} // namespace xferq

#endif // XFERQ_TRANSFER_TRANSFER_PROGRESS_H
