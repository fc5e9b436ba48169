#ifndef XFERQ_TRANSFER_TRANSFER_RESULT_H
#define XFERQ_TRANSFER_TRANSFER_RESULT_H

#include "xferq/base/error_code.h"
#include "xferq/transfer/transfer_progress.h"
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <variant>

namespace xferq {

struct TransferSuccess {
    std::string local_path;
    std::optional<std::string> remote_url;
    std::optional<int64_t> file_size;
    std::optional<std::string> mime_type;
    std::optional<std::chrono::milliseconds> duration;
    std::optional<double> average_speed;
    std::optional<std::string> server_response;
    Metadata metadata;
};

struct TransferFailure {
    std::string message;
    std::optional<std::string> code;       // stable name, see error_code_name()
    std::optional<std::string> exception;  // what() of the originating exception
    bool recoverable = true;
    std::optional<int> http_status;
    std::optional<int64_t> bytes_transferred;
    Metadata details;

    static TransferFailure network(std::string message = "Network error occurred");
    static TransferFailure timeout(std::optional<int64_t> bytes_transferred = std::nullopt,
                                   std::string message = "Transfer timed out");
    static TransferFailure server(int status_code, std::optional<std::string> message = std::nullopt);
    static TransferFailure file(std::string message);
    static TransferFailure insufficient_storage(std::optional<int64_t> required_bytes = std::nullopt,
                                                std::optional<int64_t> available_bytes = std::nullopt);
    static TransferFailure unauthorized(std::string message = "Authentication required");
    static TransferFailure forbidden(std::string message = "Access denied");
    static TransferFailure not_found(std::string message = "Resource not found");
    static TransferFailure unexpected_end(std::optional<int64_t> bytes_transferred = std::nullopt);
    static TransferFailure from_exception(const std::exception& e);
    static TransferFailure with_code(ErrorCode code, std::string message);

    // Parsed code, when it names a known ErrorCode
    std::optional<ErrorCode> error_code() const;
};

struct TransferCancelled {
    std::optional<std::string> reason;
    std::optional<int64_t> bytes_transferred;
};

// Terminal outcome of one transfer
using TransferResult = std::variant<TransferSuccess, TransferFailure, TransferCancelled>;

inline bool is_success(const TransferResult& r) { return std::holds_alternative<TransferSuccess>(r); }
inline bool is_failure(const TransferResult& r) { return std::holds_alternative<TransferFailure>(r); }
inline bool is_cancelled(const TransferResult& r) { return std::holds_alternative<TransferCancelled>(r); }

std::string to_string(const TransferResult& result);

} // namespace xferq

#endif // XFERQ_TRANSFER_TRANSFER_RESULT_H
