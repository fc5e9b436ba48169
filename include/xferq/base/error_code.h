#ifndef XFERQ_BASE_ERROR_CODE_H
#define XFERQ_BASE_ERROR_CODE_H

#include <optional>
#include <string>
#include <system_error>

namespace xferq {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    AlreadyExists = 1003,
    Disposed = 1004,
    Cancelled = 1005,
    InternalError = 1006,

    // Transfer errors (2000-2999)
    NetworkError = 2001,
    Timeout = 2002,
    ServerError = 2003,
    FileError = 2004,
    InsufficientStorage = 2005,
    Unauthorized = 2006,
    Forbidden = 2007,
    UnexpectedEnd = 2008,
    TransferFailed = 2009,

    // Controller and storage errors (3000-3999)
    TransportRejected = 3001,
    RecordStoreError = 3002,

    // Configuration errors (4000-4999)
    ConfigError = 4001
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Stable identifier suitable for UIs and persisted records, e.g. "NETWORK_ERROR"
std::string error_code_name(ErrorCode code);
std::optional<ErrorCode> error_code_from_name(const std::string& name);

// Whether a failure with this code is worth retrying automatically
bool is_recoverable(ErrorCode code);

class XferqError : public std::exception {
public:
    XferqError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

// Raised by CancellationToken::throw_if_cancelled()
class CancellationError : public std::exception {
public:
    explicit CancellationError(std::optional<std::string> reason = std::nullopt);

    const std::optional<std::string>& reason() const { return reason_; }
    const char* what() const noexcept override;

private:
    std::optional<std::string> reason_;
    std::string message_;
};

} // namespace xferq

namespace std {
template <>
struct is_error_code_enum<xferq::ErrorCode> : true_type {};
} // namespace std

#endif // XFERQ_BASE_ERROR_CODE_H
