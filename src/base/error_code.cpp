#include "xferq/base/error_code.h"
#include <utility>

namespace xferq {

namespace {

class XferqCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "xferq";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const XferqCategory& get_category() {
    static XferqCategory category;
    return category;
}

constexpr std::pair<ErrorCode, const char*> kNames[] = {
    {ErrorCode::Success, "SUCCESS"},
    {ErrorCode::InvalidArgument, "INVALID_ARGUMENT"},
    {ErrorCode::NotFound, "NOT_FOUND"},
    {ErrorCode::AlreadyExists, "ALREADY_EXISTS"},
    {ErrorCode::Disposed, "DISPOSED"},
    {ErrorCode::Cancelled, "CANCELLED"},
    {ErrorCode::InternalError, "INTERNAL_ERROR"},
    {ErrorCode::NetworkError, "NETWORK_ERROR"},
    {ErrorCode::Timeout, "TIMEOUT"},
    {ErrorCode::ServerError, "SERVER_ERROR"},
    {ErrorCode::FileError, "FILE_ERROR"},
    {ErrorCode::InsufficientStorage, "INSUFFICIENT_STORAGE"},
    {ErrorCode::Unauthorized, "UNAUTHORIZED"},
    {ErrorCode::Forbidden, "FORBIDDEN"},
    {ErrorCode::UnexpectedEnd, "UNEXPECTED_END"},
    {ErrorCode::TransferFailed, "TRANSFER_FAILED"},
    {ErrorCode::TransportRejected, "TRANSPORT_REJECTED"},
    {ErrorCode::RecordStoreError, "RECORD_STORE_ERROR"},
    {ErrorCode::ConfigError, "CONFIG_ERROR"},
};

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Disposed: return "Used after dispose";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::FileError: return "File error";
        case ErrorCode::InsufficientStorage: return "Insufficient storage";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::UnexpectedEnd: return "Transfer ended unexpectedly";
        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::TransportRejected: return "Transport rejected the task";
        case ErrorCode::RecordStoreError: return "Record store error";
        case ErrorCode::ConfigError: return "Configuration error";
        default: return "Unknown error";
    }
}

std::string error_code_name(ErrorCode code) {
    for (const auto& [value, name] : kNames) {
        if (value == code) return name;
    }
    return "UNKNOWN";
}

std::optional<ErrorCode> error_code_from_name(const std::string& name) {
    for (const auto& [value, text] : kNames) {
        if (name == text) return value;
    }
    return std::nullopt;
}

bool is_recoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return true;
        default:
            return false;
    }
}

XferqError::XferqError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* XferqError::what() const noexcept {
    return message_.c_str();
}

CancellationError::CancellationError(std::optional<std::string> reason)
    : reason_(std::move(reason)),
      message_(reason_ ? "Operation cancelled: " + *reason_ : "Operation cancelled") {}

const char* CancellationError::what() const noexcept {
    return message_.c_str();
}

} // namespace xferq
