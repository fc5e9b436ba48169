#include "xferq/transfer/transfer_result.h"
#include <fmt/format.h>

namespace xferq {

TransferFailure TransferFailure::with_code(ErrorCode code, std::string message) {
    TransferFailure f;
    f.message = std::move(message);
    f.code = error_code_name(code);
    f.recoverable = is_recoverable(code);
    return f;
}

TransferFailure TransferFailure::network(std::string message) {
    return with_code(ErrorCode::NetworkError, std::move(message));
}

TransferFailure TransferFailure::timeout(std::optional<int64_t> bytes_transferred, std::string message) {
    auto f = with_code(ErrorCode::Timeout, std::move(message));
    f.bytes_transferred = bytes_transferred;
    return f;
}

TransferFailure TransferFailure::server(int status_code, std::optional<std::string> message) {
    auto f = with_code(ErrorCode::ServerError,
                       message ? *message : fmt::format("Server error: {}", status_code));
    f.http_status = status_code;
    f.recoverable = status_code >= 500;
    return f;
}

TransferFailure TransferFailure::file(std::string message) {
    return with_code(ErrorCode::FileError, std::move(message));
}

TransferFailure TransferFailure::insufficient_storage(std::optional<int64_t> required_bytes,
                                                      std::optional<int64_t> available_bytes) {
    auto f = with_code(ErrorCode::InsufficientStorage, "Insufficient storage space");
    if (required_bytes) f.details["required_bytes"] = std::to_string(*required_bytes);
    if (available_bytes) f.details["available_bytes"] = std::to_string(*available_bytes);
    return f;
}

TransferFailure TransferFailure::unauthorized(std::string message) {
    auto f = with_code(ErrorCode::Unauthorized, std::move(message));
    f.http_status = 401;
    return f;
}

TransferFailure TransferFailure::forbidden(std::string message) {
    auto f = with_code(ErrorCode::Forbidden, std::move(message));
    f.http_status = 403;
    return f;
}

TransferFailure TransferFailure::not_found(std::string message) {
    auto f = with_code(ErrorCode::NotFound, std::move(message));
    f.http_status = 404;
    return f;
}

TransferFailure TransferFailure::unexpected_end(std::optional<int64_t> bytes_transferred) {
    auto f = with_code(ErrorCode::UnexpectedEnd, to_string(ErrorCode::UnexpectedEnd));
    f.bytes_transferred = bytes_transferred;
    // Streams that stop early are usually dropped connections
    f.recoverable = true;
    return f;
}

TransferFailure TransferFailure::from_exception(const std::exception& e) {
    TransferFailure f;
    if (auto* err = dynamic_cast<const XferqError*>(&e)) {
        f = with_code(err->code(), e.what());
    } else {
        f.message = e.what();
    }
    f.exception = e.what();
    return f;
}

std::optional<ErrorCode> TransferFailure::error_code() const {
    if (!code) return std::nullopt;
    return error_code_from_name(*code);
}

std::string to_string(const TransferResult& result) {
    if (auto* s = std::get_if<TransferSuccess>(&result)) {
        return fmt::format("TransferSuccess(local_path: {}, file_size: {})", s->local_path,
                           s->file_size ? std::to_string(*s->file_size) : "null");
    }
    if (auto* f = std::get_if<TransferFailure>(&result)) {
        return fmt::format("TransferFailure(message: {}, code: {}, recoverable: {})", f->message,
                           f->code.value_or("null"), f->recoverable);
    }
    const auto& c = std::get<TransferCancelled>(result);
    return fmt::format("TransferCancelled(reason: {})", c.reason.value_or("null"));
}

} // namespace xferq
