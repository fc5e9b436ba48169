#ifndef XFERQ_BASE_CANCELLATION_TOKEN_H
#define XFERQ_BASE_CANCELLATION_TOKEN_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace xferq {

// Cooperative cancellation: a one-way flag plus callbacks fired on cancel.
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using Unregister = std::function<void()>;

    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Idempotent; only the first reason is kept
    void cancel(std::optional<std::string> reason = std::nullopt);

    bool is_cancelled() const noexcept { return state_->cancelled.load(std::memory_order_acquire); }
    std::optional<std::string> reason() const;

    // Runs callback once on cancellation, or immediately when already cancelled.
    // The returned function removes the registration.
    Unregister on_cancel(Callback callback);

    // Throws CancellationError carrying the reason
    void throw_if_cancelled() const;

    // Child token cancelled whenever this one is; cancelling the child does
    // not affect the parent.
    std::shared_ptr<CancellationToken> create_linked();

    // Drops registered callbacks without invoking them
    void dispose();
    bool is_disposed() const;

    size_t callback_count() const;

private:
    struct State {
        mutable std::mutex mutex;
        std::atomic<bool> cancelled{false};
        bool disposed = false;
        std::optional<std::string> reason;
        std::map<uint64_t, Callback> callbacks;
        uint64_t next_id = 1;
    };

    std::shared_ptr<State> state_;
};

} // namespace xferq

#endif // XFERQ_BASE_CANCELLATION_TOKEN_H
