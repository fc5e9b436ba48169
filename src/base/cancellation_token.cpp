#include "xferq/base/cancellation_token.h"
#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"
#include <vector>

namespace xferq {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::~CancellationToken() {
    dispose();
}

void CancellationToken::cancel(std::optional<std::string> reason) {
    std::map<uint64_t, Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load(std::memory_order_relaxed)) return;
        state_->reason = std::move(reason);
        state_->cancelled.store(true, std::memory_order_release);
        callbacks.swap(state_->callbacks);
    }

    // Callbacks run outside the lock so they may touch the token again
    for (auto& [id, callback] : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            Logger::instance().warning("Cancellation callback {} threw: {}", id, e.what());
        }
    }
}

std::optional<std::string> CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

CancellationToken::Unregister CancellationToken::on_cancel(Callback callback) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_relaxed)) {
            if (state_->disposed) return [] {};
            id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
        }
    }

    if (id == 0) {
        callback();
        return [] {};
    }

    std::weak_ptr<State> weak = state_;
    return [weak, id]() {
        if (auto state = weak.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->callbacks.erase(id);
        }
    };
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancellationError(reason());
    }
}

std::shared_ptr<CancellationToken> CancellationToken::create_linked() {
    auto child = std::make_shared<CancellationToken>();
    std::weak_ptr<CancellationToken> weak_child = child;
    std::weak_ptr<State> weak_parent = state_;
    on_cancel([weak_child, weak_parent]() {
        auto token = weak_child.lock();
        if (!token) return;
        std::optional<std::string> reason;
        if (auto parent = weak_parent.lock()) {
            std::lock_guard<std::mutex> lock(parent->mutex);
            reason = parent->reason;
        }
        token->cancel(reason);
    });
    return child;
}

void CancellationToken::dispose() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->disposed = true;
    state_->callbacks.clear();
}

bool CancellationToken::is_disposed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->disposed;
}

size_t CancellationToken::callback_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->callbacks.size();
}

} // namespace xferq
