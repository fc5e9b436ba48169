#ifndef XFERQ_BASE_STREAM_H
#define XFERQ_BASE_STREAM_H

#include "xferq/base/error_code.h"
#include "xferq/base/logger.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xferq {

// Handle returned by listen(). Dropping it leaves the listener attached;
// call cancel() to detach.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void cancel() {
        if (auto fn = std::exchange(cancel_, nullptr)) fn();
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// Multi-listener event channel. Copies share the same channel.
// Events are delivered in the order they were added, one at a time: an add()
// made from inside a listener is queued until the current event has reached
// every listener.
template <typename T>
class BroadcastStream {
public:
    using DataHandler = std::function<void(const T&)>;
    using DoneHandler = std::function<void()>;

    BroadcastStream() : state_(std::make_shared<State>()) {}

    Subscription listen(DataHandler on_data, DoneHandler on_done = nullptr) {
        if (state_->closed) {
            if (on_done) on_done();
            return Subscription{};
        }

        auto listener = std::make_shared<Listener>();
        listener->id = state_->next_id++;
        listener->on_data = std::move(on_data);
        listener->on_done = std::move(on_done);
        state_->listeners.push_back(listener);

        std::weak_ptr<State> weak = state_;
        uint64_t id = listener->id;
        return Subscription([weak, id]() {
            auto state = weak.lock();
            if (!state) return;
            for (auto it = state->listeners.begin(); it != state->listeners.end(); ++it) {
                if ((*it)->id == id) {
                    (*it)->active = false;
                    state->listeners.erase(it);
                    break;
                }
            }
        });
    }

    // No-op once closed
    void add(const T& value) {
        if (state_->closed) return;
        state_->queue.push_back(Event{value});
        drain();
    }

    // Idempotent
    void close() {
        if (state_->closed) return;
        state_->closed = true;
        state_->queue.push_back(Event{std::nullopt});
        drain();
    }

    bool is_closed() const { return state_->closed; }
    size_t listener_count() const { return state_->listeners.size(); }

private:
    struct Listener {
        uint64_t id = 0;
        DataHandler on_data;
        DoneHandler on_done;
        bool active = true;
    };

    struct Event {
        std::optional<T> value;  // nullopt marks close
    };

    struct State {
        std::vector<std::shared_ptr<Listener>> listeners;
        std::deque<Event> queue;
        uint64_t next_id = 1;
        bool closed = false;
        bool dispatching = false;
    };

    void drain() {
        auto state = state_;
        if (state->dispatching) return;
        state->dispatching = true;

        while (!state->queue.empty()) {
            Event event = std::move(state->queue.front());
            state->queue.pop_front();

            auto snapshot = state->listeners;
            for (auto& listener : snapshot) {
                if (!listener->active) continue;
                try {
                    if (event.value) {
                        if (listener->on_data) listener->on_data(*event.value);
                    } else if (listener->on_done) {
                        listener->on_done();
                    }
                } catch (const std::exception& e) {
                    Logger::instance().warning("Stream listener threw: {}", e.what());
                }
            }
            if (!event.value) state->listeners.clear();
        }

        state->dispatching = false;
    }

    std::shared_ptr<State> state_;
};

// Single-listener event channel that buffers everything until listened to.
// Carries data events, at most one error and a close marker.
template <typename T>
class UnicastStream {
public:
    using DataHandler = std::function<void(const T&)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using DoneHandler = std::function<void()>;

    UnicastStream() : state_(std::make_shared<State>()) {}

    // Throws XferqError(AlreadyExists) on a second listener
    Subscription listen(DataHandler on_data, ErrorHandler on_error, DoneHandler on_done) {
        if (state_->listened) {
            throw XferqError(ErrorCode::AlreadyExists, "stream already has a listener");
        }
        state_->listened = true;
        state_->active = true;
        state_->on_data = std::move(on_data);
        state_->on_error = std::move(on_error);
        state_->on_done = std::move(on_done);

        std::weak_ptr<State> weak = state_;
        Subscription sub([weak]() {
            auto state = weak.lock();
            if (!state) return;
            state->active = false;
            state->queue.clear();
        });
        drain();
        return sub;
    }

    void add(const T& value) { push(Event{Event::Data, value, {}}); }

    void add_error(const std::string& message) { push(Event{Event::Error, std::nullopt, message}); }

    // Idempotent
    void close() {
        if (state_->closed) return;
        push(Event{Event::Done, std::nullopt, {}});
        state_->closed = true;
    }

    bool is_closed() const { return state_->closed; }
    bool has_listener() const { return state_->listened; }

private:
    struct Event {
        enum Kind { Data, Error, Done } kind;
        std::optional<T> value;
        std::string error;
    };

    struct State {
        std::deque<Event> queue;
        DataHandler on_data;
        ErrorHandler on_error;
        DoneHandler on_done;
        bool listened = false;
        bool active = false;
        bool closed = false;
        bool dispatching = false;
    };

    void push(Event event) {
        if (state_->closed) return;
        if (state_->listened && !state_->active) return;
        state_->queue.push_back(std::move(event));
        drain();
    }

    void drain() {
        auto state = state_;
        if (!state->active || state->dispatching) return;
        state->dispatching = true;

        struct Reset {
            State& s;
            ~Reset() { s.dispatching = false; }
        } reset{*state};

        while (state->active && !state->queue.empty()) {
            Event event = std::move(state->queue.front());
            state->queue.pop_front();
            switch (event.kind) {
                case Event::Data:
                    if (state->on_data) state->on_data(*event.value);
                    break;
                case Event::Error:
                    if (state->on_error) state->on_error(event.error);
                    break;
                case Event::Done:
                    state->active = false;
                    if (state->on_done) state->on_done();
                    break;
            }
        }
    }

    std::shared_ptr<State> state_;
};

} // namespace xferq

#endif // XFERQ_BASE_STREAM_H
