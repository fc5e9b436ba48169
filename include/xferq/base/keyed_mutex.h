#ifndef XFERQ_BASE_KEYED_MUTEX_H
#define XFERQ_BASE_KEYED_MUTEX_H

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace xferq {

// Per-key mutual exclusion for single-threaded cooperative code.
// Waiters are continuations resumed in FIFO order when the holder releases.
// Distinct keys never contend.
class KeyedMutex {
    struct State;

public:
    // Ownership of one key. Copies share ownership; the key is released when
    // the last copy goes away or unlock() is called.
    class Lock {
    public:
        Lock() = default;

        const std::string& key() const;
        bool owns() const;
        void unlock();

    private:
        friend class KeyedMutex;
        struct Holder;
        explicit Lock(std::shared_ptr<Holder> holder) : holder_(std::move(holder)) {}

        std::shared_ptr<Holder> holder_;
    };

    using Continuation = std::function<void(Lock)>;

    KeyedMutex();
    ~KeyedMutex();

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    // Runs on_acquired right away when key is free, otherwise queues it
    void acquire(const std::string& key, Continuation on_acquired);

    // Hands the key to the next waiter, or frees it when nobody waits
    void release(const std::string& key);

    // Runs action while holding key and releases afterwards, also when action
    // throws. An immediate action's exception reaches the caller; a queued
    // action's exception is logged.
    void synchronized(const std::string& key, std::function<void()> action);

    bool is_locked(const std::string& key) const;
    size_t pending_count(const std::string& key) const;
    size_t locked_count() const;

    // Forgets every holder and waiter; waiters are never resumed
    void clear();

private:
    static void hand_over(const std::shared_ptr<State>& state, const std::string& key);
    static Lock make_lock(const std::shared_ptr<State>& state, const std::string& key, uint64_t generation);

    std::shared_ptr<State> state_;
};

} // namespace xferq

#endif // XFERQ_BASE_KEYED_MUTEX_H
