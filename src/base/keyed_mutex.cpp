#include "xferq/base/keyed_mutex.h"
#include "xferq/base/logger.h"

namespace xferq {

struct KeyedMutex::State {
    struct Slot {
        uint64_t generation = 0;
        std::deque<Continuation> waiters;
    };

    std::map<std::string, Slot> slots;
    uint64_t next_generation = 1;
};

struct KeyedMutex::Lock::Holder {
    std::weak_ptr<State> state;
    std::string key;
    uint64_t generation = 0;
    bool released = false;

    ~Holder() { release_once(); }

    void release_once();
};

const std::string& KeyedMutex::Lock::key() const {
    static const std::string empty;
    return holder_ ? holder_->key : empty;
}

bool KeyedMutex::Lock::owns() const {
    if (!holder_ || holder_->released) return false;
    auto state = holder_->state.lock();
    if (!state) return false;
    auto it = state->slots.find(holder_->key);
    return it != state->slots.end() && it->second.generation == holder_->generation;
}

void KeyedMutex::Lock::unlock() {
    if (holder_) holder_->release_once();
}

void KeyedMutex::Lock::Holder::release_once() {
    if (released) return;
    released = true;

    auto locked = state.lock();
    if (!locked) return;
    auto it = locked->slots.find(key);
    // A forced release() or clear() may already have moved the slot on
    if (it == locked->slots.end() || it->second.generation != generation) return;
    hand_over(locked, key);
}

KeyedMutex::Lock KeyedMutex::make_lock(const std::shared_ptr<State>& state, const std::string& key,
                                       uint64_t generation) {
    auto holder = std::make_shared<Lock::Holder>();
    holder->state = state;
    holder->key = key;
    holder->generation = generation;
    return Lock(std::move(holder));
}

// Passes the slot to the next waiter or erases it. Only the current holder's
// release path may call this.
void KeyedMutex::hand_over(const std::shared_ptr<State>& state, const std::string& key) {
    auto it = state->slots.find(key);
    if (it == state->slots.end()) return;

    if (it->second.waiters.empty()) {
        state->slots.erase(it);
        return;
    }

    auto next = std::move(it->second.waiters.front());
    it->second.waiters.pop_front();
    it->second.generation = state->next_generation++;

    uint64_t generation = it->second.generation;

    try {
        next(make_lock(state, key, generation));
    } catch (const std::exception& e) {
        Logger::instance().error("Keyed mutex waiter for '{}' threw: {}", key, e.what());
    }
}

KeyedMutex::KeyedMutex() : state_(std::make_shared<State>()) {}

KeyedMutex::~KeyedMutex() = default;

void KeyedMutex::acquire(const std::string& key, Continuation on_acquired) {
    auto it = state_->slots.find(key);
    if (it != state_->slots.end()) {
        it->second.waiters.push_back(std::move(on_acquired));
        Logger::instance().debug("Key '{}' busy, {} waiting", key, it->second.waiters.size());
        return;
    }

    auto& slot = state_->slots[key];
    slot.generation = state_->next_generation++;
    on_acquired(make_lock(state_, key, slot.generation));
}

void KeyedMutex::release(const std::string& key) {
    hand_over(state_, key);
}

void KeyedMutex::synchronized(const std::string& key, std::function<void()> action) {
    if (!is_locked(key)) {
        acquire(key, [&action](Lock lock) {
            (void)lock;
            action();
        });
        return;
    }

    acquire(key, [key, action = std::move(action)](Lock lock) {
        (void)lock;
        try {
            action();
        } catch (const std::exception& e) {
            Logger::instance().error("Synchronized action for '{}' threw: {}", key, e.what());
        }
    });
}

bool KeyedMutex::is_locked(const std::string& key) const {
    return state_->slots.count(key) > 0;
}

size_t KeyedMutex::pending_count(const std::string& key) const {
    auto it = state_->slots.find(key);
    return it == state_->slots.end() ? 0 : it->second.waiters.size();
}

size_t KeyedMutex::locked_count() const {
    return state_->slots.size();
}

void KeyedMutex::clear() {
    state_->slots.clear();
}

} // namespace xferq
