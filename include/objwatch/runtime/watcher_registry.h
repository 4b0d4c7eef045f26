//
// WatcherRegistry - fixed-capacity slot table shared by the four watcher kinds.
//

#ifndef OBJWATCH_WATCHER_REGISTRY_H
#define OBJWATCH_WATCHER_REGISTRY_H

#include <objwatch/runtime/watcher_errors.h>
#include <objwatch/runtime/watcher_mask.h>
#include <objwatch/types/object.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace objwatch {

    /**
     * WatcherRegistry - slot table for one object kind.
     *
     * Provides:
     * - Allocation of the first free slot (ids are slot indices and may be reused once cleared)
     * - Validation of ids (InvalidWatcherId / WatcherNotRegistered)
     * - A lock-free "which slots are active" mask for the dispatch fast path
     * - Snapshot dispatch: callbacks for the requested slots are copied out under the mutex and invoked after it
     *   is released, so a callback may add or clear watchers, or mutate watched objects, without deadlocking.
     *
     * Registration is rare compared to dispatch; a single registry-wide mutex serialises it.
     */
    template<typename Callback>
    class WatcherRegistry {
    public:
        using callback_type = Callback;
        using callback_ptr = std::shared_ptr<const Callback>;

        WatcherRegistry(ObjectKind kind, int capacity) : _kind(kind), _capacity(capacity) {
            if (capacity < 1 || capacity > WatcherMask::capacity) {
                throw std::invalid_argument(fmt::format("{} watcher capacity must be between 1 and {}, got {}", kind,
                                                        WatcherMask::capacity, capacity));
            }
        }

        WatcherRegistry(const WatcherRegistry &) = delete;

        WatcherRegistry &operator=(const WatcherRegistry &) = delete;

        [[nodiscard]] ObjectKind kind() const noexcept { return _kind; }

        [[nodiscard]] int capacity() const noexcept { return _capacity; }

        /**
         * Store the callback in the first empty slot and return its id.
         * @throws WatcherCapacityExceeded when every slot is occupied
         */
        [[nodiscard]] int add(Callback callback) {
            if (!callback) { throw std::invalid_argument(fmt::format("{} watcher callback must be callable", _kind)); }
            auto entry = std::make_shared<const Callback>(std::move(callback));
            std::lock_guard<std::mutex> lock(_mutex);
            for (int i = 0; i < _capacity; ++i) {
                if (!_slots[i]) {
                    _slots[i] = std::move(entry);
                    _publish_locked();
                    return i;
                }
            }
            throw WatcherCapacityExceeded(_kind);
        }

        /**
         * Empty the slot. Objects whose mask still carries the bit simply stop receiving events from it.
         */
        void clear(int watcher_id) {
            callback_ptr released;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _validate_locked(watcher_id);
                released = std::move(_slots[watcher_id]);
                _slots[watcher_id].reset();
                _publish_locked();
            }
            // released is dropped outside the lock, the callback's captures may do arbitrary work when destroyed
        }

        [[nodiscard]] callback_ptr get(int watcher_id) const {
            std::lock_guard<std::mutex> lock(_mutex);
            _validate_locked(watcher_id);
            return _slots[watcher_id];
        }

        void validate(int watcher_id) const {
            std::lock_guard<std::mutex> lock(_mutex);
            _validate_locked(watcher_id);
        }

        [[nodiscard]] bool is_registered(int watcher_id) const noexcept {
            return watcher_id >= 0 && watcher_id < _capacity && active().test(watcher_id);
        }

        [[nodiscard]] WatcherMask active() const noexcept {
            return WatcherMask(_active.load(std::memory_order_acquire));
        }

        [[nodiscard]] int size() const noexcept { return active().count(); }

        /**
         * Invoke fn(watcher_id, callback) for every active slot whose bit is set in mask, in slot order.
         */
        template<typename Fn>
        void for_each(WatcherMask mask, Fn &&fn) const {
            const WatcherMask wanted = mask & active();
            if (wanted.none()) { return; }

            std::array<callback_ptr, WatcherMask::capacity> snapshot{};
            {
                std::lock_guard<std::mutex> lock(_mutex);
                for (int i = 0; i < _capacity; ++i) {
                    if (wanted.test(i)) { snapshot[i] = _slots[i]; }
                }
            }
            for (int i = 0; i < _capacity; ++i) {
                if (snapshot[i]) { fn(i, *snapshot[i]); }
            }
        }

    private:
        void _validate_locked(int watcher_id) const {
            if (watcher_id < 0 || watcher_id >= _capacity) { throw InvalidWatcherId(_kind, watcher_id); }
            if (!_slots[watcher_id]) { throw WatcherNotRegistered(_kind, watcher_id); }
        }

        void _publish_locked() noexcept {
            WatcherMask mask;
            for (int i = 0; i < _capacity; ++i) {
                if (_slots[i]) { mask.set(i); }
            }
            _active.store(mask.bits(), std::memory_order_release);
        }

        ObjectKind _kind;
        int _capacity;
        mutable std::mutex _mutex;
        std::array<callback_ptr, WatcherMask::capacity> _slots{};
        std::atomic<uint8_t> _active{0};
    };

} // namespace objwatch

#endif // OBJWATCH_WATCHER_REGISTRY_H
