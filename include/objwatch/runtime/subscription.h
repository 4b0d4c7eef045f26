#pragma once

/**
 * @file subscription.h
 * @brief Subscription - reads and writes the per-object watcher mask.
 *
 * Two scopes exist:
 * - PerObject (dict, type): a slot observes an object only after watch(); the mask records opt-ins.
 * - InterpreterWide (code, function): every active slot observes every object of the kind, since creation
 *   cannot be watched per object; the mask records opt-outs made with unwatch().
 *
 * Either way dispatch_mask() yields the slots that should receive the object's next event.
 */

#include <objwatch/runtime/watcher_mask.h>
#include <objwatch/types/object.h>

namespace objwatch {

    enum class SubscriptionScope : uint8_t { PerObject, InterpreterWide };

    [[nodiscard]] constexpr SubscriptionScope subscription_scope(ObjectKind kind) noexcept {
        return kind == ObjectKind::Dict || kind == ObjectKind::Type ? SubscriptionScope::PerObject
                                                                     : SubscriptionScope::InterpreterWide;
    }

    class OBJWATCH_EXPORT Subscription {
    public:
        static void subscribe(Object &object, int watcher_id) noexcept;

        static void unsubscribe(Object &object, int watcher_id) noexcept;

        /**
         * Drop any record of the slot on the object (used when a slot is cleared and its bits are scrubbed).
         */
        static void forget(Object &object, int watcher_id) noexcept;

        // Called once the destroy event has been dispatched
        static void release(Object &object) noexcept;

        [[nodiscard]] static bool is_watched_by(const Object &object, int watcher_id, WatcherMask active) noexcept {
            return dispatch_mask(object, active).test(watcher_id);
        }

        [[nodiscard]] static WatcherMask dispatch_mask(const Object &object, WatcherMask active) noexcept {
            return subscription_scope(object.kind()) == SubscriptionScope::PerObject
                       ? object.watcher_mask() & active
                       : active & ~object.watcher_mask();
        }
    };

} // namespace objwatch
