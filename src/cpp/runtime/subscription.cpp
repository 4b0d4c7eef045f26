#include <objwatch/runtime/subscription.h>

namespace objwatch {

    void Subscription::subscribe(Object &object, int watcher_id) noexcept {
        if (subscription_scope(object.kind()) == SubscriptionScope::PerObject) {
            object._watchers.set(watcher_id);
        } else {
            object._watchers.reset(watcher_id);
        }
    }

    void Subscription::unsubscribe(Object &object, int watcher_id) noexcept {
        if (subscription_scope(object.kind()) == SubscriptionScope::PerObject) {
            object._watchers.reset(watcher_id);
        } else {
            object._watchers.set(watcher_id);
        }
    }

    void Subscription::forget(Object &object, int watcher_id) noexcept { object._watchers.reset(watcher_id); }

    void Subscription::release(Object &object) noexcept { object._watchers.clear(); }

} // namespace objwatch
