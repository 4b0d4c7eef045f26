//
// WatcherContext - the four watcher registries, the subscription surface and the dispatch entry points.
//

#ifndef OBJWATCH_WATCHER_CONTEXT_H
#define OBJWATCH_WATCHER_CONTEXT_H

#include <objwatch/objwatch_base.h>
#include <objwatch/runtime/observer_failure.h>
#include <objwatch/runtime/subscription.h>
#include <objwatch/runtime/watch_events.h>
#include <objwatch/runtime/watcher_config.h>
#include <objwatch/runtime/watcher_registry.h>

#include <string>

namespace objwatch {

    /**
     * Owns one WatcherRegistry per object kind together with the unraisable channel.
     *
     * The public surface has the same shape for every kind:
     *
     *   add_<kind>_watcher(callback) -> id     WatcherCapacityExceeded when all slots are taken
     *   clear_<kind>_watcher(id)               InvalidWatcherId / WatcherNotRegistered
     *   watch_<kind>(id, object)               WrongObjectKind / InvalidWatcherId / WatcherNotRegistered
     *   unwatch_<kind>(id, object)             as watch
     *
     * The notify_* members are the dispatch entry points called by the object kinds at their mutation, creation
     * and destruction points. Dispatch is synchronous; each callback invocation is isolated, a failure is
     * captured as an ObserverFailure, reported through the unraisable channel and never propagated into the
     * mutation that triggered it.
     */
    class OBJWATCH_EXPORT WatcherContext {
    public:
        WatcherContext(const WatcherConfig &config, ObjectHeap &heap);

        WatcherContext(const WatcherContext &) = delete;

        WatcherContext &operator=(const WatcherContext &) = delete;

        // ========== Dict ==========

        [[nodiscard]] int add_dict_watcher(DictWatchCallback callback);

        void clear_dict_watcher(int watcher_id);

        void watch_dict(int watcher_id, Object &object);

        void unwatch_dict(int watcher_id, Object &object);

        // ========== Type ==========

        [[nodiscard]] int add_type_watcher(TypeWatchCallback callback);

        void clear_type_watcher(int watcher_id);

        /**
         * Also assigns the type a valid version tag, so its next modification is guaranteed to be reported.
         */
        void watch_type(int watcher_id, Object &object);

        void unwatch_type(int watcher_id, Object &object);

        // ========== Code ==========

        [[nodiscard]] int add_code_watcher(CodeWatchCallback callback);

        void clear_code_watcher(int watcher_id);

        void watch_code(int watcher_id, Object &object);

        void unwatch_code(int watcher_id, Object &object);

        // ========== Function ==========

        [[nodiscard]] int add_function_watcher(FunctionWatchCallback callback);

        void clear_function_watcher(int watcher_id);

        void watch_function(int watcher_id, Object &object);

        void unwatch_function(int watcher_id, Object &object);

        // ========== Queries ==========

        /**
         * True when the object's next event would be delivered to the slot.
         */
        [[nodiscard]] bool is_watching(int watcher_id, const Object &object) const noexcept;

        [[nodiscard]] WatcherMask dispatch_mask(const Object &object) const noexcept;

        [[nodiscard]] const WatcherRegistry<DictWatchCallback> &dict_registry() const noexcept { return _dict; }

        [[nodiscard]] const WatcherRegistry<TypeWatchCallback> &type_registry() const noexcept { return _type; }

        [[nodiscard]] const WatcherRegistry<CodeWatchCallback> &code_registry() const noexcept { return _code; }

        [[nodiscard]] const WatcherRegistry<FunctionWatchCallback> &function_registry() const noexcept {
            return _function;
        }

        [[nodiscard]] UnraisableChannel &unraisable() noexcept { return _unraisable; }

        // ========== Dispatch entry points ==========

        void notify_dict(DictEvent event, const DictObject &dict, const Value *key, const Value *new_value) noexcept;

        void notify_type_modified(const TypeObject &type) noexcept;

        void notify_code(CodeEvent event, const CodeObject &code) noexcept;

        void notify_function(FunctionEvent event, const FunctionObject &function, const Value *new_value) noexcept;

        /**
         * Called from the function's destroy hook. Callbacks receive only the function's ObjectId, the storage is
         * released as soon as the dispatch returns.
         */
        void notify_function_destroyed(const FunctionObject &function) noexcept;

    private:
        [[nodiscard]] WatcherMask _active(ObjectKind kind) const noexcept;

        template<typename Callback>
        void _watch(WatcherRegistry<Callback> &registry, int watcher_id, Object &object);

        template<typename Callback>
        void _unwatch(WatcherRegistry<Callback> &registry, int watcher_id, Object &object);

        template<typename Callback>
        void _clear(WatcherRegistry<Callback> &registry, int watcher_id);

        template<typename Callback, typename Repr, typename Invoke>
        void _dispatch(const WatcherRegistry<Callback> &registry, WatcherMask mask, ObjectId subject_id,
                       Repr &&subject_repr, Invoke &&invoke) noexcept;

        ObjectHeap &_heap;
        bool _clear_subscriptions_on_clear;
        WatcherRegistry<DictWatchCallback> _dict;
        WatcherRegistry<TypeWatchCallback> _type;
        WatcherRegistry<CodeWatchCallback> _code;
        WatcherRegistry<FunctionWatchCallback> _function;
        UnraisableChannel _unraisable;
    };

} // namespace objwatch

#endif // OBJWATCH_WATCHER_CONTEXT_H
