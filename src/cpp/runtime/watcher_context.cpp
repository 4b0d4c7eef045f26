#include <objwatch/memory/object_heap.h>
#include <objwatch/runtime/watcher_context.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/types/type_object.h>

#include <iostream>

namespace objwatch {

    namespace {
        void log_dispatch_failure(ObjectKind kind, const char *what) noexcept {
            try {
                std::cerr << fmt::format("Exception ignored while dispatching {} watcher event: {}", kind, what)
                          << std::endl;
            } catch (const std::exception &) {
                // stderr is the sink of last resort
            }
        }
    } // namespace

    WatcherContext::WatcherContext(const WatcherConfig &config, ObjectHeap &heap)
        : _heap(heap), _clear_subscriptions_on_clear(config.clear_subscriptions_on_clear),
          _dict(ObjectKind::Dict, config.dict_max_watchers), _type(ObjectKind::Type, config.type_max_watchers),
          _code(ObjectKind::Code, config.code_max_watchers),
          _function(ObjectKind::Function, config.function_max_watchers) {}

    template<typename Callback>
    void WatcherContext::_watch(WatcherRegistry<Callback> &registry, int watcher_id, Object &object) {
        if (object.kind() != registry.kind()) { throw WrongObjectKind(registry.kind(), object.kind(), watcher_id); }
        registry.validate(watcher_id);
        Subscription::subscribe(object, watcher_id);
    }

    template<typename Callback>
    void WatcherContext::_unwatch(WatcherRegistry<Callback> &registry, int watcher_id, Object &object) {
        if (object.kind() != registry.kind()) { throw WrongObjectKind(registry.kind(), object.kind(), watcher_id); }
        registry.validate(watcher_id);
        Subscription::unsubscribe(object, watcher_id);
    }

    template<typename Callback>
    void WatcherContext::_clear(WatcherRegistry<Callback> &registry, int watcher_id) {
        registry.clear(watcher_id);
        // Opt-outs of an interpreter-wide slot must not carry over to the slot's next occupant
        if (_clear_subscriptions_on_clear ||
            subscription_scope(registry.kind()) == SubscriptionScope::InterpreterWide) {
            _heap.for_each_live(registry.kind(),
                                [watcher_id](Object &object) { Subscription::forget(object, watcher_id); });
        }
    }

    template<typename Callback, typename Repr, typename Invoke>
    void WatcherContext::_dispatch(const WatcherRegistry<Callback> &registry, WatcherMask mask, ObjectId subject_id,
                                   Repr &&subject_repr, Invoke &&invoke) noexcept {
        if (mask.none()) { return; }
        try {
            registry.for_each(mask, [&](int watcher_id, const Callback &callback) {
                try {
                    invoke(callback);
                } catch (...) {
                    // Reported, never propagated into the mutation or the remaining slots
                    auto failure = ObserverFailure::capture_error(std::current_exception(), registry.kind(),
                                                                  watcher_id, subject_id, subject_repr());
                    _unraisable.report(failure);
                }
            });
        } catch (const std::exception &e) { log_dispatch_failure(registry.kind(), e.what()); }
    }

    int WatcherContext::add_dict_watcher(DictWatchCallback callback) { return _dict.add(std::move(callback)); }

    void WatcherContext::clear_dict_watcher(int watcher_id) { _clear(_dict, watcher_id); }

    void WatcherContext::watch_dict(int watcher_id, Object &object) { _watch(_dict, watcher_id, object); }

    void WatcherContext::unwatch_dict(int watcher_id, Object &object) { _unwatch(_dict, watcher_id, object); }

    int WatcherContext::add_type_watcher(TypeWatchCallback callback) { return _type.add(std::move(callback)); }

    void WatcherContext::clear_type_watcher(int watcher_id) { _clear(_type, watcher_id); }

    void WatcherContext::watch_type(int watcher_id, Object &object) {
        _watch(_type, watcher_id, object);
        // If the tag space is exhausted the type stays dirty and cannot report, there is nothing more to do
        static_cast<TypeObject &>(object).assign_version_tag();
    }

    void WatcherContext::unwatch_type(int watcher_id, Object &object) { _unwatch(_type, watcher_id, object); }

    int WatcherContext::add_code_watcher(CodeWatchCallback callback) { return _code.add(std::move(callback)); }

    void WatcherContext::clear_code_watcher(int watcher_id) { _clear(_code, watcher_id); }

    void WatcherContext::watch_code(int watcher_id, Object &object) { _watch(_code, watcher_id, object); }

    void WatcherContext::unwatch_code(int watcher_id, Object &object) { _unwatch(_code, watcher_id, object); }

    int WatcherContext::add_function_watcher(FunctionWatchCallback callback) {
        return _function.add(std::move(callback));
    }

    void WatcherContext::clear_function_watcher(int watcher_id) { _clear(_function, watcher_id); }

    void WatcherContext::watch_function(int watcher_id, Object &object) { _watch(_function, watcher_id, object); }

    void WatcherContext::unwatch_function(int watcher_id, Object &object) {
        _unwatch(_function, watcher_id, object);
    }

    bool WatcherContext::is_watching(int watcher_id, const Object &object) const noexcept {
        if (watcher_id < 0 || watcher_id >= WatcherMask::capacity) { return false; }
        return Subscription::is_watched_by(object, watcher_id, _active(object.kind()));
    }

    WatcherMask WatcherContext::dispatch_mask(const Object &object) const noexcept {
        return Subscription::dispatch_mask(object, _active(object.kind()));
    }

    void WatcherContext::notify_dict(DictEvent event, const DictObject &dict, const Value *key,
                                     const Value *new_value) noexcept {
        _dispatch(_dict, dispatch_mask(dict), dict.id(), [&dict] { return dict.repr(); },
                  [&](const DictWatchCallback &callback) { callback(event, dict, key, new_value); });
    }

    void WatcherContext::notify_type_modified(const TypeObject &type) noexcept {
        _dispatch(_type, dispatch_mask(type), type.id(), [&type] { return type.repr(); },
                  [&](const TypeWatchCallback &callback) { callback(type); });
    }

    void WatcherContext::notify_code(CodeEvent event, const CodeObject &code) noexcept {
        _dispatch(_code, dispatch_mask(code), code.id(), [&code] { return code.repr(); },
                  [&](const CodeWatchCallback &callback) { callback(event, code); });
    }

    void WatcherContext::notify_function(FunctionEvent event, const FunctionObject &function,
                                         const Value *new_value) noexcept {
        _dispatch(_function, dispatch_mask(function), function.id(), [&function] { return function.repr(); },
                  [&](const FunctionWatchCallback &callback) {
                      callback(event, function.id(), &function, new_value);
                  });
    }

    void WatcherContext::notify_function_destroyed(const FunctionObject &function) noexcept {
        const ObjectId function_id = function.id();
        _dispatch(_function, dispatch_mask(function), function_id, [&function] { return function.repr(); },
                  [function_id](const FunctionWatchCallback &callback) {
                      callback(FunctionEvent::Destroyed, function_id, nullptr, nullptr);
                  });
    }

    WatcherMask WatcherContext::_active(ObjectKind kind) const noexcept {
        switch (kind) {
            case ObjectKind::Dict: return _dict.active();
            case ObjectKind::Type: return _type.active();
            case ObjectKind::Code: return _code.active();
            case ObjectKind::Function: return _function.active();
        }
        return {};
    }

} // namespace objwatch
