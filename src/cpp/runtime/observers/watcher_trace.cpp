#include <objwatch/runtime/observers/watcher_trace.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/types/type_object.h>
#include <objwatch/util/errors.h>

#include <iostream>
#include <utility>

namespace objwatch {

    // Static member initialization
    bool WatcherTrace::_use_logger = true;

    WatcherTrace::WatcherTrace(WatcherContext &context, const std::optional<std::string> &filter, bool dict,
                               bool type, bool code, bool function)
        : _context(context), _filter(filter) {
        try {
            if (dict) {
                _dict_id = _context.add_dict_watcher(
                    [this](DictEvent event, const DictObject &d, const Value *key, const Value *new_value) {
                        auto repr = d.repr();
                        if (!_should_log(repr)) { return; }
                        std::string msg = fmt::format("{} {}", repr, event);
                        if (key != nullptr) { msg += fmt::format(" key={}", *key); }
                        if (new_value != nullptr) { msg += fmt::format(" value={}", *new_value); }
                        _print(ObjectKind::Dict, msg);
                    });
            }
            if (type) {
                _type_id = _context.add_type_watcher([this](const TypeObject &t) {
                    auto repr = t.repr();
                    if (_should_log(repr)) { _print(ObjectKind::Type, fmt::format("{} {}", repr, TypeEvent::Modified)); }
                });
            }
            if (code) {
                _code_id = _context.add_code_watcher([this](CodeEvent event, const CodeObject &c) {
                    auto repr = c.repr();
                    if (_should_log(repr)) { _print(ObjectKind::Code, fmt::format("{} {}", repr, event)); }
                });
            }
            if (function) {
                _function_id = _context.add_function_watcher(
                    [this](FunctionEvent event, ObjectId function_id, const FunctionObject *f, const Value *new_value) {
                        // A destroyed function is only known by its id
                        auto repr = f != nullptr ? f->repr() : fmt::format("<function at {}>", function_id);
                        if (!_should_log(repr)) { return; }
                        std::string msg = fmt::format("{} {}", repr, event);
                        if (new_value != nullptr) { msg += fmt::format(" value={}", *new_value); }
                        _print(ObjectKind::Function, msg);
                    });
            }
        } catch (...) {
            _release();
            throw;
        }
    }

    WatcherTrace::~WatcherTrace() { _release(); }

    void WatcherTrace::watch(Object &object) {
        const int id = _require(object.kind());
        switch (object.kind()) {
            case ObjectKind::Dict: _context.watch_dict(id, object); break;
            case ObjectKind::Type: _context.watch_type(id, object); break;
            case ObjectKind::Code: _context.watch_code(id, object); break;
            case ObjectKind::Function: _context.watch_function(id, object); break;
        }
    }

    void WatcherTrace::unwatch(Object &object) {
        const int id = _require(object.kind());
        switch (object.kind()) {
            case ObjectKind::Dict: _context.unwatch_dict(id, object); break;
            case ObjectKind::Type: _context.unwatch_type(id, object); break;
            case ObjectKind::Code: _context.unwatch_code(id, object); break;
            case ObjectKind::Function: _context.unwatch_function(id, object); break;
        }
    }

    std::optional<int> WatcherTrace::watcher_id(ObjectKind kind) const noexcept {
        switch (kind) {
            case ObjectKind::Dict: return _dict_id;
            case ObjectKind::Type: return _type_id;
            case ObjectKind::Code: return _code_id;
            case ObjectKind::Function: return _function_id;
        }
        return std::nullopt;
    }

    void WatcherTrace::set_use_logger(bool value) { _use_logger = value; }

    void WatcherTrace::_print(ObjectKind kind, const std::string &msg) const {
        std::string formatted = fmt::format("[{} watcher] {}", kind, msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool WatcherTrace::_should_log(const std::string &repr) const {
        if (!_filter.has_value()) { return true; }
        return repr.find(_filter.value()) != std::string::npos;
    }

    void WatcherTrace::_release() noexcept {
        // Clearing only fails for an id that is no longer registered, which leaves nothing to release
        try {
            if (_dict_id) { _context.clear_dict_watcher(*std::exchange(_dict_id, std::nullopt)); }
        } catch (const std::invalid_argument &) {}
        try {
            if (_type_id) { _context.clear_type_watcher(*std::exchange(_type_id, std::nullopt)); }
        } catch (const std::invalid_argument &) {}
        try {
            if (_code_id) { _context.clear_code_watcher(*std::exchange(_code_id, std::nullopt)); }
        } catch (const std::invalid_argument &) {}
        try {
            if (_function_id) { _context.clear_function_watcher(*std::exchange(_function_id, std::nullopt)); }
        } catch (const std::invalid_argument &) {}
    }

    int WatcherTrace::_require(ObjectKind kind) const {
        if (auto id = watcher_id(kind)) { return *id; }
        throw_error<std::invalid_argument>("WatcherTrace is not logging {} events", kind);
    }

} // namespace objwatch
