#include <objwatch/runtime/runtime.h>
#include <objwatch/runtime/subscription.h>

#include <utility>

namespace objwatch {

    namespace {
        const WatcherConfig &validated(const WatcherConfig &config) {
            config.validate();
            return config;
        }
    } // namespace

    template<typename T, typename... Args>
    std::shared_ptr<T> Runtime::_allocate(Args &&...args) {
        const ObjectId id = _heap.reserve();
        std::unique_ptr<T> object;
        try {
            object.reset(new T(*this, id, std::forward<Args>(args)...));
            _heap.bind(id, object.get());
        } catch (...) {
            _heap.release(id);
            throw;
        }
        // If the control block cannot be allocated the deleter still runs, so the id is retired either way
        return std::shared_ptr<T>(object.release(), &Runtime::_dealloc);
    }

    Runtime::Runtime(WatcherConfig config)
        : _config(validated(config)), _watchers(_config, _heap), _type_cache(_config.type_cache_size),
          _object_type(_make_object_type(*this)) {}

    Runtime::~Runtime() = default;

    dict_ptr Runtime::new_dict() { return _allocate<DictObject>(); }

    type_ptr Runtime::new_type(std::string name, std::vector<type_ptr> bases) {
        if (bases.empty()) { bases.push_back(_object_type); }
        auto type = _allocate<TypeObject>(std::move(name), std::move(bases));
        for (const auto &base : type->bases()) { base->_add_subclass(type); }
        return type;
    }

    code_ptr Runtime::new_code(std::string name, std::string filename, int first_line, std::string qualname) {
        auto code = _allocate<CodeObject>(std::move(name), std::move(qualname), std::move(filename), first_line);
        _watchers.notify_code(CodeEvent::Created, *code);
        return code;
    }

    function_ptr Runtime::new_function(code_ptr code, std::string qualname) {
        auto function = _allocate<FunctionObject>(std::move(code), std::move(qualname));
        _watchers.notify_function(FunctionEvent::Created, *function, nullptr);
        return function;
    }

    uint32_t Runtime::next_version_tag() noexcept {
        uint32_t current = _next_version_tag.load(std::memory_order_relaxed);
        do {
            if (current == 0) { return 0; }
            // Wrapping to 0 marks the counter exhausted
        } while (!_next_version_tag.compare_exchange_weak(current, current + 1, std::memory_order_relaxed));
        return current;
    }

    void Runtime::_dealloc(Object *object) noexcept {
        Runtime &runtime = object->runtime();
        object->on_dealloc();
        Subscription::release(*object);
        runtime._heap.release(object->id());
        delete object;
    }

    type_ptr Runtime::_make_object_type(Runtime &runtime) {
        return runtime._allocate<TypeObject>(std::string("object"), std::vector<type_ptr>{});
    }

} // namespace objwatch
