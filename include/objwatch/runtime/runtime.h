//
// Runtime - the explicitly owned context that creates the watched objects and holds the watcher registries.
//

#ifndef OBJWATCH_RUNTIME_H
#define OBJWATCH_RUNTIME_H

#include <objwatch/memory/object_heap.h>
#include <objwatch/runtime/watcher_config.h>
#include <objwatch/runtime/watcher_context.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/types/type_cache.h>
#include <objwatch/types/type_object.h>

#include <atomic>
#include <string>
#include <vector>

namespace objwatch {

    /**
     * Owns the object heap, the watcher context, the type attribute cache and the version tag counter. All
     * objects are created through the new_* factories and are released through the runtime's deleter, which
     * dispatches the destroy event, clears the watcher mask and retires the object's id.
     *
     * Runtimes are independent of each other. A Runtime must outlive every object it created.
     */
    class OBJWATCH_EXPORT Runtime {
    public:
        /**
         * @throws std::invalid_argument if the configuration is out of range
         */
        explicit Runtime(WatcherConfig config = {});

        Runtime(const Runtime &) = delete;

        Runtime &operator=(const Runtime &) = delete;

        ~Runtime();

        [[nodiscard]] const WatcherConfig &config() const noexcept { return _config; }

        [[nodiscard]] WatcherContext &watchers() noexcept { return _watchers; }

        [[nodiscard]] const WatcherContext &watchers() const noexcept { return _watchers; }

        [[nodiscard]] ObjectHeap &heap() noexcept { return _heap; }

        [[nodiscard]] const ObjectHeap &heap() const noexcept { return _heap; }

        [[nodiscard]] TypeAttributeCache &type_cache() noexcept { return _type_cache; }

        // The root of every type hierarchy, the implicit base of new_type
        [[nodiscard]] const type_ptr &object_type() const noexcept { return _object_type; }

        [[nodiscard]] dict_ptr new_dict();

        /**
         * @param bases direct bases in declaration order, object_type() when empty
         * @throws TypeError when the bases admit no consistent MRO
         */
        [[nodiscard]] type_ptr new_type(std::string name, std::vector<type_ptr> bases = {});

        /**
         * Code watchers observe Created before this returns.
         */
        [[nodiscard]] code_ptr new_code(std::string name, std::string filename = "<string>", int first_line = 1,
                                        std::string qualname = {});

        /**
         * Function watchers observe Created before this returns. qualname defaults to the code's qualname.
         */
        [[nodiscard]] function_ptr new_function(code_ptr code, std::string qualname = {});

        /**
         * Next type version tag, 0 once the 32 bit tag space is exhausted.
         */
        [[nodiscard]] uint32_t next_version_tag() noexcept;

        // Move the tag counter, 0 exhausts it
        void set_next_version_tag(uint32_t next) noexcept { _next_version_tag.store(next, std::memory_order_relaxed); }

    private:
        template<typename T, typename... Args>
        std::shared_ptr<T> _allocate(Args &&...args);

        static void _dealloc(Object *object) noexcept;

        static type_ptr _make_object_type(Runtime &runtime);

        WatcherConfig _config;
        ObjectHeap _heap;
        WatcherContext _watchers;
        TypeAttributeCache _type_cache;
        std::atomic<uint32_t> _next_version_tag{1};
        // Declared last so it is released first, while the heap and the watchers are still alive
        type_ptr _object_type;
    };

} // namespace objwatch

#endif // OBJWATCH_RUNTIME_H
