//
// Object - the base of every object the objwatch runtime manages.
//

#ifndef OBJWATCH_OBJECT_H
#define OBJWATCH_OBJECT_H

#include <objwatch/objwatch_base.h>
#include <objwatch/runtime/watcher_mask.h>
#include <objwatch/types/object_id.h>

#include <memory>
#include <string>
#include <string_view>

namespace objwatch {

    /**
     * The four object kinds that support watchers. Each kind has its own watcher registry.
     */
    enum class ObjectKind : uint8_t { Dict, Type, Code, Function };

    /**
     * Short name used in watcher error messages, e.g. "dict" in "Invalid dict watcher ID 8".
     */
    OBJWATCH_EXPORT std::string_view watcher_kind_name(ObjectKind kind) noexcept;

    /**
     * Noun used when an object of the wrong kind is passed to watch/unwatch, e.g. "dictionary".
     */
    OBJWATCH_EXPORT std::string_view object_kind_noun(ObjectKind kind) noexcept;

    /**
     * Objects are only ever created by the Runtime factories and are held by shared pointers whose deleter
     * routes through Runtime::dealloc, the single point where destroy events are dispatched.
     *
     * Every object embeds the watcher mask of its kind's registry. The object owns the mask; registries never
     * enumerate the objects that reference their slots.
     *
     * weak_from_this() recovers an owning handle for an object reached by reference, it is empty once the object
     * has started to deallocate.
     */
    class OBJWATCH_EXPORT Object : public std::enable_shared_from_this<Object> {
    public:
        Object(const Object &) = delete;

        Object &operator=(const Object &) = delete;

        virtual ~Object() = default;

        [[nodiscard]] ObjectKind kind() const noexcept { return _kind; }

        [[nodiscard]] ObjectId id() const noexcept { return _id; }

        [[nodiscard]] Runtime &runtime() const noexcept { return _runtime; }

        [[nodiscard]] WatcherMask watcher_mask() const noexcept { return _watchers; }

        [[nodiscard]] virtual std::string repr() const = 0;

    protected:
        Object(Runtime &runtime, ObjectKind kind, ObjectId id) noexcept;

        /**
         * Called by Runtime::dealloc while the object is still fully readable, before its arena slot is
         * released. Kinds with a destroy event dispatch it here.
         */
        virtual void on_dealloc() noexcept {}

    private:
        friend class Runtime;
        friend class Subscription;

        Runtime &_runtime;
        ObjectKind _kind;
        ObjectId _id;
        WatcherMask _watchers{};
    };

} // namespace objwatch

template<>
struct fmt::formatter<objwatch::ObjectKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(objwatch::ObjectKind kind, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(objwatch::watcher_kind_name(kind), ctx);
    }
};

#endif // OBJWATCH_OBJECT_H
