//
// Event taxonomy and callback signatures for the four watcher registries.
//

#ifndef OBJWATCH_WATCH_EVENTS_H
#define OBJWATCH_WATCH_EVENTS_H

#include <objwatch/objwatch_base.h>
#include <objwatch/types/object_id.h>

#include <functional>
#include <string_view>
#include <type_traits>

namespace objwatch {

    enum class DictEvent : uint8_t {
        New,         // key inserted
        Modified,    // value of an existing key replaced
        Deleted,     // key removed
        Cleared,     // all keys removed in one operation
        Cloned,      // contents bulk-copied from another dict
        Deallocated, // the dict is being destroyed
    };

    // Types report a single, aggregated event kind.
    enum class TypeEvent : uint8_t { Modified };

    enum class CodeEvent : uint8_t { Created, Destroyed };

    enum class FunctionEvent : uint8_t {
        Created,
        ModifiedCode,
        ModifiedDefaults,
        ModifiedKwDefaults,
        Destroyed,
    };

    OBJWATCH_EXPORT std::string_view to_string(DictEvent event) noexcept;

    OBJWATCH_EXPORT std::string_view to_string(TypeEvent event) noexcept;

    OBJWATCH_EXPORT std::string_view to_string(CodeEvent event) noexcept;

    OBJWATCH_EXPORT std::string_view to_string(FunctionEvent event) noexcept;

    /**
     * key is set for New, Modified and Deleted; new_value for New and Modified. Both are null otherwise.
     */
    using DictWatchCallback =
    std::function<void(DictEvent event, const DictObject &dict, const Value *key, const Value *new_value)>;

    using TypeWatchCallback = std::function<void(const TypeObject &type)>;

    using CodeWatchCallback = std::function<void(CodeEvent event, const CodeObject &code)>;

    /**
     * function is null for Destroyed: by the time the event is observable the function is gone and only its
     * identity remains. new_value is set for the Modified* events.
     */
    using FunctionWatchCallback = std::function<void(FunctionEvent event, ObjectId function_id,
                                                     const FunctionObject *function, const Value *new_value)>;

} // namespace objwatch

template<typename Event>
    requires std::is_enum_v<Event> && requires(Event e) { objwatch::to_string(e); }
struct fmt::formatter<Event> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(Event event, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(objwatch::to_string(event), ctx);
    }
};

#endif // OBJWATCH_WATCH_EVENTS_H
