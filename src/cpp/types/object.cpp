#include <objwatch/types/object.h>

namespace objwatch {

    std::string_view watcher_kind_name(ObjectKind kind) noexcept {
        switch (kind) {
            case ObjectKind::Dict: return "dict";
            case ObjectKind::Type: return "type";
            case ObjectKind::Code: return "code";
            case ObjectKind::Function: return "func";
        }
        return "unknown";
    }

    std::string_view object_kind_noun(ObjectKind kind) noexcept {
        switch (kind) {
            case ObjectKind::Dict: return "dictionary";
            case ObjectKind::Type: return "type";
            case ObjectKind::Code: return "code object";
            case ObjectKind::Function: return "function";
        }
        return "object";
    }

    Object::Object(Runtime &runtime, ObjectKind kind, ObjectId id) noexcept
        : _runtime(runtime), _kind(kind), _id(id) {
    }

} // namespace objwatch
