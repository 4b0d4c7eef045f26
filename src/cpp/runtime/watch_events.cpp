#include <objwatch/runtime/watch_events.h>

namespace objwatch {

    std::string_view to_string(DictEvent event) noexcept {
        switch (event) {
            case DictEvent::New: return "New";
            case DictEvent::Modified: return "Modified";
            case DictEvent::Deleted: return "Deleted";
            case DictEvent::Cleared: return "Cleared";
            case DictEvent::Cloned: return "Cloned";
            case DictEvent::Deallocated: return "Deallocated";
        }
        return "Unknown";
    }

    std::string_view to_string(TypeEvent event) noexcept {
        switch (event) {
            case TypeEvent::Modified: return "Modified";
        }
        return "Unknown";
    }

    std::string_view to_string(CodeEvent event) noexcept {
        switch (event) {
            case CodeEvent::Created: return "Created";
            case CodeEvent::Destroyed: return "Destroyed";
        }
        return "Unknown";
    }

    std::string_view to_string(FunctionEvent event) noexcept {
        switch (event) {
            case FunctionEvent::Created: return "Created";
            case FunctionEvent::ModifiedCode: return "ModifiedCode";
            case FunctionEvent::ModifiedDefaults: return "ModifiedDefaults";
            case FunctionEvent::ModifiedKwDefaults: return "ModifiedKwDefaults";
            case FunctionEvent::Destroyed: return "Destroyed";
        }
        return "Unknown";
    }

} // namespace objwatch
