#include <objwatch/runtime/watcher_config.h>
#include <objwatch/util/errors.h>

namespace objwatch {

    int WatcherConfig::max_watchers(ObjectKind kind) const noexcept {
        switch (kind) {
            case ObjectKind::Dict: return dict_max_watchers;
            case ObjectKind::Type: return type_max_watchers;
            case ObjectKind::Code: return code_max_watchers;
            case ObjectKind::Function: return function_max_watchers;
        }
        return 0;
    }

    void WatcherConfig::validate() const {
        for (auto kind : {ObjectKind::Dict, ObjectKind::Type, ObjectKind::Code, ObjectKind::Function}) {
            const int capacity = max_watchers(kind);
            if (capacity < 1 || capacity > MAX_WATCHERS) {
                throw_error<std::invalid_argument>("{} watcher capacity must be between 1 and {}, got {}", kind,
                                                   MAX_WATCHERS, capacity);
            }
        }
        if (type_cache_size == 0 || (type_cache_size & (type_cache_size - 1)) != 0) {
            throw_error<std::invalid_argument>("type cache size must be a power of two, got {}", type_cache_size);
        }
    }

} // namespace objwatch
