//
// Errors raised synchronously by the watcher registries and subscription operations.
//

#ifndef OBJWATCH_WATCHER_ERRORS_H
#define OBJWATCH_WATCHER_ERRORS_H

#include <objwatch/objwatch_base.h>
#include <objwatch/types/object.h>

#include <stdexcept>

namespace objwatch {

    /**
     * Common base for the watcher error family so a caller can catch all of them at once. Concrete errors
     * also derive from the matching standard exception (std::invalid_argument for caller bugs,
     * std::runtime_error for resource exhaustion).
     */
    struct OBJWATCH_EXPORT WatcherError {
        WatcherError(ObjectKind kind_, int watcher_id_) : kind(kind_), watcher_id(watcher_id_) {}

        virtual ~WatcherError() = default;

        ObjectKind kind;
        int watcher_id; // -1 when no id is involved
    };

    /**
     * The id is outside [0, capacity) of the registry.
     */
    struct OBJWATCH_EXPORT InvalidWatcherId : std::invalid_argument, WatcherError {
        InvalidWatcherId(ObjectKind kind, int watcher_id);
    };

    /**
     * The id is in range but its slot is empty (e.g. a double clear).
     */
    struct OBJWATCH_EXPORT WatcherNotRegistered : std::invalid_argument, WatcherError {
        WatcherNotRegistered(ObjectKind kind, int watcher_id);
    };

    /**
     * watch/unwatch was handed an object that is not of the registry's kind.
     */
    struct OBJWATCH_EXPORT WrongObjectKind : std::invalid_argument, WatcherError {
        WrongObjectKind(ObjectKind expected, ObjectKind actual, int watcher_id);

        ObjectKind actual;
    };

    /**
     * Every slot of the registry is occupied. Recoverable by clearing an existing watcher first.
     */
    struct OBJWATCH_EXPORT WatcherCapacityExceeded : std::runtime_error, WatcherError {
        explicit WatcherCapacityExceeded(ObjectKind kind);
    };

} // namespace objwatch

#endif // OBJWATCH_WATCHER_ERRORS_H
