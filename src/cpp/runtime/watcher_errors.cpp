#include <objwatch/runtime/watcher_errors.h>

namespace objwatch {

    namespace {
        // Function watcher errors are reported in lower case, the other kinds capitalised
        const char *invalid_id_format(ObjectKind kind) noexcept {
            return kind == ObjectKind::Function ? "invalid {} watcher ID {}" : "Invalid {} watcher ID {}";
        }

        const char *not_registered_format(ObjectKind kind) noexcept {
            return kind == ObjectKind::Function ? "no {} watcher set for ID {}" : "No {} watcher set for ID {}";
        }
    } // namespace

    InvalidWatcherId::InvalidWatcherId(ObjectKind kind, int watcher_id)
        : std::invalid_argument(fmt::format(fmt::runtime(invalid_id_format(kind)), kind, watcher_id)),
          WatcherError(kind, watcher_id) {}

    WatcherNotRegistered::WatcherNotRegistered(ObjectKind kind, int watcher_id)
        : std::invalid_argument(fmt::format(fmt::runtime(not_registered_format(kind)), kind, watcher_id)),
          WatcherError(kind, watcher_id) {}

    WrongObjectKind::WrongObjectKind(ObjectKind expected, ObjectKind actual_, int watcher_id)
        : std::invalid_argument(fmt::format("Cannot watch non-{} with {} watcher ID {} (got a {})",
                                            object_kind_noun(expected), expected, watcher_id,
                                            object_kind_noun(actual_))),
          WatcherError(expected, watcher_id), actual(actual_) {}

    WatcherCapacityExceeded::WatcherCapacityExceeded(ObjectKind kind)
        : std::runtime_error(fmt::format("no more {} watcher IDs available", kind)), WatcherError(kind, -1) {}

} // namespace objwatch
