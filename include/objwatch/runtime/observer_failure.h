//
// ObserverFailure - a watcher callback failure captured during dispatch, and the unraisable channel that
// receives it.
//

#ifndef OBJWATCH_OBSERVER_FAILURE_H
#define OBJWATCH_OBSERVER_FAILURE_H

#include <objwatch/objwatch_base.h>
#include <objwatch/types/object.h>

#include <atomic>
#include <exception>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace objwatch {

    struct OBJWATCH_EXPORT ObserverFailure {
        ObjectKind kind;
        int watcher_id;
        ObjectId object_id;      // the object whose mutation triggered the dispatch
        std::string object_repr; // captured at dispatch time, the object may be gone by now
        std::string error_msg;
        std::string stack_trace; // empty unless built with backward-cpp
        std::exception_ptr exception;

        [[nodiscard]] std::string to_string() const;

        static ObserverFailure capture_error(std::exception_ptr e, ObjectKind kind, int watcher_id,
                                             const Object &object);

        static ObserverFailure capture_error(std::exception_ptr e, ObjectKind kind, int watcher_id,
                                             ObjectId object_id, std::string object_repr);
    };

    using UnraisableHook = std::function<void(const ObserverFailure &failure)>;

    /**
     * The single channel through which watcher callback failures are surfaced.
     *
     * A failure is handed to the installed hook, or written to stderr when no hook is installed. If the hook
     * itself throws, or a failure is reported while another report is in progress on the same thread, the
     * failure is written to stderr instead. report() never throws.
     */
    class OBJWATCH_EXPORT UnraisableChannel {
    public:
        /**
         * Install a hook, an empty hook restores the default stderr sink. Returns the previous hook.
         */
        UnraisableHook set_hook(UnraisableHook hook);

        [[nodiscard]] bool has_hook() const;

        void report(const ObserverFailure &failure) noexcept;

        // Total failures reported since construction
        [[nodiscard]] size_t reported_count() const noexcept { return _reported.load(std::memory_order_relaxed); }

        static void write_default(const ObserverFailure &failure, std::ostream &os) noexcept;

    private:
        mutable std::mutex _mutex;
        UnraisableHook _hook;
        std::atomic<size_t> _reported{0};
    };

} // namespace objwatch

#endif // OBJWATCH_OBSERVER_FAILURE_H
