#include <objwatch/runtime/observer_failure.h>

#include <iostream>
#include <sstream>

#if OBJWATCH_WITH_BACKWARD
#include <backward.hpp>
#endif

namespace objwatch {

    namespace {
        // Set while this thread is delivering a failure, a failure raised from inside the hook is not re-routed
        // back into it.
        thread_local bool reporting_failure = false;

        struct ReportingScope {
            ReportingScope() noexcept { reporting_failure = true; }
            ~ReportingScope() { reporting_failure = false; }
        };

        void write_hook_failure(const char *what) noexcept {
            try {
                std::cerr << fmt::format("Exception ignored in unraisable hook: {}", what) << std::endl;
            } catch (const std::exception &) {
                // stderr is the sink of last resort
            }
        }

        std::string capture_stack_trace() {
#if OBJWATCH_WITH_BACKWARD
            backward::StackTrace st;
            st.load_here(32);
            st.skip_n_firsts(3); // capture_stack_trace and the two capture_error frames
            backward::Printer p;
            p.object = true;
            p.color_mode = backward::ColorMode::never;
            p.address = true;

            std::ostringstream oss;
            p.print(st, oss);
            return oss.str();
#else
            return {};
#endif
        }
    } // namespace

    std::string ObserverFailure::to_string() const {
        std::string result = fmt::format("Exception ignored in {} watcher callback for {}: {}", kind, object_repr,
                                         error_msg);
        if (!stack_trace.empty()) { result += "\nStack trace:\n" + stack_trace; }
        return result;
    }

    ObserverFailure ObserverFailure::capture_error(std::exception_ptr e, ObjectKind kind, int watcher_id,
                                                   const Object &object) {
        return capture_error(std::move(e), kind, watcher_id, object.id(), object.repr());
    }

    ObserverFailure ObserverFailure::capture_error(std::exception_ptr e, ObjectKind kind, int watcher_id,
                                                   ObjectId object_id, std::string object_repr) {
        std::string error_msg;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception &e_) {
            error_msg = e_.what();
        } catch (...) {
            error_msg = "Unknown non-standard exception raised by watcher callback";
        }
        return ObserverFailure{kind,
                               watcher_id,
                               object_id,
                               std::move(object_repr),
                               std::move(error_msg),
                               capture_stack_trace(),
                               std::move(e)};
    }

    UnraisableHook UnraisableChannel::set_hook(UnraisableHook hook) {
        std::lock_guard<std::mutex> lock(_mutex);
        std::swap(_hook, hook);
        return hook;
    }

    bool UnraisableChannel::has_hook() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<bool>(_hook);
    }

    void UnraisableChannel::report(const ObserverFailure &failure) noexcept {
        _reported.fetch_add(1, std::memory_order_relaxed);
        if (reporting_failure) {
            write_default(failure, std::cerr);
            return;
        }

        UnraisableHook hook;
        try {
            std::lock_guard<std::mutex> lock(_mutex);
            hook = _hook;
        } catch (const std::exception &) {
            // Copying the hook failed (allocation); fall through to the default sink
        }
        if (!hook) {
            write_default(failure, std::cerr);
            return;
        }

        ReportingScope scope;
        try {
            hook(failure);
        } catch (const std::exception &e) {
            write_default(failure, std::cerr);
            write_hook_failure(e.what());
        } catch (...) {
            write_default(failure, std::cerr);
            write_hook_failure("unknown non-standard exception");
        }
    }

    void UnraisableChannel::write_default(const ObserverFailure &failure, std::ostream &os) noexcept {
        try {
            os << failure.to_string() << std::endl;
        } catch (const std::exception &) {
            // Nothing left to report through
        }
    }

} // namespace objwatch
