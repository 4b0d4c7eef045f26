#pragma once

#include <objwatch/runtime/watcher_context.h>

#include <optional>
#include <string>

namespace objwatch {

    /**
     * @brief Logs every watcher event of the selected kinds.
     *
     * This is voluminous but can be helpful tracing down unexpected mutations. The trace registers one watcher per
     * enabled kind when constructed (so it occupies a slot in each of those registries) and clears them again when
     * destroyed. Dicts and types still have to be watched explicitly, see watch(); code and function events are
     * seen for every object.
     */
    class OBJWATCH_EXPORT WatcherTrace {
    public:
        /**
         * @brief Construct a new Watcher Trace object
         *
         * @param context The watcher context to install into
         * @param filter Used to restrict which objects to report (substring match on the object's repr)
         * @param dict Log dict events
         * @param type Log type events
         * @param code Log code events
         * @param function Log function events
         */
        explicit WatcherTrace(WatcherContext &context, const std::optional<std::string> &filter = std::nullopt,
                              bool dict = true, bool type = true, bool code = true, bool function = true);

        WatcherTrace(const WatcherTrace &) = delete;

        WatcherTrace &operator=(const WatcherTrace &) = delete;

        ~WatcherTrace();

        /**
         * @brief Subscribe the trace's watcher for the object's kind to the object.
         * @throws std::invalid_argument when logging for that kind is disabled
         */
        void watch(Object &object);

        void unwatch(Object &object);

        [[nodiscard]] std::optional<int> watcher_id(ObjectKind kind) const noexcept;

        // Static configuration
        static void set_use_logger(bool value);

    private:
        WatcherContext &_context;
        std::optional<std::string> _filter;
        std::optional<int> _dict_id;
        std::optional<int> _type_id;
        std::optional<int> _code_id;
        std::optional<int> _function_id;

        static bool _use_logger;

        void _print(ObjectKind kind, const std::string &msg) const;
        bool _should_log(const std::string &repr) const;
        void _release() noexcept;
        int _require(ObjectKind kind) const;
    };

} // namespace objwatch
