#pragma once

#include <objwatch/objwatch_base.h>
#include <objwatch/runtime/watcher_mask.h>
#include <objwatch/types/object.h>

#include <cstddef>

namespace objwatch {

    /**
     * Default number of watcher slots for each kind. A registry can be configured smaller but never larger,
     * the per-object mask has one bit per slot.
     */
    inline constexpr int MAX_WATCHERS = WatcherMask::capacity;

    inline constexpr std::size_t DEFAULT_TYPE_CACHE_SIZE = 4096;

    struct OBJWATCH_EXPORT WatcherConfig {
        int dict_max_watchers{MAX_WATCHERS};
        int type_max_watchers{MAX_WATCHERS};
        int code_max_watchers{MAX_WATCHERS};
        int function_max_watchers{MAX_WATCHERS};

        /**
         * When set, clearing a dict or type watcher also clears that slot's bit on every live object of the kind, so
         * a later watcher reusing the slot id never inherits subscriptions made for the previous occupant. When
         * unset the bits are left behind and are inert until the slot is reused. Code and function opt-outs are
         * always scrubbed.
         */
        bool clear_subscriptions_on_clear{false};

        // Number of entries in the type attribute cache, must be a power of two.
        std::size_t type_cache_size{DEFAULT_TYPE_CACHE_SIZE};

        [[nodiscard]] int max_watchers(ObjectKind kind) const noexcept;

        /**
         * Throws std::invalid_argument describing the first out-of-range field.
         */
        void validate() const;
    };

} // namespace objwatch
