#pragma once

/**
 * @file watcher_mask.h
 * @brief WatcherMask - one bit per watcher slot.
 *
 * Every watched object carries a WatcherMask instead of a list of callbacks, which keeps the per-object
 * overhead to a single byte and makes the "is anybody interested" test on a mutation path a single load.
 */

#include <bit>
#include <cstdint>

namespace objwatch {

    class WatcherMask {
    public:
        static constexpr int capacity = 8;

        constexpr WatcherMask() noexcept = default;

        constexpr explicit WatcherMask(uint8_t bits) noexcept : _bits(bits) {}

        [[nodiscard]] constexpr uint8_t bits() const noexcept { return _bits; }

        [[nodiscard]] constexpr bool any() const noexcept { return _bits != 0; }

        [[nodiscard]] constexpr bool none() const noexcept { return _bits == 0; }

        [[nodiscard]] constexpr bool test(int slot) const noexcept { return (_bits >> slot) & 1u; }

        [[nodiscard]] constexpr int count() const noexcept { return std::popcount(_bits); }

        constexpr void set(int slot) noexcept { _bits = static_cast<uint8_t>(_bits | (1u << slot)); }

        constexpr void reset(int slot) noexcept { _bits = static_cast<uint8_t>(_bits & ~(1u << slot)); }

        constexpr void clear() noexcept { _bits = 0; }

        [[nodiscard]] constexpr WatcherMask operator&(WatcherMask other) const noexcept {
            return WatcherMask(static_cast<uint8_t>(_bits & other._bits));
        }

        [[nodiscard]] constexpr WatcherMask operator~() const noexcept {
            return WatcherMask(static_cast<uint8_t>(~_bits));
        }

        constexpr bool operator==(const WatcherMask &) const noexcept = default;

        /**
         * @brief Mask with the low n bits set (the slots of a registry of capacity n).
         */
        [[nodiscard]] static constexpr WatcherMask first(int n) noexcept {
            return WatcherMask(static_cast<uint8_t>(n >= capacity ? 0xFFu : (1u << n) - 1u));
        }

    private:
        uint8_t _bits{0};
    };

} // namespace objwatch
