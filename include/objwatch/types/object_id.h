#pragma once

/**
 * @file object_id.h
 * @brief ObjectId - stable, generation-stamped identity of a runtime object.
 *
 * An ObjectId names an arena slot in the ObjectHeap together with the generation the slot had
 * when the object was allocated. Once the object is released the slot's generation moves on, so
 * the id can still be compared, hashed and printed (e.g. in a destroy event) but never resolves
 * to whatever occupies the slot next.
 */

#include <fmt/format.h>

#include <cstdint>
#include <functional>

namespace objwatch {

    class ObjectId {
    public:
        constexpr ObjectId() noexcept = default;

        constexpr ObjectId(uint32_t index, uint32_t generation) noexcept : _index(index), _generation(generation) {}

        [[nodiscard]] constexpr uint32_t index() const noexcept { return _index; }

        [[nodiscard]] constexpr uint32_t generation() const noexcept { return _generation; }

        /**
         * @brief The id packed into a single integer (generation in the high word).
         */
        [[nodiscard]] constexpr uint64_t value() const noexcept {
            return (static_cast<uint64_t>(_generation) << 32) | _index;
        }

        // Generation 0 is never handed out by the heap
        [[nodiscard]] constexpr bool valid() const noexcept { return _generation != 0; }

        constexpr bool operator==(const ObjectId &) const noexcept = default;

    private:
        uint32_t _index{0};
        uint32_t _generation{0};
    };

} // namespace objwatch

template<>
struct std::hash<objwatch::ObjectId> {
    size_t operator()(const objwatch::ObjectId &id) const noexcept { return std::hash<uint64_t>{}(id.value()); }
};

template<>
struct fmt::formatter<objwatch::ObjectId> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const objwatch::ObjectId &id, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "#{}:{}", id.index(), id.generation());
    }
};
