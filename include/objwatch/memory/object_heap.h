#pragma once

/**
 * @file object_heap.h
 * @brief ObjectHeap - arena of identity slots for runtime objects.
 *
 * The heap does not own object storage; it hands out ObjectIds and maps live ids back to their objects.
 * A slot's generation is bumped when the slot is released, so ids of destroyed objects stay unique and
 * resolve to nothing, even after the slot has been reused.
 */

#include <objwatch/objwatch_base.h>
#include <objwatch/types/object.h>

#include <mutex>
#include <vector>

namespace objwatch {

    class OBJWATCH_EXPORT ObjectHeap {
    public:
        ObjectHeap() = default;

        ObjectHeap(const ObjectHeap &) = delete;

        ObjectHeap &operator=(const ObjectHeap &) = delete;

        /**
         * @brief Allocate an identity; the slot resolves to nothing until bind() is called.
         */
        [[nodiscard]] ObjectId reserve();

        /**
         * @brief Attach the constructed object to its reserved id.
         * @throws std::invalid_argument if the id is not a reserved, unbound slot
         */
        void bind(ObjectId id, Object *object);

        /**
         * @brief Retire the id. Stale or unknown ids are ignored.
         */
        void release(ObjectId id) noexcept;

        /**
         * @return the live object for the id, or nullptr for a stale, unbound or unknown id
         */
        [[nodiscard]] Object *resolve(ObjectId id) const noexcept;

        [[nodiscard]] size_t live_count() const noexcept;

        // Number of slots ever allocated (live + free)
        [[nodiscard]] size_t slot_count() const noexcept;

        /**
         * @brief Call fn(Object&) for every bound object of the kind.
         *
         * The heap lock is held for the duration, fn must not create or destroy objects.
         */
        template<typename Fn>
        void for_each_live(ObjectKind kind, Fn &&fn) const {
            std::lock_guard<std::mutex> lock(_mutex);
            for (const auto &slot : _slots) {
                if (slot.object != nullptr && slot.object->kind() == kind) { fn(*slot.object); }
            }
        }

    private:
        struct Slot {
            uint32_t generation{1};
            Object *object{nullptr};
            bool in_use{false};
        };

        mutable std::mutex _mutex;
        std::vector<Slot> _slots;
        std::vector<uint32_t> _free;
        size_t _live{0};
    };

} // namespace objwatch
