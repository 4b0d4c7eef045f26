#include <objwatch/memory/object_heap.h>
#include <objwatch/util/errors.h>

#include <limits>

namespace objwatch {

    ObjectId ObjectHeap::reserve() {
        std::lock_guard<std::mutex> lock(_mutex);
        uint32_t index;
        if (!_free.empty()) {
            index = _free.back();
            _free.pop_back();
        } else {
            if (_slots.size() >= std::numeric_limits<uint32_t>::max()) {
                throw std::length_error("ObjectHeap: identity space exhausted");
            }
            index = static_cast<uint32_t>(_slots.size());
            _slots.emplace_back();
            // release() is noexcept, make sure it never has to grow the free list
            _free.reserve(_slots.size());
        }
        auto &slot = _slots[index];
        slot.in_use = true;
        slot.object = nullptr;
        ++_live;
        return ObjectId(index, slot.generation);
    }

    void ObjectHeap::bind(ObjectId id, Object *object) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (id.index() >= _slots.size()) { throw_error<std::invalid_argument>("ObjectHeap::bind: unknown id {}", id); }
        auto &slot = _slots[id.index()];
        if (!slot.in_use || slot.generation != id.generation() || slot.object != nullptr) {
            throw_error<std::invalid_argument>("ObjectHeap::bind: id {} is not a reserved slot", id);
        }
        slot.object = object;
    }

    void ObjectHeap::release(ObjectId id) noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        if (id.index() >= _slots.size()) { return; }
        auto &slot = _slots[id.index()];
        if (!slot.in_use || slot.generation != id.generation()) { return; }
        slot.in_use = false;
        slot.object = nullptr;
        // Generation 0 marks an invalid id, skip it on wrap-around
        if (++slot.generation == 0) { slot.generation = 1; }
        --_live;
        _free.push_back(id.index());
    }

    Object *ObjectHeap::resolve(ObjectId id) const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        if (id.index() >= _slots.size()) { return nullptr; }
        const auto &slot = _slots[id.index()];
        return slot.in_use && slot.generation == id.generation() ? slot.object : nullptr;
    }

    size_t ObjectHeap::live_count() const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        return _live;
    }

    size_t ObjectHeap::slot_count() const noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        return _slots.size();
    }

} // namespace objwatch
