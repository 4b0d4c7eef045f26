#include <objwatch/types/type_cache.h>
#include <objwatch/util/errors.h>

#include <algorithm>
#include <bit>
#include <functional>

namespace objwatch {

    TypeAttributeCache::TypeAttributeCache(size_t size) : _entries(size), _mask(size - 1) {
        if (size == 0 || !std::has_single_bit(size)) {
            throw_error<std::invalid_argument>("type cache size must be a power of two, got {}", size);
        }
    }

    size_t TypeAttributeCache::_index(uint32_t version_tag, std::string_view name) const noexcept {
        const size_t h = std::hash<std::string_view>{}(name);
        return (static_cast<size_t>(version_tag) * 0x9e3779b9u ^ h) & _mask;
    }

    namespace {
        bool contains_objects(const Value &value) {
            if (value.is_object()) { return true; }
            if (!value.is_tuple()) { return false; }
            return std::any_of(value.as_tuple().begin(), value.as_tuple().end(), contains_objects);
        }
    } // namespace

    bool TypeAttributeCache::find(uint32_t version_tag, std::string_view name, std::optional<Value> &result) const {
        if (version_tag != 0) {
            const auto &entry = _entries[_index(version_tag, name)];
            if (entry.version_tag == version_tag && entry.name == name) {
                if (!entry.holds_object) {
                    result = entry.value;
                    ++_hits;
                    return true;
                }
                if (auto object = entry.object.lock()) {
                    result = Value(std::move(object));
                    ++_hits;
                    return true;
                }
            }
        }
        ++_misses;
        return false;
    }

    void TypeAttributeCache::store(uint32_t version_tag, std::string_view name, const std::optional<Value> &value) {
        if (version_tag == 0) { return; }
        // Not cacheable without owning the tuple's objects
        if (value && value->is_tuple() && contains_objects(*value)) { return; }

        auto &entry = _entries[_index(version_tag, name)];
        entry.version_tag = version_tag;
        entry.name.assign(name);
        entry.holds_object = value && value->is_object();
        if (entry.holds_object) {
            entry.object = value->as_object();
            entry.value.reset();
        } else {
            entry.object.reset();
            entry.value = value;
        }
    }

} // namespace objwatch
