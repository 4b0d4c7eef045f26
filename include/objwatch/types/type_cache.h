//
// TypeAttributeCache - runtime-wide cache of type attribute lookups keyed by (version tag, name).
//

#ifndef OBJWATCH_TYPE_CACHE_H
#define OBJWATCH_TYPE_CACHE_H

#include <objwatch/objwatch_base.h>
#include <objwatch/types/value.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace objwatch {

    /**
     * Direct-mapped cache of MRO lookups. An entry is only valid for the version tag it was stored under; version
     * tags are never reused, so invalidating a type's tag is enough to retire all of its entries. Misses are
     * cached too (an empty optional).
     *
     * Entries never own objects: an object result is held weakly and a tuple result holding objects is not cached,
     * so deleting an attribute and dropping the last reference destroys the object straight away.
     *
     * Not thread safe, owned by a Runtime and used from the thread mutating the runtime's types.
     */
    class OBJWATCH_EXPORT TypeAttributeCache {
    public:
        /**
         * @param size number of entries, must be a power of two
         */
        explicit TypeAttributeCache(size_t size);

        /**
         * @return true on a hit for (version_tag, name), with the cached lookup result written to result
         */
        [[nodiscard]] bool find(uint32_t version_tag, std::string_view name, std::optional<Value> &result) const;

        void store(uint32_t version_tag, std::string_view name, const std::optional<Value> &value);

        [[nodiscard]] size_t size() const noexcept { return _entries.size(); }

        [[nodiscard]] size_t hits() const noexcept { return _hits; }

        [[nodiscard]] size_t misses() const noexcept { return _misses; }

    private:
        struct Entry {
            uint32_t version_tag{0}; // 0 marks an empty entry
            std::string name;
            bool holds_object{false};
            std::optional<Value> value;
            std::weak_ptr<Object> object; // used instead of value when holds_object
        };

        [[nodiscard]] size_t _index(uint32_t version_tag, std::string_view name) const noexcept;

        std::vector<Entry> _entries;
        size_t _mask;
        mutable size_t _hits{0};
        mutable size_t _misses{0};
    };

} // namespace objwatch

#endif // OBJWATCH_TYPE_CACHE_H
