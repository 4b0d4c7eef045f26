//
// DictObject - the runtime's associative mapping.
//

#ifndef OBJWATCH_DICT_OBJECT_H
#define OBJWATCH_DICT_OBJECT_H

#include <objwatch/runtime/watch_events.h>
#include <objwatch/types/object.h>
#include <objwatch/types/value.h>

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace objwatch {

    /**
     * Hash map from Value keys to Values. Items are stored densely; erasing swaps the last item into the hole,
     * so iteration order is not insertion order.
     *
     * Every successful mutation dispatches exactly one dict event to the slots watching this dict, after the
     * mutation has been applied:
     *
     *   set_item / setdefault on a new key      New(key, value)
     *   set_item on an existing key             Modified(key, value), nothing if the value "is" the current one
     *   del_item / pop / popitem                Deleted(key)
     *   clear                                   Cleared
     *   update into an empty dict               Cloned (one event for the whole copy)
     *   update into a non-empty dict            New / Modified per changed key
     *   destruction                             Deallocated, the last thing observable on the dict
     *
     * Dicts are unhashable and cannot be used as keys (TypeError).
     */
    class OBJWATCH_EXPORT DictObject final : public Object {
    public:
        using item_type = std::pair<Value, Value>;

        [[nodiscard]] size_t size() const noexcept { return _items.size(); }

        [[nodiscard]] bool empty() const noexcept { return _items.empty(); }

        [[nodiscard]] bool contains(const Value &key) const;

        /**
         * @throws KeyError when the key is absent
         */
        [[nodiscard]] const Value &get_item(const Value &key) const;

        [[nodiscard]] std::optional<Value> get(const Value &key) const;

        [[nodiscard]] std::vector<Value> keys() const;

        [[nodiscard]] const std::vector<item_type> &items() const noexcept { return _items; }

        void set_item(Value key, Value value);

        /**
         * @throws KeyError when the key is absent
         */
        void del_item(const Value &key);

        /**
         * Remove the key and return its value, or nullopt (and no event) if it was absent.
         */
        std::optional<Value> pop(const Value &key);

        Value pop(const Value &key, Value default_value);

        /**
         * Remove and return the last stored item.
         * @throws KeyError when the dict is empty
         */
        item_type popitem();

        /**
         * Return the value for key, inserting default_value first if the key is absent.
         */
        Value setdefault(Value key, Value default_value);

        void clear();

        void update(const DictObject &other);

        /**
         * A new dict with the same items. The copy starts with no watchers.
         */
        [[nodiscard]] dict_ptr copy() const;

        [[nodiscard]] std::string repr() const override;

    protected:
        void on_dealloc() noexcept override;

    private:
        friend class Runtime;

        DictObject(Runtime &runtime, ObjectId id);

        void _notify(DictEvent event, const Value *key, const Value *new_value) const noexcept;

        [[nodiscard]] std::optional<size_t> _find(const Value &key) const;

        static void _check_hashable(const Value &key);

        // Swap-with-last erase, returns the removed item
        item_type _erase_at(size_t index);

        void _rebuild_index();

        std::vector<item_type> _items;
        std::unordered_map<Value, size_t, ValueHash> _index;
    };

} // namespace objwatch

#endif // OBJWATCH_DICT_OBJECT_H
