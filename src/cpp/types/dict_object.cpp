#include <objwatch/runtime/runtime.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/util/errors.h>

#include <cmath>
#include <utility>

namespace objwatch {

    DictObject::DictObject(Runtime &runtime, ObjectId id) : Object(runtime, ObjectKind::Dict, id) {}

    bool DictObject::contains(const Value &key) const { return _find(key).has_value(); }

    const Value &DictObject::get_item(const Value &key) const {
        if (auto index = _find(key)) { return _items[*index].second; }
        throw_error<KeyError>("{}", key);
    }

    std::optional<Value> DictObject::get(const Value &key) const {
        if (auto index = _find(key)) { return _items[*index].second; }
        return std::nullopt;
    }

    std::vector<Value> DictObject::keys() const {
        std::vector<Value> result;
        result.reserve(_items.size());
        for (const auto &[key, _] : _items) { result.push_back(key); }
        return result;
    }

    void DictObject::set_item(Value key, Value value) {
        _check_hashable(key);
        if (auto index = _find(key)) {
            auto &current = _items[*index].second;
            if (current.is(value)) { return; }
            Value previous = std::exchange(current, value);
            _notify(DictEvent::Modified, &key, &value);
            return;
        }
        _items.emplace_back(key, value);
        try {
            _index.emplace(_items.back().first, _items.size() - 1);
        } catch (...) {
            _items.pop_back();
            throw;
        }
        _notify(DictEvent::New, &key, &value);
    }

    void DictObject::del_item(const Value &key) {
        auto index = _find(key);
        if (!index) { throw_error<KeyError>("{}", key); }
        auto removed = _erase_at(*index);
        _notify(DictEvent::Deleted, &removed.first, nullptr);
    }

    std::optional<Value> DictObject::pop(const Value &key) {
        auto index = _find(key);
        if (!index) { return std::nullopt; }
        auto removed = _erase_at(*index);
        _notify(DictEvent::Deleted, &removed.first, nullptr);
        return std::move(removed.second);
    }

    Value DictObject::pop(const Value &key, Value default_value) {
        auto value = pop(key);
        return value ? std::move(*value) : std::move(default_value);
    }

    DictObject::item_type DictObject::popitem() {
        if (_items.empty()) { throw KeyError("popitem(): dictionary is empty"); }
        auto removed = _erase_at(_items.size() - 1);
        _notify(DictEvent::Deleted, &removed.first, nullptr);
        return removed;
    }

    Value DictObject::setdefault(Value key, Value default_value) {
        if (auto index = _find(key)) { return _items[*index].second; }
        set_item(key, default_value);
        return default_value;
    }

    void DictObject::clear() {
        // Items are released after the event, the callbacks observe an already empty dict
        std::vector<item_type> released;
        released.swap(_items);
        _index.clear();
        _notify(DictEvent::Cleared, nullptr, nullptr);
    }

    void DictObject::update(const DictObject &other) {
        if (&other == this || other.empty()) { return; }
        if (_items.empty()) {
            _items = other._items;
            try {
                _rebuild_index();
            } catch (...) {
                _items.clear();
                _index.clear();
                throw;
            }
            _notify(DictEvent::Cloned, nullptr, nullptr);
            return;
        }
        // Callbacks may mutate either dict while we merge
        const std::vector<item_type> incoming = other._items;
        for (const auto &[key, value] : incoming) { set_item(key, value); }
    }

    dict_ptr DictObject::copy() const {
        auto result = runtime().new_dict();
        result->_items = _items;
        result->_rebuild_index();
        return result;
    }

    std::string DictObject::repr() const { return fmt::format("<dict at {}>", id()); }

    void DictObject::on_dealloc() noexcept { _notify(DictEvent::Deallocated, nullptr, nullptr); }

    void DictObject::_notify(DictEvent event, const Value *key, const Value *new_value) const noexcept {
        // Unwatched dicts do no dispatch work at all
        if (watcher_mask().none()) { return; }
        runtime().watchers().notify_dict(event, *this, key, new_value);
    }

    std::optional<size_t> DictObject::_find(const Value &key) const {
        auto it = _index.find(key);
        if (it == _index.end()) { return std::nullopt; }
        return it->second;
    }

    void DictObject::_check_hashable(const Value &key) {
        if (key.is_object(ObjectKind::Dict)) { throw TypeError("unhashable type: 'dict'"); }
        // NaN never compares equal to itself, such a key could be stored but never found or removed again
        if (key.is_float() && std::isnan(key.as_float())) { throw TypeError("unsupported key: nan"); }
        if (key.is_tuple()) {
            for (const auto &item : key.as_tuple()) { _check_hashable(item); }
        }
    }

    DictObject::item_type DictObject::_erase_at(size_t index) {
        _index.erase(_items[index].first);
        item_type removed = std::move(_items[index]);
        const size_t last = _items.size() - 1;
        if (index != last) {
            _items[index] = std::move(_items[last]);
            _index[_items[index].first] = index;
        }
        _items.pop_back();
        return removed;
    }

    void DictObject::_rebuild_index() {
        _index.clear();
        _index.reserve(_items.size());
        for (size_t i = 0; i < _items.size(); ++i) { _index.emplace(_items[i].first, i); }
    }

} // namespace objwatch
