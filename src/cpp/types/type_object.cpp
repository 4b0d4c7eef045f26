#include <objwatch/runtime/runtime.h>
#include <objwatch/types/type_cache.h>
#include <objwatch/types/type_object.h>
#include <objwatch/util/errors.h>

#include <algorithm>
#include <utility>

namespace objwatch {

    TypeObject::TypeObject(Runtime &runtime, ObjectId id, std::string name, std::vector<type_ptr> bases)
        : Object(runtime, ObjectKind::Type, id), _name(std::move(name)), _bases(std::move(bases)) {
        for (size_t i = 0; i < _bases.size(); ++i) {
            if (!_bases[i]) { throw_error<TypeError>("bases of '{}' must be types, got None at {}", _name, i); }
            for (size_t j = 0; j < i; ++j) {
                if (_bases[j] == _bases[i]) { throw_error<TypeError>("duplicate base class {}", _bases[i]->name()); }
            }
        }
        _mro = _linearise(this, _bases);
    }

    std::vector<type_ptr> TypeObject::subclasses() const {
        std::vector<type_ptr> result;
        result.reserve(_subclasses.size());
        for (const auto &weak : _subclasses) {
            if (auto subclass = weak.lock()) { result.push_back(std::move(subclass)); }
        }
        return result;
    }

    bool TypeObject::is_subtype(const TypeObject &other) const noexcept {
        return std::find(_mro.begin(), _mro.end(), &other) != _mro.end();
    }

    bool TypeObject::assign_version_tag() {
        if (_version_tag != 0) { return true; }
        // A type can only be cached while every type its lookups read through is cached as well
        for (const auto &base : _bases) {
            if (!base->assign_version_tag()) { return false; }
        }
        const uint32_t tag = runtime().next_version_tag();
        if (tag == 0) { return false; }
        _version_tag = tag;
        return true;
    }

    std::optional<Value> TypeObject::lookup(std::string_view name) {
        if (!assign_version_tag()) { return _find_in_mro(name); }

        auto &cache = runtime().type_cache();
        std::optional<Value> result;
        if (cache.find(_version_tag, name, result)) { return result; }
        result = _find_in_mro(name);
        cache.store(_version_tag, name, result);
        return result;
    }

    Value TypeObject::get_attribute(std::string_view name) {
        if (auto value = lookup(name)) { return std::move(*value); }
        throw_error<AttributeError>("type object '{}' has no attribute '{}'", _name, name);
    }

    void TypeObject::set_attribute(std::string_view name, Value value) {
        if (auto it = _attributes.find(name); it != _attributes.end()) {
            Value previous = std::exchange(it->second, std::move(value));
        } else {
            _attributes.emplace(std::string(name), std::move(value));
        }
        modified();
    }

    void TypeObject::del_attribute(std::string_view name) {
        auto it = _attributes.find(name);
        if (it == _attributes.end()) {
            throw_error<AttributeError>("type object '{}' has no attribute '{}'", _name, name);
        }
        Value previous = std::move(it->second);
        _attributes.erase(it);
        modified();
    }

    std::optional<Value> TypeObject::own_attribute(std::string_view name) const {
        if (auto it = _attributes.find(name); it != _attributes.end()) { return it->second; }
        return std::nullopt;
    }

    void TypeObject::modified() {
        if (_version_tag == 0) { return; }
        // Invalidate before anything observable runs: a callback that looks the type up starts a new epoch
        _version_tag = 0;

        for (const auto &subclass : subclasses()) { subclass->modified(); }

        if (watcher_mask().any()) { runtime().watchers().notify_type_modified(*this); }
    }

    std::string TypeObject::repr() const { return fmt::format("<class '{}'>", _name); }

    void TypeObject::_add_subclass(const type_ptr &subclass) {
        std::erase_if(_subclasses, [](const std::weak_ptr<TypeObject> &weak) { return weak.expired(); });
        _subclasses.emplace_back(subclass);
    }

    std::optional<Value> TypeObject::_find_in_mro(std::string_view name) const {
        for (const auto *type : _mro) {
            if (auto it = type->_attributes.find(name); it != type->_attributes.end()) { return it->second; }
        }
        return std::nullopt;
    }

    std::vector<TypeObject *> TypeObject::_linearise(TypeObject *self, const std::vector<type_ptr> &bases) {
        std::vector<std::vector<TypeObject *>> sequences;
        sequences.reserve(bases.size() + 1);
        std::vector<TypeObject *> direct;
        for (const auto &base : bases) {
            sequences.push_back(base->_mro);
            direct.push_back(base.get());
        }
        sequences.push_back(std::move(direct));

        std::vector<TypeObject *> result{self};
        while (true) {
            std::erase_if(sequences, [](const auto &sequence) { return sequence.empty(); });
            if (sequences.empty()) { return result; }

            TypeObject *next = nullptr;
            for (const auto &sequence : sequences) {
                auto *head = sequence.front();
                const bool in_tail = std::any_of(sequences.begin(), sequences.end(), [head](const auto &other) {
                    return std::find(other.begin() + 1, other.end(), head) != other.end();
                });
                if (!in_tail) {
                    next = head;
                    break;
                }
            }
            if (next == nullptr) {
                std::vector<std::string> names;
                for (const auto &base : bases) { names.push_back(base->name()); }
                throw_error<TypeError>("Cannot create a consistent method resolution order (MRO) for bases {}",
                                       fmt::join(names, ", "));
            }
            result.push_back(next);
            for (auto &sequence : sequences) {
                if (sequence.front() == next) { sequence.erase(sequence.begin()); }
            }
        }
    }

} // namespace objwatch
