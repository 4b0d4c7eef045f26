//
// TypeObject - class descriptor with an attribute table, a C3 MRO and a version tag.
//

#ifndef OBJWATCH_TYPE_OBJECT_H
#define OBJWATCH_TYPE_OBJECT_H

#include <objwatch/types/object.h>
#include <objwatch/types/value.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace objwatch {

    /**
     * A type owns its attribute table and holds its bases alive; subclasses are tracked weakly.
     *
     * The version tag doubles as the watcher dirty flag. A non-zero tag means lookups through this type may be
     * served from the runtime's attribute cache and that the next modification has not been reported yet. The
     * first modification in an epoch zeroes the tag (for the type and all live subclasses) and reports once;
     * further modifications find the tag already zero and are aggregated. A lookup assigns a fresh tag and so
     * starts the next epoch.
     */
    class OBJWATCH_EXPORT TypeObject final : public Object {
    public:
        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        [[nodiscard]] const std::vector<type_ptr> &bases() const noexcept { return _bases; }

        /**
         * Method resolution order, starting with this type.
         */
        [[nodiscard]] const std::vector<TypeObject *> &mro() const noexcept { return _mro; }

        [[nodiscard]] std::vector<type_ptr> subclasses() const;

        [[nodiscard]] bool is_subtype(const TypeObject &other) const noexcept;

        [[nodiscard]] uint32_t version_tag() const noexcept { return _version_tag; }

        [[nodiscard]] bool has_valid_version_tag() const noexcept { return _version_tag != 0; }

        /**
         * Make sure this type and its bases carry a valid tag. Returns false once the runtime has run out of tags.
         */
        bool assign_version_tag();

        /**
         * Resolve the attribute through the MRO, using the runtime's attribute cache where possible.
         */
        [[nodiscard]] std::optional<Value> lookup(std::string_view name);

        /**
         * @throws AttributeError when no type in the MRO defines the attribute
         */
        [[nodiscard]] Value get_attribute(std::string_view name);

        void set_attribute(std::string_view name, Value value);

        /**
         * @throws AttributeError when the attribute is not defined on this type itself
         */
        void del_attribute(std::string_view name);

        // This type's own attributes (not the inherited ones)
        [[nodiscard]] std::optional<Value> own_attribute(std::string_view name) const;

        /**
         * Invalidate the version tag of this type and every live subclass, reporting Modified to the watchers of
         * each type whose tag was valid.
         */
        void modified();

        [[nodiscard]] std::string repr() const override;

    private:
        friend class Runtime;

        struct NameHash {
            using is_transparent = void;

            size_t operator()(std::string_view name) const noexcept { return std::hash<std::string_view>{}(name); }
        };

        TypeObject(Runtime &runtime, ObjectId id, std::string name, std::vector<type_ptr> bases);

        void _add_subclass(const type_ptr &subclass);

        [[nodiscard]] std::optional<Value> _find_in_mro(std::string_view name) const;

        static std::vector<TypeObject *> _linearise(TypeObject *self, const std::vector<type_ptr> &bases);

        std::string _name;
        std::vector<type_ptr> _bases;
        std::vector<TypeObject *> _mro;
        std::vector<std::weak_ptr<TypeObject>> _subclasses;
        std::unordered_map<std::string, Value, NameHash, std::equal_to<>> _attributes;
        uint32_t _version_tag{0};
    };

} // namespace objwatch

#endif // OBJWATCH_TYPE_OBJECT_H
