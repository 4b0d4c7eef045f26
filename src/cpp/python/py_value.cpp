#include <objwatch/python/py_objwatch.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/types/type_object.h>
#include <objwatch/util/errors.h>

namespace objwatch {

    namespace {
        // Python always receives an owning handle, a borrowed wrapper would outlive the object once retained
        nb::object cast_object(const object_ptr &object) {
            switch (object->kind()) {
                case ObjectKind::Dict: return nb::cast(std::static_pointer_cast<DictObject>(object));
                case ObjectKind::Type: return nb::cast(std::static_pointer_cast<TypeObject>(object));
                case ObjectKind::Code: return nb::cast(std::static_pointer_cast<CodeObject>(object));
                case ObjectKind::Function: return nb::cast(std::static_pointer_cast<FunctionObject>(object));
            }
            return nb::none();
        }
    } // namespace

    Value value_from_python(nb::handle obj) {
        if (obj.is_none()) { return Value::none(); }
        // bool before int, bool is an int subclass in Python
        if (nb::isinstance<nb::bool_>(obj)) { return Value(nb::cast<bool>(obj)); }
        if (nb::isinstance<nb::int_>(obj)) { return Value(nb::cast<int64_t>(obj)); }
        if (nb::isinstance<nb::float_>(obj)) { return Value(nb::cast<double>(obj)); }
        if (nb::isinstance<nb::str>(obj)) { return Value(nb::cast<std::string>(obj)); }
        if (nb::isinstance<nb::tuple>(obj)) {
            Value::tuple_type items;
            for (auto item : nb::borrow<nb::tuple>(obj)) { items.push_back(value_from_python(item)); }
            return Value::tuple(std::move(items));
        }
        if (nb::isinstance<DictObject>(obj)) { return Value(nb::cast<dict_ptr>(obj)); }
        if (nb::isinstance<TypeObject>(obj)) { return Value(nb::cast<type_ptr>(obj)); }
        if (nb::isinstance<CodeObject>(obj)) { return Value(nb::cast<code_ptr>(obj)); }
        if (nb::isinstance<FunctionObject>(obj)) { return Value(nb::cast<function_ptr>(obj)); }
        throw_error<TypeError>("unsupported value type '{}'", nb::type_name(obj.type()).c_str());
    }

    nb::object value_to_python(const Value &value) {
        if (value.is_none()) { return nb::none(); }
        if (value.is_bool()) { return nb::bool_(value.as_bool()); }
        if (value.is_int()) { return nb::int_(value.as_int()); }
        if (value.is_float()) { return nb::float_(value.as_float()); }
        if (value.is_string()) { return nb::str(value.as_string().c_str(), value.as_string().size()); }
        if (value.is_tuple()) {
            nb::list items;
            for (const auto &item : value.as_tuple()) { items.append(value_to_python(item)); }
            return nb::tuple(items);
        }
        return cast_object(value.as_object());
    }

    nb::object object_to_python(const Object &object) {
        auto owner = std::const_pointer_cast<Object>(object.weak_from_this().lock());
        // Deallocating: only the identity is left to hand out
        if (!owner) { return nb::cast(object.id()); }
        return cast_object(owner);
    }

} // namespace objwatch
