#include <objwatch/python/py_objwatch.h>
#include <objwatch/runtime/watch_events.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/dict_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/types/type_object.h>
#include <objwatch/util/errors.h>

namespace objwatch {

    namespace {
        nb::object get_or_default(const std::optional<Value> &value, nb::handle default_value) {
            return value ? value_to_python(*value) : nb::borrow(default_value);
        }
    } // namespace

    void export_object_model(nb::module_ &m) {
        nb::class_<ObjectId>(m, "ObjectId")
            .def_prop_ro("index", &ObjectId::index)
            .def_prop_ro("generation", &ObjectId::generation)
            .def_prop_ro("value", &ObjectId::value)
            .def("__eq__", [](const ObjectId &self, const ObjectId &other) { return self == other; })
            .def("__hash__", [](const ObjectId &self) { return std::hash<ObjectId>{}(self); })
            .def("__repr__", [](const ObjectId &self) { return fmt::format("ObjectId({})", self); });

        nb::enum_<ObjectKind>(m, "ObjectKind")
            .value("DICT", ObjectKind::Dict)
            .value("TYPE", ObjectKind::Type)
            .value("CODE", ObjectKind::Code)
            .value("FUNCTION", ObjectKind::Function);

        nb::enum_<DictEvent>(m, "DictEvent")
            .value("ADDED", DictEvent::New)
            .value("MODIFIED", DictEvent::Modified)
            .value("DELETED", DictEvent::Deleted)
            .value("CLEARED", DictEvent::Cleared)
            .value("CLONED", DictEvent::Cloned)
            .value("DEALLOCATED", DictEvent::Deallocated);

        nb::enum_<TypeEvent>(m, "TypeEvent").value("MODIFIED", TypeEvent::Modified);

        nb::enum_<CodeEvent>(m, "CodeEvent")
            .value("CREATE", CodeEvent::Created)
            .value("DESTROY", CodeEvent::Destroyed);

        nb::enum_<FunctionEvent>(m, "FunctionEvent")
            .value("CREATE", FunctionEvent::Created)
            .value("MODIFY_CODE", FunctionEvent::ModifiedCode)
            .value("MODIFY_DEFAULTS", FunctionEvent::ModifiedDefaults)
            .value("MODIFY_KWDEFAULTS", FunctionEvent::ModifiedKwDefaults)
            .value("DESTROY", FunctionEvent::Destroyed);

        nb::class_<Object>(m, "Object")
            .def_prop_ro("kind", &Object::kind)
            .def_prop_ro("id", &Object::id)
            .def_prop_ro("watcher_mask", [](const Object &self) { return self.watcher_mask().bits(); })
            .def("__repr__", &Object::repr);

        nb::class_<DictObject, Object>(m, "Dict")
            .def("__len__", &DictObject::size)
            .def("__contains__",
                 [](const DictObject &self, nb::handle key) { return self.contains(value_from_python(key)); })
            .def("__getitem__",
                 [](const DictObject &self, nb::handle key) {
                     return value_to_python(self.get_item(value_from_python(key)));
                 })
            .def("__setitem__",
                 [](DictObject &self, nb::handle key, nb::handle value) {
                     self.set_item(value_from_python(key), value_from_python(value));
                 })
            .def("__delitem__", [](DictObject &self, nb::handle key) { self.del_item(value_from_python(key)); })
            .def(
                "get",
                [](const DictObject &self, nb::handle key, nb::handle default_value) {
                    return get_or_default(self.get(value_from_python(key)), default_value);
                },
                "key"_a, "default"_a = nb::none())
            .def("keys",
                 [](const DictObject &self) {
                     nb::list result;
                     for (const auto &key : self.keys()) { result.append(value_to_python(key)); }
                     return result;
                 })
            .def("items",
                 [](const DictObject &self) {
                     nb::list result;
                     for (const auto &[key, value] : self.items()) {
                         result.append(nb::make_tuple(value_to_python(key), value_to_python(value)));
                     }
                     return result;
                 })
            .def(
                "pop",
                [](DictObject &self, nb::handle key, std::optional<nb::object> default_value) -> nb::object {
                    auto value = self.pop(value_from_python(key));
                    if (value) { return value_to_python(*value); }
                    if (default_value) { return *default_value; }
                    throw KeyError(std::string(nb::repr(key).c_str()));
                },
                "key"_a, "default"_a = nb::none())
            .def("popitem",
                 [](DictObject &self) {
                     auto [key, value] = self.popitem();
                     return nb::make_tuple(value_to_python(key), value_to_python(value));
                 })
            .def(
                "setdefault",
                [](DictObject &self, nb::handle key, nb::handle default_value) {
                    return value_to_python(self.setdefault(value_from_python(key), value_from_python(default_value)));
                },
                "key"_a, "default"_a = nb::none())
            .def("clear", &DictObject::clear)
            .def("update", &DictObject::update, "other"_a)
            .def("copy", &DictObject::copy);

        nb::class_<TypeObject, Object>(m, "Type")
            .def_prop_ro("__name__", &TypeObject::name)
            .def_prop_ro("__bases__", &TypeObject::bases)
            .def_prop_ro("__mro__",
                         [](const TypeObject &self) {
                             nb::list result;
                             for (auto *type : self.mro()) { result.append(object_to_python(*type)); }
                             return nb::tuple(result);
                         })
            .def_prop_ro("version_tag", &TypeObject::version_tag)
            .def("__subclasses__", &TypeObject::subclasses)
            .def("is_subtype", &TypeObject::is_subtype, "other"_a)
            .def(
                "lookup",
                [](TypeObject &self, std::string_view name, nb::handle default_value) {
                    return get_or_default(self.lookup(name), default_value);
                },
                "name"_a, "default"_a = nb::none())
            .def("__getattr__",
                 [](TypeObject &self, std::string_view name) { return value_to_python(self.get_attribute(name)); })
            .def("__setattr__",
                 [](TypeObject &self, std::string_view name, nb::handle value) {
                     self.set_attribute(name, value_from_python(value));
                 })
            .def("__delattr__", &TypeObject::del_attribute)
            .def("modified", &TypeObject::modified);

        nb::class_<CodeObject, Object>(m, "Code")
            .def_prop_ro("co_name", &CodeObject::name)
            .def_prop_ro("co_qualname", &CodeObject::qualname)
            .def_prop_ro("co_filename", &CodeObject::filename)
            .def_prop_ro("co_firstlineno", &CodeObject::first_line);

        nb::class_<FunctionObject, Object>(m, "Function")
            .def("__getattr__",
                 [](const FunctionObject &self, std::string_view name) {
                     return value_to_python(self.get_attribute(name));
                 })
            .def("__setattr__",
                 [](FunctionObject &self, std::string_view name, nb::handle value) {
                     self.set_attribute(name, value_from_python(value));
                 })
            .def("__delattr__", &FunctionObject::del_attribute)
            .def("set_code", &FunctionObject::set_code, "code"_a)
            .def("set_defaults",
                 [](FunctionObject &self, nb::handle value) { self.set_defaults(value_from_python(value)); })
            .def("set_kwdefaults",
                 [](FunctionObject &self, nb::handle value) { self.set_kwdefaults(value_from_python(value)); });
    }

} // namespace objwatch
