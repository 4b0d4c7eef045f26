#include <objwatch/runtime/runtime.h>
#include <objwatch/types/code_object.h>
#include <objwatch/types/function_object.h>
#include <objwatch/util/errors.h>

#include <utility>

namespace objwatch {

    FunctionObject::FunctionObject(Runtime &runtime, ObjectId id, code_ptr code, std::string qualname)
        : Object(runtime, ObjectKind::Function, id), _code(std::move(code)) {
        if (!_code) { throw TypeError("function() argument 'code' must be code, not None"); }
        _name = _code->name();
        _qualname = qualname.empty() ? _code->qualname() : std::move(qualname);
    }

    void FunctionObject::set_code(code_ptr code) {
        if (!code) { throw TypeError("__code__ must be set to a code object"); }
        code_ptr previous = std::exchange(_code, code);
        _notify(FunctionEvent::ModifiedCode, Value(std::move(code)));
    }

    void FunctionObject::set_defaults(Value defaults) {
        if (!defaults.is_none() && !defaults.is_tuple()) {
            throw TypeError("__defaults__ must be set to a tuple object");
        }
        Value previous = std::exchange(_defaults, defaults);
        _notify(FunctionEvent::ModifiedDefaults, defaults);
    }

    void FunctionObject::set_kwdefaults(Value kwdefaults) {
        if (!kwdefaults.is_none() && !kwdefaults.is_object(ObjectKind::Dict)) {
            throw TypeError("__kwdefaults__ must be set to a dict object");
        }
        Value previous = std::exchange(_kwdefaults, kwdefaults);
        _notify(FunctionEvent::ModifiedKwDefaults, kwdefaults);
    }

    Value FunctionObject::get_attribute(std::string_view name) const {
        if (name == "__code__") { return Value(_code); }
        if (name == "__defaults__") { return _defaults; }
        if (name == "__kwdefaults__") { return _kwdefaults; }
        if (name == "__name__") { return Value(_name); }
        if (name == "__qualname__") { return Value(_qualname); }
        throw_error<AttributeError>("'function' object has no attribute '{}'", name);
    }

    void FunctionObject::set_attribute(std::string_view name, Value value) {
        if (name == "__code__") {
            if (!value.is_object(ObjectKind::Code)) { throw TypeError("__code__ must be set to a code object"); }
            set_code(value.as<CodeObject>());
        } else if (name == "__defaults__") {
            set_defaults(std::move(value));
        } else if (name == "__kwdefaults__") {
            set_kwdefaults(std::move(value));
        } else if (name == "__name__" || name == "__qualname__") {
            if (!value.is_string()) { throw_error<TypeError>("{} must be set to a string object", name); }
            (name == "__name__" ? _name : _qualname) = value.as_string();
        } else {
            throw_error<AttributeError>("'function' object has no attribute '{}'", name);
        }
    }

    void FunctionObject::del_attribute(std::string_view name) {
        if (name == "__defaults__") {
            set_defaults(Value::none());
        } else if (name == "__kwdefaults__") {
            set_kwdefaults(Value::none());
        } else if (name == "__code__" || name == "__name__" || name == "__qualname__") {
            throw_error<TypeError>("cannot delete {}", name);
        } else {
            throw_error<AttributeError>("'function' object has no attribute '{}'", name);
        }
    }

    std::string FunctionObject::repr() const { return fmt::format("<function {} at {}>", _qualname, id()); }

    void FunctionObject::on_dealloc() noexcept { runtime().watchers().notify_function_destroyed(*this); }

    void FunctionObject::_notify(FunctionEvent event, const Value &new_value) const noexcept {
        runtime().watchers().notify_function(event, *this, &new_value);
    }

} // namespace objwatch
