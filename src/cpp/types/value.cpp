#include <objwatch/types/value.h>
#include <objwatch/util/errors.h>

#include <functional>

namespace objwatch {

    namespace {
        // Boost-style hash combine
        size_t hash_combine(size_t h1, size_t h2) { return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2)); }

        template<class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
    } // namespace

    Value Value::tuple(tuple_type items) {
        Value result;
        result._value = std::make_shared<const tuple_type>(std::move(items));
        return result;
    }

    bool Value::is_object(ObjectKind kind) const noexcept {
        auto *object = std::get_if<object_ptr>(&_value);
        return object != nullptr && *object && (*object)->kind() == kind;
    }

    bool Value::as_bool() const {
        if (auto *v = std::get_if<bool>(&_value)) { return *v; }
        _type_error("bool");
    }

    int64_t Value::as_int() const {
        if (auto *v = std::get_if<int64_t>(&_value)) { return *v; }
        _type_error("int");
    }

    double Value::as_float() const {
        if (auto *v = std::get_if<double>(&_value)) { return *v; }
        _type_error("float");
    }

    const std::string &Value::as_string() const {
        if (auto *v = std::get_if<std::string>(&_value)) { return *v; }
        _type_error("str");
    }

    const Value::tuple_type &Value::as_tuple() const {
        if (auto *v = std::get_if<std::shared_ptr<const tuple_type>>(&_value)) { return **v; }
        _type_error("tuple");
    }

    const object_ptr &Value::as_object() const {
        if (auto *v = std::get_if<object_ptr>(&_value)) { return *v; }
        _type_error("object");
    }

    bool Value::is(const Value &other) const noexcept {
        if (_value.index() != other._value.index()) { return false; }
        if (auto *tuple = std::get_if<std::shared_ptr<const tuple_type>>(&_value)) {
            return *tuple == std::get<std::shared_ptr<const tuple_type>>(other._value);
        }
        return *this == other;
    }

    bool Value::operator==(const Value &other) const noexcept {
        if (_value.index() != other._value.index()) { return false; }
        if (auto *tuple = std::get_if<std::shared_ptr<const tuple_type>>(&_value)) {
            const auto &rhs = std::get<std::shared_ptr<const tuple_type>>(other._value);
            return *tuple == rhs || **tuple == *rhs;
        }
        // Objects compare by identity
        return _value == other._value;
    }

    size_t Value::hash() const noexcept {
        return std::visit(overloaded{
                              [](const std::monostate &) -> size_t { return 0x345678; },
                              [](const std::shared_ptr<const tuple_type> &tuple) {
                                  size_t h = 0x27d4eb2d;
                                  for (const auto &item : *tuple) { h = hash_combine(h, item.hash()); }
                                  return h;
                              },
                              [](const object_ptr &object) {
                                  return object ? std::hash<ObjectId>{}(object->id()) : size_t{0};
                              },
                              []<typename T>(const T &v) { return std::hash<T>{}(v); },
                          },
                          _value);
    }

    std::string Value::repr() const {
        return std::visit(overloaded{
                              [](const std::monostate &) -> std::string { return "None"; },
                              [](bool v) -> std::string { return v ? "True" : "False"; },
                              [](int64_t v) { return fmt::format("{}", v); },
                              [](double v) { return fmt::format("{}", v); },
                              [](const std::string &v) { return fmt::format("'{}'", v); },
                              [](const std::shared_ptr<const tuple_type> &tuple) {
                                  std::vector<std::string> items;
                                  items.reserve(tuple->size());
                                  for (const auto &item : *tuple) { items.push_back(item.repr()); }
                                  if (items.size() == 1) { return fmt::format("({},)", items.front()); }
                                  return fmt::format("({})", fmt::join(items, ", "));
                              },
                              [](const object_ptr &object) -> std::string {
                                  return object ? object->repr() : std::string("None");
                              },
                          },
                          _value);
    }

    std::string_view Value::type_name() const noexcept {
        return std::visit(overloaded{
                              [](const std::monostate &) -> std::string_view { return "NoneType"; },
                              [](bool) -> std::string_view { return "bool"; },
                              [](int64_t) -> std::string_view { return "int"; },
                              [](double) -> std::string_view { return "float"; },
                              [](const std::string &) -> std::string_view { return "str"; },
                              [](const std::shared_ptr<const tuple_type> &) -> std::string_view { return "tuple"; },
                              [](const object_ptr &object) -> std::string_view {
                                  if (!object) { return "NoneType"; }
                                  switch (object->kind()) {
                                      case ObjectKind::Dict: return "dict";
                                      case ObjectKind::Type: return "type";
                                      case ObjectKind::Code: return "code";
                                      case ObjectKind::Function: return "function";
                                  }
                                  return "object";
                              },
                          },
                          _value);
    }

    void Value::_type_error(std::string_view expected) const {
        throw_error<TypeError>("expected {}, got {}", expected, type_name());
    }

} // namespace objwatch
