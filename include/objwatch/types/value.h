//
// Value - the dynamically typed value stored in dicts and type attribute tables, and carried in event payloads.
//

#ifndef OBJWATCH_VALUE_H
#define OBJWATCH_VALUE_H

#include <objwatch/objwatch_base.h>
#include <objwatch/types/object.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace objwatch {

    class OBJWATCH_EXPORT Value {
    public:
        using tuple_type = std::vector<Value>;
        using storage_type = std::variant<std::monostate, bool, int64_t, double, std::string,
            std::shared_ptr<const tuple_type>, object_ptr>;

        // None
        Value() noexcept = default;

        Value(bool value) noexcept : _value(value) {}

        Value(int value) noexcept : _value(static_cast<int64_t>(value)) {}

        Value(int64_t value) noexcept : _value(value) {}

        Value(double value) noexcept : _value(value) {}

        Value(const char *value) : _value(std::string(value)) {}

        Value(std::string value) noexcept : _value(std::move(value)) {}

        Value(std::string_view value) : _value(std::string(value)) {}

        template<typename T>
            requires std::derived_from<T, Object>
        Value(std::shared_ptr<T> object) noexcept : _value(object_ptr(std::move(object))) {}

        static Value none() noexcept { return {}; }

        static Value tuple(tuple_type items);

        [[nodiscard]] bool is_none() const noexcept { return std::holds_alternative<std::monostate>(_value); }

        [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(_value); }

        [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int64_t>(_value); }

        [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(_value); }

        [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(_value); }

        [[nodiscard]] bool is_tuple() const noexcept {
            return std::holds_alternative<std::shared_ptr<const tuple_type>>(_value);
        }

        [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<object_ptr>(_value); }

        [[nodiscard]] bool is_object(ObjectKind kind) const noexcept;

        // Accessors throw TypeError when the value holds another alternative
        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] int64_t as_int() const;

        [[nodiscard]] double as_float() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const tuple_type &as_tuple() const;

        [[nodiscard]] const object_ptr &as_object() const;

        /**
         * The held object downcast to T, TypeError if the value is not an object of T's kind.
         */
        template<typename T>
            requires std::derived_from<T, Object>
        [[nodiscard]] std::shared_ptr<T> as() const {
            auto typed = std::dynamic_pointer_cast<T>(as_object());
            if (!typed) { _type_error("a different object kind"); }
            return typed;
        }

        /**
         * Identity test: same object for object values, same alternative and equal payload otherwise. An
         * assignment of a value that "is" the current one does not change the container.
         */
        [[nodiscard]] bool is(const Value &other) const noexcept;

        bool operator==(const Value &other) const noexcept;

        [[nodiscard]] size_t hash() const noexcept;

        [[nodiscard]] std::string repr() const;

        // Name of the held alternative as the runtime would report it ("int", "str", "dict", ...)
        [[nodiscard]] std::string_view type_name() const noexcept;

        [[nodiscard]] const storage_type &storage() const noexcept { return _value; }

    private:
        [[noreturn]] void _type_error(std::string_view expected) const;

        storage_type _value;
    };

    struct ValueHash {
        size_t operator()(const Value &value) const noexcept { return value.hash(); }
    };

} // namespace objwatch

template<>
struct fmt::formatter<objwatch::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const objwatch::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.repr(), ctx);
    }
};

#endif // OBJWATCH_VALUE_H
