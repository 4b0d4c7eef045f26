//
// FunctionObject - a callable bound to a code object, with positional and keyword defaults.
//

#ifndef OBJWATCH_FUNCTION_OBJECT_H
#define OBJWATCH_FUNCTION_OBJECT_H

#include <objwatch/runtime/watch_events.h>
#include <objwatch/types/object.h>
#include <objwatch/types/value.h>

#include <string>
#include <string_view>

namespace objwatch {

    /**
     * The watched attributes can be written through the low level setters or through set_attribute / del_attribute
     * with their dunder names. Both paths end in the same private setters, so every write of __code__,
     * __defaults__ or __kwdefaults__ reports exactly one event carrying the new value.
     */
    class OBJWATCH_EXPORT FunctionObject final : public Object {
    public:
        [[nodiscard]] const code_ptr &code() const noexcept { return _code; }

        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        [[nodiscard]] const std::string &qualname() const noexcept { return _qualname; }

        // None or a tuple
        [[nodiscard]] const Value &defaults() const noexcept { return _defaults; }

        // None or a dict
        [[nodiscard]] const Value &kwdefaults() const noexcept { return _kwdefaults; }

        /**
         * @throws TypeError for a null code object
         */
        void set_code(code_ptr code);

        /**
         * @throws TypeError unless the value is None or a tuple
         */
        void set_defaults(Value defaults);

        /**
         * @throws TypeError unless the value is None or a dict
         */
        void set_kwdefaults(Value kwdefaults);

        /**
         * Read __code__, __defaults__, __kwdefaults__, __name__ or __qualname__.
         * @throws AttributeError for any other name
         */
        [[nodiscard]] Value get_attribute(std::string_view name) const;

        void set_attribute(std::string_view name, Value value);

        /**
         * Deleting __defaults__ or __kwdefaults__ resets it to None. The other attributes cannot be deleted.
         */
        void del_attribute(std::string_view name);

        [[nodiscard]] std::string repr() const override;

    protected:
        void on_dealloc() noexcept override;

    private:
        friend class Runtime;

        FunctionObject(Runtime &runtime, ObjectId id, code_ptr code, std::string qualname);

        void _notify(FunctionEvent event, const Value &new_value) const noexcept;

        code_ptr _code;
        std::string _name;
        std::string _qualname;
        Value _defaults;
        Value _kwdefaults;
    };

} // namespace objwatch

#endif // OBJWATCH_FUNCTION_OBJECT_H
