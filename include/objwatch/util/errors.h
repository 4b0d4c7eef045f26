#ifndef OBJWATCH_UTIL_ERRORS
#define OBJWATCH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace objwatch {

    // Errors raised by the host object kinds, named after the managed-runtime errors they model.
    struct KeyError : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    struct AttributeError : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    struct TypeError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] auto throw_error(std::string_view msg) {
        throw Error{std::string(msg)};
    }

    // Direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace objwatch

#endif // OBJWATCH_UTIL_ERRORS
