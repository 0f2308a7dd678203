#ifndef TCOLL_UTIL_ERRORS
#define TCOLL_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <utility>

namespace tcoll {

    // Overload (I) - structured errors, arguments are forwarded to the error's constructor
    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (II) - message-only errors, the message is formatted from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace tcoll

#endif // TCOLL_UTIL_ERRORS
