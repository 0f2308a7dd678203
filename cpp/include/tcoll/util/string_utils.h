//
// Text helpers shared by the type parser, the key codec and error messages.
//

#ifndef TCOLL_UTIL_STRING_UTILS_H
#define TCOLL_UTIL_STRING_UTILS_H

#include <tcoll/tcoll_export.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace tcoll {
    template<typename T>
    std::string to_string(const T &value);

    template<>
    TCOLL_EXPORT std::string to_string(const bool &value);

    template<>
    TCOLL_EXPORT std::string to_string(const int64_t &value);

    // Shortest form that reads back to the same double, -0.0 renders as "-0"
    template<>
    TCOLL_EXPORT std::string to_string(const double &value);

    TCOLL_EXPORT std::string_view trim(std::string_view text);

    // ASCII only
    TCOLL_EXPORT std::string to_lower(std::string_view text);

    // Cut to max_length characters, ending with "..." when cut
    TCOLL_EXPORT std::string abbreviate(std::string_view text, size_t max_length = 30);
} // namespace tcoll

#endif  // TCOLL_UTIL_STRING_UTILS_H
