//
// fmt support for the value layer, so Values, tags, sets and pairs can be
// passed straight to fmt::format and fmt::print.
//
//   fmt::format("{}", value)    -> value.to_string()
//   fmt::format("{:t}", value)  -> value.type_name()
//

#ifndef TCOLL_UTIL_FORMAT_H
#define TCOLL_UTIL_FORMAT_H

#include <tcoll/collections/pair.h>
#include <tcoll/types/type_set.h>
#include <tcoll/types/type_tag.h>
#include <tcoll/types/value.h>

#include <fmt/format.h>

#include <string_view>

namespace fmt {
    template<>
    struct formatter<tcoll::Value> {
        bool use_type_name = false;

        constexpr auto parse(format_parse_context &ctx) {
            auto it = ctx.begin();
            auto end = ctx.end();

            if (it == end || *it == '}') { return it; }

            if (*it == 't') {
                use_type_name = true;
                ++it;
            }

            if (it != end && *it != '}') { throw format_error("Invalid format specifier for tcoll::Value"); }
            return it;
        }

        template<typename FormatContext>
        auto format(const tcoll::Value &value, FormatContext &ctx) const {
            if (use_type_name) { return fmt::format_to(ctx.out(), "{}", value.type_name()); }
            return fmt::format_to(ctx.out(), "{}", value.to_string());
        }
    };

    template<>
    struct formatter<tcoll::TypeTag> : formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const tcoll::TypeTag &tag, FormatContext &ctx) const {
            return formatter<std::string_view>::format(tag.name(), ctx);
        }
    };

    template<>
    struct formatter<tcoll::TypeSet> : formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const tcoll::TypeSet &types, FormatContext &ctx) const {
            return formatter<std::string_view>::format(types.to_string(), ctx);
        }
    };

    template<>
    struct formatter<tcoll::Pair> : formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const tcoll::Pair &pair, FormatContext &ctx) const {
            return formatter<std::string_view>::format(pair.to_string(), ctx);
        }
    };
} // namespace fmt

#endif  // TCOLL_UTIL_FORMAT_H
