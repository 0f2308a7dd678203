#include <tcoll/util/string_utils.h>

#include <fmt/format.h>

#include <cctype>

namespace tcoll {
    template<>
    std::string to_string(const bool &value) { return value ? "true" : "false"; }

    template<>
    std::string to_string(const int64_t &value) { return fmt::format("{}", value); }

    template<>
    std::string to_string(const double &value) { return fmt::format("{}", value); }

    std::string_view trim(std::string_view text) {
        constexpr std::string_view whitespace = " \t\n\r\f\v";
        auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos) { return {}; }
        auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    std::string to_lower(std::string_view text) {
        std::string result(text);
        for (auto &c : result) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
        return result;
    }

    std::string abbreviate(std::string_view text, size_t max_length) {
        if (text.size() <= max_length) { return std::string(text); }
        if (max_length <= 3) { return std::string(text.substr(0, max_length)); }
        return fmt::format("{}...", text.substr(0, max_length - 3));
    }
} // namespace tcoll
