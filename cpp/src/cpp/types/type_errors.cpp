#include <tcoll/types/type_errors.h>

#include <fmt/format.h>

namespace tcoll {

namespace {

std::string mismatch_message(const std::string& label, const std::vector<TypeTag>& expected, const TypeTag& actual) {
    std::string allowed;
    for (const auto& tag : expected) {
        if (!allowed.empty()) allowed += ", ";
        allowed += tag.name();
    }
    return fmt::format("Disallowed {} type: {}. Expected {{{}}}.", label, actual.name(), allowed);
}

} // namespace

TypeMismatch::TypeMismatch(std::string label, std::vector<TypeTag> expected, TypeTag actual)
    : std::invalid_argument(mismatch_message(label, expected, actual)),
      _label(std::move(label)),
      _expected(std::move(expected)),
      _actual(std::move(actual)) {}

} // namespace tcoll
