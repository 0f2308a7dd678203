#include <tcoll/collections/pair.h>

#include <fmt/format.h>

namespace tcoll {

std::string Pair::to_string() const { return fmt::format("{} => {}", _key.to_string(), _value.to_string()); }

} // namespace tcoll
