#pragma once

/**
 * @file pair.h
 * @brief Pair - immutable (key, value) entry of a Dictionary.
 *
 * The Dictionary keeps the key as given next to the value, the
 * canonical index is only used for lookup. A Pair never changes after
 * construction; replacing a key's value in a Dictionary builds a new Pair.
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/types/value.h>

#include <string>
#include <utility>

namespace tcoll {

    class TCOLL_EXPORT Pair {
    public:
        Pair(Value key, Value value) : _key(std::move(key)), _value(std::move(value)) {}

        [[nodiscard]] const Value &key() const { return _key; }
        [[nodiscard]] const Value &value() const { return _value; }

        /// Strict equality of both fields.
        bool operator==(const Pair &other) const = default;

        /// "key => value"
        [[nodiscard]] std::string to_string() const;

    private:
        Value _key;
        Value _value;
    };

} // namespace tcoll
