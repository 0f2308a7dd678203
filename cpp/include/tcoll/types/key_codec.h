#pragma once

/**
 * @file key_codec.h
 * @brief KeyCodec - canonical string index for any Value.
 *
 * encode(a) == encode(b) exactly when a == b under strict Value equality.
 * Every encoding starts with a kind prefix so values of different kinds never
 * collide:
 *
 * | Kind     | Encoding                          |
 * |----------|-----------------------------------|
 * | null     | n                                 |
 * | bool     | b:0, b:1                          |
 * | int      | i:<decimal>                       |
 * | float    | f:<shortest round-trip>           |
 * | string   | s:<text>                          |
 * | array    | a[<key>=<value>,...]              |
 * | object   | o:<token>                         |
 * | resource | r:<token>                         |
 * | callable | c:<token>                         |
 *
 * Inside an array each element encoding has '\', ',' and '=' escaped with '\'.
 * Identity tokens come from the IdentityRegistry the codec was built with.
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/tcoll_forward_declarations.h>
#include <tcoll/types/identity_registry.h>

#include <optional>
#include <string>

namespace tcoll {

    class TCOLL_EXPORT KeyCodec {
    public:
        explicit KeyCodec(identity_registry_s_ptr registry = IdentityRegistry::shared());

        /**
         * @brief Canonical index of a value.
         * @throws InvalidKey if the value is, or contains, NaN
         */
        [[nodiscard]] std::string encode(const Value &value) const;

        /// As encode, but nullopt instead of throwing.
        [[nodiscard]] std::optional<std::string> try_encode(const Value &value) const;

        /**
         * @brief Index of a value without registering anything.
         *
         * For lookups: an object, handle or callable the registry has not seen
         * cannot be a stored key, so it yields nullopt, as does NaN.
         */
        [[nodiscard]] std::optional<std::string> lookup(const Value &value) const;

        [[nodiscard]] const identity_registry_s_ptr &registry() const { return _registry; }

    private:
        // False when a NaN, or an unknown identity while not registering, was met.
        bool encode_into(const Value &value, std::string &out, bool register_identities) const;

        bool append_token(char prefix, const Value &value, std::string &out, bool register_identities) const;

        identity_registry_s_ptr _registry;
    };

} // namespace tcoll
