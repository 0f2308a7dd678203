#pragma once

/**
 * @file type_tag.h
 * @brief TypeTag - atomic, pseudo and named type descriptors.
 *
 * A TypeTag is the unit of a runtime type constraint. Concrete tags describe
 * exactly one ValueKind, pseudo tags (scalar, number, iterable, mixed) cover
 * several kinds at once, and named tags refer to a class, interface or trait
 * declared through the ClassRegistry.
 *
 * Tags are parsed from their textual names:
 * @code
 * TypeTag::parse("int");        // TypeKind::Int
 * TypeTag::parse("?int");       // throws InvalidTypeName, nullable sugar belongs to TypeSet
 * TypeTag::parse("\\DateTime"); // TypeKind::Named, name "DateTime"
 * @endcode
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/tcoll_forward_declarations.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace tcoll {

    /**
     * TypeKind - Classification of type tags
     *
     * The first nine kinds line up with ValueKind so a concrete tag can be
     * compared with a value's kind directly.
     */
    enum class TypeKind : uint8_t {
        Null,
        Bool,
        Int,
        Float,
        String,
        Array,     // Composite (ordered sequence or mapping)
        Object,    // Any class instance
        Handle,    // Opaque resource, spelled "resource"
        Callable,
        Scalar,    // Bool | Int | Float | String
        Number,    // Int | Float
        Iterable,  // Array, or an object with the Traversable capability
        Mixed,     // Everything, including null
        Named,     // Class / interface / trait name
    };

    /// Keyword spelling of a kind ("int", "resource", ...). Named yields "named".
    TCOLL_EXPORT std::string_view to_string(TypeKind kind);

    class TCOLL_EXPORT TypeTag {
    public:
        /// Defaults to mixed.
        TypeTag() = default;

        /**
         * @brief Construct a keyword tag.
         * @throws std::invalid_argument if kind is TypeKind::Named
         */
        explicit TypeTag(TypeKind kind);

        /**
         * @brief Parse a single tag name.
         *
         * Surrounding whitespace is ignored. Keywords are matched case-insensitively;
         * anything else must be a legal identifier and becomes a named tag with any
         * leading namespace separator removed.
         *
         * @throws InvalidTypeName if the text is neither a keyword nor an identifier
         */
        static TypeTag parse(std::string_view text);

        /**
         * @brief The concrete tag of a value, as recorded by TypeSet::infer.
         *
         * Objects report their class name rather than the generic object keyword.
         */
        static TypeTag of(const Value &value);

        /**
         * @brief Lexical check for class-like names.
         *
         * Segments of letters, digits and underscores (not starting with a digit),
         * separated by '\' or "::". One leading '\' is allowed.
         */
        static bool is_valid_identifier(std::string_view text);

        /// Remove the optional leading namespace separator.
        static std::string_view normalize_identifier(std::string_view text);

        /// True if the text spells one of the reserved keywords.
        static bool is_keyword(std::string_view text);

        [[nodiscard]] TypeKind kind() const { return _kind; }
        [[nodiscard]] bool is_named() const { return _kind == TypeKind::Named; }
        [[nodiscard]] bool is_pseudo() const {
            return _kind == TypeKind::Scalar || _kind == TypeKind::Number || _kind == TypeKind::Iterable ||
                   _kind == TypeKind::Mixed;
        }

        /// Keyword spelling, or the class name for named tags.
        [[nodiscard]] std::string_view name() const;

        bool operator==(const TypeTag &other) const = default;

    private:
        TypeTag(TypeKind kind, std::string name);

        TypeKind _kind{TypeKind::Mixed};
        std::string _name;  // Only set for named tags
    };

    /**
     * @brief Hash functor for TypeTag, suitable for ankerl::unordered_dense.
     */
    struct TCOLL_EXPORT TypeTagHash {
        using is_avalanching = void;

        [[nodiscard]] uint64_t operator()(const TypeTag &tag) const noexcept;
    };

} // namespace tcoll
