#pragma once

/**
 * @file type_set.h
 * @brief TypeSet - runtime type constraint with union and nullable syntax.
 *
 * A TypeSet is a grow-only set of TypeTags. An empty set (or one holding
 * mixed) accepts every value, null included.
 *
 * Specification grammar:
 * @code
 * spec := '?'? tag ('|' tag)*
 * tag  := keyword | identifier
 * @endcode
 *
 * Usage:
 * @code
 * TypeSet ts("?int|string");
 * ts.match(Value{});          // true (nullable)
 * ts.match(42);               // true
 * ts.match(3.14);             // false
 * ts.check(3.14, "value");    // throws TypeMismatch
 * ts.default_value();         // null
 * @endcode
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/types/class_registry.h>
#include <tcoll/types/type_tag.h>
#include <tcoll/types/value.h>

#include <ankerl/unordered_dense.h>

#include <concepts>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace tcoll {

    class TCOLL_EXPORT TypeSet {
    public:
        // Insertion ordered, nothing is ever erased.
        using tag_set = ankerl::unordered_dense::set<TypeTag, TypeTagHash>;
        using const_iterator = tag_set::const_iterator;

        // ========== Construction ==========

        /// No constraint.
        TypeSet() = default;

        /// @throws InvalidTypeName
        explicit TypeSet(std::string_view spec);

        /// Union of several specs, e.g. {"int", "?string"}. @throws InvalidTypeName
        TypeSet(std::initializer_list<std::string_view> specs);

        /// @throws InvalidTypeName
        static TypeSet from_spec(std::string_view spec);

        /// @throws InvalidTypeName
        static TypeSet from_spec(const std::vector<std::string> &specs);

        // ========== Growth ==========

        /// Add every tag of a spec. @throws InvalidTypeName
        TypeSet &add(std::string_view spec);

        TypeSet &add(std::initializer_list<std::string_view> specs);

        TypeSet &add(const std::vector<std::string> &specs);

        TypeSet &add(const TypeTag &tag);

        TypeSet &add(const TypeSet &other);

        /**
         * @brief Grow the set with the concrete tag of a value.
         *
         * Objects contribute their class name.
         */
        TypeSet &infer(const Value &value);

        // ========== Matching ==========

        [[nodiscard]] bool match(const Value &value) const;

        /**
         * @brief Validate a value.
         * @param label Role of the value in the caller ("key", "value", ...)
         * @throws TypeMismatch if the value does not match
         */
        void check(const Value &value, std::string_view label = "value") const;

        /**
         * @brief Zero value for this constraint.
         *
         * Priority: null (also for an empty or mixed set), false, 0 (int, number,
         * scalar), 0.0, empty string, empty array (array, iterable), a
         * GenericObject (object), then the first named class that is registered
         * in @p classes with a factory.
         *
         * @throws NoDefaultAvailable if nothing applies
         */
        [[nodiscard]] Value default_value(const ClassRegistry &classes = ClassRegistry::instance()) const;

        // ========== Set predicates ==========

        /// @throws InvalidTypeName if name is not a valid tag name
        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] bool contains(const TypeTag &tag) const { return _tags.contains(tag); }

        [[nodiscard]] bool contains(TypeKind kind) const { return kind != TypeKind::Named && contains(TypeTag{kind}); }

        [[nodiscard]] bool contains_all(std::initializer_list<std::string_view> names) const;
        [[nodiscard]] bool contains_any(std::initializer_list<std::string_view> names) const;

        /// Same members as names, in any order.
        [[nodiscard]] bool contains_only(std::initializer_list<std::string_view> names) const;

        template<typename... Ts>
            requires (std::convertible_to<Ts, std::string_view> && ...)
        [[nodiscard]] bool contains_all(Ts &&...names) const {
            return contains_all({std::string_view(names)...});
        }

        template<typename... Ts>
            requires (std::convertible_to<Ts, std::string_view> && ...)
        [[nodiscard]] bool contains_any(Ts &&...names) const {
            return contains_any({std::string_view(names)...});
        }

        template<typename... Ts>
            requires (std::convertible_to<Ts, std::string_view> && ...)
        [[nodiscard]] bool contains_only(Ts &&...names) const {
            return contains_only({std::string_view(names)...});
        }

        /// Every value is accepted.
        [[nodiscard]] bool any_ok() const { return _tags.empty() || contains(TypeKind::Mixed); }

        /// Null is accepted.
        [[nodiscard]] bool null_ok() const { return any_ok() || contains(TypeKind::Null); }

        [[nodiscard]] size_t size() const { return _tags.size(); }
        [[nodiscard]] bool empty() const { return _tags.empty(); }

        [[nodiscard]] const_iterator begin() const { return _tags.begin(); }
        [[nodiscard]] const_iterator end() const { return _tags.end(); }

        [[nodiscard]] std::vector<TypeTag> tags() const { return {_tags.begin(), _tags.end()}; }

        /// "{int, string}", or "{}" when empty.
        [[nodiscard]] std::string to_string() const;

        /// Order-independent set equality.
        friend TCOLL_EXPORT bool operator==(const TypeSet &lhs, const TypeSet &rhs);

    private:
        tag_set _tags;
    };

    /// Does a single tag accept the value.
    TCOLL_EXPORT bool tag_matches(const TypeTag &tag, const Value &value);

} // namespace tcoll
