#pragma once

/**
 * @file value.h
 * @brief Value - the dynamically typed value stored in typed collections.
 *
 * A Value holds exactly one of nine kinds. Scalars (bool, int, float, string)
 * and composites (Array) compare by content; objects, handles and callables
 * compare by identity, i.e. two Values are equal only when they share the
 * same instance.
 *
 * Usage:
 * @code
 * Value n;                                   // null
 * Value i = 42;                              // int
 * Value s = "hello";                         // string
 * Value a{Array{1, 2, 3}};                   // composite
 * Value o = ClassRegistry::instance().instantiate("GenericObject");
 * @endcode
 */

#include <tcoll/tcoll_export.h>
#include <tcoll/tcoll_forward_declarations.h>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tcoll {

    /**
     * ValueKind - The runtime kind of a Value
     *
     * The order matches the alternatives of Value::storage_type.
     */
    enum class ValueKind : uint8_t {
        Null,
        Bool,
        Int,
        Float,
        String,
        Array,
        Object,
        Handle,
        Callable,
    };

    TCOLL_EXPORT std::string_view to_string(ValueKind kind);

    class TCOLL_EXPORT Value {
    public:
        using storage_type = std::variant<std::monostate, bool, int64_t, double, std::string, array_s_ptr,
                                          object_s_ptr, handle_s_ptr, callable_s_ptr>;

        // ========== Construction ==========

        Value() noexcept = default;

        Value(std::nullptr_t) noexcept {}

        Value(bool v) noexcept : _storage(v) {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T v) noexcept : _storage(static_cast<int64_t>(v)) {}

        template<std::floating_point T>
        Value(T v) noexcept : _storage(static_cast<double>(v)) {}

        Value(const char *v) : _storage(std::string(v)) {}

        Value(std::string v) : _storage(std::move(v)) {}

        Value(std::string_view v) : _storage(std::string(v)) {}

        explicit Value(Array v);

        // A null pointer of any identity kind yields a null Value.
        Value(array_s_ptr v);
        Value(object_s_ptr v);
        Value(handle_s_ptr v);
        Value(callable_s_ptr v);

        // ========== Inspection ==========

        [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(_storage.index()); }

        [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
        [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
        [[nodiscard]] bool is_int() const noexcept { return kind() == ValueKind::Int; }
        [[nodiscard]] bool is_float() const noexcept { return kind() == ValueKind::Float; }
        [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
        [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::Array; }
        [[nodiscard]] bool is_object() const noexcept { return kind() == ValueKind::Object; }
        [[nodiscard]] bool is_handle() const noexcept { return kind() == ValueKind::Handle; }
        [[nodiscard]] bool is_callable() const noexcept { return kind() == ValueKind::Callable; }

        /// Objects, handles and callables compare by instance.
        [[nodiscard]] bool has_identity() const noexcept {
            return is_object() || is_handle() || is_callable();
        }

        // ========== Access ==========
        // All accessors throw std::bad_variant_access when the kind does not match.

        [[nodiscard]] bool as_bool() const { return std::get<bool>(_storage); }
        [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(_storage); }
        [[nodiscard]] double as_float() const { return std::get<double>(_storage); }
        [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(_storage); }
        [[nodiscard]] const Array &as_array() const { return *std::get<array_s_ptr>(_storage); }
        [[nodiscard]] const object_s_ptr &as_object() const { return std::get<object_s_ptr>(_storage); }
        [[nodiscard]] const handle_s_ptr &as_handle() const { return std::get<handle_s_ptr>(_storage); }
        [[nodiscard]] const callable_s_ptr &as_callable() const { return std::get<callable_s_ptr>(_storage); }

        /**
         * @brief Owning pointer to the instance behind an identity-bearing value.
         * @return The instance, or nullptr for content-compared kinds
         */
        [[nodiscard]] std::shared_ptr<const void> identity() const;

        [[nodiscard]] const storage_type &storage() const noexcept { return _storage; }

        // ========== Rendering ==========

        /**
         * @brief Debug type name.
         *
         * "null", "bool", "int", "float", "string", "array", the class name for
         * objects, "resource (<kind>)" for handles and "callable".
         */
        [[nodiscard]] std::string type_name() const;

        /// Human-readable rendering, strings are quoted.
        [[nodiscard]] std::string to_string() const;

        // ========== Comparison ==========

        /**
         * Strict equality: same kind and same content, or the same instance for
         * identity-bearing kinds. 0.0 equals -0.0, NaN equals nothing.
         */
        friend TCOLL_EXPORT bool operator==(const Value &lhs, const Value &rhs);

    private:
        storage_type _storage;
    };

    /**
     * @brief Three-way ordering used for sorting.
     *
     * Int and Float compare numerically with each other (NaN after every other
     * number), strings lexicographically, false before true, arrays by size and
     * then entry by entry, identity kinds by address. Values of unrelated kinds
     * order by kind: null, bool, numbers, string, array, object, handle, callable.
     */
    TCOLL_EXPORT std::weak_ordering compare(const Value &lhs, const Value &rhs);

    /**
     * Array - Immutable ordered composite of (key, value) entries
     *
     * The list form numbers its keys 0..n-1. The mapping form accepts int or
     * string keys; a repeated key keeps its first position and takes the last
     * value assigned to it.
     */
    class TCOLL_EXPORT Array {
    public:
        struct Entry {
            Value key;
            Value value;

            bool operator==(const Entry &other) const = default;
        };

        using const_iterator = std::vector<Entry>::const_iterator;

        Array() = default;

        Array(std::initializer_list<Value> items);

        explicit Array(std::vector<Value> items);

        /**
         * @brief Build the mapping form.
         * @throws std::invalid_argument if a key is neither int nor string
         */
        static Array from_entries(std::vector<Entry> entries);

        [[nodiscard]] size_t size() const { return _entries.size(); }
        [[nodiscard]] bool empty() const { return _entries.empty(); }

        /// True when the keys are exactly 0..n-1 in order.
        [[nodiscard]] bool is_list() const;

        [[nodiscard]] const Entry &operator[](size_t index) const { return _entries.at(index); }

        /// Value stored under key, or nullptr.
        [[nodiscard]] const Value *find(const Value &key) const;

        [[nodiscard]] const std::vector<Entry> &entries() const { return _entries; }
        [[nodiscard]] const_iterator begin() const { return _entries.begin(); }
        [[nodiscard]] const_iterator end() const { return _entries.end(); }

        bool operator==(const Array &other) const = default;

    private:
        std::vector<Entry> _entries;
    };

    /**
     * Handle - An opaque resource compared by identity
     */
    class TCOLL_EXPORT Handle {
    public:
        explicit Handle(std::string kind) : _kind(std::move(kind)) {}

        Handle(const Handle &) = delete;
        Handle &operator=(const Handle &) = delete;

        [[nodiscard]] const std::string &kind() const { return _kind; }

    private:
        std::string _kind;
    };

    inline handle_s_ptr make_handle(std::string kind) { return std::make_shared<Handle>(std::move(kind)); }

    /**
     * Callable - A function value compared by identity
     */
    class TCOLL_EXPORT Callable {
    public:
        using function_type = std::function<Value(const std::vector<Value> &)>;

        explicit Callable(function_type fn, std::string name = "{closure}")
            : _fn(std::move(fn)), _name(std::move(name)) {}

        Callable(const Callable &) = delete;
        Callable &operator=(const Callable &) = delete;

        Value operator()(const std::vector<Value> &args) const { return _fn(args); }

        [[nodiscard]] const std::string &name() const { return _name; }

    private:
        function_type _fn;
        std::string _name;
    };

    inline callable_s_ptr make_callable(Callable::function_type fn, std::string name = "{closure}") {
        return std::make_shared<Callable>(std::move(fn), std::move(name));
    }

    inline Value::Value(Array v) : _storage(std::make_shared<const Array>(std::move(v))) {}

} // namespace tcoll
