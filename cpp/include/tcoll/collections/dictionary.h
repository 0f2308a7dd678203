#pragma once

/**
 * @file dictionary.h
 * @brief Dictionary - insertion-ordered map from any Value to any Value.
 *
 * Keys and values are validated against two TypeSets when they enter the
 * Dictionary. Keys of every kind are accepted (null, floats, arrays, objects,
 * ...): each key is turned into its canonical index by a KeyCodec, and the
 * index is what the Dictionary hashes on. The key itself is kept in the
 * stored Pair and is what iteration returns.
 *
 * Usage:
 * @code
 * Dictionary prices("string", "float");
 * prices.set("apple", 1.25).set("pear", 0.8);
 * prices.get("apple");          // 1.25
 * prices.get(42);               // throws TypeMismatch
 * prices.get("kiwi");           // throws UnknownKey
 * prices.key_exists(42);        // false, never throws
 *
 * for (const Pair &pair : prices) { ... }
 * @endcode
 *
 * Storage follows the slot model: pairs live in an insertion-ordered slot
 * vector, a hash index maps canonical index to slot. Removal leaves a dead
 * slot behind; the slots are compacted once dead slots outnumber live ones.
 */

#include <tcoll/collections/pair.h>
#include <tcoll/tcoll_export.h>
#include <tcoll/types/identity_registry.h>
#include <tcoll/types/key_codec.h>
#include <tcoll/types/type_set.h>
#include <tcoll/types/value.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tcoll {

    class TCOLL_EXPORT Dictionary {
        struct Slot {
            std::string index;        // Canonical index of pair->key()
            std::optional<Pair> pair; // Empty once removed
        };

    public:
        using pair_compare_fn = std::function<bool(const Pair &, const Pair &)>;
        using filter_fn = std::function<bool(const Value &key, const Value &value)>;
        using map_fn = std::function<Pair(const Pair &)>;

        /**
         * @brief Iterator over the live pairs, in insertion order.
         */
        class const_iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Pair;
            using difference_type = std::ptrdiff_t;
            using pointer = const Pair *;
            using reference = const Pair &;

            const_iterator() = default;
            const_iterator(const std::vector<Slot> *slots, size_t slot) : _slots(slots), _slot(slot) {
                advance_to_live();
            }

            reference operator*() const { return *(*_slots)[_slot].pair; }
            pointer operator->() const { return &*(*_slots)[_slot].pair; }

            const_iterator &operator++() {
                ++_slot;
                advance_to_live();
                return *this;
            }

            const_iterator operator++(int) {
                const_iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const const_iterator &other) const {
                return _slots == other._slots && _slot == other._slot;
            }

        private:
            void advance_to_live() {
                if (!_slots) return;
                while (_slot < _slots->size() && !(*_slots)[_slot].pair) { ++_slot; }
            }

            const std::vector<Slot> *_slots{nullptr};
            size_t _slot{0};
        };

        // ========== Construction ==========

        /// No constraints, shared identity registry.
        Dictionary();

        /**
         * @brief Construct with explicit or inferred constraints.
         *
         * A std::nullopt constraint is inferred from the source: it starts empty
         * and grows with the tag of every key (value) imported from the source.
         *
         * @throws TypeMismatch if a source pair violates an explicit constraint
         */
        Dictionary(std::optional<TypeSet> key_types, std::optional<TypeSet> value_types,
                   const std::vector<Pair> &source = {},
                   identity_registry_s_ptr registry = IdentityRegistry::shared());

        /// @throws InvalidTypeName if either spec is malformed
        Dictionary(std::string_view key_spec, std::string_view value_spec,
                   identity_registry_s_ptr registry = IdentityRegistry::shared());

        /**
         * @brief Zip keys and values into a new Dictionary.
         * @param infer_types Grow the constraints from the data, otherwise leave them empty
         * @throws std::invalid_argument if the counts differ
         * @throws DuplicateKey if a key repeats
         */
        static Dictionary combine(const std::vector<Value> &keys, const std::vector<Value> &values,
                                  bool infer_types = true,
                                  identity_registry_s_ptr registry = IdentityRegistry::shared());

        // ========== Adding and removing ==========

        /**
         * @brief Insert or replace.
         *
         * A replaced key keeps its position.
         * @throws TypeMismatch if the key or the value is not allowed
         * @throws InvalidKey if the key cannot be encoded
         */
        Dictionary &set(const Value &key, const Value &value);

        Dictionary &add(const Value &key, const Value &value) { return set(key, value); }

        Dictionary &add(const Pair &pair) { return set(pair.key(), pair.value()); }

        Dictionary &import(const std::vector<Pair> &source);

        /**
         * @brief Remove an entry.
         * @throws TypeMismatch if the key type is not allowed
         * @throws UnknownKey if the key is not present
         */
        Dictionary &remove(const Value &key);

        /// As remove(), returning the removed value.
        Value remove_by_key(const Value &key);

        /**
         * @brief Remove every entry holding the value.
         * @return Number of entries removed
         * @throws TypeMismatch if the value type is not allowed
         */
        size_t remove_by_value(const Value &value);

        Dictionary &clear();

        // ========== Access ==========

        /**
         * @throws TypeMismatch if the key type is not allowed
         * @throws UnknownKey if the key is not present
         */
        [[nodiscard]] const Value &get(const Value &key) const;

        [[nodiscard]] const Value &operator[](const Value &key) const { return get(key); }

        /// Never throws; a disallowed or unencodable key is simply absent.
        [[nodiscard]] bool key_exists(const Value &key) const;

        /// Strict equality against every stored value.
        [[nodiscard]] bool contains(const Value &value) const;

        /// Same keys, values and order. Constraints are not compared.
        [[nodiscard]] bool equal(const Dictionary &other) const;

        [[nodiscard]] std::vector<Value> keys() const;
        [[nodiscard]] std::vector<Value> values() const;

        [[nodiscard]] size_t size() const { return _size; }
        [[nodiscard]] bool empty() const { return _size == 0; }

        [[nodiscard]] const TypeSet &key_types() const { return _key_types; }
        [[nodiscard]] const TypeSet &value_types() const { return _value_types; }

        [[nodiscard]] const identity_registry_s_ptr &registry() const { return _codec.registry(); }

        [[nodiscard]] const_iterator begin() const { return {&_slots, 0}; }
        [[nodiscard]] const_iterator end() const { return {&_slots, _slots.size()}; }

        // ========== Sorting (stable, in place) ==========

        /// @param less Strict weak ordering over pairs
        Dictionary &sort(const pair_compare_fn &less);

        Dictionary &sort_by_key();

        Dictionary &sort_by_value();

        // ========== Transformations (new Dictionary) ==========

        /// Pairs for which the predicate holds, with the same constraints.
        [[nodiscard]] Dictionary filter(const filter_fn &predicate) const;

        /**
         * @brief Swap keys and values, and the two constraints.
         * @throws DuplicateKey if two values are equal
         */
        [[nodiscard]] Dictionary flip() const;

        /**
         * @brief Transform every pair; constraints are inferred from the results.
         * @throws DuplicateKey if two results share a key
         */
        [[nodiscard]] Dictionary map(const map_fn &fn) const;

        /**
         * @brief Union of two Dictionaries.
         *
         * Constraints are united. A key present in both takes the value from
         * other and keeps its position in this Dictionary.
         */
        [[nodiscard]] Dictionary merge(const Dictionary &other) const;

        /// "{key => value, ...}"
        [[nodiscard]] std::string to_string() const;

    private:
        // Checks the key type, returns the slot of an existing key. @throws UnknownKey
        size_t checked_slot(const Value &key) const;

        void insert_or_replace(std::string index, const Value &key, const Value &value);

        void erase_slot(size_t slot);

        // Drop dead slots when forced or once they outnumber live ones
        void compact(bool force = false);

        TypeSet _key_types;
        TypeSet _value_types;
        KeyCodec _codec;

        std::vector<Slot> _slots;
        ankerl::unordered_dense::map<std::string, size_t> _index;
        size_t _size{0};
    };

} // namespace tcoll
