#include <tcoll/collections/dictionary.h>
#include <tcoll/types/type_errors.h>
#include <tcoll/util/errors.h>
#include <tcoll/util/format.h>
#include <tcoll/util/string_utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace tcoll {

namespace {

// An empty TypeSet allows everything, so it absorbs the other side
TypeSet unite(const TypeSet& lhs, const TypeSet& rhs) {
    if (lhs.empty() || rhs.empty()) return TypeSet{};
    TypeSet result(lhs);
    result.add(rhs);
    return result;
}

std::string abbreviated(const Value& value) { return abbreviate(value.to_string()); }

} // namespace

// ============================================================================
// Construction
// ============================================================================

Dictionary::Dictionary() : Dictionary(std::nullopt, std::nullopt) {}

Dictionary::Dictionary(std::optional<TypeSet> key_types, std::optional<TypeSet> value_types,
                       const std::vector<Pair>& source, identity_registry_s_ptr registry)
    : _key_types(key_types ? *key_types : TypeSet{}),
      _value_types(value_types ? *value_types : TypeSet{}),
      _codec(std::move(registry)) {
    bool infer_keys = !key_types.has_value();
    bool infer_values = !value_types.has_value();
    for (const auto& pair : source) {
        if (infer_keys) _key_types.infer(pair.key());
        if (infer_values) _value_types.infer(pair.value());
        set(pair.key(), pair.value());
    }
}

Dictionary::Dictionary(std::string_view key_spec, std::string_view value_spec, identity_registry_s_ptr registry)
    : Dictionary(TypeSet(key_spec), TypeSet(value_spec), {}, std::move(registry)) {}

Dictionary Dictionary::combine(const std::vector<Value>& keys, const std::vector<Value>& values, bool infer_types,
                               identity_registry_s_ptr registry) {
    if (keys.size() != values.size()) {
        throw_error<std::invalid_argument>("Cannot combine: keys count ({}) does not match values count ({}).",
                                           keys.size(), values.size());
    }

    Dictionary result(std::nullopt, std::nullopt, {}, std::move(registry));
    for (size_t i = 0; i < keys.size(); ++i) {
        if (result.key_exists(keys[i])) throw_error<DuplicateKey>("Cannot combine: keys are not unique.");
        if (infer_types) {
            result._key_types.infer(keys[i]);
            result._value_types.infer(values[i]);
        }
        result.set(keys[i], values[i]);
    }
    return result;
}

// ============================================================================
// Adding and removing
// ============================================================================

Dictionary& Dictionary::set(const Value& key, const Value& value) {
    _key_types.check(key, "key");
    _value_types.check(value, "value");
    insert_or_replace(_codec.encode(key), key, value);
    return *this;
}

Dictionary& Dictionary::import(const std::vector<Pair>& source) {
    for (const auto& pair : source) set(pair.key(), pair.value());
    return *this;
}

Dictionary& Dictionary::remove(const Value& key) {
    erase_slot(checked_slot(key));
    compact();
    return *this;
}

Value Dictionary::remove_by_key(const Value& key) {
    auto slot = checked_slot(key);
    Value removed = _slots[slot].pair->value();
    erase_slot(slot);
    compact();
    return removed;
}

size_t Dictionary::remove_by_value(const Value& value) {
    _value_types.check(value, "value");

    size_t removed = 0;
    for (size_t slot = 0; slot < _slots.size(); ++slot) {
        if (_slots[slot].pair && _slots[slot].pair->value() == value) {
            erase_slot(slot);
            ++removed;
        }
    }
    compact();
    return removed;
}

Dictionary& Dictionary::clear() {
    _slots.clear();
    _index.clear();
    _size = 0;
    return *this;
}

// ============================================================================
// Access
// ============================================================================

const Value& Dictionary::get(const Value& key) const { return _slots[checked_slot(key)].pair->value(); }

bool Dictionary::key_exists(const Value& key) const {
    if (!_key_types.match(key)) return false;
    auto index = _codec.lookup(key);
    return index && _index.contains(*index);
}

bool Dictionary::contains(const Value& value) const {
    return std::any_of(begin(), end(), [&](const Pair& pair) { return pair.value() == value; });
}

bool Dictionary::equal(const Dictionary& other) const {
    if (_size != other._size) return false;
    return std::equal(begin(), end(), other.begin(), other.end());
}

std::vector<Value> Dictionary::keys() const {
    std::vector<Value> result;
    result.reserve(_size);
    for (const auto& pair : *this) result.push_back(pair.key());
    return result;
}

std::vector<Value> Dictionary::values() const {
    std::vector<Value> result;
    result.reserve(_size);
    for (const auto& pair : *this) result.push_back(pair.value());
    return result;
}

// ============================================================================
// Sorting
// ============================================================================

Dictionary& Dictionary::sort(const pair_compare_fn& less) {
    compact(true);
    std::stable_sort(_slots.begin(), _slots.end(),
                     [&less](const Slot& lhs, const Slot& rhs) { return less(*lhs.pair, *rhs.pair); });
    for (size_t slot = 0; slot < _slots.size(); ++slot) _index[_slots[slot].index] = slot;
    return *this;
}

Dictionary& Dictionary::sort_by_key() {
    return sort([](const Pair& lhs, const Pair& rhs) { return compare(lhs.key(), rhs.key()) < 0; });
}

Dictionary& Dictionary::sort_by_value() {
    return sort([](const Pair& lhs, const Pair& rhs) { return compare(lhs.value(), rhs.value()) < 0; });
}

// ============================================================================
// Transformations
// ============================================================================

Dictionary Dictionary::filter(const filter_fn& predicate) const {
    Dictionary result(_key_types, _value_types, {}, registry());
    for (const auto& slot : _slots) {
        if (slot.pair && predicate(slot.pair->key(), slot.pair->value())) {
            result.insert_or_replace(slot.index, slot.pair->key(), slot.pair->value());
        }
    }
    return result;
}

Dictionary Dictionary::flip() const {
    Dictionary result(_value_types, _key_types, {}, registry());
    for (const auto& pair : *this) {
        if (result.key_exists(pair.value())) throw_error<DuplicateKey>("Cannot flip Dictionary: values are not unique.");
        result.set(pair.value(), pair.key());
    }
    return result;
}

Dictionary Dictionary::map(const map_fn& fn) const {
    Dictionary result(std::nullopt, std::nullopt, {}, registry());
    for (const auto& pair : *this) {
        Pair mapped = fn(pair);
        if (result.key_exists(mapped.key())) {
            throw_error<DuplicateKey>("Map callback produced a duplicate key: {}.", abbreviated(mapped.key()));
        }
        result._key_types.infer(mapped.key());
        result._value_types.infer(mapped.value());
        result.set(mapped.key(), mapped.value());
    }
    return result;
}

Dictionary Dictionary::merge(const Dictionary& other) const {
    Dictionary result(unite(_key_types, other._key_types), unite(_value_types, other._value_types), {}, registry());
    for (const auto* source : {this, &other}) {
        for (const auto& pair : *source) {
            result.insert_or_replace(result._codec.encode(pair.key()), pair.key(), pair.value());
        }
    }
    return result;
}

std::string Dictionary::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& pair : *this) {
        if (!first) out += ", ";
        first = false;
        fmt::format_to(std::back_inserter(out), "{}", pair);
    }
    out += "}";
    return out;
}

// ============================================================================
// Storage
// ============================================================================

size_t Dictionary::checked_slot(const Value& key) const {
    _key_types.check(key, "key");
    if (auto index = _codec.lookup(key)) {
        if (auto it = _index.find(*index); it != _index.end()) return it->second;
    }
    throw_error<UnknownKey>("Unknown key: {}.", abbreviated(key));
}

void Dictionary::insert_or_replace(std::string index, const Value& key, const Value& value) {
    if (auto it = _index.find(index); it != _index.end()) {
        // key and value may refer into the Pair being replaced, copy them first
        Pair replacement{key, value};
        _slots[it->second].pair = std::move(replacement);
        return;
    }
    _index.emplace(index, _slots.size());
    _slots.push_back(Slot{std::move(index), Pair{key, value}});
    ++_size;
}

void Dictionary::erase_slot(size_t slot) {
    _index.erase(_slots[slot].index);
    _slots[slot].pair.reset();
    --_size;
}

void Dictionary::compact(bool force) {
    auto dead = _slots.size() - _size;
    if (dead == 0 || (!force && dead <= _size)) return;

    std::erase_if(_slots, [](const Slot& slot) { return !slot.pair.has_value(); });
    _index.clear();
    for (size_t slot = 0; slot < _slots.size(); ++slot) _index.emplace(_slots[slot].index, slot);
}

} // namespace tcoll
