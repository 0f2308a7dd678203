#include <tcoll/types/type_set.h>
#include <tcoll/types/type_errors.h>
#include <tcoll/util/errors.h>
#include <tcoll/util/string_utils.h>

#include <algorithm>

namespace tcoll {

// ============================================================================
// Construction
// ============================================================================

TypeSet::TypeSet(std::string_view spec) { add(spec); }

TypeSet::TypeSet(std::initializer_list<std::string_view> specs) { add(specs); }

TypeSet TypeSet::from_spec(std::string_view spec) { return TypeSet{spec}; }

TypeSet TypeSet::from_spec(const std::vector<std::string>& specs) {
    TypeSet result;
    result.add(specs);
    return result;
}

// ============================================================================
// Growth
// ============================================================================

TypeSet& TypeSet::add(std::string_view spec) {
    auto text = trim(spec);
    if (text.empty()) throw_error<InvalidTypeName>("Empty type specification.");

    // A malformed spec leaves the set untouched
    std::vector<TypeTag> parsed;

    // '?T' is sugar for 'null|T'
    if (text.front() == '?') {
        parsed.emplace_back(TypeKind::Null);
        text.remove_prefix(1);
    }

    size_t start = 0;
    while (true) {
        auto bar = text.find('|', start);
        auto part = text.substr(start, bar == std::string_view::npos ? std::string_view::npos : bar - start);
        parsed.push_back(TypeTag::parse(part));
        if (bar == std::string_view::npos) break;
        start = bar + 1;
    }
    for (auto& tag : parsed) _tags.insert(std::move(tag));
    return *this;
}

TypeSet& TypeSet::add(std::initializer_list<std::string_view> specs) {
    for (auto spec : specs) add(spec);
    return *this;
}

TypeSet& TypeSet::add(const std::vector<std::string>& specs) {
    for (const auto& spec : specs) add(std::string_view(spec));
    return *this;
}

TypeSet& TypeSet::add(const TypeTag& tag) {
    _tags.insert(tag);
    return *this;
}

TypeSet& TypeSet::add(const TypeSet& other) {
    for (const auto& tag : other._tags) _tags.insert(tag);
    return *this;
}

TypeSet& TypeSet::infer(const Value& value) { return add(TypeTag::of(value)); }

// ============================================================================
// Matching
// ============================================================================

bool tag_matches(const TypeTag& tag, const Value& value) {
    switch (tag.kind()) {
        case TypeKind::Null: return value.is_null();
        case TypeKind::Bool: return value.is_bool();
        case TypeKind::Int: return value.is_int();
        case TypeKind::Float: return value.is_float();
        case TypeKind::String: return value.is_string();
        case TypeKind::Array: return value.is_array();
        case TypeKind::Object: return value.is_object();
        case TypeKind::Handle: return value.is_handle();
        case TypeKind::Callable: return value.is_callable();
        case TypeKind::Scalar: return value.is_bool() || value.is_int() || value.is_float() || value.is_string();
        case TypeKind::Number: return value.is_int() || value.is_float();
        case TypeKind::Iterable:
            return value.is_array() ||
                   (value.is_object() && value.as_object()->is_a(ClassRegistry::traversable_capability));
        case TypeKind::Mixed: return true;
        case TypeKind::Named: return value.is_object() && value.as_object()->is_a(tag.name());
    }
    return false;
}

bool TypeSet::match(const Value& value) const {
    if (any_ok()) return true;
    return std::any_of(_tags.begin(), _tags.end(), [&](const TypeTag& tag) { return tag_matches(tag, value); });
}

void TypeSet::check(const Value& value, std::string_view label) const {
    if (!match(value)) throw_error<TypeMismatch>(std::string(label), tags(), TypeTag::of(value));
}

Value TypeSet::default_value(const ClassRegistry& classes) const {
    if (null_ok()) return {};
    if (contains(TypeKind::Bool)) return false;
    if (contains(TypeKind::Int) || contains(TypeKind::Number) || contains(TypeKind::Scalar)) return 0;
    if (contains(TypeKind::Float)) return 0.0;
    if (contains(TypeKind::String)) return std::string{};
    if (contains(TypeKind::Array) || contains(TypeKind::Iterable)) return Value{Array{}};
    if (contains(TypeKind::Object)) return ClassRegistry::instantiate(classes.generic());

    for (const auto& tag : _tags) {
        if (!tag.is_named()) continue;
        auto meta = classes.find(tag.name());
        if (meta && meta->is_default_constructible()) return ClassRegistry::instantiate(meta);
    }

    throw_error<NoDefaultAvailable>("No default value could be determined for this TypeSet.");
}

// ============================================================================
// Set predicates
// ============================================================================

bool TypeSet::contains(std::string_view name) const { return contains(TypeTag::parse(name)); }

bool TypeSet::contains_all(std::initializer_list<std::string_view> names) const {
    return std::all_of(names.begin(), names.end(), [this](std::string_view name) { return contains(name); });
}

bool TypeSet::contains_any(std::initializer_list<std::string_view> names) const {
    return std::any_of(names.begin(), names.end(), [this](std::string_view name) { return contains(name); });
}

bool TypeSet::contains_only(std::initializer_list<std::string_view> names) const {
    tag_set wanted;
    for (auto name : names) wanted.insert(TypeTag::parse(name));
    return wanted.size() == _tags.size() && contains_all(names);
}

std::string TypeSet::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& tag : _tags) {
        if (!first) out += ", ";
        first = false;
        out += tag.name();
    }
    out += "}";
    return out;
}

bool operator==(const TypeSet& lhs, const TypeSet& rhs) {
    if (lhs.size() != rhs.size()) return false;
    return std::all_of(lhs.begin(), lhs.end(), [&](const TypeTag& tag) { return rhs.contains(tag); });
}

} // namespace tcoll
