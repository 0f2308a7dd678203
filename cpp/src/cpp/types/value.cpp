#include <tcoll/types/value.h>
#include <tcoll/types/class_registry.h>
#include <tcoll/util/errors.h>
#include <tcoll/util/string_utils.h>

#include <fmt/format.h>

#include <cmath>
#include <iterator>

namespace tcoll {

// ============================================================================
// ValueKind
// ============================================================================

std::string_view to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
        case ValueKind::Array: return "array";
        case ValueKind::Object: return "object";
        case ValueKind::Handle: return "resource";
        case ValueKind::Callable: return "callable";
    }
    return "unknown";
}

// ============================================================================
// Value
// ============================================================================

Value::Value(array_s_ptr v) {
    if (v) _storage = std::move(v);
}

Value::Value(object_s_ptr v) {
    if (v) _storage = std::move(v);
}

Value::Value(handle_s_ptr v) {
    if (v) _storage = std::move(v);
}

Value::Value(callable_s_ptr v) {
    if (v) _storage = std::move(v);
}

std::shared_ptr<const void> Value::identity() const {
    switch (kind()) {
        case ValueKind::Object: return as_object();
        case ValueKind::Handle: return as_handle();
        case ValueKind::Callable: return as_callable();
        default: return nullptr;
    }
}

std::string Value::type_name() const {
    switch (kind()) {
        case ValueKind::Object: return as_object()->class_name();
        case ValueKind::Handle: return fmt::format("resource ({})", as_handle()->kind());
        default: return std::string(tcoll::to_string(kind()));
    }
}

std::string Value::to_string() const {
    switch (kind()) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return tcoll::to_string(as_bool());
        case ValueKind::Int: return tcoll::to_string(as_int());
        case ValueKind::Float: return tcoll::to_string(as_float());
        case ValueKind::String: return fmt::format("\"{}\"", as_string());
        case ValueKind::Array: {
            const auto& array = as_array();
            std::string out = "[";
            bool list = array.is_list();
            bool first = true;
            for (const auto& entry : array) {
                if (!first) out += ", ";
                first = false;
                if (!list) fmt::format_to(std::back_inserter(out), "{} => ", entry.key.to_string());
                out += entry.value.to_string();
            }
            out += "]";
            return out;
        }
        case ValueKind::Object: return fmt::format("{} object", as_object()->class_name());
        case ValueKind::Handle: return fmt::format("resource ({})", as_handle()->kind());
        case ValueKind::Callable: return fmt::format("callable {}", as_callable()->name());
    }
    return {};
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) return false;
    switch (lhs.kind()) {
        case ValueKind::Null: return true;
        case ValueKind::Bool: return lhs.as_bool() == rhs.as_bool();
        case ValueKind::Int: return lhs.as_int() == rhs.as_int();
        case ValueKind::Float: return lhs.as_float() == rhs.as_float();
        case ValueKind::String: return lhs.as_string() == rhs.as_string();
        case ValueKind::Array: return lhs.as_array() == rhs.as_array();
        case ValueKind::Object:
        case ValueKind::Handle:
        case ValueKind::Callable: return lhs.identity() == rhs.identity();
    }
    return false;
}

// ============================================================================
// Ordering
// ============================================================================

namespace {

// Rank of a kind among unrelated kinds, Int and Float share a rank
int kind_rank(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return 0;
        case ValueKind::Bool: return 1;
        case ValueKind::Int:
        case ValueKind::Float: return 2;
        case ValueKind::String: return 3;
        case ValueKind::Array: return 4;
        case ValueKind::Object: return 5;
        case ValueKind::Handle: return 6;
        case ValueKind::Callable: return 7;
    }
    return 8;
}

std::weak_ordering compare_numbers(double lhs, double rhs) {
    bool l_nan = std::isnan(lhs);
    bool r_nan = std::isnan(rhs);
    if (l_nan || r_nan) {
        if (l_nan && r_nan) return std::weak_ordering::equivalent;
        return l_nan ? std::weak_ordering::greater : std::weak_ordering::less;
    }
    if (lhs < rhs) return std::weak_ordering::less;
    if (lhs > rhs) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

// Exact for every int64_t, converting the int to double would round above 2^53
std::weak_ordering compare_int_float(int64_t lhs, double rhs) {
    constexpr double two_63 = 9223372036854775808.0;
    if (std::isnan(rhs)) return std::weak_ordering::less;
    if (rhs >= two_63) return std::weak_ordering::less;
    if (rhs < -two_63) return std::weak_ordering::greater;

    double whole = std::trunc(rhs);
    auto whole_int = static_cast<int64_t>(whole);
    if (lhs != whole_int) return lhs <=> whole_int;
    if (rhs > whole) return std::weak_ordering::less;
    if (rhs < whole) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

} // namespace

std::weak_ordering compare(const Value& lhs, const Value& rhs) {
    auto l_rank = kind_rank(lhs.kind());
    auto r_rank = kind_rank(rhs.kind());
    if (l_rank != r_rank) return l_rank <=> r_rank;

    switch (lhs.kind()) {
        case ValueKind::Null: return std::weak_ordering::equivalent;
        case ValueKind::Bool: return lhs.as_bool() <=> rhs.as_bool();
        case ValueKind::Int:
        case ValueKind::Float: {
            if (lhs.is_int() && rhs.is_int()) return lhs.as_int() <=> rhs.as_int();
            if (lhs.is_float() && rhs.is_float()) return compare_numbers(lhs.as_float(), rhs.as_float());
            if (lhs.is_int()) return compare_int_float(lhs.as_int(), rhs.as_float());
            return 0 <=> compare_int_float(rhs.as_int(), lhs.as_float());
        }
        case ValueKind::String: return lhs.as_string() <=> rhs.as_string();
        case ValueKind::Array: {
            const auto& l = lhs.as_array();
            const auto& r = rhs.as_array();
            if (l.size() != r.size()) return l.size() <=> r.size();
            for (size_t i = 0; i < l.size(); ++i) {
                if (auto c = compare(l[i].value, r[i].value); c != 0) return c;
            }
            return std::weak_ordering::equivalent;
        }
        case ValueKind::Object:
        case ValueKind::Handle:
        case ValueKind::Callable:
            return std::compare_three_way{}(lhs.identity().get(), rhs.identity().get());
    }
    return std::weak_ordering::equivalent;
}

// ============================================================================
// Array
// ============================================================================

Array::Array(std::initializer_list<Value> items) : Array(std::vector<Value>(items)) {}

Array::Array(std::vector<Value> items) {
    _entries.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        _entries.push_back({Value(static_cast<int64_t>(i)), std::move(items[i])});
    }
}

Array Array::from_entries(std::vector<Entry> entries) {
    Array result;
    result._entries.reserve(entries.size());
    for (auto& entry : entries) {
        if (!entry.key.is_int() && !entry.key.is_string()) {
            throw_error<std::invalid_argument>("Array keys must be int or string, got {}.", entry.key.type_name());
        }
        bool replaced = false;
        for (auto& existing : result._entries) {
            if (existing.key == entry.key) {
                existing.value = std::move(entry.value);
                replaced = true;
                break;
            }
        }
        if (!replaced) result._entries.push_back(std::move(entry));
    }
    return result;
}

bool Array::is_list() const {
    for (size_t i = 0; i < _entries.size(); ++i) {
        const auto& key = _entries[i].key;
        if (!key.is_int() || key.as_int() != static_cast<int64_t>(i)) return false;
    }
    return true;
}

const Value* Array::find(const Value& key) const {
    for (const auto& entry : _entries) {
        if (entry.key == key) return &entry.value;
    }
    return nullptr;
}

} // namespace tcoll
