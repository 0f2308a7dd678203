#include <tcoll/types/type_tag.h>
#include <tcoll/types/type_errors.h>
#include <tcoll/types/class_registry.h>
#include <tcoll/types/value.h>
#include <tcoll/util/errors.h>
#include <tcoll/util/string_utils.h>

#include <ankerl/unordered_dense.h>

#include <array>
#include <cctype>
#include <utility>

namespace tcoll {

// ============================================================================
// Keywords
// ============================================================================

namespace {

constexpr std::array<std::pair<std::string_view, TypeKind>, 13> keywords{{
    {"null", TypeKind::Null},
    {"bool", TypeKind::Bool},
    {"int", TypeKind::Int},
    {"float", TypeKind::Float},
    {"string", TypeKind::String},
    {"array", TypeKind::Array},
    {"object", TypeKind::Object},
    {"resource", TypeKind::Handle},
    {"callable", TypeKind::Callable},
    {"scalar", TypeKind::Scalar},
    {"number", TypeKind::Number},
    {"iterable", TypeKind::Iterable},
    {"mixed", TypeKind::Mixed},
}};

const TypeKind* find_keyword(std::string_view text) {
    auto lower = to_lower(text);
    for (const auto& [word, kind] : keywords) {
        if (word == lower) return &kind;
    }
    return nullptr;
}

bool is_segment_start(char c) {
    return c == '_' || std::isalpha(static_cast<unsigned char>(c));
}

bool is_segment_char(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

} // namespace

std::string_view to_string(TypeKind kind) {
    if (kind == TypeKind::Named) return "named";
    for (const auto& [word, k] : keywords) {
        if (k == kind) return word;
    }
    return "unknown";
}

// ============================================================================
// TypeTag
// ============================================================================

TypeTag::TypeTag(TypeKind kind) : _kind(kind) {
    if (kind == TypeKind::Named) {
        throw_error<std::invalid_argument>("A named TypeTag needs a name, use TypeTag::parse.");
    }
}

TypeTag::TypeTag(TypeKind kind, std::string name) : _kind(kind), _name(std::move(name)) {}

TypeTag TypeTag::parse(std::string_view text) {
    auto trimmed = trim(text);
    if (const auto* kind = find_keyword(trimmed)) return TypeTag{*kind};
    // A leading backslash does not turn a keyword into a class name
    if (!is_valid_identifier(trimmed) || is_keyword(normalize_identifier(trimmed))) {
        throw_error<InvalidTypeName>("Invalid type name: '{}'.", trimmed);
    }
    return TypeTag{TypeKind::Named, std::string(normalize_identifier(trimmed))};
}

TypeTag TypeTag::of(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null: return TypeTag{TypeKind::Null};
        case ValueKind::Bool: return TypeTag{TypeKind::Bool};
        case ValueKind::Int: return TypeTag{TypeKind::Int};
        case ValueKind::Float: return TypeTag{TypeKind::Float};
        case ValueKind::String: return TypeTag{TypeKind::String};
        case ValueKind::Array: return TypeTag{TypeKind::Array};
        case ValueKind::Object: return TypeTag{TypeKind::Named, value.as_object()->class_name()};
        case ValueKind::Handle: return TypeTag{TypeKind::Handle};
        case ValueKind::Callable: return TypeTag{TypeKind::Callable};
    }
    return TypeTag{};
}

bool TypeTag::is_valid_identifier(std::string_view text) {
    if (!text.empty() && text.front() == '\\') text.remove_prefix(1);
    if (text.empty()) return false;

    size_t i = 0;
    while (true) {
        // One segment
        if (i >= text.size() || !is_segment_start(text[i])) return false;
        ++i;
        while (i < text.size() && is_segment_char(text[i])) ++i;
        if (i == text.size()) return true;

        // Separator
        if (text[i] == '\\') {
            ++i;
        } else if (text.substr(i, 2) == "::") {
            i += 2;
        } else {
            return false;
        }
    }
}

std::string_view TypeTag::normalize_identifier(std::string_view text) {
    if (!text.empty() && text.front() == '\\') text.remove_prefix(1);
    return text;
}

bool TypeTag::is_keyword(std::string_view text) {
    return find_keyword(trim(text)) != nullptr;
}

std::string_view TypeTag::name() const {
    return is_named() ? std::string_view(_name) : to_string(_kind);
}

uint64_t TypeTagHash::operator()(const TypeTag& tag) const noexcept {
    // Keyword names never collide with class names
    return ankerl::unordered_dense::hash<std::string_view>{}(tag.name());
}

} // namespace tcoll
