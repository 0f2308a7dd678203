#include <tcoll/types/key_codec.h>
#include <tcoll/types/type_errors.h>
#include <tcoll/types/value.h>
#include <tcoll/util/errors.h>
#include <tcoll/util/string_utils.h>

#include <fmt/format.h>

#include <cmath>
#include <iterator>

namespace tcoll {

namespace {

// Escape the characters that delimit array elements
void append_escaped(std::string& out, std::string_view encoded) {
    for (char c : encoded) {
        if (c == '\\' || c == ',' || c == '=') out += '\\';
        out += c;
    }
}

} // namespace

KeyCodec::KeyCodec(identity_registry_s_ptr registry) : _registry(std::move(registry)) {
    if (!_registry) throw_error<std::invalid_argument>("KeyCodec requires an IdentityRegistry.");
}

std::string KeyCodec::encode(const Value& value) const {
    std::string out;
    if (!encode_into(value, out, true)) {
        throw_error<InvalidKey>("NaN cannot be used as a key.");
    }
    return out;
}

std::optional<std::string> KeyCodec::try_encode(const Value& value) const {
    std::string out;
    if (!encode_into(value, out, true)) return std::nullopt;
    return out;
}

std::optional<std::string> KeyCodec::lookup(const Value& value) const {
    std::string out;
    if (!encode_into(value, out, false)) return std::nullopt;
    return out;
}

bool KeyCodec::append_token(char prefix, const Value& value, std::string& out, bool register_identities) const {
    auto token = register_identities ? _registry->token_for(value.identity()) : _registry->find(value.identity());
    if (token == 0) return false;
    fmt::format_to(std::back_inserter(out), "{}:{}", prefix, token);
    return true;
}

bool KeyCodec::encode_into(const Value& value, std::string& out, bool register_identities) const {
    switch (value.kind()) {
        case ValueKind::Null:
            out += 'n';
            return true;
        case ValueKind::Bool:
            out += value.as_bool() ? "b:1" : "b:0";
            return true;
        case ValueKind::Int:
            fmt::format_to(std::back_inserter(out), "i:{}", value.as_int());
            return true;
        case ValueKind::Float: {
            auto v = value.as_float();
            if (std::isnan(v)) return false;
            if (v == 0.0) v = 0.0;  // -0.0 == 0.0, so both share one index
            out += "f:";
            out += to_string(v);
            return true;
        }
        case ValueKind::String:
            out += "s:";
            out += value.as_string();
            return true;
        case ValueKind::Array: {
            out += "a[";
            bool first = true;
            std::string element;
            for (const auto& entry : value.as_array()) {
                if (!first) out += ',';
                first = false;

                element.clear();
                if (!encode_into(entry.key, element, register_identities)) return false;
                append_escaped(out, element);
                out += '=';

                element.clear();
                if (!encode_into(entry.value, element, register_identities)) return false;
                append_escaped(out, element);
            }
            out += ']';
            return true;
        }
        case ValueKind::Object: return append_token('o', value, out, register_identities);
        case ValueKind::Handle: return append_token('r', value, out, register_identities);
        case ValueKind::Callable: return append_token('c', value, out, register_identities);
    }
    return false;
}

} // namespace tcoll
