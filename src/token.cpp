#include "libctdi/token.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace libctdi {

// ---------------------------------------------------------------
// token
// ---------------------------------------------------------------

token token::nominal(std::string origin, std::string name) {
    token t;
    t.kind = token_kind::nominal;
    t.name = std::move(name);
    t.origin = std::move(origin);
    return t;
}

token token::synthetic(std::string key) {
    token t;
    t.kind = token_kind::synthetic;
    t.name = std::move(key);
    return t;
}

std::string token::key() const {
    if (kind == token_kind::nominal) {
        return "class:" + origin + ":" + name;
    }
    return "token:" + name;
}

// ---------------------------------------------------------------
// Primitive names
// ---------------------------------------------------------------

namespace {

constexpr std::array<std::string_view, 12> primitive_names = {
    "string", "number", "boolean", "symbol", "bigint", "undefined",
    "null", "void", "never", "any", "unknown", "object",
};

void append_canonical(const type_ref& ref, std::string& out) {
    out += ref.name;
    if (ref.arguments.empty()) return;
    out += '<';
    for (std::size_t i = 0; i < ref.arguments.size(); ++i) {
        if (i > 0) out += ", ";
        append_canonical(ref.arguments[i], out);
    }
    out += '>';
}

void walk_imports(const type_ref& ref, std::map<std::string, std::string>& out) {
    if (ref.origin.has_value()) {
        out[ref.name] = *ref.origin;
    }
    for (auto& arg : ref.arguments) {
        walk_imports(arg, out);
    }
}

} // namespace

bool is_primitive_type(std::string_view name) noexcept {
    for (auto p : primitive_names) {
        if (p == name) return true;
    }
    return false;
}

std::string canonicalize(const type_ref& ref) {
    std::string out;
    append_canonical(ref, out);
    return out;
}

std::map<std::string, std::string> collect_type_imports(const type_ref& ref) {
    std::map<std::string, std::string> imports;
    walk_imports(ref, imports);
    return imports;
}

token resolve_type_ref(const type_ref& ref) {
    if (ref.is_parameterized()) {
        auto t = token::synthetic(canonicalize(ref));
        t.origin = ref.origin.value_or(std::string{});
        t.type_annotation = t.name;
        t.type_imports = collect_type_imports(ref);
        return t;
    }

    if (ref.origin.has_value()) {
        return token::nominal(*ref.origin, ref.name);
    }

    // No declaration found: an interface or otherwise source-opaque type.
    return token::synthetic(ref.name);
}

} // namespace libctdi
