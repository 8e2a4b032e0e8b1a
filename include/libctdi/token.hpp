#pragma once

#include "export.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// type_ref: raw type reference as reported by the scanner
// ---------------------------------------------------------------

/// A type as spelled at a use site: simple name, the identity of the
/// declaration it resolves to (if the scanner found one), and the type
/// arguments, themselves type references.
struct type_ref {
    std::string name;
    std::optional<std::string> origin;
    std::vector<type_ref> arguments;

    bool is_parameterized() const noexcept { return !arguments.empty(); }

    bool operator==(const type_ref&) const = default;
};

// ---------------------------------------------------------------
// token: canonical identity of an injectable unit
// ---------------------------------------------------------------

enum class token_kind {
    nominal,
    synthetic
};

struct LIBCTDI_EXPORT token {
    token_kind  kind = token_kind::synthetic;

    /// Simple class name for nominal tokens, the key for synthetic ones.
    std::string name;

    /// Declaring-source identity.  Part of the identity of nominal tokens
    /// only; for synthetic tokens it is the origin of the base type, kept
    /// for the emitter.
    std::string origin;

    // Emitter-only data.  Never compared.
    std::string type_annotation;
    std::map<std::string, std::string> type_imports;

    static token nominal(std::string origin, std::string name);
    static token synthetic(std::string key);

    bool is_nominal() const noexcept { return kind == token_kind::nominal; }

    /// Stable map key.  Two tokens are the same component iff their keys
    /// are equal.
    std::string key() const;

    /// Short human-readable name used in diagnostics and cycle paths.
    const std::string& display_name() const noexcept { return name; }

    friend bool operator==(const token& a, const token& b) noexcept {
        if (a.kind != b.kind || a.name != b.name) return false;
        return a.kind == token_kind::synthetic || a.origin == b.origin;
    }
};

// ---------------------------------------------------------------
// Type reference resolution
// ---------------------------------------------------------------

/// True for built-in scalar names that can never be injected by type.
LIBCTDI_EXPORT bool is_primitive_type(std::string_view name) noexcept;

/// Canonical structural spelling, e.g. "Map<String, List<User>>".
/// A pure function of the tree shape; origins do not participate.
LIBCTDI_EXPORT std::string canonicalize(const type_ref& ref);

/// Transitive name -> origin map of every node in the tree that carries
/// an origin.
LIBCTDI_EXPORT std::map<std::string, std::string>
collect_type_imports(const type_ref& ref);

/// Resolve a type reference to a token:
///   - parameterized: synthetic token keyed by canonicalize(ref)
///   - known origin:  nominal token (origin, name)
///   - otherwise:     synthetic token keyed by the raw name
/// Primitive rejection is the caller's business since it depends on the
/// position the reference appears in.
LIBCTDI_EXPORT token resolve_type_ref(const type_ref& ref);

} // namespace libctdi
