#pragma once

#include "location.hpp"
#include "metadata.hpp"
#include "scope.hpp"
#include "token.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// compile_options: switches for one compile run
// ---------------------------------------------------------------

struct compile_options {
    /// Run the missing/ambiguous provider check.  Ordering still runs.
    bool validate_providers = true;

    /// Rewrite unregistered dependencies onto a unique subtype provider.
    bool subtype_resolution = true;

    /// Among several same-typed primitive factory outputs, wire the one
    /// whose method name equals the parameter name.
    bool primitive_name_matching = true;

    /// Treat a module import that names no known module as a missing
    /// provider instead of a warning.
    bool strict_imports = false;

    /// Fail the run if any warning was collected.
    bool warnings_as_errors = false;
};

// ---------------------------------------------------------------
// dependency: one edge of the component graph
// ---------------------------------------------------------------

struct dependency {
    token target;
    bool optional   = false;
    bool collection = false;
    /// Parameter or field name; empty for implicit module dependencies.
    std::string name;
    source_position location;
};

// ---------------------------------------------------------------
// component_descriptor: one node of the wiring plan
// ---------------------------------------------------------------

enum class factory_kind {
    constructor,
    provides
};

constexpr std::string_view to_string(factory_kind k) noexcept {
    return k == factory_kind::constructor ? "constructor" : "provides";
}

struct provides_source {
    token       module;
    std::string method_name;
};

struct component_descriptor {
    token        id;
    scope_kind   scope = scope_kind::singleton;
    bool         eager = false;
    std::optional<std::string> qualifier;
    std::vector<dependency> dependencies;        // constructor order
    std::vector<dependency> field_dependencies;
    factory_kind factory = factory_kind::constructor;
    std::optional<provides_source> provenance;
    /// Ancestors, nearest first.
    std::vector<token> base_types;
    metadata_map metadata;
    source_position location;
};

// ---------------------------------------------------------------
// module_descriptor: a resolved, not yet expanded module
// ---------------------------------------------------------------

struct provides_descriptor {
    std::string method_name;
    token       id;
    scope_kind  scope = scope_kind::singleton;
    bool        eager = false;
    std::optional<std::string> qualifier;
    std::vector<dependency> dependencies;
    source_position location;
};

struct module_descriptor {
    token id;
    std::vector<token> imports;
    std::vector<provides_descriptor> provides;
    source_position location;
};

// ---------------------------------------------------------------
// Stage results
// ---------------------------------------------------------------

struct resolve_result {
    std::vector<component_descriptor> components;
    std::vector<module_descriptor> modules;
    std::vector<std::string> warnings;
};

/// Final output: components in dependency-before-dependent order.
struct compile_result {
    std::vector<component_descriptor> components;
    std::vector<std::string> warnings;
};

// ---------------------------------------------------------------
// Pipeline hooks
// ---------------------------------------------------------------

/// Runs between resolve() and build_graph().  May edit descriptors,
/// including dependencies and metadata; the edits are validated and
/// ordered like scanner input.
using resolve_hook = std::function<void(resolve_result&)>;

/// Runs on the ordered plan before it is returned.  Edits are not
/// revalidated.
using plan_hook = std::function<void(compile_result&)>;

} // namespace libctdi
