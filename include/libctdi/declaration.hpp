#pragma once

/// @file declaration.hpp
/// Raw scanner output.  Nothing here has been validated or resolved;
/// `resolve()` turns it into descriptors (see descriptor.hpp).

#include "location.hpp"
#include "metadata.hpp"
#include "scope.hpp"
#include "token.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libctdi {

/// A constructor or factory-method parameter.
struct parameter_declaration {
    std::string name;
    /// Declared type; the element type when `collection` is set.
    /// Empty when the scanner could not determine a type.
    std::optional<type_ref> type;
    bool collection = false;
    bool optional   = false;
    source_position location;
};

/// An injected field (accessor).  A qualifier takes precedence over the
/// declared type.
struct field_declaration {
    std::string name;
    std::optional<type_ref> type;
    std::optional<std::string> qualifier;
    bool optional = false;
    source_position location;
};

/// An injectable class.
struct component_declaration {
    std::string name;
    std::string origin;
    scope_kind  scope = scope_kind::singleton;
    bool        eager = false;
    bool        is_abstract = false;
    std::optional<std::string> qualifier;
    std::vector<parameter_declaration> constructor_params;
    std::vector<field_declaration> fields;
    /// Ancestors, direct parent first.
    std::vector<type_ref> base_types;
    std::vector<std::string> post_construct_methods;
    std::vector<std::string> pre_destroy_methods;
    metadata_map metadata;
    source_position location;
};

/// A factory method inside a module.
struct provides_declaration {
    std::string method_name;
    std::optional<type_ref> return_type;
    std::vector<parameter_declaration> params;
    scope_kind scope = scope_kind::singleton;
    bool       eager = false;
    std::optional<std::string> qualifier;
    source_position location;
};

/// A module: a class bundling factory methods, optionally importing
/// other modules.
struct module_declaration {
    std::string name;
    std::string origin;
    bool        is_abstract = false;
    std::vector<type_ref> imports;
    std::vector<provides_declaration> provides;
    source_position location;
};

/// Everything one scanner run produced.
struct scan_result {
    std::vector<component_declaration> components;
    std::vector<module_declaration> modules;
    std::vector<std::string> warnings;
};

} // namespace libctdi
