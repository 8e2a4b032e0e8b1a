#pragma once

/// @file fwd.hpp
/// Forward declarations for the public libctdi types.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libctdi {

// location.hpp
struct source_position;

// scope.hpp
enum class scope_kind;

// token.hpp
struct type_ref;
enum class token_kind;
struct token;

// declaration.hpp
struct parameter_declaration;
struct field_declaration;
struct component_declaration;
struct provides_declaration;
struct module_declaration;
struct scan_result;

// descriptor.hpp
struct compile_options;
struct dependency;
enum class factory_kind;
struct provides_source;
struct component_descriptor;
struct provides_descriptor;
struct module_descriptor;
struct resolve_result;
struct compile_result;

// exceptions.hpp
class compile_error;
class unresolvable_type;
class missing_provider;
class ambiguous_provider;
enum class cycle_kind;
class circular_dependency;
class invalid_declaration;

// compiler.hpp
class compiler;

// config.hpp
struct tool_config;

} // namespace libctdi
