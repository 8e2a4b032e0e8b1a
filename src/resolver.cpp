#include "libctdi/resolver.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace libctdi {

namespace {

// ------------------------------------------------------------------
// Declaration sanity checks
// ------------------------------------------------------------------

void check_scope_flags(const std::string& what, scope_kind scope, bool eager,
                       const std::optional<std::string>& qualifier,
                       const source_position& where) {
    if (eager && scope == scope_kind::prototype) {
        internal::raise(invalid_declaration(
            what, "eager instantiation applies to singletons only; "
                  "remove the eager flag or make it a singleton", where));
    }
    if (qualifier.has_value() && qualifier->empty()) {
        internal::raise(invalid_declaration(
            what, "qualifier name must not be empty", where));
    }
}

void check_component(const component_declaration& decl) {
    std::string what = "component \"" + decl.name + "\"";
    if (decl.name.empty()) {
        internal::raise(invalid_declaration(
            "component", "declaration has no name", decl.location));
    }
    if (decl.is_abstract) {
        internal::raise(invalid_declaration(
            what, "abstract classes cannot be instantiated; remove the "
                  "annotation or make the class concrete", decl.location));
    }
    check_scope_flags(what, decl.scope, decl.eager, decl.qualifier, decl.location);
}

void check_module(const module_declaration& decl) {
    if (decl.name.empty()) {
        internal::raise(invalid_declaration(
            "module", "declaration has no name", decl.location));
    }
    if (decl.is_abstract) {
        internal::raise(invalid_declaration(
            "module \"" + decl.name + "\"",
            "abstract classes cannot be instantiated; remove the annotation "
            "or make the class concrete", decl.location));
    }
    for (auto& p : decl.provides) {
        check_scope_flags("factory method \"" + decl.name + "." + p.method_name + "\"",
                          p.scope, p.eager, p.qualifier, p.location);
    }
}

// ------------------------------------------------------------------
// Constructor parameters and fields
// ------------------------------------------------------------------

std::string describe_param(const parameter_declaration& p, const std::string& owner) {
    return "parameter \"" + p.name + "\" of " + owner;
}

dependency resolve_constructor_param(const parameter_declaration& p,
                                     const std::string& owner) {
    if (!p.type.has_value()) {
        internal::raise(unresolvable_type(describe_param(p, owner), p.location));
    }
    const type_ref& type = *p.type;

    if (p.collection) {
        if (is_primitive_type(type.name)) {
            internal::raise(unresolvable_type(
                canonicalize(type) + "[] (" + describe_param(p, owner)
                + ") - collection injection of primitive types is not supported",
                p.location));
        }
        return dependency{resolve_type_ref(type), p.optional, true, p.name, p.location};
    }

    if (is_primitive_type(type.name)) {
        internal::raise(unresolvable_type(
            type.name + " (" + describe_param(p, owner) + ")", p.location));
    }
    return dependency{resolve_type_ref(type), p.optional, false, p.name, p.location};
}

dependency resolve_field(const field_declaration& f, const std::string& owner) {
    if (f.qualifier.has_value()) {
        if (f.qualifier->empty()) {
            internal::raise(invalid_declaration(
                "field \"" + f.name + "\" of " + owner,
                "qualifier name must not be empty", f.location));
        }
        // Matched against named components by the disambiguator.
        return dependency{token::synthetic(*f.qualifier), f.optional, false,
                          f.name, f.location};
    }

    if (!f.type.has_value() || is_primitive_type(f.type->name)) {
        internal::raise(unresolvable_type(
            "field \"" + f.name + "\" of " + owner, f.location));
    }
    return dependency{resolve_type_ref(*f.type), f.optional, false, f.name, f.location};
}

component_descriptor resolve_component(const component_declaration& decl) {
    check_component(decl);

    component_descriptor desc;
    desc.id = token::nominal(decl.origin, decl.name);
    desc.scope = decl.scope;
    desc.eager = decl.eager;
    desc.qualifier = decl.qualifier;
    desc.factory = factory_kind::constructor;
    desc.location = decl.location;

    desc.dependencies.reserve(decl.constructor_params.size());
    for (auto& p : decl.constructor_params) {
        desc.dependencies.push_back(resolve_constructor_param(p, decl.name));
    }
    desc.field_dependencies.reserve(decl.fields.size());
    for (auto& f : decl.fields) {
        desc.field_dependencies.push_back(resolve_field(f, decl.name));
    }

    // Ancestors the scanner could not locate cannot be providers of
    // anything, so they are dropped.
    for (auto& base : decl.base_types) {
        if (base.origin.has_value() || base.is_parameterized()) {
            desc.base_types.push_back(resolve_type_ref(base));
        }
    }

    desc.metadata = decl.metadata;
    if (!decl.post_construct_methods.empty()) {
        desc.metadata[std::string(metadata_keys::post_construct_methods)] =
            decl.post_construct_methods;
    }
    if (!decl.pre_destroy_methods.empty()) {
        desc.metadata[std::string(metadata_keys::pre_destroy_methods)] =
            decl.pre_destroy_methods;
    }
    return desc;
}

// ------------------------------------------------------------------
// Modules
// ------------------------------------------------------------------

struct primitive_candidate {
    std::string method_name;
    token       id;
};

using primitive_index = std::map<std::string, std::vector<primitive_candidate>>;

/// Token for a factory method's product.  Primitive and interface-typed
/// products are named after the method.
token resolve_provides_return(const provides_declaration& p) {
    if (!p.return_type.has_value() || is_primitive_type(p.return_type->name)) {
        auto t = token::synthetic(p.method_name);
        if (p.return_type.has_value()) t.type_annotation = p.return_type->name;
        return t;
    }
    const type_ref& type = *p.return_type;
    if (type.is_parameterized() || type.origin.has_value()) {
        return resolve_type_ref(type);
    }
    auto t = token::synthetic(p.method_name);
    t.type_annotation = canonicalize(type);
    return t;
}

dependency resolve_primitive_param(const parameter_declaration& p,
                                   const std::string& owner,
                                   const primitive_index& primitives,
                                   const compile_options& options) {
    const std::string& type_name = p.type->name;
    auto it = primitives.find(type_name);
    if (it == primitives.end() || it->second.empty()) {
        internal::raise(unresolvable_type(
            type_name + " (" + describe_param(p, owner) + ")", p.location));
    }

    auto& candidates = it->second;
    if (candidates.size() == 1) {
        return dependency{candidates.front().id, false, false, p.name, p.location};
    }

    if (options.primitive_name_matching) {
        for (auto& c : candidates) {
            if (c.method_name == p.name) {
                return dependency{c.id, false, false, p.name, p.location};
            }
        }
    }

    std::string names;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (i > 0) names += ", ";
        names += candidates[i].method_name;
    }
    internal::raise(unresolvable_type(
        type_name + " (" + describe_param(p, owner) + ") - multiple providers "
        "exist (" + names + "); rename the parameter to match one of the "
        "factory method names to disambiguate", p.location));
}

module_descriptor resolve_module(const module_declaration& decl,
                                 const compile_options& options) {
    check_module(decl);

    module_descriptor mod;
    mod.id = token::nominal(decl.origin, decl.name);
    mod.location = decl.location;

    for (auto& imp : decl.imports) {
        mod.imports.push_back(token::nominal(imp.origin.value_or(std::string{}),
                                             imp.name));
    }

    // Pass 1: product tokens, and an index of primitive-typed products
    // for wiring primitive parameters.
    std::vector<token> products;
    products.reserve(decl.provides.size());
    primitive_index primitives;
    for (auto& p : decl.provides) {
        products.push_back(resolve_provides_return(p));
        if (p.return_type.has_value() && is_primitive_type(p.return_type->name)) {
            primitives[p.return_type->name].push_back({p.method_name, products.back()});
        }
    }

    // Pass 2: parameters.
    for (std::size_t i = 0; i < decl.provides.size(); ++i) {
        auto& p = decl.provides[i];
        std::string owner = decl.name + "." + p.method_name;

        provides_descriptor pd;
        pd.method_name = p.method_name;
        pd.id = products[i];
        pd.scope = p.scope;
        pd.eager = p.eager;
        pd.qualifier = p.qualifier;
        pd.location = p.location;

        for (auto& param : p.params) {
            if (param.type.has_value() && !param.collection
                    && is_primitive_type(param.type->name)) {
                pd.dependencies.push_back(
                    resolve_primitive_param(param, owner, primitives, options));
            } else {
                pd.dependencies.push_back(resolve_constructor_param(param, owner));
            }
        }
        mod.provides.push_back(std::move(pd));
    }
    return mod;
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point
// ------------------------------------------------------------------

resolve_result resolve(const scan_result& scan, const compile_options& options) {
    log::install_default_filter();
    resolve_result result;
    result.warnings = scan.warnings;

    result.components.reserve(scan.components.size());
    for (auto& decl : scan.components) {
        result.components.push_back(resolve_component(decl));
    }

    result.modules.reserve(scan.modules.size());
    for (auto& decl : scan.modules) {
        result.modules.push_back(resolve_module(decl, options));
    }

    LIBCTDI_LOG_DEBUG << "resolved " << result.components.size()
                      << " components and " << result.modules.size()
                      << " modules";
    return result;
}

} // namespace libctdi
