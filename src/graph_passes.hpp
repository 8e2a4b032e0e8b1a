#pragma once

// Internal: the individual build_graph() passes.  Not installed.

#include "libctdi/descriptor.hpp"
#include "libctdi/export.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace libctdi::internal {

/// token key -> indices of the components registered under it
using provider_index = std::unordered_map<std::string, std::vector<std::size_t>>;

LIBCTDI_HIDDEN provider_index index_providers(const std::vector<component_descriptor>& components);

/// "Module.method" for factory-method products, the token name otherwise.
LIBCTDI_HIDDEN std::string describe_provider(const component_descriptor& c);

/// Append one implicit singleton per module and one component per factory
/// method, imported modules first.
LIBCTDI_HIDDEN void expand_modules(const std::vector<module_descriptor>& modules,
                                   std::vector<component_descriptor>& components,
                                   std::vector<std::string>& warnings,
                                   const compile_options& options);

/// Rewrite unregistered synthetic dependencies onto the unique component
/// carrying that qualifier name.
LIBCTDI_HIDDEN void resolve_named_qualifiers(std::vector<component_descriptor>& components);

/// Rewrite unregistered non-collection dependencies onto the unique
/// component that declares the requested type as an ancestor.
LIBCTDI_HIDDEN void resolve_subtypes(std::vector<component_descriptor>& components);

/// Every required dependency has exactly one provider.
LIBCTDI_HIDDEN void validate_providers(const std::vector<component_descriptor>& components);

/// Dependencies before dependents; throws circular_dependency.
LIBCTDI_HIDDEN std::vector<component_descriptor>
order_components(std::vector<component_descriptor> components);

} // namespace libctdi::internal
