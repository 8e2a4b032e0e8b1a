#pragma once

#include "export.hpp"
#include "descriptor.hpp"

namespace libctdi {

/// Graph stage: expand modules, disambiguate named and subtype
/// references, validate providers, and order the components so that each
/// one follows everything it depends on.
///
/// Throws circular_dependency, missing_provider, ambiguous_provider, or
/// invalid_declaration (warnings_as_errors).  Nothing is returned on
/// failure.
LIBCTDI_EXPORT compile_result build_graph(resolve_result resolved,
                                          const compile_options& options = {});

} // namespace libctdi
