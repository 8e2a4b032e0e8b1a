#pragma once

#include "export.hpp"
#include "declaration.hpp"
#include "descriptor.hpp"

namespace libctdi {

/// Resolution stage: turn raw scanner output into descriptors.
///
/// Every type reference becomes a token, every parameter and field a
/// dependency.  Modules are resolved but not expanded; qualifier
/// references stay as synthetic placeholders for build_graph().
///
/// Throws unresolvable_type for primitive or undeterminable dependency
/// types and invalid_declaration for structurally invalid declarations.
LIBCTDI_EXPORT resolve_result resolve(const scan_result& scan,
                                      const compile_options& options = {});

} // namespace libctdi
