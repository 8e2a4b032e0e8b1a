#include "libctdi/graph_builder.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "graph_passes.hpp"
#include "stacktrace_utils.hpp"

#include <utility>

namespace libctdi {

compile_result build_graph(resolve_result resolved, const compile_options& options) {
    log::install_default_filter();
    compile_result result;
    result.warnings = std::move(resolved.warnings);
    auto& components = resolved.components;

    // Scanner warnings carry no position.  Warnings raised by the passes
    // below fail at their own declaration.
    if (options.warnings_as_errors && !result.warnings.empty()) {
        internal::raise(invalid_declaration(
            "compile run", "warning treated as error: " + result.warnings.front(),
            source_position{}));
    }

    // ① modules -> components
    internal::expand_modules(resolved.modules, components, result.warnings, options);
    LIBCTDI_LOG_DEBUG << components.size() << " components after module expansion";

    // ② named qualifiers first: a named rewrite can satisfy what would
    //    otherwise look like a missing nominal dependency
    internal::resolve_named_qualifiers(components);
    if (options.subtype_resolution) {
        internal::resolve_subtypes(components);
    }

    // ③ validate
    if (options.validate_providers) {
        internal::validate_providers(components);
    }

    // ④ order
    result.components = internal::order_components(std::move(components));

    LIBCTDI_LOG_DEBUG << "wiring plan has " << result.components.size()
                      << " components, " << result.warnings.size() << " warnings";
    return result;
}

} // namespace libctdi
