#pragma once

#include "export.hpp"
#include "declaration.hpp"
#include "descriptor.hpp"

#include <memory>

namespace libctdi {

/// Collects scanner declarations and compiles them into a wiring plan.
///
///   libctdi::compiler c;
///   c.add_component(repo).add_component(service).add_module(app);
///   auto plan = c.compile();
///
/// A compiler owns its declarations and compiles exactly once.
class LIBCTDI_EXPORT compiler {
public:
    compiler();
    ~compiler();

    compiler(const compiler&) = delete;
    compiler& operator=(const compiler&) = delete;
    compiler(compiler&&) noexcept;
    compiler& operator=(compiler&&) noexcept;

    /// Throws invalid_declaration if a class with the same identity was
    /// already added.
    compiler& add_component(component_declaration decl);

    /// Throws invalid_declaration if a module with the same identity was
    /// already added.
    compiler& add_module(module_declaration decl);

    /// Add a whole scan, including its warnings.  Either every
    /// declaration is added or, on a duplicate, none is.
    compiler& add(scan_result scan);

    /// Metadata merged into the component for `class_id` after
    /// resolution, overriding scanner metadata under the same keys.
    /// Tokens that name no component are ignored.
    compiler& add_class_metadata(const token& class_id, metadata_map metadata);

    /// Hooks run in registration order.
    compiler& add_resolve_hook(resolve_hook hook);
    compiler& add_plan_hook(plan_hook hook);

    /// resolve(), class metadata, resolve hooks, build_graph(), then plan
    /// hooks.  Throws compile_error when called twice.
    compile_result compile(compile_options options = {});

    const scan_result& declarations() const;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace libctdi
