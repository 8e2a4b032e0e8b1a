#include "libctdi/compiler.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/graph_builder.hpp"
#include "libctdi/logging.hpp"
#include "libctdi/resolver.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct compiler::impl {
    scan_result scan;
    bool compiled = false;

    // Token keys of every class and module added so far.  Components and
    // modules share one namespace: a class cannot be both.
    std::set<std::string> declared;

    std::map<std::string, metadata_map> class_metadata;
    std::vector<resolve_hook> resolve_hooks;
    std::vector<plan_hook> plan_hooks;

    void ensure_open(const char* what) const {
        if (compiled) {
            throw compile_error(std::string("Cannot ") + what
                                + " after compile() has been called");
        }
    }

    /// Throws if the identity is already declared or already in `batch`;
    /// otherwise records it in `batch`.  Nothing is committed.
    void check_unclaimed(const std::string& kind, const std::string& name,
                         const std::string& origin, const source_position& where,
                         std::set<std::string>& batch) const {
        auto key = token::nominal(origin, name).key();
        if (declared.contains(key) || !batch.insert(key).second) {
            throw invalid_declaration(kind + " \"" + name + "\"",
                                      "declared more than once", where);
        }
    }

    void merge_class_metadata(resolve_result& resolved) const {
        if (class_metadata.empty()) return;
        for (auto& c : resolved.components) {
            if (!c.id.is_nominal()) continue;
            auto it = class_metadata.find(c.id.key());
            if (it == class_metadata.end()) continue;
            for (auto& [key, value] : it->second) {
                c.metadata.insert_or_assign(key, value);
            }
        }
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

compiler::compiler()
    : impl_(std::make_unique<impl>())
{}

compiler::~compiler() = default;

compiler::compiler(compiler&&) noexcept = default;
compiler& compiler::operator=(compiler&&) noexcept = default;

// ---------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------

compiler& compiler::add_component(component_declaration decl) {
    impl_->ensure_open("add components");
    std::set<std::string> batch;
    impl_->check_unclaimed("component", decl.name, decl.origin, decl.location, batch);
    impl_->declared.merge(batch);
    impl_->scan.components.push_back(std::move(decl));
    return *this;
}

compiler& compiler::add_module(module_declaration decl) {
    impl_->ensure_open("add modules");
    std::set<std::string> batch;
    impl_->check_unclaimed("module", decl.name, decl.origin, decl.location, batch);
    impl_->declared.merge(batch);
    impl_->scan.modules.push_back(std::move(decl));
    return *this;
}

compiler& compiler::add(scan_result scan) {
    impl_->ensure_open("add declarations");

    // ① check every identity
    std::set<std::string> batch;
    for (auto& c : scan.components) {
        impl_->check_unclaimed("component", c.name, c.origin, c.location, batch);
    }
    for (auto& m : scan.modules) {
        impl_->check_unclaimed("module", m.name, m.origin, m.location, batch);
    }

    // ② commit
    impl_->declared.merge(batch);
    auto& into = impl_->scan;
    for (auto& c : scan.components) into.components.push_back(std::move(c));
    for (auto& m : scan.modules) into.modules.push_back(std::move(m));
    for (auto& w : scan.warnings) into.warnings.push_back(std::move(w));
    return *this;
}

compiler& compiler::add_class_metadata(const token& class_id, metadata_map metadata) {
    impl_->ensure_open("add metadata");
    auto& target = impl_->class_metadata[class_id.key()];
    for (auto& [key, value] : metadata) {
        target.insert_or_assign(key, std::move(value));
    }
    return *this;
}

compiler& compiler::add_resolve_hook(resolve_hook hook) {
    impl_->ensure_open("add hooks");
    impl_->resolve_hooks.push_back(std::move(hook));
    return *this;
}

compiler& compiler::add_plan_hook(plan_hook hook) {
    impl_->ensure_open("add hooks");
    impl_->plan_hooks.push_back(std::move(hook));
    return *this;
}

const scan_result& compiler::declarations() const {
    return impl_->scan;
}

// ---------------------------------------------------------------
// compile
// ---------------------------------------------------------------

compile_result compiler::compile(compile_options options) {
    if (impl_->compiled) {
        throw compile_error("compile() can only be called once");
    }
    impl_->compiled = true;
    log::install_default_filter();

    LIBCTDI_LOG_INFO << "compiling " << impl_->scan.components.size()
                     << " components and " << impl_->scan.modules.size()
                     << " modules";
    for (auto& w : impl_->scan.warnings) {
        LIBCTDI_LOG_WARNING << "scanner: " << w;
    }

    auto resolved = resolve(impl_->scan, options);
    impl_->merge_class_metadata(resolved);
    for (auto& hook : impl_->resolve_hooks) {
        hook(resolved);
    }

    auto plan = build_graph(std::move(resolved), options);
    for (auto& hook : impl_->plan_hooks) {
        hook(plan);
    }
    LIBCTDI_LOG_DEBUG << "ran " << impl_->resolve_hooks.size() << " resolve hooks and "
                      << impl_->plan_hooks.size() << " plan hooks";
    return plan;
}

} // namespace libctdi
