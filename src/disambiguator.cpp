#include "graph_passes.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <map>
#include <string>
#include <vector>

namespace libctdi::internal {

namespace {

using candidate_map = std::map<std::string, std::vector<std::size_t>>;

/// Point `dep` at the unique candidate, or fail if there are several.
/// Returns false when there is nothing to rewrite to.
bool rewrite_to_unique(dependency& dep, const candidate_map& candidates,
                       const std::string& lookup_key,
                       const std::vector<component_descriptor>& components,
                       const component_descriptor& owner,
                       const char* pass) {
    auto it = candidates.find(lookup_key);
    if (it == candidates.end() || it->second.empty()) return false;

    if (it->second.size() > 1) {
        std::vector<std::string> names;
        names.reserve(it->second.size());
        for (auto idx : it->second) names.push_back(describe_provider(components[idx]));
        raise(ambiguous_provider(dep.target.display_name(), std::move(names),
                                 owner.location));
    }

    const auto& target = components[it->second.front()].id;
    LIBCTDI_LOG_TRACE << pass << ": " << owner.id.display_name() << " -> "
                      << dep.target.display_name() << " rewritten to "
                      << target.display_name();
    dep.target = target;
    return true;
}

} // anonymous namespace

// ------------------------------------------------------------------
// Named qualifiers
// ------------------------------------------------------------------

void resolve_named_qualifiers(std::vector<component_descriptor>& components) {
    candidate_map named;
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i].qualifier.has_value()) {
            named[*components[i].qualifier].push_back(i);
        }
    }
    if (named.empty()) return;

    auto registered = index_providers(components);
    std::size_t rewrites = 0;

    auto visit = [&](dependency& dep, const component_descriptor& owner) {
        if (dep.target.is_nominal()) return;
        if (registered.contains(dep.target.key())) return;
        if (rewrite_to_unique(dep, named, dep.target.name, components, owner,
                              "named")) {
            ++rewrites;
        }
    };

    for (auto& c : components) {
        for (auto& dep : c.dependencies) visit(dep, c);
        for (auto& dep : c.field_dependencies) visit(dep, c);
    }
    LIBCTDI_LOG_DEBUG << "named qualifier pass rewrote " << rewrites
                      << " dependencies";
}

// ------------------------------------------------------------------
// Subtypes
// ------------------------------------------------------------------

void resolve_subtypes(std::vector<component_descriptor>& components) {
    // Every ancestor maps to all components that extend it, so with
    // C extends B extends A both B and A map to C.
    candidate_map subtypes;
    for (std::size_t i = 0; i < components.size(); ++i) {
        for (auto& base : components[i].base_types) {
            auto& list = subtypes[base.key()];
            if (list.empty() || list.back() != i) list.push_back(i);
        }
    }
    if (subtypes.empty()) return;

    auto registered = index_providers(components);
    std::size_t rewrites = 0;

    auto visit = [&](dependency& dep, const component_descriptor& owner) {
        // Collections take every provider at run time.
        if (dep.collection) return;
        auto key = dep.target.key();
        if (registered.contains(key)) return;
        if (rewrite_to_unique(dep, subtypes, key, components, owner, "subtype")) {
            ++rewrites;
        }
    };

    for (auto& c : components) {
        for (auto& dep : c.dependencies) visit(dep, c);
        for (auto& dep : c.field_dependencies) visit(dep, c);
    }
    LIBCTDI_LOG_DEBUG << "subtype pass rewrote " << rewrites << " dependencies";
}

} // namespace libctdi::internal
