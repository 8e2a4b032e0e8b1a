#include "graph_passes.hpp"
#include "graph_walk.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <string>
#include <utility>
#include <vector>

namespace libctdi::internal {

provider_index index_providers(const std::vector<component_descriptor>& components) {
    provider_index idx;
    for (std::size_t i = 0; i < components.size(); ++i) {
        idx[components[i].id.key()].push_back(i);
    }
    return idx;
}

std::string describe_provider(const component_descriptor& c) {
    if (c.provenance.has_value()) {
        return c.provenance->module.display_name() + "." + c.provenance->method_name;
    }
    return c.id.display_name();
}

// ------------------------------------------------------------------
// Check that every required dependency has exactly one provider
// ------------------------------------------------------------------

namespace {

void check_dependency(const dependency& dep,
                      const component_descriptor& owner,
                      const std::vector<component_descriptor>& components,
                      const provider_index& idx) {
    // Optional absences are fine; collections take however many exist.
    if (dep.optional || dep.collection) return;

    auto it = idx.find(dep.target.key());
    if (it == idx.end() || it->second.empty()) {
        raise(missing_provider(dep.target.display_name(),
                               owner.id.display_name(), owner.location));
    }
    if (it->second.size() > 1) {
        std::vector<std::string> names;
        names.reserve(it->second.size());
        for (auto i : it->second) names.push_back(describe_provider(components[i]));
        raise(ambiguous_provider(dep.target.display_name(), std::move(names),
                                 owner.location));
    }
}

} // anonymous namespace

void validate_providers(const std::vector<component_descriptor>& components) {
    auto idx = index_providers(components);

    for (auto& c : components) {
        for (auto& dep : c.dependencies) {
            check_dependency(dep, c, components, idx);
        }
        for (auto& dep : c.field_dependencies) {
            check_dependency(dep, c, components, idx);
        }
    }
}

// ------------------------------------------------------------------
// Topological order (DFS post-order on the component graph)
// ------------------------------------------------------------------

std::vector<component_descriptor>
order_components(std::vector<component_descriptor> components) {
    auto idx = index_providers(components);

    // Collection edges impose no order; missing optional targets simply
    // have no entry in the index.
    std::vector<std::vector<std::size_t>> edges(components.size());
    for (std::size_t i = 0; i < components.size(); ++i) {
        auto add = [&](const dependency& dep) {
            if (dep.collection) return;
            auto it = idx.find(dep.target.key());
            if (it == idx.end()) return;
            edges[i].insert(edges[i].end(), it->second.begin(), it->second.end());
        };
        for (auto& dep : components[i].dependencies) add(dep);
        for (auto& dep : components[i].field_dependencies) add(dep);
    }

    auto order = depth_first_order(
        components.size(),
        [&](std::size_t i) -> const std::vector<std::size_t>& { return edges[i]; },
        [&](std::size_t i) { return components[i].id.display_name(); },
        [&](std::size_t i) { return components[i].location; },
        cycle_kind::component);

    std::vector<component_descriptor> sorted;
    sorted.reserve(order.size());
    for (auto i : order) {
        sorted.push_back(std::move(components[i]));
    }
    return sorted;
}

} // namespace libctdi::internal
