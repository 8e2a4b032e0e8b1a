#include "graph_passes.hpp"
#include "graph_walk.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libctdi::internal {

namespace {

component_descriptor module_component(const module_descriptor& mod) {
    component_descriptor c;
    c.id = mod.id;
    c.scope = scope_kind::singleton;
    c.factory = factory_kind::constructor;
    c.metadata[std::string(metadata_keys::is_module)] = true;
    c.location = mod.location;
    return c;
}

component_descriptor provides_component(const module_descriptor& mod,
                                        const provides_descriptor& p) {
    component_descriptor c;
    c.id = p.id;
    c.scope = p.scope;
    c.eager = p.eager;
    c.qualifier = p.qualifier;
    c.factory = factory_kind::provides;
    c.provenance = provides_source{mod.id, p.method_name};
    c.location = p.location;

    // The module instance is the receiver of the factory call.
    c.dependencies.reserve(p.dependencies.size() + 1);
    c.dependencies.push_back(dependency{mod.id, false, false, {}, p.location});
    c.dependencies.insert(c.dependencies.end(),
                          p.dependencies.begin(), p.dependencies.end());
    return c;
}

} // anonymous namespace

void expand_modules(const std::vector<module_descriptor>& modules,
                    std::vector<component_descriptor>& components,
                    std::vector<std::string>& warnings,
                    const compile_options& options) {
    if (modules.empty()) return;

    std::unordered_map<std::string, std::size_t> by_key;
    for (std::size_t i = 0; i < modules.size(); ++i) {
        by_key.emplace(modules[i].id.key(), i);
    }

    std::vector<std::vector<std::size_t>> imports(modules.size());
    for (std::size_t i = 0; i < modules.size(); ++i) {
        auto& mod = modules[i];
        for (auto& imp : mod.imports) {
            auto it = by_key.find(imp.key());
            if (it != by_key.end()) {
                imports[i].push_back(it->second);
                continue;
            }
            if (options.strict_imports) {
                raise(missing_provider("module " + imp.display_name(),
                                       mod.id.display_name(), mod.location));
            }
            std::string warning = "Module " + mod.id.display_name()
                + " imports " + imp.display_name()
                + ", which is not a known module; import skipped";
            if (options.warnings_as_errors) {
                raise(invalid_declaration("module " + mod.id.display_name(),
                                          "warning treated as error: " + warning,
                                          mod.location));
            }
            LIBCTDI_LOG_WARNING << warning;
            warnings.push_back(std::move(warning));
        }
    }

    auto order = depth_first_order(
        modules.size(),
        [&](std::size_t i) -> const std::vector<std::size_t>& { return imports[i]; },
        [&](std::size_t i) { return modules[i].id.display_name(); },
        [&](std::size_t i) { return modules[i].location; },
        cycle_kind::module);

    for (std::size_t idx : order) {
        auto& mod = modules[idx];
        components.push_back(module_component(mod));
        for (auto& p : mod.provides) {
            components.push_back(provides_component(mod, p));
        }
        LIBCTDI_LOG_DEBUG << "expanded module " << mod.id.display_name()
                          << " (" << mod.provides.size() << " factory methods)";
    }
}

} // namespace libctdi::internal
