/// basic_usage.cpp: compiling a small application by hand.
///
/// Demonstrates the declare → compile → consume workflow:
///   1. Describe components and a module the way a scanner would.
///   2. Hand them to a compiler.
///   3. Walk the ordered wiring plan (dependencies always come first).

#include <libctdi.hpp>

#include <iostream>
#include <string>

using namespace libctdi;

namespace {

type_ref class_type(const std::string& name, const std::string& file) {
    return type_ref{name, file, {}};
}

type_ref repository_of(const std::string& entity) {
    return type_ref{"Repository", "src/Repository.ts",
                    {class_type(entity, "src/model.ts")}};
}

parameter_declaration param(const std::string& name, type_ref type) {
    parameter_declaration p;
    p.name = name;
    p.type = std::move(type);
    return p;
}

} // namespace

int main() {
    log::init({.minimum = log::level::info});

    // -----------------------------------------------------------------
    // A module providing two repositories and a primitive setting
    // -----------------------------------------------------------------
    module_declaration app;
    app.name = "AppModule";
    app.origin = "src/AppModule.ts";
    app.provides.push_back({.method_name = "userRepository",
                            .return_type = repository_of("User")});
    app.provides.push_back({.method_name = "orderRepository",
                            .return_type = repository_of("Order")});
    app.provides.push_back({.method_name = "appName",
                            .return_type = type_ref{"string", std::nullopt, {}}});

    // -----------------------------------------------------------------
    // Services consuming them
    // -----------------------------------------------------------------
    component_declaration users;
    users.name = "UserService";
    users.origin = "src/UserService.ts";
    users.constructor_params.push_back(param("userRepo", repository_of("User")));

    component_declaration orders;
    orders.name = "OrderService";
    orders.origin = "src/OrderService.ts";
    orders.constructor_params.push_back(param("orderRepo", repository_of("Order")));

    compiler c;
    c.add_component(users).add_component(orders).add_module(app);

    try {
        auto plan = c.compile();
        std::cout << "Wiring order:\n";
        for (auto& comp : plan.components) {
            std::cout << "  " << comp.id.display_name()
                      << " (" << to_string(comp.scope) << ", "
                      << to_string(comp.factory) << ")\n";
        }
        std::cout << '\n' << plan_to_yaml(plan) << '\n';
    } catch (const compile_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return 1;
    }
    return 0;
}
