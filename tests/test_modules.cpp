#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include "scan_builders.hpp"

#include <string>

using namespace scan_builders;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("module expands into a module component and its factories", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule",
        {provides("userRepository", generic("Repository", {cls("User")})),
         provides("mailer", cls("Mailer"))}));

    auto plan = compile(std::move(scan));
    REQUIRE(plan.components.size() == 3);

    auto& mod = find_component(plan, "AppModule");
    REQUIRE(mod.factory == libctdi::factory_kind::constructor);
    REQUIRE(mod.scope == libctdi::scope_kind::singleton);
    auto is_module = libctdi::find_metadata<bool>(mod.metadata,
                                                  libctdi::metadata_keys::is_module);
    REQUIRE(is_module != nullptr);
    REQUIRE(*is_module);

    auto& repo = find_component(plan, "Repository<User>");
    REQUIRE(repo.factory == libctdi::factory_kind::provides);
    REQUIRE(repo.provenance.has_value());
    REQUIRE(repo.provenance->method_name == "userRepository");
    REQUIRE(repo.provenance->module == mod.id);
}

TEST_CASE("factory components depend on their module first", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("InfraModule",
        {provides("connection", cls("Connection"), {param("clock", cls("Clock"))})}));
    scan.components.push_back(component("Clock"));

    auto plan = compile(std::move(scan));
    auto& conn = find_component(plan, "Connection");
    REQUIRE(conn.dependencies.size() == 2);
    REQUIRE(conn.dependencies[0].target.display_name() == "InfraModule");
    REQUIRE(conn.dependencies[0].name.empty());
    REQUIRE(conn.dependencies[1].name == "clock");

    REQUIRE(position_of(plan, "InfraModule") < position_of(plan, "Connection"));
    REQUIRE(position_of(plan, "Clock") < position_of(plan, "Connection"));
}

TEST_CASE("module diamond imports expand each module once", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule", {}, {"WebModule", "JobModule"}));
    scan.modules.push_back(module_of("WebModule", {}, {"CoreModule"}));
    scan.modules.push_back(module_of("JobModule", {}, {"CoreModule"}));
    scan.modules.push_back(module_of("CoreModule",
        {provides("clock", cls("Clock"))}));

    auto plan = compile(std::move(scan));
    REQUIRE(plan.components.size() == 5);
    REQUIRE(plan.warnings.empty());

    auto core = position_of(plan, "CoreModule");
    REQUIRE(core < position_of(plan, "WebModule"));
    REQUIRE(core < position_of(plan, "JobModule"));
    REQUIRE(position_of(plan, "WebModule") < position_of(plan, "AppModule"));
    REQUIRE(position_of(plan, "JobModule") < position_of(plan, "AppModule"));
}

TEST_CASE("cyclic module imports are rejected", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AModule", {}, {"BModule"}));
    scan.modules.push_back(module_of("BModule", {}, {"AModule"}));

    try {
        compile(std::move(scan));
        FAIL("Expected circular_dependency");
    } catch (const libctdi::circular_dependency& e) {
        REQUIRE(e.kind() == libctdi::cycle_kind::module);
        REQUIRE(e.cycle() == std::vector<std::string>{"AModule", "BModule", "AModule"});
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("Circular module import"));
    }
}

TEST_CASE("unknown module import is a warning", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule", {}, {"GhostModule"}));

    auto plan = compile(std::move(scan));
    REQUIRE(plan.warnings.size() == 1);
    REQUIRE_THAT(plan.warnings.front(), ContainsSubstring("GhostModule"));
}

TEST_CASE("unknown module import fails under strict imports", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule", {}, {"GhostModule"}));

    REQUIRE_THROWS_AS(compile(std::move(scan), {.strict_imports = true}),
                      libctdi::missing_provider);
}

TEST_CASE("primitive parameter wires to the only same-typed factory", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("DbModule",
        {provides("dbUrl", prim("string")),
         provides("connection", cls("Connection"), {param("url", prim("string"))})}));

    auto plan = compile(std::move(scan));
    auto& conn = find_component(plan, "Connection");
    REQUIRE(conn.dependencies[1].target == libctdi::token::synthetic("dbUrl"));
    REQUIRE(position_of(plan, "dbUrl") < position_of(plan, "Connection"));

    auto& url = find_component(plan, "dbUrl");
    REQUIRE(url.id.type_annotation == "string");
}

TEST_CASE("primitive parameter picks the factory with its name", "[modules]") {
    auto db = module_of("DbModule",
        {provides("host", prim("string")),
         provides("dbUrl", prim("string")),
         provides("connection", cls("Connection"), {param("dbUrl", prim("string"))})});

    SECTION("name matching on") {
        libctdi::scan_result scan;
        scan.modules.push_back(db);
        auto plan = compile(std::move(scan));
        auto& conn = find_component(plan, "Connection");
        REQUIRE(conn.dependencies[1].target == libctdi::token::synthetic("dbUrl"));
    }

    SECTION("name matching off") {
        libctdi::scan_result scan;
        scan.modules.push_back(db);
        REQUIRE_THROWS_AS(compile(std::move(scan), {.primitive_name_matching = false}),
                          libctdi::unresolvable_type);
    }
}

TEST_CASE("ambiguous primitive parameter asks for a rename", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("DbModule",
        {provides("host", prim("string")),
         provides("dbUrl", prim("string")),
         provides("connection", cls("Connection"), {param("target", prim("string"))})}));

    try {
        compile(std::move(scan));
        FAIL("Expected unresolvable_type");
    } catch (const libctdi::unresolvable_type& e) {
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("host, dbUrl"));
    }
}

TEST_CASE("primitive parameter with no same-module factory is rejected", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("ConfigModule", {provides("port", prim("number"))}));
    scan.modules.push_back(module_of("ServerModule",
        {provides("server", cls("Server"), {param("port", prim("number"))})},
        {"ConfigModule"}));

    REQUIRE_THROWS_AS(compile(std::move(scan)), libctdi::unresolvable_type);
}

TEST_CASE("interface-typed factory is named after its method", "[modules]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule", {provides("clock", iface("Clock"))}));

    auto plan = compile(std::move(scan));
    auto& clock = find_component(plan, "clock");
    REQUIRE_FALSE(clock.id.is_nominal());
    REQUIRE(clock.id.type_annotation == "Clock");
}

TEST_CASE("factory method flags are checked", "[modules]") {
    auto factory = provides("worker", cls("Worker"));
    factory.scope = libctdi::scope_kind::prototype;
    factory.eager = true;

    libctdi::scan_result scan;
    scan.modules.push_back(module_of("JobModule", {factory}));
    REQUIRE_THROWS_AS(compile(std::move(scan)), libctdi::invalid_declaration);
}

TEST_CASE("abstract module is rejected", "[modules]") {
    auto mod = module_of("BaseModule");
    mod.is_abstract = true;

    libctdi::scan_result scan;
    scan.modules.push_back(mod);
    REQUIRE_THROWS_AS(compile(std::move(scan)), libctdi::invalid_declaration);
}
