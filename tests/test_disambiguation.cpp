#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include "scan_builders.hpp"

#include <string>

using namespace scan_builders;
using Catch::Matchers::ContainsSubstring;

namespace {

libctdi::component_declaration qualified(const std::string& name,
                                         const std::string& qualifier) {
    auto c = component(name);
    c.qualifier = qualifier;
    return c;
}

libctdi::component_declaration extending(const std::string& name,
                                         std::vector<libctdi::type_ref> bases) {
    auto c = component(name);
    c.base_types = std::move(bases);
    return c;
}

} // namespace

TEST_CASE("qualified field resolves to the named component", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(qualified("PostgresDb", "primaryDb"));
    scan.components.push_back(qualified("SqliteDb", "cacheDb"));
    auto consumer = component("ReportService");
    consumer.fields.push_back(named_field("db", "primaryDb"));
    scan.components.push_back(consumer);

    auto plan = compile(std::move(scan));
    auto& report = find_component(plan, "ReportService");
    REQUIRE(report.field_dependencies.front().target
            == libctdi::token::nominal("src/PostgresDb.ts", "PostgresDb"));
    REQUIRE(position_of(plan, "PostgresDb") < position_of(plan, "ReportService"));
}

TEST_CASE("interface-typed parameter resolves through a qualifier", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(qualified("SystemClock", "Clock"));
    scan.components.push_back(component("Scheduler", {param("clock", iface("Clock"))}));

    auto plan = compile(std::move(scan));
    auto& scheduler = find_component(plan, "Scheduler");
    REQUIRE(scheduler.dependencies.front().target.display_name() == "SystemClock");
}

TEST_CASE("two components with one qualifier are ambiguous", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(qualified("PostgresDb", "db"));
    scan.components.push_back(qualified("SqliteDb", "db"));
    auto consumer = component("ReportService");
    consumer.fields.push_back(named_field("store", "db"));
    scan.components.push_back(consumer);

    try {
        compile(std::move(scan));
        FAIL("Expected ambiguous_provider");
    } catch (const libctdi::ambiguous_provider& e) {
        REQUIRE(e.candidates().size() == 2);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("PostgresDb"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("SqliteDb"));
    }
}

TEST_CASE("registered synthetic token wins over a qualifier", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.modules.push_back(module_of("AppModule", {provides("clock", iface("Clock"))}));
    scan.components.push_back(qualified("SystemClock", "clock"));
    auto consumer = component("Scheduler");
    consumer.fields.push_back(named_field("clock", "clock"));
    scan.components.push_back(consumer);

    auto plan = compile(std::move(scan));
    auto& scheduler = find_component(plan, "Scheduler");
    REQUIRE(scheduler.field_dependencies.front().target
            == libctdi::token::synthetic("clock"));
}

TEST_CASE("dependency on a base class resolves to its only subtype", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(extending("PostgresStore", {cls("SqlStore"), cls("Store")}));
    scan.components.push_back(component("Importer", {param("store", cls("Store"))}));

    auto plan = compile(std::move(scan));
    auto& importer = find_component(plan, "Importer");
    REQUIRE(importer.dependencies.front().target.display_name() == "PostgresStore");
    REQUIRE(position_of(plan, "PostgresStore") < position_of(plan, "Importer"));
}

TEST_CASE("dependency on a base class with two subtypes is ambiguous", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(extending("PostgresStore", {cls("Store")}));
    scan.components.push_back(extending("MemoryStore", {cls("Store")}));
    scan.components.push_back(component("Importer", {param("store", cls("Store"))}));

    try {
        compile(std::move(scan));
        FAIL("Expected ambiguous_provider");
    } catch (const libctdi::ambiguous_provider& e) {
        REQUIRE(e.token_description() == "Store");
        REQUIRE(e.candidates().size() == 2);
    }
}

TEST_CASE("registered base class is not rewritten", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(component("Store"));
    scan.components.push_back(extending("MemoryStore", {cls("Store")}));
    scan.components.push_back(component("Importer", {param("store", cls("Store"))}));

    auto plan = compile(std::move(scan));
    auto& importer = find_component(plan, "Importer");
    REQUIRE(importer.dependencies.front().target.display_name() == "Store");
}

TEST_CASE("collection dependency is not rewritten to a subtype", "[disambiguation]") {
    auto p = param("stores", cls("Store"));
    p.collection = true;

    libctdi::scan_result scan;
    scan.components.push_back(extending("PostgresStore", {cls("Store")}));
    scan.components.push_back(extending("MemoryStore", {cls("Store")}));
    scan.components.push_back(component("Backup", {p}));

    auto plan = compile(std::move(scan));
    auto& backup = find_component(plan, "Backup");
    REQUIRE(backup.dependencies.front().target.display_name() == "Store");
    REQUIRE(backup.dependencies.front().collection);
}

TEST_CASE("subtype resolution can be switched off", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(extending("PostgresStore", {cls("Store")}));
    scan.components.push_back(component("Importer", {param("store", cls("Store"))}));

    REQUIRE_THROWS_AS(compile(std::move(scan), {.subtype_resolution = false}),
                      libctdi::missing_provider);
}

TEST_CASE("parameterized base type resolves to its implementation", "[disambiguation]") {
    libctdi::scan_result scan;
    scan.components.push_back(
        extending("UserRepository", {generic("Repository", {cls("User")})}));
    scan.components.push_back(
        component("UserService", {param("repo", generic("Repository", {cls("User")}))}));

    auto plan = compile(std::move(scan));
    auto& service = find_component(plan, "UserService");
    REQUIRE(service.dependencies.front().target.display_name() == "UserRepository");
}

TEST_CASE("a qualifier is tried before subtypes", "[disambiguation]") {
    auto user_repo = generic("Repository", {cls("User")});
    auto qualifier = libctdi::resolve_type_ref(user_repo).display_name();

    libctdi::scan_result scan;
    scan.components.push_back(qualified("CachedUserRepo", qualifier));
    scan.components.push_back(extending("SqlUserRepo", {user_repo}));
    scan.components.push_back(extending("MemoryUserRepo", {user_repo}));
    scan.components.push_back(component("UserService", {param("repo", user_repo)}));

    libctdi::compile_result plan;
    REQUIRE_NOTHROW(plan = compile(std::move(scan)));
    auto& service = find_component(plan, "UserService");
    REQUIRE(service.dependencies.front().target.display_name() == "CachedUserRepo");
    REQUIRE(position_of(plan, "CachedUserRepo") < position_of(plan, "UserService"));
}
