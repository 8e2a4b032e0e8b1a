#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include "scan_builders.hpp"

#include <string>
#include <vector>

using namespace scan_builders;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("compile_error message carries the source position", "[diagnostics]") {
    libctdi::compile_error e("something broke", {"src/app.ts", 12, 5});
    REQUIRE(std::string(e.what()) == "something broke [at src/app.ts:12:5]");
    REQUIRE(e.where().line == 12);
    REQUIRE(e.where().column == 5);
}

TEST_CASE("compile_error without a position has a bare message", "[diagnostics]") {
    libctdi::compile_error e("something broke");
    REQUIRE(std::string(e.what()) == "something broke");
    REQUIRE(libctdi::to_string(e.where()) == "<unknown>");
}

TEST_CASE("full_diagnostic appends hint and detail", "[diagnostics]") {
    libctdi::missing_provider e("Mailer", "Notifier", {"src/Notifier.ts", 3, 1});
    e.set_diagnostic_detail("extra context");

    auto text = e.full_diagnostic();
    REQUIRE_THAT(text, ContainsSubstring("No provider found for \"Mailer\" (required by Notifier)"));
    REQUIRE_THAT(text, ContainsSubstring("hint: "));
    REQUIRE_THAT(text, ContainsSubstring("extra context"));
}

TEST_CASE("every diagnostic is a compile_error", "[diagnostics]") {
    libctdi::scan_result scan;
    scan.components.push_back(component("Greeter", {param("text", prim("string"))}));
    REQUIRE_THROWS_AS(compile(std::move(scan)), libctdi::compile_error);
}

TEST_CASE("unresolvable_type points at the parameter", "[diagnostics]") {
    auto p = param("greeting", prim("string"));
    p.location = {"src/Greeter.ts", 7, 15};

    libctdi::scan_result scan;
    scan.components.push_back(component("Greeter", {p}));
    try {
        compile(std::move(scan));
        FAIL("Expected unresolvable_type");
    } catch (const libctdi::unresolvable_type& e) {
        REQUIRE(e.where().file == "src/Greeter.ts");
        REQUIRE(e.where().line == 7);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("Cannot resolve type"));
        REQUIRE_FALSE(e.hint().empty());
    }
}

TEST_CASE("cycle path names each component", "[diagnostics]") {
    libctdi::scan_result scan;
    scan.components.push_back(component_using("A", {"B"}));
    scan.components.push_back(component_using("B", {"C"}));
    scan.components.push_back(component_using("C", {"A"}));

    try {
        compile(std::move(scan));
        FAIL("Expected circular_dependency");
    } catch (const libctdi::circular_dependency& e) {
        REQUIRE(e.kind() == libctdi::cycle_kind::component);
        REQUIRE(e.cycle() == std::vector<std::string>{"A", "B", "C", "A"});
        REQUIRE_THAT(std::string(e.what()),
                     ContainsSubstring("Circular dependency detected: A -> B -> C -> A"));
    }
}

TEST_CASE("self dependency is a cycle of one", "[diagnostics]") {
    libctdi::scan_result scan;
    scan.components.push_back(component_using("A", {"A"}));

    try {
        compile(std::move(scan));
        FAIL("Expected circular_dependency");
    } catch (const libctdi::circular_dependency& e) {
        REQUIRE(e.cycle() == std::vector<std::string>{"A", "A"});
    }
}

TEST_CASE("cycle reached from outside lists only the loop", "[diagnostics]") {
    libctdi::scan_result scan;
    scan.components.push_back(component_using("Entry", {"B"}));
    scan.components.push_back(component_using("B", {"C"}));
    scan.components.push_back(component_using("C", {"B"}));

    try {
        compile(std::move(scan));
        FAIL("Expected circular_dependency");
    } catch (const libctdi::circular_dependency& e) {
        REQUIRE(e.cycle() == std::vector<std::string>{"B", "C", "B"});
    }
}

TEST_CASE("invalid_declaration names the declaration and the reason", "[diagnostics]") {
    libctdi::invalid_declaration e("component \"Shape\"", "abstract classes cannot be instantiated",
                                   {"src/Shape.ts", 1, 1});
    REQUIRE(e.declaration() == "component \"Shape\"");
    REQUIRE_THAT(std::string(e.what()),
                 ContainsSubstring("Invalid declaration of component \"Shape\""));
}

TEST_CASE("raised_at points into the library", "[diagnostics]") {
    libctdi::scan_result scan;
    scan.components.push_back(component_using("A", {"Missing"}));
    try {
        compile(std::move(scan));
        FAIL("Expected missing_provider");
    } catch (const libctdi::missing_provider& e) {
        REQUIRE(e.raised_at().line() > 0);
    }
}
