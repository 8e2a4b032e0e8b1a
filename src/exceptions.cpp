#include "libctdi/exceptions.hpp"

#include <string>
#include <utility>
#include <vector>

namespace libctdi {

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

std::string compile_error::format_message(const std::string& msg,
                                          const source_position& where) {
    if (where.empty()) return msg;
    return msg + " [at " + to_string(where) + "]";
}

compile_error::compile_error(const std::string& message, source_position where,
                             std::string hint, std::source_location loc)
    : std::runtime_error(format_message(message, where))
    , where_(std::move(where))
    , hint_(std::move(hint))
    , raised_at_(loc)
{}

void compile_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

std::string compile_error::full_diagnostic() const {
    std::string out = what();
    if (!hint_.empty()) {
        out += "\n  hint: " + hint_;
    }
    if (!diagnostic_detail_.empty()) {
        out += "\n" + diagnostic_detail_;
    }
    return out;
}

unresolvable_type::unresolvable_type(std::string type_description,
                                     source_position where,
                                     std::source_location loc)
    : compile_error("Cannot resolve type \"" + type_description
                    + "\" at compile time",
                    std::move(where),
                    "Use a concrete nominal type, or annotate the injection "
                    "point with an explicit qualifier or token.",
                    loc)
    , type_description_(std::move(type_description))
{}

missing_provider::missing_provider(std::string token_description,
                                   std::string required_by,
                                   source_position where,
                                   std::source_location loc)
    : compile_error("No provider found for \"" + token_description
                    + "\" (required by " + required_by + ")",
                    std::move(where),
                    "Register the missing component or add a factory method "
                    "for it to a module.",
                    loc)
    , token_description_(std::move(token_description))
    , required_by_(std::move(required_by))
{}

ambiguous_provider::ambiguous_provider(std::string token_description,
                                       std::vector<std::string> candidates,
                                       source_position where,
                                       std::source_location loc)
    : compile_error("Ambiguous provider for \"" + token_description
                    + "\": found " + join(candidates, ", "),
                    std::move(where),
                    "Give the providers distinguishing qualifier names and "
                    "inject by name.",
                    loc)
    , token_description_(std::move(token_description))
    , candidates_(std::move(candidates))
{}

std::string circular_dependency::build_message(const std::vector<std::string>& cycle,
                                               cycle_kind kind) {
    std::string msg = kind == cycle_kind::module
        ? "Circular module import detected: "
        : "Circular dependency detected: ";
    return msg + join(cycle, " -> ");
}

circular_dependency::circular_dependency(std::vector<std::string> cycle,
                                         cycle_kind kind,
                                         source_position where,
                                         std::source_location loc)
    : compile_error(build_message(cycle, kind),
                    std::move(where),
                    kind == cycle_kind::module
                        ? "Remove the cyclic module import."
                        : "Break the cycle with an optional field dependency "
                          "or restructure the components.",
                    loc)
    , cycle_(std::move(cycle))
    , kind_(kind)
{}

invalid_declaration::invalid_declaration(std::string declaration,
                                         std::string reason,
                                         source_position where,
                                         std::source_location loc)
    : compile_error("Invalid declaration of " + declaration + ": " + reason,
                    std::move(where),
                    "Fix the declaration.",
                    loc)
    , declaration_(std::move(declaration))
    , reason_(std::move(reason))
{}

} // namespace libctdi
