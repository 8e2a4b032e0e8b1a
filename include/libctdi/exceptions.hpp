#pragma once

#include "export.hpp"
#include "location.hpp"

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace libctdi {

class LIBCTDI_EXPORT compile_error : public std::runtime_error {
public:
    explicit compile_error(const std::string& message,
                           source_position where = {},
                           std::string hint = {},
                           std::source_location loc = std::source_location::current());

    /// Position in the scanned user source the diagnostic points at.
    const source_position& where() const noexcept { return where_; }

    /// Actionable advice; may be empty.
    const std::string& hint() const noexcept { return hint_; }

    /// Where in libctdi the error was raised.
    const std::source_location& raised_at() const noexcept { return raised_at_; }

    /// Set extended diagnostic detail (e.g. the pipeline stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// what(), then the hint, then the diagnostic detail, one per line.
    std::string full_diagnostic() const;

private:
    source_position where_;
    std::string hint_;
    std::source_location raised_at_;
    std::string diagnostic_detail_;

    static std::string format_message(const std::string& msg,
                                      const source_position& where);
};

/// A type that cannot be turned into an injectable token: a primitive in
/// a dependency position, a primitive collection element, or primitive
/// factory wiring that is missing or ambiguous.
class LIBCTDI_EXPORT unresolvable_type : public compile_error {
public:
    unresolvable_type(std::string type_description, source_position where,
                      std::source_location loc = std::source_location::current());

    const std::string& type_description() const noexcept { return type_description_; }

private:
    std::string type_description_;
};

class LIBCTDI_EXPORT missing_provider : public compile_error {
public:
    missing_provider(std::string token_description, std::string required_by,
                     source_position where,
                     std::source_location loc = std::source_location::current());

    const std::string& token_description() const noexcept { return token_description_; }
    const std::string& required_by() const noexcept { return required_by_; }

private:
    std::string token_description_;
    std::string required_by_;
};

class LIBCTDI_EXPORT ambiguous_provider : public compile_error {
public:
    ambiguous_provider(std::string token_description,
                       std::vector<std::string> candidates,
                       source_position where,
                       std::source_location loc = std::source_location::current());

    const std::string& token_description() const noexcept { return token_description_; }
    const std::vector<std::string>& candidates() const noexcept { return candidates_; }

private:
    std::string token_description_;
    std::vector<std::string> candidates_;
};

enum class cycle_kind {
    component,
    module
};

class LIBCTDI_EXPORT circular_dependency : public compile_error {
public:
    circular_dependency(std::vector<std::string> cycle, cycle_kind kind,
                        source_position where,
                        std::source_location loc = std::source_location::current());

    /// Display names in traversal order; first and last are the same node.
    const std::vector<std::string>& cycle() const noexcept { return cycle_; }
    cycle_kind kind() const noexcept { return kind_; }

private:
    std::vector<std::string> cycle_;
    cycle_kind kind_;

    static std::string build_message(const std::vector<std::string>& cycle,
                                     cycle_kind kind);
};

class LIBCTDI_EXPORT invalid_declaration : public compile_error {
public:
    invalid_declaration(std::string declaration, std::string reason,
                        source_position where,
                        std::source_location loc = std::source_location::current());

    const std::string& declaration() const noexcept { return declaration_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string declaration_;
    std::string reason_;
};

} // namespace libctdi
