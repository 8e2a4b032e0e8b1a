#pragma once

#include <optional>
#include <string_view>

namespace libctdi {

/// Instance scope a component asks the runtime injector for.
enum class scope_kind {
    singleton,
    prototype
};

constexpr std::string_view to_string(scope_kind s) noexcept {
    constexpr std::string_view names[] = {"singleton", "prototype"};
    return names[static_cast<int>(s)];
}

/// Parse "singleton" / "prototype".  Returns nullopt for anything else.
constexpr std::optional<scope_kind> parse_scope(std::string_view text) noexcept {
    if (text == "singleton") return scope_kind::singleton;
    if (text == "prototype") return scope_kind::prototype;
    return std::nullopt;
}

} // namespace libctdi
