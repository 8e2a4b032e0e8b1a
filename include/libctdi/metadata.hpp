#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace libctdi {

/// One metadata entry.  The alternatives are the only shapes the emitter
/// and the runtime are required to understand.
using metadata_value = std::variant<std::string, bool, double,
                                    std::vector<std::string>>;

/// Open key/value bag carried through the pipeline untouched.
using metadata_map = std::map<std::string, metadata_value, std::less<>>;

/// Well-known metadata keys written by the pipeline itself.
namespace metadata_keys {
inline constexpr std::string_view is_module             = "isModule";
inline constexpr std::string_view post_construct_methods = "postConstructMethods";
inline constexpr std::string_view pre_destroy_methods    = "preDestroyMethods";
} // namespace metadata_keys

/// Typed lookup; nullptr when the key is absent or holds another
/// alternative.
template <typename T>
const T* find_metadata(const metadata_map& m, std::string_view key) {
    auto it = m.find(key);
    if (it == m.end()) return nullptr;
    return std::get_if<T>(&it->second);
}

} // namespace libctdi
