#pragma once

#include <string>

namespace libctdi {

/// Position in the scanned user source, used by every diagnostic.
/// An empty file name means "no position recorded".
struct source_position {
    std::string file;
    int line   = 0;
    int column = 0;

    bool empty() const noexcept { return file.empty(); }

    bool operator==(const source_position&) const = default;
};

/// "file:line:column", or "<unknown>" for an empty position.
inline std::string to_string(const source_position& pos) {
    if (pos.empty()) return "<unknown>";
    return pos.file + ":" + std::to_string(pos.line) + ":"
           + std::to_string(pos.column);
}

} // namespace libctdi
