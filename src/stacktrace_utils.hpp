#pragma once

// Internal helper for stacktrace capture and formatting.
// Not installed; used only by the library sources.

#include "libctdi/exceptions.hpp"

#include <any>
#include <sstream>
#include <string>
#include <utility>

#ifdef LIBCTDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libctdi::internal {

/// Capture the current call stack (implemented in stacktrace_capture.cpp).
/// Returns an empty any when stacktrace support is disabled.
std::any capture_stacktrace();

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBCTDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << "Raised from:\n" << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Attach the pipeline stacktrace to a diagnostic and throw it.
template <typename E>
[[noreturn]] void raise(E ex) {
    if (ex.diagnostic_detail().empty()) {
        ex.set_diagnostic_detail(format_stacktrace(capture_stacktrace()));
    }
    throw ex;
}

} // namespace libctdi::internal
