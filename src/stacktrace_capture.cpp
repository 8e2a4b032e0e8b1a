#include "stacktrace_utils.hpp"

#include <any>

#ifdef LIBCTDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libctdi::internal {

std::any capture_stacktrace() {
#ifdef LIBCTDI_HAS_STACKTRACE
    // Skip this frame and raise<E>().
    return std::any(boost::stacktrace::stacktrace(2, 64));
#else
    return {};
#endif
}

} // namespace libctdi::internal
