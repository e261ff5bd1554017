#include "librtlife/registration.hpp"

#include <any>

#ifdef LIBRTLIFE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace librtlife::internal {

std::any capture_stacktrace() {
#ifdef LIBRTLIFE_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace librtlife::internal
