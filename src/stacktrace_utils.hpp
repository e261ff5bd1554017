#pragma once

// Internal helper for stacktrace formatting.
// This header is NOT installed; it is only used by the library's .cpp files.

#include "librtlife/exceptions.hpp"
#include "librtlife/lifestyle.hpp"
#include "librtlife/registration.hpp"

#include <any>
#include <sstream>
#include <string>

#ifdef LIBRTLIFE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace librtlife::internal {

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBRTLIFE_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// "Service [impl: Impl]" label used in diagnostics.
inline std::string describe(const registration& reg) {
    std::string text = demangle(reg.service_type());
    if (reg.implementation_type().has_value()) {
        text += " [impl: " + demangle(reg.implementation_type().value()) + "]";
    }
    return text;
}

/// Format one registration's creation trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for IFoo [impl: Foo] (Singleton):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const registration& reg) {
    std::string trace = format_stacktrace(reg.stacktrace());
    if (trace.empty()) return {};

    return "Registration stacktrace for " + describe(reg)
           + " (" + reg.get_lifestyle().name() + "):\n" + trace;
}

} // namespace librtlife::internal
