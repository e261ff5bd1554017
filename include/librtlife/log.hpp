#pragma once

/// @file log.hpp
/// Library-wide spdlog logger.  librtlife logs through a named logger
/// ("librtlife") that embedders may replace to route messages into their
/// own sinks.  By default it writes warnings and above to stderr.

#include "export.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace librtlife::log {

/// Name under which the default logger is registered with spdlog.
inline constexpr const char* logger_name = "librtlife";

/// The logger used by the library.  Created on first use.
LIBRTLIFE_EXPORT std::shared_ptr<spdlog::logger> get();

/// Replace the library logger.  Passing nullptr restores the default.
LIBRTLIFE_EXPORT void set(std::shared_ptr<spdlog::logger> logger);

} // namespace librtlife::log
