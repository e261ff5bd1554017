#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   LIBRTLIFE_BUILDING  : defined when compiling the librtlife library itself
///   LIBRTLIFE_STATIC    : define when building/linking librtlife as a static lib

#if defined(LIBRTLIFE_STATIC)
  #define LIBRTLIFE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBRTLIFE_BUILDING
    #define LIBRTLIFE_EXPORT __declspec(dllexport)
  #else
    #define LIBRTLIFE_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBRTLIFE_EXPORT __attribute__((visibility("default")))
#else
  #define LIBRTLIFE_EXPORT
#endif
