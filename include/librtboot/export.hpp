#pragma once

/// @file export.hpp
/// Shared-library symbol visibility macro.
///
/// Build-system defines (set by CMake):
///   LIBRTBOOT_BUILDING : defined while compiling librtboot itself
///   LIBRTBOOT_STATIC   : define when building/linking librtboot as a static lib

#if defined(LIBRTBOOT_STATIC)
  #define LIBRTBOOT_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBRTBOOT_BUILDING
    #define LIBRTBOOT_EXPORT __declspec(dllexport)
  #else
    #define LIBRTBOOT_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBRTBOOT_EXPORT __attribute__((visibility("default")))
#else
  #define LIBRTBOOT_EXPORT
#endif
