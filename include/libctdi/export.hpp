#pragma once

/// @file export.hpp
/// Symbol visibility for the public libctdi API.
///
/// CMake defines LIBCTDI_BUILDING while compiling the shared library and
/// propagates LIBCTDI_STATIC to consumers of the static variant.  Internal
/// pipeline passes are marked LIBCTDI_HIDDEN and never leave the shared
/// object.

#if defined(LIBCTDI_STATIC)
  #define LIBCTDI_EXPORT
  #define LIBCTDI_HIDDEN
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBCTDI_BUILDING
    #define LIBCTDI_EXPORT __declspec(dllexport)
  #else
    #define LIBCTDI_EXPORT __declspec(dllimport)
  #endif
  #define LIBCTDI_HIDDEN
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBCTDI_EXPORT __attribute__((visibility("default")))
  #define LIBCTDI_HIDDEN __attribute__((visibility("hidden")))
#else
  #define LIBCTDI_EXPORT
  #define LIBCTDI_HIDDEN
#endif
