// file      : libjpull/export.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

// Normally we don't export class templates (but do complete
// specializations), inline functions, and classes with only inline member
// functions. Exporting classes that inherit from non-exported/imported bases
// (e.g., std::invalid_argument) only works with the quirks of each
// toolchain, so our exception types get the same treatment as everything
// else and we hope for the best.

#if defined(LIBJPULL_STATIC)         // Using static.
#  define LIBJPULL_SYMEXPORT
#elif defined(LIBJPULL_STATIC_BUILD) // Building static.
#  define LIBJPULL_SYMEXPORT
#elif defined(LIBJPULL_SHARED)       // Using shared.
#  ifdef _WIN32
#    define LIBJPULL_SYMEXPORT __declspec(dllimport)
#  else
#    define LIBJPULL_SYMEXPORT
#  endif
#elif defined(LIBJPULL_SHARED_BUILD) // Building shared.
#  ifdef _WIN32
#    define LIBJPULL_SYMEXPORT __declspec(dllexport)
#  else
#    define LIBJPULL_SYMEXPORT
#  endif
#else
// If none of the above macros are defined, then we assume we are being used
// by some third-party build system that cannot/doesn't signal the library
// type (static or shared).
//
#  define LIBJPULL_SYMEXPORT
#endif
