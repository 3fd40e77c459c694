#pragma once

// Platform, build configuration and attribute macros of unique-seq.
// Every other header gets these through <unique-seq/assert.hh>.

// ---------------------------------------------------------------------------------------------------------
// toolchain and platform
//
// UQ_COMPILER_MSVC or UQ_COMPILER_POSIX (gcc and clang)
// UQ_OS_LINUX, UQ_OS_WINDOWS or UQ_OS_OTHER

#if defined(_MSC_VER)
#define UQ_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define UQ_COMPILER_POSIX
#else
#error "unique-seq: unsupported compiler"
#endif

#if defined(__linux__)
#define UQ_OS_LINUX
#elif defined(_WIN32)
#define UQ_OS_WINDOWS
#else
#define UQ_OS_OTHER
#endif

// ---------------------------------------------------------------------------------------------------------
// checked access
//
// The build system passes one of UQ_DEBUG, UQ_RELWITHDEBINFO, UQ_RELEASE
// and optionally UQ_ENABLE_ASSERT_IN_RELEASE (on by default, see CMakeLists.txt).
// UQ_ASSERT_ENABLED is 1 when bounds and emptiness checks are compiled in.
// Consumers without our build files get checks, too.

#ifndef UQ_ASSERT_ENABLED
#if defined(UQ_RELEASE) && !defined(UQ_ENABLE_ASSERT_IN_RELEASE)
#define UQ_ASSERT_ENABLED 0
#else
#define UQ_ASSERT_ENABLED 1
#endif
#endif

// ---------------------------------------------------------------------------------------------------------
// attributes

#ifdef UQ_COMPILER_MSVC
#define UQ_FORCE_INLINE __forceinline
#define UQ_COLD_FUNC
#else
#define UQ_FORCE_INLINE __attribute__((always_inline)) inline
#define UQ_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define UQ_UNUSED(expr) (void)(sizeof((expr)))
