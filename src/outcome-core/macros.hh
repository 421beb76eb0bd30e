#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: OC_COMPILER_MSVC, OC_COMPILER_CLANG, OC_COMPILER_GCC, OC_COMPILER_MINGW, OC_COMPILER_POSIX

#if defined(_MSC_VER)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define OC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(OC_COMPILER_CLANG) || defined(OC_COMPILER_GCC) || defined(OC_COMPILER_MINGW)
#define OC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: OC_HAS_RTTI, OC_HAS_CPP_EXCEPTIONS
// From CMake: OC_DEBUG, OC_RELEASE, OC_RELWITHDEBINFO, OC_ENABLE_ASSERT_IN_RELEASE

#ifdef OC_COMPILER_MSVC
#ifdef _CPPRTTI
#define OC_HAS_RTTI
#endif
#ifdef _CPPUNWIND
#define OC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(OC_COMPILER_CLANG)
#if __has_feature(cxx_rtti)
#define OC_HAS_RTTI
#endif
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define OC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(OC_COMPILER_GCC)
#ifdef __GXX_RTTI
#define OC_HAS_RTTI
#endif
#if __EXCEPTIONS
#define OC_HAS_CPP_EXCEPTIONS
#endif
#endif

// OC_ASSERT_ENABLED is 1 when the debug-only assertions (OC_ASSERT, OC_ASSERTS) are active
// the *_ALWAYS variants ignore this switch
// builds without any mode define (e.g. a plain compiler invocation) count as debug
#ifndef OC_ASSERT_ENABLED
#if defined(OC_RELEASE) && !defined(OC_ENABLE_ASSERT_IN_RELEASE)
#define OC_ASSERT_ENABLED 0
#else
#define OC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: OC_OS_WINDOWS, OC_OS_LINUX, OC_OS_APPLE, OC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define OC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define OC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define OC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// OC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: OC_COLD_FUNC void report_leaked_errors(...);
#define OC_COLD_FUNC OC_IMPL_COLD_FUNC

// OC_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
#define OC_BUILTIN_UNREACHABLE OC_IMPL_BUILTIN_UNREACHABLE

// OC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define OC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(OC_COMPILER_MSVC)

#define OC_IMPL_COLD_FUNC
#define OC_IMPL_BUILTIN_UNREACHABLE __assume(0)

#elif defined(OC_COMPILER_POSIX)

#define OC_IMPL_COLD_FUNC __attribute__((cold))
#define OC_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#else
#error "Unknown compiler"
#endif
