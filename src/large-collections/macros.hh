#pragma once

// Toolchain and platform switches used by the library sources.
//
// Compiler: LC_COMPILER_MSVC or LC_COMPILER_POSIX (gcc, clang, mingw)
// Platform: LC_OS_WINDOWS, LC_OS_LINUX (neither on other systems)
// Build:    LC_ASSERT_ENABLED (0 or 1), derived from LC_RELEASE and LC_ENABLE_ASSERT_IN_RELEASE set by CMake

#if defined(_MSC_VER)
#define LC_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__)
#define LC_COMPILER_POSIX
#else
#error "large-collections supports msvc, gcc and clang"
#endif

#if defined(_WIN32)
#define LC_OS_WINDOWS
#elif defined(__linux__)
#define LC_OS_LINUX
#endif

#if defined(LC_RELEASE) && !defined(LC_ENABLE_ASSERT_IN_RELEASE)
#define LC_ASSERT_ENABLED 0
#else
#define LC_ASSERT_ENABLED 1
#endif

// LC_FORCE_INLINE - tiny helpers on the element access path (lc::move, lc::forward)
// LC_COLD_FUNC    - violation reporting, kept out of the hot code layout
#if defined(LC_COMPILER_MSVC)
#define LC_FORCE_INLINE __forceinline
#define LC_COLD_FUNC
#else
// gcc needs the extra 'inline'
#define LC_FORCE_INLINE __attribute__((always_inline)) inline
#define LC_COLD_FUNC __attribute__((cold))
#endif

// LC_UNUSED(expr) - silences unused warnings without evaluating expr
#define LC_UNUSED(expr) (void)(sizeof((expr)))
