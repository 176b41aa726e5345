#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define PROCVISOR_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define PROCVISOR_PLATFORM_MACOS 0
#endif

#if defined(__linux__)
/// @brief True when building for Linux.
#define PROCVISOR_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define PROCVISOR_PLATFORM_LINUX 0
#endif

#if !defined(_WIN32) && (defined(__unix__) || PROCVISOR_PLATFORM_MACOS || PROCVISOR_PLATFORM_LINUX)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCVISOR_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define PROCVISOR_PLATFORM_POSIX 0
#endif

#if !PROCVISOR_PLATFORM_POSIX
#error "procvisor supervises POSIX processes only"
#endif

#if __cplusplus < 202002L
#error "procvisor requires at least C++20"
#endif
