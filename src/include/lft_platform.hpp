#pragma once
/**
 * @file lft_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (LIFTOFF_PLATFORM_LINUX, LIFTOFF_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define LIFTOFF_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define LIFTOFF_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define LIFTOFF_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define LIFTOFF_PLATFORM_LINUX 1
#elif defined(_WIN64)
#define LIFTOFF_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define LIFTOFF_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LIFTOFF_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LIFTOFF_PLATFORM_LINUX 1
#else
#define LIFTOFF_PLATFORM_UNKNOWN 1
#endif

#if defined(LIFTOFF_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(LIFTOFF_PLATFORM_WIN64)
#define LIFTOFF_IS_WINDOWS 1
#elif defined(LIFTOFF_PLATFORM_APPLE) || defined(LIFTOFF_PLATFORM_FREEBSD) ||                      \
    defined(LIFTOFF_PLATFORM_LINUX)
#define LIFTOFF_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location, std::shared_mutex, concepts and class-type template
// parameters are used throughout. Fail early with a clear message.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "liftoff_utils_export.h"

namespace liftoff::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
LIFTOFF_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
LIFTOFF_UTILS_EXPORT uint64_t get_pid() noexcept;
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
LIFTOFF_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets the full version string of the liftoff library (major.minor.patch).
 */
LIFTOFF_UTILS_EXPORT const char *get_version_string() noexcept;

} // namespace liftoff::platform
