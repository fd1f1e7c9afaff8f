/**
 * @file debug_info.hpp
 * @brief Debug messaging and source-location helpers.
 *
 * Defines functions and macros within the `liftoff::debug` namespace for
 * developer-facing diagnostics. It uses `fmt` for compile-time format string
 * checks and `std::source_location` for origin labels. Hook origins recorded by
 * the lifecycle registry are produced by `SRCLOC_TO_STR`.
 */
#pragma once

#include <cstdio>          // for fflush
#include <fmt/format.h>    // for fmt::format_string, fmt::print, fmt::format
#include <source_location> // for std::source_location
#include <string>          // for std::string
#include <string_view>     // for std::string_view

#include "utils/format_tools.hpp" // for liftoff::format_tools::filename_only

namespace liftoff::debug
{

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 *
 * Intended for low-level diagnostics that must work even when the Logger is not
 * running (for example from inside the Logger itself). Enabled through `LFT_DEBUG`.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
}

} // namespace liftoff::debug

// ---------------- thin helpers for convenience --------------

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", liftoff::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

#ifndef LFT_LOC_HERE_STR
#define LFT_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Macro for calling `liftoff::debug::debug_msg`, compiled in only when
 *        `LIFTOFF_ENABLE_DEBUG_MESSAGES` is defined.
 */
#ifndef LFT_DEBUG
#if defined(LIFTOFF_ENABLE_DEBUG_MESSAGES)
#define LFT_DEBUG(fmt, ...) ::liftoff::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
// Never evaluated, but the arguments stay referenced and the format checked.
#define LFT_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
        if (false)                                                                                 \
            ::liftoff::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__);               \
    } while (0)
#endif
#endif
