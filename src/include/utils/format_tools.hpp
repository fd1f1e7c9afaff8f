// Tools for formatting strings
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <typeinfo>

#include <fmt/format.h>

#include "liftoff_utils_export.h"

namespace liftoff::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
LIFTOFF_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Turns a compiler-mangled type name into a human-readable one.
 * @details Uses `abi::__cxa_demangle` on GCC/Clang; MSVC names are already readable.
 *          Returns the input unchanged if demangling fails.
 */
LIFTOFF_UTILS_EXPORT std::string demangle(const char *mangled_name);

/// Readable name of the static type `T`, e.g. "app::Server".
template <typename T> std::string type_name()
{
    return demangle(typeid(T).name());
}

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    std::string_view::size_type last_separator_pos = last_slash;
    if (last_slash == std::string_view::npos)
    {
        last_separator_pos = last_backslash;
    }
    else if (last_backslash != std::string_view::npos && last_backslash > last_slash)
    {
        last_separator_pos = last_backslash;
    }

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace liftoff::format_tools
