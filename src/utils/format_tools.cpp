// format_tools.cpp
#include "lft_base.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__) || defined(__clang__)
#include <cxxabi.h> // For __cxa_demangle
#endif

namespace liftoff::format_tools
{

// Fractional microseconds are computed by hand so the output does not depend on
// which fmt version handles sub-second chrono formatting.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string demangle(const char *mangled_name)
{
    if (mangled_name == nullptr)
    {
        return "<null>";
    }
#if defined(__GNUG__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(
        abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled)
    {
        return demangled.get();
    }
#endif
    return mangled_name;
}

} // namespace liftoff::format_tools
