/**
 * @file platform.cpp
 * @brief Cross-platform implementations for process, thread and executable queries.
 *
 * Used by the logger (PID/TID columns) and by the orchestrator (application name in
 * its startup banner). Windows, macOS and Linux are handled explicitly; other POSIX
 * systems fall back to portable approximations.
 */
#include "lft_base.hpp"
#include "liftoff_version.h"

#include <filesystem>
#include <functional>
#include <thread>
#include <vector>

#if defined(LIFTOFF_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(LIFTOFF_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

#include <fmt/format.h>

namespace liftoff::platform
{

uint64_t get_pid() noexcept
{
#if defined(LIFTOFF_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @details Uses the cheapest OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`), otherwise hashes
 *          `std::thread::id`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(LIFTOFF_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(LIFTOFF_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LIFTOFF_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(LIFTOFF_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        for (;;)
        {
            const DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                full_path.assign(buf.data(), len);
                break;
            }
            buf.resize(buf.size() * 2);
        }
#elif defined(LIFTOFF_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        const ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(LIFTOFF_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                full_path = buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

const char *get_version_string() noexcept
{
    return LIFTOFF_VERSION_STRING;
}

} // namespace liftoff::platform
