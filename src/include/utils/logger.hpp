#pragma once
/**
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logger with pluggable sinks.
 *
 * Callers format the message on their own thread (compile-time checked
 * through `FMT_STRING` in the macros) and enqueue it; a single worker thread
 * drains the queue into the current sink. Sink changes, flushes and callback
 * registration travel through the same queue as commands, so they are ordered
 * with respect to the messages logged before them.
 *
 * The logger is a process-wide singleton with an explicit lifetime:
 *
 * @code
 * liftoff::utils::Logger::instance().start();
 * LOGGER_INFO("listening on port {}", port);
 * liftoff::utils::Logger::instance().shutdown(); // drains the queue; terminal
 * @endcode
 *
 * Messages logged before `start()` or after `shutdown()` are discarded.
 * `LoggerSession` wraps the two calls in RAII.
 *
 * Macros below `LOGGER_COMPILE_LEVEL` (0 = trace ... 5 = system) compile to nothing.
 */
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "liftoff_utils_export.h"

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff::utils
{

class LIFTOFF_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    /// Starts the worker thread. Idempotent; has no effect after shutdown().
    void start();

    /// Drains queued messages, flushes the sink and joins the worker. Terminal.
    void shutdown();

    /// True between start() and shutdown().
    [[nodiscard]] bool is_running() const noexcept;

    // ---- Sinks ----
    /// Switches to the stderr sink. Blocks until the worker has applied the switch.
    bool set_console();
    /// Switches to an append-mode file sink. Returns false if the file cannot be opened.
    bool set_logfile(const std::filesystem::path &path);

    /// Blocks until everything logged before this call has reached the sink.
    void flush();

    // ---- Configuration ----
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    void set_max_queue_size(std::size_t max_size);
    [[nodiscard]] std::size_t max_queue_size() const;
    [[nodiscard]] std::size_t total_dropped() const;

    /// Called (from the worker thread) when a sink cannot be created or written.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    // ---- Formatting API ----
    template <typename... Args>
    void log_fmt(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!should_log(lvl))
        {
            return;
        }
        try
        {
            fmt::memory_buffer mb;
            mb.reserve(static_cast<std::size_t>(LOGGER_FMT_BUFFER_RESERVE));
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string_view(ex.what()), "[FORMAT ERROR] ");
        }
    }

    /// Logs an already-formatted line.
    void log_line(Level lvl, std::string_view line) noexcept;

  private:
    Logger();
    ~Logger();

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string_view body, std::string_view prefix) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// Maps "trace", "debug", "info", "warn"/"warning", "error", "system" (any case) to a Level.
LIFTOFF_UTILS_EXPORT std::optional<Logger::Level> parse_level(std::string_view name) noexcept;

/// Starts the logger on construction and shuts it down on destruction.
class LIFTOFF_UTILS_EXPORT LoggerSession
{
  public:
    LoggerSession();
    ~LoggerSession();
    LoggerSession(const LoggerSession &) = delete;
    LoggerSession &operator=(const LoggerSession &) = delete;
};

} // namespace liftoff::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LFT_LOGGER_LOG(lvl, fmt_str, ...)                                                          \
    ::liftoff::utils::Logger::instance().log_fmt(lvl, FMT_STRING(fmt_str) __VA_OPT__(, ) __VA_ARGS__)

#if LOGGER_COMPILE_LEVEL <= 0
#define LOGGER_TRACE(fmt_str, ...)                                                                 \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_TRACE, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_TRACE(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 1
#define LOGGER_DEBUG(fmt_str, ...)                                                                 \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_DEBUG, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_DEBUG(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 2
#define LOGGER_INFO(fmt_str, ...)                                                                  \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_INFO, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_INFO(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 3
#define LOGGER_WARN(fmt_str, ...)                                                                  \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_WARNING, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_WARN(fmt_str, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 4
#define LOGGER_ERROR(fmt_str, ...)                                                                 \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_ERROR, fmt_str __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_ERROR(fmt_str, ...) ((void)0)
#endif

#define LOGGER_SYSTEM(fmt_str, ...)                                                                \
    LFT_LOGGER_LOG(::liftoff::utils::Logger::Level::L_SYSTEM, fmt_str __VA_OPT__(, ) __VA_ARGS__)
