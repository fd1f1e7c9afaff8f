#pragma once
/**
 * @file hook_registry.hpp
 * @brief Ordered hook storage and the forward/reverse phase executor.
 *
 * **Start phase** walks hooks front to back and stops at the first failing
 * start action. `started_count()` afterwards equals the number of hooks, from
 * the front, whose start is known to have succeeded (a hook without a start
 * action counts as started once reached).
 *
 * **Stop phase** walks backward from `started_count() - 1`, decrementing the
 * count on every step whatever the outcome, and keeps going after failures.
 * All failures are returned combined. A second stop with nothing started is a
 * no-op that returns success.
 *
 * An action that throws is treated exactly like an action that returned a
 * failure.
 *
 * **Abandonment.** Once the start context is done (its deadline passed or it
 * was canceled) no further hook is attempted. A start action that succeeds
 * after that point does not extend the started prefix; its stop action runs
 * immediately on the start thread instead, so a rollback that is already
 * under way never sees it.
 *
 * Thread-safety: hooks are appended during single-threaded construction. A stop
 * phase may overlap an abandoned start phase; any other phases must be
 * serialized by the caller. `started_count()` may be read concurrently.
 */
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "liftoff_utils_export.h"
#include "utils/hook.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

class LIFTOFF_UTILS_EXPORT HookRegistry final : public Lifecycle
{
  public:
    /// @param log_sink Receives START/STOP announcements; may be empty.
    explicit HookRegistry(LifecycleLogSink log_sink = {});

    HookRegistry(const HookRegistry &) = delete;
    HookRegistry &operator=(const HookRegistry &) = delete;

    void append(Hook hook, std::source_location loc = std::source_location::current()) override;

    /// Runs start actions in append order; returns the first failure.
    [[nodiscard]] Error run_start(const Context &ctx);

    /// Runs stop actions of started hooks in reverse order; returns all failures combined.
    [[nodiscard]] Error run_stop(const Context &ctx);

    [[nodiscard]] std::size_t size() const noexcept { return m_hooks.size(); }
    [[nodiscard]] std::size_t started_count() const noexcept
    {
        return m_started_count.load(std::memory_order_acquire);
    }

    /// Origin labels in append order.
    [[nodiscard]] std::vector<std::string> origins() const;

  private:
    // Extends the started prefix unless `ctx` is already done.
    bool commit_started(const Context &ctx);
    void undo_abandoned(const Hook &hook);

    void log(LifecycleLogLevel level, const std::string &msg) const;

    template <typename... Args>
    void log_debug(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        log(LifecycleLogLevel::Debug, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void log_error(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        log(LifecycleLogLevel::Error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    LifecycleLogSink m_log_sink;
    std::vector<Hook> m_hooks;
    std::atomic<std::size_t> m_started_count{0};
    std::mutex m_count_mutex; // orders commits of a late start against rollback
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
