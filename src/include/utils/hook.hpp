#pragma once
/**
 * @file hook.hpp
 * @brief Hook record, the `Lifecycle` registration capability, and the lifecycle log sink.
 *
 * Components receive a `std::shared_ptr<Lifecycle>` from the construction
 * container and append one Hook per resource they own:
 *
 * @code
 * auto make_server(std::shared_ptr<liftoff::Lifecycle> lc) -> std::shared_ptr<Server>
 * {
 *     auto server = std::make_shared<Server>();
 *     lc->append({.on_start = [server](const liftoff::Context &) { return server->listen(); },
 *                 .on_stop  = [server](const liftoff::Context &ctx) { return server->close(ctx); }});
 *     return server;
 * }
 * @endcode
 *
 * Start actions run in append order; stop actions run in reverse order for
 * the hooks whose start succeeded.
 */
#include <functional>
#include <source_location>
#include <string>

#include "liftoff_utils_export.h"
#include "utils/context.hpp"
#include "utils/error.hpp"

namespace liftoff
{

/// A start or stop action. Returns success (`{}`) or a failure.
using HookAction = std::function<Error(const Context &)>;

/**
 * @brief Paired, optional start/stop actions plus an origin label for diagnostics.
 *
 * An empty `origin` is filled in by `Lifecycle::append()` with the registering
 * call site.
 */
struct Hook
{
    HookAction on_start;
    HookAction on_stop;
    std::string origin;
};

/**
 * @brief Registration-only view of the hook registry, injected into components.
 */
class LIFTOFF_UTILS_EXPORT Lifecycle
{
  public:
    virtual ~Lifecycle() = default;

    /// Appends a hook; records `loc` as its origin unless one is set. Never fails.
    virtual void append(Hook hook, std::source_location loc = std::source_location::current()) = 0;
};

/**
 * @brief Severity levels for lifecycle log messages.
 *
 * The values line up with `utils::Logger::Level` so the default sink can
 * forward them directly.
 */
enum class LifecycleLogLevel : int
{
    Debug = 1, ///< Per-hook START/STOP announcements.
    Info = 2,  ///< Phase boundaries and received signals.
    Warn = 3,  ///< Recoverable problems such as partial broadcasts.
    Error = 4  ///< Hook failures, timeouts, fatal run errors.
};

/**
 * @brief Callback receiving the orchestrator's diagnostic lines.
 *
 * Must be thread-safe: it is called from phase worker threads and from the
 * signal relay thread.
 */
using LifecycleLogSink = std::function<void(LifecycleLogLevel, const std::string &)>;

} // namespace liftoff
