#pragma once
/**
 * @file orchestrator.hpp
 * @brief Assembles an application from providers and drives its start/stop lifecycle.
 *
 * Construction is eager and single-threaded:
 *  1. pre-seeded option errors are combined into the construction error;
 *  2. user providers are registered, then the built-ins
 *     (`std::shared_ptr<Lifecycle>`, `std::shared_ptr<Shutdowner>`, `std::shared_ptr<DotGraph>`);
 *  3. invocations run in order; components they pull in append hooks to the
 *     Lifecycle as a side effect;
 *  4. the first failure is kept as the construction error (`err()`), wrapped with
 *     a DOT rendering of the graph when the container can visualize it, and
 *     handed to every error handler.
 *
 * After that, `start()` runs all start hooks under the start timeout and rolls
 * back on failure; `stop()` runs the stop hooks of started components in
 * reverse order under the stop timeout. `run()` does both around a wait for
 * SIGINT, SIGTERM or `Shutdowner::request_shutdown()`.
 *
 * @code
 * liftoff::OrchestratorOptions opts;
 * opts.provide(make_config).provide(make_server).invoke([](std::shared_ptr<Server>) {});
 * liftoff::Orchestrator app(std::move(opts));
 * app.run();
 * @endcode
 *
 * `start()`, `stop()` and the run drivers must not be called concurrently with
 * each other.
 */
#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <vector>

#include "liftoff_utils_export.h"
#include "utils/container.hpp"
#include "utils/context.hpp"
#include "utils/error.hpp"
#include "utils/hook.hpp"
#include "utils/shutdown_broadcaster.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

/// Start and stop timeout used unless configured otherwise.
inline constexpr std::chrono::milliseconds kDefaultTimeout{15000};

/// DOT rendering of the dependency graph, available for injection.
struct DotGraph
{
    std::string dot;
};

using ErrorHandler = std::function<void(const Error &)>;

/// A lifecycle log sink that drops everything.
LIFTOFF_UTILS_EXPORT LifecycleLogSink nop_log_sink();

/// The default lifecycle log sink: forwards to `utils::Logger` with a "[liftoff]" prefix.
LIFTOFF_UTILS_EXPORT LifecycleLogSink logger_log_sink();

/**
 * @brief Everything an Orchestrator is built from.
 *
 * The builder helpers append and return `*this` so calls can be chained.
 */
struct LIFTOFF_UTILS_EXPORT OrchestratorOptions
{
    std::chrono::milliseconds start_timeout{kDefaultTimeout};
    std::chrono::milliseconds stop_timeout{kDefaultTimeout};
    std::vector<di::Provider> providers;
    std::vector<di::Invocation> invocations;
    std::vector<Error> errors; ///< Pre-seeded failures; any failure here aborts construction.
    std::vector<ErrorHandler> error_handlers;
    LifecycleLogSink log_sink; ///< Empty means `logger_log_sink()`.
    bool handle_signals{true};

    OrchestratorOptions &provide(di::Provider provider)
    {
        providers.push_back(std::move(provider));
        return *this;
    }

    template <typename F>
        requires(!std::same_as<std::decay_t<F>, di::Provider>)
    OrchestratorOptions &provide(F fn, di::ProvideOptions options = {},
                                 std::source_location loc = std::source_location::current())
    {
        providers.push_back(di::provide(std::move(fn), std::move(options), loc));
        return *this;
    }

    template <typename T>
    OrchestratorOptions &supply(std::shared_ptr<T> value, di::ProvideOptions options = {},
                                std::source_location loc = std::source_location::current())
    {
        providers.push_back(di::supply(std::move(value), std::move(options), loc));
        return *this;
    }

    OrchestratorOptions &invoke(di::Invocation invocation)
    {
        invocations.push_back(std::move(invocation));
        return *this;
    }

    template <typename F>
        requires(!std::same_as<std::decay_t<F>, di::Invocation>)
    OrchestratorOptions &invoke(F fn, std::source_location loc = std::source_location::current())
    {
        invocations.push_back(di::invoke(std::move(fn), loc));
        return *this;
    }

    template <typename T>
    OrchestratorOptions &populate(std::shared_ptr<T> &target, std::string name = {},
                                  std::source_location loc = std::source_location::current())
    {
        invocations.push_back(di::populate(target, std::move(name), loc));
        return *this;
    }

    OrchestratorOptions &error(Error err)
    {
        errors.push_back(std::move(err));
        return *this;
    }

    OrchestratorOptions &on_error(ErrorHandler handler)
    {
        error_handlers.push_back(std::move(handler));
        return *this;
    }
};

class LIFTOFF_UTILS_EXPORT Orchestrator
{
  public:
    explicit Orchestrator(OrchestratorOptions options);
    ~Orchestrator();

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;
    Orchestrator(Orchestrator &&) = delete;
    Orchestrator &operator=(Orchestrator &&) = delete;

    /// The construction error, or success.
    [[nodiscard]] Error err() const;

    /**
     * @brief Runs every start hook in append order, bounded by the start timeout.
     *
     * Returns the construction error without touching any hook if one is set.
     * If a hook fails (or the deadline passes) the hooks that did start are
     * stopped in reverse order; the result is the start error, with the
     * rollback failures appended if there were any. Failures are reported to
     * the error handlers.
     */
    [[nodiscard]] Error start(const Context &ctx = Context::background());

    /// Runs the stop hooks of started components in reverse order, bounded by the stop timeout.
    [[nodiscard]] Error stop(const Context &ctx = Context::background());

    /**
     * @brief Registers a new shutdown listener.
     * @details The first call with signal handling enabled also installs the
     *          SIGINT/SIGTERM relay. If that fails, a warning is logged and the
     *          listener still receives `request_shutdown()` broadcasts.
     */
    [[nodiscard]] ShutdownListener done();

    /// start(), block until `listener` receives a signal, then stop().
    [[nodiscard]] Error run_until(const ShutdownListener &listener);

    /// run_until(done()).
    [[nodiscard]] Error run_until_shutdown();

    /// run_until_shutdown(); on failure logs, flushes the logger and exits with status 1.
    void run();

    [[nodiscard]] std::chrono::milliseconds start_timeout() const noexcept;
    [[nodiscard]] std::chrono::milliseconds stop_timeout() const noexcept;

    [[nodiscard]] Lifecycle &lifecycle() noexcept;
    [[nodiscard]] Shutdowner &shutdowner() noexcept;
    [[nodiscard]] di::Container &container() noexcept;

    [[nodiscard]] std::size_t hook_count() const noexcept;
    [[nodiscard]] std::size_t started_count() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
