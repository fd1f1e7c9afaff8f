/**
 * @file orchestrator.cpp
 * @brief Orchestrator assembly, start with rollback, stop, and the run driver.
 *
 * Construction registers the user providers and the built-ins, then runs the
 * invocations. The first error is sticky: it short-circuits start and stop and
 * is reported to the error observers exactly once.
 */
#include "lft_base.hpp"
#include "utils/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "utils/deadline.hpp"
#include "utils/hook_registry.hpp"
#include "utils/logger.hpp"
#include "utils/signal_relay.hpp"

namespace liftoff
{

LifecycleLogSink nop_log_sink()
{
    return [](LifecycleLogLevel, const std::string &) {};
}

LifecycleLogSink logger_log_sink()
{
    return [](LifecycleLogLevel level, const std::string &msg)
    {
        // LifecycleLogLevel values line up with Logger::Level.
        const auto lvl = static_cast<utils::Logger::Level>(static_cast<int>(level));
        utils::Logger::instance().log_fmt(lvl, "[liftoff] {}", msg);
    };
}

struct Orchestrator::Impl
{
    std::chrono::milliseconds start_timeout;
    std::chrono::milliseconds stop_timeout;
    bool handle_signals;
    LifecycleLogSink log_sink;
    std::vector<ErrorHandler> handlers;

    // Shared with phase worker threads that may outlive a timed-out phase.
    std::shared_ptr<HookRegistry> registry;
    std::shared_ptr<ShutdownBroadcaster> broadcaster;
    std::shared_ptr<BroadcastShutdowner> shutdowner;
    di::Container container;
    Error construction_error;

    std::mutex relay_mutex;
    bool relay_attempted{false};
    std::unique_ptr<SignalRelay> relay;

    explicit Impl(OrchestratorOptions &options)
        : start_timeout(options.start_timeout), stop_timeout(options.stop_timeout),
          handle_signals(options.handle_signals),
          log_sink(options.log_sink ? std::move(options.log_sink) : logger_log_sink()),
          handlers(std::move(options.error_handlers)), registry(std::make_shared<HookRegistry>(log_sink)),
          broadcaster(std::make_shared<ShutdownBroadcaster>()),
          shutdowner(std::make_shared<BroadcastShutdowner>(broadcaster))
    {
    }

    template <typename... Args> void log(LifecycleLogLevel level, fmt::format_string<Args...> fmt_str, Args &&...args)
    {
        log_sink(level, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    // The first construction error wins.
    void record(Error err)
    {
        if (construction_error.is_ok())
        {
            construction_error = std::move(err);
        }
    }

    void provide(di::Provider provider)
    {
        if (construction_error.is_error())
        {
            return;
        }
        log(LifecycleLogLevel::Debug, "PROVIDE\t\t{} <= {}", di::describe(provider.outputs), provider.label);
        record(container.provide(std::move(provider)));
    }

    Error execute_invokes(const std::vector<di::Invocation> &invocations)
    {
        for (const auto &invocation : invocations)
        {
            log(LifecycleLogLevel::Info, "INVOKE\t\t{}", invocation.label);
            Error err = container.invoke(invocation);
            if (err.is_error())
            {
                log(LifecycleLogLevel::Error, "Error during invoke {}: {}", invocation.label, err);
                return err;
            }
        }
        return {};
    }

    void notify(const Error &err)
    {
        for (const auto &handler : handlers)
        {
            if (!handler)
            {
                continue;
            }
            try
            {
                handler(err);
            }
            catch (const std::exception &e)
            {
                log(LifecycleLogLevel::Error, "error handler threw: {}", e.what());
            }
        }
    }

    Error run_start(const Context &ctx)
    {
        return with_deadline(ctx, start_timeout,
                             [registry = registry](const Context &c) { return registry->run_start(c); });
    }

    Error run_stop(const Context &ctx)
    {
        return with_deadline(ctx, stop_timeout,
                             [registry = registry](const Context &c) { return registry->run_stop(c); });
    }
};

Orchestrator::Orchestrator(OrchestratorOptions options) : pImpl(std::make_unique<Impl>(options))
{
    Impl &impl = *pImpl;
    impl.log(LifecycleLogLevel::Debug, "liftoff {} assembling {} (pid {})", platform::get_version_string(),
             platform::get_executable_name(), platform::get_pid());

    impl.record(Error::combine(options.errors));

    for (auto &provider : options.providers)
    {
        impl.provide(std::move(provider));
    }
    impl.provide(di::supply(std::static_pointer_cast<Lifecycle>(impl.registry)));
    impl.provide(di::supply(std::static_pointer_cast<Shutdowner>(impl.shutdowner)));
    impl.provide(di::provide([container = &impl.container]()
                             { return std::make_shared<DotGraph>(DotGraph{container->visualize()}); }));

    if (impl.construction_error.is_error())
    {
        impl.log(LifecycleLogLevel::Error, "Error after options were applied: {}", impl.construction_error);
        impl.notify(impl.construction_error);
        return;
    }

    Error err = impl.execute_invokes(options.invocations);
    if (err.is_error())
    {
        if (impl.container.can_visualize(err))
        {
            err = err.with_graph(impl.container.visualize(err));
        }
        impl.construction_error = err;
        impl.notify(err);
    }
}

Orchestrator::~Orchestrator() = default;

Error Orchestrator::err() const
{
    return pImpl->construction_error;
}

Error Orchestrator::start(const Context &ctx)
{
    Impl &impl = *pImpl;
    if (impl.construction_error.is_error())
    {
        // Construction failed; handlers were already told.
        return impl.construction_error;
    }

    Error err = impl.run_start(ctx);
    if (err.is_ok())
    {
        impl.log(LifecycleLogLevel::Info, "RUNNING");
        return {};
    }

    impl.log(LifecycleLogLevel::Error, "ERROR\t\tStart failed, rolling back: {}", err);
    Error rollback = impl.run_stop(ctx);
    if (rollback.is_error())
    {
        impl.log(LifecycleLogLevel::Error, "ERROR\t\tCouldn't rollback cleanly: {}", rollback);
        err = Error::append(err, rollback);
    }
    impl.notify(err);
    return err;
}

Error Orchestrator::stop(const Context &ctx)
{
    Impl &impl = *pImpl;
    if (impl.construction_error.is_error())
    {
        return impl.construction_error;
    }
    Error err = impl.run_stop(ctx);
    if (err.is_error())
    {
        impl.log(LifecycleLogLevel::Error, "ERROR\t\tStop failed: {}", err);
    }
    return err;
}

ShutdownListener Orchestrator::done()
{
    Impl &impl = *pImpl;
    ShutdownListener listener = impl.broadcaster->listen();
    if (impl.handle_signals)
    {
        std::lock_guard<std::mutex> lock(impl.relay_mutex);
        if (!impl.relay_attempted)
        {
            impl.relay_attempted = true;
            auto relay = std::make_unique<SignalRelay>(impl.broadcaster, impl.log_sink);
            Error err = relay->install();
            if (err.is_error())
            {
                impl.log(LifecycleLogLevel::Warn, "signal handling disabled: {}", err);
            }
            else
            {
                impl.relay = std::move(relay);
            }
        }
    }
    return listener;
}

Error Orchestrator::run_until(const ShutdownListener &listener)
{
    Impl &impl = *pImpl;
    Error err = start();
    if (err.is_error())
    {
        impl.log(LifecycleLogLevel::Error, "ERROR\t\tFailed to start: {}", err);
        return err;
    }

    std::string name = signal_name(listener.wait());
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    impl.log(LifecycleLogLevel::Info, "{}", name);

    err = stop();
    if (err.is_error())
    {
        impl.log(LifecycleLogLevel::Error, "ERROR\t\tFailed to stop cleanly: {}", err);
    }
    return err;
}

Error Orchestrator::run_until_shutdown()
{
    if (pImpl->construction_error.is_error())
    {
        pImpl->log(LifecycleLogLevel::Error, "ERROR\t\tFailed to start: {}", pImpl->construction_error);
        return pImpl->construction_error;
    }
    return run_until(done());
}

void Orchestrator::run()
{
    Error err = run_until_shutdown();
    if (err.is_ok())
    {
        return;
    }
    LOGGER_ERROR("[liftoff] exiting: {}", err);
    utils::Logger::instance().flush();
    std::exit(EXIT_FAILURE);
}

std::chrono::milliseconds Orchestrator::start_timeout() const noexcept
{
    return pImpl->start_timeout;
}

std::chrono::milliseconds Orchestrator::stop_timeout() const noexcept
{
    return pImpl->stop_timeout;
}

Lifecycle &Orchestrator::lifecycle() noexcept
{
    return *pImpl->registry;
}

Shutdowner &Orchestrator::shutdowner() noexcept
{
    return *pImpl->shutdowner;
}

di::Container &Orchestrator::container() noexcept
{
    return pImpl->container;
}

std::size_t Orchestrator::hook_count() const noexcept
{
    return pImpl->registry->size();
}

std::size_t Orchestrator::started_count() const noexcept
{
    return pImpl->registry->started_count();
}

} // namespace liftoff
