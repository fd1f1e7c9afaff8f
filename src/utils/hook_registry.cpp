/**
 * @file hook_registry.cpp
 * @brief Forward start and reverse stop over the registered hooks.
 *
 * The start phase may be abandoned by its deadline while a hook action is
 * still running on the worker thread. From then on that thread must not touch
 * the started prefix: the caller is already rolling it back. A start action
 * that completes after abandonment is undone on the spot instead.
 */
#include "lft_base.hpp"
#include "utils/hook_registry.hpp"

#include <exception>

namespace liftoff
{

namespace
{

// Runs one action, turning an escaping exception into a failure.
Error invoke_action(const HookAction &action, const Context &ctx, const std::string &origin)
{
    try
    {
        return action(ctx);
    }
    catch (const std::exception &e)
    {
        return Error::failuref("hook {} threw: {}", origin, e.what());
    }
    catch (...)
    {
        return Error::failuref("hook {} threw a non-standard exception", origin);
    }
}

} // namespace

HookRegistry::HookRegistry(LifecycleLogSink log_sink) : m_log_sink(std::move(log_sink)) {}

void HookRegistry::append(Hook hook, std::source_location loc)
{
    if (hook.origin.empty())
    {
        hook.origin = SRCLOC_TO_STR(loc);
    }
    m_hooks.push_back(std::move(hook));
}

Error HookRegistry::run_start(const Context &ctx)
{
    for (std::size_t i = started_count(); i < m_hooks.size(); ++i)
    {
        // An abandoned phase attempts nothing further.
        if (ctx.done())
        {
            return ctx.err();
        }
        const Hook &hook = m_hooks[i];
        if (hook.on_start)
        {
            log_debug("START\t\t{}", hook.origin);
            Error err = invoke_action(hook.on_start, ctx, hook.origin);
            if (err.is_error())
            {
                log_error("START FAILED\t{}: {}", hook.origin, err);
                return err;
            }
        }
        if (!commit_started(ctx))
        {
            undo_abandoned(hook);
            return ctx.err();
        }
    }
    return {};
}

bool HookRegistry::commit_started(const Context &ctx)
{
    std::lock_guard<std::mutex> lock(m_count_mutex);
    if (ctx.done())
    {
        return false;
    }
    m_started_count.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

void HookRegistry::undo_abandoned(const Hook &hook)
{
    if (!hook.on_stop)
    {
        return;
    }
    // The phase context is already done; the stop action gets a fresh one.
    log_debug("STOP\t\t{} (start finished after the phase was abandoned)", hook.origin);
    Error err = invoke_action(hook.on_stop, Context::background(), hook.origin);
    if (err.is_error())
    {
        log_error("STOP FAILED\t{}: {}", hook.origin, err);
    }
}

Error HookRegistry::run_stop(const Context &ctx)
{
    std::vector<Error> failures;
    // Decrement before invoking so a failing or throwing action is never retried.
    for (;;)
    {
        std::size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_count_mutex);
            if (m_started_count.load(std::memory_order_acquire) == 0)
            {
                break;
            }
            index = m_started_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        }
        const Hook &hook = m_hooks[index];
        if (!hook.on_stop)
        {
            continue;
        }
        log_debug("STOP\t\t{}", hook.origin);
        Error err = invoke_action(hook.on_stop, ctx, hook.origin);
        if (err.is_error())
        {
            log_error("STOP FAILED\t{}: {}", hook.origin, err);
            failures.push_back(std::move(err));
        }
    }
    return Error::combine(failures);
}

std::vector<std::string> HookRegistry::origins() const
{
    std::vector<std::string> out;
    out.reserve(m_hooks.size());
    for (const auto &hook : m_hooks)
    {
        out.push_back(hook.origin);
    }
    return out;
}

void HookRegistry::log(LifecycleLogLevel level, const std::string &msg) const
{
    if (m_log_sink)
    {
        m_log_sink(level, msg);
        return;
    }
    // No sink installed: fall back to LFT_DEBUG for all levels.
    (void)level;
    LFT_DEBUG("[Lifecycle] {}", msg);
}

} // namespace liftoff
