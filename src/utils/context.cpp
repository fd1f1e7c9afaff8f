/**
 * @file context.cpp
 * @brief Context tree: deadline inheritance and cancellation propagation.
 */
#include "lft_base.hpp"
#include "utils/context.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace liftoff
{

struct ContextState
{
    std::optional<Context::Clock::time_point> deadline;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    ErrorKind reason{ErrorKind::Canceled};
    std::vector<std::weak_ptr<ContextState>> children;

    bool expired_locked(Context::Clock::time_point now) const { return deadline && now >= *deadline; }
};

namespace
{

void cancel_state(const std::shared_ptr<ContextState> &state)
{
    std::vector<std::weak_ptr<ContextState>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled)
        {
            return;
        }
        state->cancelled = true;
        // A cancel that arrives after the deadline is reported as expiry.
        state->reason = state->expired_locked(Context::Clock::now()) ? ErrorKind::DeadlineExceeded
                                                                       : ErrorKind::Canceled;
        children.swap(state->children);
    }
    state->cv.notify_all();
    for (auto &weak_child : children)
    {
        if (auto child = weak_child.lock())
        {
            cancel_state(child);
        }
    }
}

std::shared_ptr<ContextState> derive(const std::shared_ptr<ContextState> &parent,
                                     std::optional<Context::Clock::time_point> deadline)
{
    auto child = std::make_shared<ContextState>();
    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent->mutex);
        child->deadline = parent->deadline;
        if (deadline && (!child->deadline || *deadline < *child->deadline))
        {
            child->deadline = deadline;
        }
        parent_cancelled = parent->cancelled;
        if (!parent_cancelled)
        {
            // Drop entries of children that are already gone.
            std::erase_if(parent->children, [](const auto &w) { return w.expired(); });
            parent->children.push_back(child);
        }
    }
    if (parent_cancelled)
    {
        cancel_state(child);
    }
    return child;
}

// `now + timeout`, or nothing when that lies beyond the clock's range.
std::optional<Context::Clock::time_point> deadline_after(std::chrono::milliseconds timeout)
{
    const auto now = Context::Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Context::Clock::time_point::max() - now);
    if (timeout >= headroom)
    {
        return std::nullopt;
    }
    return now + timeout;
}

} // namespace

Context::Context(std::shared_ptr<ContextState> state) noexcept : m_state(std::move(state)) {}

Context Context::background()
{
    return Context(std::make_shared<ContextState>());
}

Context Context::with_timeout(const Context &parent, std::chrono::milliseconds timeout)
{
    // Without an own deadline the child still inherits the parent's.
    return Context(derive(parent.m_state, deadline_after(timeout)));
}

Context Context::with_deadline(const Context &parent, Clock::time_point deadline)
{
    return Context(derive(parent.m_state, deadline));
}

Context Context::with_cancel(const Context &parent)
{
    return Context(derive(parent.m_state, std::nullopt));
}

void Context::cancel() const noexcept
{
    cancel_state(m_state);
}

bool Context::done() const noexcept
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->cancelled || m_state->expired_locked(Clock::now());
}

Error Context::err() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->cancelled)
    {
        if (m_state->reason == ErrorKind::DeadlineExceeded)
        {
            return Error::make(ErrorKind::DeadlineExceeded, "context deadline exceeded");
        }
        return Error::make(ErrorKind::Canceled, "context canceled");
    }
    if (m_state->expired_locked(Clock::now()))
    {
        return Error::make(ErrorKind::DeadlineExceeded, "context deadline exceeded");
    }
    return {};
}

std::optional<Context::Clock::time_point> Context::deadline() const noexcept
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->deadline;
}

void Context::wait() const
{
    std::unique_lock<std::mutex> lock(m_state->mutex);
    if (m_state->deadline)
    {
        m_state->cv.wait_until(lock, *m_state->deadline, [this] { return m_state->cancelled; });
        return;
    }
    m_state->cv.wait(lock, [this] { return m_state->cancelled; });
}

bool Context::wait_for(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_state->mutex);
    auto until = deadline_after(timeout);
    if (m_state->deadline && (!until || *m_state->deadline < *until))
    {
        until = m_state->deadline;
    }
    if (until)
    {
        m_state->cv.wait_until(lock, *until, [this] { return m_state->cancelled; });
    }
    else
    {
        m_state->cv.wait(lock, [this] { return m_state->cancelled; });
    }
    return m_state->cancelled || m_state->expired_locked(Clock::now());
}

} // namespace liftoff
