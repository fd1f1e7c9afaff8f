#pragma once
/**
 * @file context.hpp
 * @brief Cancellable, deadline-bearing execution context passed to hook actions.
 *
 * A `Context` is a cheap handle to shared state. Contexts form a tree: a child
 * derived with `with_timeout()` / `with_deadline()` / `with_cancel()` inherits
 * its parent's deadline (the earlier of the two wins) and is canceled whenever
 * its parent is canceled. Canceling a child never affects the parent.
 *
 * Deadlines are evaluated lazily: no timer thread exists. `done()` and `err()`
 * report expiry as soon as the deadline has passed, and `wait()` wakes at the
 * deadline.
 *
 * Well-behaved hook actions poll `done()` or block in `wait_for()` instead of
 * sleeping so that they return promptly when the phase is abandoned.
 *
 * @code
 * Error on_start(const Context &ctx)
 * {
 *     while (!server_ready())
 *     {
 *         if (ctx.wait_for(std::chrono::milliseconds(10)))
 *             return ctx.err();        // DeadlineExceeded or Canceled
 *     }
 *     return {};
 * }
 * @endcode
 */
#include <chrono>
#include <memory>
#include <optional>

#include "liftoff_utils_export.h"
#include "utils/error.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

struct ContextState;

class LIFTOFF_UTILS_EXPORT Context
{
  public:
    using Clock = std::chrono::steady_clock;

    /// A fresh root context: no deadline, canceled only by an explicit cancel().
    [[nodiscard]] static Context background();

    /// Child bounded by `now + timeout` (or the parent's deadline if earlier).
    [[nodiscard]] static Context with_timeout(const Context &parent, std::chrono::milliseconds timeout);

    /// Child bounded by `deadline` (or the parent's deadline if earlier).
    [[nodiscard]] static Context with_deadline(const Context &parent, Clock::time_point deadline);

    /// Child with the parent's deadline that can be canceled on its own.
    [[nodiscard]] static Context with_cancel(const Context &parent);

    /// Cancels this context and every context derived from it. Idempotent.
    void cancel() const noexcept;

    /// True once canceled or past the deadline.
    [[nodiscard]] bool done() const noexcept;

    /// Success while not done; otherwise DeadlineExceeded or Canceled.
    [[nodiscard]] Error err() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept;

    /// Blocks until done. Blocks forever on a background context nobody cancels.
    void wait() const;

    /**
     * @brief Blocks until done or until `timeout` elapses.
     * @return true if the context is done.
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

  private:
    explicit Context(std::shared_ptr<ContextState> state) noexcept;
    std::shared_ptr<ContextState> m_state;
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
