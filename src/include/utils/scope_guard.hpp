#pragma once
/**
 * @file scope_guard.hpp
 * @brief RAII helper that runs a callable when the enclosing scope exits.
 *
 * Used to unwind partially acquired OS resources (pipe descriptors, installed
 * signal handlers) and to pop bookkeeping entries on every exit path.
 *
 * @code
 * int fds[2];
 * ::pipe(fds);
 * auto close_fds = liftoff::basics::make_scope_guard([&] { ::close(fds[0]); ::close(fds[1]); });
 * if (!install_handlers())
 *     return error;          // descriptors are closed here
 * close_fds.dismiss();       // success: ownership moves elsewhere
 * @endcode
 */
#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace liftoff::basics
{

/**
 * @class ScopeGuard
 * @tparam Callable A callable invocable with no arguments.
 *
 * Exceptions escaping the callable during destruction are reported on stderr and
 * not propagated, since a throwing destructor would terminate the process.
 */
template <typename Callable>
    requires std::invocable<Callable &>
class [[nodiscard]] ScopeGuard
{
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

  public:
    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { run_once(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// `true` while the guard will still execute on scope exit.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Deactivates the guard, preventing the callable from being executed.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Executes the callable now if still active, then dismisses the guard.
    void invoke() noexcept { run_once(); }

  private:
    void run_once() noexcept
    {
        if (!m_active)
        {
            return;
        }
        m_active = false; // dismiss before invoke to prevent double execution
        try
        {
            std::invoke(m_func);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[liftoff] scope guard cleanup threw: {}\n", e.what());
        }
    }

    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory that deduces the guard type; the callable is stored by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace liftoff::basics
