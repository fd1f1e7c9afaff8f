#pragma once
/**
 * @file error.hpp
 * @brief Error value type shared by the lifecycle, container and shutdown modules.
 *
 * `liftoff::Error` is a small, cheaply copyable value. A default-constructed
 * Error means success, so hook actions simply `return {};` when they succeed.
 * Failures carry an `ErrorKind`, a message, an optional integer code and,
 * for aggregated or wrapped failures, a list of causes.
 *
 * Aggregation follows a "flatten and drop successes" rule:
 * @code
 * Error e = Error::combine({ok, Error::failure("a"), Error::combine({Error::failure("b")})});
 * // e.kind() == ErrorKind::Multiple, e.errors().size() == 2, e.message() == "a; b"
 * @endcode
 *
 * Errors produced by the construction container may additionally carry a DOT
 * rendering of the dependency graph (`with_graph`), retrieved through
 * `visualize_error()`.
 */
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "liftoff_utils_export.h"
#include "utils/result.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

/**
 * @brief Classification of failures.
 */
enum class ErrorKind : int
{
    Failure = 0,             ///< Reported by a hook action or an invocation.
    InvalidOption,           ///< An option was rejected while assembling the orchestrator.
    InvalidProvider,         ///< A constructor could not be registered (bad annotation, duplicate).
    MissingDependency,       ///< No provider for a requested type.
    DependencyCycle,         ///< Resolving a type requires itself.
    ConstructorFailed,       ///< A constructor threw or returned a failure.
    DeadlineExceeded,        ///< A phase did not finish before its deadline.
    Canceled,                ///< The execution context was canceled explicitly.
    BroadcastPartialFailure, ///< Some listener slots still held an undelivered signal.
    SignalRelay,             ///< Process signal handlers could not be installed.
    Multiple,                ///< Aggregate of several failures; see causes().
};

/// Stable, human-readable name of an ErrorKind.
LIFTOFF_UTILS_EXPORT const char *to_string(ErrorKind kind) noexcept;

class LIFTOFF_UTILS_EXPORT Error
{
  public:
    /// Success.
    Error() noexcept = default;

    [[nodiscard]] static Error make(ErrorKind kind, std::string message, int code = 0);

    /// A plain failure, the usual return value of a failing hook action.
    [[nodiscard]] static Error failure(std::string message);

    template <typename... Args>
    [[nodiscard]] static Error failuref(fmt::format_string<Args...> fmt_str, Args &&...args)
    {
        return failure(fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    /**
     * @brief Wraps `cause` under a new kind; the message becomes "<message>: <cause>".
     * @details If `cause` is success the result is a plain error of `kind`.
     */
    [[nodiscard]] static Error wrap(ErrorKind kind, std::string message, Error cause);

    /**
     * @brief Aggregates errors. Successes are dropped and nested aggregates flattened.
     * @return Success if nothing failed, the single failure if exactly one did,
     *         otherwise an ErrorKind::Multiple error.
     */
    [[nodiscard]] static Error combine(const std::vector<Error> &errors);

    /// Shorthand for `combine({first, second})`.
    [[nodiscard]] static Error append(const Error &first, const Error &second);

    [[nodiscard]] bool is_ok() const noexcept { return m_rep == nullptr; }
    [[nodiscard]] bool is_error() const noexcept { return m_rep != nullptr; }

    /// Kind of the failure. Calling this on success throws std::logic_error.
    [[nodiscard]] ErrorKind kind() const;
    /// Empty for success.
    [[nodiscard]] const std::string &message() const noexcept;
    [[nodiscard]] int code() const noexcept;

    /// Direct causes: the members of an aggregate, or the wrapped cause.
    [[nodiscard]] const std::vector<Error> &causes() const noexcept;

    /// Leaf failures of an aggregate; `{*this}` for a single failure; empty for success.
    [[nodiscard]] std::vector<Error> errors() const;

    /// True if this error or any of its causes (recursively) has the given kind.
    [[nodiscard]] bool contains(ErrorKind kind) const noexcept;

    /// Copy of this error with a rendered dependency graph attached.
    [[nodiscard]] Error with_graph(std::string dot_graph) const;
    [[nodiscard]] bool has_graph() const noexcept;

    /// "ok" for success, otherwise "<kind>: <message>".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Error &lhs, const Error &rhs) noexcept { return lhs.m_rep == rhs.m_rep; }

  private:
    struct Rep;
    explicit Error(std::shared_ptr<const Rep> rep) noexcept;

    friend LIFTOFF_UTILS_EXPORT Result<std::string, Error> visualize_error(const Error &err);

    std::shared_ptr<const Rep> m_rep;
};

/// Result alias used throughout liftoff for fallible values.
template <typename T> using Fallible = Result<T, Error>;

/**
 * @brief Returns the DOT graph attached to `err`.
 * @return The graph, or a failure "unable to visualize error" when none is attached.
 */
LIFTOFF_UTILS_EXPORT Result<std::string, Error> visualize_error(const Error &err);

} // namespace liftoff

template <> struct fmt::formatter<liftoff::Error> : fmt::formatter<std::string_view>
{
    template <typename FormatContext> auto format(const liftoff::Error &err, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(err.is_ok() ? std::string_view("ok") : std::string_view(err.message()),
                                                        ctx);
    }
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
