#pragma once
/**
 * @file deadline.hpp
 * @brief Races a phase against a deadline.
 *
 * `with_deadline()` derives a child context bounded by `timeout`, runs the
 * phase on a dedicated worker thread against that child, and returns whichever
 * settles first:
 *  - the phase's own result, or
 *  - `DeadlineExceeded` when the deadline passes first, or
 *  - `Canceled` when the parent context is canceled first.
 *
 * A phase that loses the race is abandoned: the worker thread is detached and
 * keeps running until the phase returns. It is never forcibly terminated. The
 * child context is canceled once the phase returns or is abandoned, so
 * cooperative actions observe `ctx.done()` and exit.
 *
 * @warning Everything the phase function touches must stay alive for as long as
 *          the phase may run. Capture owning `std::shared_ptr`s, never references
 *          to the caller's stack.
 */
#include <chrono>
#include <functional>

#include "liftoff_utils_export.h"
#include "utils/context.hpp"
#include "utils/error.hpp"

namespace liftoff
{

using PhaseFn = std::function<Error(const Context &)>;

[[nodiscard]] LIFTOFF_UTILS_EXPORT Error with_deadline(const Context &parent, std::chrono::milliseconds timeout,
                                                       PhaseFn phase);

} // namespace liftoff
