/**
 * @file deadline.cpp
 * @brief Runs a phase on a worker thread and races it against a deadline.
 */
#include "lft_base.hpp"
#include "utils/deadline.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace liftoff
{

namespace
{

// Shared between the waiting caller and a possibly abandoned worker.
struct PhaseSlot
{
    std::mutex mutex;
    std::optional<Error> result;
};

Error run_phase(const PhaseFn &phase, const Context &ctx)
{
    try
    {
        return phase(ctx);
    }
    catch (const std::exception &e)
    {
        return Error::failuref("phase threw: {}", e.what());
    }
    catch (...)
    {
        return Error::failure("phase threw a non-standard exception");
    }
}

} // namespace

Error with_deadline(const Context &parent, std::chrono::milliseconds timeout, PhaseFn phase)
{
    if (!phase)
    {
        return {};
    }

    const Context ctx = Context::with_timeout(parent, timeout);
    auto slot = std::make_shared<PhaseSlot>();

    std::thread worker(
        [phase = std::move(phase), ctx, slot]()
        {
            Error result = run_phase(phase, ctx);
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->result = std::move(result);
            }
            // Wakes the waiter below.
            ctx.cancel();
        });

    // Returns when the worker finished, the deadline passed or the parent was canceled.
    ctx.wait();

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->result)
        {
            Error result = std::move(*slot->result);
            worker.join();
            return result;
        }
    }

    LFT_DEBUG("with_deadline: abandoning phase after {} ms", timeout.count());
    worker.detach();
    Error reason = ctx.err();
    ctx.cancel();
    return reason.is_error() ? reason : Error::make(ErrorKind::DeadlineExceeded, "context deadline exceeded");
}

} // namespace liftoff
