#pragma once
/**
 * @file shutdown_broadcaster.hpp
 * @brief Fan-out of a termination signal to every shutdown listener.
 *
 * Each call to `ShutdownBroadcaster::listen()` creates a single-capacity slot
 * and returns a receive-only `ShutdownListener` handle to it. `shutdown()`
 * attempts a non-blocking delivery into every slot. A slot that still holds an
 * undelivered signal is counted as a failed delivery; the broadcaster carries
 * on with the remaining slots and never blocks.
 *
 * The slot set is guarded by a `std::shared_mutex`: `listen()` takes it
 * exclusively, `shutdown()` takes it shared, so concurrent broadcasts (for
 * example a SIGTERM racing an explicit request) interleave safely.
 *
 * Slots are never unregistered; they live as long as the broadcaster or the
 * last listener handle.
 */
#include <chrono>
#include <csignal>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "liftoff_utils_export.h"
#include "utils/error.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

/// Conventional name of a signal number ("interrupt", "terminated", "signal 10").
LIFTOFF_UTILS_EXPORT std::string signal_name(int signo);

class ListenerSlot;

/**
 * @brief Receive-only handle to one listener slot.
 *
 * Copies share the same slot. Receiving consumes the pending signal.
 */
class LIFTOFF_UTILS_EXPORT ShutdownListener
{
  public:
    /// Blocks until a signal is delivered; returns its number.
    int wait() const;

    /// Blocks up to `timeout`; returns the signal number if one arrived.
    [[nodiscard]] std::optional<int> wait_for(std::chrono::milliseconds timeout) const;

    /// Non-blocking receive.
    [[nodiscard]] std::optional<int> try_receive() const;

    /// True if a signal is waiting to be received.
    [[nodiscard]] bool pending() const;

  private:
    friend class ShutdownBroadcaster;
    explicit ShutdownListener(std::shared_ptr<ListenerSlot> slot) noexcept;
    std::shared_ptr<ListenerSlot> m_slot;
};

/**
 * @brief Capability injected into components so they can ask the process to stop.
 */
class LIFTOFF_UTILS_EXPORT Shutdowner
{
  public:
    virtual ~Shutdowner() = default;

    /// Equivalent to an explicit broadcast of SIGTERM to every listener.
    virtual Error request_shutdown() = 0;
};

class LIFTOFF_UTILS_EXPORT ShutdownBroadcaster
{
  public:
    ShutdownBroadcaster() = default;
    ShutdownBroadcaster(const ShutdownBroadcaster &) = delete;
    ShutdownBroadcaster &operator=(const ShutdownBroadcaster &) = delete;

    /// Registers a new single-capacity slot.
    [[nodiscard]] ShutdownListener listen();

    /**
     * @brief Delivers `signo` to every slot without blocking.
     * @return Success if every slot accepted the signal; otherwise a
     *         BroadcastPartialFailure whose `code()` is the number of slots that
     *         could not be signaled.
     */
    Error shutdown(int signo = SIGTERM);

    [[nodiscard]] std::size_t listener_count() const;

  private:
    mutable std::shared_mutex m_mutex;
    std::vector<std::shared_ptr<ListenerSlot>> m_slots;
};

/**
 * @brief `Shutdowner` backed by a broadcaster. Keeps the broadcaster alive.
 */
class LIFTOFF_UTILS_EXPORT BroadcastShutdowner final : public Shutdowner
{
  public:
    explicit BroadcastShutdowner(std::shared_ptr<ShutdownBroadcaster> broadcaster);
    Error request_shutdown() override;

  private:
    std::shared_ptr<ShutdownBroadcaster> m_broadcaster;
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
