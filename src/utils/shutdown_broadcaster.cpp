/**
 * @file shutdown_broadcaster.cpp
 * @brief Single-slot listeners and the non-blocking shutdown fan-out.
 */
#include "lft_base.hpp"
#include "utils/shutdown_broadcaster.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace liftoff
{

// Holds at most one undelivered signal.
class ListenerSlot
{
  public:
    bool try_deliver(int signo)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_signal)
            {
                return false;
            }
            m_signal = signo;
        }
        m_cv.notify_all();
        return true;
    }

    int receive()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_signal.has_value(); });
        return take_locked();
    }

    std::optional<int> receive_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, timeout, [this] { return m_signal.has_value(); }))
        {
            return std::nullopt;
        }
        return take_locked();
    }

    std::optional<int> try_receive()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_signal)
        {
            return std::nullopt;
        }
        return take_locked();
    }

    bool pending() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_signal.has_value();
    }

  private:
    int take_locked()
    {
        const int signo = *m_signal;
        m_signal.reset();
        return signo;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<int> m_signal;
};

std::string signal_name(int signo)
{
    switch (signo)
    {
    case SIGINT:
        return "interrupt";
    case SIGTERM:
        return "terminated";
    default:
        return fmt::format("signal {}", signo);
    }
}

// ----------------------------------------------------------------------------
// ShutdownListener
// ----------------------------------------------------------------------------

ShutdownListener::ShutdownListener(std::shared_ptr<ListenerSlot> slot) noexcept : m_slot(std::move(slot)) {}

int ShutdownListener::wait() const
{
    return m_slot->receive();
}

std::optional<int> ShutdownListener::wait_for(std::chrono::milliseconds timeout) const
{
    return m_slot->receive_for(timeout);
}

std::optional<int> ShutdownListener::try_receive() const
{
    return m_slot->try_receive();
}

bool ShutdownListener::pending() const
{
    return m_slot->pending();
}

// ----------------------------------------------------------------------------
// ShutdownBroadcaster
// ----------------------------------------------------------------------------

ShutdownListener ShutdownBroadcaster::listen()
{
    auto slot = std::make_shared<ListenerSlot>();
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_slots.push_back(slot);
    return ShutdownListener(std::move(slot));
}

Error ShutdownBroadcaster::shutdown(int signo)
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::size_t unsent = 0;
    for (const auto &slot : m_slots)
    {
        if (!slot->try_deliver(signo))
        {
            ++unsent;
        }
    }

    if (unsent != 0)
    {
        return Error::make(ErrorKind::BroadcastPartialFailure,
                           fmt::format("failed to send {} signal to {} out of {} listeners",
                                       signal_name(signo), unsent, m_slots.size()),
                           static_cast<int>(unsent));
    }
    return {};
}

std::size_t ShutdownBroadcaster::listener_count() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_slots.size();
}

// ----------------------------------------------------------------------------
// BroadcastShutdowner
// ----------------------------------------------------------------------------

BroadcastShutdowner::BroadcastShutdowner(std::shared_ptr<ShutdownBroadcaster> broadcaster)
    : m_broadcaster(std::move(broadcaster))
{
    if (!m_broadcaster)
    {
        throw std::invalid_argument("BroadcastShutdowner requires a broadcaster");
    }
}

Error BroadcastShutdowner::request_shutdown()
{
    return m_broadcaster->shutdown(SIGTERM);
}

} // namespace liftoff
