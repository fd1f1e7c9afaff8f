/**
 * @file signal_relay.cpp
 * @brief Process-wide SIGINT/SIGTERM relay into a ShutdownBroadcaster.
 */
#include "lft_base.hpp"
#include "utils/signal_relay.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>

#if defined(LIFTOFF_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace liftoff
{

struct SignalRelay::Impl
{
    std::shared_ptr<ShutdownBroadcaster> broadcaster;
    LifecycleLogSink log_sink;
    bool installed{false};
#if defined(LIFTOFF_IS_POSIX)
    int pipe_fds[2]{-1, -1};
    std::thread reader;
    std::vector<std::pair<int, struct sigaction>> previous;

    void reader_loop();
    void restore_handlers() noexcept;
    void close_pipe() noexcept;
#endif

    void log(LifecycleLogLevel level, const std::string &msg) const
    {
        if (log_sink)
        {
            log_sink(level, msg);
        }
    }
};

namespace
{
// Identity of the relay that owns the process signal handlers.
std::atomic<const void *> g_owner{nullptr};
#if defined(LIFTOFF_IS_POSIX)
std::atomic<int> g_write_fd{-1};

// Byte written to stop the relay thread; no signal has number 0.
constexpr unsigned char kStopByte = 0;

extern "C" void relay_signal_handler(int signo)
{
    const int saved_errno = errno;
    const int fd = g_write_fd.load(std::memory_order_relaxed);
    if (fd >= 0)
    {
        const auto byte = static_cast<unsigned char>(signo);
        // Nothing useful can be done on failure inside a handler.
        [[maybe_unused]] const ssize_t n = ::write(fd, &byte, 1);
    }
    errno = saved_errno;
}

Error os_error(const char *what)
{
    const int err = errno;
    return Error::make(ErrorKind::SignalRelay, fmt::format("{} failed: {}", what, std::strerror(err)), err);
}
#endif
} // namespace

#if defined(LIFTOFF_IS_POSIX)

void SignalRelay::Impl::reader_loop()
{
    for (;;)
    {
        unsigned char byte = 0;
        const ssize_t n = ::read(pipe_fds[0], &byte, 1);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n != 1 || byte == kStopByte)
        {
            return;
        }
        const int signo = static_cast<int>(byte);
        log(LifecycleLogLevel::Info, fmt::format("received signal: {}", signal_name(signo)));
        Error err = broadcaster->shutdown(signo);
        if (err.is_error())
        {
            log(LifecycleLogLevel::Warn, err.message());
        }
    }
}

void SignalRelay::Impl::restore_handlers() noexcept
{
    for (auto it = previous.rbegin(); it != previous.rend(); ++it)
    {
        ::sigaction(it->first, &it->second, nullptr);
    }
    previous.clear();
}

void SignalRelay::Impl::close_pipe() noexcept
{
    for (int &fd : pipe_fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

#endif

SignalRelay::SignalRelay(std::shared_ptr<ShutdownBroadcaster> broadcaster, LifecycleLogSink log_sink)
    : pImpl(std::make_unique<Impl>())
{
    if (!broadcaster)
    {
        throw std::invalid_argument("SignalRelay requires a broadcaster");
    }
    pImpl->broadcaster = std::move(broadcaster);
    pImpl->log_sink = std::move(log_sink);
}

SignalRelay::~SignalRelay()
{
    uninstall();
}

bool SignalRelay::installed() const noexcept
{
    return pImpl->installed;
}

bool SignalRelay::active() noexcept
{
    return g_owner.load(std::memory_order_acquire) != nullptr;
}

Error SignalRelay::install(const std::vector<int> &signals)
{
    if (pImpl->installed)
    {
        return {};
    }
#if defined(LIFTOFF_IS_POSIX)
    const void *expected = nullptr;
    if (!g_owner.compare_exchange_strong(expected, static_cast<const void *>(pImpl.get()),
                                         std::memory_order_acq_rel))
    {
        return Error::make(ErrorKind::SignalRelay, "signal handlers are already owned by another relay");
    }

    auto rollback = basics::make_scope_guard(
        [this]
        {
            pImpl->restore_handlers();
            g_write_fd.store(-1, std::memory_order_relaxed);
            pImpl->close_pipe();
            g_owner.store(nullptr, std::memory_order_release);
        });

    if (::pipe(pImpl->pipe_fds) != 0)
    {
        return os_error("pipe");
    }
    for (int fd : pImpl->pipe_fds)
    {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    // A full pipe drops the byte instead of blocking inside the handler.
    ::fcntl(pImpl->pipe_fds[1], F_SETFL, ::fcntl(pImpl->pipe_fds[1], F_GETFL) | O_NONBLOCK);
    g_write_fd.store(pImpl->pipe_fds[1], std::memory_order_relaxed);

    struct sigaction action
    {
    };
    action.sa_handler = relay_signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    for (int signo : signals)
    {
        struct sigaction old
        {
        };
        if (::sigaction(signo, &action, &old) != 0)
        {
            return os_error("sigaction");
        }
        pImpl->previous.emplace_back(signo, old);
    }

    pImpl->reader = std::thread([impl = pImpl.get()] { impl->reader_loop(); });
    rollback.dismiss();
    pImpl->installed = true;
    return {};
#else
    (void)signals;
    return Error::make(ErrorKind::SignalRelay, "signal relay is not supported on this platform");
#endif
}

void SignalRelay::uninstall() noexcept
{
    if (!pImpl || !pImpl->installed)
    {
        return;
    }
#if defined(LIFTOFF_IS_POSIX)
    pImpl->restore_handlers();
    g_write_fd.store(-1, std::memory_order_relaxed);
    const unsigned char stop = kStopByte;
    if (::write(pImpl->pipe_fds[1], &stop, 1) != 1)
    {
        // Pipe full of undelivered signals; closing the write end ends the reader.
        ::close(pImpl->pipe_fds[1]);
        pImpl->pipe_fds[1] = -1;
    }
    if (pImpl->reader.joinable())
    {
        pImpl->reader.join();
    }
    pImpl->close_pipe();
    g_owner.store(nullptr, std::memory_order_release);
#endif
    pImpl->installed = false;
}

} // namespace liftoff
