#pragma once
/**
 * @file signal_relay.hpp
 * @brief Turns SIGINT/SIGTERM into shutdown broadcasts.
 *
 * The installed handler only writes the signal number into a self-pipe, which
 * is async-signal-safe. A relay thread reads the pipe and calls
 * `ShutdownBroadcaster::shutdown(signo)`, so an external termination request is
 * handled exactly like `Shutdowner::request_shutdown()`.
 *
 * Signal dispositions are process-wide, so at most one relay may be installed
 * at a time; a second `install()` fails with ErrorKind::SignalRelay. The
 * previous dispositions are restored by `uninstall()` or the destructor.
 *
 * POSIX only. On other platforms `install()` reports ErrorKind::SignalRelay.
 */
#include <csignal>
#include <memory>
#include <vector>

#include "liftoff_utils_export.h"
#include "utils/error.hpp"
#include "utils/hook.hpp"
#include "utils/shutdown_broadcaster.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

class LIFTOFF_UTILS_EXPORT SignalRelay
{
  public:
    explicit SignalRelay(std::shared_ptr<ShutdownBroadcaster> broadcaster, LifecycleLogSink log_sink = {});
    ~SignalRelay();

    SignalRelay(const SignalRelay &) = delete;
    SignalRelay &operator=(const SignalRelay &) = delete;

    /**
     * @brief Installs handlers for `signals` and starts the relay thread.
     * @return Success (also when already installed by this relay), or a
     *         SignalRelay error if another relay owns the handlers or a system
     *         call failed. On failure nothing stays installed.
     */
    [[nodiscard]] Error install(const std::vector<int> &signals = {SIGINT, SIGTERM});

    /// Restores the previous handlers and joins the relay thread. Idempotent.
    void uninstall() noexcept;

    [[nodiscard]] bool installed() const noexcept;

    /// True while any relay in the process owns the signal handlers.
    [[nodiscard]] static bool active() noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
