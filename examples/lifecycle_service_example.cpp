/**
 * @file lifecycle_service_example.cpp
 * @brief A small service assembled and driven by liftoff::Orchestrator.
 *
 * Usage: liftoff_example [config.json]
 *
 * Three components are wired through the container:
 *  - `Settings`   parsed configuration, supplied as a value
 *  - `Listener`   a pretend network listener with start/stop hooks
 *  - `Heartbeat`  a worker thread that logs periodically and, if
 *                 `LIFTOFF_EXAMPLE_BEATS` is set, asks the process to shut down
 *                 after that many beats
 *
 * Without a beat limit the example runs until SIGINT or SIGTERM.
 */
#include "lft_service.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace liftoff;
using namespace std::chrono_literals;

namespace example
{

struct Settings
{
    std::string address{"127.0.0.1:8080"};
    int beat_limit{0}; ///< 0 means unlimited.
};

class Listener
{
  public:
    explicit Listener(std::string address) : m_address(std::move(address)) {}

    Error open(const Context &ctx)
    {
        if (ctx.done())
        {
            return ctx.err();
        }
        LOGGER_INFO("Listener: accepting connections on {}", m_address);
        m_open = true;
        return {};
    }

    Error close(const Context &)
    {
        if (!m_open)
        {
            return Error::failuref("listener on {} was never opened", m_address);
        }
        LOGGER_INFO("Listener: closed {}", m_address);
        m_open = false;
        return {};
    }

  private:
    std::string m_address;
    bool m_open{false};
};

class Heartbeat
{
  public:
    Heartbeat(std::shared_ptr<Shutdowner> shutdowner, int beat_limit)
        : m_shutdowner(std::move(shutdowner)), m_beat_limit(beat_limit)
    {
    }

    Error start(const Context &)
    {
        m_thread = std::thread([this] { loop(); });
        return {};
    }

    Error stop(const Context &ctx)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_cv.notify_all();
        if (m_thread.joinable())
        {
            m_thread.join();
        }
        LOGGER_INFO("Heartbeat: stopped after {} beats", m_beats.load());
        return ctx.err();
    }

  private:
    void loop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_cv.wait_for(lock, 1s, [this] { return m_stopping; }))
        {
            const int beat = ++m_beats;
            LOGGER_DEBUG("Heartbeat: beat {}", beat);
            if (m_beat_limit > 0 && beat == m_beat_limit)
            {
                Error err = m_shutdowner->request_shutdown();
                if (err.is_error())
                {
                    LOGGER_WARN("Heartbeat: shutdown request incomplete: {}", err);
                }
            }
        }
    }

    std::shared_ptr<Shutdowner> m_shutdowner;
    int m_beat_limit;
    std::atomic<int> m_beats{0};
    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping{false};
};

std::shared_ptr<Listener> make_listener(std::shared_ptr<Settings> settings, std::shared_ptr<Lifecycle> lc)
{
    auto listener = std::make_shared<Listener>(settings->address);
    lc->append({.on_start = [listener](const Context &ctx) { return listener->open(ctx); },
                .on_stop = [listener](const Context &ctx) { return listener->close(ctx); },
                .origin = "example::Listener"});
    return listener;
}

std::shared_ptr<Heartbeat> make_heartbeat(std::shared_ptr<Settings> settings, std::shared_ptr<Shutdowner> shutdowner,
                                          std::shared_ptr<Lifecycle> lc)
{
    auto heartbeat = std::make_shared<Heartbeat>(std::move(shutdowner), settings->beat_limit);
    lc->append({.on_start = [heartbeat](const Context &ctx) { return heartbeat->start(ctx); },
                .on_stop = [heartbeat](const Context &ctx) { return heartbeat->stop(ctx); },
                .origin = "example::Heartbeat"});
    return heartbeat;
}

} // namespace example

int main(int argc, char **argv)
{
    utils::LoggerSession logger_session;

    OrchestratorConfig config;
    try
    {
        config = (argc > 1) ? OrchestratorConfig::from_file(argv[1]) : OrchestratorConfig::load();
        if (argc > 1)
        {
            config.apply_env();
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    if (!config.apply_logging())
    {
        LOGGER_WARN("Could not open log file '{}'; logging to the console", config.log_file.string());
    }

    auto settings = std::make_shared<example::Settings>();
    if (const char *beats = std::getenv("LIFTOFF_EXAMPLE_BEATS"))
    {
        settings->beat_limit = std::atoi(beats);
    }

    OrchestratorOptions options;
    config.apply_to(options);
    options.supply(settings)
        .provide(example::make_listener)
        .provide(example::make_heartbeat)
        .invoke([](std::shared_ptr<example::Listener>, std::shared_ptr<example::Heartbeat>) {})
        .on_error([](const Error &err)
                  {
                      auto graph = visualize_error(err);
                      if (graph.is_ok())
                      {
                          LOGGER_ERROR("Dependency graph:\n{}", graph.content());
                      }
                  });

    Orchestrator app(std::move(options));
    app.run();
    return EXIT_SUCCESS;
}
