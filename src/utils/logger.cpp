/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "lft_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace liftoff::format_tools;

namespace liftoff::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

namespace
{

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
    {
        return;
    }
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        LFT_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

LogMessage system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}

    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_; // worker thread only
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex sink_mutex_;
    std::size_t max_queue_size_{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<std::size_t> messages_dropped_{0};
    std::atomic<std::size_t> total_dropped_{0};
};

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }
        // Log lines are dropped once the queue is full; control commands never are.
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogMessage>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            total_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &msg)
{
    if (!error_callback_)
    {
        LFT_DEBUG("Logger error with no callback installed: {}", msg);
        return;
    }
    try
    {
        error_callback_(msg);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LFT] Logger error callback threw: {}\n", e.what());
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();
        }

        const std::size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
        if (dropped > 0)
        {
            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
            sink_->write(system_message(Logger::Level::L_WARNING,
                                        make_buffer("Logger queue overflow: {} messages dropped.", dropped)),
                         Sink::ASYNC_WRITE);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                    if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                            const std::string old_desc = sink_->description();
                            const std::string new_desc = arg.new_sink->description();
                            sink_->write(system_message(Logger::Level::L_SYSTEM,
                                                        make_buffer("Switching log sink to: {}", new_desc)),
                                         Sink::ASYNC_WRITE);
                            sink_->flush();
                            sink_ = std::move(arg.new_sink);
                            sink_->write(system_message(Logger::Level::L_SYSTEM,
                                                        make_buffer("Log sink switched from: {}", old_desc)),
                                         Sink::ASYNC_WRITE);
                            total_dropped_.store(0, std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                            sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
            sink_->write(system_message(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down.")),
                         Sink::ASYNC_WRITE);
            sink_->flush();
            return;
        }
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

// ----------------------------------------------------------------------------
// Logger public API
// ----------------------------------------------------------------------------

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    // Static destruction: make sure the worker is not left running.
    shutdown();
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::start()
{
    LoggerState expected = LoggerState::Uninitialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::Initialized, std::memory_order_acq_rel))
    {
        pImpl->start_worker();
    }
}

void Logger::shutdown()
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown, std::memory_order_acq_rel))
    {
        pImpl->shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

bool Logger::is_running() const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

bool Logger::set_console()
{
    if (!is_running())
    {
        return false;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::filesystem::path &path)
{
    if (!is_running())
    {
        return false;
    }
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(path), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::flush()
{
    if (!is_running())
    {
        return;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(std::size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->max_queue_size_ = (max_size > 0) ? max_size : 1;
}

std::size_t Logger::max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->max_queue_size_;
}

std::size_t Logger::total_dropped() const
{
    return pImpl->total_dropped_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!is_running())
    {
        return;
    }
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return is_running() && static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::log_line(Level lvl, std::string_view line) noexcept
{
    if (should_log(lvl))
    {
        enqueue_log(lvl, line, {});
    }
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        return pImpl->enqueue_command(system_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        LFT_DEBUG("Logger failed to enqueue a message: {}", e.what());
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string_view body, std::string_view prefix) noexcept
{
    try
    {
        fmt::memory_buffer mb;
        mb.append(prefix.data(), prefix.data() + prefix.size());
        mb.append(body.data(), body.data() + body.size());
        return enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &e)
    {
        LFT_DEBUG("Logger failed to build a message: {}", e.what());
        return false;
    }
}

std::optional<Logger::Level> parse_level(std::string_view name) noexcept
{
    auto iequals = [name](std::string_view candidate)
    {
        return name.size() == candidate.size() &&
               std::equal(name.begin(), name.end(), candidate.begin(),
                          [](char a, char b)
                          {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };
    if (iequals("trace"))
        return Logger::Level::L_TRACE;
    if (iequals("debug"))
        return Logger::Level::L_DEBUG;
    if (iequals("info"))
        return Logger::Level::L_INFO;
    if (iequals("warn") || iequals("warning"))
        return Logger::Level::L_WARNING;
    if (iequals("error"))
        return Logger::Level::L_ERROR;
    if (iequals("system"))
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

LoggerSession::LoggerSession()
{
    Logger::instance().start();
}

LoggerSession::~LoggerSession()
{
    Logger::instance().shutdown();
}

} // namespace liftoff::utils
