#include "lft_base.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace liftoff::utils
{

// Returns a string representation for a given log level.
const char *Sink::level_to_string_internal(int lvl)
{
    // Plain ints keep this file free of logger.hpp; values follow Logger::Level.
    constexpr int kTraceLevel = 0;
    constexpr int kDebugLevel = 1;
    constexpr int kInfoLevel = 2;
    constexpr int kWarnLevel = 3;
    constexpr int kErrorLevel = 4;
    constexpr int kSystemLevel = 5;
    switch (lvl)
    {
    case kTraceLevel:
        return "TRACE";
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARN";
    case kErrorLevel:
        return "ERROR";
    case kSystemLevel:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

// Formats a LogMessage into the standard line layout.
std::string Sink::format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const std::string time_str = format_tools::formatted_time(msg.timestamp);
    const std::string_view body(msg.body.data(), msg.body.size());
    return fmt::format("[{}] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n",
                       mode == Sink::ASYNC_WRITE ? "LFT" : "LFT_SYNC", level_to_string_internal(msg.level),
                       time_str, msg.process_id, msg.thread_id, body);
}

} // namespace liftoff::utils
