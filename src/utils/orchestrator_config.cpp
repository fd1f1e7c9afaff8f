/**
 * @file orchestrator_config.cpp
 * @brief OrchestratorConfig loading, validation and application.
 */
#include "lft_base.hpp"
#include "utils/orchestrator_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace liftoff
{

namespace fs = std::filesystem;

namespace
{

const char *level_name(utils::Logger::Level lvl)
{
    switch (lvl)
    {
    case utils::Logger::Level::L_TRACE:
        return "trace";
    case utils::Logger::Level::L_DEBUG:
        return "debug";
    case utils::Logger::Level::L_INFO:
        return "info";
    case utils::Logger::Level::L_WARNING:
        return "warn";
    case utils::Logger::Level::L_ERROR:
        return "error";
    case utils::Logger::Level::L_SYSTEM:
        return "system";
    }
    return "info";
}

// Timeouts beyond the representable range saturate; the Context treats them as unbounded.
std::chrono::milliseconds parse_timeout(const nlohmann::json &value, const char *key)
{
    if (!value.is_number_integer())
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: '{}' must be an integer, got {}", key, value.dump()));
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::chrono::milliseconds::max().count()))
    {
        return std::chrono::milliseconds::max();
    }
    const auto ms = value.get<long long>();
    if (ms < 0)
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: '{}' must not be negative, got {}", key, ms));
    }
    return std::chrono::milliseconds(ms);
}

std::chrono::milliseconds parse_timeout(const std::string &text, const char *key)
{
    std::size_t consumed = 0;
    long long ms = 0;
    try
    {
        ms = std::stoll(text, &consumed);
    }
    catch (const std::out_of_range &)
    {
        if (!text.empty() && text.front() != '-' &&
            text.find_first_not_of("+0123456789") == std::string::npos)
        {
            return std::chrono::milliseconds::max();
        }
        consumed = 0;
    }
    catch (const std::invalid_argument &)
    {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size())
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: {}='{}' is not an integer", key, text));
    }
    if (ms < 0)
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: {} must not be negative, got {}", key, ms));
    }
    return std::chrono::milliseconds(ms);
}

utils::Logger::Level parse_log_level(const std::string &text, const char *key)
{
    auto lvl = utils::parse_level(text);
    if (!lvl)
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: unknown log level '{}' for {}", text, key));
    }
    return *lvl;
}

std::string require_string(const nlohmann::json &value, const char *key)
{
    if (!value.is_string())
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: '{}' must be a string, got {}", key, value.dump()));
    }
    return value.get<std::string>();
}

const char *env(const char *name)
{
    const char *value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // anonymous namespace

OrchestratorConfig OrchestratorConfig::load()
{
    OrchestratorConfig cfg;
    if (const char *path = env("LIFTOFF_CONFIG_FILE"))
    {
        cfg = from_file(path);
    }
    cfg.apply_env();
    return cfg;
}

OrchestratorConfig OrchestratorConfig::from_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: cannot open '{}'", path.string()));
    }
    nlohmann::json j;
    try
    {
        in >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(fmt::format("OrchestratorConfig: '{}' is not valid JSON: {}", path.string(), e.what()));
    }
    OrchestratorConfig cfg = from_json(j);
    // A relative log file is taken relative to the config file.
    if (!cfg.log_file.empty() && cfg.log_file.is_relative())
    {
        cfg.log_file = path.parent_path() / cfg.log_file;
    }
    return cfg;
}

OrchestratorConfig OrchestratorConfig::from_json(const nlohmann::json &j)
{
    OrchestratorConfig cfg;
    cfg.merge(j);
    return cfg;
}

void OrchestratorConfig::merge(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("OrchestratorConfig: top-level value must be an object");
    }

    if (auto it = j.find("lifecycle"); it != j.end())
    {
        const auto &lc = *it;
        if (lc.contains("start_timeout_ms"))
            start_timeout = parse_timeout(lc.at("start_timeout_ms"), "lifecycle.start_timeout_ms");
        if (lc.contains("stop_timeout_ms"))
            stop_timeout = parse_timeout(lc.at("stop_timeout_ms"), "lifecycle.stop_timeout_ms");
        if (lc.contains("handle_signals"))
        {
            if (!lc.at("handle_signals").is_boolean())
                throw std::runtime_error("OrchestratorConfig: 'lifecycle.handle_signals' must be a boolean");
            handle_signals = lc.at("handle_signals").get<bool>();
        }
    }

    if (auto it = j.find("logging"); it != j.end())
    {
        const auto &lg = *it;
        if (lg.contains("level"))
            log_level = parse_log_level(require_string(lg.at("level"), "logging.level"), "logging.level");
        if (lg.contains("file"))
            log_file = require_string(lg.at("file"), "logging.file");
    }
}

void OrchestratorConfig::apply_env()
{
    if (const char *v = env("LIFTOFF_START_TIMEOUT_MS"))
        start_timeout = parse_timeout(std::string(v), "LIFTOFF_START_TIMEOUT_MS");
    if (const char *v = env("LIFTOFF_STOP_TIMEOUT_MS"))
        stop_timeout = parse_timeout(std::string(v), "LIFTOFF_STOP_TIMEOUT_MS");
    if (const char *v = env("LIFTOFF_LOG_LEVEL"))
        log_level = parse_log_level(v, "LIFTOFF_LOG_LEVEL");
}

void OrchestratorConfig::apply_to(OrchestratorOptions &options) const
{
    options.start_timeout = start_timeout;
    options.stop_timeout = stop_timeout;
    options.handle_signals = handle_signals;
}

bool OrchestratorConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    logger.set_level(log_level);
    if (log_file.empty())
    {
        return true;
    }
    return logger.set_logfile(log_file);
}

nlohmann::json OrchestratorConfig::to_json() const
{
    return nlohmann::json{
        {"lifecycle",
         {{"start_timeout_ms", start_timeout.count()},
          {"stop_timeout_ms", stop_timeout.count()},
          {"handle_signals", handle_signals}}},
        {"logging", {{"level", level_name(log_level)}, {"file", log_file.string()}}},
    };
}

} // namespace liftoff
