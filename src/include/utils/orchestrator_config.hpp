#pragma once

/**
 * @file orchestrator_config.hpp
 * @brief OrchestratorConfig: JSON + environment configuration for an orchestrated process.
 *
 * ## Config loading (priority low → high)
 *
 *  1. Built-in defaults (15 s timeouts, signal handling on, level "info", console logging)
 *  2. A JSON file, when one is given (`from_file`) or named by `LIFTOFF_CONFIG_FILE` (`load`)
 *  3. Environment overrides (`apply_env`):
 *     - `LIFTOFF_START_TIMEOUT_MS`  overrides lifecycle.start_timeout_ms
 *     - `LIFTOFF_STOP_TIMEOUT_MS`   overrides lifecycle.stop_timeout_ms
 *     - `LIFTOFF_LOG_LEVEL`         overrides logging.level
 *
 * File layout (every key optional):
 * @code{.json}
 * {
 *   "lifecycle": { "start_timeout_ms": 15000, "stop_timeout_ms": 15000, "handle_signals": true },
 *   "logging":   { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * Invalid values (negative or non-numeric timeouts, unknown levels, malformed
 * JSON) throw `std::runtime_error` naming the offending key. A timeout too
 * large to represent saturates to `milliseconds::max()`, which the lifecycle
 * treats as no deadline at all.
 */

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "liftoff_utils_export.h"
#include "utils/logger.hpp"
#include "utils/orchestrator.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff
{

class LIFTOFF_UTILS_EXPORT OrchestratorConfig
{
  public:
    std::chrono::milliseconds start_timeout{kDefaultTimeout};
    std::chrono::milliseconds stop_timeout{kDefaultTimeout};
    bool handle_signals{true};
    utils::Logger::Level log_level{utils::Logger::Level::L_INFO};
    std::filesystem::path log_file; ///< Empty means console.

    /// Defaults, then `LIFTOFF_CONFIG_FILE` if set, then environment overrides.
    [[nodiscard]] static OrchestratorConfig load();

    /// Defaults overlaid with the file at `path`. Does not read the environment.
    [[nodiscard]] static OrchestratorConfig from_file(const std::filesystem::path &path);

    /// Defaults overlaid with `j`. Does not read the environment.
    [[nodiscard]] static OrchestratorConfig from_json(const nlohmann::json &j);

    /// Applies `LIFTOFF_*` environment overrides in place.
    void apply_env();

    /// Copies timeouts and the signal flag into `options`.
    void apply_to(OrchestratorOptions &options) const;

    /**
     * @brief Sets the logger level and, if `log_file` is set, switches to a file sink.
     * @return false if the file sink could not be opened (the logger keeps its sink).
     */
    bool apply_logging() const;

    [[nodiscard]] nlohmann::json to_json() const;

  private:
    void merge(const nlohmann::json &j);
};

} // namespace liftoff

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
