#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden by a protobuf text-format file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <string>

#include "warden/core/error.hpp"
#include "warden/runtime/health_monitor.hpp"
#include "warden/runtime/supervisor.hpp"

namespace warden::config {

    /** @struct Settings
     *  @brief Aggregate of sub-configs required by the orchestrator.
     */
    struct Settings {
        warden::runtime::SupervisorConfig supervisor; ///< Lifecycle timings, channel geometry
        warden::runtime::MonitorConfig    monitor;    ///< Cycle period, heartbeat thresholds
        std::string                       log_level{"info"};
    };

    /** @class Loader
     *  @brief Source of orchestrator settings (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Load settings from a text-format file, or defaults for an empty path.
         * @return Settings, or ConfigError (unreadable, unparsable, inconsistent).
         */
        static Result<Settings> load_from_file(const std::string& path);

        /// Parse text-format content directly.
        static Result<Settings> load_from_string(const std::string& text);

        /// Threshold consistency checks.
        static Result<void> validate(const Settings& s);
    };

} // namespace warden::config
