#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the supervisor, monitor and channels.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          settings file (see config_loader.hpp) in real deployments.
 */

#include <cstddef>
#include <cstdint>

namespace warden::config::constants {

// =====================
// Health Monitor
// Units: milliseconds
// =====================
inline constexpr uint32_t MONITOR_CHECK_INTERVAL_MS   = 1000; ///< Monitor cycle period
inline constexpr uint32_t HEARTBEAT_INTERVAL_MS       =  200; ///< Max gap between beats of a healthy unit
inline constexpr uint32_t HEARTBEAT_SLOW_AFTER_MS     = 2000; ///< Age above which a unit is DEGRADED
inline constexpr uint32_t HEARTBEAT_DEAD_AFTER_MS     = 5000; ///< Age above which a unit is DEAD
inline constexpr bool     MONITOR_AUTO_RESTART        = true; ///< Restart DEAD units automatically

// =====================
// Supervisor lifecycle
// =====================
inline constexpr uint32_t SUPERVISOR_MAX_RESTARTS     = 3;    ///< Ceiling per registration
inline constexpr uint32_t SUPERVISOR_STARTUP_GRACE_MS = 3000; ///< Wait for first heartbeat
inline constexpr uint32_t SUPERVISOR_DRAIN_TIMEOUT_MS = 2000; ///< Graceful stop before SIGKILL
inline constexpr uint32_t SUPERVISOR_POLL_MS          = 10;   ///< Poll step while waiting on units

// =====================
// Calls and channels
// =====================
inline constexpr uint32_t CALL_TIMEOUT_MS             = 2000; ///< Default dispatch_call deadline
inline constexpr uint32_t INBOX_CAPACITY              = 64;   ///< Slots per channel (power-of-two)
inline constexpr uint32_t CHANNEL_SLOT_BYTES          = 4096; ///< Max encoded envelope size
inline constexpr uint32_t CALL_READER_SLICE_MS        = 50;   ///< Max time one caller reads on behalf of others

// =====================
// Demo orchestrator app
// =====================
inline constexpr uint32_t APP_STATUS_PERIOD_MS        = 5000; ///< Introspection report period

} // namespace warden::config::constants

namespace warden {

/// Compile-time capacity and field limits of the shared arena.
struct Limits {
    static constexpr std::size_t MaxEndpoints    = 64;   ///< Services + client endpoints.
    static constexpr std::size_t MaxNameLen      = 31;   ///< Service / endpoint names.
    static constexpr std::size_t MaxCounters     = 256;  ///< Generic statistics counters.
    static constexpr std::size_t MaxCounterKeyLen = 63;  ///< Counter key length.
};

} // namespace warden
