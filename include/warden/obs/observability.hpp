#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: process logger + lifecycle events + counters.
 * @details Backed by spdlog. Forked units must call reinit_for_child() before
 *          logging so they never touch a sink mutex inherited mid-write.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>

#include <spdlog/spdlog.h>

namespace warden::obs {

    /** @enum EventKind
     *  @brief Lifecycle transitions worth counting.
     */
    enum class EventKind : uint8_t {
        Started,         ///< Unit reached RUNNING
        Stopped,         ///< Unit stopped on request
        Restarted,       ///< Restart completed (unit RUNNING again)
        Died,            ///< Unit detected DEAD (process gone or heartbeat expired)
        Degraded,        ///< Heartbeat older than the slow threshold
        Recovered,       ///< DEGRADED unit back to RUNNING
        RestartRefused,  ///< Restart ceiling reached
        CallTimeout,     ///< dispatch_call deadline expired
        CallFailed       ///< dispatch_call got an ERROR reply or could not send
    };

    /// Stable name for logs.
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for supervision events.
     */
    struct Counters {
        uint64_t starts{0};
        uint64_t stops{0};
        uint64_t restarts{0};
        uint64_t deaths{0};
        uint64_t degradations{0};
        uint64_t recoveries{0};
        uint64_t restart_refusals{0};
        uint64_t call_timeouts{0};
        uint64_t call_failures{0};
    };

    /** @struct LifecycleEvent
     *  @brief Payload describing one supervision event.
     */
    struct LifecycleEvent {
        std::string service;          ///< Service name
        EventKind   kind{EventKind::Started};
        pid_t       pid{0};           ///< Execution handle at the time of the event
        uint32_t    restart_count{0}; ///< Restart count after the event
        std::string detail;           ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single lifecycle event.
        virtual void record(const LifecycleEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// New log-backed observer (one per supervisor).
    std::unique_ptr<Observer> make_simple_observer();

    /// Process logger. Lazily created on first use.
    spdlog::logger& log();

    /// Set the process log level from a spdlog level name ("debug", "info", ...).
    void set_log_level(std::string_view level);

    /// Replace the process logger with a fresh one named after the unit.
    /// Call first thing in a forked child.
    void reinit_for_child(std::string_view unit_name);

} // namespace warden::obs
