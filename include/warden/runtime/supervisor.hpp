#pragma once
/**
 * @file supervisor.hpp
 * @brief Owns the shared arena, the registry and every execution unit.
 *
 * Lifecycle operations (start/stop/restart and monitor-driven status marks) are
 * serialized by one lifecycle mutex. Calls are not: dispatch_call only touches
 * the directory and a per-caller CallClient.
 *
 * Destruction stops every unit gracefully. Stop any HealthMonitor bound to a
 * Supervisor before destroying it.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "warden/config/constants.hpp"
#include "warden/core/error.hpp"
#include "warden/ipc/directory.hpp"
#include "warden/ipc/message.hpp"
#include "warden/ipc/shared_arena.hpp"
#include "warden/ipc/stats_store.hpp"
#include "warden/obs/observability.hpp"
#include "warden/runtime/call_client.hpp"
#include "warden/runtime/health_monitor.hpp"
#include "warden/runtime/process.hpp"
#include "warden/runtime/service_context.hpp"
#include "warden/runtime/service_registry.hpp"

namespace warden::runtime {

/** @struct SupervisorConfig
 *  @brief Lifecycle timings and channel geometry.
 */
struct SupervisorConfig {
    uint32_t max_restarts{config::constants::SUPERVISOR_MAX_RESTARTS};
    uint32_t startup_grace_ms{config::constants::SUPERVISOR_STARTUP_GRACE_MS};
    uint32_t drain_timeout_ms{config::constants::SUPERVISOR_DRAIN_TIMEOUT_MS};
    uint32_t heartbeat_interval_ms{config::constants::HEARTBEAT_INTERVAL_MS};
    uint32_t call_timeout_ms{config::constants::CALL_TIMEOUT_MS};
    uint32_t inbox_capacity{config::constants::INBOX_CAPACITY};   ///< power-of-two
    uint32_t slot_bytes{config::constants::CHANNEL_SLOT_BYTES};
};

/// Service body, run inside the forked unit. Return value is the exit code.
using Entrypoint = std::function<int(ServiceContext&)>;

/** @struct ServiceReport
 *  @brief Introspection view: descriptor plus aggregated statistics.
 */
struct ServiceReport {
    ServiceDescriptor descriptor;
    std::uint64_t     requests{0};
    std::uint64_t     errors{0};
    std::optional<std::chrono::milliseconds> heartbeat_age; ///< nullopt: never beat
};

class Supervisor final : public ServiceController {
public:
    /**
     * @brief Factory: maps the arena and lays out directory + statistics.
     * @param observer Event sink; a log-backed observer when null.
     */
    static Result<std::unique_ptr<Supervisor>> create(SupervisorConfig cfg,
                                                      std::unique_ptr<obs::Observer> observer = nullptr);

    Supervisor(const Supervisor&)            = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    ~Supervisor() override;

    // --------------------------- Lifecycle -----------------------------------
    /// Register STARTING, fork, wait for the first heartbeat, mark RUNNING.
    Result<ServiceDescriptor> start_service(std::string_view name, Entrypoint entry);

    /// Drain-then-kill (graceful) or kill. Always ends STOPPED.
    Result<void> stop_service(std::string_view name, bool graceful = true);

    /// Kill, DEAD, restart_count+1, STARTING, fresh unit. Bounded by max_restarts.
    Result<ServiceDescriptor> restart_service(std::string_view name) override;

    /// Stop every unit (graceful for live ones).
    void stop_all();

    // --------------------------- Calls ---------------------------------------
    /// Blocking request/response on behalf of `source` (e.g. a gateway).
    Result<ipc::Payload> dispatch_call(std::string_view source, std::string_view target,
                                       std::string_view action, ipc::Payload payload,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // --------------------------- Introspection -------------------------------
    std::vector<ServiceReport> list_services() const;
    Result<ServiceReport> service_health(std::string_view name) const;

    const ServiceRegistry& registry() const noexcept { return registry_; }
    ipc::StatsStore& stats() noexcept { return stats_; }
    obs::Observer& observer() noexcept { return *observer_; }
    const SupervisorConfig& config() const noexcept { return cfg_; }

    // --------------------------- ServiceController ---------------------------
    std::vector<ServiceDescriptor> services() const override;
    bool unit_alive(const ServiceDescriptor& d) override;
    std::optional<std::chrono::steady_clock::time_point>
    last_heartbeat(std::string_view name) const override;
    Result<void> mark(std::string_view name, pid_t expected_pid,
                      ServiceStatus status, std::string_view reason) override;

private:
    Supervisor(SupervisorConfig cfg, std::unique_ptr<obs::Observer> observer,
               ipc::SharedArena arena, ipc::Directory dir, ipc::StatsStore stats);

    /// Acquire endpoint, fork, wait for first beat, mark RUNNING. Caller holds lifecycle_mu_
    /// and the entry is STARTING.
    Result<ServiceDescriptor> launch_locked(const std::string& name, const Entrypoint& entry);

    /// Kill the unit (if any) and release its endpoint. Caller holds lifecycle_mu_.
    void retire_unit_locked(const std::string& name) noexcept;

    std::shared_ptr<ProcessHandle> unit_of(std::string_view name) const;
    Result<CallClient*> client_for(std::string_view source);
    ServiceReport report_of(const ServiceDescriptor& d) const;
    void emit(obs::EventKind kind, const ServiceDescriptor& d, std::string detail);

    SupervisorConfig               cfg_;
    std::unique_ptr<obs::Observer> observer_;
    ipc::SharedArena               arena_;   ///< Outlives every view below
    ipc::Directory                 dir_;
    ipc::StatsStore                stats_;
    ServiceRegistry                registry_;

    std::mutex lifecycle_mu_;

    mutable std::mutex units_mu_;
    std::unordered_map<std::string, std::shared_ptr<ProcessHandle>> units_;
    std::unordered_map<std::string, Entrypoint>                     entrypoints_;

    std::mutex clients_mu_;
    std::unordered_map<std::string, std::unique_ptr<CallClient>> clients_;
    std::vector<ipc::EndpointId>                                 client_endpoints_;
};

} // namespace warden::runtime
