#pragma once
/**
 * @file health_monitor.hpp
 * @brief Periodic liveness classification of running units.
 * @details Thresholds are named in constants.hpp. The monitor only reads and
 *          requests changes through ServiceController; it never touches a unit.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>

#include "warden/config/constants.hpp"
#include "warden/core/error.hpp"
#include "warden/runtime/service_registry.hpp"

namespace warden::runtime {

/** @struct MonitorConfig
 *  @brief Cycle period and heartbeat age thresholds.
 */
struct MonitorConfig {
    uint32_t check_interval_ms{config::constants::MONITOR_CHECK_INTERVAL_MS}; ///< Cycle period
    uint32_t slow_after_ms{config::constants::HEARTBEAT_SLOW_AFTER_MS};       ///< DEGRADED above this age
    uint32_t dead_after_ms{config::constants::HEARTBEAT_DEAD_AFTER_MS};       ///< DEAD above this age
    bool     auto_restart{config::constants::MONITOR_AUTO_RESTART};           ///< Restart DEAD units
};

/** @enum Verdict
 *  @brief Health classification of one unit at one instant.
 */
enum class Verdict : uint8_t { Healthy, Slow, Dead };

const char* to_string(Verdict v) noexcept;

/**
 * @brief Classify a unit.
 * @param alive OS-level liveness of the process.
 * @param last_beat Last heartbeat; nullopt counts as infinitely old.
 */
Verdict classify(bool alive, std::optional<std::chrono::steady_clock::time_point> last_beat,
                 std::chrono::steady_clock::time_point now, const MonitorConfig& cfg) noexcept;

/** @class ServiceController
 *  @brief What the monitor may ask of the supervisor.
 */
class ServiceController {
public:
    virtual ~ServiceController() = default;

    /// Registry snapshot.
    virtual std::vector<ServiceDescriptor> services() const = 0;

    /// OS-level liveness of the unit behind `d` (false if the handle changed).
    virtual bool unit_alive(const ServiceDescriptor& d) = 0;

    virtual std::optional<std::chrono::steady_clock::time_point>
    last_heartbeat(std::string_view name) const = 0;

    /// Status change guarded by the pid the decision was made on.
    virtual Result<void> mark(std::string_view name, pid_t expected_pid,
                              ServiceStatus status, std::string_view reason) = 0;

    virtual Result<ServiceDescriptor> restart_service(std::string_view name) = 0;
};

/** @struct CycleReport
 *  @brief What one check_once() pass did.
 */
struct CycleReport {
    std::size_t checked{0};
    std::size_t healthy{0};
    std::size_t degraded{0};
    std::size_t recovered{0};
    std::size_t dead{0};
    std::size_t restarted{0};
    std::size_t restart_failures{0};
};

/** @class HealthMonitor
 *  @brief Timer thread that runs check_once() every check_interval.
 */
class HealthMonitor {
public:
    HealthMonitor(ServiceController& ctl, MonitorConfig cfg) noexcept : ctl_(ctl), cfg_(cfg) {}
    ~HealthMonitor() { stop(); }

    HealthMonitor(const HealthMonitor&)            = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    /// Idempotent; waits for an in-flight cycle to finish.
    void stop();
    bool running() const noexcept;

    /// One synchronous cycle.
    CycleReport check_once();
    CycleReport check_once(std::chrono::steady_clock::time_point now);

    const MonitorConfig& config() const noexcept { return cfg_; }

private:
    void loop();

    ServiceController& ctl_;
    MonitorConfig      cfg_;

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    bool                    stop_requested_{false};
    std::thread             worker_;
};

} // namespace warden::runtime
