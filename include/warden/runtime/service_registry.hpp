#pragma once
// Warden — ServiceRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers are serialized by one mutex, copy the whole map, mutate and swap with RELEASE.
//   • Readers never block writers; writers only block each other.
//   • Reclamation is handled by shared_ptr refcounts.
// Owned by the supervisor process; forked units never see it.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

#include "warden/core/error.hpp"
#include "warden/ipc/directory.hpp"

namespace warden::runtime {

/// Lifecycle status of a registered service.
enum class ServiceStatus : std::uint8_t {
    Starting,  ///< Registered, unit forked or about to be, no heartbeat yet
    Running,   ///< Heartbeating within thresholds
    Degraded,  ///< Heartbeat older than slow_after
    Dead,      ///< Unit gone or heartbeat older than dead_after
    Stopped    ///< Stopped on request (terminal)
};

const char* to_string(ServiceStatus s) noexcept;

/// STARTING, RUNNING or DEGRADED.
constexpr bool is_live(ServiceStatus s) noexcept {
    return s == ServiceStatus::Starting || s == ServiceStatus::Running ||
           s == ServiceStatus::Degraded;
}

/// Lifecycle state machine. Same-state is handled by the caller (no-op).
bool transition_allowed(ServiceStatus from, ServiceStatus to) noexcept;

/// Registry entry. Changed only through ServiceRegistry operations.
struct ServiceDescriptor {
    std::string      name;                 ///< Unique key
    pid_t            pid{0};               ///< Execution handle (0: none)
    ipc::EndpointId  endpoint{0};          ///< Inbox handle in the endpoint directory
    ServiceStatus    status{ServiceStatus::Starting};
    std::chrono::system_clock::time_point started_at{};
    std::uint32_t    restart_count{0};     ///< Never decreases for one registration
    std::string      last_error;           ///< Last failure detail, empty if none
};

///
/// Maintains name → ServiceDescriptor.
/// - Reads: grab shared_ptr snapshot, consistent, non-blocking.
/// - Writes: copy-on-write full map under writer mutex, atomic swap, version increment.
/// - Non-throwing: failures are returned as Error values.
///
class ServiceRegistry final {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, ServiceDescriptor, SKeyHash, SKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Descriptor copy, or NotFound.
    [[nodiscard]] Result<ServiceDescriptor> get(std::string_view name) const;

    /// Snapshot copy of every entry, sorted by name.
    [[nodiscard]] std::vector<ServiceDescriptor> list() const;

    [[nodiscard]] bool contains(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Add a fresh registration. DuplicateService if the name is live;
    /// a DEAD/STOPPED entry under the same name is replaced.
    Result<void> register_service(ServiceDescriptor d);

    /// Remove an entry. Idempotent: returns true only if something was erased.
    bool deregister(std::string_view name) noexcept;

    /// Move to `next` along the state machine.
    /// @return previous status. Same-state is a successful no-op.
    Result<ServiceStatus> update_status(std::string_view name, ServiceStatus next);

    /// Attach a new execution handle. Only while STARTING.
    Result<void> assign_unit(std::string_view name, pid_t pid, ipc::EndpointId endpoint);

    /// @return the new count.
    Result<std::uint32_t> increment_restart_count(std::string_view name);

    Result<void> set_last_error(std::string_view name, std::string text);

    /// Reset started_at to now (fresh unit).
    Result<void> touch_started(std::string_view name);

    /// Clear all entries. Maintenance operation.
    void clear() noexcept;

    /// Allow [A-Za-z0-9_-], 1..MaxNameLen.
    static bool validate_name(std::string_view name) noexcept;

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t registrations{0}, deregistrations{0}, transitions{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    // Writer helper: copy, apply fn(descriptor&) -> Result<R>, publish on success.
    template <class Fn>
    auto mutate_entry(std::string_view name, Fn&& fn) -> decltype(fn(std::declval<ServiceDescriptor&>()));

    void publish(std::shared_ptr<Map> next) noexcept;

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex writer_mu_;

    std::atomic<uint64_t> registrations_{0}, deregistrations_{0}, transitions_{0}, failures_{0};
};

} // namespace warden::runtime
