#pragma once
/**
 * @file stats_store.hpp
 * @brief Shared statistics: per-service heartbeat records + generic counters.
 *
 * Concurrency model:
 *   - One coarse robust mutex over the whole table; every read-modify-write
 *     (increment, record_request, beat) happens inside it, so concurrent
 *     writers from different processes never lose updates.
 *   - Timestamps are steady_clock (CLOCK_MONOTONIC), comparable across
 *     processes on one host.
 *   - No persistence: the table starts empty with every supervisor.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "warden/config/constants.hpp"
#include "warden/core/error.hpp"
#include "warden/ipc/shm_sync.hpp"

namespace warden::ipc {

class SharedArena;

/// Liveness signal of one service, as seen by the monitor.
struct HeartbeatRecord {
    std::string service;
    std::optional<std::chrono::steady_clock::time_point> last_beat; ///< nullopt: never beat
    std::uint64_t request_count{0};
    std::uint64_t error_count{0};
    std::chrono::system_clock::time_point started_at{};
};

/// In-arena heartbeat slot.
struct BeatSlot {
    char          name[Limits::MaxNameLen + 1]{};
    std::int64_t  last_beat_ns{0};   ///< steady_clock; 0 = never
    std::int64_t  started_at_ns{0};  ///< system_clock
    std::uint64_t requests{0};
    std::uint64_t errors{0};
    bool          in_use{false};
};

/// In-arena counter slot.
struct CounterSlot {
    char         key[Limits::MaxCounterKeyLen + 1]{};
    std::int64_t value{0};
    bool         in_use{false};
};

struct StatsTable {
    ShmMutex    mu;
    BeatSlot    beats[Limits::MaxEndpoints];
    CounterSlot counters[Limits::MaxCounters];
};

class StatsStore final {
public:
    StatsStore() noexcept = default;

    /// Factory: carves an empty table out of `arena`.
    static Result<StatsStore> create(SharedArena& arena);

    // --------------------------- Heartbeats ----------------------------------
    /// Fresh record for a (re)started unit: no beat yet, counts zeroed.
    Result<void> reset_service(std::string_view service);

    /// Drop the record entirely.
    void forget_service(std::string_view service) noexcept;

    /// Stamp "now" as the last beat.
    void beat(std::string_view service) noexcept;

    /// Stamp an explicit time (monitor tests, clock injection).
    void beat_at(std::string_view service, std::chrono::steady_clock::time_point when) noexcept;

    /// Count one processed request; returns the new total.
    std::uint64_t record_request(std::string_view service) noexcept;

    /// Count one request answered with ERROR; returns the new total.
    std::uint64_t record_error(std::string_view service) noexcept;

    [[nodiscard]] std::optional<HeartbeatRecord> heartbeat(std::string_view service) const;
    [[nodiscard]] std::vector<HeartbeatRecord> heartbeats() const;

    // --------------------------- Counters ------------------------------------
    /// Atomic increment-and-store. Creates the key at 0 if needed.
    Result<std::int64_t> increment(std::string_view key, std::int64_t delta = 1);

    [[nodiscard]] std::optional<std::int64_t> counter(std::string_view key) const;
    [[nodiscard]] std::vector<std::pair<std::string, std::int64_t>> counters() const;

    /// Wipe everything.
    void clear() noexcept;

    bool valid() const noexcept { return table_ != nullptr; }

private:
    BeatSlot* find_beat(std::string_view service) const noexcept;
    BeatSlot* find_or_add_beat(std::string_view service) noexcept;

    StatsTable* table_ = nullptr;
};

} // namespace warden::ipc
