#pragma once
/**
 * @file directory.hpp
 * @brief Shared endpoint directory: name -> (inbox, reply channel, stop flag).
 *
 * Every service and every out-of-process caller owns one endpoint. The table
 * lives in the arena so a forked unit can resolve a call target, or the
 * reply_to of a request, without asking the supervisor.
 *
 * Thread/process safety: lookups and mutations take the table's robust mutex;
 * the stop flag is a lock-free atomic.
 */

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

#include "warden/config/constants.hpp"
#include "warden/core/error.hpp"
#include "warden/ipc/channel.hpp"
#include "warden/ipc/shm_sync.hpp"

namespace warden::ipc {

class SharedArena;

/// Endpoint role.
enum class EndpointKind : std::uint8_t {
    Free    = 0,  ///< Slot available
    Service = 1,  ///< Supervised unit: inbox + replies
    Client  = 2   ///< Caller outside any unit: replies only
};

/// In-arena directory entry.
struct EndpointSlot {
    EndpointKind               kind{EndpointKind::Free};
    char                       name[Limits::MaxNameLen + 1]{};
    pid_t                      owner{0};
    std::uint32_t              generation{0};
    std::atomic<std::uint32_t> stop_requested{0};
};

struct DirectoryTable {
    ShmMutex     mu;
    EndpointSlot slots[Limits::MaxEndpoints];
};

static_assert(std::atomic<std::uint32_t>::is_always_lock_free,
              "cross-process stop flags need lock-free atomics");

using EndpointId = std::uint32_t;

class Directory final {
public:
    Directory() = default;

    /// Factory: carves the table and 2 * MaxEndpoints channels out of `arena`.
    static Result<Directory> create(SharedArena& arena, std::size_t capacity_pow2,
                                    std::size_t slot_bytes);

    /// Bytes of arena needed for a directory with these channel parameters.
    static std::size_t footprint(std::size_t capacity_pow2, std::size_t slot_bytes) noexcept;

    /**
     * @brief Claim a free slot under `name`. Both channels are emptied.
     * @return DuplicateService if the name is already held, Capacity if full.
     */
    Result<EndpointId> acquire(std::string_view name, EndpointKind kind);

    /// Return a slot to the pool. Idempotent; drops whatever is still queued.
    void release(EndpointId id) noexcept;

    /// Find a live endpoint by name and kind.
    std::optional<EndpointId> find(std::string_view name, EndpointKind kind) const;

    /// Find a live endpoint by name, any kind (reply routing).
    std::optional<EndpointId> find_any(std::string_view name) const;

    void set_owner(EndpointId id, pid_t pid) noexcept;
    std::string name_of(EndpointId id) const;

    void request_stop(EndpointId id) noexcept;
    bool stop_requested(EndpointId id) const noexcept;

    Channel inbox(EndpointId id) const noexcept { return id < inboxes_.size() ? inboxes_[id] : Channel{}; }
    Channel replies(EndpointId id) const noexcept { return id < replies_.size() ? replies_[id] : Channel{}; }

    std::size_t in_use() const;

private:
    std::optional<EndpointId> find_locked(std::string_view name, bool any_kind, EndpointKind kind) const;

    DirectoryTable*      table_ = nullptr;
    std::vector<Channel> inboxes_;
    std::vector<Channel> replies_;
};

} // namespace warden::ipc
