/**
 * @file channel.hpp
 * @brief Bounded multi-producer FIFO of encoded messages, living in shared memory.
 *
 * Design goals:
 *  - Any process that inherited the arena may send or receive.
 *  - send() never blocks: a full ring is reported as QueueOverflow (back
 *    pressure), never a silent drop.
 *  - receive() blocks until a message arrives or the timeout elapses and
 *    returns std::nullopt on timeout.
 *  - Strict FIFO per channel; no duplication.
 *
 * Construction:
 *  - Use Channel::create(arena, capacity_pow2, slot_bytes) at setup time.
 *  - A Channel object is a cheap, copyable view; the ring itself is owned by
 *    the arena.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "warden/core/error.hpp"
#include "warden/ipc/message.hpp"
#include "warden/ipc/shm_sync.hpp"

namespace warden::ipc {

class SharedArena;

/// Cumulative per-channel counters.
struct ChannelStats {
    std::uint64_t sent{0};
    std::uint64_t received{0};
    std::uint64_t overflows{0};
    std::uint64_t malformed{0};
};

/// In-arena ring header. head/tail are free-running; index = counter & mask.
struct ChannelHeader {
    ShmMutex      mu;
    ShmCondition  not_empty;
    std::uint32_t capacity{0};
    std::uint32_t mask{0};
    std::uint32_t slot_bytes{0};
    std::uint32_t stride{0};
    std::uint64_t head{0};     ///< Consumer counter
    std::uint64_t tail{0};     ///< Producer counter
    ChannelStats  stats{};
};

class Channel final {
public:
    /// @brief Empty shell; valid() is false.
    Channel() noexcept = default;

    /**
     * @brief Factory: validates input and carves the ring out of `arena`.
     * @param capacity_pow2 Number of slots (power-of-two, >= 2).
     * @param slot_bytes Max encoded message size per slot.
     */
    static Result<Channel> create(SharedArena& arena, std::size_t capacity_pow2,
                                  std::size_t slot_bytes) noexcept;

    /// Encode and enqueue. QueueOverflow when full, MessageTooLarge when oversized.
    Result<void> send(const Message& m);

    /// Enqueue pre-encoded bytes.
    Result<void> send_bytes(std::span<const std::byte> bytes);

    /**
     * @brief Dequeue the oldest message.
     * @param timeout std::nullopt blocks indefinitely.
     * @return std::nullopt on timeout.
     */
    std::optional<Message> receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Raw variant of receive(); the bytes are not decoded.
    std::optional<std::string> receive_bytes(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Drop everything queued (used when an endpoint is recycled).
    void reset() noexcept;

    bool          valid() const noexcept { return hdr_ != nullptr; }
    std::size_t   capacity() const noexcept { return hdr_ ? hdr_->capacity : 0; }
    std::size_t   slot_bytes() const noexcept { return hdr_ ? hdr_->slot_bytes : 0; }
    std::size_t   size() const noexcept;
    bool          empty() const noexcept { return size() == 0; }
    ChannelStats  stats() const noexcept;

private:
    Channel(ChannelHeader* hdr, std::byte* slots) noexcept : hdr_(hdr), slots_(slots) {}

    std::byte* slot_at(std::uint64_t counter) const noexcept {
        return slots_ + static_cast<std::size_t>(counter & hdr_->mask) * hdr_->stride;
    }

    ChannelHeader* hdr_   = nullptr; ///< Non-owning view into the arena
    std::byte*     slots_ = nullptr; ///< capacity * stride bytes
};

} // namespace warden::ipc
