/**
 * @file channel.cpp
 * @brief Shared-memory ring: length-prefixed slots guarded by a robust mutex.
 */
#include "warden/ipc/channel.hpp"

#include <cstring>
#include <mutex>

#include "warden/ipc/shared_arena.hpp"
#include "warden/obs/observability.hpp"

namespace warden::ipc {

namespace {

constexpr std::size_t kLengthPrefix = sizeof(std::uint32_t);
constexpr std::size_t kSlotAlign    = 8;

} // namespace

Result<Channel> Channel::create(SharedArena& arena, std::size_t capacity_pow2,
                                std::size_t slot_bytes) noexcept {
    if (capacity_pow2 < 2) {
        return make_error(ErrorCode::InvalidArgument, "channel capacity must be >= 2");
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
        return make_error(ErrorCode::InvalidArgument, "channel capacity must be a power of two");
    }
    if (slot_bytes == 0 || slot_bytes > UINT32_MAX - kLengthPrefix - kSlotAlign) {
        return make_error(ErrorCode::InvalidArgument, "invalid slot size");
    }

    auto hdr = arena.allocate<ChannelHeader>();
    if (!hdr) return make_error(hdr.error().code, hdr.error().detail);

    const std::size_t stride = (kLengthPrefix + slot_bytes + kSlotAlign - 1) & ~(kSlotAlign - 1);
    auto slots = arena.allocate_bytes(stride * capacity_pow2, kSlotAlign);
    if (!slots) return make_error(slots.error().code, slots.error().detail);

    ChannelHeader* h = *hdr;
    if (auto r = h->mu.init(); !r) return make_error(r.error().code, r.error().detail);
    if (auto r = h->not_empty.init(); !r) return make_error(r.error().code, r.error().detail);
    h->capacity   = static_cast<std::uint32_t>(capacity_pow2);
    h->mask       = static_cast<std::uint32_t>(capacity_pow2 - 1);
    h->slot_bytes = static_cast<std::uint32_t>(slot_bytes);
    h->stride     = static_cast<std::uint32_t>(stride);

    return Channel(h, *slots);
}

Result<void> Channel::send(const Message& m) {
    const std::string bytes = encode(m);
    return send_bytes(std::as_bytes(std::span<const char>(bytes.data(), bytes.size())));
}

Result<void> Channel::send_bytes(std::span<const std::byte> bytes) {
    if (!hdr_) return make_error(ErrorCode::InvalidArgument, "channel not initialized");
    if (bytes.size() > hdr_->slot_bytes) {
        return make_error(ErrorCode::MessageTooLarge,
                          std::to_string(bytes.size()) + " bytes > slot size " +
                          std::to_string(hdr_->slot_bytes));
    }

    {
        std::lock_guard<ShmMutex> lk(hdr_->mu);
        if (hdr_->tail - hdr_->head >= hdr_->capacity) {
            hdr_->stats.overflows++;
            return make_error(ErrorCode::QueueOverflow,
                              "channel full (" + std::to_string(hdr_->capacity) + " slots)");
        }
        std::byte* slot = slot_at(hdr_->tail);
        const auto len = static_cast<std::uint32_t>(bytes.size());
        std::memcpy(slot, &len, kLengthPrefix);
        if (len != 0) std::memcpy(slot + kLengthPrefix, bytes.data(), len);
        hdr_->tail++;
        hdr_->stats.sent++;
    }
    hdr_->not_empty.notify_one();
    return {};
}

std::optional<std::string> Channel::receive_bytes(std::optional<std::chrono::milliseconds> timeout) {
    if (!hdr_) return std::nullopt;
    const auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                  : std::chrono::steady_clock::time_point::max();

    std::unique_lock<ShmMutex> lk(hdr_->mu);
    while (hdr_->head == hdr_->tail) {
        if (!timeout) {
            hdr_->not_empty.wait(hdr_->mu);
        } else if (!hdr_->not_empty.wait_until(hdr_->mu, deadline)) {
            if (hdr_->head == hdr_->tail) return std::nullopt;
        }
    }
    const std::byte* slot = slot_at(hdr_->head);
    std::uint32_t len = 0;
    std::memcpy(&len, slot, kLengthPrefix);
    std::string out(reinterpret_cast<const char*>(slot + kLengthPrefix), len);
    hdr_->head++;
    hdr_->stats.received++;
    return out;
}

std::optional<Message> Channel::receive(std::optional<std::chrono::milliseconds> timeout) {
    const auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                  : std::chrono::steady_clock::time_point::max();
    for (;;) {
        std::optional<std::chrono::milliseconds> remaining;
        if (timeout) {
            const auto now = std::chrono::steady_clock::now();
            remaining = (now >= deadline)
                ? std::chrono::milliseconds(0)
                : std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        }
        auto bytes = receive_bytes(remaining);
        if (!bytes) return std::nullopt;

        auto msg = decode(std::as_bytes(std::span<const char>(bytes->data(), bytes->size())));
        if (msg) return std::move(*msg);

        {
            std::lock_guard<ShmMutex> lk(hdr_->mu);
            hdr_->stats.malformed++;
        }
        obs::log().error("channel: dropping undecodable slot ({} bytes): {}",
                         bytes->size(), msg.error().detail);
    }
}

void Channel::reset() noexcept {
    if (!hdr_) return;
    std::lock_guard<ShmMutex> lk(hdr_->mu);
    hdr_->head = hdr_->tail;
}

std::size_t Channel::size() const noexcept {
    if (!hdr_) return 0;
    std::lock_guard<ShmMutex> lk(hdr_->mu);
    return static_cast<std::size_t>(hdr_->tail - hdr_->head);
}

ChannelStats Channel::stats() const noexcept {
    if (!hdr_) return {};
    std::lock_guard<ShmMutex> lk(hdr_->mu);
    return hdr_->stats;
}

} // namespace warden::ipc
