/**
 * @file directory.cpp
 * @brief Endpoint directory over a fixed slot table.
 */
#include "warden/ipc/directory.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>

#include "warden/ipc/shared_arena.hpp"

namespace warden::ipc {

namespace {

std::string_view slot_name(const EndpointSlot& s) noexcept {
    return std::string_view(s.name, ::strnlen(s.name, sizeof(s.name)));
}

} // namespace

std::size_t Directory::footprint(std::size_t capacity_pow2, std::size_t slot_bytes) noexcept {
    // Header + ring per channel, rounded generously for alignment padding.
    const std::size_t stride  = (sizeof(std::uint32_t) + slot_bytes + 7) & ~std::size_t{7};
    const std::size_t channel = sizeof(ChannelHeader) + 64 + stride * capacity_pow2;
    return sizeof(DirectoryTable) + 64 + 2 * Limits::MaxEndpoints * channel;
}

Result<Directory> Directory::create(SharedArena& arena, std::size_t capacity_pow2,
                                    std::size_t slot_bytes) {
    auto table = arena.allocate<DirectoryTable>();
    if (!table) return make_error(table.error().code, table.error().detail);
    if (auto r = (*table)->mu.init(); !r) return make_error(r.error().code, r.error().detail);

    Directory dir;
    dir.table_ = *table;
    dir.inboxes_.reserve(Limits::MaxEndpoints);
    dir.replies_.reserve(Limits::MaxEndpoints);
    for (std::size_t i = 0; i < Limits::MaxEndpoints; ++i) {
        auto in = Channel::create(arena, capacity_pow2, slot_bytes);
        if (!in) return make_error(in.error().code, in.error().detail);
        auto out = Channel::create(arena, capacity_pow2, slot_bytes);
        if (!out) return make_error(out.error().code, out.error().detail);
        dir.inboxes_.push_back(*in);
        dir.replies_.push_back(*out);
    }
    return dir;
}

std::optional<EndpointId> Directory::find_locked(std::string_view name, bool any_kind,
                                                 EndpointKind kind) const {
    for (EndpointId i = 0; i < Limits::MaxEndpoints; ++i) {
        const auto& s = table_->slots[i];
        if (s.kind == EndpointKind::Free) continue;
        if (!any_kind && s.kind != kind) continue;
        if (slot_name(s) == name) return i;
    }
    return std::nullopt;
}

Result<EndpointId> Directory::acquire(std::string_view name, EndpointKind kind) {
    if (!table_) return make_error(ErrorCode::InvalidArgument, "directory not initialized");
    if (name.empty() || name.size() > Limits::MaxNameLen) {
        return make_error(ErrorCode::InvalidArgument, "endpoint name length out of range");
    }
    if (kind == EndpointKind::Free) {
        return make_error(ErrorCode::InvalidArgument, "cannot acquire a Free endpoint");
    }

    EndpointId id = 0;
    {
        std::lock_guard<ShmMutex> lk(table_->mu);
        if (find_locked(name, true, kind)) {
            return make_error(ErrorCode::DuplicateService,
                              "endpoint '" + std::string(name) + "' already in use");
        }
        const auto* first = table_->slots;
        const auto* last  = table_->slots + Limits::MaxEndpoints;
        const auto* it = std::find_if(first, last,
                                      [](const EndpointSlot& s) { return s.kind == EndpointKind::Free; });
        if (it == last) {
            return make_error(ErrorCode::Capacity,
                              "all " + std::to_string(Limits::MaxEndpoints) + " endpoints in use");
        }
        id = static_cast<EndpointId>(it - first);
        auto& slot = table_->slots[id];
        slot.kind = kind;
        std::memset(slot.name, 0, sizeof(slot.name));
        std::memcpy(slot.name, name.data(), name.size());
        slot.owner = 0;
        slot.generation++;
        slot.stop_requested.store(0, std::memory_order_release);
    }
    inboxes_[id].reset();
    replies_[id].reset();
    return id;
}

void Directory::release(EndpointId id) noexcept {
    if (!table_ || id >= Limits::MaxEndpoints) return;
    {
        std::lock_guard<ShmMutex> lk(table_->mu);
        auto& slot = table_->slots[id];
        slot.kind = EndpointKind::Free;
        std::memset(slot.name, 0, sizeof(slot.name));
        slot.owner = 0;
        slot.stop_requested.store(0, std::memory_order_release);
    }
    inboxes_[id].reset();
    replies_[id].reset();
}

std::optional<EndpointId> Directory::find(std::string_view name, EndpointKind kind) const {
    if (!table_) return std::nullopt;
    std::lock_guard<ShmMutex> lk(table_->mu);
    return find_locked(name, false, kind);
}

std::optional<EndpointId> Directory::find_any(std::string_view name) const {
    if (!table_) return std::nullopt;
    std::lock_guard<ShmMutex> lk(table_->mu);
    return find_locked(name, true, EndpointKind::Free);
}

void Directory::set_owner(EndpointId id, pid_t pid) noexcept {
    if (!table_ || id >= Limits::MaxEndpoints) return;
    std::lock_guard<ShmMutex> lk(table_->mu);
    table_->slots[id].owner = pid;
}

std::string Directory::name_of(EndpointId id) const {
    if (!table_ || id >= Limits::MaxEndpoints) return {};
    std::lock_guard<ShmMutex> lk(table_->mu);
    return std::string(slot_name(table_->slots[id]));
}

void Directory::request_stop(EndpointId id) noexcept {
    if (!table_ || id >= Limits::MaxEndpoints) return;
    table_->slots[id].stop_requested.store(1, std::memory_order_release);
}

bool Directory::stop_requested(EndpointId id) const noexcept {
    if (!table_ || id >= Limits::MaxEndpoints) return false;
    return table_->slots[id].stop_requested.load(std::memory_order_acquire) != 0;
}

std::size_t Directory::in_use() const {
    if (!table_) return 0;
    std::lock_guard<ShmMutex> lk(table_->mu);
    return static_cast<std::size_t>(std::count_if(
        table_->slots, table_->slots + Limits::MaxEndpoints,
        [](const EndpointSlot& s) { return s.kind != EndpointKind::Free; }));
}

} // namespace warden::ipc
