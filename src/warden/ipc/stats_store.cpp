/**
 * @file stats_store.cpp
 * @brief StatsStore over a fixed shared table.
 */
#include "warden/ipc/stats_store.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>

#include "warden/ipc/shared_arena.hpp"
#include "warden/obs/observability.hpp"

namespace warden::ipc {

namespace {

template <std::size_t N>
std::string_view view_of(const char (&buf)[N]) noexcept {
    return std::string_view(buf, ::strnlen(buf, N));
}

template <std::size_t N>
void store_name(char (&buf)[N], std::string_view s) noexcept {
    std::memset(buf, 0, N);
    std::memcpy(buf, s.data(), std::min(s.size(), N - 1));
}

std::int64_t steady_ns(std::chrono::steady_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::int64_t system_ns(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

HeartbeatRecord to_record(const BeatSlot& s) {
    HeartbeatRecord r;
    r.service = std::string(view_of(s.name));
    if (s.last_beat_ns != 0) {
        r.last_beat = std::chrono::steady_clock::time_point(
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::nanoseconds(s.last_beat_ns)));
    }
    r.request_count = s.requests;
    r.error_count   = s.errors;
    r.started_at = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(s.started_at_ns)));
    return r;
}

} // namespace

Result<StatsStore> StatsStore::create(SharedArena& arena) {
    auto table = arena.allocate<StatsTable>();
    if (!table) return make_error(table.error().code, table.error().detail);
    if (auto r = (*table)->mu.init(); !r) return make_error(r.error().code, r.error().detail);
    StatsStore store;
    store.table_ = *table;
    return store;
}

//------------------------------- Heartbeats -----------------------------------

BeatSlot* StatsStore::find_beat(std::string_view service) const noexcept {
    for (auto& s : table_->beats) {
        if (s.in_use && view_of(s.name) == service) return &s;
    }
    return nullptr;
}

BeatSlot* StatsStore::find_or_add_beat(std::string_view service) noexcept {
    if (auto* s = find_beat(service)) return s;
    if (service.empty() || service.size() > Limits::MaxNameLen) return nullptr;
    for (auto& s : table_->beats) {
        if (!s.in_use) {
            s = BeatSlot{};
            store_name(s.name, service);
            s.in_use = true;
            s.started_at_ns = system_ns(std::chrono::system_clock::now());
            return &s;
        }
    }
    return nullptr;
}

Result<void> StatsStore::reset_service(std::string_view service) {
    if (!table_) return make_error(ErrorCode::InvalidArgument, "stats store not initialized");
    std::lock_guard<ShmMutex> lk(table_->mu);
    BeatSlot* s = find_or_add_beat(service);
    if (!s) {
        return make_error(ErrorCode::Capacity,
                          "no heartbeat slot for '" + std::string(service) + "'");
    }
    s->last_beat_ns  = 0;
    s->requests      = 0;
    s->errors        = 0;
    s->started_at_ns = system_ns(std::chrono::system_clock::now());
    return {};
}

void StatsStore::forget_service(std::string_view service) noexcept {
    if (!table_) return;
    std::lock_guard<ShmMutex> lk(table_->mu);
    if (BeatSlot* s = find_beat(service)) *s = BeatSlot{};
}

void StatsStore::beat(std::string_view service) noexcept {
    beat_at(service, std::chrono::steady_clock::now());
}

void StatsStore::beat_at(std::string_view service, std::chrono::steady_clock::time_point when) noexcept {
    if (!table_) return;
    std::lock_guard<ShmMutex> lk(table_->mu);
    if (BeatSlot* s = find_or_add_beat(service)) {
        s->last_beat_ns = steady_ns(when);
    } else {
        obs::log().warn("stats: heartbeat table full, dropping beat of '{}'", service);
    }
}

std::uint64_t StatsStore::record_request(std::string_view service) noexcept {
    if (!table_) return 0;
    std::lock_guard<ShmMutex> lk(table_->mu);
    BeatSlot* s = find_or_add_beat(service);
    return s ? ++s->requests : 0;
}

std::uint64_t StatsStore::record_error(std::string_view service) noexcept {
    if (!table_) return 0;
    std::lock_guard<ShmMutex> lk(table_->mu);
    BeatSlot* s = find_or_add_beat(service);
    return s ? ++s->errors : 0;
}

std::optional<HeartbeatRecord> StatsStore::heartbeat(std::string_view service) const {
    if (!table_) return std::nullopt;
    std::lock_guard<ShmMutex> lk(table_->mu);
    const BeatSlot* s = find_beat(service);
    if (!s) return std::nullopt;
    return to_record(*s);
}

std::vector<HeartbeatRecord> StatsStore::heartbeats() const {
    std::vector<HeartbeatRecord> out;
    if (!table_) return out;
    std::lock_guard<ShmMutex> lk(table_->mu);
    for (const auto& s : table_->beats) {
        if (s.in_use) out.push_back(to_record(s));
    }
    return out;
}

//------------------------------- Counters -------------------------------------

Result<std::int64_t> StatsStore::increment(std::string_view key, std::int64_t delta) {
    if (!table_) return make_error(ErrorCode::InvalidArgument, "stats store not initialized");
    if (key.empty() || key.size() > Limits::MaxCounterKeyLen) {
        return make_error(ErrorCode::InvalidArgument, "counter key length out of range");
    }

    std::lock_guard<ShmMutex> lk(table_->mu);
    CounterSlot* free_slot = nullptr;
    for (auto& c : table_->counters) {
        if (c.in_use && view_of(c.key) == key) {
            c.value += delta;
            return c.value;
        }
        if (!c.in_use && !free_slot) free_slot = &c;
    }
    if (!free_slot) {
        return make_error(ErrorCode::Capacity,
                          "counter table full (" + std::to_string(Limits::MaxCounters) + ")");
    }
    store_name(free_slot->key, key);
    free_slot->in_use = true;
    free_slot->value  = delta;
    return free_slot->value;
}

std::optional<std::int64_t> StatsStore::counter(std::string_view key) const {
    if (!table_) return std::nullopt;
    std::lock_guard<ShmMutex> lk(table_->mu);
    for (const auto& c : table_->counters) {
        if (c.in_use && view_of(c.key) == key) return c.value;
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::int64_t>> StatsStore::counters() const {
    std::vector<std::pair<std::string, std::int64_t>> out;
    if (!table_) return out;
    std::lock_guard<ShmMutex> lk(table_->mu);
    for (const auto& c : table_->counters) {
        if (c.in_use) out.emplace_back(std::string(view_of(c.key)), c.value);
    }
    return out;
}

void StatsStore::clear() noexcept {
    if (!table_) return;
    std::lock_guard<ShmMutex> lk(table_->mu);
    for (auto& s : table_->beats) s = BeatSlot{};
    for (auto& c : table_->counters) c = CounterSlot{};
}

} // namespace warden::ipc
