#pragma once
/**
 * @file shared_arena.hpp
 * @brief One anonymous MAP_SHARED mapping, carved with a bump allocator.
 *
 * Design goals:
 *  - Created once by the supervisor, before any unit is forked, so every
 *    child inherits the same mapping at the same address.
 *  - Allocation is setup-time only (not thread-safe, never freed piecemeal).
 *  - Pages are committed lazily (MAP_NORESERVE); unused slots cost nothing.
 */

#include <cstddef>
#include <new>
#include <utility>

#include "warden/core/error.hpp"

namespace warden::ipc {

class SharedArena final {
public:
    SharedArena() noexcept = default;

    /**
     * @brief Factory: maps `bytes` of shared anonymous memory.
     * @return the arena, or SystemError when mmap fails / InvalidArgument for zero size.
     */
    static Result<SharedArena> create(std::size_t bytes) noexcept;

    SharedArena(const SharedArena&)            = delete;
    SharedArena& operator=(const SharedArena&) = delete;
    SharedArena(SharedArena&& other) noexcept { move_from(std::move(other)); }
    SharedArena& operator=(SharedArena&& other) noexcept {
        if (this != &other) { release(); move_from(std::move(other)); }
        return *this;
    }
    ~SharedArena() { release(); }

    /// Carve `count` default-constructed objects of T. Capacity error when exhausted.
    template <class T>
    Result<T*> allocate(std::size_t count = 1) noexcept {
        auto raw = allocate_bytes(sizeof(T) * count, alignof(T));
        if (!raw) return make_error(raw.error().code, raw.error().detail);
        T* first = reinterpret_cast<T*>(*raw);
        for (std::size_t i = 0; i < count; ++i) ::new (static_cast<void*>(first + i)) T();
        return first;
    }

    /// Carve raw, zero-filled bytes with the given alignment.
    Result<std::byte*> allocate_bytes(std::size_t n, std::size_t align) noexcept;

    std::size_t size() const noexcept { return size_; }
    std::size_t used() const noexcept { return used_; }
    bool valid() const noexcept { return base_ != nullptr; }

private:
    void release() noexcept;
    void move_from(SharedArena&& other) noexcept {
        base_ = std::exchange(other.base_, nullptr);
        size_ = std::exchange(other.size_, 0);
        used_ = std::exchange(other.used_, 0);
    }

    std::byte*  base_ = nullptr;
    std::size_t size_ = 0;
    std::size_t used_ = 0;
};

} // namespace warden::ipc
