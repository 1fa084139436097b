/**
 * @file shared_arena.cpp
 * @brief mmap-backed SharedArena.
 */
#include "warden/ipc/shared_arena.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/mman.h>

namespace warden::ipc {

Result<SharedArena> SharedArena::create(std::size_t bytes) noexcept {
    if (bytes == 0) return make_error(ErrorCode::InvalidArgument, "arena size must be > 0");

    void* addr = mmap(nullptr, bytes, PROT_READ | PROT_WRITE,
                      MAP_SHARED | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (addr == MAP_FAILED) {
        return make_error(ErrorCode::SystemError,
                          "mmap(" + std::to_string(bytes) + "): " + std::strerror(errno));
    }

    SharedArena arena;
    arena.base_ = static_cast<std::byte*>(addr);
    arena.size_ = bytes;
    return arena;
}

Result<std::byte*> SharedArena::allocate_bytes(std::size_t n, std::size_t align) noexcept {
    if (!base_) return make_error(ErrorCode::InvalidArgument, "arena not mapped");
    if (align == 0 || (align & (align - 1)) != 0) {
        return make_error(ErrorCode::InvalidArgument, "alignment must be a power of two");
    }
    const std::size_t start = (used_ + align - 1) & ~(align - 1);
    if (start > size_ || n > size_ - start) {
        return make_error(ErrorCode::Capacity,
                          "arena exhausted: need " + std::to_string(n) + " bytes, " +
                          std::to_string(size_ - used_) + " left");
    }
    used_ = start + n;
    // Anonymous mappings are zero-filled by the kernel.
    return base_ + start;
}

void SharedArena::release() noexcept {
    if (base_) munmap(base_, size_);
    base_ = nullptr;
    size_ = 0;
    used_ = 0;
}

} // namespace warden::ipc
