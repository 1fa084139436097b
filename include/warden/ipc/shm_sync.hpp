#pragma once
/**
 * @file shm_sync.hpp
 * @brief Process-shared, robust synchronization primitives for shared memory.
 *
 * Both types are meant to live *inside* a MAP_SHARED mapping and be initialized
 * in place exactly once, before any fork. After that every process that
 * inherited the mapping may use them.
 *
 * Robustness: if a unit dies while holding a ShmMutex, the next locker gets
 * EOWNERDEAD, marks the mutex consistent and carries on. A crashed service
 * never wedges the channels or the statistics table.
 */

#include <chrono>
#include <pthread.h>

#include "warden/core/error.hpp"

namespace warden::ipc {

/**
 * @brief Robust PTHREAD_PROCESS_SHARED mutex. Satisfies BasicLockable, so
 *        std::lock_guard / std::unique_lock work on it.
 */
class ShmMutex {
public:
    ShmMutex() noexcept = default;
    ShmMutex(const ShmMutex&)            = delete;
    ShmMutex& operator=(const ShmMutex&) = delete;

    /// In-place initialization (once, in the creating process).
    Result<void> init() noexcept;

    void lock() noexcept;
    void unlock() noexcept;

    pthread_mutex_t* native() noexcept { return &m_; }

    /// Recover the mutex after EOWNERDEAD (owner died inside the section).
    void recover() noexcept;

private:
    pthread_mutex_t m_{};
};

/**
 * @brief Process-shared condition variable on CLOCK_MONOTONIC.
 *        Deadlines are std::chrono::steady_clock time points (same clock on Linux).
 */
class ShmCondition {
public:
    ShmCondition() noexcept = default;
    ShmCondition(const ShmCondition&)            = delete;
    ShmCondition& operator=(const ShmCondition&) = delete;

    Result<void> init() noexcept;

    void notify_one() noexcept;
    void notify_all() noexcept;

    /// Wait with `m` held. Spurious wake-ups are possible; re-check the predicate.
    void wait(ShmMutex& m) noexcept;

    /// @return false once `deadline` has passed.
    bool wait_until(ShmMutex& m, std::chrono::steady_clock::time_point deadline) noexcept;

private:
    pthread_cond_t c_{};
};

} // namespace warden::ipc
