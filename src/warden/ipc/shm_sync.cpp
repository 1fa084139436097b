/**
 * @file shm_sync.cpp
 * @brief pthread-backed ShmMutex / ShmCondition.
 */
#include "warden/ipc/shm_sync.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>

#include "warden/obs/observability.hpp"

namespace warden::ipc {

namespace {

std::string errno_text(int rc) {
    return std::string(std::strerror(rc));
}

timespec to_timespec(std::chrono::steady_clock::time_point tp) noexcept {
    using namespace std::chrono;
    const auto ns = duration_cast<nanoseconds>(tp.time_since_epoch()).count();
    timespec ts{};
    ts.tv_sec  = static_cast<time_t>(ns / 1'000'000'000);
    ts.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    return ts;
}

} // namespace

//------------------------------- ShmMutex -------------------------------------

Result<void> ShmMutex::init() noexcept {
    pthread_mutexattr_t attr;
    int rc = pthread_mutexattr_init(&attr);
    if (rc != 0) return make_error(ErrorCode::SystemError, "pthread_mutexattr_init: " + errno_text(rc));

    rc = pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    if (rc == 0) rc = pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
    if (rc == 0) rc = pthread_mutex_init(&m_, &attr);
    pthread_mutexattr_destroy(&attr);

    if (rc != 0) return make_error(ErrorCode::SystemError, "pthread_mutex_init: " + errno_text(rc));
    return {};
}

void ShmMutex::lock() noexcept {
    const int rc = pthread_mutex_lock(&m_);
    if (rc == EOWNERDEAD) {
        recover();
    } else if (rc != 0) {
        obs::log().critical("shm mutex lock failed: {}", errno_text(rc));
    }
}

void ShmMutex::unlock() noexcept {
    pthread_mutex_unlock(&m_);
}

void ShmMutex::recover() noexcept {
    obs::log().warn("shm mutex owner died inside critical section; marking consistent");
    pthread_mutex_consistent(&m_);
}

//------------------------------- ShmCondition ---------------------------------

Result<void> ShmCondition::init() noexcept {
    pthread_condattr_t attr;
    int rc = pthread_condattr_init(&attr);
    if (rc != 0) return make_error(ErrorCode::SystemError, "pthread_condattr_init: " + errno_text(rc));

    rc = pthread_condattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    if (rc == 0) rc = pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    if (rc == 0) rc = pthread_cond_init(&c_, &attr);
    pthread_condattr_destroy(&attr);

    if (rc != 0) return make_error(ErrorCode::SystemError, "pthread_cond_init: " + errno_text(rc));
    return {};
}

void ShmCondition::notify_one() noexcept { pthread_cond_signal(&c_); }

void ShmCondition::notify_all() noexcept { pthread_cond_broadcast(&c_); }

void ShmCondition::wait(ShmMutex& m) noexcept {
    if (pthread_cond_wait(&c_, m.native()) == EOWNERDEAD) m.recover();
}

bool ShmCondition::wait_until(ShmMutex& m, std::chrono::steady_clock::time_point deadline) noexcept {
    const timespec ts = to_timespec(deadline);
    const int rc = pthread_cond_timedwait(&c_, m.native(), &ts);
    if (rc == EOWNERDEAD) {
        m.recover();
        return true;
    }
    return rc != ETIMEDOUT;
}

} // namespace warden::ipc
