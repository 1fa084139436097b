#pragma once
/**
 * @file process.hpp
 * @brief Execution unit: one forked child process running a service body.
 *
 * Contract:
 *  - spawn() forks; the child runs `body` and _exit()s with its return value
 *    (1 if it throws). The child never returns into the caller's stack.
 *  - fork() runs on one process-wide launcher thread, so the child dies with
 *    the parent process (PR_SET_PDEATHSIG), not with the thread that called
 *    spawn(). A unit body must not spawn() units of its own.
 *  - The child ignores SIGINT, so a terminal ^C reaches only the orchestrator,
 *    which stops units in order.
 *  - A handle reaps its child exactly once. All members are thread-safe.
 *  - Destruction kills and reaps a still-running child (no zombies).
 */

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

#include "warden/core/error.hpp"

namespace warden::runtime {

class ProcessHandle final {
public:
    using Body = std::function<int()>;

    /// Fork a unit named `name` running `body`. SystemError when fork fails.
    static Result<std::shared_ptr<ProcessHandle>> spawn(Body body, std::string_view name);

    ProcessHandle(const ProcessHandle&)            = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ~ProcessHandle();

    pid_t pid() const noexcept { return pid_; }
    const std::string& name() const noexcept { return name_; }

    /// Non-blocking: reaps the child if it has exited.
    bool is_alive();

    /// Send a signal to a live child. No-op after reaping.
    Result<void> signal(int signo);

    /// Poll until the child exits or `timeout` elapses. @return true if it exited.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGKILL + blocking reap. Idempotent.
    void kill_and_reap() noexcept;

    /// Raw wait status once reaped.
    std::optional<int> exit_status() const;

    /// "running", "exited with status 0", "killed by signal 9 (Killed)".
    std::string describe_exit() const;

private:
    ProcessHandle(pid_t pid, std::string name) : pid_(pid), name_(std::move(name)) {}

    /// Caller holds mu_.
    bool reap_locked(bool block) noexcept;

    pid_t              pid_;
    std::string        name_;
    mutable std::mutex mu_;
    std::optional<int> status_;
};

} // namespace warden::runtime
