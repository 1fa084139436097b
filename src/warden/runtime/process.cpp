/**
 * @file process.cpp
 * @brief fork/waitpid plumbing for execution units.
 */
#include "warden/runtime/process.hpp"

#include <cerrno>
#include <csignal>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <exception>
#include <future>
#include <thread>

#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "warden/config/constants.hpp"
#include "warden/obs/observability.hpp"

namespace warden::runtime {

namespace {

[[noreturn]] void run_child(const ProcessHandle::Body& body, std::string_view name, pid_t parent) {
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() != parent) ::_exit(1); // parent already gone
    const std::string comm(name.substr(0, 15));
    ::prctl(PR_SET_NAME, comm.c_str());
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGINT, SIG_IGN);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_IGN);

    obs::reinit_for_child(name);

    int rc = 1;
    try {
        rc = body();
    } catch (const std::exception& e) {
        obs::log().error("unit '{}' terminated by exception: {}", name, e.what());
        rc = 1;
    } catch (...) {
        obs::log().error("unit '{}' terminated by unknown exception", name);
        rc = 1;
    }
    obs::log().flush();
    ::_exit(rc);
}

/**
 * PR_SET_PDEATHSIG fires when the forking *thread* exits, not the process.
 * Every fork therefore runs on this one thread, which lives until process
 * exit, so a unit started from a short-lived thread (the health monitor)
 * survives that thread.
 */
class Launcher final {
public:
    static Launcher& instance() {
        static Launcher launcher;
        return launcher;
    }

    Result<pid_t> fork_unit(const ProcessHandle::Body& body, std::string_view name) {
        Job job{&body, name, {}};
        auto done = job.result.get_future();
        {
            std::lock_guard<std::mutex> lk(mu_);
            jobs_.push_back(&job);
        }
        cv_.notify_one();
        return done.get();
    }

    Launcher(const Launcher&)            = delete;
    Launcher& operator=(const Launcher&) = delete;

private:
    struct Job {
        const ProcessHandle::Body*   body;
        std::string_view             name;
        std::promise<Result<pid_t>>  result;
    };

    Launcher() : thread_([this] { run(); }) {}

    ~Launcher() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_ = true;
        }
        cv_.notify_one();
        if (thread_.joinable()) thread_.join();
    }

    void run() {
        for (;;) {
            Job* job = nullptr;
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait(lk, [this] { return stop_ || !jobs_.empty(); });
                if (jobs_.empty()) return;
                job = jobs_.front();
                jobs_.pop_front();
            }
            // mu_ is released: the child must not inherit it locked.
            obs::log().flush();
            const pid_t parent = ::getpid();
            const pid_t pid = ::fork();
            if (pid == 0) run_child(*job->body, job->name, parent);
            if (pid < 0) {
                job->result.set_value(make_error(ErrorCode::SystemError,
                                                 std::string("fork failed: ") + std::strerror(errno)));
            } else {
                job->result.set_value(pid);
            }
        }
    }

    std::mutex              mu_;
    std::condition_variable cv_;
    std::deque<Job*>        jobs_;
    bool                    stop_{false};
    std::thread             thread_;
};

} // namespace

Result<std::shared_ptr<ProcessHandle>> ProcessHandle::spawn(Body body, std::string_view name) {
    if (!body) return make_error(ErrorCode::InvalidArgument, "empty unit body");

    auto pid = Launcher::instance().fork_unit(body, name);
    if (!pid) return make_error(pid.error().code, pid.error().detail);

    return std::shared_ptr<ProcessHandle>(new ProcessHandle(*pid, std::string(name)));
}

ProcessHandle::~ProcessHandle() {
    kill_and_reap();
}

bool ProcessHandle::reap_locked(bool block) noexcept {
    if (status_) return true;
    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &st, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        status_ = st;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere (or not our child): treat as gone.
        status_ = 0;
        return true;
    }
    return false;
}

bool ProcessHandle::is_alive() {
    std::lock_guard<std::mutex> lk(mu_);
    return !reap_locked(false);
}

Result<void> ProcessHandle::signal(int signo) {
    std::lock_guard<std::mutex> lk(mu_);
    if (reap_locked(false)) return {};
    if (::kill(pid_, signo) != 0 && errno != ESRCH) {
        return make_error(ErrorCode::SystemError,
                          "kill(" + std::to_string(pid_) + ", " + std::to_string(signo) +
                              ") failed: " + std::strerror(errno));
    }
    return {};
}

bool ProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto step = std::chrono::milliseconds(config::constants::SUPERVISOR_POLL_MS);
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (reap_locked(false)) return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(step);
    }
}

void ProcessHandle::kill_and_reap() noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    if (reap_locked(false)) return;
    ::kill(pid_, SIGKILL);
    reap_locked(true);
}

std::optional<int> ProcessHandle::exit_status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

std::string ProcessHandle::describe_exit() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!status_) return "running";
    const int st = *status_;
    if (WIFEXITED(st)) return "exited with status " + std::to_string(WEXITSTATUS(st));
    if (WIFSIGNALED(st)) {
        const int sig = WTERMSIG(st);
        const char* desc = ::strsignal(sig);
        return "killed by signal " + std::to_string(sig) + " (" + (desc ? desc : "?") + ")";
    }
    return "terminated (status " + std::to_string(st) + ")";
}

} // namespace warden::runtime
