/**
 * @file health_monitor.cpp
 * @brief Classification rules and the monitor thread.
 */
#include "warden/runtime/health_monitor.hpp"

#include <string>

#include "warden/obs/observability.hpp"

namespace warden::runtime {

const char* to_string(Verdict v) noexcept {
    switch (v) {
        case Verdict::Healthy: return "healthy";
        case Verdict::Slow:    return "slow";
        case Verdict::Dead:    return "dead";
    }
    return "unknown";
}

Verdict classify(bool alive, std::optional<std::chrono::steady_clock::time_point> last_beat,
                 std::chrono::steady_clock::time_point now, const MonitorConfig& cfg) noexcept {
    using namespace std::chrono;
    if (!alive || !last_beat) return Verdict::Dead;
    const auto age = duration_cast<milliseconds>(now - *last_beat).count();
    if (age > static_cast<long long>(cfg.dead_after_ms)) return Verdict::Dead;
    if (age > static_cast<long long>(cfg.slow_after_ms)) return Verdict::Slow;
    return Verdict::Healthy;
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (worker_.joinable()) return;
    stop_requested_ = false;
    worker_ = std::thread([this] { loop(); });
    obs::log().info("health monitor started (interval {} ms, slow {} ms, dead {} ms, auto_restart {})",
                    cfg_.check_interval_ms, cfg_.slow_after_ms, cfg_.dead_after_ms, cfg_.auto_restart);
}

void HealthMonitor::stop() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!worker_.joinable()) return;
        stop_requested_ = true;
        t = std::move(worker_);
    }
    cv_.notify_all();
    t.join();
    obs::log().info("health monitor stopped");
}

bool HealthMonitor::running() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return worker_.joinable() && !stop_requested_;
}

void HealthMonitor::loop() {
    const auto period = std::chrono::milliseconds(cfg_.check_interval_ms);
    std::unique_lock<std::mutex> lk(mu_);
    while (!cv_.wait_for(lk, period, [this] { return stop_requested_; })) {
        lk.unlock();
        check_once();
        lk.lock();
    }
}

CycleReport HealthMonitor::check_once() {
    return check_once(std::chrono::steady_clock::now());
}

CycleReport HealthMonitor::check_once(std::chrono::steady_clock::time_point now) {
    CycleReport rep;
    for (const auto& d : ctl_.services()) {
        if (d.status != ServiceStatus::Running && d.status != ServiceStatus::Degraded) continue;
        ++rep.checked;

        const bool alive = ctl_.unit_alive(d);
        const auto last  = ctl_.last_heartbeat(d.name);
        const Verdict v  = classify(alive, last, now, cfg_);
        const auto age_ms = last
            ? std::chrono::duration_cast<std::chrono::milliseconds>(now - *last).count()
            : -1;

        switch (v) {
            case Verdict::Healthy:
                if (d.status == ServiceStatus::Degraded) {
                    if (ctl_.mark(d.name, d.pid, ServiceStatus::Running, "heartbeat recovered")) ++rep.recovered;
                } else {
                    ++rep.healthy;
                }
                break;

            case Verdict::Slow:
                if (d.status == ServiceStatus::Running) {
                    const std::string why = "heartbeat age " + std::to_string(age_ms) + " ms > " +
                                            std::to_string(cfg_.slow_after_ms) + " ms";
                    if (ctl_.mark(d.name, d.pid, ServiceStatus::Degraded, why)) ++rep.degraded;
                } else {
                    ++rep.degraded;
                }
                break;

            case Verdict::Dead: {
                const std::string why = !alive ? std::string("unit process exited")
                    : !last ? std::string("no heartbeat recorded")
                            : "heartbeat age " + std::to_string(age_ms) + " ms > " +
                                  std::to_string(cfg_.dead_after_ms) + " ms";
                auto marked = ctl_.mark(d.name, d.pid, ServiceStatus::Dead, why);
                if (!marked) {
                    // Handle changed under us (restart/stop in flight): next cycle decides.
                    obs::log().debug("monitor: skip '{}': {}", d.name, marked.error().detail);
                    break;
                }
                ++rep.dead;
                if (!cfg_.auto_restart) break;
                if (auto r = ctl_.restart_service(d.name)) {
                    ++rep.restarted;
                } else {
                    ++rep.restart_failures;
                    obs::log().error("monitor: restart of '{}' failed: {} ({})", d.name,
                                     warden::to_string(r.error().code), r.error().detail);
                }
                break;
            }
        }
    }
    return rep;
}

} // namespace warden::runtime
