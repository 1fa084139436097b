/**
 * @file test_health.cpp
 * @brief Tests for heartbeat classification and HealthMonitor cycles.
 *
 * The monitor is driven against a scripted ServiceController, so every cycle
 * is deterministic (explicit `now`, no processes).
 */
#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "warden/runtime/health_monitor.hpp"

using namespace std::chrono_literals;
using warden::ErrorCode;
using warden::Result;
using warden::runtime::CycleReport;
using warden::runtime::HealthMonitor;
using warden::runtime::MonitorConfig;
using warden::runtime::ServiceController;
using warden::runtime::ServiceDescriptor;
using warden::runtime::ServiceRegistry;
using warden::runtime::ServiceStatus;
using warden::runtime::Verdict;
using warden::runtime::classify;
using Clock = std::chrono::steady_clock;

namespace {

MonitorConfig test_cfg(bool auto_restart = true) {
  MonitorConfig c;
  c.check_interval_ms = 20;
  c.slow_after_ms = 200;
  c.dead_after_ms = 500;
  c.auto_restart = auto_restart;
  return c;
}

/// Scripted controller backed by a real registry.
class FakeController : public ServiceController {
public:
  void add(const std::string& name, pid_t pid, ServiceStatus status) {
    ServiceDescriptor d;
    d.name = name;
    d.pid = pid;
    ASSERT_TRUE(reg.register_service(d));
    if (status != ServiceStatus::Starting) ASSERT_TRUE(reg.update_status(name, status));
    alive[name] = true;
  }

  std::vector<ServiceDescriptor> services() const override { return reg.list(); }

  bool unit_alive(const ServiceDescriptor& d) override { return alive[d.name]; }

  std::optional<Clock::time_point> last_heartbeat(std::string_view name) const override {
    auto it = beats.find(std::string(name));
    if (it == beats.end()) return std::nullopt;
    return it->second;
  }

  Result<void> mark(std::string_view name, pid_t expected_pid, ServiceStatus status,
                    std::string_view reason) override {
    auto d = reg.get(name);
    if (!d) return warden::make_error(d.error().code, d.error().detail);
    if (d->pid != expected_pid) return warden::make_error(ErrorCode::InvalidTransition, "stale");
    auto r = reg.update_status(name, status);
    if (!r) return warden::make_error(r.error().code, r.error().detail);
    marks.push_back(std::string(name) + ":" + to_string(status) + ":" + std::string(reason));
    return {};
  }

  Result<ServiceDescriptor> restart_service(std::string_view name) override {
    restarts.push_back(std::string(name));
    auto d = reg.get(name);
    if (!d) return warden::make_error(d.error().code, d.error().detail);
    if (d->restart_count >= max_restarts) {
      return warden::make_error(ErrorCode::RestartLimitExceeded, "limit");
    }
    (void)reg.increment_restart_count(name);
    (void)reg.update_status(name, ServiceStatus::Starting);
    (void)reg.update_status(name, ServiceStatus::Running);
    alive[std::string(name)] = true;
    return reg.get(name);
  }

  ServiceRegistry reg;
  std::map<std::string, bool> alive;
  std::map<std::string, Clock::time_point> beats;
  std::vector<std::string> marks;
  std::vector<std::string> restarts;
  std::uint32_t max_restarts{3};
};

} // namespace

// ---------- classify ----------

TEST(Classify, Thresholds) {
  const auto cfg = test_cfg();
  const auto now = Clock::now();
  EXPECT_EQ(classify(true, now - 10ms, now, cfg), Verdict::Healthy);
  EXPECT_EQ(classify(true, now - 200ms, now, cfg), Verdict::Healthy);   // boundary: not above
  EXPECT_EQ(classify(true, now - 201ms, now, cfg), Verdict::Slow);
  EXPECT_EQ(classify(true, now - 500ms, now, cfg), Verdict::Slow);
  EXPECT_EQ(classify(true, now - 501ms, now, cfg), Verdict::Dead);
  EXPECT_EQ(classify(true, std::nullopt, now, cfg), Verdict::Dead);
  EXPECT_EQ(classify(false, now, now, cfg), Verdict::Dead);             // process gone wins
}

// ---------- check_once ----------

TEST(HealthMonitor, Heartbeat_Ageing_Drives_Status) {
  FakeController ctl;
  ctl.add("fresh", 100, ServiceStatus::Running);
  ctl.add("slow", 101, ServiceStatus::Running);
  ctl.add("stale", 102, ServiceStatus::Running);
  const auto now = Clock::now();
  ctl.beats["fresh"] = now - 50ms;
  ctl.beats["slow"]  = now - 300ms;
  ctl.beats["stale"] = now - 900ms;

  HealthMonitor mon(ctl, test_cfg(/*auto_restart=*/false));
  const CycleReport rep = mon.check_once(now);

  EXPECT_EQ(rep.checked, 3u);
  EXPECT_EQ(rep.healthy, 1u);
  EXPECT_EQ(rep.degraded, 1u);
  EXPECT_EQ(rep.dead, 1u);
  EXPECT_EQ(rep.restarted, 0u);
  EXPECT_EQ(ctl.reg.get("fresh")->status, ServiceStatus::Running);
  EXPECT_EQ(ctl.reg.get("slow")->status, ServiceStatus::Degraded);
  EXPECT_EQ(ctl.reg.get("stale")->status, ServiceStatus::Dead);
  EXPECT_TRUE(ctl.restarts.empty());
}

TEST(HealthMonitor, Degraded_Recovers_On_Fresh_Beat) {
  FakeController ctl;
  ctl.add("svc", 7, ServiceStatus::Running);
  auto now = Clock::now();
  ctl.beats["svc"] = now - 300ms;

  HealthMonitor mon(ctl, test_cfg());
  (void)mon.check_once(now);
  ASSERT_EQ(ctl.reg.get("svc")->status, ServiceStatus::Degraded);

  ctl.beats["svc"] = now;
  const auto rep = mon.check_once(now + 10ms);
  EXPECT_EQ(rep.recovered, 1u);
  EXPECT_EQ(ctl.reg.get("svc")->status, ServiceStatus::Running);
}

TEST(HealthMonitor, Dead_Process_Is_Restarted) {
  FakeController ctl;
  ctl.add("svc", 7, ServiceStatus::Running);
  const auto now = Clock::now();
  ctl.beats["svc"] = now;        // fresh beat, but the process is gone
  ctl.alive["svc"] = false;

  HealthMonitor mon(ctl, test_cfg(/*auto_restart=*/true));
  const auto rep = mon.check_once(now);
  EXPECT_EQ(rep.dead, 1u);
  EXPECT_EQ(rep.restarted, 1u);
  ASSERT_EQ(ctl.restarts.size(), 1u);
  ASSERT_FALSE(ctl.marks.empty());
  EXPECT_EQ(ctl.marks.front(), "svc:DEAD:unit process exited");
  EXPECT_EQ(ctl.reg.get("svc")->status, ServiceStatus::Running);
  EXPECT_EQ(ctl.reg.get("svc")->restart_count, 1u);
}

TEST(HealthMonitor, Refused_Restart_Leaves_Dead) {
  FakeController ctl;
  ctl.max_restarts = 0;
  ctl.add("svc", 7, ServiceStatus::Running);
  ctl.alive["svc"] = false;

  HealthMonitor mon(ctl, test_cfg(true));
  const auto rep = mon.check_once(Clock::now());
  EXPECT_EQ(rep.restart_failures, 1u);
  EXPECT_EQ(ctl.reg.get("svc")->status, ServiceStatus::Dead);

  // DEAD entries are not re-examined.
  const auto rep2 = mon.check_once(Clock::now());
  EXPECT_EQ(rep2.checked, 0u);
}

TEST(HealthMonitor, Skips_Starting_And_Stopped) {
  FakeController ctl;
  ctl.add("booting", 1, ServiceStatus::Starting);
  ctl.add("gone", 2, ServiceStatus::Stopped);
  ctl.alive["booting"] = false;
  ctl.alive["gone"] = false;

  HealthMonitor mon(ctl, test_cfg());
  const auto rep = mon.check_once(Clock::now());
  EXPECT_EQ(rep.checked, 0u);
  EXPECT_TRUE(ctl.marks.empty());
}

TEST(HealthMonitor, Thread_Runs_Cycles_And_Stops) {
  FakeController ctl;
  ctl.add("svc", 7, ServiceStatus::Running);
  ctl.beats["svc"] = Clock::now() - 10s;

  HealthMonitor mon(ctl, test_cfg(false));
  mon.start();
  EXPECT_TRUE(mon.running());
  const auto deadline = Clock::now() + 2s;
  while (Clock::now() < deadline) {
    auto d = ctl.reg.get("svc");
    if (d && d->status == ServiceStatus::Dead) break;
    std::this_thread::sleep_for(5ms);
  }
  mon.stop();
  mon.stop();   // idempotent
  EXPECT_FALSE(mon.running());
  EXPECT_EQ(ctl.reg.get("svc")->status, ServiceStatus::Dead);
}
