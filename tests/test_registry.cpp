/**
 * @file test_registry.cpp
 * @brief Tests for ServiceRegistry RCU semantics and the lifecycle state machine.
 *
 * Validates:
 *  - register / get / list / deregister behavior
 *  - duplicate live registrations are rejected without publishing
 *  - DEAD/STOPPED entries are replaced by a fresh registration
 *  - allowed and refused status transitions
 *  - unit assignment only while STARTING, monotonic restart counter
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string_view>
#include <thread>

#include "warden/runtime/service_registry.hpp"

using warden::ErrorCode;
using warden::runtime::ServiceDescriptor;
using warden::runtime::ServiceRegistry;
using warden::runtime::ServiceStatus;
using warden::runtime::transition_allowed;

static ServiceDescriptor starting(std::string name) {
  ServiceDescriptor d;
  d.name = std::move(name);
  d.status = ServiceStatus::Starting;
  return d;
}

// --------------------------- Basic construction ----------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Fresh registry publishes a valid empty snapshot.
 */
TEST(ServiceRegistry, Registry_Construct_Empty) {
  ServiceRegistry reg;
  auto snap = reg.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_TRUE(reg.list().empty());
}

// --------------------------- Register / Get --------------------------------

/**
 * @test Registry_Register_Then_Get
 * @brief A registered name is returned by get() and visible via heterogeneous find.
 */
TEST(ServiceRegistry, Registry_Register_Then_Get) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("users")));

  auto d = reg.get("users");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->name, "users");
  EXPECT_TRUE(d->status == ServiceStatus::Starting || d->status == ServiceStatus::Running);
  EXPECT_EQ(d->restart_count, 0u);

  auto snap = reg.snapshot();
  EXPECT_NE(snap->find(std::string_view{"users"}), snap->end());
  EXPECT_EQ(reg.version(), 1u);
}

/**
 * @test Registry_Get_Missing
 * @brief get() on an unknown name reports NotFound.
 */
TEST(ServiceRegistry, Registry_Get_Missing) {
  ServiceRegistry reg;
  auto d = reg.get("ghost");
  ASSERT_FALSE(d);
  EXPECT_EQ(d.error().code, ErrorCode::NotFound);
}

/**
 * @test Registry_Duplicate_Live_Rejected
 * @brief Re-registering a live name fails and leaves the snapshot untouched.
 */
TEST(ServiceRegistry, Registry_Duplicate_Live_Rejected) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("orders")));
  ASSERT_TRUE(reg.update_status("orders", ServiceStatus::Running));
  ASSERT_TRUE(reg.set_last_error("orders", "marker"));

  const auto before  = reg.snapshot();
  const auto version = reg.version();

  auto again = reg.register_service(starting("orders"));
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code, ErrorCode::DuplicateService);

  EXPECT_EQ(reg.snapshot(), before);   // same published pointer
  EXPECT_EQ(reg.version(), version);
  EXPECT_EQ(reg.get("orders")->status, ServiceStatus::Running);
  EXPECT_EQ(reg.get("orders")->last_error, "marker");
  EXPECT_EQ(reg.stats().failures, 1u);
}

/**
 * @test Registry_Replace_Dead_Or_Stopped
 * @brief A DEAD or STOPPED entry is replaced by a fresh registration.
 */
TEST(ServiceRegistry, Registry_Replace_Dead_Or_Stopped) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("svc")));
  ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Dead));
  ASSERT_TRUE(reg.increment_restart_count("svc"));

  ASSERT_TRUE(reg.register_service(starting("svc")));
  EXPECT_EQ(reg.get("svc")->status, ServiceStatus::Starting);
  EXPECT_EQ(reg.get("svc")->restart_count, 0u);

  ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Stopped));
  EXPECT_TRUE(reg.register_service(starting("svc")));
}

/**
 * @test Registry_Invalid_Names
 * @brief Names outside [A-Za-z0-9_-]{1,31} are rejected; one character is enough.
 */
TEST(ServiceRegistry, Registry_Invalid_Names) {
  ServiceRegistry reg;
  for (const char* bad : {"", "has space", "semi;colon", "client:gw",
                          "a_name_that_is_far_too_long_for_it"}) {
    auto r = reg.register_service(starting(bad));
    ASSERT_FALSE(r) << bad;
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  }
  EXPECT_TRUE(reg.register_service(starting("ok-name_2")));
  EXPECT_TRUE(reg.register_service(starting("A")));
  EXPECT_EQ(reg.size(), 2u);
}

// --------------------------- Deregister ------------------------------------

/**
 * @test Registry_Deregister_Idempotent
 * @brief Deregistering twice is harmless; the second call reports nothing erased.
 */
TEST(ServiceRegistry, Registry_Deregister_Idempotent) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("ping")));
  EXPECT_TRUE(reg.deregister("ping"));
  EXPECT_FALSE(reg.deregister("ping"));
  EXPECT_FALSE(reg.deregister("never"));
  EXPECT_FALSE(reg.contains("ping"));
}

/**
 * @test Registry_List_Is_Sorted_Copy
 * @brief list() returns a detached, name-ordered copy.
 */
TEST(ServiceRegistry, Registry_List_Is_Sorted_Copy) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("zeta")));
  ASSERT_TRUE(reg.register_service(starting("auth")));

  auto l = reg.list();
  ASSERT_EQ(l.size(), 2u);
  EXPECT_EQ(l[0].name, "auth");
  EXPECT_EQ(l[1].name, "zeta");

  ASSERT_TRUE(reg.update_status("auth", ServiceStatus::Running));
  EXPECT_EQ(l[0].status, ServiceStatus::Starting); // copy unaffected
}

// --------------------------- State machine ---------------------------------

/**
 * @test StateMachine_Table
 * @brief Exactly the documented edges are allowed.
 */
TEST(ServiceRegistry, StateMachine_Table) {
  using S = ServiceStatus;
  const S all[] = {S::Starting, S::Running, S::Degraded, S::Dead, S::Stopped};
  auto allowed = [](S f, S t) {
    switch (f) {
      case S::Starting: return t == S::Running || t == S::Dead || t == S::Stopped;
      case S::Running:  return t == S::Degraded || t == S::Dead || t == S::Stopped;
      case S::Degraded: return t == S::Running || t == S::Dead || t == S::Stopped;
      case S::Dead:     return t == S::Starting || t == S::Stopped;
      case S::Stopped:  return false;
    }
    return false;
  };
  for (S f : all)
    for (S t : all)
      EXPECT_EQ(transition_allowed(f, t), allowed(f, t))
          << to_string(f) << " -> " << to_string(t);
}

/**
 * @test UpdateStatus_Enforced
 * @brief Refused transitions report InvalidTransition; same-state is a no-op.
 */
TEST(ServiceRegistry, UpdateStatus_Enforced) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("svc")));

  auto bad = reg.update_status("svc", ServiceStatus::Degraded);   // STARTING -> DEGRADED
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::InvalidTransition);

  auto prev = reg.update_status("svc", ServiceStatus::Running);
  ASSERT_TRUE(prev);
  EXPECT_EQ(*prev, ServiceStatus::Starting);

  const auto v = reg.version();
  auto same = reg.update_status("svc", ServiceStatus::Running);
  ASSERT_TRUE(same);
  EXPECT_EQ(*same, ServiceStatus::Running);
  EXPECT_EQ(reg.version(), v);

  ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Stopped));
  auto after_stop = reg.update_status("svc", ServiceStatus::Starting);
  ASSERT_FALSE(after_stop);
  EXPECT_EQ(after_stop.error().code, ErrorCode::InvalidTransition);

  auto missing = reg.update_status("nope", ServiceStatus::Running);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

/**
 * @test AssignUnit_Only_While_Starting
 * @brief The execution handle can only change while STARTING.
 */
TEST(ServiceRegistry, AssignUnit_Only_While_Starting) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("svc")));
  ASSERT_TRUE(reg.assign_unit("svc", 4242, 3));
  EXPECT_EQ(reg.get("svc")->pid, 4242);
  EXPECT_EQ(reg.get("svc")->endpoint, 3u);

  ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Running));
  auto r = reg.assign_unit("svc", 9999, 4);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);
  EXPECT_EQ(reg.get("svc")->pid, 4242);
}

/**
 * @test RestartCount_Monotonic
 * @brief increment_restart_count only goes up and survives status changes.
 */
TEST(ServiceRegistry, RestartCount_Monotonic) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("svc")));
  for (std::uint32_t i = 1; i <= 3; ++i) {
    ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Dead));
    auto n = reg.increment_restart_count("svc");
    ASSERT_TRUE(n);
    EXPECT_EQ(*n, i);
    ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Starting));
  }
  EXPECT_EQ(reg.get("svc")->restart_count, 3u);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Registry_Concurrency_1W_MR
 * @brief One writer flips status; readers only ever see published states.
 */
TEST(ServiceRegistry, Registry_Concurrency_1W_MR) {
  ServiceRegistry reg;
  ASSERT_TRUE(reg.register_service(starting("svc")));
  ASSERT_TRUE(reg.update_status("svc", ServiceStatus::Running));

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 4000; ++i) {
      (void)reg.update_status("svc", (i & 1) == 0 ? ServiceStatus::Degraded : ServiceStatus::Running);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto d = reg.get("svc");
      if (!d) { ADD_FAILURE() << "entry vanished"; break; }
      if (d->status == ServiceStatus::Running || d->status == ServiceStatus::Degraded) {
        ok_reads.fetch_add(1, std::memory_order_relaxed);
      } else {
        ADD_FAILURE() << "Observed invalid status: " << to_string(d->status);
        break;
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_GT(ok_reads.load(), 0);
}
