/**
 * @file main.cpp
 * @brief wardend: orchestrator process for the demo services.
 *
 * **Bootstrap**
 * - Load settings (argv[1], optional); create the Supervisor (arena, directory, stats).
 * - Start ping, users, orders, notifications; start the HealthMonitor.
 *
 * **Run**
 * - Demo call sequence, then a status report every APP_STATUS_PERIOD_MS.
 *
 * **Shutdown**
 * - SIGINT/SIGTERM: stop the monitor first, then every unit gracefully.
 *
 * Usage: wardend [settings.txtpb]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include "demo_services.hpp"
#include "warden/config/config_loader.hpp"
#include "warden/config/constants.hpp"
#include "warden/obs/observability.hpp"
#include "warden/runtime/health_monitor.hpp"
#include "warden/runtime/supervisor.hpp"
#include "warden/version.hpp"

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

std::string status_table(const std::vector<warden::runtime::ServiceReport>& reports) {
    std::ostringstream os;
    os << std::left << std::setw(10) << "SERVICE" << std::setw(10) << "STATUS" << std::setw(9) << "PID"
       << std::setw(10) << "RESTARTS" << std::setw(10) << "REQUESTS" << std::setw(8) << "ERRORS"
       << std::setw(10) << "HB_AGE" << "LAST_ERROR\n";
    for (const auto& r : reports) {
        const auto& d = r.descriptor;
        os << std::left << std::setw(10) << d.name << std::setw(10) << warden::runtime::to_string(d.status)
           << std::setw(9) << d.pid << std::setw(10) << d.restart_count << std::setw(10) << r.requests
           << std::setw(8) << r.errors
           << std::setw(10) << (r.heartbeat_age ? std::to_string(r.heartbeat_age->count()) + "ms" : "-")
           << (d.last_error.empty() ? "-" : d.last_error) << '\n';
    }
    return os.str();
}

void show(const char* what, const warden::Result<warden::ipc::Payload>& r) {
    if (r) {
        std::cout << "  " << what << " -> " << warden::ipc::to_string(*r) << '\n';
    } else {
        std::cout << "  " << what << " -> " << warden::to_string(r.error().code) << ": "
                  << r.error().detail << '\n';
    }
}

void demo_calls(warden::runtime::Supervisor& sup) {
    using warden::ipc::Payload;
    constexpr const char* gw = "gateway";
    std::cout << "demo calls:\n";
    show("ping.ping", sup.dispatch_call(gw, warden::demo::kPing, "ping", {}));
    show("users.create_user(alice)",
         sup.dispatch_call(gw, warden::demo::kUsers, "create_user",
                           Payload{{"username", std::string("alice")}, {"email", std::string("alice@example.com")}}));
    show("users.create_user(alice) again",
         sup.dispatch_call(gw, warden::demo::kUsers, "create_user",
                           Payload{{"username", std::string("alice")}, {"email", std::string("a2@example.com")}}));
    show("orders.create_order(user 1)",
         sup.dispatch_call(gw, warden::demo::kOrders, "create_order",
                           Payload{{"user_id", std::int64_t{1}}, {"product", std::string("widget")},
                                   {"quantity", std::int64_t{3}}}));
    show("orders.create_order(user 42)",
         sup.dispatch_call(gw, warden::demo::kOrders, "create_order",
                           Payload{{"user_id", std::int64_t{42}}, {"product", std::string("widget")}}));
    show("orders.list_orders", sup.dispatch_call(gw, warden::demo::kOrders, "list_orders", {}));
    show("notifications.send_notification(user 1)",
         sup.dispatch_call(gw, warden::demo::kNotifications, "send_notification",
                           Payload{{"user_id", std::int64_t{1}},
                                   {"message", std::string("Your order has been created")},
                                   {"type", std::string("sms")}}));
    show("notifications.get_stats", sup.dispatch_call(gw, warden::demo::kNotifications, "get_stats", {}));
    show("users.frobnicate", sup.dispatch_call(gw, warden::demo::kUsers, "frobnicate", {}));
}

} // namespace

int main(int argc, char** argv) {
    namespace rt = warden::runtime;
    auto& log = warden::obs::log();

    const std::string path = (argc > 1) ? argv[1] : "";
    auto settings = warden::config::Loader::load_from_file(path);
    if (!settings) {
        std::cerr << "wardend: " << settings.error().detail << '\n';
        return 2;
    }
    warden::obs::set_log_level(settings->log_level);
    log.info("wardend {} starting ({})", warden::version_string,
             path.empty() ? "default settings" : path);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto sup = rt::Supervisor::create(settings->supervisor);
    if (!sup) {
        log.critical("supervisor: {}", sup.error().detail);
        return 1;
    }
    rt::Supervisor& supervisor = **sup;

    const std::pair<const char*, rt::Entrypoint> services[] = {
        {warden::demo::kPing,   warden::demo::ping_service()},
        {warden::demo::kUsers,  warden::demo::user_service()},
        {warden::demo::kOrders, warden::demo::order_service()},
        {warden::demo::kNotifications, warden::demo::notification_service()},
    };
    for (const auto& [name, entry] : services) {
        if (auto r = supervisor.start_service(name, entry); !r) {
            log.critical("cannot start '{}': {} ({})", name, warden::to_string(r.error().code),
                         r.error().detail);
            return 1;
        }
    }

    rt::HealthMonitor monitor(supervisor, settings->monitor);
    monitor.start();

    std::cout << status_table(supervisor.list_services()) << std::flush;
    demo_calls(supervisor);
    std::cout << "running; Ctrl-C to stop\n" << std::flush;

    const auto period = std::chrono::milliseconds(warden::config::constants::APP_STATUS_PERIOD_MS);
    auto next_report = std::chrono::steady_clock::now() + period;
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() >= next_report) {
            log.info("status\n{}", status_table(supervisor.list_services()));
            next_report += period;
        }
    }

    log.info("shutdown requested");
    monitor.stop();
    supervisor.stop_all();

    const auto c = supervisor.observer().snapshot();
    log.info("lifecycle: starts={} stops={} restarts={} deaths={} refusals={} call_timeouts={} call_failures={}",
             c.starts, c.stops, c.restarts, c.deaths, c.restart_refusals, c.call_timeouts, c.call_failures);
    return 0;
}
