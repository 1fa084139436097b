// apps/warden_call/src/main.cpp
// Warden — warden_call
// Purpose: probe a service round trip (REQUEST -> RESPONSE) through the
// supervisor, the way a gateway would, and print per-call latency.
// This is NOT the orchestrator — it's a demo/testing utility. It starts its
// own in-process supervisor with the ping unit.
//
// Usage:
//   ./warden_call [action] [count]      (default: ping 5)

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "demo_services.hpp"
#include "warden/obs/observability.hpp"
#include "warden/runtime/supervisor.hpp"

static int probe(warden::runtime::Supervisor& sup, const std::string& action, int count) {
    using clock = std::chrono::steady_clock;
    std::vector<double> rtts;
    int failures = 0;

    for (int i = 0; i < count; ++i) {
        const auto t0 = clock::now();
        auto r = sup.dispatch_call("warden_call", warden::demo::kPing, action,
                                   warden::ipc::Payload{{"seq", static_cast<std::int64_t>(i)}});
        const double us = std::chrono::duration<double, std::micro>(clock::now() - t0).count();

        if (r) {
            rtts.push_back(us);
            std::cout << "CALL ping." << action << " seq=" << i << " rtt=" << us << " us "
                      << warden::ipc::to_string(*r) << std::endl;
        } else {
            ++failures;
            std::cout << "CALL ping." << action << " seq=" << i << " failed: "
                      << warden::to_string(r.error().code) << " " << r.error().detail << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!rtts.empty()) {
        std::sort(rtts.begin(), rtts.end());
        double sum = 0;
        for (double v : rtts) sum += v;
        std::cout << "rtt min/avg/max = " << rtts.front() << "/" << sum / rtts.size() << "/"
                  << rtts.back() << " us, " << failures << " failed" << std::endl;
    }
    return failures == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
    const std::string action = (argc > 1) ? argv[1] : "ping";
    const int count = (argc > 2) ? std::stoi(argv[2]) : 5;

    warden::obs::set_log_level("warn");
    std::cout << "Warden — warden_call starting" << std::endl;
    std::cout << "Target: ping." << action << ", count: " << count << std::endl;

    auto sup = warden::runtime::Supervisor::create(warden::runtime::SupervisorConfig{});
    if (!sup) {
        std::cerr << "supervisor: " << sup.error().detail << std::endl;
        return 1;
    }
    if (auto r = (*sup)->start_service(warden::demo::kPing, warden::demo::ping_service()); !r) {
        std::cerr << "start ping: " << r.error().detail << std::endl;
        return 1;
    }

    const int rc = probe(**sup, action, count);
    (*sup)->stop_all();
    std::cout << "warden_call finished" << std::endl;
    return rc;
}
