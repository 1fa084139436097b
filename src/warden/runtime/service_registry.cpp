// ServiceRegistry — RCU Implementation Notes
// Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
// Writers: lock writer_mu_, copy current map, mutate, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its ref.

#include "warden/runtime/service_registry.hpp"

#include <algorithm>
#include <memory>

#include "warden/config/constants.hpp"

namespace warden::runtime {

const char* to_string(ServiceStatus s) noexcept {
    switch (s) {
        case ServiceStatus::Starting: return "STARTING";
        case ServiceStatus::Running:  return "RUNNING";
        case ServiceStatus::Degraded: return "DEGRADED";
        case ServiceStatus::Dead:     return "DEAD";
        case ServiceStatus::Stopped:  return "STOPPED";
    }
    return "UNKNOWN";
}

bool transition_allowed(ServiceStatus from, ServiceStatus to) noexcept {
    using S = ServiceStatus;
    switch (from) {
        case S::Starting: return to == S::Running || to == S::Dead || to == S::Stopped;
        case S::Running:  return to == S::Degraded || to == S::Dead || to == S::Stopped;
        case S::Degraded: return to == S::Running || to == S::Dead || to == S::Stopped;
        case S::Dead:     return to == S::Starting || to == S::Stopped;
        case S::Stopped:  return false;
    }
    return false;
}

//------------------------------- Validation -----------------------------------

bool ServiceRegistry::validate_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > Limits::MaxNameLen) return false;
    for (char c : name) {
        const bool ok = (c == '_' || c == '-' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const ServiceRegistry::Map>
ServiceRegistry::snapshot() const noexcept {
    // Pairs with the RELEASE store in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

Result<ServiceDescriptor> ServiceRegistry::get(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->find(name);
    if (it == snap->end()) {
        return make_error(ErrorCode::NotFound, "service '" + std::string(name) + "' not registered");
    }
    return it->second; // copy
}

std::vector<ServiceDescriptor> ServiceRegistry::list() const {
    std::vector<ServiceDescriptor> out;
    auto snap = snapshot();
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.second);
    std::sort(out.begin(), out.end(),
              [](const ServiceDescriptor& a, const ServiceDescriptor& b) { return a.name < b.name; });
    return out;
}

bool ServiceRegistry::contains(std::string_view name) const noexcept {
    auto snap = snapshot();
    return snap->find(name) != snap->end();
}

std::size_t ServiceRegistry::size() const noexcept {
    return snapshot()->size();
}

ServiceRegistry::Stats ServiceRegistry::stats() const noexcept {
    return Stats{registrations_.load(std::memory_order_relaxed),
                 deregistrations_.load(std::memory_order_relaxed),
                 transitions_.load(std::memory_order_relaxed),
                 failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutation Core --------------------------------

void ServiceRegistry::publish(std::shared_ptr<Map> next) noexcept {
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

template <class Fn>
auto ServiceRegistry::mutate_entry(std::string_view name, Fn&& fn)
    -> decltype(fn(std::declval<ServiceDescriptor&>())) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    if (snap->find(name) == snap->end()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return make_error(ErrorCode::NotFound, "service '" + std::string(name) + "' not registered");
    }
    auto next = std::make_shared<Map>(*snap); // copy-on-write
    auto r = fn(next->find(name)->second);
    if (!r) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return r;
    }
    publish(std::move(next));
    return r;
}

Result<void> ServiceRegistry::register_service(ServiceDescriptor d) {
    if (!validate_name(d.name)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return make_error(ErrorCode::InvalidArgument, "invalid service name '" + d.name + "'");
    }

    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    auto it = snap->find(d.name);
    if (it != snap->end() && is_live(it->second.status)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return make_error(ErrorCode::DuplicateService,
                          "service '" + d.name + "' is " + to_string(it->second.status));
    }
    if (it == snap->end() && snap->size() >= Limits::MaxEndpoints) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return make_error(ErrorCode::Capacity, "registry full");
    }

    auto next = std::make_shared<Map>(*snap);
    std::string key = d.name;
    (*next)[key] = std::move(d);
    publish(std::move(next));
    registrations_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

bool ServiceRegistry::deregister(std::string_view name) noexcept {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    if (snap->find(name) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(next->find(name));
    publish(std::move(next));
    deregistrations_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

Result<ServiceStatus> ServiceRegistry::update_status(std::string_view name, ServiceStatus to) {
    // Same-state is answered from the snapshot without publishing.
    {
        auto snap = snapshot();
        auto it = snap->find(name);
        if (it != snap->end() && it->second.status == to) return to;
    }
    auto r = mutate_entry(name, [to](ServiceDescriptor& d) -> Result<ServiceStatus> {
        const ServiceStatus from = d.status;
        if (from == to) return from;
        if (!transition_allowed(from, to)) {
            return make_error(ErrorCode::InvalidTransition,
                              std::string(to_string(from)) + " -> " + to_string(to));
        }
        d.status = to;
        return from;
    });
    if (r) transitions_.fetch_add(1, std::memory_order_relaxed);
    return r;
}

Result<void> ServiceRegistry::assign_unit(std::string_view name, pid_t pid, ipc::EndpointId endpoint) {
    return mutate_entry(name, [pid, endpoint](ServiceDescriptor& d) -> Result<void> {
        if (d.status != ServiceStatus::Starting) {
            return make_error(ErrorCode::InvalidTransition,
                              std::string("unit can only be assigned while STARTING, entry is ") +
                                  to_string(d.status));
        }
        d.pid = pid;
        d.endpoint = endpoint;
        return {};
    });
}

Result<std::uint32_t> ServiceRegistry::increment_restart_count(std::string_view name) {
    return mutate_entry(name, [](ServiceDescriptor& d) -> Result<std::uint32_t> {
        return ++d.restart_count;
    });
}

Result<void> ServiceRegistry::set_last_error(std::string_view name, std::string text) {
    return mutate_entry(name, [&text](ServiceDescriptor& d) -> Result<void> {
        d.last_error = std::move(text);
        return {};
    });
}

Result<void> ServiceRegistry::touch_started(std::string_view name) {
    return mutate_entry(name, [](ServiceDescriptor& d) -> Result<void> {
        d.started_at = std::chrono::system_clock::now();
        return {};
    });
}

void ServiceRegistry::clear() noexcept {
    std::lock_guard<std::mutex> lk(writer_mu_);
    publish(std::make_shared<Map>());
}

} // namespace warden::runtime
