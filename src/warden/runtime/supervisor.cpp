/**
 * @file supervisor.cpp
 * @brief Unit lifecycle, call dispatch and introspection.
 */
#include "warden/runtime/supervisor.hpp"

#include <thread>

namespace warden::runtime {

namespace {

constexpr std::string_view kClientPrefix   = "client:";

bool is_pow2(uint32_t v) noexcept { return v >= 2 && (v & (v - 1)) == 0; }

// Bookkeeping writes whose failure must not abort the lifecycle step in progress.
template <class T>
void warn_on_failure(const Result<T>& r, std::string_view what, const std::string& name) {
    if (!r) obs::log().warn("{} of '{}' not recorded: {}", what, name, r.error().detail);
}

} // namespace

//------------------------------- Construction ---------------------------------

Result<std::unique_ptr<Supervisor>> Supervisor::create(SupervisorConfig cfg,
                                                       std::unique_ptr<obs::Observer> observer) {
    if (!is_pow2(cfg.inbox_capacity)) {
        return make_error(ErrorCode::InvalidArgument,
                          "inbox_capacity must be a power of two >= 2, got " +
                              std::to_string(cfg.inbox_capacity));
    }
    if (cfg.slot_bytes < 256) {
        return make_error(ErrorCode::InvalidArgument, "slot_bytes must be at least 256");
    }

    const std::size_t bytes = ipc::Directory::footprint(cfg.inbox_capacity, cfg.slot_bytes) +
                              sizeof(ipc::StatsTable) + 4096;
    auto arena = ipc::SharedArena::create(bytes);
    if (!arena) return make_error(arena.error().code, arena.error().detail);

    auto dir = ipc::Directory::create(*arena, cfg.inbox_capacity, cfg.slot_bytes);
    if (!dir) return make_error(dir.error().code, dir.error().detail);

    auto stats = ipc::StatsStore::create(*arena);
    if (!stats) return make_error(stats.error().code, stats.error().detail);

    if (!observer) observer = obs::make_simple_observer();

    obs::log().info("supervisor ready: arena {} KiB, {} endpoints x {} slots x {} B",
                    arena->size() / 1024, Limits::MaxEndpoints, cfg.inbox_capacity, cfg.slot_bytes);

    return std::unique_ptr<Supervisor>(new Supervisor(cfg, std::move(observer), std::move(*arena),
                                                      std::move(*dir), std::move(*stats)));
}

Supervisor::Supervisor(SupervisorConfig cfg, std::unique_ptr<obs::Observer> observer,
                       ipc::SharedArena arena, ipc::Directory dir, ipc::StatsStore stats)
    : cfg_(cfg),
      observer_(std::move(observer)),
      arena_(std::move(arena)),
      dir_(std::move(dir)),
      stats_(stats) {}

Supervisor::~Supervisor() {
    stop_all();
    std::lock_guard<std::mutex> lk(clients_mu_);
    clients_.clear();
    for (auto id : client_endpoints_) dir_.release(id);
    client_endpoints_.clear();
}

//------------------------------- Helpers --------------------------------------

void Supervisor::emit(obs::EventKind kind, const ServiceDescriptor& d, std::string detail) {
    observer_->record(obs::LifecycleEvent{d.name, kind, d.pid, d.restart_count, std::move(detail)});
}

std::shared_ptr<ProcessHandle> Supervisor::unit_of(std::string_view name) const {
    std::lock_guard<std::mutex> lk(units_mu_);
    auto it = units_.find(std::string(name));
    return it == units_.end() ? nullptr : it->second;
}

void Supervisor::retire_unit_locked(const std::string& name) noexcept {
    std::shared_ptr<ProcessHandle> unit;
    {
        std::lock_guard<std::mutex> lk(units_mu_);
        auto it = units_.find(name);
        if (it != units_.end()) {
            unit = std::move(it->second);
            units_.erase(it);
        }
    }
    if (unit) unit->kill_and_reap();
    if (auto ep = dir_.find(name, ipc::EndpointKind::Service)) dir_.release(*ep);
}

Result<ServiceDescriptor> Supervisor::launch_locked(const std::string& name, const Entrypoint& entry) {
    auto ep = dir_.acquire(name, ipc::EndpointKind::Service);
    if (!ep) return make_error(ep.error().code, ep.error().detail);

    if (auto r = stats_.reset_service(name); !r) {
        dir_.release(*ep);
        return make_error(r.error().code, r.error().detail);
    }

    // The child gets its own copies of the views; nothing of `this` crosses the fork.
    ProcessHandle::Body body = [name, id = *ep, dir = dir_, stats = stats_, entry,
                                hb = std::chrono::milliseconds(cfg_.heartbeat_interval_ms),
                                ct = std::chrono::milliseconds(cfg_.call_timeout_ms)]() mutable {
        ServiceContext ctx(name, id, dir, stats, hb, ct);
        return entry(ctx);
    };

    auto unit = ProcessHandle::spawn(std::move(body), name);
    if (!unit) {
        dir_.release(*ep);
        return make_error(ErrorCode::StartupError, unit.error().detail);
    }
    auto handle = *unit;
    dir_.set_owner(*ep, handle->pid());
    if (auto r = registry_.assign_unit(name, handle->pid(), *ep); !r) {
        handle->kill_and_reap();
        dir_.release(*ep);
        return make_error(r.error().code, r.error().detail);
    }
    warn_on_failure(registry_.touch_started(name), "start time", name);
    {
        std::lock_guard<std::mutex> lk(units_mu_);
        units_[name] = handle;
    }

    // Wait for the first heartbeat.
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(cfg_.startup_grace_ms);
    const auto step = std::chrono::milliseconds(config::constants::SUPERVISOR_POLL_MS);
    std::string failure;
    for (;;) {
        const auto hb = stats_.heartbeat(name);
        if (hb && hb->last_beat) break;
        if (!handle->is_alive()) {
            failure = "unit " + handle->describe_exit() + " before its first heartbeat";
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            failure = "no heartbeat within " + std::to_string(cfg_.startup_grace_ms) + " ms";
            break;
        }
        std::this_thread::sleep_for(step);
    }

    if (failure.empty()) {
        if (auto r = registry_.update_status(name, ServiceStatus::Running); !r) {
            failure = r.error().detail;
        }
    }
    if (!failure.empty()) {
        retire_unit_locked(name);
        return make_error(ErrorCode::StartupError, "'" + name + "': " + failure);
    }
    return registry_.get(name);
}

//------------------------------- Lifecycle ------------------------------------

Result<ServiceDescriptor> Supervisor::start_service(std::string_view name_sv, Entrypoint entry) {
    const std::string name(name_sv);
    if (!ServiceRegistry::validate_name(name)) {
        return make_error(ErrorCode::InvalidArgument,
                          "invalid service name '" + name + "' (allowed: [A-Za-z0-9_-], 1.." +
                              std::to_string(Limits::MaxNameLen) + " chars)");
    }
    if (!entry) return make_error(ErrorCode::InvalidArgument, "empty entrypoint for '" + name + "'");

    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    if (auto existing = registry_.get(name)) {
        if (is_live(existing->status)) {
            return make_error(ErrorCode::DuplicateService,
                              "service '" + name + "' is " + to_string(existing->status));
        }
        retire_unit_locked(name); // leftovers of a DEAD/STOPPED registration
    }

    ServiceDescriptor d;
    d.name       = name;
    d.status     = ServiceStatus::Starting;
    d.started_at = std::chrono::system_clock::now();
    if (auto r = registry_.register_service(d); !r) return make_error(r.error().code, r.error().detail);
    {
        std::lock_guard<std::mutex> ulk(units_mu_);
        entrypoints_[name] = entry;
    }

    auto launched = launch_locked(name, entry);
    if (!launched) {
        registry_.deregister(name);
        stats_.forget_service(name);
        {
            std::lock_guard<std::mutex> ulk(units_mu_);
            entrypoints_.erase(name);
        }
        obs::log().error("start of '{}' failed: {}", name, launched.error().detail);
        return launched;
    }
    emit(obs::EventKind::Started, *launched, "started");
    return launched;
}

Result<void> Supervisor::stop_service(std::string_view name_sv, bool graceful) {
    const std::string name(name_sv);
    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    auto d = registry_.get(name);
    if (!d) return make_error(d.error().code, d.error().detail);
    if (d->status == ServiceStatus::Stopped) return {};

    std::string how = "killed";
    auto unit = unit_of(name);
    const auto ep = dir_.find(name, ipc::EndpointKind::Service);
    if (graceful && unit && ep && unit->is_alive()) {
        dir_.request_stop(*ep);
        auto shutdown = ipc::build_request(ipc::kSupervisorSource, name, ipc::kShutdownAction, {}, "");
        if (auto sent = dir_.inbox(*ep).send(shutdown); !sent) {
            obs::log().debug("shutdown message to '{}' not queued ({}); relying on stop flag",
                             name, sent.error().detail);
        }
        if (unit->wait_for_exit(std::chrono::milliseconds(cfg_.drain_timeout_ms))) {
            how = "drained, " + unit->describe_exit();
        } else {
            obs::log().warn("'{}' did not drain within {} ms, killing", name, cfg_.drain_timeout_ms);
        }
    }
    retire_unit_locked(name);

    if (auto r = registry_.update_status(name, ServiceStatus::Stopped); !r) {
        return make_error(r.error().code, r.error().detail);
    }
    emit(obs::EventKind::Stopped, *d, how);
    return {};
}

Result<ServiceDescriptor> Supervisor::restart_service(std::string_view name_sv) {
    const std::string name(name_sv);
    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    auto d = registry_.get(name);
    if (!d) return make_error(d.error().code, d.error().detail);
    if (d->status == ServiceStatus::Stopped) {
        return make_error(ErrorCode::InvalidTransition,
                          "'" + name + "' is STOPPED; use start_service");
    }
    if (d->restart_count >= cfg_.max_restarts) {
        const std::string why = "restart limit reached (" + std::to_string(d->restart_count) + "/" +
                                std::to_string(cfg_.max_restarts) + ")";
        warn_on_failure(registry_.set_last_error(name, why), "refusal reason", name);
        emit(obs::EventKind::RestartRefused, *d, why);
        return make_error(ErrorCode::RestartLimitExceeded, "'" + name + "': " + why);
    }

    Entrypoint entry;
    {
        std::lock_guard<std::mutex> ulk(units_mu_);
        auto it = entrypoints_.find(name);
        if (it == entrypoints_.end()) {
            return make_error(ErrorCode::NotFound, "no entrypoint recorded for '" + name + "'");
        }
        entry = it->second;
    }

    retire_unit_locked(name);
    if (auto r = registry_.update_status(name, ServiceStatus::Dead); !r) {
        return make_error(r.error().code, r.error().detail);
    }
    auto count = registry_.increment_restart_count(name);
    if (!count) return make_error(count.error().code, count.error().detail);
    if (auto r = registry_.update_status(name, ServiceStatus::Starting); !r) {
        return make_error(r.error().code, r.error().detail);
    }

    auto launched = launch_locked(name, entry);
    if (!launched) {
        warn_on_failure(registry_.update_status(name, ServiceStatus::Dead), "DEAD status", name);
        warn_on_failure(registry_.set_last_error(name, launched.error().detail), "restart failure", name);
        obs::log().error("restart of '{}' failed: {}", name, launched.error().detail);
        return launched;
    }
    emit(obs::EventKind::Restarted, *launched, "restart " + std::to_string(*count));
    return launched;
}

void Supervisor::stop_all() {
    for (const auto& d : registry_.list()) {
        if (d.status == ServiceStatus::Stopped) continue;
        if (auto r = stop_service(d.name, is_live(d.status)); !r) {
            obs::log().warn("stop of '{}' failed: {}", d.name, r.error().detail);
        }
    }
}

//------------------------------- Calls ----------------------------------------

Result<CallClient*> Supervisor::client_for(std::string_view source) {
    if (source.empty() || source.size() + kClientPrefix.size() > Limits::MaxNameLen) {
        return make_error(ErrorCode::InvalidArgument, "caller name length out of range");
    }
    std::string endpoint_name(kClientPrefix);
    endpoint_name += source;

    std::lock_guard<std::mutex> lk(clients_mu_);
    auto it = clients_.find(endpoint_name);
    if (it != clients_.end()) return it->second.get();

    auto ep = dir_.acquire(endpoint_name, ipc::EndpointKind::Client);
    if (!ep) return make_error(ep.error().code, ep.error().detail);
    client_endpoints_.push_back(*ep);
    auto client = std::make_unique<CallClient>(endpoint_name, dir_.replies(*ep), dir_);
    CallClient* raw = client.get();
    clients_.emplace(std::move(endpoint_name), std::move(client));
    return raw;
}

Result<ipc::Payload> Supervisor::dispatch_call(std::string_view source, std::string_view target,
                                               std::string_view action, ipc::Payload payload,
                                               std::optional<std::chrono::milliseconds> timeout) {
    auto client = client_for(source);
    if (!client) return make_error(client.error().code, client.error().detail);

    const auto deadline = timeout.value_or(std::chrono::milliseconds(cfg_.call_timeout_ms));
    auto r = (*client)->call(source, target, action, std::move(payload), deadline);
    if (!r) {
        ServiceDescriptor d;
        d.name = std::string(target);
        if (auto cur = registry_.get(target)) d = *cur;
        const auto kind = r.error().code == ErrorCode::ServiceTimeout ? obs::EventKind::CallTimeout
                                                                      : obs::EventKind::CallFailed;
        emit(kind, d, std::string(action) + ": " + r.error().detail);
    }
    return r;
}

//------------------------------- Introspection --------------------------------

ServiceReport Supervisor::report_of(const ServiceDescriptor& d) const {
    ServiceReport rep;
    rep.descriptor = d;
    if (auto hb = stats_.heartbeat(d.name)) {
        rep.requests = hb->request_count;
        rep.errors   = hb->error_count;
        if (hb->last_beat) {
            rep.heartbeat_age = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - *hb->last_beat);
        }
    }
    return rep;
}

std::vector<ServiceReport> Supervisor::list_services() const {
    std::vector<ServiceReport> out;
    for (const auto& d : registry_.list()) out.push_back(report_of(d));
    return out;
}

Result<ServiceReport> Supervisor::service_health(std::string_view name) const {
    auto d = registry_.get(name);
    if (!d) return make_error(d.error().code, d.error().detail);
    return report_of(*d);
}

//------------------------------- ServiceController ----------------------------

std::vector<ServiceDescriptor> Supervisor::services() const {
    return registry_.list();
}

bool Supervisor::unit_alive(const ServiceDescriptor& d) {
    auto unit = unit_of(d.name);
    if (!unit || unit->pid() != d.pid) return false;
    return unit->is_alive();
}

std::optional<std::chrono::steady_clock::time_point>
Supervisor::last_heartbeat(std::string_view name) const {
    auto hb = stats_.heartbeat(name);
    if (!hb) return std::nullopt;
    return hb->last_beat;
}

Result<void> Supervisor::mark(std::string_view name_sv, pid_t expected_pid,
                              ServiceStatus status, std::string_view reason) {
    const std::string name(name_sv);
    std::lock_guard<std::mutex> lk(lifecycle_mu_);

    auto d = registry_.get(name);
    if (!d) return make_error(d.error().code, d.error().detail);
    if (d->pid != expected_pid) {
        return make_error(ErrorCode::InvalidTransition,
                          "stale handle for '" + name + "' (pid " + std::to_string(expected_pid) +
                              ", now " + std::to_string(d->pid) + ")");
    }

    auto prev = registry_.update_status(name, status);
    if (!prev) return make_error(prev.error().code, prev.error().detail);
    if (*prev == status) return {};

    const std::string why(reason);
    switch (status) {
        case ServiceStatus::Dead:
            warn_on_failure(registry_.set_last_error(name, why), "death reason", name);
            retire_unit_locked(name);
            emit(obs::EventKind::Died, *d, why);
            break;
        case ServiceStatus::Degraded:
            emit(obs::EventKind::Degraded, *d, why);
            break;
        case ServiceStatus::Running:
            if (*prev == ServiceStatus::Degraded) emit(obs::EventKind::Recovered, *d, why);
            break;
        default:
            break;
    }
    return {};
}

} // namespace warden::runtime
