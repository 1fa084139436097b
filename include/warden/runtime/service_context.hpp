#pragma once
/**
 * @file service_context.hpp
 * @brief What a running unit sees: its inbox, the stats store and a call client.
 *
 * Built inside the forked child. The serve loop:
 *  - heartbeats on every cycle, so at least every heartbeat_interval while idle;
 *  - processes the inbox FIFO through an ActionRouter;
 *  - replies exactly once to every REQUEST that carries a reply_to;
 *  - exits once the stop flag is raised and the inbox is drained, or on the
 *    shutdown control action.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "warden/core/error.hpp"
#include "warden/ipc/directory.hpp"
#include "warden/ipc/message.hpp"
#include "warden/ipc/stats_store.hpp"
#include "warden/runtime/call_client.hpp"

namespace warden::runtime {

class ActionRouter;

class ServiceContext final {
public:
    /// Outcome of one serve step.
    enum class Step : std::uint8_t { Idle, Handled, Stop };

    ServiceContext(std::string name, ipc::EndpointId endpoint, const ipc::Directory& dir,
                   ipc::StatsStore& stats, std::chrono::milliseconds heartbeat_interval,
                   std::chrono::milliseconds call_timeout);

    const std::string& name() const noexcept { return name_; }
    ipc::EndpointId endpoint() const noexcept { return endpoint_; }

    /// Stamp this unit's heartbeat now.
    void heartbeat() noexcept;

    /// Bump a shared counter.
    Result<std::int64_t> increment(std::string_view key, std::int64_t delta = 1);

    /// Lateral call to another service; replies come back on this unit's reply channel.
    Result<ipc::Payload> call(std::string_view target, std::string_view action,
                              ipc::Payload payload,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool stop_requested() const noexcept;

    /// Serve until stopped. @return process exit code.
    int serve(const ActionRouter& router);

    /// Wait up to `wait` for one message and handle it.
    Step serve_one(const ActionRouter& router, std::chrono::milliseconds wait);

    ipc::StatsStore& stats() noexcept { return stats_; }

private:
    void reply(const ipc::Message& request, const ipc::Message& response);

    std::string               name_;
    ipc::EndpointId           endpoint_;
    const ipc::Directory&     dir_;
    ipc::StatsStore&          stats_;
    std::chrono::milliseconds heartbeat_interval_;
    std::chrono::milliseconds call_timeout_;
    ipc::Channel              inbox_;
    CallClient                client_;
};

} // namespace warden::runtime
