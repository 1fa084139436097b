/**
 * @file service_context.cpp
 * @brief Unit-side serve loop.
 */
#include "warden/runtime/service_context.hpp"

#include "warden/obs/observability.hpp"
#include "warden/runtime/action_router.hpp"

namespace warden::runtime {

ServiceContext::ServiceContext(std::string name, ipc::EndpointId endpoint, const ipc::Directory& dir,
                               ipc::StatsStore& stats, std::chrono::milliseconds heartbeat_interval,
                               std::chrono::milliseconds call_timeout)
    : name_(std::move(name)),
      endpoint_(endpoint),
      dir_(dir),
      stats_(stats),
      heartbeat_interval_(heartbeat_interval),
      call_timeout_(call_timeout),
      inbox_(dir.inbox(endpoint)),
      client_(name_, dir.replies(endpoint), dir) {}

void ServiceContext::heartbeat() noexcept {
    stats_.beat(name_);
}

Result<std::int64_t> ServiceContext::increment(std::string_view key, std::int64_t delta) {
    return stats_.increment(key, delta);
}

Result<ipc::Payload> ServiceContext::call(std::string_view target, std::string_view action,
                                          ipc::Payload payload,
                                          std::optional<std::chrono::milliseconds> timeout) {
    return client_.call(name_, target, action, std::move(payload), timeout.value_or(call_timeout_));
}

bool ServiceContext::stop_requested() const noexcept {
    return dir_.stop_requested(endpoint_);
}

int ServiceContext::serve(const ActionRouter& router) {
    obs::log().info("'{}' serving on endpoint {}", name_, endpoint_);
    heartbeat();
    for (;;) {
        const Step step = serve_one(router, heartbeat_interval_);
        heartbeat();
        if (step == Step::Stop) break;
    }
    obs::log().info("'{}' drained, exiting", name_);
    return 0;
}

ServiceContext::Step ServiceContext::serve_one(const ActionRouter& router, std::chrono::milliseconds wait) {
    if (stop_requested() && inbox_.empty()) return Step::Stop;

    auto msg = inbox_.receive(wait);
    if (!msg) return stop_requested() ? Step::Stop : Step::Idle;

    if (msg->kind != ipc::MessageKind::Request) {
        obs::log().warn("'{}': ignoring {} {} in inbox", name_, ipc::to_string(msg->kind),
                        msg->correlation_id);
        return Step::Handled;
    }
    if (msg->action == ipc::kShutdownAction && msg->source == ipc::kSupervisorSource &&
        stop_requested()) {
        obs::log().info("'{}': shutdown requested by the supervisor", name_);
        return Step::Stop;
    }
    if (ipc::is_reserved_action(msg->action)) {
        obs::log().warn("'{}': refusing control action {} from '{}'", name_, msg->action, msg->source);
        stats_.record_request(name_);
        stats_.record_error(name_);
        reply(*msg, ipc::build_error(*msg, ipc::reason::UnknownAction,
                                     "control action '" + msg->action + "' not accepted"));
        return Step::Handled;
    }

    stats_.record_request(name_);
    const ipc::Message response = router.dispatch(*msg, *this);
    if (response.kind == ipc::MessageKind::Error) {
        stats_.record_error(name_);
        obs::log().debug("'{}': {} -> {} ({})", name_, msg->action, response.reason,
                         ipc::to_string(response.payload));
    }
    reply(*msg, response);
    return Step::Handled;
}

void ServiceContext::reply(const ipc::Message& request, const ipc::Message& response) {
    if (request.reply_to.empty()) return;
    const auto ep = dir_.find_any(request.reply_to);
    if (!ep) {
        obs::log().warn("'{}': reply endpoint '{}' is gone, dropping reply {}", name_,
                        request.reply_to, request.correlation_id);
        return;
    }
    auto replies = dir_.replies(*ep);
    auto sent = replies.send(response);
    if (!sent && sent.error().code == ErrorCode::MessageTooLarge) {
        // The caller still gets exactly one answer; a bare error always fits a slot.
        if (response.kind != ipc::MessageKind::Error) stats_.record_error(name_);
        obs::log().warn("'{}': reply {} to '{}' too large ({}), sending error instead", name_,
                        request.correlation_id, request.reply_to, sent.error().detail);
        sent = replies.send(ipc::build_error(request, ipc::reason::HandlerFailure,
                                             "response exceeds slot size"));
    }
    if (!sent) {
        obs::log().warn("'{}': reply {} to '{}' not delivered: {}", name_, request.correlation_id,
                        request.reply_to, sent.error().detail);
    }
}

} // namespace warden::runtime
