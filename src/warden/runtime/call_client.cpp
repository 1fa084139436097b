/**
 * @file call_client.cpp
 * @brief Leader/follower reading of a shared reply channel.
 */
#include "warden/runtime/call_client.hpp"

#include <algorithm>

#include "warden/config/constants.hpp"
#include "warden/obs/observability.hpp"

namespace warden::runtime {

Error call_error_from(const ipc::Message& reply) {
    std::string detail = reply.reason.empty() ? std::string(ipc::reason::Rejected) : reply.reason;
    if (const auto* text = ipc::get_if<std::string>(reply.payload, ipc::kErrorMessageKey)) {
        detail += ": " + *text;
    }
    return Error{ErrorCode::ServiceCallError, std::move(detail)};
}

CallClient::CallClient(std::string endpoint_name, ipc::Channel replies, const ipc::Directory& dir)
    : endpoint_name_(std::move(endpoint_name)), replies_(replies), dir_(dir) {}

Result<ipc::Payload> CallClient::call(std::string_view source, std::string_view target,
                                      std::string_view action, ipc::Payload payload,
                                      std::chrono::milliseconds timeout) {
    if (ipc::is_reserved_action(action)) {
        return make_error(ErrorCode::InvalidArgument,
                          "action '" + std::string(action) + "' is reserved for the supervisor");
    }
    const auto target_ep = dir_.find(target, ipc::EndpointKind::Service);
    if (!target_ep) {
        return make_error(ErrorCode::UnknownService,
                          "no live endpoint for '" + std::string(target) + "'");
    }

    ipc::Message req = ipc::build_request(source, target, action, std::move(payload), endpoint_name_);
    if (auto ok = ipc::validate_envelope(req); !ok) return make_error(ok.error().code, ok.error().detail);

    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.emplace(req.correlation_id, std::nullopt);
    }

    if (auto sent = dir_.inbox(*target_ep).send(req); !sent) {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.erase(req.correlation_id);
        return make_error(sent.error().code,
                          "'" + std::string(target) + "': " + sent.error().detail);
    }

    auto reply = await_reply(req.correlation_id, std::chrono::steady_clock::now() + timeout);
    if (!reply) {
        return make_error(ErrorCode::ServiceTimeout,
                          "no reply from '" + std::string(target) + "' to '" + std::string(action) +
                              "' within " + std::to_string(timeout.count()) + " ms");
    }
    if (reply->kind == ipc::MessageKind::Error) {
        return warden_detail::unexpected<Error>(call_error_from(*reply));
    }
    return std::move(reply->payload);
}

std::optional<ipc::Message>
CallClient::await_reply(const std::string& id, std::chrono::steady_clock::time_point deadline) {
    const auto slice = std::chrono::milliseconds(config::constants::CALL_READER_SLICE_MS);

    std::unique_lock<std::mutex> lk(mu_);
    for (;;) {
        auto it = pending_.find(id);
        if (it != pending_.end() && it->second) {
            ipc::Message m = std::move(*it->second);
            pending_.erase(it);
            return m;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // Retire the id: whatever arrives for it later is discarded.
            pending_.erase(id);
            return std::nullopt;
        }

        if (reader_active_) {
            cv_.wait_until(lk, std::min(deadline, now + slice));
            continue;
        }

        reader_active_ = true;
        lk.unlock();
        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::min<std::chrono::steady_clock::duration>(deadline - now, slice));
        auto msg = replies_.receive(std::max(wait, std::chrono::milliseconds(1)));
        lk.lock();
        reader_active_ = false;

        if (msg) {
            auto owner = pending_.find(msg->correlation_id);
            if (owner != pending_.end() && !owner->second) {
                owner->second = std::move(*msg);
            } else {
                discarded_.fetch_add(1, std::memory_order_relaxed);
                obs::log().debug("{}: discarding late reply {} from '{}'",
                                 endpoint_name_, msg->correlation_id, msg->source);
            }
        }
        cv_.notify_all();
    }
}

} // namespace warden::runtime
