#pragma once
/**
 * @file message.hpp
 * @brief Message envelope, typed payload and the request/response protocol.
 *
 * Contract:
 *  - correlation_id is generated once per request and copied verbatim into the
 *    reply, so callers can match replies that arrive out of order on a shared
 *    reply channel.
 *  - action is opaque here; receivers dispatch on it (see runtime/action_router.hpp).
 *  - This layer enforces envelope shape only; per-action payload checks belong
 *    to the receiving service.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "warden/core/error.hpp"

namespace warden::ipc {

/// Message kind.
enum class MessageKind : std::uint8_t { Request = 0, Response = 1, Error = 2 };

const char* to_string(MessageKind k) noexcept;

/// Payload scalar. Order matters: index() is used by schema checks.
using Value   = std::variant<bool, std::int64_t, double, std::string>;
/// Structured key/value payload (ordered, heterogeneous lookup).
using Payload = std::map<std::string, Value, std::less<>>;

/// Reason codes carried by ERROR messages.
namespace reason {
    inline constexpr std::string_view UnknownAction      = "unknown_action";
    inline constexpr std::string_view InvalidPayload     = "invalid_payload";
    inline constexpr std::string_view HandlerFailure     = "handler_failure";
    inline constexpr std::string_view ServiceUnavailable = "service_unavailable";
    inline constexpr std::string_view Rejected           = "rejected";
} // namespace reason

/// Prefix of control actions. Only the supervisor sends them; callers cannot.
inline constexpr std::string_view kReservedActionPrefix = "__";

/// Control action the supervisor sends to ask a unit to drain and exit.
inline constexpr std::string_view kShutdownAction = "__shutdown";

/// Source name on control messages.
inline constexpr std::string_view kSupervisorSource = "supervisor";

/// True for actions in the control namespace.
inline bool is_reserved_action(std::string_view action) noexcept {
    return action.substr(0, kReservedActionPrefix.size()) == kReservedActionPrefix;
}

/// Payload key holding the human-readable text of an ERROR.
inline constexpr std::string_view kErrorMessageKey = "message";

/**
 * @brief Unit of inter-service communication. Immutable by convention once built.
 */
struct Message {
    std::string correlation_id;  ///< Unique per request, echoed by the reply
    std::string source;          ///< Logical caller name
    std::string target;          ///< Logical callee name
    std::string reply_to;        ///< Endpoint that receives the reply (empty: no reply)
    std::string action;          ///< Operation tag the callee dispatches on
    Payload     payload;         ///< Structured data
    MessageKind kind{MessageKind::Request};
    std::chrono::system_clock::time_point timestamp{};
    std::string reason;          ///< Reason code on ERROR, empty otherwise

    bool operator==(const Message&) const = default;
};

/// Generate a correlation id unique across processes on this host.
std::string new_correlation_id();

/// Build a REQUEST with a fresh correlation id.
Message build_request(std::string_view source, std::string_view target,
                      std::string_view action, Payload payload,
                      std::string_view reply_to);

/// Build the reply to `request`. ok=false yields kind ERROR with reason "rejected".
Message build_response(const Message& request, Payload payload, bool ok = true);

/// Build an ERROR reply with a machine-readable reason and a human detail.
Message build_error(const Message& request, std::string_view reason_code, std::string_view detail);

/// Envelope shape check (ids, names, reason presence on ERROR).
Result<void> validate_envelope(const Message& m);

/// Serialize to the protobuf wire format.
std::string encode(const Message& m);

/// Parse the protobuf wire format.
Result<Message> decode(std::span<const std::byte> bytes);

/// Typed lookup; nullptr when missing or of another type.
template <class T>
const T* get_if(const Payload& p, std::string_view key) noexcept {
    const auto it = p.find(key);
    if (it == p.end()) return nullptr;
    return std::get_if<T>(&it->second);
}

/// Compact human rendering, e.g. {pong=true, user_id=3}.
std::string to_string(const Payload& p);

} // namespace warden::ipc
