/**
 * @file message.cpp
 * @brief Protocol builders and the protobuf envelope codec.
 */
#include "warden/ipc/message.hpp"

#include <atomic>
#include <random>
#include <sstream>
#include <type_traits>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include "envelope.pb.h"
#include "warden/config/constants.hpp"

namespace warden::ipc {

namespace {

std::atomic<std::uint64_t> g_sequence{0};

std::uint32_t random_salt() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return static_cast<std::uint32_t>(rng());
}

wire::Envelope::Kind to_wire(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Request:  return wire::Envelope::KIND_REQUEST;
        case MessageKind::Response: return wire::Envelope::KIND_RESPONSE;
        case MessageKind::Error:    return wire::Envelope::KIND_ERROR;
    }
    return wire::Envelope::KIND_REQUEST;
}

MessageKind from_wire(wire::Envelope::Kind k) noexcept {
    switch (k) {
        case wire::Envelope::KIND_RESPONSE: return MessageKind::Response;
        case wire::Envelope::KIND_ERROR:    return MessageKind::Error;
        default:                            return MessageKind::Request;
    }
}

void value_to_wire(const Value& v, wire::Value& out) {
    std::visit([&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>)              out.set_flag(x);
        else if constexpr (std::is_same_v<T, std::int64_t>) out.set_integer(x);
        else if constexpr (std::is_same_v<T, double>)       out.set_real(x);
        else                                                out.set_text(x);
    }, v);
}

bool value_from_wire(const wire::Value& in, Value& out) {
    switch (in.kind_case()) {
        case wire::Value::kFlag:    out = in.flag();    return true;
        case wire::Value::kInteger: out = in.integer(); return true;
        case wire::Value::kReal:    out = in.real();    return true;
        case wire::Value::kText:    out = in.text();    return true;
        case wire::Value::KIND_NOT_SET: break;
    }
    return false;
}

bool valid_name(std::string_view s) noexcept {
    return !s.empty() && s.size() <= Limits::MaxNameLen;
}

} // namespace

const char* to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Request:  return "request";
        case MessageKind::Response: return "response";
        case MessageKind::Error:    return "error";
    }
    return "unknown";
}

std::string new_correlation_id() {
    const auto seq = g_sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return fmt::format("{:x}-{:x}-{:08x}", static_cast<unsigned>(::getpid()), seq, random_salt());
}

Message build_request(std::string_view source, std::string_view target,
                      std::string_view action, Payload payload,
                      std::string_view reply_to) {
    Message m;
    m.correlation_id = new_correlation_id();
    m.source    = std::string(source);
    m.target    = std::string(target);
    m.reply_to  = std::string(reply_to);
    m.action    = std::string(action);
    m.payload   = std::move(payload);
    m.kind      = MessageKind::Request;
    m.timestamp = std::chrono::system_clock::now();
    return m;
}

Message build_response(const Message& request, Payload payload, bool ok) {
    Message m;
    m.correlation_id = request.correlation_id;
    m.source    = request.target;
    m.target    = request.source;
    m.action    = request.action;
    m.payload   = std::move(payload);
    m.kind      = ok ? MessageKind::Response : MessageKind::Error;
    m.timestamp = std::chrono::system_clock::now();
    if (!ok) m.reason = std::string(reason::Rejected);
    return m;
}

Message build_error(const Message& request, std::string_view reason_code, std::string_view detail) {
    Payload p;
    p.emplace(std::string(kErrorMessageKey), std::string(detail));
    Message m = build_response(request, std::move(p), false);
    m.reason = std::string(reason_code);
    return m;
}

Result<void> validate_envelope(const Message& m) {
    if (m.correlation_id.empty()) return make_error(ErrorCode::InvalidArgument, "missing correlation_id");
    if (!valid_name(m.source))    return make_error(ErrorCode::InvalidArgument, "bad source '" + m.source + "'");
    if (!valid_name(m.target))    return make_error(ErrorCode::InvalidArgument, "bad target '" + m.target + "'");
    if (m.action.empty())         return make_error(ErrorCode::InvalidArgument, "missing action");
    if (m.reply_to.size() > Limits::MaxNameLen) {
        return make_error(ErrorCode::InvalidArgument, "reply_to too long");
    }
    if (m.kind == MessageKind::Error && m.reason.empty()) {
        return make_error(ErrorCode::InvalidArgument, "error message without reason code");
    }
    return {};
}

std::string encode(const Message& m) {
    wire::Envelope env;
    env.set_correlation_id(m.correlation_id);
    env.set_source(m.source);
    env.set_target(m.target);
    env.set_reply_to(m.reply_to);
    env.set_action(m.action);
    env.set_kind(to_wire(m.kind));
    env.set_timestamp_ns(std::chrono::duration_cast<std::chrono::nanoseconds>(
        m.timestamp.time_since_epoch()).count());
    env.set_reason(m.reason);
    auto& out = *env.mutable_payload();
    for (const auto& [key, value] : m.payload) value_to_wire(value, out[key]);

    std::string bytes;
    env.SerializeToString(&bytes);
    return bytes;
}

Result<Message> decode(std::span<const std::byte> bytes) {
    wire::Envelope env;
    if (!env.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return make_error(ErrorCode::InvalidArgument, "malformed envelope");
    }
    Message m;
    m.correlation_id = env.correlation_id();
    m.source   = env.source();
    m.target   = env.target();
    m.reply_to = env.reply_to();
    m.action   = env.action();
    m.kind     = from_wire(env.kind());
    m.timestamp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(env.timestamp_ns())));
    m.reason   = env.reason();
    for (const auto& kv : env.payload()) {
        Value v;
        if (!value_from_wire(kv.second, v)) {
            return make_error(ErrorCode::InvalidArgument, "payload field '" + kv.first + "' has no value");
        }
        m.payload.emplace(kv.first, std::move(v));
    }
    return m;
}

std::string to_string(const Payload& p) {
    std::ostringstream os;
    os << '{';
    bool first = true;
    for (const auto& [key, value] : p) {
        if (!first) os << ", ";
        first = false;
        os << key << '=';
        std::visit([&os](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) os << (x ? "true" : "false");
            else os << x;
        }, value);
    }
    os << '}';
    return os.str();
}

} // namespace warden::ipc
