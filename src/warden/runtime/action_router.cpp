/**
 * @file action_router.cpp
 * @brief Schema checks and reply construction for ActionRouter.
 */
#include "warden/runtime/action_router.hpp"

#include <exception>

#include "warden/obs/observability.hpp"

namespace warden::runtime {

namespace {

bool matches(const ipc::Value& v, ValueType t) noexcept {
    switch (t) {
        case ValueType::Bool:   return std::holds_alternative<bool>(v);
        case ValueType::Int:    return std::holds_alternative<std::int64_t>(v);
        // Integers are accepted where a real is expected.
        case ValueType::Double: return std::holds_alternative<double>(v) ||
                                       std::holds_alternative<std::int64_t>(v);
        case ValueType::String: return std::holds_alternative<std::string>(v);
    }
    return false;
}

} // namespace

const char* to_string(ValueType t) noexcept {
    switch (t) {
        case ValueType::Bool:   return "bool";
        case ValueType::Int:    return "int";
        case ValueType::Double: return "double";
        case ValueType::String: return "string";
    }
    return "unknown";
}

ActionRouter& ActionRouter::on(std::string action, std::vector<FieldSpec> schema, Handler handler) {
    routes_[std::move(action)] = Route{std::move(schema), std::move(handler)};
    return *this;
}

std::vector<std::string> ActionRouter::actions() const {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto& kv : routes_) out.push_back(kv.first);
    return out;
}

std::optional<std::string> ActionRouter::check_schema(const ipc::Payload& payload,
                                                      const std::vector<FieldSpec>& schema) {
    for (const auto& f : schema) {
        const auto it = payload.find(f.name);
        if (it == payload.end()) {
            if (f.required) return "missing field '" + f.name + "'";
            continue;
        }
        if (!matches(it->second, f.type)) {
            return "field '" + f.name + "' must be " + to_string(f.type);
        }
    }
    return std::nullopt;
}

ipc::Message ActionRouter::dispatch(const ipc::Message& request, ServiceContext& ctx) const {
    const auto it = routes_.find(request.action);
    if (it == routes_.end()) {
        return ipc::build_error(request, ipc::reason::UnknownAction,
                                "unknown action '" + request.action + "'");
    }

    if (auto violation = check_schema(request.payload, it->second.schema)) {
        return ipc::build_error(request, ipc::reason::InvalidPayload, *violation);
    }

    HandlerResult result;
    try {
        result = it->second.handler(request, ctx);
    } catch (const std::exception& e) {
        obs::log().error("handler for '{}' threw: {}", request.action, e.what());
        return ipc::build_error(request, ipc::reason::HandlerFailure, e.what());
    }

    if (!result) {
        return ipc::build_error(request, result.error().reason, result.error().detail);
    }
    return ipc::build_response(request, std::move(*result));
}

} // namespace warden::runtime
