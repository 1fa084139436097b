#pragma once
/**
 * @file action_router.hpp
 * @brief Per-service dispatch table: action name -> (field schema, handler).
 * @details Payload validation happens here, at the receiving boundary. The
 *          router always produces exactly one reply message per request.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/compat/expected.hpp"
#include "warden/ipc/message.hpp"

namespace warden::runtime {

class ServiceContext;

/// Expected scalar type of a payload field (mirrors ipc::Value alternatives).
enum class ValueType : std::uint8_t { Bool, Int, Double, String };

const char* to_string(ValueType t) noexcept;

/// One field of an action schema.
struct FieldSpec {
    std::string name;
    ValueType   type{ValueType::String};
    bool        required{true};
};

/// Handler-side failure, turned into an ERROR reply.
struct Fault {
    std::string reason; ///< reason code (see ipc::reason)
    std::string detail; ///< human text, sent under payload["message"]
};

using HandlerResult = warden_detail::expected<ipc::Payload, Fault>;
using Handler       = std::function<HandlerResult(const ipc::Message&, ServiceContext&)>;

/// Business-level refusal ("user not found", "username taken").
inline warden_detail::unexpected<Fault> reject(std::string detail) {
    return warden_detail::unexpected<Fault>(Fault{std::string(ipc::reason::Rejected), std::move(detail)});
}

class ActionRouter {
public:
    /// Register (or replace) an action. Returns *this for chaining.
    ActionRouter& on(std::string action, std::vector<FieldSpec> schema, Handler handler);

    /**
     * @brief Route one REQUEST.
     *  - unknown action        -> ERROR unknown_action
     *  - schema mismatch       -> ERROR invalid_payload
     *  - handler throws        -> ERROR handler_failure
     *  - handler returns Fault -> ERROR with its reason
     */
    ipc::Message dispatch(const ipc::Message& request, ServiceContext& ctx) const;

    bool handles(std::string_view action) const noexcept { return routes_.find(action) != routes_.end(); }
    std::vector<std::string> actions() const;

    /// @return description of the first violation, or nullopt.
    static std::optional<std::string> check_schema(const ipc::Payload& payload,
                                                   const std::vector<FieldSpec>& schema);

private:
    struct Route {
        std::vector<FieldSpec> schema;
        Handler                handler;
    };
    std::map<std::string, Route, std::less<>> routes_;
};

} // namespace warden::runtime
