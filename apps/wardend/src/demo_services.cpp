/**
 * @file demo_services.cpp
 * @brief Demo business logic served through ActionRouter.
 */
#include "demo_services.hpp"

#include <map>
#include <memory>
#include <string>

#include "warden/obs/observability.hpp"
#include "warden/runtime/service_context.hpp"

namespace warden::demo {

using runtime::ActionRouter;
using runtime::FieldSpec;
using runtime::HandlerResult;
using runtime::ServiceContext;
using runtime::ValueType;
using runtime::reject;
using ipc::Message;
using ipc::Payload;

namespace {

struct User {
    std::int64_t id{0};
    std::string  username;
    std::string  email;
};

struct Order {
    std::int64_t id{0};
    std::int64_t user_id{0};
    std::string  product;
    std::int64_t quantity{1};
};

Payload user_payload(const User& u) {
    return Payload{{"user_id", u.id}, {"username", u.username}, {"email", u.email}};
}

Payload order_payload(const Order& o) {
    return Payload{{"order_id", o.id}, {"user_id", o.user_id}, {"product", o.product},
                   {"quantity", o.quantity}, {"status", std::string("created")}};
}

} // namespace

ActionRouter ping_router() {
    ActionRouter r;
    r.on("ping", {}, [](const Message&, ServiceContext& ctx) -> HandlerResult {
        (void)ctx.increment("ping.pings");
        return Payload{{"pong", true}};
    });
    r.on("echo", {}, [](const Message& m, ServiceContext&) -> HandlerResult {
        return m.payload;
    });
    return r;
}

runtime::Entrypoint ping_service() {
    return [](ServiceContext& ctx) {
        const ActionRouter router = ping_router();
        return ctx.serve(router);
    };
}

runtime::Entrypoint user_service() {
    return [](ServiceContext& ctx) {
        auto users   = std::make_shared<std::map<std::int64_t, User>>();
        auto next_id = std::make_shared<std::int64_t>(1);

        ActionRouter router;
        router.on("create_user",
                  {{"username", ValueType::String}, {"email", ValueType::String}},
                  [users, next_id](const Message& m, ServiceContext& c) -> HandlerResult {
                      const auto& username = *ipc::get_if<std::string>(m.payload, "username");
                      const auto& email    = *ipc::get_if<std::string>(m.payload, "email");
                      if (username.empty() || email.empty()) {
                          return reject("username and email are required");
                      }
                      for (const auto& kv : *users) {
                          if (kv.second.username == username) {
                              return reject("user " + username + " already exists");
                          }
                      }
                      User u{(*next_id)++, username, email};
                      (*users)[u.id] = u;
                      (void)c.increment("users.created");
                      obs::log().info("created user {} (id {})", u.username, u.id);
                      return user_payload(u);
                  });
        router.on("get_user", {{"user_id", ValueType::Int}},
                  [users](const Message& m, ServiceContext&) -> HandlerResult {
                      const auto id = *ipc::get_if<std::int64_t>(m.payload, "user_id");
                      auto it = users->find(id);
                      if (it == users->end()) return reject("user " + std::to_string(id) + " not found");
                      return user_payload(it->second);
                  });
        router.on("list_users", {},
                  [users](const Message&, ServiceContext&) -> HandlerResult {
                      std::string names;
                      for (const auto& kv : *users) {
                          if (!names.empty()) names += ",";
                          names += kv.second.username;
                      }
                      return Payload{{"count", static_cast<std::int64_t>(users->size())},
                                     {"usernames", names}};
                  });
        router.on("validate_user", {{"user_id", ValueType::Int}},
                  [users](const Message& m, ServiceContext&) -> HandlerResult {
                      const auto id = *ipc::get_if<std::int64_t>(m.payload, "user_id");
                      return Payload{{"valid", users->count(id) > 0}, {"user_id", id}};
                  });
        return ctx.serve(router);
    };
}

runtime::Entrypoint order_service() {
    return [](ServiceContext& ctx) {
        auto orders  = std::make_shared<std::map<std::int64_t, Order>>();
        auto next_id = std::make_shared<std::int64_t>(1);

        ActionRouter router;
        router.on("create_order",
                  {{"user_id", ValueType::Int}, {"product", ValueType::String},
                   {"quantity", ValueType::Int, false}},
                  [orders, next_id](const Message& m, ServiceContext& c) -> HandlerResult {
                      const auto user_id = *ipc::get_if<std::int64_t>(m.payload, "user_id");
                      const auto& product = *ipc::get_if<std::string>(m.payload, "product");
                      const auto* qty = ipc::get_if<std::int64_t>(m.payload, "quantity");
                      const std::int64_t quantity = qty ? *qty : 1;
                      if (product.empty()) return reject("product is required");
                      if (quantity <= 0) return reject("quantity must be positive");

                      auto check = c.call(kUsers, "validate_user", Payload{{"user_id", user_id}});
                      if (!check) {
                          return warden_detail::unexpected<runtime::Fault>(runtime::Fault{
                              std::string(ipc::reason::ServiceUnavailable),
                              "user validation failed: " + check.error().detail});
                      }
                      const bool* valid = ipc::get_if<bool>(*check, "valid");
                      if (!valid || !*valid) {
                          return reject("user " + std::to_string(user_id) + " not found");
                      }

                      Order o{(*next_id)++, user_id, product, quantity};
                      (*orders)[o.id] = o;
                      (void)c.increment("orders.created");
                      obs::log().info("created order {} for user {}", o.id, o.user_id);
                      return order_payload(o);
                  });
        router.on("get_order", {{"order_id", ValueType::Int}},
                  [orders](const Message& m, ServiceContext&) -> HandlerResult {
                      const auto id = *ipc::get_if<std::int64_t>(m.payload, "order_id");
                      auto it = orders->find(id);
                      if (it == orders->end()) return reject("order " + std::to_string(id) + " not found");
                      return order_payload(it->second);
                  });
        router.on("list_orders", {},
                  [orders](const Message&, ServiceContext&) -> HandlerResult {
                      std::string ids;
                      for (const auto& kv : *orders) {
                          if (!ids.empty()) ids += ",";
                          ids += std::to_string(kv.first);
                      }
                      return Payload{{"count", static_cast<std::int64_t>(orders->size())},
                                     {"order_ids", ids}};
                  });
        return ctx.serve(router);
    };
}

runtime::Entrypoint notification_service() {
    return [](ServiceContext& ctx) {
        auto sent = std::make_shared<std::int64_t>(0);

        ActionRouter router;
        router.on("send_notification",
                  {{"user_id", ValueType::Int}, {"message", ValueType::String},
                   {"type", ValueType::String, false}},
                  [sent](const Message& m, ServiceContext& c) -> HandlerResult {
                      const auto user_id  = *ipc::get_if<std::int64_t>(m.payload, "user_id");
                      const auto& text    = *ipc::get_if<std::string>(m.payload, "message");
                      const auto* type_in = ipc::get_if<std::string>(m.payload, "type");
                      const std::string type = type_in ? *type_in : std::string("email");
                      if (user_id <= 0 || text.empty()) return reject("user_id and message are required");
                      if (type != "email" && type != "sms") {
                          return reject("unsupported notification type '" + type + "'");
                      }

                      // Delivery is simulated.
                      obs::log().info("sending {} to user {}: {}", type, user_id, text);
                      ++*sent;
                      if (auto n = c.increment("notifications.sent"); !n) {
                          obs::log().debug("notifications.sent not counted: {}", n.error().detail);
                      }
                      std::string label = type == "sms" ? "SMS" : "Email";
                      return Payload{{"sent", true}, {"type", type}, {"user_id", user_id},
                                     {"status", label + " notification sent"}};
                  });
        router.on("get_stats", {},
                  [sent](const Message&, ServiceContext&) -> HandlerResult {
                      return Payload{{"notifications_sent", *sent}};
                  });
        return ctx.serve(router);
    };
}

} // namespace warden::demo
