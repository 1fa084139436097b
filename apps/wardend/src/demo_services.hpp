#pragma once
/**
 * @file demo_services.hpp
 * @brief Demo units: ping, users, orders (orders calls users laterally), notifications.
 * @details State is in-memory and private to each unit process; it is lost
 *          on restart.
 */

#include "warden/runtime/action_router.hpp"
#include "warden/runtime/supervisor.hpp"

namespace warden::demo {

inline constexpr const char* kPing   = "ping";
inline constexpr const char* kUsers  = "users";
inline constexpr const char* kOrders = "orders";
inline constexpr const char* kNotifications = "notifications";

/// ping -> {pong: true}; echo -> request payload.
runtime::ActionRouter ping_router();

/// create_user, get_user, list_users, validate_user.
runtime::Entrypoint user_service();

/// create_order (validates the user via users.validate_user), get_order, list_orders.
runtime::Entrypoint order_service();

runtime::Entrypoint ping_service();

/// send_notification{user_id, message, type?} (email or sms), get_stats.
runtime::Entrypoint notification_service();

} // namespace warden::demo
