/**
 * @file error.cpp
 * @brief Names for ErrorCode values.
 */
#include "warden/core/error.hpp"

namespace warden {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DuplicateService:     return "duplicate_service";
        case ErrorCode::InvalidTransition:    return "invalid_transition";
        case ErrorCode::StartupError:         return "startup_error";
        case ErrorCode::RestartLimitExceeded: return "restart_limit_exceeded";
        case ErrorCode::ServiceTimeout:       return "service_timeout";
        case ErrorCode::ServiceCallError:     return "service_call_error";
        case ErrorCode::QueueOverflow:        return "queue_overflow";
        case ErrorCode::NotFound:             return "not_found";
        case ErrorCode::UnknownService:       return "unknown_service";
        case ErrorCode::InvalidArgument:      return "invalid_argument";
        case ErrorCode::MessageTooLarge:      return "message_too_large";
        case ErrorCode::Capacity:             return "capacity";
        case ErrorCode::SystemError:          return "system_error";
        case ErrorCode::ConfigError:          return "config_error";
    }
    return "unknown";
}

} // namespace warden
