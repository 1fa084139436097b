#pragma once
/**
 * @file error.hpp
 * @brief Error codes and the Result alias shared by every warden layer.
 * @details The public API never throws: failures travel as Error inside
 *          warden_detail::expected, so callers must look at them.
 */

#include <cstdint>
#include <string>
#include <utility>

#include "warden/compat/expected.hpp"

namespace warden {

/// Result codes for orchestration operations.
enum class ErrorCode : std::uint8_t {
    DuplicateService = 1,  ///< Name already registered in a live status.
    InvalidTransition,     ///< Status change not allowed by the lifecycle state machine.
    StartupError,          ///< Unit did not reach RUNNING within the startup grace.
    RestartLimitExceeded,  ///< restart_count reached the configured ceiling.
    ServiceTimeout,        ///< No reply before the call deadline.
    ServiceCallError,      ///< Callee answered with an ERROR message.
    QueueOverflow,         ///< Channel full; back pressure signalled to the sender.
    NotFound,              ///< No registry entry under that name.
    UnknownService,        ///< Call target has no live endpoint.
    InvalidArgument,       ///< Input validation failed (names, sizes, payloads).
    MessageTooLarge,       ///< Encoded envelope exceeds the channel slot size.
    Capacity,              ///< Fixed table (endpoints, counters) exhausted.
    SystemError,           ///< OS call failed (fork, mmap, pthread init).
    ConfigError            ///< Settings file unreadable or inconsistent.
};

/// Stable, log-friendly name of an error code.
const char* to_string(ErrorCode code) noexcept;

/// Error value: machine-readable code plus human detail.
struct Error {
    ErrorCode   code{ErrorCode::InvalidArgument};
    std::string detail;
};

template <class T>
using Result = warden_detail::expected<T, Error>;

/// Build the unexpected branch of a Result.
inline warden_detail::unexpected<Error> make_error(ErrorCode code, std::string detail = {}) {
    return warden_detail::unexpected<Error>(Error{code, std::move(detail)});
}

} // namespace warden
