#pragma once
/**
 * @file call_client.hpp
 * @brief Request/response over channels, multiplexed by correlation id.
 *
 * One CallClient owns the reading side of one reply channel. Any number of
 * threads may call() concurrently: at any moment one of them reads the channel
 * on behalf of all (in short slices) and hands replies to their owners.
 * A reply whose correlation id is no longer pending (its caller timed out) is
 * discarded and counted.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/core/error.hpp"
#include "warden/ipc/channel.hpp"
#include "warden/ipc/directory.hpp"
#include "warden/ipc/message.hpp"

namespace warden::runtime {

class CallClient final {
public:
    /**
     * @param endpoint_name Name replies are addressed to (the request's reply_to).
     * @param replies Reply channel of that endpoint.
     * @param dir Directory used to resolve call targets.
     */
    CallClient(std::string endpoint_name, ipc::Channel replies, const ipc::Directory& dir);

    CallClient(const CallClient&)            = delete;
    CallClient& operator=(const CallClient&) = delete;

    /**
     * @brief Send `action` to `target` and wait for its reply.
     * @return RESPONSE payload, or UnknownService / QueueOverflow /
     *         MessageTooLarge / ServiceTimeout / ServiceCallError ("reason: detail").
     */
    Result<ipc::Payload> call(std::string_view source, std::string_view target,
                              std::string_view action, ipc::Payload payload,
                              std::chrono::milliseconds timeout);

    const std::string& endpoint_name() const noexcept { return endpoint_name_; }

    /// Late or unmatched replies dropped so far.
    std::uint64_t discarded() const noexcept { return discarded_.load(std::memory_order_relaxed); }

private:
    std::optional<ipc::Message> await_reply(const std::string& correlation_id,
                                            std::chrono::steady_clock::time_point deadline);

    std::string           endpoint_name_;
    ipc::Channel          replies_;
    const ipc::Directory& dir_;

    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    reader_active_{false};
    std::unordered_map<std::string, std::optional<ipc::Message>> pending_;
    std::atomic<std::uint64_t> discarded_{0};
};

/// Map an ERROR reply to a ServiceCallError ("reason: message").
Error call_error_from(const ipc::Message& reply);

} // namespace warden::runtime
