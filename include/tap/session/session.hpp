/**
 * @file session.hpp
 * @brief Live connection entity (the "actor" of a packet event).
 *
 * A Session is owned by the transport layer (via SessionRegistry). Packet
 * events only hold a weak relation to it, so a session may be disconnected or
 * destroyed while events that reference it are still in flight.
 */
#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

namespace tap::session {

/// Stable, durable identifier of a session (account or session key).
using SessionId = std::string;

class Session final {
public:
    Session(SessionId id, std::string remote_endpoint)
        : id_(std::move(id)), remote_endpoint_(std::move(remote_endpoint)) {}

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const SessionId&   id() const noexcept { return id_; }
    [[nodiscard]] const std::string& remote_endpoint() const noexcept { return remote_endpoint_; }

    /// False once the transport has torn the connection down.
    [[nodiscard]] bool connected() const noexcept { return connected_.load(std::memory_order_acquire); }

    /// Mark the connection closed. Idempotent, callable from any thread.
    void disconnect() noexcept { connected_.store(false, std::memory_order_release); }

private:
    SessionId         id_;
    std::string       remote_endpoint_;
    std::atomic<bool> connected_{true};
};

} // namespace tap::session
