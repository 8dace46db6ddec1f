/**
 * @file actor_ref.hpp
 * @brief Non-owning actor relation of a packet event.
 *
 * States:
 *  - Live:     weak handle to a session owned by the transport layer (may go stale).
 *  - Snapshot: identifier read back from a persisted record, not yet resolved.
 *  - Absent:   no actor (never set, or resolution failed).
 *
 * A Snapshot only exists between decoding and resolution; resolved() collapses
 * it to Live or Absent and leaves the other states untouched.
 */
#pragma once

#include <memory>
#include <optional>
#include <variant>

#include "tap/session/actor_resolver.hpp"
#include "tap/session/session.hpp"

namespace tap::events {

class ActorRef final {
public:
    /// @brief Weak handle plus the id captured when the handle was taken.
    struct Live {
        std::weak_ptr<session::Session> handle;
        session::SessionId              id;
    };
    struct Snapshot {
        session::ActorSnapshot snapshot;
    };
    struct Absent {};

    /// Absent.
    ActorRef() noexcept = default;

    /// Live reference to @p s; a null pointer yields Absent.
    static ActorRef live(const std::shared_ptr<session::Session>& s);

    /// Unresolved reference read back from a persisted record.
    static ActorRef unresolved(session::ActorSnapshot snapshot);

    [[nodiscard]] bool is_live() const noexcept       { return std::holds_alternative<Live>(state_); }
    [[nodiscard]] bool is_unresolved() const noexcept { return std::holds_alternative<Snapshot>(state_); }
    [[nodiscard]] bool is_absent() const noexcept     { return std::holds_alternative<Absent>(state_); }

    /// @brief Session handle, or nullptr when absent, unresolved, or expired.
    [[nodiscard]] std::shared_ptr<session::Session> lock() const noexcept;

    /// @brief Identity record to persist in place of the live handle.
    /// @return nullopt when absent.
    [[nodiscard]] std::optional<session::ActorSnapshot> snapshot() const;

    /// @brief Resolution step: Snapshot becomes Live (found) or Absent (not found).
    [[nodiscard]] ActorRef resolved(const session::ActorResolver& resolver) const;

private:
    std::variant<Absent, Live, Snapshot> state_{};
};

} // namespace tap::events
