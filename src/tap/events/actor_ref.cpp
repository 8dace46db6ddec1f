/**
 * @file actor_ref.cpp
 * @brief ActorRef state transitions.
 */
#include "tap/events/actor_ref.hpp"

#include <utility>

namespace tap::events {

ActorRef ActorRef::live(const std::shared_ptr<session::Session>& s) {
    ActorRef r;
    if (s) r.state_ = Live{s, s->id()};
    return r;
}

ActorRef ActorRef::unresolved(session::ActorSnapshot snapshot) {
    ActorRef r;
    r.state_ = Snapshot{std::move(snapshot)};
    return r;
}

std::shared_ptr<session::Session> ActorRef::lock() const noexcept {
    if (const auto* l = std::get_if<Live>(&state_)) return l->handle.lock();
    return nullptr;
}

std::optional<session::ActorSnapshot> ActorRef::snapshot() const {
    if (const auto* l = std::get_if<Live>(&state_))     return session::ActorSnapshot{l->id};
    if (const auto* s = std::get_if<Snapshot>(&state_)) return s->snapshot;
    return std::nullopt;
}

ActorRef ActorRef::resolved(const session::ActorResolver& resolver) const {
    const auto* s = std::get_if<Snapshot>(&state_);
    if (!s) return *this;
    // Not found → Absent (ActorRef::live of nullptr).
    return live(resolver.resolve(s->snapshot));
}

} // namespace tap::events
