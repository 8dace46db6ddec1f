/**
 * @file packet_event.cpp
 * @brief PacketEvent construction, typestate transition and accessors.
 */
#include "tap/events/packet_event.hpp"

namespace tap::events {

std::string_view to_string(EventErr e) noexcept {
    switch (e) {
        case EventErr::InvalidState:   return "invalid_state";
        case EventErr::MissingPayload: return "missing_payload";
    }
    return "unknown";
}

std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::FromClient: return "from_client";
        case Direction::FromServer: return "from_server";
    }
    return "unknown";
}

//------------------------------- Construction ---------------------------------

PacketEvent::PacketEvent(EventSource source, std::optional<mem::Packet> packet, ActorRef actor,
                         std::optional<Direction> direction) noexcept
    : source_(source),
      packet_(std::move(packet)),
      actor_(std::move(actor)),
      direction_(direction) {}

PacketEvent PacketEvent::from_client(EventSource source, mem::Packet packet,
                                     const std::shared_ptr<session::Session>& client) {
    return PacketEvent(source, std::move(packet), ActorRef::live(client), Direction::FromClient);
}

PacketEvent PacketEvent::from_server(EventSource source, mem::Packet packet,
                                     const std::shared_ptr<session::Session>& recipient) {
    return PacketEvent(source, std::move(packet), ActorRef::live(recipient), Direction::FromServer);
}

PacketEvent PacketEvent::placeholder(EventSource source) noexcept {
    PacketEvent e;
    e.source_ = source;
    return e;
}

tap_detail::expected<PacketEvent, EventErr>
PacketEvent::derive_asynchronous(const PacketEvent& original, MarkerPtr marker) {
    // Only one hop exists: Pending → Committed.
    if (original.is_asynchronous() || !marker) {
        return tap_detail::unexpected(EventErr::InvalidState);
    }
    PacketEvent forked(original);   // value copy; no state shared with original
    forked.stage_ = Committed{std::move(marker)};
    return forked;
}

//------------------------------- Accessors ------------------------------------

tap_detail::expected<mem::PacketId, EventErr> PacketEvent::packet_id() const noexcept {
    if (!packet_) return tap_detail::unexpected(EventErr::MissingPayload);
    return packet_->id;
}

const MarkerPtr& PacketEvent::continuation_marker() const noexcept {
    return std::visit([](const auto& s) -> const MarkerPtr& { return s.marker; }, stage_);
}

tap_detail::expected<void, EventErr> PacketEvent::set_continuation_marker(MarkerPtr marker) {
    auto* pending = std::get_if<Pending>(&stage_);
    if (!pending) {
        // Committed has no marker setter; a deferred worker may be reading it.
        return tap_detail::unexpected(EventErr::InvalidState);
    }
    pending->marker = std::move(marker);
    return {};
}

} // namespace tap::events
