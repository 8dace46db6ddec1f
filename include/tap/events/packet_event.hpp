#pragma once
// tap: PacketEvent
// One intercepted packet transmission on its way through the listener pipeline.
//
// Typestate:
//   • Pending: synchronous; listeners may replace the packet, cancel it, or
//     attach a continuation marker.
//   • Committed: asynchronous; produced only by derive_asynchronous(). The
//     marker is frozen because a deferred worker may already read it.
//   The transition is one-way and happens at most once (Pending → Committed).
//
// Concurrency model: single writer per instance, no internal locking.
// derive_asynchronous() copies every field, so the dispatch thread and the
// deferred worker never share mutable state after the fork.

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

#include "tap/compat/expected.hpp"
#include "tap/events/actor_ref.hpp"
#include "tap/events/continuation_marker.hpp"
#include "tap/mem/packet.hpp"

namespace tap::events {

/// Opaque identity of the pipeline stage that produced the event (non-owning).
/// nullptr means "unset"; it never crosses a serialization boundary.
using EventSource = const void*;

/// Which side of the connection created the packet.
enum class Direction : std::uint8_t {
    FromClient = 0,
    FromServer = 1
};

/// Errors reported by PacketEvent operations. Both indicate caller misuse.
enum class EventErr : std::uint8_t {
    InvalidState = 1, ///< Marker write or derivation on an asynchronous event.
    MissingPayload    ///< Payload-derived read while no packet is set.
};

[[nodiscard]] std::string_view to_string(EventErr e) noexcept;
[[nodiscard]] std::string_view to_string(Direction d) noexcept;

struct EventRecordAccess; // persisted-record codec (event_codec.cpp)

class PacketEvent final {
public:
    // --------------------------- Construction --------------------------------
    /// Packet sent by @p client.
    static PacketEvent from_client(EventSource source, mem::Packet packet,
                                   const std::shared_ptr<session::Session>& client);

    /// Packet about to be sent to @p recipient.
    static PacketEvent from_server(EventSource source, mem::Packet packet,
                                   const std::shared_ptr<session::Session>& recipient);

    /**
     * @brief Fork a synchronous event onto the deferred path.
     *
     * The result copies source, packet, actor, direction and cancellation of
     * @p original as they are now, carries @p marker, and is asynchronous.
     * @return EventErr::InvalidState if @p original is already asynchronous or
     *         @p marker is null.
     */
    [[nodiscard]] static tap_detail::expected<PacketEvent, EventErr>
    derive_asynchronous(const PacketEvent& original, MarkerPtr marker);

    /// Source-only scaffolding for listener tests and framework wiring.
    /// Packet, actor and direction stay unset.
    static PacketEvent placeholder(EventSource source) noexcept;

    PacketEvent(const PacketEvent&)            = default;
    PacketEvent& operator=(const PacketEvent&) = default;
    PacketEvent(PacketEvent&&) noexcept            = default;
    PacketEvent& operator=(PacketEvent&&) noexcept = default;

    /// Empty shell (placeholder with no source). Needed for queue slots.
    PacketEvent() noexcept = default;

    // --------------------------- Payload -------------------------------------
    /// @return nullptr when no packet is set.
    [[nodiscard]] const mem::Packet* packet() const noexcept { return packet_ ? &*packet_ : nullptr; }
    [[nodiscard]] mem::Packet*       packet() noexcept       { return packet_ ? &*packet_ : nullptr; }

    /// Replace the packet that continues down the pipeline (last write wins).
    void set_packet(mem::Packet packet) { packet_ = std::move(packet); }

    /// Identifier of the current packet, or MissingPayload.
    [[nodiscard]] tap_detail::expected<mem::PacketId, EventErr> packet_id() const noexcept;

    // --------------------------- Flags ---------------------------------------
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_; }
    void set_cancelled(bool cancel) noexcept { cancelled_ = cancel; }

    /// FromServer → true. False for client packets and placeholders.
    [[nodiscard]] bool is_server_originated() const noexcept {
        return direction_ == Direction::FromServer;
    }
    [[nodiscard]] std::optional<Direction> direction() const noexcept { return direction_; }

    [[nodiscard]] bool is_asynchronous() const noexcept {
        return std::holds_alternative<Committed>(stage_);
    }

    // --------------------------- Actor / source ------------------------------
    /// Session that sent or will receive the packet. May be null, and may be
    /// stale (check Session::connected()).
    [[nodiscard]] std::shared_ptr<session::Session> actor() const noexcept { return actor_.lock(); }
    [[nodiscard]] const ActorRef& actor_ref() const noexcept { return actor_; }

    [[nodiscard]] EventSource source() const noexcept { return source_; }

    // --------------------------- Continuation marker -------------------------
    /// @return the attached marker or nullptr.
    [[nodiscard]] const MarkerPtr& continuation_marker() const noexcept;

    /**
     * @brief Attach (or clear, with nullptr) the continuation marker.
     *
     * A non-null marker left in place when synchronous processing ends asks
     * the dispatcher to fork the packet onto the deferred path.
     * @return EventErr::InvalidState on an asynchronous event; the marker is
     *         left unchanged.
     */
    [[nodiscard]] tap_detail::expected<void, EventErr> set_continuation_marker(MarkerPtr marker);

private:
    struct Pending   { MarkerPtr marker; };
    struct Committed { MarkerPtr marker; };

    PacketEvent(EventSource source, std::optional<mem::Packet> packet, ActorRef actor,
                std::optional<Direction> direction) noexcept;

    friend struct EventRecordAccess;

    EventSource                        source_{nullptr};
    std::optional<mem::Packet>         packet_{};
    ActorRef                           actor_{};
    std::optional<Direction>           direction_{};
    bool                               cancelled_{false};
    std::variant<Pending, Committed>   stage_{Pending{}};
};

} // namespace tap::events
