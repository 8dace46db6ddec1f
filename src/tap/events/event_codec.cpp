/**
 * @file event_codec.cpp
 * @brief PacketEvent ⇄ JSON record.
 */
#include "tap/events/event_codec.hpp"
#include "tap/config/constants.hpp"
#include "tap/obs/observability.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace tap::events {

/// Restores the private fields a record carries.
struct EventRecordAccess {
    static PacketEvent restore(std::optional<mem::Packet> packet, ActorRef actor,
                               std::optional<Direction> direction, bool cancelled,
                               bool asynchronous) {
        PacketEvent e(nullptr, std::move(packet), std::move(actor), direction);
        e.cancelled_ = cancelled;
        // The marker is process-local: a restored asynchronous event is still
        // committed (frozen), it just carries no marker.
        if (asynchronous) e.stage_ = PacketEvent::Committed{};
        return e;
    }

    static PacketEvent with_actor(PacketEvent e, ActorRef actor) {
        e.actor_ = std::move(actor);
        return e;
    }
};

namespace {

constexpr const char* kFormatVersion = "format_version";
constexpr const char* kPacket        = "packet";
constexpr const char* kActor         = "actor_snapshot";
constexpr const char* kDirection     = "direction";
constexpr const char* kCancelled     = "cancelled";
constexpr const char* kAsynchronous  = "asynchronous";

std::optional<Direction> parse_direction(std::string_view s) noexcept {
    if (s == to_string(Direction::FromClient)) return Direction::FromClient;
    if (s == to_string(Direction::FromServer)) return Direction::FromServer;
    return std::nullopt;
}

} // namespace

std::string_view to_string(CodecErr e) noexcept {
    switch (e) {
        case CodecErr::Malformed:          return "malformed";
        case CodecErr::UnsupportedVersion: return "unsupported_version";
        case CodecErr::MissingField:       return "missing_field";
        case CodecErr::BadDirection:       return "bad_direction";
    }
    return "unknown";
}

//------------------------------- Encode ---------------------------------------

nlohmann::json encode(const PacketEvent& e) {
    nlohmann::json j;
    j[kFormatVersion] = config::constants::EVENT_RECORD_FORMAT_VERSION;
    j[kPacket]        = e.packet() ? nlohmann::json(*e.packet()) : nlohmann::json(nullptr);

    // Snapshot instead of the live handle; null when there is no actor.
    if (auto snap = e.actor_ref().snapshot()) {
        j[kActor] = nlohmann::json{{"id", snap->id}};
    } else {
        j[kActor] = nullptr;
    }

    if (auto d = e.direction()) j[kDirection] = std::string(to_string(*d));
    else                        j[kDirection] = nullptr;

    j[kCancelled]    = e.is_cancelled();
    j[kAsynchronous] = e.is_asynchronous();
    return j;
}

std::string serialize(const PacketEvent& e) {
    return encode(e).dump();
}

//------------------------------- Decode ---------------------------------------

tap_detail::expected<PacketEvent, CodecErr> decode_unresolved(const nlohmann::json& record) {
    if (!record.is_object()) return tap_detail::unexpected(CodecErr::Malformed);

    for (const char* key : {kFormatVersion, kPacket, kActor, kDirection, kCancelled, kAsynchronous}) {
        if (!record.contains(key)) {
            return tap_detail::unexpected(std::string_view(key) == kFormatVersion ? CodecErr::UnsupportedVersion
                                                                : CodecErr::MissingField);
        }
    }

    const auto& ver = record[kFormatVersion];
    if (!ver.is_number_integer() ||
        ver.get<int64_t>() != static_cast<int64_t>(config::constants::EVENT_RECORD_FORMAT_VERSION)) {
        return tap_detail::unexpected(CodecErr::UnsupportedVersion);
    }

    try {
        std::optional<mem::Packet> packet;
        if (const auto& p = record[kPacket]; !p.is_null()) packet = p.get<mem::Packet>();

        ActorRef actor;
        if (const auto& a = record[kActor]; !a.is_null()) {
            actor = ActorRef::unresolved(session::ActorSnapshot{a.at("id").get<std::string>()});
        }

        std::optional<Direction> direction;
        if (const auto& d = record[kDirection]; !d.is_null()) {
            direction = parse_direction(d.get<std::string>());
            if (!direction) return tap_detail::unexpected(CodecErr::BadDirection);
        }

        const auto& c = record[kCancelled];
        const auto& s = record[kAsynchronous];
        if (!c.is_boolean() || !s.is_boolean()) return tap_detail::unexpected(CodecErr::Malformed);

        return EventRecordAccess::restore(std::move(packet), std::move(actor), direction,
                                          c.get<bool>(), s.get<bool>());
    } catch (const nlohmann::json::exception&) {
        return tap_detail::unexpected(CodecErr::Malformed);
    } catch (const std::logic_error&) {
        // Packet fields that are not integers or do not fit their type.
        return tap_detail::unexpected(CodecErr::Malformed);
    }
}

tap_detail::expected<PacketEvent, CodecErr>
decode(const nlohmann::json& record, const session::ActorResolver& resolver, obs::Observer* observer) {
    auto e = decode_unresolved(record);
    if (!e || !e->actor_ref().is_unresolved()) return e;

    const auto snap = e->actor_ref().snapshot();
    ActorRef resolved = e->actor_ref().resolved(resolver);
    if (resolved.is_absent()) {
        // Partial reconstruction: keep the event, drop the actor.
        if (observer) observer->actor_unresolved(*snap);
        else          obs::logger()->debug("actor '{}' did not resolve", snap->id);
    }
    return EventRecordAccess::with_actor(std::move(*e), std::move(resolved));
}

tap_detail::expected<PacketEvent, CodecErr>
deserialize(std::string_view text, const session::ActorResolver& resolver, obs::Observer* observer) {
    const auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) return tap_detail::unexpected(CodecErr::Malformed);
    return decode(doc, resolver, observer);
}

} // namespace tap::events
