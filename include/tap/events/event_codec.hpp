#pragma once
/**
 * @file event_codec.hpp
 * @brief Persisted/transport record of a PacketEvent (JSON, nlohmann::json).
 *
 * Record layout (format_version 1):
 * @code
 * {
 *   "format_version": 1,
 *   "packet":         {"id": 10, "payload": [..]} | null,
 *   "actor_snapshot": {"id": "alice"} | null,
 *   "direction":      "from_client" | "from_server" | null,
 *   "cancelled":      false,
 *   "asynchronous":   false
 * }
 * @endcode
 *
 * The source handle and the continuation marker are process-local and never
 * written. The live actor is replaced by its snapshot; on decode the snapshot
 * goes through an ActorResolver, and a miss leaves the actor absent instead
 * of failing the decode.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "tap/compat/expected.hpp"
#include "tap/events/packet_event.hpp"
#include "tap/session/actor_resolver.hpp"

namespace tap::obs { class Observer; }

namespace tap::events {

/// Reasons a record was rejected. Actor resolution misses are not errors.
enum class CodecErr : std::uint8_t {
    Malformed = 1,      ///< Not JSON, or a field has the wrong type
    UnsupportedVersion, ///< format_version is missing or unknown
    MissingField,       ///< A required key is absent
    BadDirection        ///< direction is not a known value
};

[[nodiscard]] std::string_view to_string(CodecErr e) noexcept;

/// Build the persisted record for @p e.
[[nodiscard]] nlohmann::json encode(const PacketEvent& e);

/// encode() rendered as compact JSON text.
[[nodiscard]] std::string serialize(const PacketEvent& e);

/**
 * @brief Rebuild an event without resolving the actor.
 * @return Event whose actor_ref() is unresolved (or absent if none was stored).
 */
[[nodiscard]] tap_detail::expected<PacketEvent, CodecErr> decode_unresolved(const nlohmann::json& record);

/**
 * @brief Rebuild an event and resolve its actor through @p resolver.
 * @param observer Optional sink told about snapshots that did not resolve.
 */
[[nodiscard]] tap_detail::expected<PacketEvent, CodecErr>
decode(const nlohmann::json& record, const session::ActorResolver& resolver,
       obs::Observer* observer = nullptr);

/// decode() from JSON text.
[[nodiscard]] tap_detail::expected<PacketEvent, CodecErr>
deserialize(std::string_view text, const session::ActorResolver& resolver,
            obs::Observer* observer = nullptr);

} // namespace tap::events
