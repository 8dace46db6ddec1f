#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tap::mem {

/**
 * @file packet.hpp
 * @brief Packet payload container carried by a PacketEvent.
 *
 * The pipeline treats a Packet as an opaque owned value: it only reads the
 * identifier and copies the whole container when an event forks. Field level
 * decoding of the payload bytes belongs to the protocol layer above.
 */

/// @brief Protocol-level packet identifier (opcode).
using PacketId = std::int32_t;

/**
 * @brief Value-semantic packet container.
 *
 * Copies are deep, so two events never alias the same payload bytes.
 */
struct Packet final {
  /// @brief Protocol identifier of the packet.
  PacketId id{0};

  /// @brief Raw payload bytes (already framed, not interpreted here).
  std::vector<std::uint8_t> payload{};

  /// @brief Payload length in bytes.
  std::size_t length() const noexcept { return payload.size(); }

  /// Structural equality (id and bytes).
  bool operator==(const Packet&) const = default;
};

/// JSON form: {"id": <int>, "payload": [<byte>, ...]}.
void to_json(nlohmann::json& j, const Packet& p);
/// Throws nlohmann::json::exception on missing fields, std::invalid_argument on
/// non-integer values, std::out_of_range on ids or bytes that do not fit.
void from_json(const nlohmann::json& j, Packet& p);

} // namespace tap::mem
