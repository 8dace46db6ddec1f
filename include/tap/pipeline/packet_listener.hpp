#pragma once
/**
 * @file packet_listener.hpp
 * @brief Listener interface for the synchronous dispatch pass.
 */

#include <cstdint>
#include <string_view>

#include "tap/events/packet_event.hpp"
#include "tap/mem/packet.hpp"

namespace tap::pipeline {

/**
 * @enum ListenerPriority
 * @brief Call order within one dispatch pass, Lowest first.
 *
 * Monitor listeners run last and only observe: cancellation changes they make
 * are rolled back.
 */
enum class ListenerPriority : std::uint8_t {
    Lowest = 0,
    Low,
    Normal,
    High,
    Highest,
    Monitor
};

[[nodiscard]] std::string_view to_string(ListenerPriority p) noexcept;

class PacketListener {
public:
    virtual ~PacketListener() = default;

    /// Packet sent by a client (Direction::FromClient).
    virtual void on_receiving(events::PacketEvent& event) { (void)event; }

    /// Packet about to be sent to a client (Direction::FromServer).
    virtual void on_sending(events::PacketEvent& event) { (void)event; }

    virtual ListenerPriority priority() const noexcept { return ListenerPriority::Normal; }

    /// Filter on packet id; default is every packet.
    virtual bool wants(mem::PacketId id) const noexcept { (void)id; return true; }

    /// Label used in logs.
    virtual std::string_view name() const noexcept { return "listener"; }
};

} // namespace tap::pipeline
