#pragma once

#include <cstdint>
#include <string_view>

namespace tap::pipeline {

/// What the dispatcher did with a packet once the synchronous pass ended.
enum class DispatchOutcome : std::uint8_t {
    Delivered,       ///< Continue on the normal path (packet possibly replaced)
    Cancelled,       ///< A listener cancelled the packet
    Deferred,        ///< Forked onto the deferred queue
    DeferredDropped  ///< Marker attached but the deferred queue was full
};

constexpr std::string_view to_string(DispatchOutcome o) noexcept {
    switch (o) {
        case DispatchOutcome::Delivered:       return "delivered";
        case DispatchOutcome::Cancelled:       return "cancelled";
        case DispatchOutcome::Deferred:        return "deferred";
        case DispatchOutcome::DeferredDropped: return "deferred_dropped";
    }
    return "unknown";
}

} // namespace tap::pipeline
