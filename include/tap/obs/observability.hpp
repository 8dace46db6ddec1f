#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: dispatch records + counters, backed by spdlog.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "tap/events/packet_event.hpp"
#include "tap/pipeline/outcome.hpp"
#include "tap/session/actor_resolver.hpp"

namespace tap::obs {

    /** @struct Counters
     *  @brief Process-level counters for pipeline decisions.
     */
    struct Counters {
        uint64_t dispatched{0};                ///< Events that went through a synchronous pass
        uint64_t delivered{0};                 ///< Continued on the normal path
        uint64_t cancelled{0};                 ///< Cancelled by a listener
        uint64_t deferred{0};                  ///< Forked onto the deferred queue
        uint64_t deferred_dropped{0};          ///< Fork attempted, queue full
        uint64_t marker_rejections{0};         ///< Marker writes refused on asynchronous events
        uint64_t actor_resolution_failures{0}; ///< Snapshots that did not resolve on decode
    };

    /** @struct DispatchRecord
     *  @brief Payload describing what happened to one packet.
     */
    struct DispatchRecord {
        uint64_t                         sequence{0};  ///< Dispatcher-local sequence
        std::optional<mem::PacketId>     packet_id;  ///< Final packet id (after replacement); unset without payload
        std::optional<events::Direction> direction;  ///< Unset for placeholder events
        pipeline::DispatchOutcome        outcome{pipeline::DispatchOutcome::Delivered};
        std::string                      actor_id;   ///< Empty when the event has no actor
        std::string                      reason;     ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record one dispatch decision.
        virtual void record(const DispatchRecord& r) = 0;
        /// A listener or worker tried to re-mark a committed event.
        virtual void marker_rejected(uint64_t sequence) = 0;
        /// A persisted actor snapshot no longer names a live session.
        virtual void actor_unresolved(const session::ActorSnapshot& snapshot) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// One-line JSON rendering of @p r. Strings are escaped; unset fields are null.
    std::string format_record(const DispatchRecord& r);

    /// Process-wide spdlog-backed observer.
    Observer* make_log_observer();

    /// Fresh spdlog-backed observer with its own counters (tests, per-pipeline wiring).
    std::unique_ptr<Observer> make_counting_observer();

    /// Library logger ("tap"); created on first use, colored stdout sink.
    std::shared_ptr<spdlog::logger> logger();

    /// Names accepted by set_log_level: trace, debug, info, warn, error, critical, off.
    bool is_valid_log_level(std::string_view level) noexcept;

    /// Apply @p level to the library logger. Returns false for unknown names.
    bool set_log_level(std::string_view level);

} // namespace tap::obs
