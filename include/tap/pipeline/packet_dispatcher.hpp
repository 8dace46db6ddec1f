#pragma once
/**
 * @file packet_dispatcher.hpp
 * @brief Synchronous listener pass + fork onto the deferred queue.
 *
 * Thread roles:
 *  - Dispatch thread (single producer): calls dispatch_*() and create_marker().
 *  - Deferred worker (single consumer): calls poll_deferred().
 *  - Any thread: add_listener()/remove_listener() (copy-on-write list; a pass
 *    already running keeps the list it started with).
 *
 * Scheduling of the deferred worker is left to the caller.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "tap/compat/expected.hpp"
#include "tap/config/config_loader.hpp"
#include "tap/events/packet_event.hpp"
#include "tap/mem/spsc_queue.hpp"
#include "tap/obs/observability.hpp"
#include "tap/pipeline/outcome.hpp"
#include "tap/pipeline/packet_listener.hpp"

namespace tap::pipeline {

/** @struct DispatchResult
 *  @brief Synchronous event after the pass, plus what happened to it.
 */
struct DispatchResult {
    DispatchOutcome     outcome{DispatchOutcome::Delivered};
    uint64_t            sequence{0}; ///< Dispatcher-local sequence of this pass
    events::PacketEvent event;       ///< Pre-fork instance (packet to send when Delivered)
};

class PacketDispatcher final {
public:
    using ListenerList = std::vector<std::shared_ptr<PacketListener>>;

    /**
     * @brief Build a dispatcher and its deferred ring.
     * @param observer Sink for dispatch records; the process-wide log observer when null.
     */
    static tap_detail::expected<PacketDispatcher, mem::SpscError>
    create(const config::PipelineConfig& cfg, obs::Observer* observer = nullptr);

    PacketDispatcher(PacketDispatcher&& other) noexcept;
    PacketDispatcher& operator=(PacketDispatcher&&) = delete;
    PacketDispatcher(const PacketDispatcher&)            = delete;
    PacketDispatcher& operator=(const PacketDispatcher&) = delete;

    // --------------------------- Listeners -----------------------------------
    /// Insert after every listener of the same or lower priority.
    void add_listener(std::shared_ptr<PacketListener> listener);
    /// @return true if @p listener was registered.
    bool remove_listener(const PacketListener* listener);
    [[nodiscard]] std::size_t listener_count() const noexcept;

    // --------------------------- Dispatch ------------------------------------
    DispatchResult dispatch_from_client(events::EventSource source, mem::Packet packet,
                                        const std::shared_ptr<session::Session>& client);
    DispatchResult dispatch_from_server(events::EventSource source, mem::Packet packet,
                                        const std::shared_ptr<session::Session>& recipient);

    /**
     * @brief Run the synchronous pass over an already built event.
     *
     * Asynchronous events are not re-dispatched: they come back Delivered
     * without touching listeners or the queue.
     */
    DispatchResult dispatch(events::PacketEvent event);

    /// New marker with the next sequence number and the configured timeout.
    [[nodiscard]] events::MarkerPtr create_marker();

    /**
     * @brief create_marker() + attach it to @p event.
     *
     * The usual call from a listener that wants the packet processed out of line.
     * @return EventErr::InvalidState for an asynchronous event (reported to
     *         the observer; the event keeps its marker).
     */
    [[nodiscard]] tap_detail::expected<void, events::EventErr> mark_for_deferral(events::PacketEvent& event);

    // --------------------------- Deferred path -------------------------------
    /// Consumer side of the deferred ring. @return false when empty.
    bool poll_deferred(events::PacketEvent& out);
    [[nodiscard]] std::size_t deferred_depth() const noexcept { return deferred_.approx_size(); }

    [[nodiscard]] const config::PipelineConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] obs::Observer& observer() const noexcept { return *observer_; }

private:
    PacketDispatcher(config::PipelineConfig cfg, mem::SpscQueue<events::PacketEvent> ring,
                     obs::Observer* observer) noexcept;

    std::shared_ptr<const ListenerList> listeners() const noexcept;
    void run_listeners(const ListenerList& list, events::PacketEvent& event, uint64_t seq);
    void record(uint64_t seq, const events::PacketEvent& event, DispatchOutcome outcome,
                const char* reason);

    config::PipelineConfig               cfg_;
    mem::SpscQueue<events::PacketEvent>  deferred_;
    obs::Observer*                       observer_{nullptr};

    std::shared_ptr<const ListenerList>  listeners_{std::make_shared<ListenerList>()};
    std::mutex                           listeners_mu_; ///< Serializes writers only

    std::atomic<uint64_t>                next_sequence_{1};
    std::atomic<uint64_t>                next_marker_{config::constants::MARKER_FIRST_SEQUENCE};
};

} // namespace tap::pipeline
