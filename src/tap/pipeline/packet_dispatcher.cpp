/**
 * @file packet_dispatcher.cpp
 * @brief Listener pass, cancellation, and the synchronous → asynchronous fork.
 */
#include "tap/pipeline/packet_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace tap::pipeline {

std::string_view to_string(ListenerPriority p) noexcept {
    switch (p) {
        case ListenerPriority::Lowest:  return "lowest";
        case ListenerPriority::Low:     return "low";
        case ListenerPriority::Normal:  return "normal";
        case ListenerPriority::High:    return "high";
        case ListenerPriority::Highest: return "highest";
        case ListenerPriority::Monitor: return "monitor";
    }
    return "unknown";
}

//------------------------------- Construction ---------------------------------

PacketDispatcher::PacketDispatcher(config::PipelineConfig cfg,
                                   mem::SpscQueue<events::PacketEvent> ring,
                                   obs::Observer* observer) noexcept
    : cfg_(std::move(cfg)),
      deferred_(std::move(ring)),
      observer_(observer ? observer : obs::make_log_observer()) {}

PacketDispatcher::PacketDispatcher(PacketDispatcher&& other) noexcept
    : cfg_(std::move(other.cfg_)),
      deferred_(std::move(other.deferred_)),
      observer_(other.observer_),
      listeners_(std::atomic_load_explicit(&other.listeners_, std::memory_order_acquire)),
      next_sequence_(other.next_sequence_.load(std::memory_order_relaxed)),
      next_marker_(other.next_marker_.load(std::memory_order_relaxed)) {}

tap_detail::expected<PacketDispatcher, mem::SpscError>
PacketDispatcher::create(const config::PipelineConfig& cfg, obs::Observer* observer) {
    auto ring = mem::SpscQueue<events::PacketEvent>::with_capacity(cfg.deferred_queue_capacity);
    if (!ring) {
        obs::logger()->error("deferred ring rejected capacity {}", cfg.deferred_queue_capacity);
        return tap_detail::unexpected(ring.error());
    }
    return PacketDispatcher(cfg, std::move(*ring), observer);
}

//------------------------------- Listeners ------------------------------------

std::shared_ptr<const PacketDispatcher::ListenerList> PacketDispatcher::listeners() const noexcept {
    return std::atomic_load_explicit(&listeners_, std::memory_order_acquire);
}

void PacketDispatcher::add_listener(std::shared_ptr<PacketListener> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lk(listeners_mu_);
    auto next = std::make_shared<ListenerList>(*listeners());
    const auto prio = listener->priority();
    auto pos = std::upper_bound(next->begin(), next->end(), prio,
                                [](ListenerPriority p, const std::shared_ptr<PacketListener>& l) {
                                    return p < l->priority();
                                });
    next->insert(pos, std::move(listener));
    std::shared_ptr<const ListenerList> cnext = std::move(next);
    std::atomic_store_explicit(&listeners_, std::move(cnext), std::memory_order_release);
}

bool PacketDispatcher::remove_listener(const PacketListener* listener) {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    auto next = std::make_shared<ListenerList>(*listeners());
    auto it = std::find_if(next->begin(), next->end(),
                           [&](const auto& l) { return l.get() == listener; });
    if (it == next->end()) return false;
    next->erase(it);
    std::shared_ptr<const ListenerList> cnext = std::move(next);
    std::atomic_store_explicit(&listeners_, std::move(cnext), std::memory_order_release);
    return true;
}

std::size_t PacketDispatcher::listener_count() const noexcept {
    return listeners()->size();
}

//------------------------------- Markers --------------------------------------

events::MarkerPtr PacketDispatcher::create_marker() {
    const auto seq = next_marker_.fetch_add(1, std::memory_order_relaxed);
    return std::make_shared<events::ContinuationMarker>(
        seq, std::chrono::milliseconds(cfg_.marker_timeout_ms));
}

tap_detail::expected<void, events::EventErr>
PacketDispatcher::mark_for_deferral(events::PacketEvent& event) {
    if (event.is_asynchronous()) {
        const auto& frozen = event.continuation_marker();
        observer_->marker_rejected(frozen ? frozen->sequence_number() : 0);
        return tap_detail::unexpected(events::EventErr::InvalidState);
    }
    return event.set_continuation_marker(create_marker());
}

//------------------------------- Dispatch -------------------------------------

DispatchResult PacketDispatcher::dispatch_from_client(events::EventSource source, mem::Packet packet,
                                                      const std::shared_ptr<session::Session>& client) {
    return dispatch(events::PacketEvent::from_client(source, std::move(packet), client));
}

DispatchResult PacketDispatcher::dispatch_from_server(events::EventSource source, mem::Packet packet,
                                                      const std::shared_ptr<session::Session>& recipient) {
    return dispatch(events::PacketEvent::from_server(source, std::move(packet), recipient));
}

void PacketDispatcher::run_listeners(const ListenerList& list, events::PacketEvent& event, uint64_t seq) {
    for (const auto& l : list) {
        // Listeners may replace the packet, so filter on the current id.
        const auto id = event.packet_id();
        if (id && !l->wants(*id)) continue;

        const bool monitor   = l->priority() == ListenerPriority::Monitor;
        const bool cancelled = event.is_cancelled();
        try {
            if (event.is_server_originated()) l->on_sending(event);
            else                              l->on_receiving(event);
        } catch (const std::exception& ex) {
            // A faulty listener must not take the packet down with it.
            obs::logger()->error("listener '{}' threw on seq={}: {}", l->name(), seq, ex.what());
        }
        if (monitor) event.set_cancelled(cancelled);
    }
}

void PacketDispatcher::record(uint64_t seq, const events::PacketEvent& event, DispatchOutcome outcome,
                              const char* reason) {
    obs::DispatchRecord r;
    r.sequence  = seq;
    if (auto id = event.packet_id()) r.packet_id = *id;
    r.direction = event.direction();
    r.outcome   = outcome;
    if (auto snap = event.actor_ref().snapshot()) r.actor_id = snap->id;
    r.reason    = reason;
    observer_->record(r);
}

DispatchResult PacketDispatcher::dispatch(events::PacketEvent event) {
    const auto seq = next_sequence_.fetch_add(1, std::memory_order_relaxed);

    if (event.is_asynchronous()) {
        record(seq, event, DispatchOutcome::Delivered, "already_asynchronous");
        return DispatchResult{DispatchOutcome::Delivered, seq, std::move(event)};
    }

    const auto list = listeners(); // snapshot for the whole pass
    run_listeners(*list, event, seq);

    if (const auto& marker = event.continuation_marker()) {
        // Fork: the clone owns its copy of the packet and carries the marker.
        auto forked = events::PacketEvent::derive_asynchronous(event, marker);
        if (!forked) {
            // Unreachable for a Pending event with a non-null marker.
            obs::logger()->error("fork failed on seq={}: {}", seq, events::to_string(forked.error()));
            record(seq, event, DispatchOutcome::DeferredDropped, "fork_failed");
            return DispatchResult{DispatchOutcome::DeferredDropped, seq, std::move(event)};
        }
        if (!deferred_.push(std::move(*forked))) {
            record(seq, event, DispatchOutcome::DeferredDropped, "deferred_queue_full");
            return DispatchResult{DispatchOutcome::DeferredDropped, seq, std::move(event)};
        }
        record(seq, event, DispatchOutcome::Deferred, "marker_attached");
        return DispatchResult{DispatchOutcome::Deferred, seq, std::move(event)};
    }

    if (event.is_cancelled()) {
        record(seq, event, DispatchOutcome::Cancelled, "listener_cancelled");
        return DispatchResult{DispatchOutcome::Cancelled, seq, std::move(event)};
    }

    record(seq, event, DispatchOutcome::Delivered, "no_marker");
    return DispatchResult{DispatchOutcome::Delivered, seq, std::move(event)};
}

bool PacketDispatcher::poll_deferred(events::PacketEvent& out) {
    return deferred_.pop(out);
}

} // namespace tap::pipeline
