#pragma once
/**
 * @file continuation_marker.hpp
 * @brief Token that moves a packet event from the synchronous to the deferred path.
 * @details PacketEvent stores and hands over the token but never interprets it.
 *          The fields here are consumed by whatever worker drains the deferred
 *          queue. Counters are atomic because the worker and late synchronous
 *          listeners may touch the same marker.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace tap::events {

/** @class ContinuationMarker
 *  @brief Deferred-processing ticket for one packet.
 */
class ContinuationMarker final {
public:
    using clock = std::chrono::steady_clock;

    ContinuationMarker(std::uint64_t sequence_number,
                       std::chrono::milliseconds timeout,
                       clock::time_point initial_time = clock::now()) noexcept
        : sequence_number_(sequence_number), timeout_(timeout), initial_time_(initial_time) {}

    ContinuationMarker(const ContinuationMarker&)            = delete;
    ContinuationMarker& operator=(const ContinuationMarker&) = delete;

    /// Position of the packet in its dispatcher's send order.
    [[nodiscard]] std::uint64_t sequence_number() const noexcept { return sequence_number_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    [[nodiscard]] clock::time_point initial_time() const noexcept { return initial_time_; }

    /// True once @p now is past initial_time + timeout.
    [[nodiscard]] bool has_expired(clock::time_point now = clock::now()) const noexcept {
        return now - initial_time_ >= timeout_;
    }

    /// Listeners that still need time on the packet before it may be sent.
    [[nodiscard]] int processing_delay() const noexcept {
        return processing_delay_.load(std::memory_order_acquire);
    }
    int increment_processing_delay() noexcept {
        return processing_delay_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }
    /// Never drops below zero. Returns the new value.
    int decrement_processing_delay() noexcept;

    [[nodiscard]] bool processed() const noexcept { return processed_.load(std::memory_order_acquire); }
    /// @return false if the marker had already been processed.
    bool mark_processed() noexcept { return !processed_.exchange(true, std::memory_order_acq_rel); }

private:
    const std::uint64_t             sequence_number_;
    const std::chrono::milliseconds timeout_;
    const clock::time_point         initial_time_;
    std::atomic<int>                processing_delay_{0};
    std::atomic<bool>               processed_{false};
};

/// Shared between the pre-fork event and the derived asynchronous event.
using MarkerPtr = std::shared_ptr<ContinuationMarker>;

} // namespace tap::events
