/**
 * @file spsc_queue.hpp
 * @brief Single-producer/single-consumer ring buffer (owning).
 *
 * Carries forked asynchronous PacketEvents from the dispatch thread (producer)
 * to the deferred worker (consumer).
 *
 * Design goals:
 *  - Exception-free hot path (push/pop return bool).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Slots hold raw storage; elements are constructed on push and destroyed
 *    on pop, so T need not be default-constructible or trivially copyable.
 *
 * @tparam T Element type. Must be nothrow-move-constructible.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "tap/compat/expected.hpp"  // tap_detail::expected / unexpected

namespace tap::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class SpscError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed,          ///< Aligned allocation failed
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

  /// Uninitialized slot; an element lives here only between push and pop.
  struct Slot {
    alignas(T) unsigned char bytes[sizeof(T)];
    T*       ptr() noexcept       { return std::launder(reinterpret_cast<T*>(bytes)); }
    const T* ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(bytes)); }
  };

public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity_pow2 Ring capacity (power-of-two; usable depth is capacity-1).
   * @return expected<SpscQueue, SpscError> constructed queue or error.
   */
  static tap_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 == 0) {
      return tap_detail::unexpected(SpscError::CapacityZero);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return tap_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    }
    if constexpr (!std::is_nothrow_move_constructible_v<T>) {
      return tap_detail::unexpected(SpscError::ElementNotNothrowMovable);
    }

    std::unique_ptr<Slot[]> storage(new (std::nothrow) Slot[capacity_pow2]);
    if (!storage) {
      return tap_detail::unexpected(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    q.slots_    = std::move(storage);
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete; ///< Non-copyable
  SpscQueue& operator=(const SpscQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (never move a queue that is in use by two threads).
  SpscQueue(SpscQueue&& other) noexcept { move_from(std::move(other)); }

  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) {
      destroy_all();
      move_from(std::move(other));
    }
    return *this;
  }

  ~SpscQueue() { destroy_all(); }

  /**
   * @brief Construct an element in place at the tail.
   * @return false if queue is full (arguments are left untouched).
   */
  template <class... Args>
  bool emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args&&...>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    ::new (static_cast<void*>(slots_[t].bytes)) T(std::forward<Args>(args)...);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  bool push(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>) { return emplace(v); }
  bool push(T&& v) noexcept { return emplace(std::move(v)); }

  /**
   * @brief Move the head element into @p out and destroy the slot's copy.
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    T* elem = slots_[h].ptr();
    out = std::move(*elem);
    elem->~T();
    head_.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  /// @brief True if queue is empty (observer).
  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  /// @brief True if queue is full (observer).
  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & mask_) == head_.load(std::memory_order_acquire);
  }

  /// @brief Capacity (power-of-two). Usable depth is capacity()-1.
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + capacity_ - h) & mask_;
  }

private:
  void move_from(SpscQueue&& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    capacity_ = other.capacity_;
    mask_     = other.mask_;
    slots_    = std::move(other.slots_);
    other.head_.store(0, std::memory_order_relaxed);
    other.tail_.store(0, std::memory_order_relaxed);
    other.capacity_ = 0;
    other.mask_ = 0;
  }

  /// Destroy elements still queued. Only valid when no thread is using the ring.
  void destroy_all() noexcept {
    if (!slots_) return;
    std::size_t h = head_.load(std::memory_order_relaxed);
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    for (; h != t; h = (h + 1) & mask_) slots_[h].ptr()->~T();
    head_.store(t, std::memory_order_relaxed);
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  // Read-mostly metadata and owning storage
  alignas(kCacheLine) std::unique_ptr<Slot[]> slots_{}; ///< Raw element storage
  std::size_t                                 capacity_ = 0; ///< Capacity (power-of-two)
  std::size_t                                 mask_     = 0; ///< capacity_-1
};

} // namespace tap::mem
