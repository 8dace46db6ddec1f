/**
 * @file handoff_bench.cpp
 * @brief Microbenchmark for the synchronous → deferred handoff (1 producer / 1 consumer).
 *
 * Two runs per ring capacity:
 *   1) `int` through a bare SpscQueue (ring cost floor)
 *   2) full PacketDispatcher pass: one listener marks every packet, the event
 *      is forked (deep copy) and consumed by a worker via poll_deferred()
 *
 * Reports: items/sec and ns per item.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "tap/mem/spsc_queue.hpp"
#include "tap/obs/observability.hpp"
#include "tap/pipeline/packet_dispatcher.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;             // e.g., "dispatch@1024"
  std::size_t N = 0;            // items transferred
  double      seconds = 0.0;    // wall time
  double      items_per_s = 0.0;
  double      ns_per_item = 0.0;
};

inline void backoff() noexcept {
  std::this_thread::yield();
}

Result finish(std::string name, std::size_t N, clock::time_point t0, clock::time_point t1) {
  const double seconds = std::chrono::duration_cast<ns>(t1 - t0).count() / 1e9;
  Result r;
  r.name        = std::move(name);
  r.N           = N;
  r.seconds     = seconds;
  r.items_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  r.ns_per_item = (r.items_per_s > 0.0) ? 1e9 / r.items_per_s : 0.0;
  return r;
}

// -----------------------------------------------------------------------------
// Ring floor: ints through a bare SpscQueue
// -----------------------------------------------------------------------------
Result run_ring(std::size_t capacity_pow2, std::size_t N) {
  auto qexp = tap::mem::SpscQueue<int>::with_capacity(capacity_pow2);
  if (!qexp) {
    std::cerr << "Failed to create SpscQueue<int> with capacity " << capacity_pow2 << "\n";
    std::exit(1);
  }
  auto q = std::make_shared<tap::mem::SpscQueue<int>>(std::move(*qexp));

  std::barrier sync(2);
  clock::time_point t_start, t_end;

  std::thread prod([&] {
    sync.arrive_and_wait();
    for (std::size_t i = 0; i < N;) {
      if (q->push(static_cast<int>(i))) ++i;
      else backoff();
    }
  });
  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    int v{};
    for (std::size_t got = 0; got < N;) {
      if (q->pop(v)) ++got;
      else backoff();
    }
    t_end = clock::now();
  });
  prod.join(); cons.join();
  return finish("int@" + std::to_string(capacity_pow2), N, t_start, t_end);
}

// -----------------------------------------------------------------------------
// Full dispatch: listener pass + fork + deferred poll
// -----------------------------------------------------------------------------
class MarkAll final : public tap::pipeline::PacketListener {
public:
  explicit MarkAll(tap::pipeline::PacketDispatcher& d) : d_(d) {}
  void on_receiving(tap::events::PacketEvent& e) override { (void)d_.mark_for_deferral(e); }
private:
  tap::pipeline::PacketDispatcher& d_;
};

Result run_dispatch(std::size_t capacity_pow2, std::size_t N) {
  tap::config::PipelineConfig cfg;
  cfg.deferred_queue_capacity = capacity_pow2;
  auto counters = tap::obs::make_counting_observer();
  auto dexp = tap::pipeline::PacketDispatcher::create(cfg, counters.get());
  if (!dexp) {
    std::cerr << "Failed to create PacketDispatcher with capacity " << capacity_pow2 << "\n";
    std::exit(1);
  }
  auto& d = *dexp;
  d.add_listener(std::make_shared<MarkAll>(d));

  auto actor = std::make_shared<tap::session::Session>("bench", "127.0.0.1:1");
  const tap::mem::Packet proto{10, std::vector<std::uint8_t>(64, 0xAB)};

  std::barrier sync(2);
  clock::time_point t_start, t_end;
  std::atomic<std::size_t> dropped{0};

  std::thread prod([&] {
    sync.arrive_and_wait();
    for (std::size_t i = 0; i < N;) {
      auto r = d.dispatch_from_client(nullptr, proto, actor);
      if (r.outcome == tap::pipeline::DispatchOutcome::Deferred) ++i;
      else { dropped.fetch_add(1, std::memory_order_relaxed); backoff(); }
    }
  });
  std::thread cons([&] {
    sync.arrive_and_wait();
    t_start = clock::now();
    tap::events::PacketEvent ev;
    for (std::size_t got = 0; got < N;) {
      if (d.poll_deferred(ev)) ++got;
      else backoff();
    }
    t_end = clock::now();
  });
  prod.join(); cons.join();

  auto r = finish("dispatch@" + std::to_string(capacity_pow2), N, t_start, t_end);
  std::cout << "  (ring-full retries: " << dropped.load() << ")\n";
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  items/s=" << std::setw(12) << r.items_per_s
            << "  ns/item=" << std::setw(10) << r.ns_per_item
            << '\n';
}

} // namespace bench

int main() {
  constexpr std::size_t N = 200'000;   // items per run
  const std::vector<std::size_t> caps = {256, 1024};

  // Per-packet debug lines would dominate the measurement.
  tap::obs::set_log_level("error");

  std::cout << "Deferred handoff microbenchmark (1P/1C)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto cap : caps) {
    bench::print(bench::run_ring(cap, N));
    bench::print(bench::run_dispatch(cap, N));
  }

  std::cout << std::flush;
  return 0;
}
