/**
 * @file main.cpp
 * @brief tap_demo: end-to-end wiring of the packet event pipeline.
 *
 * **Bootstrap**
 * Load config (JSON, defaults when absent); build SessionRegistry and PacketDispatcher.
 *
 * **Synchronous pass**
 * Listeners inspect packets; one cancels, one defers packet id 10 via a continuation marker.
 *
 * **Deferred path**
 * A worker thread drains the deferred ring (1P/1C) and finds every forked event frozen.
 *
 * **Persistence**
 * Round-trips an event through the JSON record, once with a live actor and once
 * after the actor disconnected (event restored without actor).
 *
 * Usage: tap_demo [config.json]
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "tap/config/config_loader.hpp"
#include "tap/events/event_codec.hpp"
#include "tap/obs/observability.hpp"
#include "tap/pipeline/packet_dispatcher.hpp"
#include "tap/session/session_registry.hpp"
#include "tap/version.hpp"

using namespace std::chrono_literals;

namespace {

constexpr tap::mem::PacketId kChatPacket  = 10;
constexpr tap::mem::PacketId kDebugPacket = 42;

/// Defers chat packets onto the out-of-line path.
class DeferChat final : public tap::pipeline::PacketListener {
public:
    explicit DeferChat(tap::pipeline::PacketDispatcher& d) : d_(d) {}
    void on_receiving(tap::events::PacketEvent& e) override {
        if (auto r = d_.mark_for_deferral(e); !r) {
            tap::obs::logger()->warn("defer refused: {}", tap::events::to_string(r.error()));
        }
    }
    bool wants(tap::mem::PacketId id) const noexcept override { return id == kChatPacket; }
    std::string_view name() const noexcept override { return "defer_chat"; }
private:
    tap::pipeline::PacketDispatcher& d_;
};

/// Drops debug packets from clients.
class DropDebug final : public tap::pipeline::PacketListener {
public:
    void on_receiving(tap::events::PacketEvent& e) override { e.set_cancelled(true); }
    bool wants(tap::mem::PacketId id) const noexcept override { return id == kDebugPacket; }
    tap::pipeline::ListenerPriority priority() const noexcept override {
        return tap::pipeline::ListenerPriority::High;
    }
    std::string_view name() const noexcept override { return "drop_debug"; }
};

} // namespace

int main(int argc, char** argv) {
    auto log = tap::obs::logger();
    log->info("tap_demo {}", tap::version_string);

    const std::string path = (argc > 1) ? argv[1] : "tap.json";
    auto cfg = tap::config::Loader::load_from_file(path);
    if (!cfg) {
        log->error("config rejected: {}", tap::config::to_string(cfg.error()));
        return 1;
    }
    tap::obs::set_log_level(cfg->log_level);

    tap::session::SessionRegistry registry;
    auto alice = std::make_shared<tap::session::Session>("alice", "192.0.2.10:50000");
    auto bob   = std::make_shared<tap::session::Session>("bob",   "198.51.100.20:50001");
    for (const auto& s : {alice, bob}) {
        if (const auto rc = registry.add(s); rc != tap::session::RegistryErr::Ok) {
            log->error("session '{}' not registered: {}", s->id(), tap::session::to_string(rc));
            return 1;
        }
    }

    auto dexp = tap::pipeline::PacketDispatcher::create(*cfg);
    if (!dexp) {
        log->error("dispatcher setup failed");
        return 1;
    }
    auto& dispatcher = *dexp;
    dispatcher.add_listener(std::make_shared<DeferChat>(dispatcher));
    dispatcher.add_listener(std::make_shared<DropDebug>());

    // Deferred worker: sole consumer of the ring.
    std::atomic<bool> running{true};
    std::thread worker([&] {
        tap::events::PacketEvent ev;
        while (running.load(std::memory_order_acquire) || dispatcher.deferred_depth() > 0) {
            if (!dispatcher.poll_deferred(ev)) { std::this_thread::sleep_for(1ms); continue; }
            const auto& marker = ev.continuation_marker();
            log->info("deferred seq={} packet_id={} cancelled={}",
                      marker->sequence_number(), ev.packet_id().value_or(0), ev.is_cancelled());
            if (dispatcher.mark_for_deferral(ev)) log->error("asynchronous event accepted a new marker");
            (void)marker->mark_processed();
        }
    });

    const int kSource = 0; // identity of this pipeline stage
    const tap::events::EventSource src = &kSource;

    (void)dispatcher.dispatch_from_client(src, tap::mem::Packet{kChatPacket, {'h', 'i'}}, alice);
    (void)dispatcher.dispatch_from_client(src, tap::mem::Packet{kDebugPacket, {}}, bob);
    auto sent = dispatcher.dispatch_from_server(src, tap::mem::Packet{7, {0x01, 0x02}}, bob);

    running.store(false, std::memory_order_release);
    worker.join();

    // Persistence: live actor, then a stale one.
    const auto record = tap::events::serialize(sent.event);
    log->info("record {}", record);
    if (auto back = tap::events::deserialize(record, registry, &dispatcher.observer())) {
        log->info("restored actor={}", back->actor() ? back->actor()->id() : "<absent>");
    }
    bob->disconnect();
    if (auto back = tap::events::deserialize(record, registry, &dispatcher.observer())) {
        log->info("restored after disconnect actor={}", back->actor() ? back->actor()->id() : "<absent>");
    }

    const auto c = dispatcher.observer().snapshot();
    log->info("dispatched={} delivered={} cancelled={} deferred={} dropped={} rejected={} unresolved={}",
              c.dispatched, c.delivered, c.cancelled, c.deferred, c.deferred_dropped,
              c.marker_rejections, c.actor_resolution_failures);
    return 0;
}
