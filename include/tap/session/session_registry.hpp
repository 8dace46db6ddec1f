#pragma once
// tap: SessionRegistry
// Live sessions keyed by their durable id. This is the actor registry that
// rebuilds packet events consult when turning a persisted ActorSnapshot back
// into a live session.
//
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers (dispatch threads, codec) take a snapshot with ACQUIRE semantics.
//   • Writers (transport connect/disconnect) serialize on a mutex, copy the
//     map, mutate, and publish with RELEASE semantics.
//   • Readers never block writers; writers never block readers.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tap/config/constants.hpp"
#include "tap/session/actor_resolver.hpp"
#include "tap/session/session.hpp"

namespace tap::session {

/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< Add failed because the id is already registered.
    NotFound,   ///< Replace failed because the id is not registered.
    Invalid,    ///< Null session or malformed id.
    Capacity    ///< Registry is full.
};

[[nodiscard]] std::string_view to_string(RegistryErr e) noexcept;

/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxSessions = config::constants::SESSION_REGISTRY_MAX_SESSIONS;
    static constexpr std::size_t MinIdLen    = config::constants::SESSION_ID_MIN_LEN;
    static constexpr std::size_t MaxIdLen    = config::constants::SESSION_ID_MAX_LEN;
};

///
/// Maintains SessionId → live Session.
/// - Reads: grab shared_ptr snapshot, consistent, non-blocking.
/// - Writes: copy-on-write full map, atomic swap, version increment.
/// - Non-throwing mutations: return RegistryErr codes.
///
/// The registry co-owns sessions with the transport; packet events only keep
/// weak references, so removing a session here lets it expire once the
/// transport lets go.
//
class SessionRegistry final : public ActorResolver {
public:
    // Transparent hash/equal functors enable lookup with string_view keys.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, std::shared_ptr<Session>, SKeyHash, SKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the entire registry map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    // --------------------------- Read utilities ------------------------------
    /// Registered session for @p id (connected or not), or nullptr.
    [[nodiscard]] std::shared_ptr<Session> find(std::string_view id) const noexcept;
    [[nodiscard]] bool contains(std::string_view id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<SessionId> list_ids() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    /// ActorResolver: registered and still connected, otherwise nullptr.
    std::shared_ptr<Session> resolve(const ActorSnapshot& snapshot) const override;

    // --------------------------- Mutations -----------------------------------
    /// Register a new session. Fails if the id is taken.
    RegistryErr add(std::shared_ptr<Session> session);

    /// Swap the session registered under the same id (reconnect).
    RegistryErr replace(std::shared_ptr<Session> session);

    /// Insert or replace.
    RegistryErr upsert(std::shared_ptr<Session> session);

    /// Drop a session. Returns true if it was registered.
    bool remove(std::string_view id) noexcept;

    /// Drop every session. Maintenance operation.
    void clear() noexcept;

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t adds{0}, replaces{0}, upserts{0}, removes{0}, failures{0};
        uint64_t resolves{0}, resolve_misses{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

    /// Id rules: [A-Za-z0-9_.@-], length within Limits.
    static bool validate_id(std::string_view id) noexcept;

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_; // one copy-on-write at a time

    std::atomic<uint64_t> adds_{0}, replaces_{0}, upserts_{0}, removes_{0}, failures_{0};
    mutable std::atomic<uint64_t> resolves_{0}, resolve_misses_{0};

    enum class Mode { Add, Replace, Upsert };

    RegistryErr mutate(Mode mode, std::shared_ptr<Session> session);
    void publish(std::shared_ptr<Map> next) noexcept;
    RegistryErr fail(RegistryErr e) noexcept;
};

} // namespace tap::session
