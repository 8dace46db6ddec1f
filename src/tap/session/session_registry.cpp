// SessionRegistry: RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock write_mu_, copy current map, mutate, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "tap/session/session_registry.hpp"

#include <utility>

namespace tap::session {

std::string_view to_string(RegistryErr e) noexcept {
    switch (e) {
        case RegistryErr::Ok:       return "ok";
        case RegistryErr::Exists:   return "exists";
        case RegistryErr::NotFound: return "not_found";
        case RegistryErr::Invalid:  return "invalid";
        case RegistryErr::Capacity: return "capacity";
    }
    return "unknown";
}

//------------------------------- Validation -----------------------------------

bool SessionRegistry::validate_id(std::string_view id) noexcept {
    if (id.size() < Limits::MinIdLen || id.size() > Limits::MaxIdLen) return false;
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '.' || c == '@' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const SessionRegistry::Map>
SessionRegistry::snapshot() const noexcept {
    // Pairs with the RELEASE store in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::shared_ptr<Session> SessionRegistry::find(std::string_view id) const noexcept {
    auto snap = snapshot();
    if (!snap) return nullptr;
    auto it = snap->find(id);
    return it == snap->end() ? nullptr : it->second;
}

bool SessionRegistry::contains(std::string_view id) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(id) != snap->end());
}

std::size_t SessionRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<SessionId> SessionRegistry::list_ids() const {
    std::vector<SessionId> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    return out;
}

std::shared_ptr<Session> SessionRegistry::resolve(const ActorSnapshot& snapshot) const {
    resolves_.fetch_add(1, std::memory_order_relaxed);
    auto s = find(snapshot.id);
    if (!s || !s->connected()) {
        resolve_misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    return s;
}

RegistryErr SessionRegistry::add(std::shared_ptr<Session> session) {
    return mutate(Mode::Add, std::move(session));
}

RegistryErr SessionRegistry::replace(std::shared_ptr<Session> session) {
    return mutate(Mode::Replace, std::move(session));
}

RegistryErr SessionRegistry::upsert(std::shared_ptr<Session> session) {
    return mutate(Mode::Upsert, std::move(session));
}

bool SessionRegistry::remove(std::string_view id) noexcept {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->find(id) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(next->find(id));
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void SessionRegistry::clear() noexcept {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
    // Not counted as success or failure; maintenance op.
}

SessionRegistry::Stats SessionRegistry::stats() const noexcept {
    Stats s;
    s.adds           = adds_.load(std::memory_order_relaxed);
    s.replaces       = replaces_.load(std::memory_order_relaxed);
    s.upserts        = upserts_.load(std::memory_order_relaxed);
    s.removes        = removes_.load(std::memory_order_relaxed);
    s.failures       = failures_.load(std::memory_order_relaxed);
    s.resolves       = resolves_.load(std::memory_order_relaxed);
    s.resolve_misses = resolve_misses_.load(std::memory_order_relaxed);
    return s;
}

//------------------------------- Mutation Core --------------------------------

void SessionRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RELEASE pairs with reader ACQUIRE so the fully built map is visible.
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RegistryErr SessionRegistry::fail(RegistryErr e) noexcept {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return e;
}

RegistryErr SessionRegistry::mutate(Mode mode, std::shared_ptr<Session> session) {
    if (!session || !validate_id(session->id())) return fail(RegistryErr::Invalid);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap) return fail(RegistryErr::Invalid);

    const bool exists = snap->find(session->id()) != snap->end();
    if (mode == Mode::Add && exists)      return fail(RegistryErr::Exists);
    if (mode == Mode::Replace && !exists) return fail(RegistryErr::NotFound);
    if (!exists && snap->size() >= Limits::MaxSessions) return fail(RegistryErr::Capacity);

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    const SessionId id = session->id();
    (*next)[id] = std::move(session);
    publish(std::move(next));

    switch (mode) {
        case Mode::Add:     adds_.fetch_add(1, std::memory_order_relaxed);     break;
        case Mode::Replace: replaces_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Upsert:  upserts_.fetch_add(1, std::memory_order_relaxed);  break;
    }
    return RegistryErr::Ok;
}

} // namespace tap::session
