#pragma once
/**
 * @file actor_resolver.hpp
 * @brief Pluggable lookup: which live session does a persisted actor snapshot name?
 * @details Used when an event is rebuilt from its persisted record. The
 *          in-process SessionRegistry is the default implementation.
 */

#include <memory>

#include "tap/session/session.hpp"

namespace tap::session {

    /// @brief Serializable stand-in for a live session reference.
    struct ActorSnapshot {
        SessionId id; ///< Durable session/account identifier

        bool operator==(const ActorSnapshot&) const = default;
    };

    class ActorResolver {
    public:
        virtual ~ActorResolver() = default;

        /**
         * @brief Return the live session named by @p snapshot.
         * @return nullptr when the session is unknown or no longer connected.
         */
        virtual std::shared_ptr<Session> resolve(const ActorSnapshot& snapshot) const = 0;
    };

} // namespace tap::session
