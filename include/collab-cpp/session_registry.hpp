/// @file session_registry.hpp
/// @brief Tracks the active collaboration session and its participants.

#pragma once

#include <collab-cpp/event_bus.hpp>
#include <collab-cpp/session.hpp>
#include <collab-cpp/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace collab_cpp {

/// Owns the single active collaboration session of one Collaboration.
///
/// A registry holds at most one session at a time. create_session()
/// replaces whatever session was there; the replaced session's documents
/// keep existing in the DocumentStore. When the last participant leaves,
/// the session is marked closed and stays readable via current_session().
///
/// Every successful state change publishes a SessionUpdate on the bus.
///
/// Not thread-safe: a host that calls into the registry from several
/// threads must serialize those calls (for example, one mutex around the
/// owning Collaboration).
class SessionRegistry {
public:
    /// @param events Bus to publish SessionUpdates on. Must outlive the registry.
    explicit SessionRegistry(EventBus& events);

    SessionRegistry(const SessionRegistry&) = delete;
    auto operator=(const SessionRegistry&) -> SessionRegistry& = delete;

    // -- Mutation -------------------------------------------------------------

    /// Start a fresh active session with `creator` as sole participant.
    auto create_session(std::string name, const CollaborationUser& creator)
        -> CollaborationSession;

    /// Join the active session.
    /// @return true if `session_id` is the active session (including when
    ///   the user was already connected); false otherwise.
    auto join_session(const SessionId& session_id, const CollaborationUser& user) -> bool;

    /// Leave the active session. No-op if the user is not connected.
    /// Closes the session when nobody is left.
    void leave_session(const CollaborationUser& user);

    // -- Reading --------------------------------------------------------------

    /// Connected participants in join order.
    auto connected_users() const -> const std::vector<CollaborationUser>& {
        return connected_;
    }

    /// The session, if there is one and it is still active.
    auto active_session() const -> std::optional<CollaborationSession>;

    /// The most recent session, active or closed.
    auto current_session() const -> const std::optional<CollaborationSession>& {
        return session_;
    }

    auto has_active_session() const -> bool;

    /// True if `session_id` names the session that is currently active.
    auto is_active(const SessionId& session_id) const -> bool;

    auto is_connected(const UserId& user_id) const -> bool;

    /// Display name of a connected user, or `fallback` if not connected.
    auto user_name(const UserId& user_id, const std::string& fallback) const -> std::string;

private:
    void close_session();

    EventBus& events_;
    std::optional<CollaborationSession> session_;
    std::vector<CollaborationUser> connected_;
};

}  // namespace collab_cpp
