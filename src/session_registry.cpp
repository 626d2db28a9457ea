#include <collab-cpp/session_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace collab_cpp {

SessionRegistry::SessionRegistry(EventBus& events)
    : events_{events} {}

auto SessionRegistry::create_session(std::string name, const CollaborationUser& creator)
    -> CollaborationSession {
    if (has_active_session()) {
        spdlog::info("replacing active session {} with a new session",
                     session_->id.to_string());
    }

    auto session = CollaborationSession{
        .id = SessionId::random(),
        .name = std::move(name),
        .created_at = Timestamp::now(),
        .created_by = creator.id,
        .status = SessionStatus::active,
    };
    session_ = session;
    connected_ = {creator};

    spdlog::info("session {} '{}' created by {}", session.id.to_string(), session.name,
                 creator.name);
    events_.publish(SessionUpdate{
        .session_id = session.id,
        .payload = SessionCreated{.name = session.name, .creator_name = creator.name},
    });
    return session;
}

auto SessionRegistry::join_session(const SessionId& session_id, const CollaborationUser& user)
    -> bool {
    if (!is_active(session_id)) {
        spdlog::warn("user {} denied: session {} is not the active session", user.name,
                     session_id.to_string());
        return false;
    }
    if (is_connected(user.id)) return true;

    connected_.push_back(user);
    spdlog::debug("user {} joined session {}", user.name, session_id.to_string());
    events_.publish(SessionUpdate{
        .session_id = session_id,
        .payload = UserJoined{.user_id = user.id, .user_name = user.name},
    });
    return true;
}

void SessionRegistry::leave_session(const CollaborationUser& user) {
    if (!has_active_session()) return;
    auto it = std::ranges::find(connected_, user.id, &CollaborationUser::id);
    if (it == connected_.end()) return;
    // Report the name the participant joined with.
    auto name = std::move(it->name);
    connected_.erase(it);

    spdlog::debug("user {} left session {}", name, session_->id.to_string());
    events_.publish(SessionUpdate{
        .session_id = session_->id,
        .payload = UserLeft{.user_id = user.id, .user_name = std::move(name)},
    });

    if (connected_.empty()) {
        close_session();
    }
}

void SessionRegistry::close_session() {
    session_->status = SessionStatus::closed;
    spdlog::info("session {} closed", session_->id.to_string());
    events_.publish(SessionUpdate{
        .session_id = session_->id,
        .payload = SessionClosed{},
    });
}

auto SessionRegistry::active_session() const -> std::optional<CollaborationSession> {
    if (!has_active_session()) return std::nullopt;
    return session_;
}

auto SessionRegistry::has_active_session() const -> bool {
    return session_ && session_->status == SessionStatus::active;
}

auto SessionRegistry::is_active(const SessionId& session_id) const -> bool {
    return has_active_session() && session_->id == session_id;
}

auto SessionRegistry::is_connected(const UserId& user_id) const -> bool {
    return std::ranges::any_of(connected_,
        [&](const CollaborationUser& u) { return u.id == user_id; });
}

auto SessionRegistry::user_name(const UserId& user_id, const std::string& fallback) const
    -> std::string {
    auto it = std::ranges::find(connected_, user_id, &CollaborationUser::id);
    return it != connected_.end() ? it->name : fallback;
}

}  // namespace collab_cpp
