/// @file session.hpp
/// @brief Session, participant and shared-conversation data types.

#pragma once

#include <collab-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab_cpp {

/// Lifecycle state of a collaboration session.
enum class SessionStatus : std::uint8_t {
    active,
    closed,
};

/// Convert a SessionStatus to its string representation.
constexpr auto to_string_view(SessionStatus status) noexcept -> std::string_view {
    switch (status) {
        case SessionStatus::active: return "active";
        case SessionStatus::closed: return "closed";
    }
    return "unknown";
}

/// A collaboration session.
struct CollaborationSession {
    SessionId id;
    std::string name;
    Timestamp created_at;
    UserId created_by;
    SessionStatus status{SessionStatus::active};

    auto operator==(const CollaborationSession&) const -> bool = default;
};

/// A participant, as identified by the host application.
///
/// The library does not authenticate: whoever calls with a given id is
/// that user. Two users compare equal when their ids are equal.
struct CollaborationUser {
    UserId id;
    std::string name;
    std::string email;
    std::optional<std::string> avatar_url;

    auto operator==(const CollaborationUser& other) const -> bool {
        return id == other.id;
    }
};

/// A single message of a shared conversation.
struct SharedMessage {
    MessageId id;
    UserId user_id;
    Timestamp timestamp;
    std::string content;
    bool is_ai{false};  ///< True for messages written by the assistant.

    auto operator==(const SharedMessage&) const -> bool = default;
};

/// A conversation shared into the active session.
struct SharedConversation {
    ConversationId id;
    std::string title;
    Timestamp created_at;
    UserId created_by;
    std::vector<SharedMessage> messages;

    auto operator==(const SharedConversation&) const -> bool = default;
};

}  // namespace collab_cpp
