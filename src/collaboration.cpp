#include <collab-cpp/collaboration.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace collab_cpp {

Collaboration::Collaboration(Options options)
    : events_{},
      sessions_{events_},
      documents_{sessions_, events_, std::move(options)} {}

auto Collaboration::share_conversation(const SharedConversation& conversation,
                                       const UserId& user_id) -> bool {
    auto session = sessions_.active_session();
    if (!session) {
        spdlog::warn("conversation '{}' not shared: no active session", conversation.title);
        return false;
    }

    events_.publish(SessionUpdate{
        .session_id = session->id,
        .payload = ConversationShared{
            .conversation_id = conversation.id,
            .title = conversation.title,
            .user_name = sessions_.user_name(user_id, documents_.options().unknown_user_name),
            .message_count = conversation.messages.size(),
        },
    });
    return true;
}

auto Collaboration::handle(const Request& request) -> bool {
    return std::visit(overload{
        [&](const JoinRequest& r) {
            return sessions_.join_session(r.session_id, r.user);
        },
        [&](const LeaveRequest& r) {
            sessions_.leave_session(r.user);
            return true;
        },
        [&](const ShareRequest& r) {
            return documents_.share_document(r.document_id, r.user_id, r.role);
        },
        [&](const EditRequest& r) {
            return documents_.apply_edit(r.document_id, r.user_id, r.operation);
        },
        [&](const AnnotateRequest& r) {
            return documents_.add_annotation(r.document_id, r.user_id, r.annotation);
        },
    }, request);
}

}  // namespace collab_cpp
