#include <collab-cpp/event_bus.hpp>
#include <collab-cpp/events.hpp>

#include <algorithm>

namespace collab_cpp {

auto type_of(const SessionUpdate& update) -> SessionUpdateType {
    return std::visit(overload{
        [](const SessionCreated&) { return SessionUpdateType::session_created; },
        [](const UserJoined&) { return SessionUpdateType::user_joined; },
        [](const UserLeft&) { return SessionUpdateType::user_left; },
        [](const SessionClosed&) { return SessionUpdateType::session_closed; },
        [](const ConversationShared&) { return SessionUpdateType::conversation_shared; },
    }, update.payload);
}

auto type_of(const DocumentUpdate& update) -> DocumentUpdateType {
    return std::visit(overload{
        [](const DocumentCreated&) { return DocumentUpdateType::document_created; },
        [](const DocumentShared&) { return DocumentUpdateType::document_shared; },
        [](const DocumentEdited&) { return DocumentUpdateType::document_edited; },
        [](const AnnotationAdded&) { return DocumentUpdateType::annotation_added; },
    }, update.payload);
}

auto EventBus::subscribe(SessionHandler handler) -> SubscriptionId {
    auto id = next_id_++;
    session_handlers_.emplace_back(id, std::move(handler));
    return id;
}

auto EventBus::subscribe(DocumentHandler handler) -> SubscriptionId {
    auto id = next_id_++;
    document_handlers_.emplace_back(id, std::move(handler));
    return id;
}

auto EventBus::unsubscribe(SubscriptionId id) -> bool {
    auto matches = [id](const auto& entry) { return entry.first == id; };
    return std::erase_if(session_handlers_, matches) > 0
        || std::erase_if(document_handlers_, matches) > 0;
}

// Handlers are copied before the loop so that (un)subscribing from inside a
// handler does not invalidate the iteration.

void EventBus::publish(const SessionUpdate& update) const {
    auto handlers = session_handlers_;
    for (const auto& [id, handler] : handlers) {
        handler(update);
    }
}

void EventBus::publish(const DocumentUpdate& update) const {
    auto handlers = document_handlers_;
    for (const auto& [id, handler] : handlers) {
        handler(update);
    }
}

}  // namespace collab_cpp
