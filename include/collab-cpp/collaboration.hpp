/// @file collaboration.hpp
/// @brief The Collaboration class -- one ordering authority for a team.

#pragma once

#include <collab-cpp/document_store.hpp>
#include <collab-cpp/event_bus.hpp>
#include <collab-cpp/options.hpp>
#include <collab-cpp/request.hpp>
#include <collab-cpp/session.hpp>
#include <collab-cpp/session_registry.hpp>
#include <collab-cpp/types.hpp>

namespace collab_cpp {

/// Owns the event bus, session registry and document store of one team.
///
/// Collaboration is the object a host application constructs once (at its
/// root) and passes to whatever needs it. It is the single in-process
/// ordering authority: every edit to every document it holds is applied
/// in the order its methods are called. Converging several processes
/// requires funnelling their requests through one Collaboration, e.g. by
/// forwarding Request messages to handle().
///
/// Not thread-safe. Guard the whole object with one mutex, or give it to
/// a single thread and post requests to it.
///
/// @code
/// auto collab = Collaboration{};
/// collab.events().subscribe([](const DocumentUpdate& u) { ... });
/// auto session = collab.sessions().create_session("Design Sync", alice);
/// collab.sessions().join_session(session.id, bob);
/// auto doc = collab.documents().create_shared_document("Spec", "Hello", alice);
/// @endcode
class Collaboration {
public:
    explicit Collaboration(Options options = {});

    Collaboration(const Collaboration&) = delete;
    auto operator=(const Collaboration&) -> Collaboration& = delete;

    auto events() -> EventBus& { return events_; }
    auto sessions() -> SessionRegistry& { return sessions_; }
    auto sessions() const -> const SessionRegistry& { return sessions_; }
    auto documents() -> DocumentStore& { return documents_; }
    auto documents() const -> const DocumentStore& { return documents_; }

    /// Announce a conversation to the active session.
    /// @return false if no session is active.
    auto share_conversation(const SharedConversation& conversation, const UserId& user_id)
        -> bool;

    /// Dispatch a request to the matching service call.
    /// @return The result of that call; true for LeaveRequest.
    auto handle(const Request& request) -> bool;

private:
    // Declaration order is construction order: the bus first.
    EventBus events_;
    SessionRegistry sessions_;
    DocumentStore documents_;
};

}  // namespace collab_cpp
