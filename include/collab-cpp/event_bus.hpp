/// @file event_bus.hpp
/// @brief Synchronous publish/subscribe of session and document updates.

#pragma once

#include <collab-cpp/events.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace collab_cpp {

/// Handle returned by EventBus::subscribe(), used to unsubscribe.
using SubscriptionId = std::uint64_t;

/// Fan-out of SessionUpdate and DocumentUpdate events to listeners.
///
/// publish() calls every handler that is subscribed at the moment of the
/// call, in subscription order, on the calling thread, before returning.
/// Nothing is buffered: a handler subscribed after an event was published
/// never sees it. Handlers added or removed from inside a handler take
/// effect from the next publish().
///
/// A handler that throws propagates out of publish(), and from there out
/// of the mutating call that published; the mutation itself has already
/// been applied.
///
/// Not thread-safe.
class EventBus {
public:
    using SessionHandler = std::function<void(const SessionUpdate&)>;
    using DocumentHandler = std::function<void(const DocumentUpdate&)>;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    auto operator=(const EventBus&) -> EventBus& = delete;

    /// Register a listener for session updates.
    auto subscribe(SessionHandler handler) -> SubscriptionId;

    /// Register a listener for document updates.
    auto subscribe(DocumentHandler handler) -> SubscriptionId;

    /// Remove a listener of either family.
    /// @return false if the id is unknown or already removed.
    auto unsubscribe(SubscriptionId id) -> bool;

    void publish(const SessionUpdate& update) const;
    void publish(const DocumentUpdate& update) const;

    /// Number of registered listeners across both families.
    auto subscriber_count() const -> std::size_t {
        return session_handlers_.size() + document_handlers_.size();
    }

private:
    std::vector<std::pair<SubscriptionId, SessionHandler>> session_handlers_;
    std::vector<std::pair<SubscriptionId, DocumentHandler>> document_handlers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace collab_cpp
