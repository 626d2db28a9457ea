/// @file document_store.hpp
/// @brief The registry of shared documents and the gated edit entry points.

#pragma once

#include <collab-cpp/access.hpp>
#include <collab-cpp/annotation.hpp>
#include <collab-cpp/edit.hpp>
#include <collab-cpp/event_bus.hpp>
#include <collab-cpp/options.hpp>
#include <collab-cpp/session_registry.hpp>
#include <collab-cpp/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collab_cpp {

namespace detail {
struct StoreState;
}  // namespace detail

/// Metadata of a shared document.
struct SharedDocument {
    DocumentId id;
    SessionId session_id;  ///< The session that was active at creation.
    std::string title;
    Timestamp created_at;
    UserId created_by;
    Timestamp last_modified_at;
    UserId last_modified_by;
    std::uint64_t version{1};  ///< 1 at creation, +1 per applied edit.

    auto operator==(const SharedDocument&) const -> bool = default;
};

/// Registry of shared documents, their access lists and replicas.
///
/// Each document owns exactly one ReplicatedDocument and one
/// AccessControlTable. All mutation goes through apply_edit(),
/// add_annotation(), reply_to_annotation() and share_document(), which
/// check access first and leave the document untouched when they return
/// false. Successful mutations publish a DocumentUpdate.
///
/// Not thread-safe: the store performs no locking. A host that shares it
/// between threads must serialize every call (one mutex per store, or one
/// actor owning the whole Collaboration).
///
/// @code
/// auto bus = EventBus{};
/// auto sessions = SessionRegistry{bus};
/// auto store = DocumentStore{sessions, bus};
/// sessions.create_session("Design Sync", alice);
/// auto doc = store.create_shared_document("Spec", "Hello", alice);
/// store.apply_edit(doc.id, alice.id, EditOperation{
///     .type = EditType::insert, .position = 5, .content = " World"});
/// @endcode
class DocumentStore {
public:
    /// @param sessions Consulted for the active session and user names.
    /// @param events Bus to publish DocumentUpdates on.
    /// Both must outlive the store.
    DocumentStore(const SessionRegistry& sessions, EventBus& events,
                  Options options = {});

    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    auto operator=(const DocumentStore&) -> DocumentStore& = delete;

    // -- Mutation -------------------------------------------------------------

    /// Create a document in the active session with `creator` as owner.
    /// @throws Exception with ErrorKind::no_active_session if no session
    ///   is active. The store is unchanged in that case.
    auto create_shared_document(std::string title, std::string content,
                                const CollaborationUser& creator) -> SharedDocument;

    /// Grant `role` to a user, replacing any previous role.
    /// @return false if the document is unknown.
    auto share_document(const DocumentId& document_id, const UserId& user_id, Role role)
        -> bool;

    /// Apply an edit on behalf of a user with at least editor access.
    /// @return false (nothing changed, nothing published) if the document
    ///   is unknown, the user lacks editor access, or the document is locked.
    auto apply_edit(const DocumentId& document_id, const UserId& user_id,
                    const EditOperation& operation) -> bool;

    /// Attach an annotation on behalf of a user with at least viewer access.
    /// Does not change the document version.
    auto add_annotation(const DocumentId& document_id, const UserId& user_id,
                        DocumentAnnotation annotation) -> bool;

    /// Append a reply to an annotation; same access rule as add_annotation().
    auto reply_to_annotation(const DocumentId& document_id, const UserId& user_id,
                             const AnnotationId& annotation_id,
                             AnnotationReply reply) -> bool;

    // -- Access ---------------------------------------------------------------

    /// False for unknown documents or users; otherwise the role lattice.
    auto has_access(const UserId& user_id, const DocumentId& document_id,
                    Role required) const -> bool;

    /// The access table of a document, or nullptr if unknown.
    auto acl(const DocumentId& document_id) const -> const AccessControlTable*;

    // -- Reading --------------------------------------------------------------

    /// All documents in creation order.
    auto documents() const -> std::vector<SharedDocument>;

    auto document(const DocumentId& document_id) const -> std::optional<SharedDocument>;

    auto content(const DocumentId& document_id) const -> std::optional<std::string>;

    /// Applied edits of a document, empty if unknown.
    auto history(const DocumentId& document_id) const -> std::vector<EditHistoryItem>;

    /// Annotations of a document, empty if unknown.
    auto annotations(const DocumentId& document_id) const
        -> std::vector<DocumentAnnotation>;

    /// True if edits to the document are refused because its session closed.
    auto is_locked(const DocumentId& document_id) const -> bool;

    auto options() const -> const Options& { return options_; }

private:
    const SessionRegistry& sessions_;
    EventBus& events_;
    Options options_;
    std::unique_ptr<detail::StoreState> state_;
};

}  // namespace collab_cpp
