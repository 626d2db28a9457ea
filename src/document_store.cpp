#include <collab-cpp/document_store.hpp>
#include <collab-cpp/error.hpp>

#include "store_state.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace collab_cpp {

DocumentStore::DocumentStore(const SessionRegistry& sessions, EventBus& events,
                             Options options)
    : sessions_{sessions},
      events_{events},
      options_{std::move(options)},
      state_{std::make_unique<detail::StoreState>()} {}

DocumentStore::~DocumentStore() = default;

auto DocumentStore::create_shared_document(std::string title, std::string content,
                                           const CollaborationUser& creator)
    -> SharedDocument {
    auto session = sessions_.active_session();
    if (!session) {
        spdlog::warn("document '{}' not created: no active session", title);
        throw Exception{ErrorKind::no_active_session,
                        "cannot create shared document '" + title + "': no active session"};
    }

    const auto now = Timestamp::now();
    auto meta = SharedDocument{
        .id = DocumentId::random(),
        .session_id = session->id,
        .title = std::move(title),
        .created_at = now,
        .created_by = creator.id,
        .last_modified_at = now,
        .last_modified_by = creator.id,
        .version = 1,
    };
    auto& entry = state_->insert(detail::DocumentEntry{
        .meta = meta,
        .acl = AccessControlTable{creator.id},
        .replica = ReplicatedDocument{std::move(content)},
    });

    spdlog::debug("document {} '{}' created by {}", meta.id.to_string(), meta.title,
                  creator.name);
    events_.publish(DocumentUpdate{
        .document_id = meta.id,
        .user_id = creator.id,
        .payload = DocumentCreated{.title = entry.meta.title, .creator_name = creator.name},
    });
    return meta;
}

auto DocumentStore::share_document(const DocumentId& document_id, const UserId& user_id,
                                   Role role) -> bool {
    auto* entry = state_->find(document_id);
    if (!entry) {
        spdlog::warn("share of unknown document {}", document_id.to_string());
        return false;
    }

    entry->acl.grant(user_id, role);
    auto user_name = sessions_.user_name(user_id, options_.unknown_user_name);
    spdlog::debug("document {} shared with {} as {}", document_id.to_string(), user_name,
                  to_string_view(role));
    events_.publish(DocumentUpdate{
        .document_id = document_id,
        .user_id = user_id,
        .payload = DocumentShared{.title = entry->meta.title,
                                  .user_name = std::move(user_name),
                                  .role = role},
    });
    return true;
}

auto DocumentStore::apply_edit(const DocumentId& document_id, const UserId& user_id,
                               const EditOperation& operation) -> bool {
    auto* entry = state_->find(document_id);
    if (!entry) {
        spdlog::warn("edit of unknown document {}", document_id.to_string());
        return false;
    }
    if (!entry->acl.has_access(user_id, Role::editor)) {
        spdlog::warn("edit of document {} denied for user {}", document_id.to_string(),
                     user_id.to_string());
        return false;
    }
    if (is_locked(document_id)) {
        spdlog::warn("edit of document {} rejected: session closed", document_id.to_string());
        return false;
    }

    auto user_name = sessions_.user_name(user_id, options_.unknown_user_name);
    entry->replica.apply_operation(operation, user_name);

    auto& meta = entry->meta;
    meta.version += 1;
    meta.last_modified_at = Timestamp::now();
    meta.last_modified_by = user_id;

    spdlog::debug("document {} v{}: {}", document_id.to_string(), meta.version,
                  describe(operation));
    events_.publish(DocumentUpdate{
        .document_id = document_id,
        .user_id = user_id,
        .payload = DocumentEdited{.title = meta.title,
                                  .user_name = std::move(user_name),
                                  .description = describe(operation),
                                  .version = meta.version},
    });
    return true;
}

auto DocumentStore::add_annotation(const DocumentId& document_id, const UserId& user_id,
                                   DocumentAnnotation annotation) -> bool {
    auto* entry = state_->find(document_id);
    if (!entry) {
        spdlog::warn("annotation on unknown document {}", document_id.to_string());
        return false;
    }
    if (!entry->acl.has_access(user_id, Role::viewer)) {
        spdlog::warn("annotation on document {} denied for user {}", document_id.to_string(),
                     user_id.to_string());
        return false;
    }
    if (is_locked(document_id)) {
        spdlog::warn("annotation on document {} rejected: session closed",
                     document_id.to_string());
        return false;
    }

    auto payload = AnnotationAdded{
        .title = entry->meta.title,
        .user_name = sessions_.user_name(user_id, options_.unknown_user_name),
        .annotation_id = annotation.id,
        .annotation_type = annotation.type,
        .position = annotation.position,
    };
    entry->replica.add_annotation(std::move(annotation));

    spdlog::debug("{} added to document {} at {}", to_string_view(payload.annotation_type),
                  document_id.to_string(), payload.position);
    events_.publish(DocumentUpdate{
        .document_id = document_id,
        .user_id = user_id,
        .payload = std::move(payload),
    });
    return true;
}

auto DocumentStore::reply_to_annotation(const DocumentId& document_id, const UserId& user_id,
                                        const AnnotationId& annotation_id,
                                        AnnotationReply reply) -> bool {
    auto* entry = state_->find(document_id);
    if (!entry || !entry->acl.has_access(user_id, Role::viewer) || is_locked(document_id)) {
        spdlog::warn("reply on document {} rejected for user {}", document_id.to_string(),
                     user_id.to_string());
        return false;
    }
    return entry->replica.add_reply(annotation_id, std::move(reply));
}

auto DocumentStore::has_access(const UserId& user_id, const DocumentId& document_id,
                               Role required) const -> bool {
    const auto* entry = state_->find(document_id);
    return entry && entry->acl.has_access(user_id, required);
}

auto DocumentStore::acl(const DocumentId& document_id) const -> const AccessControlTable* {
    const auto* entry = state_->find(document_id);
    return entry ? &entry->acl : nullptr;
}

auto DocumentStore::documents() const -> std::vector<SharedDocument> {
    auto result = std::vector<SharedDocument>{};
    result.reserve(state_->creation_order.size());
    for (const auto& id : state_->creation_order) {
        result.push_back(state_->find(id)->meta);
    }
    return result;
}

auto DocumentStore::document(const DocumentId& document_id) const
    -> std::optional<SharedDocument> {
    const auto* entry = state_->find(document_id);
    if (!entry) return std::nullopt;
    return entry->meta;
}

auto DocumentStore::content(const DocumentId& document_id) const
    -> std::optional<std::string> {
    const auto* entry = state_->find(document_id);
    if (!entry) return std::nullopt;
    return entry->replica.content();
}

auto DocumentStore::history(const DocumentId& document_id) const
    -> std::vector<EditHistoryItem> {
    const auto* entry = state_->find(document_id);
    if (!entry) return {};
    return entry->replica.history();
}

auto DocumentStore::annotations(const DocumentId& document_id) const
    -> std::vector<DocumentAnnotation> {
    const auto* entry = state_->find(document_id);
    if (!entry) return {};
    return entry->replica.annotations();
}

auto DocumentStore::is_locked(const DocumentId& document_id) const -> bool {
    if (!options_.lock_documents_on_session_close) return false;
    const auto* entry = state_->find(document_id);
    return entry && !sessions_.is_active(entry->meta.session_id);
}

}  // namespace collab_cpp
