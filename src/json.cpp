#include <collab-cpp/json.hpp>
#include <collab-cpp/error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace collab_cpp {

namespace {

// Decode a string field through a name parser, raising decoding_error on
// names the parser does not know.
template <typename T, typename Parse>
auto parse_name(const nlohmann::json& j, std::string_view what, Parse parse) -> T {
    const auto name = j.get<std::string>();
    auto value = parse(name);
    if (!value) {
        throw Exception{ErrorKind::decoding_error,
                        "unknown " + std::string{what} + " '" + name + "'"};
    }
    return *value;
}

auto string_of(std::string_view sv) -> std::string { return std::string{sv}; }

}  // anonymous namespace

// =============================================================================
// Identity and time
// =============================================================================

void to_json(nlohmann::json& j, const Uuid& id) {
    j = id.to_string();
}

void from_json(const nlohmann::json& j, Uuid& id) {
    id = parse_name<Uuid>(j, "uuid", &Uuid::parse);
}

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = t.millis_since_epoch;
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    t.millis_since_epoch = j.get<std::int64_t>();
}

// =============================================================================
// Enumerations
// =============================================================================

void to_json(nlohmann::json& j, Role role) {
    j = string_of(to_string_view(role));
}

void from_json(const nlohmann::json& j, Role& role) {
    role = parse_name<Role>(j, "role", role_from_string);
}

void to_json(nlohmann::json& j, EditType type) {
    j = string_of(to_string_view(type));
}

void from_json(const nlohmann::json& j, EditType& type) {
    type = parse_name<EditType>(j, "edit type", edit_type_from_string);
}

void to_json(nlohmann::json& j, AnnotationType type) {
    j = string_of(to_string_view(type));
}

void from_json(const nlohmann::json& j, AnnotationType& type) {
    type = parse_name<AnnotationType>(j, "annotation type", annotation_type_from_string);
}

void to_json(nlohmann::json& j, SessionStatus status) {
    j = string_of(to_string_view(status));
}

void from_json(const nlohmann::json& j, SessionStatus& status) {
    status = parse_name<SessionStatus>(j, "session status",
        [](std::string_view name) -> std::optional<SessionStatus> {
            if (name == "active") return SessionStatus::active;
            if (name == "closed") return SessionStatus::closed;
            return std::nullopt;
        });
}

// =============================================================================
// Data model
// =============================================================================

void to_json(nlohmann::json& j, const CollaborationUser& user) {
    j = nlohmann::json{
        {"id", user.id},
        {"name", user.name},
        {"email", user.email},
    };
    if (user.avatar_url) {
        j["avatar_url"] = *user.avatar_url;
    }
}

void from_json(const nlohmann::json& j, CollaborationUser& user) {
    user.id = j.at("id").get<UserId>();
    user.name = j.at("name").get<std::string>();
    user.email = j.value("email", std::string{});
    user.avatar_url = std::nullopt;
    if (j.contains("avatar_url") && !j["avatar_url"].is_null()) {
        user.avatar_url = j["avatar_url"].get<std::string>();
    }
}

void to_json(nlohmann::json& j, const CollaborationSession& session) {
    j = nlohmann::json{
        {"id", session.id},
        {"name", session.name},
        {"created_at", session.created_at},
        {"created_by", session.created_by},
        {"status", session.status},
    };
}

void from_json(const nlohmann::json& j, CollaborationSession& session) {
    session.id = j.at("id").get<SessionId>();
    session.name = j.at("name").get<std::string>();
    session.created_at = j.at("created_at").get<Timestamp>();
    session.created_by = j.at("created_by").get<UserId>();
    session.status = j.at("status").get<SessionStatus>();
}

void to_json(nlohmann::json& j, const SharedDocument& doc) {
    j = nlohmann::json{
        {"id", doc.id},
        {"session_id", doc.session_id},
        {"title", doc.title},
        {"created_at", doc.created_at},
        {"created_by", doc.created_by},
        {"last_modified_at", doc.last_modified_at},
        {"last_modified_by", doc.last_modified_by},
        {"version", doc.version},
    };
}

void from_json(const nlohmann::json& j, SharedDocument& doc) {
    doc.id = j.at("id").get<DocumentId>();
    doc.session_id = j.at("session_id").get<SessionId>();
    doc.title = j.at("title").get<std::string>();
    doc.created_at = j.at("created_at").get<Timestamp>();
    doc.created_by = j.at("created_by").get<UserId>();
    doc.last_modified_at = j.at("last_modified_at").get<Timestamp>();
    doc.last_modified_by = j.at("last_modified_by").get<UserId>();
    doc.version = j.at("version").get<std::uint64_t>();
}

void to_json(nlohmann::json& j, const EditOperation& op) {
    j = nlohmann::json{
        {"type", op.type},
        {"position", op.position},
        {"content", op.content},
        {"timestamp", op.timestamp},
        {"user_id", op.user_id},
    };
}

void from_json(const nlohmann::json& j, EditOperation& op) {
    op.type = j.at("type").get<EditType>();
    op.position = j.at("position").get<std::size_t>();
    op.content = j.at("content").get<std::string>();
    op.timestamp = j.at("timestamp").get<Timestamp>();
    op.user_id = j.at("user_id").get<UserId>();
}

void to_json(nlohmann::json& j, const EditHistoryItem& item) {
    j = nlohmann::json{
        {"operation", item.operation},
        {"user_name", item.user_name},
    };
}

void to_json(nlohmann::json& j, const AnnotationReply& reply) {
    j = nlohmann::json{
        {"id", reply.id},
        {"user_id", reply.user_id},
        {"created_at", reply.created_at},
        {"content", reply.content},
    };
}

void from_json(const nlohmann::json& j, AnnotationReply& reply) {
    reply.id = j.at("id").get<AnnotationId>();
    reply.user_id = j.at("user_id").get<UserId>();
    reply.created_at = j.at("created_at").get<Timestamp>();
    reply.content = j.at("content").get<std::string>();
}

void to_json(nlohmann::json& j, const DocumentAnnotation& annotation) {
    j = nlohmann::json{
        {"id", annotation.id},
        {"user_id", annotation.user_id},
        {"created_at", annotation.created_at},
        {"type", annotation.type},
        {"position", annotation.position},
        {"content", annotation.content},
        {"replies", annotation.replies},
    };
}

void from_json(const nlohmann::json& j, DocumentAnnotation& annotation) {
    annotation.id = j.at("id").get<AnnotationId>();
    annotation.user_id = j.at("user_id").get<UserId>();
    annotation.created_at = j.at("created_at").get<Timestamp>();
    annotation.type = j.at("type").get<AnnotationType>();
    annotation.position = j.at("position").get<std::size_t>();
    annotation.content = j.at("content").get<std::string>();
    annotation.replies = j.value("replies", std::vector<AnnotationReply>{});
}

void to_json(nlohmann::json& j, const SharedMessage& message) {
    j = nlohmann::json{
        {"id", message.id},
        {"user_id", message.user_id},
        {"timestamp", message.timestamp},
        {"content", message.content},
        {"is_ai", message.is_ai},
    };
}

void from_json(const nlohmann::json& j, SharedMessage& message) {
    message.id = j.at("id").get<MessageId>();
    message.user_id = j.at("user_id").get<UserId>();
    message.timestamp = j.at("timestamp").get<Timestamp>();
    message.content = j.at("content").get<std::string>();
    message.is_ai = j.value("is_ai", false);
}

void to_json(nlohmann::json& j, const SharedConversation& conversation) {
    j = nlohmann::json{
        {"id", conversation.id},
        {"title", conversation.title},
        {"created_at", conversation.created_at},
        {"created_by", conversation.created_by},
        {"messages", conversation.messages},
    };
}

void from_json(const nlohmann::json& j, SharedConversation& conversation) {
    conversation.id = j.at("id").get<ConversationId>();
    conversation.title = j.at("title").get<std::string>();
    conversation.created_at = j.at("created_at").get<Timestamp>();
    conversation.created_by = j.at("created_by").get<UserId>();
    conversation.messages = j.value("messages", std::vector<SharedMessage>{});
}

// =============================================================================
// Events
// =============================================================================

void to_json(nlohmann::json& j, const SessionUpdate& update) {
    j = nlohmann::json{
        {"session_id", update.session_id},
        {"type", string_of(to_string_view(type_of(update)))},
    };
    std::visit(overload{
        [&](const SessionCreated& p) {
            j["name"] = p.name;
            j["creator_name"] = p.creator_name;
        },
        [&](const UserJoined& p) {
            j["user_id"] = p.user_id;
            j["user_name"] = p.user_name;
        },
        [&](const UserLeft& p) {
            j["user_id"] = p.user_id;
            j["user_name"] = p.user_name;
        },
        [&](const SessionClosed&) {},
        [&](const ConversationShared& p) {
            j["conversation_id"] = p.conversation_id;
            j["title"] = p.title;
            j["user_name"] = p.user_name;
            j["message_count"] = p.message_count;
        },
    }, update.payload);
}

void from_json(const nlohmann::json& j, SessionUpdate& update) {
    update.session_id = j.at("session_id").get<SessionId>();
    const auto type = j.at("type").get<std::string>();
    if (type == "session_created") {
        update.payload = SessionCreated{
            .name = j.at("name").get<std::string>(),
            .creator_name = j.at("creator_name").get<std::string>(),
        };
    } else if (type == "user_joined") {
        update.payload = UserJoined{
            .user_id = j.at("user_id").get<UserId>(),
            .user_name = j.at("user_name").get<std::string>(),
        };
    } else if (type == "user_left") {
        update.payload = UserLeft{
            .user_id = j.at("user_id").get<UserId>(),
            .user_name = j.at("user_name").get<std::string>(),
        };
    } else if (type == "session_closed") {
        update.payload = SessionClosed{};
    } else if (type == "conversation_shared") {
        update.payload = ConversationShared{
            .conversation_id = j.at("conversation_id").get<ConversationId>(),
            .title = j.at("title").get<std::string>(),
            .user_name = j.at("user_name").get<std::string>(),
            .message_count = j.at("message_count").get<std::size_t>(),
        };
    } else {
        throw Exception{ErrorKind::decoding_error, "unknown session update '" + type + "'"};
    }
}

void to_json(nlohmann::json& j, const DocumentUpdate& update) {
    j = nlohmann::json{
        {"document_id", update.document_id},
        {"user_id", update.user_id},
        {"type", string_of(to_string_view(type_of(update)))},
    };
    std::visit(overload{
        [&](const DocumentCreated& p) {
            j["title"] = p.title;
            j["creator_name"] = p.creator_name;
        },
        [&](const DocumentShared& p) {
            j["title"] = p.title;
            j["user_name"] = p.user_name;
            j["role"] = p.role;
        },
        [&](const DocumentEdited& p) {
            j["title"] = p.title;
            j["user_name"] = p.user_name;
            j["description"] = p.description;
            j["version"] = p.version;
        },
        [&](const AnnotationAdded& p) {
            j["title"] = p.title;
            j["user_name"] = p.user_name;
            j["annotation_id"] = p.annotation_id;
            j["annotation_type"] = p.annotation_type;
            j["position"] = p.position;
        },
    }, update.payload);
}

void from_json(const nlohmann::json& j, DocumentUpdate& update) {
    update.document_id = j.at("document_id").get<DocumentId>();
    update.user_id = j.at("user_id").get<UserId>();
    const auto type = j.at("type").get<std::string>();
    if (type == "document_created") {
        update.payload = DocumentCreated{
            .title = j.at("title").get<std::string>(),
            .creator_name = j.at("creator_name").get<std::string>(),
        };
    } else if (type == "document_shared") {
        update.payload = DocumentShared{
            .title = j.at("title").get<std::string>(),
            .user_name = j.at("user_name").get<std::string>(),
            .role = j.at("role").get<Role>(),
        };
    } else if (type == "document_edited") {
        update.payload = DocumentEdited{
            .title = j.at("title").get<std::string>(),
            .user_name = j.at("user_name").get<std::string>(),
            .description = j.at("description").get<std::string>(),
            .version = j.at("version").get<std::uint64_t>(),
        };
    } else if (type == "annotation_added") {
        update.payload = AnnotationAdded{
            .title = j.at("title").get<std::string>(),
            .user_name = j.at("user_name").get<std::string>(),
            .annotation_id = j.at("annotation_id").get<AnnotationId>(),
            .annotation_type = j.at("annotation_type").get<AnnotationType>(),
            .position = j.at("position").get<std::size_t>(),
        };
    } else {
        throw Exception{ErrorKind::decoding_error, "unknown document update '" + type + "'"};
    }
}

// =============================================================================
// Requests
// =============================================================================

void to_json(nlohmann::json& j, const Request& request) {
    std::visit(overload{
        [&](const JoinRequest& r) {
            j = nlohmann::json{{"type", "join"}, {"session_id", r.session_id},
                               {"user", r.user},
                               {"timestamp", r.timestamp}};
        },
        [&](const LeaveRequest& r) {
            j = nlohmann::json{{"type", "leave"}, {"user", r.user},
                               {"timestamp", r.timestamp}};
        },
        [&](const ShareRequest& r) {
            j = nlohmann::json{{"type", "share"}, {"document_id", r.document_id},
                               {"user_id", r.user_id}, {"role", r.role},
                               {"timestamp", r.timestamp}};
        },
        [&](const EditRequest& r) {
            j = nlohmann::json{{"type", "edit"}, {"document_id", r.document_id},
                               {"user_id", r.user_id}, {"operation", r.operation},
                               {"timestamp", r.timestamp}};
        },
        [&](const AnnotateRequest& r) {
            j = nlohmann::json{{"type", "annotate"}, {"document_id", r.document_id},
                               {"user_id", r.user_id}, {"annotation", r.annotation},
                               {"timestamp", r.timestamp}};
        },
    }, request);
}

auto request_from_json(const nlohmann::json& j) -> Request {
    const auto type = j.at("type").get<std::string>();
    const auto timestamp = j.at("timestamp").get<Timestamp>();
    if (type == "join") {
        return JoinRequest{
            .session_id = j.at("session_id").get<SessionId>(),
            .user = j.at("user").get<CollaborationUser>(),
            .timestamp = timestamp,
        };
    }
    if (type == "leave") {
        return LeaveRequest{
            .user = j.at("user").get<CollaborationUser>(),
            .timestamp = timestamp,
        };
    }
    if (type == "share") {
        return ShareRequest{
            .document_id = j.at("document_id").get<DocumentId>(),
            .user_id = j.at("user_id").get<UserId>(),
            .role = j.at("role").get<Role>(),
            .timestamp = timestamp,
        };
    }
    if (type == "edit") {
        return EditRequest{
            .document_id = j.at("document_id").get<DocumentId>(),
            .user_id = j.at("user_id").get<UserId>(),
            .operation = j.at("operation").get<EditOperation>(),
            .timestamp = timestamp,
        };
    }
    if (type == "annotate") {
        return AnnotateRequest{
            .document_id = j.at("document_id").get<DocumentId>(),
            .user_id = j.at("user_id").get<UserId>(),
            .annotation = j.at("annotation").get<DocumentAnnotation>(),
            .timestamp = timestamp,
        };
    }
    throw Exception{ErrorKind::decoding_error, "unknown request type '" + type + "'"};
}

}  // namespace collab_cpp
