/// @file events.hpp
/// @brief Session and document update events.
///
/// Both families are closed sets of strongly typed payloads held in a
/// std::variant. They carry only plain data so a transport can forward
/// them unchanged (see json.hpp).

#pragma once

#include <collab-cpp/access.hpp>
#include <collab-cpp/annotation.hpp>
#include <collab-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace collab_cpp {

// -- Session updates ----------------------------------------------------------

/// The kinds of session update.
enum class SessionUpdateType : std::uint8_t {
    session_created,
    user_joined,
    user_left,
    session_closed,
    conversation_shared,
};

/// Convert a SessionUpdateType to its string representation.
constexpr auto to_string_view(SessionUpdateType type) noexcept -> std::string_view {
    switch (type) {
        case SessionUpdateType::session_created:     return "session_created";
        case SessionUpdateType::user_joined:         return "user_joined";
        case SessionUpdateType::user_left:           return "user_left";
        case SessionUpdateType::session_closed:      return "session_closed";
        case SessionUpdateType::conversation_shared: return "conversation_shared";
    }
    return "unknown";
}

/// A session was created.
struct SessionCreated {
    std::string name;          ///< Session name.
    std::string creator_name;  ///< Display name of the creator.
    auto operator==(const SessionCreated&) const -> bool = default;
};

/// A participant joined the session.
struct UserJoined {
    UserId user_id;
    std::string user_name;
    auto operator==(const UserJoined&) const -> bool = default;
};

/// A participant left the session.
struct UserLeft {
    UserId user_id;
    std::string user_name;
    auto operator==(const UserLeft&) const -> bool = default;
};

/// The last participant left and the session is now closed.
struct SessionClosed {
    auto operator==(const SessionClosed&) const -> bool = default;
};

/// A conversation was shared into the session.
struct ConversationShared {
    ConversationId conversation_id;
    std::string title;
    std::string user_name;       ///< Display name of the user who shared it.
    std::size_t message_count{0};
    auto operator==(const ConversationShared&) const -> bool = default;
};

/// The set of possible session update payloads.
using SessionPayload = std::variant<
    SessionCreated,
    UserJoined,
    UserLeft,
    SessionClosed,
    ConversationShared
>;

/// A change to the membership or contents of a session.
struct SessionUpdate {
    SessionId session_id;    ///< The session concerned.
    SessionPayload payload;  ///< What happened.

    auto operator==(const SessionUpdate&) const -> bool = default;
};

/// The kind of a session update, derived from its payload.
auto type_of(const SessionUpdate& update) -> SessionUpdateType;

// -- Document updates ---------------------------------------------------------

/// The kinds of document update.
enum class DocumentUpdateType : std::uint8_t {
    document_created,
    document_shared,
    document_edited,
    annotation_added,
};

/// Convert a DocumentUpdateType to its string representation.
constexpr auto to_string_view(DocumentUpdateType type) noexcept -> std::string_view {
    switch (type) {
        case DocumentUpdateType::document_created: return "document_created";
        case DocumentUpdateType::document_shared:  return "document_shared";
        case DocumentUpdateType::document_edited:  return "document_edited";
        case DocumentUpdateType::annotation_added: return "annotation_added";
    }
    return "unknown";
}

/// A shared document was created.
struct DocumentCreated {
    std::string title;
    std::string creator_name;
    auto operator==(const DocumentCreated&) const -> bool = default;
};

/// A user was granted (or re-granted) a role on a document.
struct DocumentShared {
    std::string title;
    std::string user_name;  ///< Display name of the grantee.
    Role role;
    auto operator==(const DocumentShared&) const -> bool = default;
};

/// An edit was applied.
struct DocumentEdited {
    std::string title;
    std::string user_name;    ///< Display name of the author.
    std::string description;  ///< describe() of the operation.
    std::uint64_t version{0}; ///< Document version after the edit.
    auto operator==(const DocumentEdited&) const -> bool = default;
};

/// An annotation was added.
struct AnnotationAdded {
    std::string title;
    std::string user_name;
    AnnotationId annotation_id;
    AnnotationType annotation_type;
    std::size_t position{0};
    auto operator==(const AnnotationAdded&) const -> bool = default;
};

/// The set of possible document update payloads.
using DocumentPayload = std::variant<
    DocumentCreated,
    DocumentShared,
    DocumentEdited,
    AnnotationAdded
>;

/// A change to a shared document or its access list.
struct DocumentUpdate {
    DocumentId document_id;   ///< The document concerned.
    UserId user_id;           ///< The acting user (the grantee for DocumentShared).
    DocumentPayload payload;  ///< What happened.

    auto operator==(const DocumentUpdate&) const -> bool = default;
};

/// The kind of a document update, derived from its payload.
auto type_of(const DocumentUpdate& update) -> DocumentUpdateType;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const DocumentEdited& e) { ... },
///     [](const auto&) {},
/// }, update.payload);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace collab_cpp
