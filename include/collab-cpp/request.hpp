/// @file request.hpp
/// @brief Message forms of every mutating call, for transport layers.

#pragma once

#include <collab-cpp/access.hpp>
#include <collab-cpp/annotation.hpp>
#include <collab-cpp/edit.hpp>
#include <collab-cpp/session.hpp>
#include <collab-cpp/types.hpp>

#include <variant>

namespace collab_cpp {

/// SessionRegistry::join_session().
struct JoinRequest {
    SessionId session_id;
    CollaborationUser user;
    Timestamp timestamp;
    auto operator==(const JoinRequest&) const -> bool = default;
};

/// SessionRegistry::leave_session().
struct LeaveRequest {
    CollaborationUser user;
    Timestamp timestamp;
    auto operator==(const LeaveRequest&) const -> bool = default;
};

/// DocumentStore::share_document().
struct ShareRequest {
    DocumentId document_id;
    UserId user_id;
    Role role;
    Timestamp timestamp;
    auto operator==(const ShareRequest&) const -> bool = default;
};

/// DocumentStore::apply_edit().
struct EditRequest {
    DocumentId document_id;
    UserId user_id;
    EditOperation operation;
    Timestamp timestamp;
    auto operator==(const EditRequest&) const -> bool = default;
};

/// DocumentStore::add_annotation().
struct AnnotateRequest {
    DocumentId document_id;
    UserId user_id;
    DocumentAnnotation annotation;
    Timestamp timestamp;
    auto operator==(const AnnotateRequest&) const -> bool = default;
};

/// Any request a remote participant can send to the ordering authority.
using Request = std::variant<
    JoinRequest,
    LeaveRequest,
    ShareRequest,
    EditRequest,
    AnnotateRequest
>;

}  // namespace collab_cpp
