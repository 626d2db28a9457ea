/// @file json.hpp
/// @brief nlohmann/json interoperability for collab-cpp.
///
/// Provides ADL serialization (to_json/from_json) for every type that
/// crosses a process boundary: identifiers, timestamps, users, sessions,
/// documents, edit operations, annotations, conversations, requests and
/// both event families.
///
/// Encoding rules:
/// - Uuid: canonical lowercase 8-4-4-4-12 string.
/// - Timestamp: integer milliseconds since the Unix epoch.
/// - Enumerations: their to_string_view() name.
/// - Variants (events, requests): an object with a "type" discriminator
///   naming the alternative, plus that alternative's fields.
///
/// from_json throws Exception (ErrorKind::decoding_error) on unknown
/// names or malformed ids, and nlohmann::json::exception on missing or
/// mistyped fields.

#pragma once

#include <collab-cpp/access.hpp>
#include <collab-cpp/annotation.hpp>
#include <collab-cpp/document_store.hpp>
#include <collab-cpp/edit.hpp>
#include <collab-cpp/events.hpp>
#include <collab-cpp/request.hpp>
#include <collab-cpp/session.hpp>
#include <collab-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace collab_cpp {

// -- Identity and time --------------------------------------------------------

void to_json(nlohmann::json& j, const Uuid& id);
void from_json(const nlohmann::json& j, Uuid& id);

void to_json(nlohmann::json& j, const Timestamp& t);
void from_json(const nlohmann::json& j, Timestamp& t);

// -- Enumerations (string names) ----------------------------------------------

void to_json(nlohmann::json& j, Role role);
void from_json(const nlohmann::json& j, Role& role);

void to_json(nlohmann::json& j, EditType type);
void from_json(const nlohmann::json& j, EditType& type);

void to_json(nlohmann::json& j, AnnotationType type);
void from_json(const nlohmann::json& j, AnnotationType& type);

void to_json(nlohmann::json& j, SessionStatus status);
void from_json(const nlohmann::json& j, SessionStatus& status);

// -- Data model ---------------------------------------------------------------

void to_json(nlohmann::json& j, const CollaborationUser& user);
void from_json(const nlohmann::json& j, CollaborationUser& user);

void to_json(nlohmann::json& j, const CollaborationSession& session);
void from_json(const nlohmann::json& j, CollaborationSession& session);

void to_json(nlohmann::json& j, const SharedDocument& doc);
void from_json(const nlohmann::json& j, SharedDocument& doc);

void to_json(nlohmann::json& j, const EditOperation& op);
void from_json(const nlohmann::json& j, EditOperation& op);

void to_json(nlohmann::json& j, const EditHistoryItem& item);

void to_json(nlohmann::json& j, const AnnotationReply& reply);
void from_json(const nlohmann::json& j, AnnotationReply& reply);

void to_json(nlohmann::json& j, const DocumentAnnotation& annotation);
void from_json(const nlohmann::json& j, DocumentAnnotation& annotation);

void to_json(nlohmann::json& j, const SharedMessage& message);
void from_json(const nlohmann::json& j, SharedMessage& message);

void to_json(nlohmann::json& j, const SharedConversation& conversation);
void from_json(const nlohmann::json& j, SharedConversation& conversation);

// -- Events -------------------------------------------------------------------

void to_json(nlohmann::json& j, const SessionUpdate& update);
void from_json(const nlohmann::json& j, SessionUpdate& update);

void to_json(nlohmann::json& j, const DocumentUpdate& update);
void from_json(const nlohmann::json& j, DocumentUpdate& update);

// -- Requests -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Request& request);

/// Decode a request. Requests are a variant, so decoding is a function
/// rather than an ADL from_json.
auto request_from_json(const nlohmann::json& j) -> Request;

}  // namespace collab_cpp
