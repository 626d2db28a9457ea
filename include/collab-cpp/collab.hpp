/// @file collab.hpp
/// @brief Umbrella header for the collab-cpp library.
///
/// Include this single header for access to all public types:
/// Collaboration, SessionRegistry, DocumentStore, ReplicatedDocument,
/// AccessControlTable, EventBus, the event and request types, and Error.
/// JSON support lives in <collab-cpp/json.hpp> and is not included here.

#pragma once

#include <collab-cpp/access.hpp>
#include <collab-cpp/annotation.hpp>
#include <collab-cpp/collaboration.hpp>
#include <collab-cpp/document_store.hpp>
#include <collab-cpp/edit.hpp>
#include <collab-cpp/error.hpp>
#include <collab-cpp/event_bus.hpp>
#include <collab-cpp/events.hpp>
#include <collab-cpp/options.hpp>
#include <collab-cpp/replicated_document.hpp>
#include <collab-cpp/request.hpp>
#include <collab-cpp/session.hpp>
#include <collab-cpp/session_registry.hpp>
#include <collab-cpp/types.hpp>
