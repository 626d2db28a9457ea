/// @file options.hpp
/// @brief Construction-time settings for the collaboration services.

#pragma once

#include <string>

namespace collab_cpp {

/// Settings passed to DocumentStore and Collaboration at construction.
struct Options {
    /// Reject edits and annotations on documents whose session is no
    /// longer active. Off by default: documents stay editable after their
    /// session closes.
    bool lock_documents_on_session_close{false};

    /// Display name used in events and history for users that are not
    /// connected to the active session.
    std::string unknown_user_name{"Unknown User"};
};

}  // namespace collab_cpp
