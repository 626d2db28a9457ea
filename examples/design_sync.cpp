// design_sync -- two users share and edit a document in one session
//
// Alice opens a "Design Sync" session, Bob joins, Alice creates a design
// document and makes Bob an editor. Both edit, Bob leaves a comment and
// Alice replies. Every update published on the bus is printed as it happens.
//
// Build: cmake --build build
// Run:   ./build/examples/design_sync

#include <collab-cpp/collab.hpp>

#include <cstdio>
#include <string>
#include <utility>

namespace cc = collab_cpp;

static auto make_user(const char* name, const char* email) -> cc::CollaborationUser {
    return cc::CollaborationUser{
        .id = cc::Uuid::random(),
        .name = name,
        .email = email,
        .avatar_url = std::nullopt,
    };
}

static auto make_edit(cc::EditType type, std::size_t position, std::string content,
                      const cc::UserId& user) -> cc::EditOperation {
    return cc::EditOperation{
        .type = type,
        .position = position,
        .content = std::move(content),
        .timestamp = cc::Timestamp::now(),
        .user_id = user,
    };
}

int main() {
    auto collab = cc::Collaboration{};

    // -- Print every update -----------------------------------------------------
    collab.events().subscribe([](const cc::SessionUpdate& u) {
        std::visit(cc::overload{
            [](const cc::SessionCreated& p) {
                std::printf("[session] %s created '%s'\n", p.creator_name.c_str(),
                            p.name.c_str());
            },
            [](const cc::UserJoined& p) {
                std::printf("[session] %s joined\n", p.user_name.c_str());
            },
            [](const cc::UserLeft& p) {
                std::printf("[session] %s left\n", p.user_name.c_str());
            },
            [](const cc::SessionClosed&) {
                std::printf("[session] closed\n");
            },
            [](const cc::ConversationShared& p) {
                std::printf("[session] %s shared '%s'\n", p.user_name.c_str(),
                            p.title.c_str());
            },
        }, u.payload);
    });
    collab.events().subscribe([](const cc::DocumentUpdate& u) {
        std::visit(cc::overload{
            [](const cc::DocumentCreated& p) {
                std::printf("[doc] %s created '%s'\n", p.creator_name.c_str(), p.title.c_str());
            },
            [](const cc::DocumentShared& p) {
                std::printf("[doc] '%s' shared with %s as %.*s\n", p.title.c_str(),
                            p.user_name.c_str(),
                            static_cast<int>(cc::to_string_view(p.role).size()),
                            cc::to_string_view(p.role).data());
            },
            [](const cc::DocumentEdited& p) {
                std::printf("[doc] v%llu %s: %s\n",
                            static_cast<unsigned long long>(p.version),
                            p.user_name.c_str(), p.description.c_str());
            },
            [](const cc::AnnotationAdded& p) {
                std::printf("[doc] %s annotated '%s' at %zu\n", p.user_name.c_str(),
                            p.title.c_str(), p.position);
            },
        }, u.payload);
    });

    auto alice = make_user("Alice", "alice@example.com");
    auto bob = make_user("Bob", "bob@example.com");

    // -- Session ----------------------------------------------------------------
    auto session = collab.sessions().create_session("Design Sync", alice);
    collab.sessions().join_session(session.id, bob);

    // -- Document ---------------------------------------------------------------
    auto doc = collab.documents().create_shared_document(
        "Spec", "This is a test document", alice);
    collab.documents().share_document(doc.id, bob.id, cc::Role::editor);

    auto& store = collab.documents();
    store.apply_edit(doc.id, bob.id, make_edit(cc::EditType::insert, 23, " with an edit", bob.id));
    store.apply_edit(doc.id, alice.id, make_edit(cc::EditType::replace, 10, "TEST", alice.id));

    // -- Annotations ------------------------------------------------------------
    auto note = cc::DocumentAnnotation{
        .id = cc::Uuid::random(),
        .user_id = bob.id,
        .created_at = cc::Timestamp::now(),
        .type = cc::AnnotationType::comment,
        .position = 10,
        .content = "Why uppercase?",
        .replies = {},
    };
    auto note_id = note.id;
    store.add_annotation(doc.id, bob.id, std::move(note));
    store.reply_to_annotation(doc.id, alice.id, note_id, cc::AnnotationReply{
        .id = cc::Uuid::random(),
        .user_id = alice.id,
        .created_at = cc::Timestamp::now(),
        .content = "Emphasis.",
    });

    // -- Result -----------------------------------------------------------------
    auto content = store.content(doc.id).value_or("");
    auto meta = store.document(doc.id);
    std::printf("\ncontent: \"%s\" (version %llu)\n", content.c_str(),
                static_cast<unsigned long long>(meta ? meta->version : 0));
    std::printf("history:\n");
    for (const auto& item : store.history(doc.id)) {
        std::printf("  %-6s %s\n", item.user_name.c_str(), cc::describe(item.operation).c_str());
    }
    for (const auto& a : store.annotations(doc.id)) {
        std::printf("annotation at %zu: %s (%zu replies)\n", a.position, a.content.c_str(),
                    a.replies.size());
    }

    collab.sessions().leave_session(bob);
    collab.sessions().leave_session(alice);
    return 0;
}
