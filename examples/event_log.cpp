// event_log -- streams every update as a line of JSON
//
// Subscribes to both event families and writes each update to stdout in
// the same JSON form a transport layer would send. Runs a short session
// with a denied edit, an annotation and a shared conversation. The
// library's own diagnostics go to stderr through spdlog.
//
// Build: cmake --build build
// Run:   ./build/examples/event_log [--verbose]

#include <collab-cpp/collab.hpp>
#include <collab-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <string>

namespace cc = collab_cpp;
using json = nlohmann::json;

static auto make_user(const char* name) -> cc::CollaborationUser {
    return cc::CollaborationUser{
        .id = cc::Uuid::random(),
        .name = name,
        .email = std::string{name} + "@example.com",
        .avatar_url = std::nullopt,
    };
}

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::warn);
    if (argc > 1 && std::strcmp(argv[1], "--verbose") == 0) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto collab = cc::Collaboration{};
    collab.events().subscribe([](const cc::SessionUpdate& u) {
        std::printf("%s\n", json(u).dump().c_str());
    });
    collab.events().subscribe([](const cc::DocumentUpdate& u) {
        std::printf("%s\n", json(u).dump().c_str());
    });

    auto alice = make_user("Alice");
    auto bob = make_user("Bob");

    auto session = collab.sessions().create_session("Review", alice);
    collab.sessions().join_session(session.id, bob);

    auto doc = collab.documents().create_shared_document("Notes", "draft", alice);
    collab.documents().share_document(doc.id, bob.id, cc::Role::viewer);

    // Viewers cannot edit: nothing is published for this one.
    auto denied = collab.documents().apply_edit(doc.id, bob.id, cc::EditOperation{
        .type = cc::EditType::del,
        .position = 0,
        .content = "draft",
        .timestamp = cc::Timestamp::now(),
        .user_id = bob.id,
    });
    if (!denied) {
        std::fprintf(stderr, "bob's edit was rejected\n");
    }

    collab.documents().add_annotation(doc.id, bob.id, cc::DocumentAnnotation{
        .id = cc::Uuid::random(),
        .user_id = bob.id,
        .created_at = cc::Timestamp::now(),
        .type = cc::AnnotationType::suggestion,
        .position = 0,
        .content = "final",
        .replies = {},
    });

    auto conversation = cc::SharedConversation{
        .id = cc::Uuid::random(),
        .title = "Kickoff",
        .created_at = cc::Timestamp::now(),
        .created_by = alice.id,
        .messages = {
            cc::SharedMessage{.id = cc::Uuid::random(), .user_id = alice.id,
                              .timestamp = cc::Timestamp::now(),
                              .content = "What is left?", .is_ai = false},
            cc::SharedMessage{.id = cc::Uuid::random(), .user_id = alice.id,
                              .timestamp = cc::Timestamp::now(),
                              .content = "The notes need a final pass.", .is_ai = true},
        },
    };
    collab.share_conversation(conversation, alice.id);

    collab.sessions().leave_session(bob);
    collab.sessions().leave_session(alice);
    return 0;
}
