// request_relay -- a single ordering authority fed by serialized requests
//
// Two replicas produce requests as JSON text, the way they would arrive
// over a socket. The relay decodes each line with request_from_json() and
// hands it to Collaboration::handle(), so every edit is applied in arrival
// order. Malformed lines are reported and skipped.
//
// Build: cmake --build build
// Run:   ./build/examples/request_relay

#include <collab-cpp/collab.hpp>
#include <collab-cpp/json.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

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

static auto edit_line(const cc::DocumentId& doc, const cc::UserId& user, cc::EditType type,
                      std::size_t position, std::string content) -> std::string {
    auto now = cc::Timestamp::now();
    return json(cc::Request{cc::EditRequest{
        .document_id = doc,
        .user_id = user,
        .operation = cc::EditOperation{.type = type, .position = position,
                                       .content = std::move(content),
                                       .timestamp = now, .user_id = user},
        .timestamp = now,
    }}).dump();
}

int main() {
    auto relay = cc::Collaboration{};
    auto alice = make_user("Alice");
    auto bob = make_user("Bob");

    auto session = relay.sessions().create_session("Pairing", alice);
    auto doc = relay.documents().create_shared_document("main.cpp", "int main() {}", alice);

    // -- Wire traffic, in arrival order ----------------------------------------
    auto lines = std::vector<std::string>{
        json(cc::Request{cc::JoinRequest{.session_id = session.id, .user = bob,
                                         .timestamp = cc::Timestamp::now()}}).dump(),
        json(cc::Request{cc::ShareRequest{.document_id = doc.id, .user_id = bob.id,
                                          .role = cc::Role::editor,
                                          .timestamp = cc::Timestamp::now()}}).dump(),
        edit_line(doc.id, bob.id, cc::EditType::insert, 12, " return 0; "),
        edit_line(doc.id, alice.id, cc::EditType::replace, 0, "INT"),
        R"({"type": "rename", "timestamp": 0})",
        "{ not json",
        json(cc::Request{cc::LeaveRequest{.user = bob,
                                          .timestamp = cc::Timestamp::now()}}).dump(),
    };

    for (const auto& line : lines) {
        try {
            auto request = cc::request_from_json(json::parse(line));
            auto accepted = relay.handle(request);
            std::printf("%-8s %s\n", accepted ? "applied" : "rejected",
                        json(request).at("type").get<std::string>().c_str());
        } catch (const cc::Exception& e) {
            std::printf("skipped  %s\n", e.what());
        } catch (const json::exception& e) {
            std::printf("skipped  malformed line (%s)\n", e.what());
        }
    }

    auto meta = relay.documents().document(doc.id);
    std::printf("\n%s v%llu: %s\n", meta->title.c_str(),
                static_cast<unsigned long long>(meta->version),
                relay.documents().content(doc.id).value_or("").c_str());
    return 0;
}
