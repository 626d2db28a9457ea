#include <collab-cpp/document_store.hpp>
#include <collab-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace collab_cpp;

namespace {

auto make_user(const std::string& name) -> CollaborationUser {
    return CollaborationUser{
        .id = Uuid::random(),
        .name = name,
        .email = name + "@example.com",
        .avatar_url = std::nullopt,
    };
}

auto edit(EditType type, std::size_t position, std::string content, const UserId& user)
    -> EditOperation {
    return EditOperation{
        .type = type,
        .position = position,
        .content = std::move(content),
        .timestamp = Timestamp::now(),
        .user_id = user,
    };
}

auto comment(const UserId& user, std::size_t position, std::string content)
    -> DocumentAnnotation {
    return DocumentAnnotation{
        .id = Uuid::random(),
        .user_id = user,
        .created_at = Timestamp::now(),
        .type = AnnotationType::comment,
        .position = position,
        .content = std::move(content),
        .replies = {},
    };
}

class DocumentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus.subscribe([this](const DocumentUpdate& u) { updates.push_back(u); });
    }

    // Create the standard session (Alice + Bob) and a "Spec" document.
    auto start_session_with_document(std::string content = "Hello") -> SharedDocument {
        session = sessions.create_session("Design Sync", alice);
        sessions.join_session(session.id, bob);
        return store.create_shared_document("Spec", std::move(content), alice);
    }

    EventBus bus;
    SessionRegistry sessions{bus};
    DocumentStore store{sessions, bus};
    std::vector<DocumentUpdate> updates;
    CollaborationSession session;
    CollaborationUser alice = make_user("Alice");
    CollaborationUser bob = make_user("Bob");
    CollaborationUser carol = make_user("Carol");
};

}  // namespace

// -- create_shared_document ---------------------------------------------------

TEST_F(DocumentStoreTest, create_without_session_throws_typed_error) {
    try {
        store.create_shared_document("Spec", "Hello", alice);
        FAIL() << "expected collab_cpp::Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::no_active_session);
    }
    EXPECT_TRUE(store.documents().empty());
    EXPECT_TRUE(updates.empty());
}

TEST_F(DocumentStoreTest, create_after_session_closed_throws) {
    sessions.create_session("Design Sync", alice);
    sessions.leave_session(alice);
    EXPECT_THROW(store.create_shared_document("Spec", "Hello", alice), Exception);
}

TEST_F(DocumentStoreTest, store_remains_usable_after_rejected_create) {
    EXPECT_THROW(store.create_shared_document("Spec", "Hello", alice), Exception);
    sessions.create_session("Design Sync", alice);
    const auto doc = store.create_shared_document("Spec", "Hello", alice);
    EXPECT_EQ(store.content(doc.id), "Hello");
}

TEST_F(DocumentStoreTest, create_seeds_version_one_and_owner) {
    const auto doc = start_session_with_document();

    EXPECT_EQ(doc.version, 1u);
    EXPECT_EQ(doc.title, "Spec");
    EXPECT_EQ(doc.created_by, alice.id);
    EXPECT_EQ(doc.last_modified_by, alice.id);
    EXPECT_EQ(doc.created_at, doc.last_modified_at);
    EXPECT_EQ(doc.session_id, session.id);

    const auto* acl = store.acl(doc.id);
    ASSERT_NE(acl, nullptr);
    EXPECT_EQ(acl->size(), 1u);
    EXPECT_EQ(acl->role_of(alice.id), Role::owner);
    EXPECT_EQ(store.content(doc.id), "Hello");
}

TEST_F(DocumentStoreTest, create_for_various_inputs_always_has_single_owner) {
    sessions.create_session("Design Sync", alice);
    for (const auto& [title, content] : std::vector<std::pair<std::string, std::string>>{
             {"", ""}, {"Notes", "x"}, {"Long", std::string(10'000, 'a')},
             {"Unicode", "h\xC3\xA9llo"}}) {
        const auto doc = store.create_shared_document(title, content, alice);
        EXPECT_EQ(doc.version, 1u);
        EXPECT_EQ(store.acl(doc.id)->role_of(alice.id), Role::owner);
        EXPECT_EQ(store.acl(doc.id)->size(), 1u);
        EXPECT_EQ(store.content(doc.id), content);
    }
}

TEST_F(DocumentStoreTest, create_publishes_document_created) {
    const auto doc = start_session_with_document();

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].document_id, doc.id);
    EXPECT_EQ(updates[0].user_id, alice.id);
    const auto& payload = std::get<DocumentCreated>(updates[0].payload);
    EXPECT_EQ(payload.title, "Spec");
    EXPECT_EQ(payload.creator_name, "Alice");
}

TEST_F(DocumentStoreTest, documents_are_listed_in_creation_order) {
    sessions.create_session("Design Sync", alice);
    const auto a = store.create_shared_document("A", "", alice);
    const auto b = store.create_shared_document("B", "", alice);
    const auto c = store.create_shared_document("C", "", alice);

    const auto docs = store.documents();
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0].id, a.id);
    EXPECT_EQ(docs[1].id, b.id);
    EXPECT_EQ(docs[2].id, c.id);
}

// -- share_document / has_access ----------------------------------------------

TEST_F(DocumentStoreTest, share_grants_role_and_publishes) {
    const auto doc = start_session_with_document();

    EXPECT_TRUE(store.share_document(doc.id, bob.id, Role::editor));
    EXPECT_TRUE(store.has_access(bob.id, doc.id, Role::editor));
    EXPECT_FALSE(store.has_access(bob.id, doc.id, Role::owner));

    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[1].user_id, bob.id);
    const auto& payload = std::get<DocumentShared>(updates[1].payload);
    EXPECT_EQ(payload.title, "Spec");
    EXPECT_EQ(payload.user_name, "Bob");
    EXPECT_EQ(payload.role, Role::editor);
}

TEST_F(DocumentStoreTest, share_with_unconnected_user_uses_unknown_name) {
    const auto doc = start_session_with_document();
    EXPECT_TRUE(store.share_document(doc.id, carol.id, Role::viewer));
    EXPECT_EQ(std::get<DocumentShared>(updates.back().payload).user_name, "Unknown User");
}

TEST_F(DocumentStoreTest, share_unknown_document_returns_false) {
    start_session_with_document();
    const auto before = updates.size();

    EXPECT_FALSE(store.share_document(Uuid::random(), bob.id, Role::editor));
    EXPECT_EQ(updates.size(), before);
}

TEST_F(DocumentStoreTest, share_upserts_existing_entry) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::editor);
    store.share_document(doc.id, bob.id, Role::viewer);

    EXPECT_EQ(store.acl(doc.id)->size(), 2u);
    EXPECT_FALSE(store.has_access(bob.id, doc.id, Role::editor));
    EXPECT_TRUE(store.has_access(bob.id, doc.id, Role::viewer));
}

TEST_F(DocumentStoreTest, has_access_follows_role_lattice) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::viewer);

    EXPECT_TRUE(store.has_access(alice.id, doc.id, Role::viewer));
    EXPECT_TRUE(store.has_access(alice.id, doc.id, Role::owner));
    EXPECT_TRUE(store.has_access(bob.id, doc.id, Role::viewer));
    EXPECT_FALSE(store.has_access(bob.id, doc.id, Role::editor));
}

TEST_F(DocumentStoreTest, has_access_is_false_for_unknowns) {
    const auto doc = start_session_with_document();
    EXPECT_FALSE(store.has_access(carol.id, doc.id, Role::viewer));
    EXPECT_FALSE(store.has_access(alice.id, Uuid::random(), Role::viewer));
    EXPECT_EQ(store.acl(Uuid::random()), nullptr);
}

// -- apply_edit ---------------------------------------------------------------

TEST_F(DocumentStoreTest, owner_edit_bumps_version_and_metadata) {
    const auto doc = start_session_with_document("This is a test document");

    EXPECT_TRUE(store.apply_edit(doc.id, alice.id,
        edit(EditType::insert, 23, " with an edit", alice.id)));

    EXPECT_EQ(store.content(doc.id), "This is a test document with an edit");
    const auto updated = store.document(doc.id);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->version, 2u);
    EXPECT_EQ(updated->last_modified_by, alice.id);
    EXPECT_GE(updated->last_modified_at, doc.last_modified_at);
}

TEST_F(DocumentStoreTest, viewer_edit_is_denied_without_side_effects) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::viewer);
    const auto before = updates.size();

    EXPECT_FALSE(store.apply_edit(doc.id, bob.id, edit(EditType::del, 0, "H", bob.id)));

    EXPECT_EQ(store.document(doc.id)->version, 1u);
    EXPECT_EQ(store.content(doc.id), "Hello");
    EXPECT_TRUE(store.history(doc.id).empty());
    EXPECT_EQ(updates.size(), before);
}

TEST_F(DocumentStoreTest, edit_by_user_without_entry_is_denied) {
    const auto doc = start_session_with_document();
    EXPECT_FALSE(store.apply_edit(doc.id, carol.id, edit(EditType::insert, 0, "x", carol.id)));
    EXPECT_EQ(store.document(doc.id)->version, 1u);
}

TEST_F(DocumentStoreTest, edit_of_unknown_document_returns_false) {
    start_session_with_document();
    EXPECT_FALSE(store.apply_edit(Uuid::random(), alice.id,
        edit(EditType::insert, 0, "x", alice.id)));
}

TEST_F(DocumentStoreTest, edit_publishes_document_edited_with_new_version) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::editor);

    ASSERT_TRUE(store.apply_edit(doc.id, bob.id, edit(EditType::insert, 5, " World", bob.id)));

    EXPECT_EQ(type_of(updates.back()), DocumentUpdateType::document_edited);
    EXPECT_EQ(updates.back().user_id, bob.id);
    const auto& payload = std::get<DocumentEdited>(updates.back().payload);
    EXPECT_EQ(payload.version, 2u);
    EXPECT_EQ(payload.user_name, "Bob");
    EXPECT_EQ(payload.title, "Spec");
    EXPECT_EQ(payload.description, "Inserted \" World\" at position 5");
}

TEST_F(DocumentStoreTest, version_counts_only_successful_edits) {
    const auto doc = start_session_with_document("");
    store.share_document(doc.id, bob.id, Role::viewer);

    auto accepted = 0u;
    for (int i = 0; i < 10; ++i) {
        const auto& author = (i % 3 == 0) ? bob : alice;
        if (store.apply_edit(doc.id, author.id, edit(EditType::insert, 0, "x", author.id))) {
            ++accepted;
        }
    }

    EXPECT_EQ(accepted, 6u);
    EXPECT_EQ(store.document(doc.id)->version, 1u + accepted);
    EXPECT_EQ(store.history(doc.id).size(), accepted);
    EXPECT_EQ(store.content(doc.id), std::string(accepted, 'x'));
}

TEST_F(DocumentStoreTest, out_of_range_positions_are_clamped_not_rejected) {
    const auto doc = start_session_with_document("abc");

    EXPECT_TRUE(store.apply_edit(doc.id, alice.id, edit(EditType::insert, 1'000, "!", alice.id)));
    EXPECT_TRUE(store.apply_edit(doc.id, alice.id, edit(EditType::del, 1'000, "zz", alice.id)));

    EXPECT_EQ(store.content(doc.id), "abc!");
    EXPECT_EQ(store.document(doc.id)->version, 3u);
}

TEST_F(DocumentStoreTest, history_records_author_names) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::editor);
    store.share_document(doc.id, carol.id, Role::editor);

    store.apply_edit(doc.id, bob.id, edit(EditType::insert, 5, "!", bob.id));
    store.apply_edit(doc.id, carol.id, edit(EditType::insert, 6, "?", carol.id));

    const auto history = store.history(doc.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].user_name, "Bob");
    EXPECT_EQ(history[1].user_name, "Unknown User");
    EXPECT_EQ(history[1].operation.content, "?");
}

TEST_F(DocumentStoreTest, edits_to_one_document_leave_others_untouched) {
    sessions.create_session("Design Sync", alice);
    const auto a = store.create_shared_document("A", "aaa", alice);
    const auto b = store.create_shared_document("B", "bbb", alice);

    store.apply_edit(a.id, alice.id, edit(EditType::replace, 0, "AAA", alice.id));

    EXPECT_EQ(store.content(a.id), "AAA");
    EXPECT_EQ(store.content(b.id), "bbb");
    EXPECT_EQ(store.document(b.id)->version, 1u);
}

// -- Session closure ----------------------------------------------------------

TEST_F(DocumentStoreTest, documents_stay_editable_after_session_closes) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::editor);
    sessions.leave_session(alice);
    sessions.leave_session(bob);
    ASSERT_EQ(sessions.current_session()->status, SessionStatus::closed);

    EXPECT_FALSE(store.is_locked(doc.id));
    EXPECT_TRUE(store.apply_edit(doc.id, bob.id, edit(EditType::insert, 5, "!", bob.id)));
    EXPECT_EQ(store.content(doc.id), "Hello!");
    EXPECT_EQ(store.document(doc.id)->version, 2u);
}

TEST(DocumentStoreLocking, closed_session_locks_documents_when_configured) {
    auto bus = EventBus{};
    auto sessions = SessionRegistry{bus};
    auto store = DocumentStore{sessions, bus, Options{.lock_documents_on_session_close = true}};
    const auto alice = make_user("Alice");

    sessions.create_session("Design Sync", alice);
    const auto doc = store.create_shared_document("Spec", "Hello", alice);
    EXPECT_TRUE(store.apply_edit(doc.id, alice.id, edit(EditType::insert, 5, "!", alice.id)));

    sessions.leave_session(alice);

    EXPECT_TRUE(store.is_locked(doc.id));
    EXPECT_FALSE(store.apply_edit(doc.id, alice.id, edit(EditType::insert, 0, "x", alice.id)));
    EXPECT_FALSE(store.add_annotation(doc.id, alice.id, comment(alice.id, 0, "late")));
    EXPECT_EQ(store.content(doc.id), "Hello!");
    EXPECT_EQ(store.document(doc.id)->version, 2u);
}

TEST(DocumentStoreLocking, new_session_does_not_unlock_older_documents) {
    auto bus = EventBus{};
    auto sessions = SessionRegistry{bus};
    auto store = DocumentStore{sessions, bus, Options{.lock_documents_on_session_close = true}};
    const auto alice = make_user("Alice");

    sessions.create_session("First", alice);
    const auto old_doc = store.create_shared_document("Old", "", alice);
    sessions.create_session("Second", alice);
    const auto new_doc = store.create_shared_document("New", "", alice);

    EXPECT_TRUE(store.is_locked(old_doc.id));
    EXPECT_FALSE(store.is_locked(new_doc.id));
}

TEST(DocumentStoreOptions, unknown_user_name_is_configurable) {
    auto bus = EventBus{};
    auto sessions = SessionRegistry{bus};
    auto store = DocumentStore{sessions, bus, Options{.unknown_user_name = "guest"}};
    const auto alice = make_user("Alice");
    const auto carol = make_user("Carol");

    sessions.create_session("Design Sync", alice);
    const auto doc = store.create_shared_document("Spec", "", alice);
    store.share_document(doc.id, carol.id, Role::editor);
    store.apply_edit(doc.id, carol.id, edit(EditType::insert, 0, "x", carol.id));

    EXPECT_EQ(store.history(doc.id).at(0).user_name, "guest");
}

// -- Annotations --------------------------------------------------------------

TEST_F(DocumentStoreTest, viewer_can_annotate_without_bumping_version) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::viewer);

    EXPECT_TRUE(store.add_annotation(doc.id, bob.id, comment(bob.id, 2, "typo?")));

    const auto annotations = store.annotations(doc.id);
    ASSERT_EQ(annotations.size(), 1u);
    EXPECT_EQ(annotations[0].content, "typo?");
    EXPECT_EQ(store.document(doc.id)->version, 1u);

    EXPECT_EQ(type_of(updates.back()), DocumentUpdateType::annotation_added);
    const auto& payload = std::get<AnnotationAdded>(updates.back().payload);
    EXPECT_EQ(payload.annotation_type, AnnotationType::comment);
    EXPECT_EQ(payload.position, 2u);
    EXPECT_EQ(payload.annotation_id, annotations[0].id);
    EXPECT_EQ(payload.user_name, "Bob");
}

TEST_F(DocumentStoreTest, annotation_without_access_is_denied) {
    const auto doc = start_session_with_document();
    const auto before = updates.size();

    EXPECT_FALSE(store.add_annotation(doc.id, carol.id, comment(carol.id, 0, "hi")));
    EXPECT_FALSE(store.add_annotation(Uuid::random(), alice.id, comment(alice.id, 0, "hi")));

    EXPECT_TRUE(store.annotations(doc.id).empty());
    EXPECT_EQ(updates.size(), before);
}

TEST_F(DocumentStoreTest, annotation_position_is_stale_after_earlier_insert) {
    const auto doc = start_session_with_document("Hello World");
    store.add_annotation(doc.id, alice.id, comment(alice.id, 6, "on World"));

    store.apply_edit(doc.id, alice.id, edit(EditType::insert, 0, "Well, ", alice.id));

    EXPECT_EQ(store.content(doc.id), "Well, Hello World");
    EXPECT_EQ(store.annotations(doc.id)[0].position, 6u);
}

TEST_F(DocumentStoreTest, replies_accumulate_through_store) {
    const auto doc = start_session_with_document();
    store.share_document(doc.id, bob.id, Role::viewer);
    auto note = comment(alice.id, 0, "thoughts?");
    const auto note_id = note.id;
    store.add_annotation(doc.id, alice.id, std::move(note));

    const auto reply = AnnotationReply{.id = Uuid::random(), .user_id = bob.id,
                                       .created_at = Timestamp::now(), .content = "lgtm"};
    EXPECT_TRUE(store.reply_to_annotation(doc.id, bob.id, note_id, reply));
    EXPECT_FALSE(store.reply_to_annotation(doc.id, carol.id, note_id, reply));
    EXPECT_FALSE(store.reply_to_annotation(doc.id, bob.id, Uuid::random(), reply));

    const auto annotations = store.annotations(doc.id);
    ASSERT_EQ(annotations[0].replies.size(), 1u);
    EXPECT_EQ(annotations[0].replies[0].content, "lgtm");
}

// -- Reading unknown documents ------------------------------------------------

TEST_F(DocumentStoreTest, reads_of_unknown_document_are_empty) {
    const auto unknown = Uuid::random();
    EXPECT_FALSE(store.document(unknown).has_value());
    EXPECT_FALSE(store.content(unknown).has_value());
    EXPECT_TRUE(store.history(unknown).empty());
    EXPECT_TRUE(store.annotations(unknown).empty());
    EXPECT_FALSE(store.is_locked(unknown));
}
