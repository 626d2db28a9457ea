#include <collab-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace collab_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::access_denied),     "access_denied");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),         "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::no_active_session), "no_active_session");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error),    "decoding_error");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation), "invalid_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "no such document"};
    const auto e2 = Error{ErrorKind::not_found, "no such document"};
    const auto e3 = Error{ErrorKind::access_denied, "no such document"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::not_found, "foo"};
    const auto e2 = Error{ErrorKind::not_found, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_error_and_message) {
    const auto ex = Exception{ErrorKind::no_active_session, "no active session"};

    EXPECT_EQ(ex.kind(), ErrorKind::no_active_session);
    EXPECT_EQ(ex.error().message, "no active session");
    EXPECT_STREQ(ex.what(), "no active session");
}

TEST(Exception, catchable_as_runtime_error) {
    try {
        throw Exception{ErrorKind::decoding_error, "bad uuid"};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "bad uuid");
        return;
    }
    FAIL() << "exception was not caught as std::runtime_error";
}
