#include <marshal-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace marshal_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::incompatible_version), "incompatible_version");
    EXPECT_EQ(to_string_view(ErrorKind::unexpected_end),       "unexpected_end");
    EXPECT_EQ(to_string_view(ErrorKind::trailing_data),        "trailing_data");
    EXPECT_EQ(to_string_view(ErrorKind::bad_reference),        "bad_reference");
    EXPECT_EQ(to_string_view(ErrorKind::unknown_tag),          "unknown_tag");
    EXPECT_EQ(to_string_view(ErrorKind::schema_mismatch),      "schema_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::grid_shape_mismatch),  "grid_shape_mismatch");
    EXPECT_EQ(to_string_view(ErrorKind::malformed),            "malformed");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::bad_reference, "link 3"};
    const auto e2 = Error{ErrorKind::bad_reference, "link 3"};
    const auto e3 = Error{ErrorKind::unknown_tag, "link 3"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::malformed, "foo"};
    const auto e2 = Error{ErrorKind::malformed, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_the_error) {
    const auto e = Exception{ErrorKind::trailing_data, "2 bytes after the top-level value"};

    EXPECT_EQ(e.kind(), ErrorKind::trailing_data);
    EXPECT_EQ(e.error().message, "2 bytes after the top-level value");
}

TEST(Exception, what_prefixes_the_kind) {
    const auto e = Exception{Error{ErrorKind::unknown_tag, "tag 0x7a at offset 2"}};

    EXPECT_EQ(std::string{e.what()}, "unknown_tag: tag 0x7a at offset 2");
}

TEST(Exception, is_a_runtime_error) {
    try {
        throw Exception{ErrorKind::schema_mismatch, "x"};
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("schema_mismatch"), std::string::npos);
        return;
    }
    FAIL() << "exception was not caught as std::runtime_error";
}
