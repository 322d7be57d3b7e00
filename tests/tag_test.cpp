#include "../src/wire/reference_tables.hpp"
#include "../src/wire/tag.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>

using namespace marshal_cpp;
using namespace marshal_cpp::wire;

// -- Tags ---------------------------------------------------------------------

TEST(Tag, to_tag_recognizes_every_tag_byte) {
    for (char c : std::string{"0TFi:;\"/fl[{}oSuUdcmMeCI@"}) {
        auto tag = to_tag(static_cast<std::byte>(c));
        ASSERT_TRUE(tag.has_value()) << "tag '" << c << "'";
        EXPECT_EQ(static_cast<char>(*tag), c);
    }
}

TEST(Tag, to_tag_rejects_other_bytes) {
    EXPECT_FALSE(to_tag(std::byte{'z'}).has_value());
    EXPECT_FALSE(to_tag(std::byte{0x00}).has_value());
    EXPECT_FALSE(to_tag(std::byte{0xFF}).has_value());
}

TEST(Tag, heap_values_register_objects) {
    EXPECT_TRUE(registers_object(Tag::string));
    EXPECT_TRUE(registers_object(Tag::float_));
    EXPECT_TRUE(registers_object(Tag::bignum));
    EXPECT_TRUE(registers_object(Tag::array));
    EXPECT_TRUE(registers_object(Tag::hash_default));
    EXPECT_TRUE(registers_object(Tag::object));
    EXPECT_TRUE(registers_object(Tag::user_defined));
    EXPECT_TRUE(registers_object(Tag::class_));
}

TEST(Tag, wrappers_links_and_immediates_do_not_register) {
    EXPECT_FALSE(registers_object(Tag::nil));
    EXPECT_FALSE(registers_object(Tag::fixnum));
    EXPECT_FALSE(registers_object(Tag::symbol));
    EXPECT_FALSE(registers_object(Tag::symbol_link));
    EXPECT_FALSE(registers_object(Tag::object_link));
    EXPECT_FALSE(registers_object(Tag::ivar));
    EXPECT_FALSE(registers_object(Tag::extended));
    EXPECT_FALSE(registers_object(Tag::user_class));
}

TEST(Tag, version_header_check) {
    const auto ok = std::array{std::byte{4}, std::byte{8}, std::byte{'0'}};
    const auto old = std::array{std::byte{4}, std::byte{7}};
    const auto short_input = std::array{std::byte{4}};

    EXPECT_TRUE(has_version_header(ok));
    EXPECT_FALSE(has_version_header(old));
    EXPECT_FALSE(has_version_header(short_input));
    EXPECT_FALSE(has_version_header({}));
}

// -- Reference tables ---------------------------------------------------------

TEST(ReferenceTable, indices_follow_insertion_order) {
    auto table = SymbolTable{"symbol"};
    EXPECT_EQ(table.push(Symbol{"a"}), 0u);
    EXPECT_EQ(table.push(Symbol{"b"}), 1u);

    EXPECT_EQ(table.get(0), Symbol{"a"});
    EXPECT_EQ(table.get(1), Symbol{"b"});
    EXPECT_EQ(table.size(), 2u);
}

TEST(ReferenceTable, link_past_the_end_is_a_bad_reference) {
    auto table = ObjectTable{"object"};
    table.push(Value{std::int64_t{1}});

    try {
        table.get(1);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::bad_reference);
        EXPECT_NE(e.error().message.find("object link 1"), std::string::npos);
    }
}

TEST(ReferenceTable, negative_link_is_a_bad_reference) {
    auto table = SymbolTable{"symbol"};
    table.push(Symbol{"a"});

    EXPECT_THROW(table.get(-1), Exception);
}

TEST(ReferenceIndex, find_returns_the_first_slot) {
    auto index = SymbolIndex{};
    EXPECT_FALSE(index.find("a").has_value());
    EXPECT_EQ(index.insert("a"), 0u);
    EXPECT_EQ(index.insert("b"), 1u);
    EXPECT_EQ(index.find("a"), 0u);
    EXPECT_EQ(index.find("b"), 1u);
}

TEST(ReferenceIndex, skip_consumes_an_anonymous_slot) {
    auto index = ObjectIndex{};
    EXPECT_EQ(index.insert(7), 0u);
    EXPECT_EQ(index.skip(), 1u);
    EXPECT_EQ(index.insert(3), 2u);
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.find(3), 2u);
}
