#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/graph.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <vector>

using namespace marshal_cpp;

namespace {

// Marshal bytes, header included.
auto marshal(std::initializer_list<int> body) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{std::byte{0x04}, std::byte{0x08}};
    for (auto v : body) result.push_back(static_cast<std::byte>(v));
    return result;
}

auto decode_error(const std::vector<std::byte>& data) -> ErrorKind {
    try {
        decode(data);
    } catch (const Exception& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode succeeded";
    return ErrorKind::malformed;
}

}  // anonymous namespace

// -- Header and framing -------------------------------------------------------

TEST(Decoder, rejects_wrong_version) {
    auto data = std::vector<std::byte>{std::byte{0x04}, std::byte{0x09}, std::byte{'0'}};
    EXPECT_EQ(decode_error(data), ErrorKind::incompatible_version);
}

TEST(Decoder, rejects_short_header) {
    EXPECT_EQ(decode_error({}), ErrorKind::incompatible_version);
    EXPECT_EQ(decode_error({std::byte{0x04}}), ErrorKind::incompatible_version);
}

TEST(Decoder, header_without_value_is_unexpected_end) {
    EXPECT_EQ(decode_error(marshal({})), ErrorKind::unexpected_end);
}

TEST(Decoder, one_trailing_byte_is_rejected) {
    EXPECT_EQ(decode_error(marshal({'0', '0'})), ErrorKind::trailing_data);
}

TEST(Decoder, unknown_tag) {
    EXPECT_EQ(decode_error(marshal({'z'})), ErrorKind::unknown_tag);
}

TEST(Decoder, truncated_array_is_unexpected_end) {
    EXPECT_EQ(decode_error(marshal({'[', 0x07, 'i', 0x06})), ErrorKind::unexpected_end);
}

TEST(Decoder, negative_length_is_malformed) {
    EXPECT_EQ(decode_error(marshal({'[', 0xFA})), ErrorKind::malformed);
}

TEST(Decoder, length_beyond_the_buffer_is_unexpected_end) {
    EXPECT_EQ(decode_error(marshal({'"', 0x7F, 'a'})), ErrorKind::unexpected_end);
}

// -- Immediates ---------------------------------------------------------------

TEST(Decoder, nil_true_false) {
    EXPECT_TRUE(is_nil(decode(marshal({'0'})).root));
    EXPECT_EQ(get_as<bool>(decode(marshal({'T'})).root), true);
    EXPECT_EQ(get_as<bool>(decode(marshal({'F'})).root), false);
}

TEST(Decoder, fixnums) {
    EXPECT_EQ(get_as<std::int64_t>(decode(marshal({'i', 0x00})).root), 0);
    EXPECT_EQ(get_as<std::int64_t>(decode(marshal({'i', 0x06})).root), 1);
    EXPECT_EQ(get_as<std::int64_t>(decode(marshal({'i', 0xFA})).root), -1);
    EXPECT_EQ(get_as<std::int64_t>(decode(marshal({'i', 0x01, 0xFF})).root), 255);
    EXPECT_EQ(get_as<std::int64_t>(decode(marshal({'i', 0xFE, 0x00, 0xFF})).root), -256);
}

TEST(Decoder, symbol_and_symbol_link) {
    auto doc = decode(marshal({'[', 0x07, ':', 0x08, 'f', 'o', 'o', ';', 0x00}));
    const auto* array = doc.graph.get_if<Array>(doc.root);
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->elements.size(), 2u);
    EXPECT_EQ(get_as<Symbol>(array->elements[0]), Symbol{"foo"});
    EXPECT_EQ(get_as<Symbol>(array->elements[1]), Symbol{"foo"});
}

TEST(Decoder, symbol_link_out_of_range) {
    EXPECT_EQ(decode_error(marshal({';', 0x00})), ErrorKind::bad_reference);
}

TEST(Decoder, object_link_out_of_range) {
    EXPECT_EQ(decode_error(marshal({'@', 0x00})), ErrorKind::bad_reference);
    EXPECT_EQ(decode_error(marshal({'[', 0x06, '@', 0x06})), ErrorKind::bad_reference);
}

// -- Floats and bignums -------------------------------------------------------

TEST(Decoder, float_text) {
    auto doc = decode(marshal({'f', 0x08, '1', '.', '5'}));
    EXPECT_EQ(get_as<double>(doc.root), 1.5);
}

TEST(Decoder, float_text_stops_at_nul) {
    auto doc = decode(marshal({'f', 0x0A, '1', '.', '5', 0x00, 'x'}));
    EXPECT_EQ(get_as<double>(doc.root), 1.5);
}

TEST(Decoder, float_special_values) {
    auto nan = get_as<double>(decode(marshal({'f', 0x08, 'n', 'a', 'n'})).root);
    ASSERT_TRUE(nan.has_value());
    EXPECT_TRUE(std::isnan(*nan));

    auto inf = get_as<double>(decode(marshal({'f', 0x08, 'i', 'n', 'f'})).root);
    EXPECT_EQ(inf, HUGE_VAL);

    auto ninf = get_as<double>(decode(marshal({'f', 0x09, '-', 'i', 'n', 'f'})).root);
    EXPECT_EQ(ninf, -HUGE_VAL);
}

TEST(Decoder, float_garbage_is_malformed) {
    EXPECT_EQ(decode_error(marshal({'f', 0x08, 'a', 'b', 'c'})), ErrorKind::malformed);
}

TEST(Decoder, float_occupies_an_object_slot) {
    // [1.5, @1]
    auto doc = decode(marshal({'[', 0x07, 'f', 0x08, '1', '.', '5', '@', 0x06}));
    const auto* array = doc.graph.get_if<Array>(doc.root);
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->elements.size(), 2u);
    EXPECT_EQ(get_as<double>(array->elements[1]), 1.5);
}

TEST(Decoder, small_bignum_becomes_int64) {
    // 2^30, just outside the 'i' range
    auto doc = decode(marshal({'l', '+', 0x07, 0x00, 0x00, 0x00, 0x40}));
    EXPECT_EQ(get_as<std::int64_t>(doc.root), std::int64_t{1} << 30);
}

TEST(Decoder, negative_bignum) {
    auto doc = decode(marshal({'l', '-', 0x07, 0x00, 0x00, 0x00, 0x40}));
    EXPECT_EQ(get_as<std::int64_t>(doc.root), -(std::int64_t{1} << 30));
}

TEST(Decoder, wide_bignum_keeps_its_magnitude) {
    // 2^64 + 1
    auto doc = decode(marshal({'l', '+', 0x0A,
                               0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00}));
    auto big = get_as<BigInt>(doc.root);
    ASSERT_TRUE(big.has_value());
    EXPECT_FALSE(big->negative);
    ASSERT_EQ(big->magnitude.size(), 9u);
    EXPECT_EQ(big->magnitude[0], std::byte{0x01});
    EXPECT_EQ(big->magnitude[8], std::byte{0x01});
}

TEST(Decoder, bignum_bad_sign_is_malformed) {
    EXPECT_EQ(decode_error(marshal({'l', '*', 0x06, 0x01, 0x00})), ErrorKind::malformed);
}

// -- Heap values --------------------------------------------------------------

TEST(Decoder, string_bytes) {
    auto doc = decode(marshal({'"', 0x08, 'a', 'b', 'c'}));
    const auto* s = doc.graph.get_if<String>(doc.root);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->text(), "abc");
}

TEST(Decoder, ivar_wrapper_attaches_to_the_string) {
    // "abc" with :E => true
    auto doc = decode(marshal({'I', '"', 0x08, 'a', 'b', 'c', 0x06, ':', 0x06, 'E', 'T'}));
    auto ref = get_as<NodeRef>(doc.root);
    ASSERT_TRUE(ref.has_value());
    const auto& node = doc.graph.node(*ref);
    ASSERT_EQ(node.ivars.size(), 1u);
    EXPECT_EQ(node.ivars[0].first, Symbol{"E"});
    EXPECT_EQ(get_as<bool>(node.ivars[0].second), true);
}

TEST(Decoder, ivar_wrapper_around_symbol_is_dropped) {
    auto doc = decode(marshal({'I', ':', 0x06, 'a', 0x06, ':', 0x06, 'E', 'T'}));
    EXPECT_EQ(get_as<Symbol>(doc.root), Symbol{"a"});
    EXPECT_EQ(doc.graph.size(), 0u);
}

TEST(Decoder, ivar_wrapper_around_fixnum_is_malformed) {
    EXPECT_EQ(decode_error(marshal({'I', 'i', 0x06, 0x00})), ErrorKind::malformed);
}

TEST(Decoder, regexp) {
    auto doc = decode(marshal({'/', 0x08, 'a', 'b', 'c', 0x01}));
    const auto* re = doc.graph.get_if<Regexp>(doc.root);
    ASSERT_NE(re, nullptr);
    EXPECT_EQ(re->source.size(), 3u);
    EXPECT_EQ(re->options, 1);
}

TEST(Decoder, hash_with_default) {
    // {1 => 2} with default 3
    auto doc = decode(marshal({'}', 0x06, 'i', 0x06, 'i', 0x07, 'i', 0x08}));
    const auto* hash = doc.graph.get_if<Hash>(doc.root);
    ASSERT_NE(hash, nullptr);
    ASSERT_EQ(hash->entries.size(), 1u);
    EXPECT_EQ(get_as<std::int64_t>(hash->entries[0].first), 1);
    EXPECT_EQ(get_as<std::int64_t>(hash->entries[0].second), 2);
    ASSERT_TRUE(hash->default_value.has_value());
    EXPECT_EQ(get_as<std::int64_t>(*hash->default_value), 3);
}

TEST(Decoder, plain_hash_has_no_default) {
    auto doc = decode(marshal({'{', 0x00}));
    const auto* hash = doc.graph.get_if<Hash>(doc.root);
    ASSERT_NE(hash, nullptr);
    EXPECT_FALSE(hash->default_value.has_value());
}

TEST(Decoder, object_with_ivars) {
    // Point with @x = 1
    auto doc = decode(marshal({'o', ':', 0x0A, 'P', 'o', 'i', 'n', 't', 0x06,
                               ':', 0x07, '@', 'x', 'i', 0x06}));
    const auto* object = doc.graph.get_if<Object>(doc.root);
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(object->class_name.name, "Point");
    const auto* x = find_field(object->fields, "@x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(get_as<std::int64_t>(*x), 1);
}

TEST(Decoder, object_class_name_must_be_a_symbol) {
    EXPECT_EQ(decode_error(marshal({'o', 'i', 0x06, 0x00})), ErrorKind::malformed);
}

TEST(Decoder, struct_members) {
    auto doc = decode(marshal({'S', ':', 0x06, 'P', 0x07,
                               ':', 0x06, 'a', 'i', 0x06,
                               ':', 0x06, 'b', 'i', 0x07}));
    const auto* s = doc.graph.get_if<Struct>(doc.root);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->class_name.name, "P");
    ASSERT_EQ(s->members.size(), 2u);
    EXPECT_EQ(s->members[1].first, Symbol{"b"});
}

TEST(Decoder, user_defined_data) {
    auto doc = decode(marshal({'u', ':', 0x06, 'X', 0x07, 0xAB, 0xCD}));
    const auto* data = doc.graph.get_if<UserData>(doc.root);
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->class_name.name, "X");
    ASSERT_EQ(data->data.size(), 2u);
    EXPECT_EQ(data->data[0], std::byte{0xAB});
}

TEST(Decoder, user_marshal_and_data) {
    auto um = decode(marshal({'U', ':', 0x06, 'X', '[', 0x00}));
    const auto* u = um.graph.get_if<UserMarshal>(um.root);
    ASSERT_NE(u, nullptr);
    EXPECT_NE(um.graph.get_if<Array>(u->data), nullptr);

    auto wd = decode(marshal({'d', ':', 0x06, 'D', '0'}));
    const auto* d = wd.graph.get_if<WrappedData>(wd.root);
    ASSERT_NE(d, nullptr);
    EXPECT_TRUE(is_nil(d->data));
}

TEST(Decoder, class_and_module_references) {
    auto c = decode(marshal({'c', 0x0B, 'S', 't', 'r', 'i', 'n', 'g'}));
    const auto* cls = c.graph.get_if<ClassRef>(c.root);
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->name, "String");

    auto m = decode(marshal({'M', 0x06, 'K'}));
    const auto* mod = m.graph.get_if<ModuleRef>(m.root);
    ASSERT_NE(mod, nullptr);
    EXPECT_EQ(mod->name, "K");
    EXPECT_TRUE(mod->legacy);
}

TEST(Decoder, extends_are_kept_outermost_first) {
    auto doc = decode(marshal({'e', ':', 0x06, 'A', 'e', ':', 0x06, 'B', '[', 0x00}));
    auto ref = get_as<NodeRef>(doc.root);
    ASSERT_TRUE(ref.has_value());
    const auto& node = doc.graph.node(*ref);
    ASSERT_EQ(node.extends.size(), 2u);
    EXPECT_EQ(node.extends[0], Symbol{"A"});
    EXPECT_EQ(node.extends[1], Symbol{"B"});
}

TEST(Decoder, extended_fixnum_is_malformed) {
    EXPECT_EQ(decode_error(marshal({'e', ':', 0x06, 'M', 'i', 0x06})), ErrorKind::malformed);
}

TEST(Decoder, user_class_wrapper) {
    auto doc = decode(marshal({'C', ':', 0x08, 'F', 'o', 'o', '"', 0x06, 'x'}));
    auto ref = get_as<NodeRef>(doc.root);
    ASSERT_TRUE(ref.has_value());
    const auto& node = doc.graph.node(*ref);
    ASSERT_TRUE(node.user_class.has_value());
    EXPECT_EQ(node.user_class->name, "Foo");
    EXPECT_NE(doc.graph.get_if<String>(doc.root), nullptr);
}

// -- Sharing and cycles -------------------------------------------------------

TEST(Decoder, two_links_share_one_node) {
    // ["x", @1]
    auto doc = decode(marshal({'[', 0x07, '"', 0x06, 'x', '@', 0x06}));
    const auto* array = doc.graph.get_if<Array>(doc.root);
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->elements.size(), 2u);
    EXPECT_EQ(array->elements[0], array->elements[1]);

    // Mutating through one reference is visible through the other.
    auto second = array->elements[1];
    doc.graph.get_if<String>(array->elements[0])->data.push_back(std::byte{'y'});
    EXPECT_EQ(doc.graph.get_if<String>(second)->text(), "xy");
}

TEST(Decoder, self_referencing_array) {
    // a = []; a << a
    auto doc = decode(marshal({'[', 0x06, '@', 0x00}));
    const auto* array = doc.graph.get_if<Array>(doc.root);
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->elements.size(), 1u);
    EXPECT_EQ(array->elements[0], doc.root);
}

TEST(Decoder, object_cycle_through_ivar) {
    // o = Node.new; o.@next = o
    auto doc = decode(marshal({'o', ':', 0x09, 'N', 'o', 'd', 'e', 0x06,
                               ':', 0x0A, '@', 'n', 'e', 'x', 't', '@', 0x00}));
    const auto* object = doc.graph.get_if<Object>(doc.root);
    ASSERT_NE(object, nullptr);
    const auto* next = find_field(object->fields, "@next");
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(*next, doc.root);
}

// -- Limits -------------------------------------------------------------------

TEST(Decoder, nesting_beyond_max_depth_is_malformed) {
    auto data = marshal({'[', 0x06, '[', 0x06, '[', 0x00});
    EXPECT_NO_THROW(decode(data, DecodeOptions{.max_depth = 3}));
    try {
        decode(data, DecodeOptions{.max_depth = 2});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::malformed);
    }
}

TEST(Decoder, deep_input_does_not_overflow_the_stack) {
    auto data = marshal({});
    for (int i = 0; i < 100000; ++i) {
        data.push_back(std::byte{'['});
        data.push_back(std::byte{0x06});
    }
    data.push_back(std::byte{'0'});
    EXPECT_THROW(decode(data), Exception);
}
