#include <marshal-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace marshal_cpp;

// -- BigInt -------------------------------------------------------------------

TEST(BigInt, from_magnitude_strips_high_zero_bytes) {
    auto n = BigInt::from_magnitude(false, Bytes{std::byte{0x01}, std::byte{0x00}, std::byte{0x00}});
    ASSERT_EQ(n.magnitude.size(), 1u);
    EXPECT_EQ(n.magnitude[0], std::byte{0x01});
}

TEST(BigInt, negative_zero_is_normalized) {
    auto n = BigInt::from_magnitude(true, Bytes{std::byte{0x00}, std::byte{0x00}});
    EXPECT_FALSE(n.negative);
    EXPECT_TRUE(n.magnitude.empty());
    EXPECT_EQ(n, BigInt{});
}

TEST(BigInt, to_int64_small_values) {
    EXPECT_EQ(BigInt::from_int64(0).to_int64(), 0);
    EXPECT_EQ(BigInt::from_int64(1).to_int64(), 1);
    EXPECT_EQ(BigInt::from_int64(-1).to_int64(), -1);
    EXPECT_EQ(BigInt::from_int64(1 << 30).to_int64(), 1 << 30);
}

TEST(BigInt, to_int64_extremes) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    EXPECT_EQ(BigInt::from_int64(max).to_int64(), max);
    EXPECT_EQ(BigInt::from_int64(min).to_int64(), min);
}

TEST(BigInt, to_int64_rejects_overflow) {
    // 2^63
    auto mag = Bytes(8, std::byte{0x00});
    mag[7] = std::byte{0x80};
    EXPECT_FALSE(BigInt::from_magnitude(false, mag).to_int64().has_value());
    EXPECT_EQ(BigInt::from_magnitude(true, mag).to_int64(), std::numeric_limits<std::int64_t>::min());

    // 2^64
    auto wide = Bytes(9, std::byte{0x00});
    wide[8] = std::byte{0x01};
    EXPECT_FALSE(BigInt::from_magnitude(false, wide).to_int64().has_value());
}

TEST(BigInt, from_int64_is_little_endian) {
    auto n = BigInt::from_int64(-0x1234);
    EXPECT_TRUE(n.negative);
    ASSERT_EQ(n.magnitude.size(), 2u);
    EXPECT_EQ(n.magnitude[0], std::byte{0x34});
    EXPECT_EQ(n.magnitude[1], std::byte{0x12});
}

// -- Value --------------------------------------------------------------------

TEST(Value, default_is_nil) {
    auto v = Value{};
    EXPECT_TRUE(is_nil(v));
    EXPECT_EQ(type_name(v), "nil");
}

TEST(Value, type_names) {
    EXPECT_EQ(type_name(Value{true}), "bool");
    EXPECT_EQ(type_name(Value{std::int64_t{3}}), "integer");
    EXPECT_EQ(type_name(Value{BigInt{}}), "bignum");
    EXPECT_EQ(type_name(Value{1.5}), "float");
    EXPECT_EQ(type_name(Value{Symbol{"a"}}), "symbol");
    EXPECT_EQ(type_name(Value{NodeRef{0}}), "object");
}

TEST(Value, get_as_matches_the_held_type) {
    auto v = Value{std::int64_t{42}};
    EXPECT_EQ(get_as<std::int64_t>(v), 42);
    EXPECT_FALSE(get_as<double>(v).has_value());
    EXPECT_FALSE(get_as<bool>(v).has_value());
}

TEST(Value, symbols_compare_by_name) {
    EXPECT_EQ(Symbol{"foo"}, Symbol{"foo"});
    EXPECT_NE(Symbol{"foo"}, Symbol{"bar"});
    EXPECT_LT(Symbol{"a"}, Symbol{"b"});
}

TEST(Value, overload_dispatches_on_alternative) {
    auto describe = [](const Value& v) {
        return std::visit(overload{
            [](std::int64_t) { return 1; },
            [](const Symbol&) { return 2; },
            [](const auto&) { return 0; },
        }, v);
    };
    EXPECT_EQ(describe(Value{std::int64_t{1}}), 1);
    EXPECT_EQ(describe(Value{Symbol{"x"}}), 2);
    EXPECT_EQ(describe(Value{Nil{}}), 0);
}
