#include <marshal-cpp/error.hpp>
#include <marshal-cpp/table.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace marshal_cpp;

namespace {

auto grid_error(auto&& fn) -> bool {
    try {
        fn();
    } catch (const Exception& e) {
        return e.kind() == ErrorKind::grid_shape_mismatch;
    }
    return false;
}

}  // anonymous namespace

// -- Construction -------------------------------------------------------------

TEST(Table, default_is_empty) {
    auto t = Table{};
    EXPECT_EQ(t.xsize(), 0u);
    EXPECT_EQ(t.ysize(), 1u);
    EXPECT_EQ(t.zsize(), 1u);
    EXPECT_TRUE(t.empty());
}

TEST(Table, dimensions_are_zero_filled) {
    auto t = Table{4, 3, 2};
    EXPECT_EQ(t.size(), 24u);
    for (auto cell : t.data()) EXPECT_EQ(cell, 0);
}

TEST(Table, from_data_x_varies_fastest) {
    auto t = Table::from_data(2, 3, 1, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(t.at(0, 0), 1);
    EXPECT_EQ(t.at(1, 0), 2);
    EXPECT_EQ(t.at(0, 1), 3);
    EXPECT_EQ(t.at(1, 2), 6);
}

TEST(Table, from_data_rejects_wrong_cell_count) {
    EXPECT_TRUE(grid_error([] { Table::from_data(2, 3, 1, {1, 2, 3, 4, 5}); }));
}

TEST(Table, at_is_bounds_checked) {
    auto t = Table{2, 2};
    EXPECT_THROW(t.at(2, 0), std::out_of_range);
    EXPECT_THROW(t.at(0, 2), std::out_of_range);
    EXPECT_THROW(t.at(0, 0, 1), std::out_of_range);
}

TEST(Table, call_operator_writes_cells) {
    auto t = Table{3, 3, 3};
    t(2, 1, 0) = 42;
    EXPECT_EQ(t.at(2, 1, 0), 42);
    EXPECT_EQ(t.data()[2 + 3 * 1], 42);
}

TEST(Table, resize_keeps_overlapping_cells) {
    auto t = Table::from_data(2, 2, 1, {1, 2, 3, 4});
    t.resize(3, 1, 1, 9);
    EXPECT_EQ(t.size(), 3u);
    EXPECT_EQ(t.at(0), 1);
    EXPECT_EQ(t.at(1), 2);
    EXPECT_EQ(t.at(2), 9);
}

TEST(Table, resize_to_nothing) {
    auto t = Table{5, 5};
    t.resize(0, 0, 0);
    EXPECT_TRUE(t.empty());
}

// -- Byte layout --------------------------------------------------------------

TEST(TableCodec, encode_layout) {
    auto t = Table::from_data(2, 1, 1, {0x0102, 0xFFFF});
    auto bytes = encode_table(t);

    const auto expected = Bytes{
        std::byte{2}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{2}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{0x02}, std::byte{0x01}, std::byte{0xFF}, std::byte{0xFF},
    };
    EXPECT_EQ(bytes, expected);
}

TEST(TableCodec, round_trip) {
    auto t = Table::from_data(2, 3, 1, {1, 2, 3, 4, 5, 6});
    auto back = decode_table(encode_table(t));
    EXPECT_EQ(back, t);
    EXPECT_EQ(back.at(1, 2), 6);
}

TEST(TableCodec, zero_dimension_round_trip) {
    auto t = Table{0, 0, 0};
    auto bytes = encode_table(t);
    EXPECT_EQ(bytes.size(), 16u);
    EXPECT_EQ(decode_table(bytes), t);
}

TEST(TableCodec, short_header_is_rejected) {
    auto bytes = Bytes(15, std::byte{0});
    EXPECT_TRUE(grid_error([&] { decode_table(bytes); }));
}

TEST(TableCodec, count_must_match_dimensions) {
    auto bytes = encode_table(Table::from_data(2, 3, 1, {1, 2, 3, 4, 5, 6}));
    bytes[12] = std::byte{5};  // count field
    EXPECT_TRUE(grid_error([&] { decode_table(bytes); }));
}

TEST(TableCodec, cell_bytes_must_match_count) {
    auto bytes = encode_table(Table{2, 3});
    bytes.pop_back();
    EXPECT_TRUE(grid_error([&] { decode_table(bytes); }));

    auto longer = encode_table(Table{2, 3});
    longer.push_back(std::byte{0});
    longer.push_back(std::byte{0});
    EXPECT_TRUE(grid_error([&] { decode_table(longer); }));
}

TEST(TableCodec, overflowing_dimensions_are_rejected) {
    auto bytes = Bytes(16, std::byte{0xFF});
    EXPECT_TRUE(grid_error([&] { decode_table(bytes); }));
}

TEST(TableCodec, dimension_count_word_is_not_accepted) {
    // 3x1x1 grid preceded by a dimension count of 1.
    auto bytes = Bytes{
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{3}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{3}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{7}, std::byte{0}, std::byte{8}, std::byte{0}, std::byte{9}, std::byte{0},
    };
    EXPECT_TRUE(grid_error([&] { decode_table(bytes); }));

    auto single = Bytes{
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{7}, std::byte{0},
    };
    EXPECT_TRUE(grid_error([&] { decode_table(single); }));
}
