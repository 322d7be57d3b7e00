#include <marshal-cpp/batch.hpp>
#include <marshal-cpp/codec.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace marshal_cpp;

namespace {

auto fixnum_stream(std::int64_t n) -> std::vector<std::byte> {
    return encode(Graph{}, Value{n});
}

}  // anonymous namespace

TEST(Batch, empty_input) {
    auto inputs = std::vector<std::vector<std::byte>>{};
    EXPECT_TRUE(decode_batch(inputs).empty());
}

TEST(Batch, single_input) {
    auto inputs = std::vector<std::vector<std::byte>>{fixnum_stream(7)};
    auto results = decode_batch(inputs);
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].ok());
    EXPECT_EQ(get_as<std::int64_t>(results[0].document().root), 7);
}

TEST(Batch, results_keep_input_order) {
    auto inputs = std::vector<std::vector<std::byte>>{};
    for (std::int64_t i = 0; i < 200; ++i) inputs.push_back(fixnum_stream(i * 1000));

    auto results = decode_batch(inputs);
    ASSERT_EQ(results.size(), inputs.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(get_as<std::int64_t>(results[i].document().root),
                  static_cast<std::int64_t>(i) * 1000);
    }
}

TEST(Batch, failures_are_isolated) {
    auto inputs = std::vector<std::vector<std::byte>>{
        fixnum_stream(1),
        {std::byte{0x04}, std::byte{0x07}, std::byte{'0'}},
        fixnum_stream(3),
        {std::byte{0x04}, std::byte{0x08}, std::byte{'['}},
    };
    auto results = decode_batch(inputs);
    ASSERT_EQ(results.size(), 4u);

    EXPECT_TRUE(results[0].ok());
    ASSERT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].error().kind, ErrorKind::incompatible_version);
    EXPECT_TRUE(results[2].ok());
    ASSERT_FALSE(results[3].ok());
    EXPECT_EQ(results[3].error().kind, ErrorKind::unexpected_end);
}

TEST(Batch, options_apply_to_every_buffer) {
    auto graph = Graph{};
    auto root = graph.make_array({graph.make_array({})});
    auto inputs = std::vector<std::vector<std::byte>>{encode(graph, root), encode(graph, root)};

    auto results = decode_batch(inputs, DecodeOptions{.max_depth = 1});
    for (const auto& r : results) {
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error().kind, ErrorKind::malformed);
    }
}
