#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

using namespace marshal_cpp;
using json = nlohmann::json;

namespace {

auto marshal(std::initializer_list<int> body) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{std::byte{0x04}, std::byte{0x08}};
    for (auto v : body) result.push_back(static_cast<std::byte>(v));
    return result;
}

}  // anonymous namespace

// =============================================================================
// Graph export
// =============================================================================

TEST(ExportJson, immediates) {
    auto graph = Graph{};
    EXPECT_EQ(export_json(graph, Nil{}), json(nullptr));
    EXPECT_EQ(export_json(graph, true), json(true));
    EXPECT_EQ(export_json(graph, std::int64_t{-3}), json(-3));
    EXPECT_EQ(export_json(graph, 1.5), json(1.5));
}

TEST(ExportJson, tagged_scalars) {
    auto graph = Graph{};
    EXPECT_EQ(export_json(graph, Symbol{"name"}),
              (json{{"__type", "symbol"}, {"value", "name"}}));
    EXPECT_EQ(export_json(graph, std::numeric_limits<double>::quiet_NaN()),
              (json{{"__type", "float"}, {"value", "nan"}}));
    EXPECT_EQ(export_json(graph, -std::numeric_limits<double>::infinity()),
              (json{{"__type", "float"}, {"value", "-inf"}}));
}

TEST(ExportJson, bignum_as_hex) {
    // 2**64 + 1
    auto doc = decode(marshal({'l', '+', 0x0A, 0x01, 0, 0, 0, 0, 0, 0, 0, 0x01, 0x00}));
    EXPECT_EQ(export_json(doc),
              (json{{"__type", "bignum"}, {"value", "0x10000000000000001"}}));
}

TEST(ExportJson, strings) {
    auto graph = Graph{};
    EXPECT_EQ(export_json(graph, graph.make_string("h\xc3\xa9llo")), json("h\xc3\xa9llo"));

    auto binary = graph.add(NodeData{String{Bytes{std::byte{0xFF}}}});
    EXPECT_EQ(export_json(graph, binary), (json{{"__type", "bytes"}, {"value", "/w=="}}));
}

TEST(ExportJson, string_with_ivars_is_wrapped) {
    auto doc = decode(marshal({'I', '"', 0x06, 'a', 0x06, ':', 0x06, 'E', 'T'}));
    auto j = export_json(doc);
    EXPECT_EQ(j["__type"], "string");
    EXPECT_EQ(j["value"], "a");
    EXPECT_EQ(j["__ivars"]["E"], true);
}

TEST(ExportJson, arrays_and_hashes) {
    auto graph = Graph{};
    auto root = graph.make_hash({{Symbol{"k"}, graph.make_array({std::int64_t{1}, Nil{}})}});
    auto j = export_json(graph, root);
    EXPECT_EQ(j["__type"], "hash");
    ASSERT_EQ(j["entries"].size(), 1u);
    EXPECT_EQ(j["entries"][0][0]["value"], "k");
    EXPECT_EQ(j["entries"][0][1], (json{1, nullptr}));
    EXPECT_FALSE(j.contains("default"));
}

TEST(ExportJson, objects_carry_their_class) {
    auto graph = Graph{};
    auto root = graph.make_object("Point", {{Symbol{"@x"}, std::int64_t{1}}});
    EXPECT_EQ(export_json(graph, root), (json{{"__class", "Point"}, {"@x", 1}}));
}

TEST(ExportJson, user_data_is_base64) {
    auto graph = Graph{};
    auto root = graph.make_user_data("Blob", Bytes{std::byte{'a'}, std::byte{'b'}, std::byte{'c'}});
    EXPECT_EQ(export_json(graph, root),
              (json{{"__type", "user_data"}, {"__class", "Blob"}, {"value", "YWJj"}}));
}

TEST(ExportJson, repeated_nodes_become_refs) {
    auto graph = Graph{};
    auto s = graph.make_string("x");
    auto root = graph.make_array({s, s});
    EXPECT_EQ(export_json(graph, root), (json{"x", {{"__ref", 0}}}));
}

TEST(ExportJson, cycles_terminate) {
    auto graph = Graph{};
    auto root = graph.make_array({});
    graph.get_if<Array>(root)->elements.push_back(root);
    EXPECT_EQ(export_json(graph, root), json::array({json{{"__ref", 0}}}));
}

// =============================================================================
// Typed records
// =============================================================================

TEST(RecordJson, table) {
    auto t = Table::from_data(2, 1, 1, {5, 6});
    EXPECT_EQ(json(t), (json{{"xsize", 2}, {"ysize", 1}, {"zsize", 1}, {"data", {5, 6}}}));
}

TEST(RecordJson, record_fields_by_wire_name) {
    auto info = rpg::MapInfo{.name = "Town", .parent_id = 1, .order = 2};
    auto j = json(info);
    EXPECT_EQ(j["__class"], "RPG::MapInfo");
    EXPECT_EQ(j["name"], "Town");
    EXPECT_EQ(j["parent_id"], 1);
    EXPECT_EQ(j["order"], 2);
    EXPECT_EQ(j["expanded"], false);
}

TEST(RecordJson, missing_optionals_are_null) {
    auto actor = rpg::Actor{};
    actor.armor1_id = 3;
    auto j = json(actor);
    EXPECT_TRUE(j["weapon_id"].is_null());
    EXPECT_EQ(j["armor1_id"], 3);
    EXPECT_TRUE(j["battler_name"].is_null());
    EXPECT_EQ(j["parameters"]["xsize"], 6);
}

TEST(RecordJson, nested_records_and_parameters) {
    auto command = rpg::EventCommand{
        .code = 250,
        .indent = 1,
        .parameters = {
            rpg::Parameter{rpg::AudioFile{.name = "Bell", .volume = 80, .pitch = 100}},
            rpg::Parameter{rpg::Parameter::Array{rpg::Parameter{std::int64_t{1}}, rpg::Parameter{}}},
        },
    };
    auto j = json(command);
    EXPECT_EQ(j["code"], 250);
    EXPECT_EQ(j["parameters"][0]["__class"], "RPG::AudioFile");
    EXPECT_EQ(j["parameters"][0]["name"], "Bell");
    EXPECT_EQ(j["parameters"][1], (json{1, nullptr}));
}

TEST(RecordJson, enums_export_as_integers) {
    auto armor = rpg::Armor{};
    armor.kind = rpg::ArmorKind::body_armor;
    armor.guard_element_set = {2};
    auto j = json(armor);
    EXPECT_EQ(j["__class"], "RPG::Armor");
    EXPECT_EQ(j["kind"], 2);
    EXPECT_EQ(j["guard_element_set"], json::array({2}));

    auto timing = rpg::AnimationTiming{};
    EXPECT_EQ(json(timing)["flash_color"]["__class"], "Color");
}

TEST(RecordJson, color_and_script) {
    auto color = rpg::Color{.red = 1.0, .green = 2.0, .blue = 3.0, .alpha = 4.0};
    EXPECT_EQ(json(color)["__class"], "Color");
    EXPECT_EQ(json(color)["alpha"], 4.0);

    auto script = rpg::Script{.id = 7, .name = "Main", .text = "rescue"};
    EXPECT_EQ(json(script), (json{{"id", 7}, {"name", "Main"}, {"text", "rescue"}}));
}
