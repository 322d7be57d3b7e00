// basic_usage: demonstrates the core marshal-cpp API
//
// Decodes a raw Marshal stream into an object graph, exports it as JSON,
// then round-trips typed RPG Maker records through the schema layer.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage [file.rxdata]

#include <marshal-cpp/marshal.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace mc = marshal_cpp;
namespace rpg = marshal_cpp::rpg;

static auto read_file(const char* path) -> std::vector<std::byte> {
    auto in = std::ifstream{path, std::ios::binary};
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    auto bytes = std::vector<std::byte>(chars.size());
    for (std::size_t i = 0; i < chars.size(); ++i) bytes[i] = static_cast<std::byte>(chars[i]);
    return bytes;
}

// Decode any file and report what the registry makes of its root.
static int inspect(const char* path) {
    auto bytes = read_file(path);
    try {
        auto doc = mc::decode(bytes);
        std::printf("%s: %zu bytes, %zu nodes\n", path, bytes.size(), doc.graph.size());

        if (doc.graph.get_if<mc::Object>(doc.root) || doc.graph.get_if<mc::UserData>(doc.root)) {
            auto record = mc::Registry::instance().decode(doc.graph, doc.root);
            std::printf("root record: %s\n", mc::class_name_of(record).c_str());
        }
        std::printf("%s\n", mc::export_json(doc).dump(2).c_str());
    } catch (const mc::Exception& e) {
        std::fprintf(stderr, "%s: %s\n", path, e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    mc::Logger::instance().add_sink(mc::sinks::console_sink());

    if (argc > 1) return inspect(argv[1]);

    // -- Untyped graph: build, encode, decode ---------------------------------
    auto graph = mc::Graph{};
    auto name = graph.make_string("Aluxes");
    auto root = graph.make_array({name, name, mc::Symbol{"hero"}, std::int64_t{42}});
    auto bytes = mc::encode(graph, root);
    std::printf("encoded %zu bytes\n", bytes.size());

    auto doc = mc::decode(bytes);
    std::printf("json: %s\n", mc::export_json(doc).dump().c_str());

    // -- Typed records --------------------------------------------------------
    auto actor = rpg::Actor{};
    actor.name = "Aluxes";
    actor.character_name = "001-Fighter01";
    actor.parameters(0, 1) = 500;
    actor.weapon_id = 0;

    auto actors = mc::load_database<rpg::Actor>(mc::dump_database(std::vector{actor}));
    std::printf("actor %zu: %s, max HP at level 1 = %u\n",
                actors[0].id, actors[0].name.c_str(),
                static_cast<unsigned>(actors[0].parameters(0, 1)));

    // -- Scripts are zlib-compressed on the wire ------------------------------
    auto scripts = rpg::Scripts{rpg::Script{.id = 1, .name = "Main", .text = "p :hello\n"}};
    auto loaded = mc::load<rpg::Scripts>(mc::dump(scripts));
    std::printf("script %s: %s", loaded[0].name.c_str(), loaded[0].text.c_str());

    // -- Schema errors name the failing field ---------------------------------
    auto bad = mc::Graph{};
    auto info = bad.make_object("RPG::MapInfo", {{mc::Symbol{"@name"}, std::int64_t{1}}});
    try {
        mc::from_value<rpg::MapInfo>(bad, info);
    } catch (const mc::Exception& e) {
        std::printf("rejected: %s\n", e.what());
    }

    // -- Typed records as JSON ------------------------------------------------
    std::printf("%s\n", nlohmann::json(actors[0]).dump(2).c_str());
    return 0;
}
