// Writes a seed corpus for fuzz_decode into the given directory.
//
// Usage: generate_seeds <corpus-dir>

#include <marshal-cpp/marshal.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace mc = marshal_cpp;
namespace rpg = marshal_cpp::rpg;

static void write_seed(const std::filesystem::path& dir, const std::string& name,
                       const std::vector<std::byte>& bytes) {
    auto out = std::ofstream{dir / name, std::ios::binary};
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    std::printf("  %-20s %zu bytes\n", name.c_str(), bytes.size());
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::fprintf(stderr, "usage: %s <corpus-dir>\n", argv[0]);
        return 1;
    }
    auto dir = std::filesystem::path{argv[1]};
    std::filesystem::create_directories(dir);

    // -- Plain values ---------------------------------------------------------
    {
        auto graph = mc::Graph{};
        auto s = graph.make_string("shared");
        auto root = graph.make_array({
            mc::Nil{}, true, std::int64_t{-129}, std::int64_t{1} << 40, 0.1,
            mc::Symbol{"sym"}, mc::Symbol{"sym"}, s, s,
        });
        write_seed(dir, "values.bin", mc::encode(graph, root));
    }

    // -- Cyclic object --------------------------------------------------------
    {
        auto graph = mc::Graph{};
        auto root = graph.make_object("Node", {});
        graph.get_if<mc::Object>(root)->fields.emplace_back(mc::Symbol{"@next"}, root);
        write_seed(dir, "cycle.bin", mc::encode(graph, root));
    }

    // -- RGSS records ---------------------------------------------------------
    {
        auto map = rpg::Map{};
        map.data = mc::Table{4, 4, 3};
        map.events[1] = rpg::Event{.id = 1, .name = "EV001", .x = 0, .y = 0,
                                   .pages = {rpg::EventPage{}}};
        write_seed(dir, "map.bin", mc::dump(map));

        write_seed(dir, "actors.bin", mc::dump_database(std::vector<rpg::Actor>(2)));

        auto scripts = rpg::Scripts{rpg::Script{.id = 1, .name = "Main", .text = "p 1\n"}};
        write_seed(dir, "scripts.bin", mc::dump(scripts));
    }

    return 0;
}
