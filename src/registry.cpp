#include <marshal-cpp/registry.hpp>
#include <marshal-cpp/logger.hpp>

#include <type_traits>
#include <utility>

namespace marshal_cpp {

namespace {

// Class name of an Object or UserData node, or nullptr.
auto class_name_of_node(const Graph& graph, const Value& v) -> const std::string* {
    if (const auto* object = graph.get_if<Object>(v)) return &object->class_name.name;
    if (const auto* data = graph.get_if<UserData>(v)) return &data->class_name.name;
    return nullptr;
}

struct BuiltinRegistry {
    BuiltinRegistry() { register_rgss(registry); }

    Registry registry;
};

}  // anonymous namespace

void register_rgss(Registry& registry) {
    registry.add<rpg::AudioFile>();
    registry.add<rpg::MoveCommand>();
    registry.add<rpg::MoveRoute>();
    registry.add<rpg::EventCommand>();
    registry.add<rpg::EventCondition>();
    registry.add<rpg::EventGraphic>();
    registry.add<rpg::EventPage>();
    registry.add<rpg::Event>();
    registry.add<rpg::CommonEvent>();
    registry.add<rpg::Map>();
    registry.add<rpg::MapInfo>();
    registry.add<rpg::Actor>();
    registry.add<rpg::Tileset>();
    registry.add<rpg::Weapon>();
    registry.add<rpg::Armor>();
    registry.add<rpg::Item>();
    registry.add<rpg::Skill>();
    registry.add<rpg::ClassLearning>();
    registry.add<rpg::Class>();
    registry.add<rpg::EnemyAction>();
    registry.add<rpg::Enemy>();
    registry.add<rpg::State>();
    registry.add<rpg::TroopMember>();
    registry.add<rpg::TroopCondition>();
    registry.add<rpg::TroopPage>();
    registry.add<rpg::Troop>();
    registry.add<rpg::AnimationTiming>();
    registry.add<rpg::AnimationFrame>();
    registry.add<rpg::Animation>();
    registry.add<rpg::SystemWords>();
    registry.add<rpg::TestBattler>();
    registry.add<rpg::System>();

    registry.add("Color", [](const Graph& graph, const Value& v, DecodeContext& ctx) -> AnyRecord {
        return Converter<rpg::Color>::decode(graph, v, ctx);
    });
    registry.add("Tone", [](const Graph& graph, const Value& v, DecodeContext& ctx) -> AnyRecord {
        return Converter<rpg::Tone>::decode(graph, v, ctx);
    });
    registry.add(table_class_name, [](const Graph& graph, const Value& v, DecodeContext& ctx) -> AnyRecord {
        return Converter<Table>::decode(graph, v, ctx);
    });
}

auto Registry::instance() -> Registry& {
    static auto builtin = BuiltinRegistry{};
    return builtin.registry;
}

void Registry::add(std::string class_name, DecodeFn decoder) {
    auto lock = std::scoped_lock{mutex_};
    decoders_.insert_or_assign(std::move(class_name), std::move(decoder));
}

auto Registry::contains(std::string_view class_name) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return decoders_.find(class_name) != decoders_.end();
}

auto Registry::class_names() const -> std::vector<std::string> {
    auto lock = std::scoped_lock{mutex_};
    auto names = std::vector<std::string>{};
    names.reserve(decoders_.size());
    for (const auto& [name, decoder] : decoders_) {
        names.push_back(name);
    }
    return names;
}

auto Registry::decode(const Graph& graph, const Value& v) const -> AnyRecord {
    const auto* class_name = class_name_of_node(graph, v);
    if (!class_name) {
        detail::type_mismatch("object or user data", graph, v);
    }

    auto decoder = DecodeFn{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (auto it = decoders_.find(*class_name); it != decoders_.end()) {
            decoder = it->second;
        }
    }

    if (!decoder) {
        MARSHAL_CPP_LOG_WARN("registry", "no schema for class {}, keeping the raw node",
                             *class_name);
        auto raw = Document{};
        raw.root = copy_value(graph, v, raw.graph);
        return UnknownRecord{*class_name, std::move(raw)};
    }

    auto ctx = DecodeContext{graph};
    return decoder(graph, v, ctx);
}

auto Registry::encode(Graph& graph, const AnyRecord& record) -> Value {
    return std::visit(overload{
        [&](const UnknownRecord& unknown) -> Value {
            return copy_value(unknown.raw.graph, unknown.raw.root, graph);
        },
        [&](const auto& typed) -> Value {
            return to_value(graph, typed);
        },
    }, record);
}

auto class_name_of(const AnyRecord& record) -> std::string {
    return std::visit(overload{
        [](const UnknownRecord& unknown) -> std::string { return unknown.class_name; },
        [](const rpg::Color&) -> std::string { return "Color"; },
        [](const rpg::Tone&) -> std::string { return "Tone"; },
        [](const Table&) -> std::string { return table_class_name; },
        [](const auto& typed) -> std::string {
            return std::string{Schema<std::decay_t<decltype(typed)>>::class_name};
        },
    }, record);
}

}  // namespace marshal_cpp
