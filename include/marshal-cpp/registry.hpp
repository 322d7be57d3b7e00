/// @file registry.hpp
/// @brief Class-name dispatch from object-graph nodes to typed records.

#pragma once

#include <marshal-cpp/graph.hpp>
#include <marshal-cpp/rgss.hpp>
#include <marshal-cpp/schema.hpp>
#include <marshal-cpp/table.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marshal_cpp {

/// A node whose class has no registered schema.
///
/// The raw composite is kept as a standalone document so that it can be
/// inspected or written back unchanged.
struct UnknownRecord {
    std::string class_name;
    Document raw;
};

/// Every record type the registry can produce.
using AnyRecord = std::variant<
    UnknownRecord,
    rpg::AudioFile,
    rpg::MoveCommand,
    rpg::MoveRoute,
    rpg::EventCommand,
    rpg::EventCondition,
    rpg::EventGraphic,
    rpg::EventPage,
    rpg::Event,
    rpg::CommonEvent,
    rpg::Map,
    rpg::MapInfo,
    rpg::Actor,
    rpg::Tileset,
    rpg::Weapon,
    rpg::Armor,
    rpg::Item,
    rpg::Skill,
    rpg::ClassLearning,
    rpg::Class,
    rpg::EnemyAction,
    rpg::Enemy,
    rpg::State,
    rpg::TroopMember,
    rpg::TroopCondition,
    rpg::TroopPage,
    rpg::Troop,
    rpg::AnimationTiming,
    rpg::AnimationFrame,
    rpg::Animation,
    rpg::SystemWords,
    rpg::TestBattler,
    rpg::System,
    rpg::Color,
    rpg::Tone,
    Table
>;

/// Maps wire class names to decoders.
///
/// The process-wide instance comes populated with every RGSS record,
/// Color, Tone and Table. Lookups may run concurrently with each other
/// and with add().
///
/// @code
/// auto doc = marshal_cpp::decode(bytes);
/// auto record = marshal_cpp::Registry::instance().decode(doc.graph, doc.root);
/// if (auto* map = std::get_if<marshal_cpp::rpg::Map>(&record)) { ... }
/// @endcode
class Registry {
public:
    using DecodeFn = std::function<AnyRecord(const Graph&, const Value&, DecodeContext&)>;

    static auto instance() -> Registry&;

    /// An empty registry.
    Registry() = default;

    /// Register a decoder under a class name, replacing any previous one.
    void add(std::string class_name, DecodeFn decoder);

    /// Register a schema record under its schema class name.
    template <Record T>
    void add() {
        add(std::string{Schema<T>::class_name},
            [](const Graph& graph, const Value& v, DecodeContext& ctx) -> AnyRecord {
                return Converter<T>::decode(graph, v, ctx);
            });
    }

    auto contains(std::string_view class_name) const -> bool;
    auto class_names() const -> std::vector<std::string>;

    /// Decode an Object or UserData node by its class name.
    ///
    /// An unregistered class yields UnknownRecord and logs a warning.
    /// Throws Exception{schema_mismatch} for a value that carries no
    /// class name, or when the registered decoder rejects the node.
    auto decode(const Graph& graph, const Value& v) const -> AnyRecord;

    /// Build the graph representation of any record inside `graph`.
    static auto encode(Graph& graph, const AnyRecord& record) -> Value;

private:
    mutable std::mutex mutex_;
    std::map<std::string, DecodeFn, std::less<>> decoders_;
};

/// Register every RGSS record plus Color, Tone and Table.
void register_rgss(Registry& registry);

/// Class name of the record held by an AnyRecord.
auto class_name_of(const AnyRecord& record) -> std::string;

}  // namespace marshal_cpp
