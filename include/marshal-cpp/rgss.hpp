/// @file rgss.hpp
/// @brief RPG Maker XP data records and their wire schemas.
///
/// Every record here round-trips through the RGSS class it is named
/// after. Database files are nil-padded arrays of records:
///
/// @code
/// auto actors = marshal_cpp::load_database<marshal_cpp::rpg::Actor>(bytes);
/// auto infos  = marshal_cpp::load<marshal_cpp::rpg::MapInfos>(map_info_bytes);
/// auto map    = marshal_cpp::load<marshal_cpp::rpg::Map>(map_bytes);
/// @endcode

#pragma once

#include <marshal-cpp/error.hpp>
#include <marshal-cpp/schema.hpp>
#include <marshal-cpp/table.hpp>
#include <marshal-cpp/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

namespace marshal_cpp::rpg {

/// Compositing mode for sprites and fogs.
enum class BlendMode : std::uint8_t {
    normal   = 0,
    add      = 1,
    subtract = 2,
};

/// Armor slot.
enum class ArmorKind : std::uint8_t {
    shield     = 0,
    helmet     = 1,
    body_armor = 2,
    accessory  = 3,
};

/// Who an item or skill affects.
enum class TargetScope : std::uint8_t {
    none              = 0,
    one_enemy         = 1,
    all_enemies       = 2,
    one_ally          = 3,
    all_allies        = 4,
    one_ally_hp0      = 5,
    all_allies_hp0    = 6,
    user              = 7,
};

/// Where an item or skill can be used.
enum class Occasion : std::uint8_t {
    always      = 0,
    only_battle = 1,
    only_menu   = 2,
    never       = 3,
};

/// Stat raised permanently by an item.
enum class ParameterType : std::uint8_t {
    none   = 0,
    max_hp = 1,
    max_sp = 2,
    str    = 3,
    dex    = 4,
    agi    = 5,
    intel  = 6,
};

/// Battle formation row of a class.
enum class BattlePosition : std::uint8_t {
    front  = 0,
    middle = 1,
    rear   = 2,
};

enum class ActionKind : std::uint8_t {
    basic = 0,
    skill = 1,
};

enum class BasicAction : std::uint8_t {
    attack     = 0,
    defend     = 1,
    escape     = 2,
    do_nothing = 3,
};

/// Behaviour a state forces on its target.
enum class Restriction : std::uint8_t {
    none           = 0,
    no_magic       = 1,
    attack_enemies = 2,
    attack_allies  = 3,
    no_move        = 4,
};

/// Anchor of an animation relative to its target.
enum class AnimationPosition : std::uint8_t {
    top    = 0,
    middle = 1,
    bottom = 2,
    screen = 3,
};

/// An RGBA color, each channel 0..255 (RGSS `Color`).
struct Color {
    double red{255.0};
    double green{255.0};
    double blue{255.0};
    double alpha{255.0};

    auto operator==(const Color&) const -> bool = default;
};

/// A color offset, each channel -255..255 (RGSS `Tone`).
struct Tone {
    double red{0.0};
    double green{0.0};
    double blue{0.0};
    double gray{0.0};

    auto operator==(const Tone&) const -> bool = default;
};

/// A sound or music cue.
struct AudioFile {
    std::optional<std::string> name;  ///< File stem; none for silence.
    std::uint8_t volume{100};
    std::uint8_t pitch{100};

    auto operator==(const AudioFile&) const -> bool = default;
};

struct Parameter;

/// One step of a move route.
struct MoveCommand {
    std::uint16_t code{0};
    std::vector<Parameter> parameters;

    auto operator==(const MoveCommand&) const -> bool = default;
};

/// A scripted movement sequence.
struct MoveRoute {
    bool repeat{true};
    bool skippable{false};
    std::vector<MoveCommand> list;

    auto operator==(const MoveRoute&) const -> bool = default;
};

/// An event command argument. Commands mix integers, strings, colors,
/// audio cues, move routes and nested arrays freely.
struct Parameter {
    using Array = std::vector<Parameter>;
    using Kind = std::variant<
        Nil,
        std::int64_t,
        double,
        bool,
        std::string,
        Color,
        Tone,
        AudioFile,
        MoveRoute,
        MoveCommand,
        Array
    >;

    Kind value;

    auto operator==(const Parameter&) const -> bool = default;

    auto is_nil() const noexcept -> bool { return std::holds_alternative<Nil>(value); }

    /// Ruby truthiness: nil, false and 0 are false.
    auto truthy() const noexcept -> bool {
        if (is_nil()) return false;
        if (const auto* b = std::get_if<bool>(&value)) return *b;
        if (const auto* i = std::get_if<std::int64_t>(&value)) return *i != 0;
        return true;
    }
};

/// One line of an event's command list.
struct EventCommand {
    std::uint16_t code{0};
    std::size_t indent{0};
    std::vector<Parameter> parameters;

    auto operator==(const EventCommand&) const -> bool = default;
};

/// Conditions under which an event page is active.
struct EventCondition {
    bool switch1_valid{false};
    bool switch2_valid{false};
    bool variable_valid{false};
    bool self_switch_valid{false};
    std::size_t switch1_id{0};
    std::size_t switch2_id{0};
    std::size_t variable_id{1};
    std::int32_t variable_value{0};
    std::string self_switch_ch{"A"};

    auto operator==(const EventCondition&) const -> bool = default;
};

/// The sprite or tile an event page shows.
struct EventGraphic {
    std::optional<std::size_t> tile_id;
    std::optional<std::string> character_name;
    std::int32_t character_hue{0};
    std::int32_t direction{2};
    std::int32_t pattern{0};
    std::int32_t opacity{255};
    BlendMode blend_type{BlendMode::normal};

    auto operator==(const EventGraphic&) const -> bool = default;
};

struct EventPage {
    EventCondition condition;
    EventGraphic graphic;
    std::size_t move_type{0};
    std::size_t move_speed{3};
    std::size_t move_frequency{3};
    MoveRoute move_route;
    bool walk_anime{true};
    bool step_anime{false};
    bool direction_fix{false};
    bool through{false};
    bool always_on_top{false};
    std::int32_t trigger{0};
    std::vector<EventCommand> list;

    auto operator==(const EventPage&) const -> bool = default;
};

/// A map event.
struct Event {
    std::size_t id{0};
    std::string name;
    std::int32_t x{0};
    std::int32_t y{0};
    std::vector<EventPage> pages;

    auto operator==(const Event&) const -> bool = default;
};

/// A database-wide event triggered by a switch or called by id.
struct CommonEvent {
    std::size_t id{0};
    std::string name;
    std::size_t trigger{0};
    std::size_t switch_id{1};
    std::vector<EventCommand> list;

    auto operator==(const CommonEvent&) const -> bool = default;
};

/// A map: tile layers plus the events placed on it.
struct Map {
    std::size_t tileset_id{0};
    std::size_t width{20};
    std::size_t height{15};
    bool autoplay_bgm{false};
    AudioFile bgm;
    bool autoplay_bgs{false};
    AudioFile bgs{.name = std::nullopt, .volume = 80, .pitch = 100};
    std::vector<std::size_t> encounter_list;
    std::int32_t encounter_step{30};
    Table data;                             ///< width x height x 3 tile ids.
    std::map<std::size_t, Event> events;    ///< Keyed by event id.

    auto operator==(const Map&) const -> bool = default;
};

/// An entry of the map tree.
struct MapInfo {
    std::string name;
    std::size_t parent_id{0};  ///< 0 for a top-level map.
    std::int32_t order{0};
    bool expanded{false};
    std::int32_t scroll_x{0};
    std::int32_t scroll_y{0};

    auto operator==(const MapInfo&) const -> bool = default;
};

struct Actor {
    std::size_t id{0};
    std::string name;
    std::size_t class_id{0};
    std::int32_t initial_level{1};
    std::int32_t final_level{99};
    std::int32_t exp_basis{30};
    std::int32_t exp_inflation{30};
    std::optional<std::string> character_name;
    std::int32_t character_hue{0};
    std::optional<std::string> battler_name;
    std::int32_t battler_hue{0};
    Table parameters{6, 100};  ///< Stat curve: 6 stats x 100 levels.
    std::optional<std::size_t> weapon_id;
    std::optional<std::size_t> armor1_id;
    std::optional<std::size_t> armor2_id;
    std::optional<std::size_t> armor3_id;
    std::optional<std::size_t> armor4_id;
    bool weapon_fix{false};
    bool armor1_fix{false};
    bool armor2_fix{false};
    bool armor3_fix{false};
    bool armor4_fix{false};

    auto operator==(const Actor&) const -> bool = default;
};

struct Tileset {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> tileset_name;
    std::vector<std::string> autotile_names = std::vector<std::string>(7);
    std::optional<std::string> panorama_name;
    std::int32_t panorama_hue{0};
    std::optional<std::string> fog_name;
    std::int32_t fog_hue{0};
    std::int32_t fog_opacity{64};
    BlendMode fog_blend_type{BlendMode::normal};
    std::int32_t fog_zoom{200};
    std::int32_t fog_sx{0};
    std::int32_t fog_sy{0};
    std::optional<std::string> battleback_name;
    Table passages{384};
    Table priorities{384};
    Table terrain_tags{384};

    auto operator==(const Tileset&) const -> bool = default;
};

// -- Database -----------------------------------------------------------------

struct Weapon {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> icon_name;
    std::string description;
    std::optional<std::size_t> animation1_id;
    std::optional<std::size_t> animation2_id;
    std::int32_t price{0};
    std::int32_t atk{0};
    std::int32_t pdef{0};
    std::int32_t mdef{0};
    std::int32_t str_plus{0};
    std::int32_t dex_plus{0};
    std::int32_t agi_plus{0};
    std::int32_t int_plus{0};
    std::vector<std::size_t> element_set;
    std::vector<std::size_t> plus_state_set;
    std::vector<std::size_t> minus_state_set;

    auto operator==(const Weapon&) const -> bool = default;
};

struct Armor {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> icon_name;
    std::string description;
    ArmorKind kind{ArmorKind::shield};
    std::optional<std::size_t> auto_state_id;
    std::int32_t price{0};
    std::int32_t pdef{0};
    std::int32_t mdef{0};
    std::int32_t eva{0};
    std::int32_t str_plus{0};
    std::int32_t dex_plus{0};
    std::int32_t agi_plus{0};
    std::int32_t int_plus{0};
    std::vector<std::size_t> guard_element_set;
    std::vector<std::size_t> guard_state_set;

    auto operator==(const Armor&) const -> bool = default;
};

/// A consumable or key item. Older data omits the SP recovery fields.
struct Item {
    std::size_t id{0};
    std::string name;
    std::string icon_name;
    std::string description;
    TargetScope scope{TargetScope::none};
    Occasion occasion{Occasion::always};
    std::optional<std::size_t> animation1_id;
    std::optional<std::size_t> animation2_id;
    AudioFile menu_se{.name = std::nullopt, .volume = 80, .pitch = 100};
    std::optional<std::size_t> common_event_id;
    std::int32_t price{0};
    bool consumable{true};
    ParameterType parameter_type{ParameterType::none};
    std::int32_t parameter_points{0};
    std::int32_t recover_hp_rate{0};
    std::int32_t recover_hp{0};
    std::int32_t recover_sp_rate{0};
    std::int32_t recover_sp{0};
    std::int32_t hit{100};
    std::int32_t pdef_f{0};
    std::int32_t mdef_f{0};
    std::int32_t variance{0};
    std::vector<std::size_t> element_set;
    std::vector<std::size_t> plus_state_set;
    std::vector<std::size_t> minus_state_set;

    auto operator==(const Item&) const -> bool = default;
};

struct Skill {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> icon_name;
    std::string description;
    TargetScope scope{TargetScope::none};
    Occasion occasion{Occasion::always};
    std::optional<std::size_t> animation1_id;
    std::optional<std::size_t> animation2_id;
    AudioFile menu_se{.name = std::nullopt, .volume = 80, .pitch = 100};
    std::optional<std::size_t> common_event_id;
    std::int32_t sp_cost{0};
    std::int32_t power{0};
    std::int32_t atk_f{0};
    std::int32_t eva_f{0};
    std::int32_t str_f{0};
    std::int32_t dex_f{0};
    std::int32_t agi_f{0};
    std::int32_t int_f{100};
    std::int32_t hit{100};
    std::int32_t pdef_f{0};
    std::int32_t mdef_f{100};
    std::int32_t variance{15};
    std::vector<std::size_t> element_set;
    std::vector<std::size_t> plus_state_set;
    std::vector<std::size_t> minus_state_set;

    auto operator==(const Skill&) const -> bool = default;
};

/// A skill a class learns on reaching a level.
struct ClassLearning {
    std::int32_t level{1};
    std::size_t skill_id{0};

    auto operator==(const ClassLearning&) const -> bool = default;
};

struct Class {
    std::size_t id{0};
    std::string name;
    BattlePosition position{BattlePosition::front};
    std::vector<std::size_t> weapon_set;
    std::vector<std::size_t> armor_set;
    Table element_ranks;  ///< Rank per element id.
    Table state_ranks;    ///< Rank per state id.
    std::vector<ClassLearning> learnings;

    auto operator==(const Class&) const -> bool = default;
};

/// One entry of an enemy's battle AI.
struct EnemyAction {
    ActionKind kind{ActionKind::basic};
    BasicAction basic{BasicAction::attack};
    std::size_t skill_id{0};
    std::int32_t condition_turn_a{0};
    std::int32_t condition_turn_b{1};
    std::int32_t condition_hp{100};
    std::int32_t condition_level{1};
    std::optional<std::size_t> condition_switch_id;
    std::int32_t rating{5};

    auto operator==(const EnemyAction&) const -> bool = default;
};

struct Enemy {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> battler_name;
    std::int32_t battler_hue{0};
    std::int32_t maxhp{500};
    std::int32_t maxsp{500};
    std::int32_t str{50};
    std::int32_t dex{50};
    std::int32_t agi{50};
    std::int32_t intel{50};
    std::int32_t atk{100};
    std::int32_t pdef{100};
    std::int32_t mdef{100};
    std::int32_t eva{0};
    std::optional<std::size_t> animation1_id;
    std::optional<std::size_t> animation2_id;
    Table element_ranks;
    Table state_ranks;
    std::vector<EnemyAction> actions;
    std::int32_t exp{0};
    std::int32_t gold{0};
    std::optional<std::size_t> item_id;
    std::optional<std::size_t> weapon_id;
    std::optional<std::size_t> armor_id;
    std::int32_t treasure_prob{100};

    auto operator==(const Enemy&) const -> bool = default;
};

struct State {
    std::size_t id{0};
    std::string name;
    std::optional<std::size_t> animation_id;
    Restriction restriction{Restriction::none};
    bool nonresistance{false};
    bool zero_hp{false};
    bool cant_get_exp{false};
    bool cant_evade{false};
    bool slip_damage{false};
    std::int32_t rating{5};
    std::int32_t hit_rate{100};
    std::int32_t maxhp_rate{100};
    std::int32_t maxsp_rate{100};
    std::int32_t str_rate{100};
    std::int32_t dex_rate{100};
    std::int32_t agi_rate{100};
    std::int32_t int_rate{100};
    std::int32_t atk_rate{100};
    std::int32_t pdef_rate{100};
    std::int32_t mdef_rate{100};
    std::int32_t eva{0};
    bool battle_only{true};
    std::int32_t hold_turn{0};
    std::int32_t auto_release_prob{0};
    std::int32_t shock_release_prob{0};
    std::vector<std::size_t> guard_element_set;
    std::vector<std::size_t> plus_state_set;
    std::vector<std::size_t> minus_state_set;

    auto operator==(const State&) const -> bool = default;
};

/// An enemy placed in a troop.
struct TroopMember {
    std::size_t enemy_id{0};
    std::int32_t x{0};
    std::int32_t y{0};
    bool hidden{false};
    bool immortal{false};

    auto operator==(const TroopMember&) const -> bool = default;
};

/// When a battle event page runs.
struct TroopCondition {
    bool turn_valid{false};
    bool enemy_valid{false};
    bool actor_valid{false};
    bool switch_valid{false};
    std::int32_t turn_a{0};
    std::int32_t turn_b{0};
    std::size_t enemy_index{0};  ///< Position in the troop, not an id.
    std::int32_t enemy_hp{50};
    std::optional<std::size_t> actor_id;
    std::int32_t actor_hp{50};
    std::optional<std::size_t> switch_id;

    auto operator==(const TroopCondition&) const -> bool = default;
};

struct TroopPage {
    TroopCondition condition;
    std::int32_t span{0};
    std::vector<EventCommand> list;

    auto operator==(const TroopPage&) const -> bool = default;
};

struct Troop {
    std::size_t id{0};
    std::string name;
    std::vector<TroopMember> members;
    std::vector<TroopPage> pages;

    auto operator==(const Troop&) const -> bool = default;
};

/// Sound and screen flash at one frame of an animation.
struct AnimationTiming {
    std::int32_t frame{0};
    AudioFile se{.name = std::nullopt, .volume = 80, .pitch = 100};
    std::int32_t flash_scope{0};
    Color flash_color;
    std::int32_t flash_duration{5};
    std::int32_t condition{0};

    auto operator==(const AnimationTiming&) const -> bool = default;
};

/// Cell placements of one frame: cell index x 8 properties.
struct AnimationFrame {
    std::int32_t cell_max{0};
    Table cell_data{0, 0};

    auto operator==(const AnimationFrame&) const -> bool = default;
};

struct Animation {
    std::size_t id{0};
    std::string name;
    std::optional<std::string> animation_name;
    std::int32_t animation_hue{0};
    AnimationPosition position{AnimationPosition::middle};
    std::int32_t frame_max{1};
    std::vector<AnimationFrame> frames;
    std::vector<AnimationTiming> timings;

    auto operator==(const Animation&) const -> bool = default;
};

/// Display names for stats, equipment slots and battle commands.
struct SystemWords {
    std::string gold;
    std::string hp;
    std::string sp;
    std::string str;
    std::string dex;
    std::string agi;
    std::string intel;
    std::string atk;
    std::string pdef;
    std::string mdef;
    std::string weapon;
    std::string armor1;
    std::string armor2;
    std::string armor3;
    std::string armor4;
    std::string attack;
    std::string skill;
    std::string guard;
    std::string item;
    std::string equip;

    auto operator==(const SystemWords&) const -> bool = default;
};

/// A party member used by the editor's battle test.
struct TestBattler {
    std::int32_t level{1};
    std::size_t actor_id{0};
    std::optional<std::size_t> weapon_id;
    std::optional<std::size_t> armor1_id;
    std::optional<std::size_t> armor2_id;
    std::optional<std::size_t> armor3_id;
    std::optional<std::size_t> armor4_id;

    auto operator==(const TestBattler&) const -> bool = default;
};

/// Contents of System.rxdata. Every field may be absent on the wire.
struct System {
    std::int32_t magic_number{0};
    std::vector<std::size_t> party_members;
    std::vector<std::string> elements;
    std::vector<std::string> switches;   ///< Named from switch 1.
    std::vector<std::string> variables;  ///< Named from variable 1.
    std::optional<std::string> windowskin_name;
    std::optional<std::string> title_name;
    std::optional<std::string> gameover_name;
    std::optional<std::string> battle_transition;
    AudioFile title_bgm;
    AudioFile battle_bgm;
    AudioFile battle_end_me;
    AudioFile gameover_me;
    AudioFile cursor_se;
    AudioFile decision_se;
    AudioFile cancel_se;
    AudioFile buzzer_se;
    AudioFile equip_se;
    AudioFile shop_se;
    AudioFile save_se;
    AudioFile load_se;
    AudioFile battle_start_se;
    AudioFile escape_se;
    AudioFile actor_collapse_se;
    AudioFile enemy_collapse_se;
    SystemWords words;
    std::vector<TestBattler> test_battlers;
    std::optional<std::size_t> test_troop_id;
    std::size_t start_map_id{0};
    std::int32_t start_x{0};
    std::int32_t start_y{0};
    std::optional<std::string> battleback_name;
    std::optional<std::string> battler_name;
    std::int32_t battler_hue{0};
    std::size_t edit_map_id{0};

    auto operator==(const System&) const -> bool = default;
};

/// A script section. The text is zlib-compressed on the wire.
struct Script {
    std::int64_t id{0};
    std::string name;
    std::string text;

    auto operator==(const Script&) const -> bool = default;
};

/// Largest inflated script body accepted.
inline constexpr std::size_t max_script_size = std::size_t{64} * 1024 * 1024;

/// Contents of MapInfos.rxdata, keyed by map id.
using MapInfos = std::map<std::size_t, MapInfo>;

/// Contents of Scripts.rxdata.
using Scripts = std::vector<Script>;

}  // namespace marshal_cpp::rpg

namespace marshal_cpp {

// -- Converters for non-object RGSS types -------------------------------------

/// Bounds of an enum stored as an integer 0..last. Specialize with the
/// highest valid value and a name for diagnostics.
template <typename E>
struct EnumRange;

template <typename E>
concept RangedEnum = std::is_enum_v<E> && requires {
    { EnumRange<E>::last } -> std::convertible_to<E>;
    { EnumRange<E>::name } -> std::convertible_to<std::string_view>;
};

template <RangedEnum E>
struct Converter<E> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> E {
        auto raw = Converter<std::int64_t>::decode(graph, v, ctx);
        if (raw < 0 || raw > static_cast<std::int64_t>(EnumRange<E>::last)) {
            throw Exception{ErrorKind::schema_mismatch,
                            std::string{EnumRange<E>::name} + " " + std::to_string(raw) +
                            " out of range"};
        }
        return static_cast<E>(raw);
    }
    static auto encode(Graph&, E value) -> Value { return static_cast<std::int64_t>(value); }
};

template <>
struct EnumRange<rpg::BlendMode> {
    static constexpr auto last = rpg::BlendMode::subtract;
    static constexpr std::string_view name = "blend mode";
};

template <>
struct EnumRange<rpg::ArmorKind> {
    static constexpr auto last = rpg::ArmorKind::accessory;
    static constexpr std::string_view name = "armor kind";
};

template <>
struct EnumRange<rpg::TargetScope> {
    static constexpr auto last = rpg::TargetScope::user;
    static constexpr std::string_view name = "scope";
};

template <>
struct EnumRange<rpg::Occasion> {
    static constexpr auto last = rpg::Occasion::never;
    static constexpr std::string_view name = "occasion";
};

template <>
struct EnumRange<rpg::ParameterType> {
    static constexpr auto last = rpg::ParameterType::intel;
    static constexpr std::string_view name = "parameter type";
};

template <>
struct EnumRange<rpg::BattlePosition> {
    static constexpr auto last = rpg::BattlePosition::rear;
    static constexpr std::string_view name = "position";
};

template <>
struct EnumRange<rpg::ActionKind> {
    static constexpr auto last = rpg::ActionKind::skill;
    static constexpr std::string_view name = "action kind";
};

template <>
struct EnumRange<rpg::BasicAction> {
    static constexpr auto last = rpg::BasicAction::do_nothing;
    static constexpr std::string_view name = "basic action";
};

template <>
struct EnumRange<rpg::Restriction> {
    static constexpr auto last = rpg::Restriction::no_move;
    static constexpr std::string_view name = "restriction";
};

template <>
struct EnumRange<rpg::AnimationPosition> {
    static constexpr auto last = rpg::AnimationPosition::screen;
    static constexpr std::string_view name = "animation position";
};

/// "Color" user data: four little-endian doubles.
template <>
struct Converter<rpg::Color> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> rpg::Color;
    static auto encode(Graph& graph, const rpg::Color& color) -> Value;
};

/// "Tone" user data: four little-endian doubles.
template <>
struct Converter<rpg::Tone> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> rpg::Tone;
    static auto encode(Graph& graph, const rpg::Tone& tone) -> Value;
};

/// Dispatches on the wire kind, and on the class name for objects and
/// user data.
template <>
struct Converter<rpg::Parameter> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> rpg::Parameter;
    static auto encode(Graph& graph, const rpg::Parameter& parameter) -> Value;
};

/// A three-element array: id, name, zlib-compressed text.
template <>
struct Converter<rpg::Script> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> rpg::Script;
    static auto encode(Graph& graph, const rpg::Script& script) -> Value;
};

// -- Record schemas -----------------------------------------------------------

template <>
struct Schema<rpg::AudioFile> {
    static constexpr std::string_view class_name = "RPG::AudioFile";
    static constexpr auto fields = std::tuple{
        Field<&rpg::AudioFile::name, OptionalText>{"name"},
        Field<&rpg::AudioFile::volume>{"volume"},
        Field<&rpg::AudioFile::pitch>{"pitch"},
    };
};

template <>
struct Schema<rpg::MoveCommand> {
    static constexpr std::string_view class_name = "RPG::MoveCommand";
    static constexpr auto fields = std::tuple{
        Field<&rpg::MoveCommand::code>{"code"},
        Field<&rpg::MoveCommand::parameters>{"parameters", Presence::defaulted},
    };
};

template <>
struct Schema<rpg::MoveRoute> {
    static constexpr std::string_view class_name = "RPG::MoveRoute";
    static constexpr auto fields = std::tuple{
        Field<&rpg::MoveRoute::repeat>{"repeat"},
        Field<&rpg::MoveRoute::skippable>{"skippable", Presence::defaulted},
        Field<&rpg::MoveRoute::list>{"list"},
    };
};

template <>
struct Schema<rpg::EventCommand> {
    static constexpr std::string_view class_name = "RPG::EventCommand";
    static constexpr auto fields = std::tuple{
        Field<&rpg::EventCommand::code>{"code"},
        Field<&rpg::EventCommand::indent>{"indent", Presence::defaulted},
        Field<&rpg::EventCommand::parameters>{"parameters", Presence::defaulted},
    };
};

template <>
struct Schema<rpg::EventCondition> {
    static constexpr std::string_view class_name = "RPG::Event::Page::Condition";
    static constexpr auto fields = std::tuple{
        Field<&rpg::EventCondition::switch1_valid>{"switch1_valid"},
        Field<&rpg::EventCondition::switch2_valid>{"switch2_valid"},
        Field<&rpg::EventCondition::variable_valid>{"variable_valid"},
        Field<&rpg::EventCondition::self_switch_valid>{"self_switch_valid"},
        Field<&rpg::EventCondition::switch1_id, IdShift>{"switch1_id"},
        Field<&rpg::EventCondition::switch2_id, IdShift>{"switch2_id"},
        Field<&rpg::EventCondition::variable_id>{"variable_id"},
        Field<&rpg::EventCondition::variable_value>{"variable_value"},
        Field<&rpg::EventCondition::self_switch_ch>{"self_switch_ch"},
    };
};

template <>
struct Schema<rpg::EventGraphic> {
    static constexpr std::string_view class_name = "RPG::Event::Page::Graphic";
    static constexpr auto fields = std::tuple{
        Field<&rpg::EventGraphic::tile_id, OptionalIdShift>{"tile_id"},
        Field<&rpg::EventGraphic::character_name, OptionalText>{"character_name"},
        Field<&rpg::EventGraphic::character_hue>{"character_hue"},
        Field<&rpg::EventGraphic::direction>{"direction"},
        Field<&rpg::EventGraphic::pattern>{"pattern"},
        Field<&rpg::EventGraphic::opacity>{"opacity"},
        Field<&rpg::EventGraphic::blend_type>{"blend_type", Presence::defaulted},
    };
};

template <>
struct Schema<rpg::EventPage> {
    static constexpr std::string_view class_name = "RPG::Event::Page";
    static constexpr auto fields = std::tuple{
        Field<&rpg::EventPage::condition>{"condition"},
        Field<&rpg::EventPage::graphic>{"graphic"},
        Field<&rpg::EventPage::move_type>{"move_type"},
        Field<&rpg::EventPage::move_speed>{"move_speed"},
        Field<&rpg::EventPage::move_frequency>{"move_frequency"},
        Field<&rpg::EventPage::move_route>{"move_route"},
        Field<&rpg::EventPage::walk_anime>{"walk_anime"},
        Field<&rpg::EventPage::step_anime>{"step_anime"},
        Field<&rpg::EventPage::direction_fix>{"direction_fix"},
        Field<&rpg::EventPage::through>{"through"},
        Field<&rpg::EventPage::always_on_top>{"always_on_top"},
        Field<&rpg::EventPage::trigger>{"trigger"},
        Field<&rpg::EventPage::list>{"list"},
    };
};

template <>
struct Schema<rpg::Event> {
    static constexpr std::string_view class_name = "RPG::Event";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Event::id>{"id"},
        Field<&rpg::Event::name>{"name"},
        Field<&rpg::Event::x>{"x"},
        Field<&rpg::Event::y>{"y"},
        Field<&rpg::Event::pages>{"pages"},
    };
};

template <>
struct Schema<rpg::CommonEvent> {
    static constexpr std::string_view class_name = "RPG::CommonEvent";
    static constexpr auto fields = std::tuple{
        Field<&rpg::CommonEvent::id, IdShift>{"id"},
        Field<&rpg::CommonEvent::name>{"name"},
        Field<&rpg::CommonEvent::trigger>{"trigger"},
        Field<&rpg::CommonEvent::switch_id>{"switch_id"},
        Field<&rpg::CommonEvent::list>{"list"},
    };
};

template <>
struct Schema<rpg::Map> {
    static constexpr std::string_view class_name = "RPG::Map";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Map::tileset_id, IdShift>{"tileset_id"},
        Field<&rpg::Map::width>{"width"},
        Field<&rpg::Map::height>{"height"},
        Field<&rpg::Map::autoplay_bgm>{"autoplay_bgm"},
        Field<&rpg::Map::bgm>{"bgm"},
        Field<&rpg::Map::autoplay_bgs>{"autoplay_bgs"},
        Field<&rpg::Map::bgs>{"bgs"},
        Field<&rpg::Map::encounter_list, IdShiftEach>{"encounter_list", Presence::defaulted},
        Field<&rpg::Map::encounter_step>{"encounter_step", Presence::defaulted},
        Field<&rpg::Map::data, GridBlob>{"data"},
        Field<&rpg::Map::events>{"events"},
    };
};

template <>
struct Schema<rpg::MapInfo> {
    static constexpr std::string_view class_name = "RPG::MapInfo";
    static constexpr auto fields = std::tuple{
        Field<&rpg::MapInfo::name>{"name"},
        Field<&rpg::MapInfo::parent_id>{"parent_id"},
        Field<&rpg::MapInfo::order>{"order"},
        Field<&rpg::MapInfo::expanded>{"expanded"},
        Field<&rpg::MapInfo::scroll_x>{"scroll_x"},
        Field<&rpg::MapInfo::scroll_y>{"scroll_y"},
    };
};

template <>
struct Schema<rpg::Actor> {
    static constexpr std::string_view class_name = "RPG::Actor";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Actor::id, IdShift>{"id"},
        Field<&rpg::Actor::name>{"name"},
        Field<&rpg::Actor::class_id, IdShift>{"class_id"},
        Field<&rpg::Actor::initial_level>{"initial_level"},
        Field<&rpg::Actor::final_level>{"final_level"},
        Field<&rpg::Actor::exp_basis>{"exp_basis"},
        Field<&rpg::Actor::exp_inflation>{"exp_inflation"},
        Field<&rpg::Actor::character_name, OptionalText>{"character_name"},
        Field<&rpg::Actor::character_hue>{"character_hue"},
        Field<&rpg::Actor::battler_name, OptionalText>{"battler_name"},
        Field<&rpg::Actor::battler_hue>{"battler_hue"},
        Field<&rpg::Actor::parameters, GridBlob>{"parameters"},
        Field<&rpg::Actor::weapon_id, OptionalIdShift>{"weapon_id"},
        Field<&rpg::Actor::armor1_id, OptionalIdShift>{"armor1_id"},
        Field<&rpg::Actor::armor2_id, OptionalIdShift>{"armor2_id"},
        Field<&rpg::Actor::armor3_id, OptionalIdShift>{"armor3_id"},
        Field<&rpg::Actor::armor4_id, OptionalIdShift>{"armor4_id"},
        Field<&rpg::Actor::weapon_fix>{"weapon_fix"},
        Field<&rpg::Actor::armor1_fix>{"armor1_fix"},
        Field<&rpg::Actor::armor2_fix>{"armor2_fix"},
        Field<&rpg::Actor::armor3_fix>{"armor3_fix"},
        Field<&rpg::Actor::armor4_fix>{"armor4_fix"},
    };
};

template <>
struct Schema<rpg::Tileset> {
    static constexpr std::string_view class_name = "RPG::Tileset";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Tileset::id, IdShift>{"id"},
        Field<&rpg::Tileset::name>{"name"},
        Field<&rpg::Tileset::tileset_name, OptionalText>{"tileset_name"},
        Field<&rpg::Tileset::autotile_names>{"autotile_names"},
        Field<&rpg::Tileset::panorama_name, OptionalText>{"panorama_name"},
        Field<&rpg::Tileset::panorama_hue>{"panorama_hue"},
        Field<&rpg::Tileset::fog_name, OptionalText>{"fog_name"},
        Field<&rpg::Tileset::fog_hue>{"fog_hue"},
        Field<&rpg::Tileset::fog_opacity>{"fog_opacity"},
        Field<&rpg::Tileset::fog_blend_type>{"fog_blend_type"},
        Field<&rpg::Tileset::fog_zoom>{"fog_zoom"},
        Field<&rpg::Tileset::fog_sx>{"fog_sx"},
        Field<&rpg::Tileset::fog_sy>{"fog_sy"},
        Field<&rpg::Tileset::battleback_name, OptionalText>{"battleback_name"},
        Field<&rpg::Tileset::passages, GridBlob>{"passages"},
        Field<&rpg::Tileset::priorities, GridBlob>{"priorities"},
        Field<&rpg::Tileset::terrain_tags, GridBlob>{"terrain_tags"},
    };
};

// -- Database schemas ---------------------------------------------------------

template <>
struct Schema<rpg::Weapon> {
    static constexpr std::string_view class_name = "RPG::Weapon";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Weapon::id, IdShift>{"id"},
        Field<&rpg::Weapon::name>{"name"},
        Field<&rpg::Weapon::icon_name, OptionalText>{"icon_name"},
        Field<&rpg::Weapon::description>{"description"},
        Field<&rpg::Weapon::animation1_id, OptionalIdShift>{"animation1_id"},
        Field<&rpg::Weapon::animation2_id, OptionalIdShift>{"animation2_id"},
        Field<&rpg::Weapon::price>{"price"},
        Field<&rpg::Weapon::atk>{"atk"},
        Field<&rpg::Weapon::pdef>{"pdef"},
        Field<&rpg::Weapon::mdef>{"mdef"},
        Field<&rpg::Weapon::str_plus>{"str_plus"},
        Field<&rpg::Weapon::dex_plus>{"dex_plus"},
        Field<&rpg::Weapon::agi_plus>{"agi_plus"},
        Field<&rpg::Weapon::int_plus>{"int_plus"},
        Field<&rpg::Weapon::element_set, IdShiftEach>{"element_set"},
        Field<&rpg::Weapon::plus_state_set, IdShiftEach>{"plus_state_set"},
        Field<&rpg::Weapon::minus_state_set, IdShiftEach>{"minus_state_set"},
    };
};

template <>
struct Schema<rpg::Armor> {
    static constexpr std::string_view class_name = "RPG::Armor";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Armor::id, IdShift>{"id"},
        Field<&rpg::Armor::name>{"name"},
        Field<&rpg::Armor::icon_name, OptionalText>{"icon_name"},
        Field<&rpg::Armor::description>{"description"},
        Field<&rpg::Armor::kind>{"kind"},
        Field<&rpg::Armor::auto_state_id, OptionalIdShift>{"auto_state_id"},
        Field<&rpg::Armor::price>{"price"},
        Field<&rpg::Armor::pdef>{"pdef"},
        Field<&rpg::Armor::mdef>{"mdef"},
        Field<&rpg::Armor::eva>{"eva"},
        Field<&rpg::Armor::str_plus>{"str_plus"},
        Field<&rpg::Armor::dex_plus>{"dex_plus"},
        Field<&rpg::Armor::agi_plus>{"agi_plus"},
        Field<&rpg::Armor::int_plus>{"int_plus"},
        Field<&rpg::Armor::guard_element_set, IdShiftEach>{"guard_element_set"},
        Field<&rpg::Armor::guard_state_set, IdShiftEach>{"guard_state_set"},
    };
};

template <>
struct Schema<rpg::Item> {
    static constexpr std::string_view class_name = "RPG::Item";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Item::id, IdShift>{"id"},
        Field<&rpg::Item::name>{"name"},
        Field<&rpg::Item::icon_name>{"icon_name"},
        Field<&rpg::Item::description>{"description"},
        Field<&rpg::Item::scope>{"scope"},
        Field<&rpg::Item::occasion>{"occasion"},
        Field<&rpg::Item::animation1_id, OptionalIdShift>{"animation1_id"},
        Field<&rpg::Item::animation2_id, OptionalIdShift>{"animation2_id"},
        Field<&rpg::Item::menu_se>{"menu_se"},
        Field<&rpg::Item::common_event_id, OptionalIdShift>{"common_event_id"},
        Field<&rpg::Item::price>{"price"},
        Field<&rpg::Item::consumable>{"consumable"},
        Field<&rpg::Item::parameter_type>{"parameter_type"},
        Field<&rpg::Item::parameter_points>{"parameter_points"},
        Field<&rpg::Item::recover_hp_rate>{"recover_hp_rate"},
        Field<&rpg::Item::recover_hp>{"recover_hp"},
        Field<&rpg::Item::recover_sp_rate>{"recover_sp_rate", Presence::defaulted},
        Field<&rpg::Item::recover_sp>{"recover_sp", Presence::defaulted},
        Field<&rpg::Item::hit>{"hit"},
        Field<&rpg::Item::pdef_f>{"pdef_f"},
        Field<&rpg::Item::mdef_f>{"mdef_f"},
        Field<&rpg::Item::variance>{"variance"},
        Field<&rpg::Item::element_set, IdShiftEach>{"element_set"},
        Field<&rpg::Item::plus_state_set, IdShiftEach>{"plus_state_set"},
        Field<&rpg::Item::minus_state_set, IdShiftEach>{"minus_state_set"},
    };
};

template <>
struct Schema<rpg::Skill> {
    static constexpr std::string_view class_name = "RPG::Skill";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Skill::id, IdShift>{"id"},
        Field<&rpg::Skill::name>{"name"},
        Field<&rpg::Skill::icon_name, OptionalText>{"icon_name"},
        Field<&rpg::Skill::description>{"description"},
        Field<&rpg::Skill::scope>{"scope"},
        Field<&rpg::Skill::occasion>{"occasion"},
        Field<&rpg::Skill::animation1_id, OptionalIdShift>{"animation1_id"},
        Field<&rpg::Skill::animation2_id, OptionalIdShift>{"animation2_id"},
        Field<&rpg::Skill::menu_se>{"menu_se"},
        Field<&rpg::Skill::common_event_id, OptionalIdShift>{"common_event_id"},
        Field<&rpg::Skill::sp_cost>{"sp_cost"},
        Field<&rpg::Skill::power>{"power"},
        Field<&rpg::Skill::atk_f>{"atk_f"},
        Field<&rpg::Skill::eva_f>{"eva_f"},
        Field<&rpg::Skill::str_f>{"str_f"},
        Field<&rpg::Skill::dex_f>{"dex_f"},
        Field<&rpg::Skill::agi_f>{"agi_f"},
        Field<&rpg::Skill::int_f>{"int_f"},
        Field<&rpg::Skill::hit>{"hit"},
        Field<&rpg::Skill::pdef_f>{"pdef_f"},
        Field<&rpg::Skill::mdef_f>{"mdef_f"},
        Field<&rpg::Skill::variance>{"variance"},
        Field<&rpg::Skill::element_set, IdShiftEach>{"element_set"},
        Field<&rpg::Skill::plus_state_set, IdShiftEach>{"plus_state_set"},
        Field<&rpg::Skill::minus_state_set, IdShiftEach>{"minus_state_set"},
    };
};

template <>
struct Schema<rpg::ClassLearning> {
    static constexpr std::string_view class_name = "RPG::Class::Learning";
    static constexpr auto fields = std::tuple{
        Field<&rpg::ClassLearning::level>{"level"},
        Field<&rpg::ClassLearning::skill_id, IdShift>{"skill_id"},
    };
};

template <>
struct Schema<rpg::Class> {
    static constexpr std::string_view class_name = "RPG::Class";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Class::id, IdShift>{"id"},
        Field<&rpg::Class::name>{"name"},
        Field<&rpg::Class::position>{"position"},
        Field<&rpg::Class::weapon_set, IdShiftEach>{"weapon_set"},
        Field<&rpg::Class::armor_set, IdShiftEach>{"armor_set"},
        Field<&rpg::Class::element_ranks, GridBlob>{"element_ranks"},
        Field<&rpg::Class::state_ranks, GridBlob>{"state_ranks"},
        Field<&rpg::Class::learnings>{"learnings"},
    };
};

template <>
struct Schema<rpg::EnemyAction> {
    static constexpr std::string_view class_name = "RPG::Enemy::Action";
    static constexpr auto fields = std::tuple{
        Field<&rpg::EnemyAction::kind>{"kind"},
        Field<&rpg::EnemyAction::basic>{"basic"},
        Field<&rpg::EnemyAction::skill_id, IdShift>{"skill_id"},
        Field<&rpg::EnemyAction::condition_turn_a>{"condition_turn_a"},
        Field<&rpg::EnemyAction::condition_turn_b>{"condition_turn_b"},
        Field<&rpg::EnemyAction::condition_hp>{"condition_hp"},
        Field<&rpg::EnemyAction::condition_level>{"condition_level"},
        Field<&rpg::EnemyAction::condition_switch_id, OptionalIdShift>{"condition_switch_id"},
        Field<&rpg::EnemyAction::rating>{"rating"},
    };
};

template <>
struct Schema<rpg::Enemy> {
    static constexpr std::string_view class_name = "RPG::Enemy";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Enemy::id, IdShift>{"id"},
        Field<&rpg::Enemy::name>{"name"},
        Field<&rpg::Enemy::battler_name, OptionalText>{"battler_name"},
        Field<&rpg::Enemy::battler_hue>{"battler_hue"},
        Field<&rpg::Enemy::maxhp>{"maxhp"},
        Field<&rpg::Enemy::maxsp>{"maxsp"},
        Field<&rpg::Enemy::str>{"str"},
        Field<&rpg::Enemy::dex>{"dex"},
        Field<&rpg::Enemy::agi>{"agi"},
        Field<&rpg::Enemy::intel>{"int"},
        Field<&rpg::Enemy::atk>{"atk"},
        Field<&rpg::Enemy::pdef>{"pdef"},
        Field<&rpg::Enemy::mdef>{"mdef"},
        Field<&rpg::Enemy::eva>{"eva"},
        Field<&rpg::Enemy::animation1_id, OptionalIdShift>{"animation1_id"},
        Field<&rpg::Enemy::animation2_id, OptionalIdShift>{"animation2_id"},
        Field<&rpg::Enemy::element_ranks, GridBlob>{"element_ranks"},
        Field<&rpg::Enemy::state_ranks, GridBlob>{"state_ranks"},
        Field<&rpg::Enemy::actions>{"actions"},
        Field<&rpg::Enemy::exp>{"exp"},
        Field<&rpg::Enemy::gold>{"gold"},
        Field<&rpg::Enemy::item_id, OptionalIdShift>{"item_id"},
        Field<&rpg::Enemy::weapon_id, OptionalIdShift>{"weapon_id"},
        Field<&rpg::Enemy::armor_id, OptionalIdShift>{"armor_id"},
        Field<&rpg::Enemy::treasure_prob>{"treasure_prob"},
    };
};

template <>
struct Schema<rpg::State> {
    static constexpr std::string_view class_name = "RPG::State";
    static constexpr auto fields = std::tuple{
        Field<&rpg::State::id, IdShift>{"id"},
        Field<&rpg::State::name>{"name"},
        Field<&rpg::State::animation_id, OptionalIdShift>{"animation_id"},
        Field<&rpg::State::restriction>{"restriction"},
        Field<&rpg::State::nonresistance>{"nonresistance"},
        Field<&rpg::State::zero_hp>{"zero_hp"},
        Field<&rpg::State::cant_get_exp>{"cant_get_exp"},
        Field<&rpg::State::cant_evade>{"cant_evade"},
        Field<&rpg::State::slip_damage>{"slip_damage"},
        Field<&rpg::State::rating>{"rating"},
        Field<&rpg::State::hit_rate>{"hit_rate"},
        Field<&rpg::State::maxhp_rate>{"maxhp_rate"},
        Field<&rpg::State::maxsp_rate>{"maxsp_rate"},
        Field<&rpg::State::str_rate>{"str_rate"},
        Field<&rpg::State::dex_rate>{"dex_rate"},
        Field<&rpg::State::agi_rate>{"agi_rate"},
        Field<&rpg::State::int_rate>{"int_rate"},
        Field<&rpg::State::atk_rate>{"atk_rate"},
        Field<&rpg::State::pdef_rate>{"pdef_rate"},
        Field<&rpg::State::mdef_rate>{"mdef_rate"},
        Field<&rpg::State::eva>{"eva"},
        Field<&rpg::State::battle_only>{"battle_only"},
        Field<&rpg::State::hold_turn>{"hold_turn"},
        Field<&rpg::State::auto_release_prob>{"auto_release_prob"},
        Field<&rpg::State::shock_release_prob>{"shock_release_prob"},
        Field<&rpg::State::guard_element_set, IdShiftEach>{"guard_element_set"},
        Field<&rpg::State::plus_state_set, IdShiftEach>{"plus_state_set"},
        Field<&rpg::State::minus_state_set, IdShiftEach>{"minus_state_set"},
    };
};

template <>
struct Schema<rpg::TroopMember> {
    static constexpr std::string_view class_name = "RPG::Troop::Member";
    static constexpr auto fields = std::tuple{
        Field<&rpg::TroopMember::enemy_id, IdShift>{"enemy_id"},
        Field<&rpg::TroopMember::x>{"x"},
        Field<&rpg::TroopMember::y>{"y"},
        Field<&rpg::TroopMember::hidden>{"hidden"},
        Field<&rpg::TroopMember::immortal>{"immortal"},
    };
};

template <>
struct Schema<rpg::TroopCondition> {
    static constexpr std::string_view class_name = "RPG::Troop::Page::Condition";
    static constexpr auto fields = std::tuple{
        Field<&rpg::TroopCondition::turn_valid>{"turn_valid"},
        Field<&rpg::TroopCondition::enemy_valid>{"enemy_valid"},
        Field<&rpg::TroopCondition::actor_valid>{"actor_valid"},
        Field<&rpg::TroopCondition::switch_valid>{"switch_valid"},
        Field<&rpg::TroopCondition::turn_a>{"turn_a"},
        Field<&rpg::TroopCondition::turn_b>{"turn_b"},
        Field<&rpg::TroopCondition::enemy_index>{"enemy_index"},
        Field<&rpg::TroopCondition::enemy_hp>{"enemy_hp"},
        Field<&rpg::TroopCondition::actor_id, OptionalIdShift>{"actor_id"},
        Field<&rpg::TroopCondition::actor_hp>{"actor_hp"},
        Field<&rpg::TroopCondition::switch_id, OptionalIdShift>{"switch_id"},
    };
};

template <>
struct Schema<rpg::TroopPage> {
    static constexpr std::string_view class_name = "RPG::Troop::Page";
    static constexpr auto fields = std::tuple{
        Field<&rpg::TroopPage::condition>{"condition"},
        Field<&rpg::TroopPage::span>{"span"},
        Field<&rpg::TroopPage::list>{"list"},
    };
};

template <>
struct Schema<rpg::Troop> {
    static constexpr std::string_view class_name = "RPG::Troop";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Troop::id, IdShift>{"id"},
        Field<&rpg::Troop::name>{"name"},
        Field<&rpg::Troop::members>{"members"},
        Field<&rpg::Troop::pages>{"pages"},
    };
};

template <>
struct Schema<rpg::AnimationTiming> {
    static constexpr std::string_view class_name = "RPG::Animation::Timing";
    static constexpr auto fields = std::tuple{
        Field<&rpg::AnimationTiming::frame>{"frame"},
        Field<&rpg::AnimationTiming::se>{"se"},
        Field<&rpg::AnimationTiming::flash_scope>{"flash_scope"},
        Field<&rpg::AnimationTiming::flash_color>{"flash_color"},
        Field<&rpg::AnimationTiming::flash_duration>{"flash_duration"},
        Field<&rpg::AnimationTiming::condition>{"condition"},
    };
};

template <>
struct Schema<rpg::AnimationFrame> {
    static constexpr std::string_view class_name = "RPG::Animation::Frame";
    static constexpr auto fields = std::tuple{
        Field<&rpg::AnimationFrame::cell_max>{"cell_max"},
        Field<&rpg::AnimationFrame::cell_data, GridBlob>{"cell_data"},
    };
};

template <>
struct Schema<rpg::Animation> {
    static constexpr std::string_view class_name = "RPG::Animation";
    static constexpr auto fields = std::tuple{
        Field<&rpg::Animation::id, IdShift>{"id"},
        Field<&rpg::Animation::name>{"name"},
        Field<&rpg::Animation::animation_name, OptionalText>{"animation_name"},
        Field<&rpg::Animation::animation_hue>{"animation_hue"},
        Field<&rpg::Animation::position>{"position"},
        Field<&rpg::Animation::frame_max>{"frame_max"},
        Field<&rpg::Animation::frames>{"frames"},
        Field<&rpg::Animation::timings>{"timings"},
    };
};

template <>
struct Schema<rpg::SystemWords> {
    static constexpr std::string_view class_name = "RPG::System::Words";
    static constexpr auto fields = std::tuple{
        Field<&rpg::SystemWords::gold>{"gold", Presence::defaulted},
        Field<&rpg::SystemWords::hp>{"hp", Presence::defaulted},
        Field<&rpg::SystemWords::sp>{"sp", Presence::defaulted},
        Field<&rpg::SystemWords::str>{"str", Presence::defaulted},
        Field<&rpg::SystemWords::dex>{"dex", Presence::defaulted},
        Field<&rpg::SystemWords::agi>{"agi", Presence::defaulted},
        Field<&rpg::SystemWords::intel>{"int", Presence::defaulted},
        Field<&rpg::SystemWords::atk>{"atk", Presence::defaulted},
        Field<&rpg::SystemWords::pdef>{"pdef", Presence::defaulted},
        Field<&rpg::SystemWords::mdef>{"mdef", Presence::defaulted},
        Field<&rpg::SystemWords::weapon>{"weapon", Presence::defaulted},
        Field<&rpg::SystemWords::armor1>{"armor1", Presence::defaulted},
        Field<&rpg::SystemWords::armor2>{"armor2", Presence::defaulted},
        Field<&rpg::SystemWords::armor3>{"armor3", Presence::defaulted},
        Field<&rpg::SystemWords::armor4>{"armor4", Presence::defaulted},
        Field<&rpg::SystemWords::attack>{"attack", Presence::defaulted},
        Field<&rpg::SystemWords::skill>{"skill", Presence::defaulted},
        Field<&rpg::SystemWords::guard>{"guard", Presence::defaulted},
        Field<&rpg::SystemWords::item>{"item", Presence::defaulted},
        Field<&rpg::SystemWords::equip>{"equip", Presence::defaulted},
    };
};

template <>
struct Schema<rpg::TestBattler> {
    static constexpr std::string_view class_name = "RPG::System::TestBattler";
    static constexpr auto fields = std::tuple{
        Field<&rpg::TestBattler::level>{"level"},
        Field<&rpg::TestBattler::actor_id, IdShift>{"actor_id"},
        Field<&rpg::TestBattler::weapon_id, OptionalIdShift>{"weapon_id"},
        Field<&rpg::TestBattler::armor1_id, OptionalIdShift>{"armor1_id"},
        Field<&rpg::TestBattler::armor2_id, OptionalIdShift>{"armor2_id"},
        Field<&rpg::TestBattler::armor3_id, OptionalIdShift>{"armor3_id"},
        Field<&rpg::TestBattler::armor4_id, OptionalIdShift>{"armor4_id"},
    };
};

template <>
struct Schema<rpg::System> {
    static constexpr std::string_view class_name = "RPG::System";
    static constexpr auto fields = std::tuple{
        Field<&rpg::System::magic_number>{"magic_number", Presence::defaulted},
        Field<&rpg::System::party_members, IdShiftEach>{"party_members", Presence::defaulted},
        Field<&rpg::System::elements>{"elements", Presence::defaulted},
        Field<&rpg::System::switches, NilPadded>{"switches", Presence::defaulted},
        Field<&rpg::System::variables, NilPadded>{"variables", Presence::defaulted},
        Field<&rpg::System::windowskin_name, OptionalText>{"windowskin_name", Presence::defaulted},
        Field<&rpg::System::title_name, OptionalText>{"title_name", Presence::defaulted},
        Field<&rpg::System::gameover_name, OptionalText>{"gameover_name", Presence::defaulted},
        Field<&rpg::System::battle_transition, OptionalText>{"battle_transition", Presence::defaulted},
        Field<&rpg::System::title_bgm>{"title_bgm", Presence::defaulted},
        Field<&rpg::System::battle_bgm>{"battle_bgm", Presence::defaulted},
        Field<&rpg::System::battle_end_me>{"battle_end_me", Presence::defaulted},
        Field<&rpg::System::gameover_me>{"gameover_me", Presence::defaulted},
        Field<&rpg::System::cursor_se>{"cursor_se", Presence::defaulted},
        Field<&rpg::System::decision_se>{"decision_se", Presence::defaulted},
        Field<&rpg::System::cancel_se>{"cancel_se", Presence::defaulted},
        Field<&rpg::System::buzzer_se>{"buzzer_se", Presence::defaulted},
        Field<&rpg::System::equip_se>{"equip_se", Presence::defaulted},
        Field<&rpg::System::shop_se>{"shop_se", Presence::defaulted},
        Field<&rpg::System::save_se>{"save_se", Presence::defaulted},
        Field<&rpg::System::load_se>{"load_se", Presence::defaulted},
        Field<&rpg::System::battle_start_se>{"battle_start_se", Presence::defaulted},
        Field<&rpg::System::escape_se>{"escape_se", Presence::defaulted},
        Field<&rpg::System::actor_collapse_se>{"actor_collapse_se", Presence::defaulted},
        Field<&rpg::System::enemy_collapse_se>{"enemy_collapse_se", Presence::defaulted},
        Field<&rpg::System::words>{"words", Presence::defaulted},
        Field<&rpg::System::test_battlers>{"test_battlers", Presence::defaulted},
        Field<&rpg::System::test_troop_id, OptionalIdShift>{"test_troop_id", Presence::defaulted},
        Field<&rpg::System::start_map_id, IdShift>{"start_map_id", Presence::defaulted},
        Field<&rpg::System::start_x>{"start_x", Presence::defaulted},
        Field<&rpg::System::start_y>{"start_y", Presence::defaulted},
        Field<&rpg::System::battleback_name, OptionalText>{"battleback_name", Presence::defaulted},
        Field<&rpg::System::battler_name, OptionalText>{"battler_name", Presence::defaulted},
        Field<&rpg::System::battler_hue>{"battler_hue", Presence::defaulted},
        Field<&rpg::System::edit_map_id>{"edit_map_id", Presence::defaulted},
    };
};

}  // namespace marshal_cpp
