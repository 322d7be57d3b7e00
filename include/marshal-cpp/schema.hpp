/// @file schema.hpp
/// @brief Declarative mapping between object-graph nodes and typed records.
///
/// A record type opts in by specializing Schema<T> with its wire class
/// name and an ordered tuple of Field descriptors. Each field names the
/// member it fills, its wire key (without the leading '@'), a transform
/// strategy and whether it may be absent.
///
/// @code
/// template <>
/// struct marshal_cpp::Schema<Actor> {
///     static constexpr std::string_view class_name = "RPG::Actor";
///     static constexpr auto fields = std::tuple{
///         Field<&Actor::id, IdShift>{"id"},
///         Field<&Actor::name>{"name"},
///         Field<&Actor::battler_name, OptionalText>{"battler_name", Presence::defaulted},
///     };
/// };
///
/// auto actor = marshal_cpp::load<Actor>(bytes);
/// auto bytes2 = marshal_cpp::dump(actor);
/// @endcode

#pragma once

#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/graph.hpp>
#include <marshal-cpp/logger.hpp>
#include <marshal-cpp/table.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace marshal_cpp {

/// Whether a field may be missing from the wire.
enum class Presence : std::uint8_t {
    required,   ///< Absence is a schema_mismatch.
    defaulted,  ///< Absence keeps the member's default value.
};

/// Specialize for each record type. See the file comment.
template <typename T>
struct Schema;

/// A type with a Schema specialization.
template <typename T>
concept Record = requires {
    { Schema<T>::class_name } -> std::convertible_to<std::string_view>;
    Schema<T>::fields;
};

/// Per-call state for materializing typed values.
///
/// Tracks the nodes currently being converted so that a cyclic graph
/// is rejected instead of recursing forever. Nesting is capped at
/// `max_depth`. A node shared through links is copied each time it is
/// reached, so node visits are capped in proportion to the graph size.
class DecodeContext {
public:
    /// Node visits allowed per graph node, on top of `min_visit_budget`.
    static constexpr std::size_t visits_per_node = 16;
    static constexpr std::size_t min_visit_budget = 4096;

    /// Marks a node as in progress for its lifetime.
    class Scope {
    public:
        Scope(DecodeContext* ctx, std::uint32_t index) : ctx_{ctx}, index_{index} {}
        ~Scope() {
            if (ctx_) ctx_->active_.erase(index_);
        }

        Scope(const Scope&) = delete;
        auto operator=(const Scope&) -> Scope& = delete;

    private:
        DecodeContext* ctx_;
        std::uint32_t index_;
    };

    /// Limits for a graph of `node_count` nodes.
    explicit DecodeContext(std::size_t node_count = 0,
                           std::size_t max_depth = DecodeOptions{}.max_depth)
        : max_depth_{max_depth},
          visit_budget_{node_count * visits_per_node + min_visit_budget} {}

    explicit DecodeContext(const Graph& graph, const DecodeOptions& options = {})
        : DecodeContext{graph.size(), options.max_depth} {}

    /// Enter the node behind `v`. Values that are not node references
    /// cannot form cycles and are not tracked.
    /// Throws Exception{schema_mismatch} if the node is already in
    /// progress, and Exception{malformed} past the depth or visit limit.
    auto enter(const Value& v, std::string_view what) -> Scope;

    auto depth() const noexcept -> std::size_t { return active_.size(); }
    auto visits() const noexcept -> std::size_t { return visits_; }

private:
    std::unordered_set<std::uint32_t> active_;
    std::size_t max_depth_;
    std::size_t visit_budget_;
    std::size_t visits_{0};
};

namespace detail {

/// Human-readable description of a value for diagnostics, such as
/// "integer", "array" or "RPG::Actor object".
auto describe(const Graph& graph, const Value& v) -> std::string;

/// Throw Exception{schema_mismatch} for a value of the wrong kind.
[[noreturn]] void type_mismatch(std::string_view expected, const Graph& graph, const Value& v);

template <typename>
struct member_traits;

template <typename C, typename M>
struct member_traits<M C::*> {
    using class_type = C;
    using member_type = M;
};

}  // namespace detail

// -- Converters ---------------------------------------------------------------

/// Conversion between a C++ type and a Value.
///
/// Every specialization provides:
///   static auto decode(const Graph&, const Value&, DecodeContext&) -> T;
///   static auto encode(Graph&, const T&) -> Value;
template <typename T>
struct Converter;

template <>
struct Converter<bool> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext&) -> bool {
        if (const auto* b = std::get_if<bool>(&v)) return *b;
        detail::type_mismatch("bool", graph, v);
    }
    static auto encode(Graph&, bool b) -> Value { return b; }
};

/// Integers are range-checked against the destination type.
template <typename T>
    requires (std::integral<T> && !std::same_as<T, bool>)
struct Converter<T> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext&) -> T {
        const auto* i = std::get_if<std::int64_t>(&v);
        if (!i) detail::type_mismatch("integer", graph, v);
        if (!std::in_range<T>(*i)) {
            throw Exception{ErrorKind::schema_mismatch,
                            "integer " + std::to_string(*i) + " out of range"};
        }
        return static_cast<T>(*i);
    }

    static auto encode(Graph&, T value) -> Value {
        if (!std::in_range<std::int64_t>(value)) {
            throw Exception{ErrorKind::schema_mismatch,
                            "integer " + std::to_string(value) + " out of range"};
        }
        return static_cast<std::int64_t>(value);
    }
};

/// Floats also accept integers, which Ruby writes for whole numbers.
template <>
struct Converter<double> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext&) -> double {
        if (const auto* d = std::get_if<double>(&v)) return *d;
        if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
        detail::type_mismatch("float", graph, v);
    }
    static auto encode(Graph&, double d) -> Value { return d; }
};

template <>
struct Converter<std::string> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext&) -> std::string {
        const auto* s = graph.get_if<String>(v);
        if (!s) detail::type_mismatch("string", graph, v);
        return std::string{s->text()};
    }
    static auto encode(Graph& graph, const std::string& s) -> Value {
        return graph.make_string(s);
    }
};

template <typename T>
struct Converter<std::optional<T>> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> std::optional<T> {
        if (is_nil(v)) return std::nullopt;
        return Converter<T>::decode(graph, v, ctx);
    }
    static auto encode(Graph& graph, const std::optional<T>& value) -> Value {
        if (!value) return Nil{};
        return Converter<T>::encode(graph, *value);
    }
};

template <typename T>
struct Converter<std::vector<T>> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> std::vector<T> {
        const auto* array = graph.get_if<Array>(v);
        if (!array) detail::type_mismatch("array", graph, v);
        auto scope = ctx.enter(v, "array");

        auto result = std::vector<T>{};
        result.reserve(array->elements.size());
        for (const auto& element : array->elements) {
            result.push_back(Converter<T>::decode(graph, element, ctx));
        }
        return result;
    }

    static auto encode(Graph& graph, const std::vector<T>& values) -> Value {
        auto elements = std::vector<Value>{};
        elements.reserve(values.size());
        for (const auto& value : values) {
            elements.push_back(Converter<T>::encode(graph, value));
        }
        return graph.make_array(std::move(elements));
    }
};

/// Hashes. A key that repeats on the wire keeps its last value.
template <typename K, typename V>
struct Converter<std::map<K, V>> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> std::map<K, V> {
        const auto* hash = graph.get_if<Hash>(v);
        if (!hash) detail::type_mismatch("hash", graph, v);
        auto scope = ctx.enter(v, "hash");

        auto result = std::map<K, V>{};
        for (const auto& [key, value] : hash->entries) {
            result.insert_or_assign(Converter<K>::decode(graph, key, ctx),
                                    Converter<V>::decode(graph, value, ctx));
        }
        return result;
    }

    static auto encode(Graph& graph, const std::map<K, V>& values) -> Value {
        auto entries = std::vector<std::pair<Value, Value>>{};
        entries.reserve(values.size());
        for (const auto& [key, value] : values) {
            auto k = Converter<K>::encode(graph, key);
            auto v = Converter<V>::encode(graph, value);
            entries.emplace_back(std::move(k), std::move(v));
        }
        return graph.make_hash(std::move(entries));
    }
};

/// Tables travel as "Table" user data in the grid byte layout.
template <>
struct Converter<Table> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext&) -> Table {
        const auto* data = graph.get_if<UserData>(v);
        if (!data || data->class_name.name != table_class_name) {
            detail::type_mismatch("Table user data", graph, v);
        }
        return decode_table(data->data);
    }
    static auto encode(Graph& graph, const Table& table) -> Value {
        return graph.make_user_data(table_class_name, encode_table(table));
    }
};

// -- Transforms ---------------------------------------------------------------

/// Pass the value through its Converter.
struct Identity {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        return Converter<T>::decode(graph, v, ctx);
    }
    template <typename T>
    static auto encode(Graph& graph, const T& value) -> Value {
        return Converter<T>::encode(graph, value);
    }
};

/// 1-based wire ids mapped to 0-based indices. Wire ids below 1 are rejected.
struct IdShift {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        auto wire = Converter<std::int64_t>::decode(graph, v, ctx);
        if (wire < 1) {
            throw Exception{ErrorKind::schema_mismatch,
                            "id " + std::to_string(wire) + " is not 1-based"};
        }
        return Converter<T>::decode(graph, Value{wire - 1}, ctx);
    }

    template <typename T>
    static auto encode(Graph& graph, const T& value) -> Value {
        if (!std::in_range<std::int64_t>(value) ||
            static_cast<std::int64_t>(value) == std::numeric_limits<std::int64_t>::max()) {
            throw Exception{ErrorKind::schema_mismatch,
                            "id " + std::to_string(value) + " out of range"};
        }
        return Converter<std::int64_t>::encode(graph, static_cast<std::int64_t>(value) + 1);
    }
};

/// Like IdShift, with wire 0 meaning "none".
struct OptionalIdShift {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        if (Converter<std::int64_t>::decode(graph, v, ctx) == 0) return std::nullopt;
        return IdShift::decode<typename T::value_type>(graph, v, ctx);
    }

    template <typename T>
    static auto encode(Graph& graph, const T& value) -> Value {
        if (!value) return std::int64_t{0};
        return IdShift::encode(graph, *value);
    }
};

/// IdShift applied to every element of an array.
struct IdShiftEach {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        const auto* array = graph.get_if<Array>(v);
        if (!array) detail::type_mismatch("array", graph, v);

        auto result = T{};
        result.reserve(array->elements.size());
        for (const auto& element : array->elements) {
            result.push_back(IdShift::decode<typename T::value_type>(graph, element, ctx));
        }
        return result;
    }

    template <typename T>
    static auto encode(Graph& graph, const T& values) -> Value {
        auto elements = std::vector<Value>{};
        elements.reserve(values.size());
        for (const auto& value : values) {
            elements.push_back(IdShift::encode(graph, value));
        }
        return graph.make_array(std::move(elements));
    }
};

/// Arrays whose slot 0 is a nil placeholder for 1-based indexing.
struct NilPadded {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        using Element = typename T::value_type;
        const auto* array = graph.get_if<Array>(v);
        if (!array) detail::type_mismatch("nil-padded array", graph, v);
        auto scope = ctx.enter(v, "array");

        auto result = T{};
        if (array->elements.empty()) return result;
        if (!is_nil(array->elements.front())) {
            throw Exception{ErrorKind::schema_mismatch,
                            "first element of a nil-padded array is " +
                            detail::describe(graph, array->elements.front())};
        }
        result.reserve(array->elements.size() - 1);
        for (std::size_t i = 1; i < array->elements.size(); ++i) {
            result.push_back(Converter<Element>::decode(graph, array->elements[i], ctx));
        }
        return result;
    }

    template <typename T>
    static auto encode(Graph& graph, const T& values) -> Value {
        using Element = typename T::value_type;
        auto elements = std::vector<Value>{};
        elements.reserve(values.size() + 1);
        elements.emplace_back(Nil{});
        for (const auto& value : values) {
            elements.push_back(Converter<Element>::encode(graph, value));
        }
        return graph.make_array(std::move(elements));
    }
};

/// Strings where "" means "none", such as graphic file names.
struct OptionalText {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        auto text = Converter<std::string>::decode(graph, v, ctx);
        if (text.empty()) return std::nullopt;
        return text;
    }

    template <typename T>
    static auto encode(Graph& graph, const T& value) -> Value {
        return graph.make_string(value ? std::string_view{*value} : std::string_view{});
    }
};

/// Tables embedded as user data.
struct GridBlob {
    template <typename T>
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        static_assert(std::same_as<T, Table>, "GridBlob fields must be Table");
        return Converter<Table>::decode(graph, v, ctx);
    }

    template <typename T>
    static auto encode(Graph& graph, const T& value) -> Value {
        static_assert(std::same_as<T, Table>, "GridBlob fields must be Table");
        return Converter<Table>::encode(graph, value);
    }
};

// -- Field descriptors --------------------------------------------------------

/// One entry of a Schema: the member to fill, its wire key and transform.
template <auto Member, typename Transform = Identity>
struct Field {
    using record_type = typename detail::member_traits<decltype(Member)>::class_type;
    using member_type = typename detail::member_traits<decltype(Member)>::member_type;
    using transform = Transform;

    static constexpr auto member = Member;

    std::string_view key;
    Presence presence{Presence::required};
};

namespace detail {

template <Record T>
auto is_declared(std::string_view key) -> bool {
    return std::apply([&](const auto&... field) {
        return ((key == field.key) || ...);
    }, Schema<T>::fields);
}

template <Record T, auto Member, typename Transform>
void decode_field(const Graph& graph, const Fields& wire,
                  const Field<Member, Transform>& field, T& record, DecodeContext& ctx) {
    using M = typename Field<Member, Transform>::member_type;

    auto key = "@" + std::string{field.key};
    const auto* value = find_field(wire, key);
    if (!value) {
        if (field.presence == Presence::defaulted) return;
        throw Exception{ErrorKind::schema_mismatch,
                        std::string{Schema<T>::class_name} + ": missing required field " +
                        std::string{field.key}};
    }

    try {
        record.*Member = Transform::template decode<M>(graph, *value, ctx);
    } catch (const Exception& e) {
        throw Exception{e.kind(), std::string{Schema<T>::class_name} + "." +
                                  std::string{field.key} + ": " + e.error().message};
    }
}

template <Record T, auto Member, typename Transform>
auto encode_field(Graph& graph, const Field<Member, Transform>&, const T& record) -> Value {
    using M = typename Field<Member, Transform>::member_type;
    return Transform::template encode<M>(graph, record.*Member);
}

}  // namespace detail

/// Typed records: an Object node of the schema's class.
template <Record T>
struct Converter<T> {
    static auto decode(const Graph& graph, const Value& v, DecodeContext& ctx) -> T {
        constexpr auto class_name = std::string_view{Schema<T>::class_name};

        const auto* object = graph.get_if<Object>(v);
        if (!object) {
            detail::type_mismatch(std::string{class_name} + " object", graph, v);
        }
        if (object->class_name.name != class_name) {
            throw Exception{ErrorKind::schema_mismatch,
                            "expected " + std::string{class_name} + ", found " +
                            object->class_name.name};
        }
        auto scope = ctx.enter(v, class_name);

        auto record = T{};
        std::apply([&](const auto&... field) {
            (detail::decode_field(graph, object->fields, field, record, ctx), ...);
        }, Schema<T>::fields);

        for (const auto& [name, value] : object->fields) {
            auto key = std::string_view{name.name};
            if (key.starts_with('@')) key.remove_prefix(1);
            if (!detail::is_declared<T>(key)) {
                MARSHAL_CPP_LOG_TRACE("schema", "{}: ignoring undeclared field {}",
                                      class_name, key);
            }
        }
        return record;
    }

    static auto encode(Graph& graph, const T& record) -> Value {
        auto fields = Fields{};
        fields.reserve(std::tuple_size_v<std::remove_cvref_t<decltype(Schema<T>::fields)>>);
        std::apply([&](const auto&... field) {
            (fields.emplace_back(Symbol{"@" + std::string{field.key}},
                                 detail::encode_field(graph, field, record)), ...);
        }, Schema<T>::fields);
        return graph.make_object(std::string{Schema<T>::class_name}, std::move(fields));
    }
};

// -- Entry points -------------------------------------------------------------

/// Materialize a typed value from a node of a decoded graph.
/// Throws Exception{schema_mismatch} on a shape or type conflict, and
/// Exception{malformed} when nesting passes `options.max_depth` or
/// shared nodes expand past the visit budget.
template <typename T>
auto from_value(const Graph& graph, const Value& v, const DecodeOptions& options = {}) -> T {
    auto ctx = DecodeContext{graph, options};
    return Converter<T>::decode(graph, v, ctx);
}

/// Build the graph representation of a typed value inside `graph`.
template <typename T>
auto to_value(Graph& graph, const T& value) -> Value {
    return Converter<T>::encode(graph, value);
}

/// Decode a byte stream straight into a typed value.
template <typename T>
auto load(std::span<const std::byte> bytes, const DecodeOptions& options = {}) -> T {
    auto doc = decode(bytes, options);
    return from_value<T>(doc.graph, doc.root, options);
}

/// Encode a typed value into a byte stream.
template <typename T>
auto dump(const T& value) -> std::vector<std::byte> {
    auto graph = Graph{};
    auto root = to_value(graph, value);
    return encode(graph, root);
}

/// Decode a database file: a nil-padded array of records.
template <typename T>
auto load_database(std::span<const std::byte> bytes, const DecodeOptions& options = {})
    -> std::vector<T> {
    auto doc = decode(bytes, options);
    auto ctx = DecodeContext{doc.graph, options};
    return NilPadded::decode<std::vector<T>>(doc.graph, doc.root, ctx);
}

/// Encode a database file: records behind a nil placeholder.
template <typename T>
auto dump_database(const std::vector<T>& records) -> std::vector<std::byte> {
    auto graph = Graph{};
    auto root = NilPadded::encode(graph, records);
    return encode(graph, root);
}

}  // namespace marshal_cpp
