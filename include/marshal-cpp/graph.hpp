/// @file graph.hpp
/// @brief Heap node types, the Graph arena, and Document.

#pragma once

#include <marshal-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_cpp {

/// Ordered (name, value) pairs: instance variables or struct members.
/// Instance variable names keep their leading '@'.
using Fields = std::vector<std::pair<Symbol, Value>>;

/// Raw string bytes. Marshal strings carry no implied encoding.
struct String {
    Bytes data;

    auto operator==(const String&) const -> bool = default;

    /// View the bytes as text.
    auto text() const -> std::string_view {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }
};

/// A regular expression: source bytes plus option flags.
struct Regexp {
    Bytes source;
    std::uint8_t options{0};

    auto operator==(const Regexp&) const -> bool = default;
};

/// An ordered sequence of values.
struct Array {
    std::vector<Value> elements;

    auto operator==(const Array&) const -> bool = default;
};

/// A hash. Keys may be any value; entry order is the wire order.
struct Hash {
    std::vector<std::pair<Value, Value>> entries;
    std::optional<Value> default_value;  ///< Set only for hashes tagged '}'.

    auto operator==(const Hash&) const -> bool = default;
};

/// A plain object: class name plus instance variables.
struct Object {
    Symbol class_name;
    Fields fields;

    auto operator==(const Object&) const -> bool = default;
};

/// A Struct instance: class name plus member values (no '@' prefix).
struct Struct {
    Symbol class_name;
    Fields members;

    auto operator==(const Struct&) const -> bool = default;
};

/// A reference to a class by name.
struct ClassRef {
    std::string name;

    auto operator==(const ClassRef&) const -> bool = default;
};

/// A reference to a module by name. `legacy` marks the old 'M' tag.
struct ModuleRef {
    std::string name;
    bool legacy{false};

    auto operator==(const ModuleRef&) const -> bool = default;
};

/// Opaque bytes produced by a class's `_dump` (tag 'u').
struct UserData {
    Symbol class_name;
    Bytes data;

    auto operator==(const UserData&) const -> bool = default;
};

/// A value produced by a class's `marshal_dump` (tag 'U').
struct UserMarshal {
    Symbol class_name;
    Value data;

    auto operator==(const UserMarshal&) const -> bool = default;
};

/// A wrapped C data object (tag 'd').
struct WrappedData {
    Symbol class_name;
    Value data;

    auto operator==(const WrappedData&) const -> bool = default;
};

/// The payload of a heap node.
using NodeData = std::variant<
    String,
    Regexp,
    Array,
    Hash,
    Object,
    Struct,
    ClassRef,
    ModuleRef,
    UserData,
    UserMarshal,
    WrappedData
>;

/// A heap node: payload plus the wrapper metadata Marshal can attach.
struct Node {
    NodeData data;
    Fields ivars;                      ///< From an 'I' wrapper.
    std::vector<Symbol> extends;       ///< From 'e' wrappers, outermost first.
    std::optional<Symbol> user_class;  ///< From a 'C' wrapper.

    auto operator==(const Node&) const -> bool = default;
};

/// Find a field by name, or nullptr.
auto find_field(const Fields& fields, std::string_view name) -> const Value*;

/// Arena that owns every heap node of one object graph.
///
/// Values refer to nodes by index, so shared references and cycles
/// are plain data. References and pointers returned by node() and
/// get_if() are invalidated by the next add().
class Graph {
public:
    Graph() = default;

    /// Append a node and return its reference.
    auto add(Node node) -> NodeRef;

    /// Append a node with no wrapper metadata.
    auto add(NodeData data) -> NodeRef {
        return add(Node{.data = std::move(data), .ivars = {}, .extends = {}, .user_class = {}});
    }

    /// Check whether a reference names a node of this graph.
    auto contains(NodeRef ref) const noexcept -> bool {
        return ref.index < nodes_.size();
    }

    /// Access a node. Throws Exception{bad_reference} for foreign refs.
    auto node(NodeRef ref) -> Node&;
    auto node(NodeRef ref) const -> const Node&;

    /// Typed access to the node behind a value, or nullptr if the value
    /// is not a NodeRef or the node holds a different payload.
    template <typename T>
    auto get_if(const Value& v) const -> const T* {
        const auto* ref = std::get_if<NodeRef>(&v);
        if (!ref || !contains(*ref)) return nullptr;
        return std::get_if<T>(&nodes_[ref->index].data);
    }

    template <typename T>
    auto get_if(const Value& v) -> T* {
        const auto* ref = std::get_if<NodeRef>(&v);
        if (!ref || !contains(*ref)) return nullptr;
        return std::get_if<T>(&nodes_[ref->index].data);
    }

    auto size() const noexcept -> std::size_t { return nodes_.size(); }
    auto nodes() const noexcept -> const std::vector<Node>& { return nodes_; }

    // -- Builders -------------------------------------------------------------

    auto make_string(std::string_view text) -> Value;
    auto make_array(std::vector<Value> elements) -> Value;
    auto make_hash(std::vector<std::pair<Value, Value>> entries) -> Value;
    auto make_object(std::string class_name, Fields fields) -> Value;
    auto make_user_data(std::string class_name, Bytes data) -> Value;

    auto operator==(const Graph&) const -> bool = default;

private:
    std::vector<Node> nodes_;
};

/// A complete decoded object graph: the arena plus its root value.
struct Document {
    Graph graph;
    Value root{Nil{}};
};

/// Compare two values structurally, following node references.
///
/// Node identity and arena order are ignored; shared references and
/// cycles are compared by shape, so a graph compares equal to its own
/// re-decoded form.
auto structurally_equal(const Graph& a, const Value& va,
                        const Graph& b, const Value& vb) -> bool;

/// Copy everything reachable from `v` in `src` into `dst`.
///
/// Sharing and cycles inside the copied part are preserved. Returns the
/// value to use in `dst`.
auto copy_value(const Graph& src, const Value& v, Graph& dst) -> Value;

}  // namespace marshal_cpp
