#include <marshal-cpp/schema.hpp>

#include <string>

namespace marshal_cpp {

auto DecodeContext::enter(const Value& v, std::string_view what) -> Scope {
    const auto* ref = std::get_if<NodeRef>(&v);
    if (!ref) return Scope{nullptr, 0};

    if (++visits_ > visit_budget_) {
        throw Exception{ErrorKind::malformed,
                        "materializing more than " + std::to_string(visit_budget_) +
                        " nodes; shared references expand too far"};
    }
    if (active_.size() >= max_depth_) {
        throw Exception{ErrorKind::malformed,
                        "typed nesting deeper than " + std::to_string(max_depth_)};
    }
    if (!active_.insert(ref->index).second) {
        throw Exception{ErrorKind::schema_mismatch,
                        std::string{what} + " node " + std::to_string(ref->index) +
                        " contains itself; typed records cannot be cyclic"};
    }
    return Scope{this, ref->index};
}

namespace detail {

auto describe(const Graph& graph, const Value& v) -> std::string {
    const auto* ref = std::get_if<NodeRef>(&v);
    if (!ref) return std::string{type_name(v)};
    if (!graph.contains(*ref)) return "dangling reference";

    return std::visit(overload{
        [](const String&) -> std::string { return "string"; },
        [](const Regexp&) -> std::string { return "regexp"; },
        [](const Array&) -> std::string { return "array"; },
        [](const Hash&) -> std::string { return "hash"; },
        [](const Object& o) -> std::string { return o.class_name.name + " object"; },
        [](const Struct& s) -> std::string { return s.class_name.name + " struct"; },
        [](const ClassRef&) -> std::string { return "class"; },
        [](const ModuleRef&) -> std::string { return "module"; },
        [](const UserData& u) -> std::string { return u.class_name.name + " user data"; },
        [](const UserMarshal& u) -> std::string { return u.class_name.name + " user marshal"; },
        [](const WrappedData& d) -> std::string { return d.class_name.name + " data"; },
    }, graph.node(*ref).data);
}

void type_mismatch(std::string_view expected, const Graph& graph, const Value& v) {
    throw Exception{ErrorKind::schema_mismatch,
                    "expected " + std::string{expected} + ", found " + describe(graph, v)};
}

}  // namespace detail

}  // namespace marshal_cpp
