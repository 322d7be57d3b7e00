#include <marshal-cpp/error.hpp>
#include <marshal-cpp/graph.hpp>

#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace marshal_cpp {

auto find_field(const Fields& fields, std::string_view name) -> const Value* {
    for (const auto& [key, value] : fields) {
        if (key.name == name) return &value;
    }
    return nullptr;
}

auto Graph::add(Node node) -> NodeRef {
    auto ref = NodeRef{static_cast<std::uint32_t>(nodes_.size())};
    nodes_.push_back(std::move(node));
    return ref;
}

auto Graph::node(NodeRef ref) -> Node& {
    if (!contains(ref)) {
        throw Exception{ErrorKind::bad_reference,
                        "node " + std::to_string(ref.index) + " is not part of this graph"};
    }
    return nodes_[ref.index];
}

auto Graph::node(NodeRef ref) const -> const Node& {
    if (!contains(ref)) {
        throw Exception{ErrorKind::bad_reference,
                        "node " + std::to_string(ref.index) + " is not part of this graph"};
    }
    return nodes_[ref.index];
}

auto Graph::make_string(std::string_view text) -> Value {
    auto data = Bytes{};
    data.reserve(text.size());
    for (auto c : text) data.push_back(static_cast<std::byte>(c));
    return add(NodeData{String{std::move(data)}});
}

auto Graph::make_array(std::vector<Value> elements) -> Value {
    return add(NodeData{Array{std::move(elements)}});
}

auto Graph::make_hash(std::vector<std::pair<Value, Value>> entries) -> Value {
    return add(NodeData{Hash{.entries = std::move(entries), .default_value = std::nullopt}});
}

auto Graph::make_object(std::string class_name, Fields fields) -> Value {
    return add(NodeData{Object{Symbol{std::move(class_name)}, std::move(fields)}});
}

auto Graph::make_user_data(std::string class_name, Bytes data) -> Value {
    return add(NodeData{UserData{Symbol{std::move(class_name)}, std::move(data)}});
}

// -- Structural comparison ----------------------------------------------------

namespace {

class StructuralComparer {
public:
    StructuralComparer(const Graph& a, const Graph& b) : a_{a}, b_{b} {}

    auto values(const Value& va, const Value& vb) -> bool {
        if (va.index() != vb.index()) return false;
        const auto* ra = std::get_if<NodeRef>(&va);
        if (!ra) return inline_values(va, vb);
        const auto& rb = std::get<NodeRef>(vb);
        if (!a_.contains(*ra) || !b_.contains(rb)) return false;

        // A pair already visited is assumed equal; any
        // difference is reported by the outer comparison.
        if (!visited_.emplace(ra->index, rb.index).second) return true;
        return nodes(a_.node(*ra), b_.node(rb));
    }

private:
    static auto inline_values(const Value& va, const Value& vb) -> bool {
        const auto* da = std::get_if<double>(&va);
        const auto* db = std::get_if<double>(&vb);
        if (da && db && std::isnan(*da) && std::isnan(*db)) return true;
        return va == vb;
    }

    auto fields(const Fields& fa, const Fields& fb) -> bool {
        if (fa.size() != fb.size()) return false;
        for (std::size_t i = 0; i < fa.size(); ++i) {
            if (fa[i].first != fb[i].first) return false;
            if (!values(fa[i].second, fb[i].second)) return false;
        }
        return true;
    }

    auto nodes(const Node& na, const Node& nb) -> bool {
        if (na.extends != nb.extends || na.user_class != nb.user_class) return false;
        if (!fields(na.ivars, nb.ivars)) return false;
        if (na.data.index() != nb.data.index()) return false;

        return std::visit(overload{
            [&](const Array& x) {
                const auto& y = std::get<Array>(nb.data);
                if (x.elements.size() != y.elements.size()) return false;
                for (std::size_t i = 0; i < x.elements.size(); ++i) {
                    if (!values(x.elements[i], y.elements[i])) return false;
                }
                return true;
            },
            [&](const Hash& x) {
                const auto& y = std::get<Hash>(nb.data);
                if (x.entries.size() != y.entries.size()) return false;
                if (x.default_value.has_value() != y.default_value.has_value()) return false;
                if (x.default_value && !values(*x.default_value, *y.default_value)) return false;
                for (std::size_t i = 0; i < x.entries.size(); ++i) {
                    if (!values(x.entries[i].first, y.entries[i].first)) return false;
                    if (!values(x.entries[i].second, y.entries[i].second)) return false;
                }
                return true;
            },
            [&](const Object& x) {
                const auto& y = std::get<Object>(nb.data);
                return x.class_name == y.class_name && fields(x.fields, y.fields);
            },
            [&](const Struct& x) {
                const auto& y = std::get<Struct>(nb.data);
                return x.class_name == y.class_name && fields(x.members, y.members);
            },
            [&](const UserMarshal& x) {
                const auto& y = std::get<UserMarshal>(nb.data);
                return x.class_name == y.class_name && values(x.data, y.data);
            },
            [&](const WrappedData& x) {
                const auto& y = std::get<WrappedData>(nb.data);
                return x.class_name == y.class_name && values(x.data, y.data);
            },
            [&](const auto& x) {
                return x == std::get<std::decay_t<decltype(x)>>(nb.data);
            },
        }, na.data);
    }

    const Graph& a_;
    const Graph& b_;
    std::set<std::pair<std::uint32_t, std::uint32_t>> visited_;
};

}  // anonymous namespace

auto structurally_equal(const Graph& a, const Value& va,
                        const Graph& b, const Value& vb) -> bool {
    return StructuralComparer{a, b}.values(va, vb);
}

// -- Subgraph copy ------------------------------------------------------------

namespace {

class SubgraphCopier {
public:
    SubgraphCopier(const Graph& src, Graph& dst) : src_{src}, dst_{dst} {}

    auto value(const Value& v) -> Value {
        const auto* ref = std::get_if<NodeRef>(&v);
        if (!ref) return v;
        if (auto it = copied_.find(ref->index); it != copied_.end()) return it->second;

        // Taken by value: src and dst may be the same graph, and add()
        // invalidates references into it.
        auto source = src_.node(*ref);
        auto target = dst_.add(NodeData{});
        copied_.emplace(ref->index, target);

        auto copy = Node{
            .data = data(source.data),
            .ivars = fields(source.ivars),
            .extends = source.extends,
            .user_class = source.user_class,
        };
        dst_.node(target) = std::move(copy);
        return target;
    }

private:
    auto fields(const Fields& in) -> Fields {
        auto out = Fields{};
        out.reserve(in.size());
        for (const auto& [key, v] : in) {
            auto copied = value(v);
            out.emplace_back(key, std::move(copied));
        }
        return out;
    }

    auto data(const NodeData& in) -> NodeData {
        return std::visit(overload{
            [&](const Array& a) -> NodeData {
                auto out = Array{};
                out.elements.reserve(a.elements.size());
                for (const auto& element : a.elements) {
                    out.elements.push_back(value(element));
                }
                return out;
            },
            [&](const Hash& h) -> NodeData {
                auto out = Hash{};
                out.entries.reserve(h.entries.size());
                for (const auto& [key, v] : h.entries) {
                    auto k = value(key);
                    auto copied = value(v);
                    out.entries.emplace_back(std::move(k), std::move(copied));
                }
                if (h.default_value) out.default_value = value(*h.default_value);
                return out;
            },
            [&](const Object& o) -> NodeData {
                return Object{o.class_name, fields(o.fields)};
            },
            [&](const Struct& s) -> NodeData {
                return Struct{s.class_name, fields(s.members)};
            },
            [&](const UserMarshal& u) -> NodeData {
                return UserMarshal{u.class_name, value(u.data)};
            },
            [&](const WrappedData& d) -> NodeData {
                return WrappedData{d.class_name, value(d.data)};
            },
            [](const auto& leaf) -> NodeData { return leaf; },
        }, in);
    }

    const Graph& src_;
    Graph& dst_;
    std::map<std::uint32_t, NodeRef> copied_;
};

}  // anonymous namespace

auto copy_value(const Graph& src, const Value& v, Graph& dst) -> Value {
    return SubgraphCopier{src, dst}.value(v);
}

}  // namespace marshal_cpp
