#include <marshal-cpp/json.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_cpp {

namespace {

auto base64_encode(const Bytes& data) -> std::string {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(table[b0 >> 2]);
        result.push_back(table[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? table[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? table[b2 & 0x3F] : '=');
    }
    return result;
}

// Big-endian hex of a little-endian magnitude, with sign: "-0x1f00".
auto bignum_to_hex(const BigInt& n) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto digits = std::string{};
    for (auto it = n.magnitude.rbegin(); it != n.magnitude.rend(); ++it) {
        auto b = static_cast<unsigned char>(*it);
        digits.push_back(hex_chars[b >> 4]);
        digits.push_back(hex_chars[b & 0x0F]);
    }
    auto first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? "0" : digits.substr(first);
    return (n.negative ? "-0x" : "0x") + digits;
}

auto is_valid_utf8(std::string_view s) -> bool {
    auto i = std::size_t{0};
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        auto len = std::size_t{0};
        auto min = std::uint32_t{0};
        auto cp = std::uint32_t{0};
        if (c < 0x80) { ++i; continue; }
        if ((c & 0xE0) == 0xC0)      { len = 2; min = 0x80;    cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; min = 0x800;   cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; min = 0x10000; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

auto text_or_bytes(const Bytes& data) -> nlohmann::json {
    auto text = std::string_view{reinterpret_cast<const char*>(data.data()), data.size()};
    if (is_valid_utf8(text)) return std::string{text};
    return nlohmann::json{{"__type", "bytes"}, {"value", base64_encode(data)}};
}

class JsonExporter {
public:
    explicit JsonExporter(const Graph& graph) : graph_{graph} {}

    auto value(const Value& v) -> nlohmann::json {
        return std::visit(overload{
            [](Nil) -> nlohmann::json { return nullptr; },
            [](bool b) -> nlohmann::json { return b; },
            [](std::int64_t i) -> nlohmann::json { return i; },
            [](const BigInt& n) -> nlohmann::json {
                return {{"__type", "bignum"}, {"value", bignum_to_hex(n)}};
            },
            [](double d) -> nlohmann::json {
                if (std::isnan(d)) return {{"__type", "float"}, {"value", "nan"}};
                if (std::isinf(d)) return {{"__type", "float"}, {"value", d < 0 ? "-inf" : "inf"}};
                return d;
            },
            [](const Symbol& s) -> nlohmann::json {
                return {{"__type", "symbol"}, {"value", s.name}};
            },
            [&](NodeRef ref) -> nlohmann::json { return node(ref); },
        }, v);
    }

private:
    auto node(NodeRef ref) -> nlohmann::json {
        if (!visited_.insert(ref.index).second) {
            return {{"__ref", ref.index}};
        }
        const auto& n = graph_.node(ref);
        auto j = body(n.data);

        if (!n.ivars.empty() || !n.extends.empty() || n.user_class) {
            // Scalars and arrays get wrapped so the metadata has a home.
            if (!j.is_object()) {
                j = nlohmann::json{{"__type", std::string{kind_of(n.data)}}, {"value", std::move(j)}};
            }
            if (!n.ivars.empty()) j["__ivars"] = fields(n.ivars);
            if (!n.extends.empty()) {
                auto extends = nlohmann::json::array();
                for (const auto& module : n.extends) extends.push_back(module.name);
                j["__extends"] = std::move(extends);
            }
            if (n.user_class) j["__user_class"] = n.user_class->name;
        }
        return j;
    }

    auto body(const NodeData& data) -> nlohmann::json {
        return std::visit(overload{
            [](const String& s) -> nlohmann::json { return text_or_bytes(s.data); },
            [](const Regexp& r) -> nlohmann::json {
                return {{"__type", "regexp"}, {"source", text_or_bytes(r.source)},
                        {"options", r.options}};
            },
            [&](const Array& a) -> nlohmann::json {
                auto j = nlohmann::json::array();
                for (const auto& element : a.elements) j.push_back(value(element));
                return j;
            },
            [&](const Hash& h) -> nlohmann::json {
                auto entries = nlohmann::json::array();
                for (const auto& [k, v] : h.entries) {
                    entries.push_back(nlohmann::json::array({value(k), value(v)}));
                }
                auto j = nlohmann::json{{"__type", "hash"}, {"entries", std::move(entries)}};
                if (h.default_value) j["default"] = value(*h.default_value);
                return j;
            },
            [&](const Object& o) -> nlohmann::json {
                auto j = fields(o.fields);
                j["__class"] = o.class_name.name;
                return j;
            },
            [&](const Struct& s) -> nlohmann::json {
                return {{"__type", "struct"}, {"__class", s.class_name.name},
                        {"members", fields(s.members)}};
            },
            [](const ClassRef& c) -> nlohmann::json {
                return {{"__type", "class"}, {"value", c.name}};
            },
            [](const ModuleRef& m) -> nlohmann::json {
                return {{"__type", "module"}, {"value", m.name}};
            },
            [](const UserData& u) -> nlohmann::json {
                return {{"__type", "user_data"}, {"__class", u.class_name.name},
                        {"value", base64_encode(u.data)}};
            },
            [&](const UserMarshal& u) -> nlohmann::json {
                return {{"__type", "user_marshal"}, {"__class", u.class_name.name},
                        {"value", value(u.data)}};
            },
            [&](const WrappedData& d) -> nlohmann::json {
                return {{"__type", "data"}, {"__class", d.class_name.name},
                        {"value", value(d.data)}};
            },
        }, data);
    }

    auto fields(const Fields& list) -> nlohmann::json {
        auto j = nlohmann::json::object();
        for (const auto& [name, v] : list) {
            j[name.name] = value(v);
        }
        return j;
    }

    static auto kind_of(const NodeData& data) -> std::string_view {
        return std::visit(overload{
            [](const String&) { return std::string_view{"string"}; },
            [](const Array&) { return std::string_view{"array"}; },
            [](const auto&) { return std::string_view{"node"}; },
        }, data);
    }

    const Graph& graph_;
    std::unordered_set<std::uint32_t> visited_;
};

}  // anonymous namespace

auto export_json(const Graph& graph, const Value& v) -> nlohmann::json {
    auto exporter = JsonExporter{graph};
    return exporter.value(v);
}

void to_json(nlohmann::json& j, const Table& table) {
    auto cells = table.data();
    j = nlohmann::json{
        {"xsize", table.xsize()},
        {"ysize", table.ysize()},
        {"zsize", table.zsize()},
        {"data", std::vector<std::uint16_t>(cells.begin(), cells.end())},
    };
}

namespace rpg {

void to_json(nlohmann::json& j, const Color& color) {
    j = nlohmann::json{
        {"__class", "Color"},
        {"red", color.red}, {"green", color.green},
        {"blue", color.blue}, {"alpha", color.alpha},
    };
}

void to_json(nlohmann::json& j, const Tone& tone) {
    j = nlohmann::json{
        {"__class", "Tone"},
        {"red", tone.red}, {"green", tone.green},
        {"blue", tone.blue}, {"gray", tone.gray},
    };
}

void to_json(nlohmann::json& j, const Parameter& parameter) {
    std::visit(overload{
        [&](Nil) { j = nullptr; },
        [&](const Parameter::Array& a) {
            j = nlohmann::json::array();
            for (const auto& element : a) j.push_back(element);
        },
        [&](const auto& v) { j = v; },
    }, parameter.value);
}

void to_json(nlohmann::json& j, const Script& script) {
    j = nlohmann::json{{"id", script.id}, {"name", script.name}, {"text", script.text}};
}

}  // namespace rpg

}  // namespace marshal_cpp
