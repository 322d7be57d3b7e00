#include <marshal-cpp/rgss.hpp>
#include <marshal-cpp/logger.hpp>

#include "compression.hpp"
#include "wire/reader.hpp"
#include "wire/writer.hpp"

#include <array>
#include <bit>
#include <span>
#include <string>

namespace marshal_cpp {

namespace {

using Channels = std::array<double, 4>;

constexpr std::size_t channels_size = 32;

auto read_channels(const Graph& graph, const Value& v, std::string_view class_name) -> Channels {
    const auto* data = graph.get_if<UserData>(v);
    if (!data || data->class_name.name != class_name) {
        detail::type_mismatch(std::string{class_name} + " user data", graph, v);
    }
    if (data->data.size() != channels_size) {
        throw Exception{ErrorKind::schema_mismatch,
                        std::string{class_name} + " user data holds " +
                        std::to_string(data->data.size()) + " bytes, expected " +
                        std::to_string(channels_size)};
    }

    auto r = wire::Reader{data->data};
    auto channels = Channels{};
    for (auto& channel : channels) {
        auto lo = std::uint64_t{r.read_u32()};
        auto hi = std::uint64_t{r.read_u32()};
        channel = std::bit_cast<double>(lo | (hi << 32));
    }
    return channels;
}

auto write_channels(Graph& graph, std::string_view class_name, const Channels& channels) -> Value {
    auto w = wire::Writer{};
    for (auto channel : channels) {
        auto bits = std::bit_cast<std::uint64_t>(channel);
        w.write_u32(static_cast<std::uint32_t>(bits & 0xFFFFFFFF));
        w.write_u32(static_cast<std::uint32_t>(bits >> 32));
    }
    return graph.make_user_data(std::string{class_name}, w.take());
}

}  // anonymous namespace

// -- Color / Tone -------------------------------------------------------------

auto Converter<rpg::Color>::decode(const Graph& graph, const Value& v, DecodeContext&)
    -> rpg::Color {
    auto [r, g, b, a] = read_channels(graph, v, "Color");
    return rpg::Color{.red = r, .green = g, .blue = b, .alpha = a};
}

auto Converter<rpg::Color>::encode(Graph& graph, const rpg::Color& color) -> Value {
    return write_channels(graph, "Color", {color.red, color.green, color.blue, color.alpha});
}

auto Converter<rpg::Tone>::decode(const Graph& graph, const Value& v, DecodeContext&)
    -> rpg::Tone {
    auto [r, g, b, gray] = read_channels(graph, v, "Tone");
    return rpg::Tone{.red = r, .green = g, .blue = b, .gray = gray};
}

auto Converter<rpg::Tone>::encode(Graph& graph, const rpg::Tone& tone) -> Value {
    return write_channels(graph, "Tone", {tone.red, tone.green, tone.blue, tone.gray});
}

// -- Parameter ----------------------------------------------------------------

auto Converter<rpg::Parameter>::decode(const Graph& graph, const Value& v, DecodeContext& ctx)
    -> rpg::Parameter {
    using rpg::Parameter;

    if (is_nil(v)) return Parameter{};
    if (const auto* i = std::get_if<std::int64_t>(&v)) return Parameter{*i};
    if (const auto* d = std::get_if<double>(&v)) return Parameter{*d};
    if (const auto* b = std::get_if<bool>(&v)) return Parameter{*b};

    if (graph.get_if<String>(v)) {
        return Parameter{Converter<std::string>::decode(graph, v, ctx)};
    }
    if (graph.get_if<Array>(v)) {
        return Parameter{Converter<Parameter::Array>::decode(graph, v, ctx)};
    }
    if (const auto* data = graph.get_if<UserData>(v)) {
        if (data->class_name.name == "Color") {
            return Parameter{Converter<rpg::Color>::decode(graph, v, ctx)};
        }
        if (data->class_name.name == "Tone") {
            return Parameter{Converter<rpg::Tone>::decode(graph, v, ctx)};
        }
    }
    if (const auto* object = graph.get_if<Object>(v)) {
        const auto& name = object->class_name.name;
        if (name == Schema<rpg::AudioFile>::class_name) {
            return Parameter{Converter<rpg::AudioFile>::decode(graph, v, ctx)};
        }
        if (name == Schema<rpg::MoveRoute>::class_name) {
            return Parameter{Converter<rpg::MoveRoute>::decode(graph, v, ctx)};
        }
        if (name == Schema<rpg::MoveCommand>::class_name) {
            return Parameter{Converter<rpg::MoveCommand>::decode(graph, v, ctx)};
        }
    }
    detail::type_mismatch("command parameter", graph, v);
}

auto Converter<rpg::Parameter>::encode(Graph& graph, const rpg::Parameter& parameter) -> Value {
    return std::visit(overload{
        [](Nil) -> Value { return Nil{}; },
        [](std::int64_t i) -> Value { return i; },
        [](double d) -> Value { return d; },
        [](bool b) -> Value { return b; },
        [&](const std::string& s) -> Value { return graph.make_string(s); },
        [&](const rpg::Color& c) -> Value { return Converter<rpg::Color>::encode(graph, c); },
        [&](const rpg::Tone& t) -> Value { return Converter<rpg::Tone>::encode(graph, t); },
        [&](const rpg::AudioFile& a) -> Value {
            return Converter<rpg::AudioFile>::encode(graph, a);
        },
        [&](const rpg::MoveRoute& r) -> Value {
            return Converter<rpg::MoveRoute>::encode(graph, r);
        },
        [&](const rpg::MoveCommand& c) -> Value {
            return Converter<rpg::MoveCommand>::encode(graph, c);
        },
        [&](const rpg::Parameter::Array& a) -> Value {
            return Converter<rpg::Parameter::Array>::encode(graph, a);
        },
    }, parameter.value);
}

// -- Script -------------------------------------------------------------------

auto Converter<rpg::Script>::decode(const Graph& graph, const Value& v, DecodeContext& ctx)
    -> rpg::Script {
    const auto* entry = graph.get_if<Array>(v);
    if (!entry) detail::type_mismatch("script entry", graph, v);
    if (entry->elements.size() < 3) {
        throw Exception{ErrorKind::schema_mismatch,
                        "script entry has " + std::to_string(entry->elements.size()) +
                        " elements, expected 3"};
    }

    auto script = rpg::Script{};
    script.id = Converter<std::int64_t>::decode(graph, entry->elements[0], ctx);
    script.name = Converter<std::string>::decode(graph, entry->elements[1], ctx);

    const auto* body = graph.get_if<String>(entry->elements[2]);
    if (!body) detail::type_mismatch("compressed script body", graph, entry->elements[2]);

    auto text = detail::zlib_decompress(body->data, rpg::max_script_size);
    if (!text) {
        throw Exception{ErrorKind::schema_mismatch,
                        "script \"" + script.name + "\" is corrupt or inflates past " +
                        std::to_string(rpg::max_script_size) + " bytes"};
    }
    script.text.assign(reinterpret_cast<const char*>(text->data()), text->size());

    MARSHAL_CPP_LOG_TRACE("rgss", "inflated script \"{}\": {} -> {} bytes",
                          script.name, body->data.size(), text->size());
    return script;
}

auto Converter<rpg::Script>::encode(Graph& graph, const rpg::Script& script) -> Value {
    auto compressed = detail::zlib_compress(std::as_bytes(std::span{script.text}));
    if (!compressed) {
        throw Exception{ErrorKind::schema_mismatch,
                        "script \"" + script.name + "\" could not be compressed"};
    }

    auto elements = std::vector<Value>{};
    elements.reserve(3);
    elements.push_back(Converter<std::int64_t>::encode(graph, script.id));
    elements.push_back(graph.make_string(script.name));
    elements.emplace_back(graph.add(String{std::move(*compressed)}));
    return graph.make_array(std::move(elements));
}

}  // namespace marshal_cpp
