#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/logger.hpp>

#include "wire/fixnum.hpp"
#include "wire/reader.hpp"
#include "wire/reference_tables.hpp"
#include "wire/tag.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_cpp {

namespace {

auto describe_byte(std::byte b) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    auto v = static_cast<unsigned>(b);
    return std::string{"0x"} + hex[v >> 4] + hex[v & 0x0F];
}

// Parse the textual float representation. Legacy producers append raw
// mantissa bytes after a NUL; only the text before it is significant.
auto parse_float(std::string_view text) -> double {
    if (auto nul = text.find('\0'); nul != std::string_view::npos) {
        text = text.substr(0, nul);
    }
    if (text == "nan") return std::numeric_limits<double>::quiet_NaN();
    if (text == "inf") return std::numeric_limits<double>::infinity();
    if (text == "-inf") return -std::numeric_limits<double>::infinity();

    auto value = 0.0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        throw Exception{ErrorKind::malformed,
                        "invalid float literal \"" + std::string{text} + "\""};
    }
    return value;
}

class Decoder {
public:
    Decoder(std::span<const std::byte> data, const DecodeOptions& options)
        : reader_{data}, options_{options} {}

    auto run() -> Document {
        reader_.read_exact(wire::version_header.size());

        auto root = read_value();
        if (!reader_.at_end()) {
            throw Exception{ErrorKind::trailing_data,
                            std::to_string(reader_.remaining()) +
                            " bytes after the top-level value"};
        }

        MARSHAL_CPP_LOG_DEBUG("decoder", "decoded {} bytes: {} symbols, {} objects, {} nodes",
                              reader_.pos(), symbols_.size(), objects_.size(), graph_.size());
        return Document{std::move(graph_), std::move(root)};
    }

private:
    // Tracks recursion depth for the lifetime of one nested read.
    class DepthGuard {
    public:
        explicit DepthGuard(Decoder& d) : d_{d} {
            if (++d_.depth_ > d_.options_.max_depth) {
                throw Exception{ErrorKind::malformed,
                                "nesting deeper than " + std::to_string(d_.options_.max_depth)};
            }
        }
        ~DepthGuard() { --d_.depth_; }

        DepthGuard(const DepthGuard&) = delete;
        auto operator=(const DepthGuard&) -> DepthGuard& = delete;

    private:
        Decoder& d_;
    };

    auto read_long() -> std::int64_t {
        auto lead = reader_.read_byte();
        auto payload = reader_.read_exact(wire::fixnum_payload_size(lead));
        return wire::decode_fixnum_payload(lead, payload);
    }

    // A count of elements that each take at least one byte.
    auto read_count(std::string_view what) -> std::size_t {
        auto n = read_long();
        if (n < 0) {
            throw Exception{ErrorKind::malformed,
                            "negative " + std::string{what} + " " + std::to_string(n)};
        }
        if (static_cast<std::uint64_t>(n) > reader_.remaining()) {
            throw Exception{ErrorKind::unexpected_end,
                            std::string{what} + " " + std::to_string(n) +
                            " exceeds the remaining " + std::to_string(reader_.remaining()) +
                            " bytes"};
        }
        return static_cast<std::size_t>(n);
    }

    auto read_bytes() -> Bytes {
        auto data = reader_.read_exact(read_count("byte length"));
        return Bytes{data.begin(), data.end()};
    }

    auto read_text() -> std::string {
        auto data = reader_.read_exact(read_count("byte length"));
        return std::string{reinterpret_cast<const char*>(data.data()), data.size()};
    }

    auto read_tag() -> wire::Tag {
        auto b = reader_.read_byte();
        auto tag = wire::to_tag(b);
        if (!tag) {
            throw Exception{ErrorKind::unknown_tag,
                            "tag " + describe_byte(b) + " at offset " +
                            std::to_string(reader_.pos() - 1)};
        }
        return *tag;
    }

    auto read_symbol_body() -> Symbol {
        auto sym = Symbol{read_text()};
        symbols_.push(sym);
        return sym;
    }

    // A symbol in a position that can only hold a symbol: class names,
    // instance variable names, struct member names.
    auto read_symbol() -> Symbol {
        auto tag = read_tag();
        switch (tag) {
            case wire::Tag::symbol:
                return read_symbol_body();
            case wire::Tag::symbol_link:
                return symbols_.get(read_long());
            case wire::Tag::ivar: {
                if (read_tag() != wire::Tag::symbol) {
                    throw Exception{ErrorKind::malformed, "instance variables on a non-symbol name"};
                }
                auto sym = read_symbol_body();
                read_fields();  // encoding metadata, not kept
                return sym;
            }
            default:
                throw Exception{ErrorKind::malformed,
                                "expected a symbol, found tag '" +
                                std::string(1, static_cast<char>(tag)) + "'"};
        }
    }

    auto read_fields() -> Fields {
        auto count = read_count("field count");
        auto fields = Fields{};
        fields.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            auto key = read_symbol();
            auto value = read_value();
            fields.emplace_back(std::move(key), std::move(value));
        }
        return fields;
    }

    // Composites are registered before their children are read, so a
    // child that links back to the parent resolves to this node.
    auto register_node(NodeData data) -> NodeRef {
        auto ref = graph_.add(std::move(data));
        objects_.push(ref);
        return ref;
    }

    auto require_node(const Value& inner, std::string_view wrapper) -> Node& {
        const auto* ref = std::get_if<NodeRef>(&inner);
        if (!ref) {
            throw Exception{ErrorKind::malformed,
                            std::string{wrapper} + " wrapper around a " +
                            std::string{type_name(inner)}};
        }
        return graph_.node(*ref);
    }

    auto read_value() -> Value {
        auto guard = DepthGuard{*this};
        return read_tagged(read_tag());
    }

    auto read_tagged(wire::Tag tag) -> Value {
        using wire::Tag;
        switch (tag) {
            case Tag::nil:    return Nil{};
            case Tag::true_:  return true;
            case Tag::false_: return false;
            case Tag::fixnum: return read_long();

            case Tag::symbol:      return read_symbol_body();
            case Tag::symbol_link: return symbols_.get(read_long());
            case Tag::object_link: return objects_.get(read_long());

            case Tag::string:
                return register_node(String{read_bytes()});

            case Tag::regexp: {
                auto source = read_bytes();
                auto options = reader_.read_u8();
                return register_node(Regexp{std::move(source), options});
            }

            case Tag::float_: {
                auto value = Value{parse_float(read_text())};
                objects_.push(value);
                return value;
            }

            case Tag::bignum: {
                auto sign = reader_.read_u8();
                if (sign != '+' && sign != '-') {
                    throw Exception{ErrorKind::malformed,
                                    "bignum sign byte " + describe_byte(std::byte{sign})};
                }
                auto words = read_count("bignum length");
                auto raw = reader_.read_exact(words * 2);
                auto big = BigInt::from_magnitude(sign == '-', Bytes{raw.begin(), raw.end()});
                auto value = big.to_int64() ? Value{*big.to_int64()} : Value{std::move(big)};
                objects_.push(value);
                return value;
            }

            case Tag::array: {
                auto ref = register_node(Array{});
                auto count = read_count("array length");
                auto elements = std::vector<Value>{};
                elements.reserve(count);
                for (std::size_t i = 0; i < count; ++i) {
                    elements.push_back(read_value());
                }
                graph_.node(ref).data = Array{std::move(elements)};
                return ref;
            }

            case Tag::hash:
            case Tag::hash_default: {
                auto ref = register_node(Hash{});
                auto count = read_count("hash size");
                auto hash = Hash{};
                hash.entries.reserve(count);
                for (std::size_t i = 0; i < count; ++i) {
                    auto key = read_value();
                    auto value = read_value();
                    hash.entries.emplace_back(std::move(key), std::move(value));
                }
                if (tag == Tag::hash_default) {
                    hash.default_value = read_value();
                }
                graph_.node(ref).data = std::move(hash);
                return ref;
            }

            case Tag::object: {
                auto class_name = read_symbol();
                auto ref = register_node(Object{class_name, {}});
                auto fields = read_fields();
                graph_.node(ref).data = Object{std::move(class_name), std::move(fields)};
                return ref;
            }

            case Tag::struct_: {
                auto class_name = read_symbol();
                auto ref = register_node(Struct{class_name, {}});
                auto members = read_fields();
                graph_.node(ref).data = Struct{std::move(class_name), std::move(members)};
                return ref;
            }

            case Tag::user_defined: {
                auto class_name = read_symbol();
                return register_node(UserData{std::move(class_name), read_bytes()});
            }

            case Tag::user_marshal: {
                auto class_name = read_symbol();
                auto ref = register_node(UserMarshal{class_name, Nil{}});
                auto data = read_value();
                graph_.node(ref).data = UserMarshal{std::move(class_name), std::move(data)};
                return ref;
            }

            case Tag::data: {
                auto class_name = read_symbol();
                auto ref = register_node(WrappedData{class_name, Nil{}});
                auto data = read_value();
                graph_.node(ref).data = WrappedData{std::move(class_name), std::move(data)};
                return ref;
            }

            case Tag::class_:
                return register_node(ClassRef{read_text()});
            case Tag::module:
                return register_node(ModuleRef{read_text(), false});
            case Tag::module_old:
                return register_node(ModuleRef{read_text(), true});

            case Tag::extended: {
                auto module = read_symbol();
                auto inner = read_value();
                auto& node = require_node(inner, "extended");
                node.extends.insert(node.extends.begin(), std::move(module));
                return inner;
            }

            case Tag::user_class: {
                auto class_name = read_symbol();
                auto inner = read_value();
                require_node(inner, "user class").user_class = std::move(class_name);
                return inner;
            }

            case Tag::ivar: {
                auto inner = read_value();
                auto ivars = read_fields();
                if (std::holds_alternative<Symbol>(inner)) {
                    return inner;  // encoding metadata on a symbol, not kept
                }
                auto& node = require_node(inner, "instance variable");
                for (auto& field : ivars) {
                    node.ivars.push_back(std::move(field));
                }
                return inner;
            }
        }
        throw Exception{ErrorKind::unknown_tag, "unhandled tag"};
    }

    wire::Reader reader_;
    const DecodeOptions& options_;
    wire::SymbolTable symbols_{"symbol"};
    wire::ObjectTable objects_{"object"};
    Graph graph_;
    std::size_t depth_{0};
};

}  // anonymous namespace

auto decode(std::span<const std::byte> data, const DecodeOptions& options) -> Document {
    if (!wire::has_version_header(data)) {
        auto found = std::string{};
        for (std::size_t i = 0; i < data.size() && i < 2; ++i) {
            found += (i == 0 ? "" : " ") + describe_byte(data[i]);
        }
        throw Exception{ErrorKind::incompatible_version,
                        "version header [" + found + "], expected 4.8"};
    }
    return Decoder{data, options}.run();
}

}  // namespace marshal_cpp
