#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/logger.hpp>

#include "wire/fixnum.hpp"
#include "wire/reference_tables.hpp"
#include "wire/tag.hpp"
#include "wire/writer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace marshal_cpp {

namespace {

// Shortest text that parses back to the same double.
auto format_float(double d) -> std::string {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    auto buf = std::array<char, 32>{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc{}) {
        throw Exception{ErrorKind::malformed, "float cannot be formatted"};
    }
    return std::string{buf.data(), end};
}

class Encoder {
public:
    explicit Encoder(const Graph& graph) : graph_{graph} {}

    auto run(const Value& root) -> std::vector<std::byte> {
        writer_.write_bytes(wire::version_header);
        write_value(root);
        MARSHAL_CPP_LOG_DEBUG("encoder", "encoded {} bytes: {} symbols, {} objects",
                              writer_.size(), symbols_.size(), objects_.size());
        return writer_.take();
    }

private:
    void write_tag(wire::Tag tag) {
        writer_.write_u8(static_cast<std::uint8_t>(tag));
    }

    void write_count(std::size_t n) {
        if (n > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
            throw Exception{ErrorKind::malformed,
                            "length " + std::to_string(n) + " does not fit the format"};
        }
        writer_.write_fixnum(static_cast<std::int64_t>(n));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        write_count(bytes.size());
        writer_.write_bytes(bytes);
    }

    void write_text(std::string_view text) {
        write_count(text.size());
        writer_.write_text(text);
    }

    void write_symbol(const Symbol& sym) {
        if (auto index = symbols_.find(sym.name)) {
            write_tag(wire::Tag::symbol_link);
            writer_.write_fixnum(static_cast<std::int64_t>(*index));
            return;
        }
        symbols_.insert(sym.name);
        write_tag(wire::Tag::symbol);
        write_text(sym.name);
    }

    void write_fields(const Fields& fields) {
        write_count(fields.size());
        for (const auto& [key, value] : fields) {
            write_symbol(key);
            write_value(value);
        }
    }

    void write_integer(std::int64_t v) {
        if (v < wire::fixnum_min || v > wire::fixnum_max) {
            write_bignum(BigInt::from_int64(v));
            return;
        }
        write_tag(wire::Tag::fixnum);
        writer_.write_fixnum(v);
    }

    void write_bignum(const BigInt& big) {
        objects_.skip();
        write_tag(wire::Tag::bignum);
        writer_.write_u8(big.negative ? '-' : '+');
        auto words = (big.magnitude.size() + 1) / 2;
        write_count(words);
        writer_.write_bytes(big.magnitude);
        if (big.magnitude.size() % 2 != 0) {
            writer_.write_u8(0);
        }
    }

    void write_float(double d) {
        objects_.skip();
        write_tag(wire::Tag::float_);
        write_text(format_float(d));
    }

    void write_value(const Value& v) {
        std::visit(overload{
            [&](Nil) { write_tag(wire::Tag::nil); },
            [&](bool b) { write_tag(b ? wire::Tag::true_ : wire::Tag::false_); },
            [&](std::int64_t i) { write_integer(i); },
            [&](const BigInt& big) { write_bignum(big); },
            [&](double d) { write_float(d); },
            [&](const Symbol& sym) { write_symbol(sym); },
            [&](NodeRef ref) { write_node(ref); },
        }, v);
    }

    void write_node(NodeRef ref) {
        if (!graph_.contains(ref)) {
            throw Exception{ErrorKind::bad_reference,
                            "node " + std::to_string(ref.index) + " is not part of the graph (" +
                            std::to_string(graph_.size()) + " nodes)"};
        }
        if (auto index = objects_.find(ref.index)) {
            write_tag(wire::Tag::object_link);
            writer_.write_fixnum(static_cast<std::int64_t>(*index));
            return;
        }

        const auto& node = graph_.node(ref);
        auto has_ivars = !node.ivars.empty();
        if (has_ivars) {
            write_tag(wire::Tag::ivar);
        }
        for (const auto& module : node.extends) {
            write_tag(wire::Tag::extended);
            write_symbol(module);
        }
        if (node.user_class) {
            write_tag(wire::Tag::user_class);
            write_symbol(*node.user_class);
        }

        objects_.insert(ref.index);
        write_body(node.data);

        if (has_ivars) {
            write_fields(node.ivars);
        }
    }

    void write_body(const NodeData& data) {
        std::visit(overload{
            [&](const String& s) {
                write_tag(wire::Tag::string);
                write_bytes(s.data);
            },
            [&](const Regexp& r) {
                write_tag(wire::Tag::regexp);
                write_bytes(r.source);
                writer_.write_u8(r.options);
            },
            [&](const Array& a) {
                write_tag(wire::Tag::array);
                write_count(a.elements.size());
                for (const auto& element : a.elements) {
                    write_value(element);
                }
            },
            [&](const Hash& h) {
                write_tag(h.default_value ? wire::Tag::hash_default : wire::Tag::hash);
                write_count(h.entries.size());
                for (const auto& [key, value] : h.entries) {
                    write_value(key);
                    write_value(value);
                }
                if (h.default_value) {
                    write_value(*h.default_value);
                }
            },
            [&](const Object& o) {
                write_tag(wire::Tag::object);
                write_symbol(o.class_name);
                write_fields(o.fields);
            },
            [&](const Struct& s) {
                write_tag(wire::Tag::struct_);
                write_symbol(s.class_name);
                write_fields(s.members);
            },
            [&](const ClassRef& c) {
                write_tag(wire::Tag::class_);
                write_text(c.name);
            },
            [&](const ModuleRef& m) {
                write_tag(m.legacy ? wire::Tag::module_old : wire::Tag::module);
                write_text(m.name);
            },
            [&](const UserData& u) {
                write_tag(wire::Tag::user_defined);
                write_symbol(u.class_name);
                write_bytes(u.data);
            },
            [&](const UserMarshal& u) {
                write_tag(wire::Tag::user_marshal);
                write_symbol(u.class_name);
                write_value(u.data);
            },
            [&](const WrappedData& d) {
                write_tag(wire::Tag::data);
                write_symbol(d.class_name);
                write_value(d.data);
            },
        }, data);
    }

    const Graph& graph_;
    wire::Writer writer_;
    wire::SymbolIndex symbols_;
    wire::ObjectIndex objects_;
};

}  // anonymous namespace

auto encode(const Graph& graph, const Value& root) -> std::vector<std::byte> {
    return Encoder{graph}.run(root);
}

}  // namespace marshal_cpp
